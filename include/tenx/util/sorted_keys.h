#pragma once

#include <algorithm>
#include <vector>

namespace tenx::util {

// Entity tables are std::unordered_map keyed by id. Anything that must be
// reproducible (serialization, digests, validation reports, end-of-turn
// processing) walks them through this helper instead of raw iteration order.
template <typename Map>
inline std::vector<typename Map::key_type> sorted_keys(const Map& m) {
  std::vector<typename Map::key_type> keys;
  keys.reserve(m.size());
  for (const auto& kv : m) keys.push_back(kv.first);
  std::sort(keys.begin(), keys.end());
  return keys;
}

} // namespace tenx::util
