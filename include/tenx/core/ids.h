#pragma once

#include <cstdint>

namespace tenx {

using Id = std::uint64_t;

constexpr Id kInvalidId = 0;

} // namespace tenx
