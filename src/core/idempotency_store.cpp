#include "tenx/core/idempotency_store.h"

#include <mutex>
#include <unordered_map>
#include <utility>

namespace tenx {

namespace {

std::string cache_key(const std::string& key) { return "idempotency:" + key; }

} // namespace

struct MemoryIdempotencyStore::Impl {
  struct Entry {
    ActionResult result;
    Clock::time_point expires_at;
  };

  mutable std::mutex mu;
  std::unordered_map<std::string, Entry> entries;
  NowFn now;

  Clock::time_point current_time() const { return now ? now() : Clock::now(); }
};

MemoryIdempotencyStore::MemoryIdempotencyStore(NowFn now) : impl_(std::make_unique<Impl>()) {
  impl_->now = std::move(now);
}

MemoryIdempotencyStore::~MemoryIdempotencyStore() = default;

std::optional<ActionResult> MemoryIdempotencyStore::try_get(const std::string& key) {
  std::lock_guard<std::mutex> lock(impl_->mu);
  auto it = impl_->entries.find(cache_key(key));
  if (it == impl_->entries.end()) return std::nullopt;
  if (impl_->current_time() >= it->second.expires_at) {
    impl_->entries.erase(it);
    return std::nullopt;
  }
  return it->second.result;
}

bool MemoryIdempotencyStore::try_put(const std::string& key, const ActionResult& result, std::chrono::seconds ttl) {
  std::lock_guard<std::mutex> lock(impl_->mu);
  const auto now = impl_->current_time();
  const std::string k = cache_key(key);

  auto it = impl_->entries.find(k);
  if (it != impl_->entries.end()) {
    if (now < it->second.expires_at) return false;
    impl_->entries.erase(it);
  }

  Impl::Entry e;
  e.result = result;
  e.expires_at = now + ttl;
  impl_->entries.emplace(k, std::move(e));
  return true;
}

std::size_t MemoryIdempotencyStore::purge_expired() {
  std::lock_guard<std::mutex> lock(impl_->mu);
  const auto now = impl_->current_time();
  std::size_t removed = 0;
  for (auto it = impl_->entries.begin(); it != impl_->entries.end();) {
    if (now >= it->second.expires_at) {
      it = impl_->entries.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t MemoryIdempotencyStore::size() const {
  std::lock_guard<std::mutex> lock(impl_->mu);
  return impl_->entries.size();
}

} // namespace tenx
