#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "tenx/core/actions.h"

namespace tenx {

// Cache of committed action results, shared across retries of the same logical
// action. Entries are never overwritten: the first stored result for a key wins.
class IdempotencyStore {
 public:
  virtual ~IdempotencyStore() = default;

  virtual std::optional<ActionResult> try_get(const std::string& key) = 0;

  // Insert-if-absent. Returns false (and leaves the stored value alone) when
  // a live entry already exists for key.
  virtual bool try_put(const std::string& key, const ActionResult& result, std::chrono::seconds ttl) = 0;
};

// Process-local store with absolute expiry. Keys are namespaced with an
// "idempotency:" prefix so the backing map can share a keyspace with other caches.
class MemoryIdempotencyStore : public IdempotencyStore {
 public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  // now defaults to Clock::now; tests inject a manual clock.
  explicit MemoryIdempotencyStore(NowFn now = {});
  ~MemoryIdempotencyStore() override;

  MemoryIdempotencyStore(const MemoryIdempotencyStore&) = delete;
  MemoryIdempotencyStore& operator=(const MemoryIdempotencyStore&) = delete;

  std::optional<ActionResult> try_get(const std::string& key) override;
  bool try_put(const std::string& key, const ActionResult& result, std::chrono::seconds ttl) override;

  // Drops expired entries; returns how many were removed.
  std::size_t purge_expired();

  // Entries currently held, expired ones included until purged.
  std::size_t size() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace tenx
