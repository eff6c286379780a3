#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "tenx/core/game_state.h"

namespace tenx {

// Persistence seam for game state, plus the per-game action guard.
//
// The guard (GameState::turn_in_progress) is flipped only through try_begin and
// release, so at most one action is in flight per game. An action that never
// commits is rolled back simply by releasing the guard.
class GameStore {
 public:
  virtual ~GameStore() = default;

  // Copy of the stored state, or nullopt for an unknown game.
  virtual std::optional<GameState> load(Id game_id) = 0;

  // Atomically sets the guard if it is clear. Returns false when another action
  // holds it or the game does not exist.
  virtual bool try_begin(Id game_id) = 0;

  // Persists state. The guard stays held until release(). Throws
  // std::logic_error when the guard is not held.
  virtual void commit(GameState state) = 0;

  // Clears the guard. Safe to call for unknown games.
  virtual void release(Id game_id) = 0;
};

// Thread-safe in-process store. Each game lives in its own slot with its own
// mutex; the store mutex only protects the slot table.
class MemoryGameStore : public GameStore {
 public:
  MemoryGameStore();
  ~MemoryGameStore() override;

  MemoryGameStore(const MemoryGameStore&) = delete;
  MemoryGameStore& operator=(const MemoryGameStore&) = delete;

  // Adds a new game. Throws std::invalid_argument for kInvalidId or a duplicate id.
  void create(GameState state);
  bool contains(Id game_id) const;
  std::vector<Id> game_ids() const;

  std::optional<GameState> load(Id game_id) override;
  bool try_begin(Id game_id) override;
  void commit(GameState state) override;
  void release(Id game_id) override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace tenx
