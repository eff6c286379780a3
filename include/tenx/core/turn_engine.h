#pragma once

#include <string>

#include "tenx/core/actions.h"
#include "tenx/core/config.h"
#include "tenx/core/game_store.h"
#include "tenx/core/idempotency_store.h"

namespace tenx {

// Serialized action execution for many games.
//
// Per request: idempotent replay lookup, turn check, per-game guard
// acquisition, validation + mutation (apply_action), commit, then recording
// the result under the idempotency key. The guard is released on every exit
// path, including exceptions thrown by collaborators.
//
// The engine holds references only; store, idempotency store and content must
// outlive it. Safe to call concurrently when the collaborators are.
class TurnEngine {
 public:
  TurnEngine(GameStore& store, IdempotencyStore& idempotency, const ContentDB& content, EngineConfig cfg = {});

  ActionResult execute(Id game_id, const ActionRequest& req);

  ActionResult move_unit(Id game_id, Id actor, Id unit_id, const GridPosition& to, const std::string& token = {});
  ActionResult attack_unit(Id game_id, Id actor, Id attacker_id, Id target_unit_id, const std::string& token = {});
  ActionResult attack_city(Id game_id, Id actor, Id attacker_id, Id target_city_id, const std::string& token = {});
  ActionResult end_turn(Id game_id, Id actor, const std::string& token = {});

  const EngineConfig& config() const { return cfg_; }

 private:
  GameStore& store_;
  IdempotencyStore& idempotency_;
  const ContentDB& content_;
  EngineConfig cfg_;
};

} // namespace tenx
