#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "tenx/core/hex_grid.h"
#include "tenx/core/ids.h"
#include "tenx/util/json.h"

namespace tenx {

enum class ActionKind : std::uint8_t { Move, AttackUnit, AttackCity, EndTurn };

// Failure kinds reported to the caller. Each maps 1:1 to a distinct response in
// the API layer.
enum class ErrorKind : std::uint8_t {
  None,
  NotPlayerTurn,   // actor is not the active participant, or the game is over
  TurnBusy,        // another action is in flight for this game; retry later
  NoActionsLeft,   // unit already acted this turn
  OutOfRange,      // attack distance or movement exceeds what the unit can do
  InvalidTarget,   // missing, friendly, occupied or otherwise illegal target
  SchemaMismatch,  // snapshot/load only, never produced by action execution
  GameNotFound,
  Internal,
};

struct ActionRequest {
  ActionKind kind{ActionKind::EndTurn};
  Id actor_participant_id{kInvalidId};

  Id unit_id{kInvalidId};          // Move, AttackUnit, AttackCity
  Id target_unit_id{kInvalidId};   // AttackUnit
  Id target_city_id{kInvalidId};   // AttackCity
  std::optional<GridPosition> destination;  // Move

  // Client supplied retry token. Empty disables idempotent replay.
  std::string idempotency_token;
};

struct ActionResult {
  bool ok{false};
  ErrorKind error{ErrorKind::None};
  std::string message;

  // State projection after the action (compact JSON). Empty on failure.
  std::string state_json;

  static ActionResult success(std::string state_json);
  static ActionResult failure(ErrorKind kind, std::string message);
};

const char* action_kind_to_string(ActionKind k);
ActionKind action_kind_from_string(const std::string& s);

// Stable wire codes, e.g. "NOT_PLAYER_TURN".
const char* error_kind_to_string(ErrorKind k);
ErrorKind error_kind_from_string(const std::string& s);

// Only TurnBusy is worth retrying unchanged.
bool is_retryable(ErrorKind k);

// "{action-kind}:{game-id}:{token}", e.g. "move-unit:42:abc".
std::string idempotency_key(ActionKind kind, Id game_id, const std::string& token);

json::Value action_request_to_json(const ActionRequest& req);
// Throws std::runtime_error on missing/ill-typed fields.
ActionRequest action_request_from_json(const json::Value& v);

json::Value action_result_to_json(const ActionResult& r);
ActionResult action_result_from_json(const json::Value& v);

} // namespace tenx
