#include "tenx/core/actions.h"

#include <stdexcept>
#include <utility>

#include "tenx/util/strings.h"

namespace tenx {

using json::Object;
using json::Value;

ActionResult ActionResult::success(std::string state_json) {
  ActionResult r;
  r.ok = true;
  r.state_json = std::move(state_json);
  return r;
}

ActionResult ActionResult::failure(ErrorKind kind, std::string message) {
  ActionResult r;
  r.ok = false;
  r.error = kind;
  r.message = std::move(message);
  return r;
}

const char* action_kind_to_string(ActionKind k) {
  switch (k) {
    case ActionKind::Move: return "move-unit";
    case ActionKind::AttackUnit: return "attack-unit";
    case ActionKind::AttackCity: return "attack-city";
    case ActionKind::EndTurn: return "end-turn";
  }
  return "end-turn";
}

ActionKind action_kind_from_string(const std::string& raw) {
  const std::string s = to_lower(trim(raw));
  if (s == "move-unit" || s == "move") return ActionKind::Move;
  if (s == "attack-unit" || s == "attack") return ActionKind::AttackUnit;
  if (s == "attack-city") return ActionKind::AttackCity;
  if (s == "end-turn") return ActionKind::EndTurn;
  throw std::runtime_error("Unknown action kind: " + raw);
}

const char* error_kind_to_string(ErrorKind k) {
  switch (k) {
    case ErrorKind::None: return "NONE";
    case ErrorKind::NotPlayerTurn: return "NOT_PLAYER_TURN";
    case ErrorKind::TurnBusy: return "TURN_BUSY";
    case ErrorKind::NoActionsLeft: return "NO_ACTIONS_LEFT";
    case ErrorKind::OutOfRange: return "OUT_OF_RANGE";
    case ErrorKind::InvalidTarget: return "INVALID_TARGET";
    case ErrorKind::SchemaMismatch: return "SCHEMA_MISMATCH";
    case ErrorKind::GameNotFound: return "GAME_NOT_FOUND";
    case ErrorKind::Internal: return "INTERNAL_ERROR";
  }
  return "INTERNAL_ERROR";
}

ErrorKind error_kind_from_string(const std::string& s) {
  if (s == "NONE") return ErrorKind::None;
  if (s == "NOT_PLAYER_TURN") return ErrorKind::NotPlayerTurn;
  if (s == "TURN_BUSY") return ErrorKind::TurnBusy;
  if (s == "NO_ACTIONS_LEFT") return ErrorKind::NoActionsLeft;
  if (s == "OUT_OF_RANGE") return ErrorKind::OutOfRange;
  if (s == "INVALID_TARGET") return ErrorKind::InvalidTarget;
  if (s == "SCHEMA_MISMATCH") return ErrorKind::SchemaMismatch;
  if (s == "GAME_NOT_FOUND") return ErrorKind::GameNotFound;
  return ErrorKind::Internal;
}

bool is_retryable(ErrorKind k) { return k == ErrorKind::TurnBusy; }

std::string idempotency_key(ActionKind kind, Id game_id, const std::string& token) {
  return std::string(action_kind_to_string(kind)) + ":" + std::to_string(game_id) + ":" + token;
}

Value action_request_to_json(const ActionRequest& req) {
  Object o;
  o["kind"] = std::string(action_kind_to_string(req.kind));
  o["actor"] = static_cast<double>(req.actor_participant_id);
  if (req.unit_id != kInvalidId) o["unit_id"] = static_cast<double>(req.unit_id);
  if (req.target_unit_id != kInvalidId) o["target_unit_id"] = static_cast<double>(req.target_unit_id);
  if (req.target_city_id != kInvalidId) o["target_city_id"] = static_cast<double>(req.target_city_id);
  if (req.destination) {
    Object to;
    to["row"] = static_cast<double>(req.destination->row);
    to["col"] = static_cast<double>(req.destination->col);
    o["to"] = std::move(to);
  }
  if (!req.idempotency_token.empty()) o["token"] = req.idempotency_token;
  return o;
}

ActionRequest action_request_from_json(const Value& v) {
  ActionRequest req;
  req.kind = action_kind_from_string(v.at("kind").string_value());
  req.actor_participant_id = static_cast<Id>(v.at("actor").int_value());
  if (const Value* p = v.find("unit_id")) req.unit_id = static_cast<Id>(p->int_value());
  if (const Value* p = v.find("target_unit_id")) req.target_unit_id = static_cast<Id>(p->int_value());
  if (const Value* p = v.find("target_city_id")) req.target_city_id = static_cast<Id>(p->int_value());
  if (const Value* p = v.find("to")) {
    GridPosition to;
    to.row = static_cast<int>(p->at("row").int_value());
    to.col = static_cast<int>(p->at("col").int_value());
    req.destination = to;
  }
  if (const Value* p = v.find("token")) req.idempotency_token = p->string_value();
  return req;
}

Value action_result_to_json(const ActionResult& r) {
  Object o;
  o["ok"] = r.ok;
  if (r.ok) {
    o["state"] = r.state_json;
  } else {
    o["error"] = std::string(error_kind_to_string(r.error));
    o["message"] = r.message;
  }
  return o;
}

ActionResult action_result_from_json(const Value& v) {
  if (v.at("ok").bool_value()) return ActionResult::success(v.at("state").string_value());
  return ActionResult::failure(error_kind_from_string(v.at("error").string_value()),
                               v.at("message").string_value());
}

} // namespace tenx
