#include "tenx/core/turn_engine.h"

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <utility>

#include "tenx/core/rules.h"
#include "tenx/core/serialization.h"
#include "tenx/util/log.h"

namespace tenx {

namespace {

// Holds the per-game guard for one action and releases it on every exit path.
// Nothing is written unless the action reaches GameStore::commit, so releasing
// without a commit is the rollback.
class ActionScope {
 public:
  ActionScope(GameStore& store, Id game_id) : store_(store), game_id_(game_id) {}
  ~ActionScope() {
    try {
      store_.release(game_id_);
    } catch (const std::exception& e) {
      log::error("releasing the turn guard failed for game " + std::to_string(game_id_) + ": " + e.what());
    }
  }

  ActionScope(const ActionScope&) = delete;
  ActionScope& operator=(const ActionScope&) = delete;

 private:
  GameStore& store_;
  Id game_id_;
};

std::string describe(Id game_id, const ActionRequest& req) {
  return std::string(action_kind_to_string(req.kind)) + " game=" + std::to_string(game_id) +
         " actor=" + std::to_string(req.actor_participant_id);
}

std::optional<ActionResult> turn_check(const GameState& s, const ActionRequest& req) {
  if (s.status != GameStatus::Active) {
    return ActionResult::failure(ErrorKind::NotPlayerTurn, "Game " + std::to_string(s.id) + " is not active");
  }
  if (req.actor_participant_id != s.active_participant_id) {
    return ActionResult::failure(ErrorKind::NotPlayerTurn, "Participant " + std::to_string(req.actor_participant_id) +
                                                               " is not the active participant");
  }
  return std::nullopt;
}

std::optional<ActionResult> replay(IdempotencyStore& idempotency, Id game_id, const ActionRequest& req,
                                   const std::string& key) {
  if (key.empty()) return std::nullopt;
  auto cached = idempotency.try_get(key);
  if (cached) log::info("replayed " + describe(game_id, req) + " key=" + key);
  return cached;
}

// Body of one action while the guard is held. The idempotency record is
// written before the guard is released, so a concurrent retry either sees
// TurnBusy or the recorded result.
ActionResult run_guarded(GameStore& store, IdempotencyStore& idempotency, const ContentDB& content,
                         const EngineConfig& cfg, Id game_id, const ActionRequest& req, const std::string& key) {
  // A retry of the same request may have committed between the first lookup
  // and acquiring the guard.
  if (auto cached = replay(idempotency, game_id, req, key)) return *cached;

  auto loaded = store.load(game_id);
  if (!loaded) return ActionResult::failure(ErrorKind::GameNotFound, "Game " + std::to_string(game_id) + " not found");
  GameState s = std::move(*loaded);
  if (auto rejected = turn_check(s, req)) return *rejected;

  ActionResult r = apply_action(s, content, cfg, req);
  if (!r.ok) {
    log::debug("rejected " + describe(game_id, req) + ": " + r.message);
    return r;
  }

  // The projection shows the state as it reads once the guard is released.
  s.turn_in_progress = false;
  std::string state_json = serialize_game_to_json(s, 0);
  store.commit(std::move(s));

  ActionResult result = ActionResult::success(std::move(state_json));
  if (!key.empty() && !idempotency.try_put(key, result, std::chrono::seconds(cfg.idempotency_ttl_seconds))) {
    // Lost an insert race to an identical request; the first stored result wins.
    if (auto existing = idempotency.try_get(key)) return *existing;
  }
  log::info("committed " + describe(game_id, req));
  return result;
}

} // namespace

TurnEngine::TurnEngine(GameStore& store, IdempotencyStore& idempotency, const ContentDB& content, EngineConfig cfg)
    : store_(store), idempotency_(idempotency), content_(content), cfg_(std::move(cfg)) {}

ActionResult TurnEngine::execute(Id game_id, const ActionRequest& req) {
  const std::string key =
      req.idempotency_token.empty() ? std::string() : idempotency_key(req.kind, game_id, req.idempotency_token);

  if (auto cached = replay(idempotency_, game_id, req, key)) return *cached;

  const auto current = store_.load(game_id);
  const std::optional<ActionResult> rejected =
      current ? turn_check(*current, req)
              : ActionResult::failure(ErrorKind::GameNotFound, "Game " + std::to_string(game_id) + " not found");
  if (rejected) {
    // An identical request may have committed since the lookup above and
    // handed the turn on; its recorded result wins over the rejection.
    if (auto cached = replay(idempotency_, game_id, req, key)) return *cached;
    log::debug("rejected " + describe(game_id, req) + ": " + rejected->message);
    return *rejected;
  }

  if (!store_.try_begin(game_id)) {
    log::warn("busy " + describe(game_id, req));
    return ActionResult::failure(ErrorKind::TurnBusy,
                                 "Another action is in progress for game " + std::to_string(game_id));
  }

  ActionScope scope(store_, game_id);
  try {
    return run_guarded(store_, idempotency_, content_, cfg_, game_id, req, key);
  } catch (const std::exception& e) {
    log::error("internal error in " + describe(game_id, req) + ": " + e.what());
    return ActionResult::failure(ErrorKind::Internal, e.what());
  }
}

ActionResult TurnEngine::move_unit(Id game_id, Id actor, Id unit_id, const GridPosition& to, const std::string& token) {
  ActionRequest req;
  req.kind = ActionKind::Move;
  req.actor_participant_id = actor;
  req.unit_id = unit_id;
  req.destination = to;
  req.idempotency_token = token;
  return execute(game_id, req);
}

ActionResult TurnEngine::attack_unit(Id game_id, Id actor, Id attacker_id, Id target_unit_id,
                                     const std::string& token) {
  ActionRequest req;
  req.kind = ActionKind::AttackUnit;
  req.actor_participant_id = actor;
  req.unit_id = attacker_id;
  req.target_unit_id = target_unit_id;
  req.idempotency_token = token;
  return execute(game_id, req);
}

ActionResult TurnEngine::attack_city(Id game_id, Id actor, Id attacker_id, Id target_city_id,
                                     const std::string& token) {
  ActionRequest req;
  req.kind = ActionKind::AttackCity;
  req.actor_participant_id = actor;
  req.unit_id = attacker_id;
  req.target_city_id = target_city_id;
  req.idempotency_token = token;
  return execute(game_id, req);
}

ActionResult TurnEngine::end_turn(Id game_id, Id actor, const std::string& token) {
  ActionRequest req;
  req.kind = ActionKind::EndTurn;
  req.actor_participant_id = actor;
  req.idempotency_token = token;
  return execute(game_id, req);
}

} // namespace tenx
