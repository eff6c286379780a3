#include "tenx/core/rules.h"

#include <algorithm>
#include <string>

#include "tenx/core/combat.h"
#include "tenx/core/content.h"
#include "tenx/core/enum_strings.h"
#include "tenx/core/pathfinder.h"
#include "tenx/util/log.h"
#include "tenx/util/sorted_keys.h"

namespace tenx {

namespace {

std::string unit_label(const Unit& u) { return "unit " + std::to_string(u.id) + " (" + u.type_code + ")"; }

std::string city_label(const City& c) { return "city " + std::to_string(c.id); }

bool owns_any_city(const GameState& s, Id participant_id) {
  for (const auto& [_, c] : s.cities) {
    if (c.participant_id == participant_id) return true;
  }
  return false;
}

bool city_under_siege(const GameState& s, const BoardIndex& board, const City& city) {
  const Tile* city_tile = board.tile(city.tile_id);
  if (!city_tile) return false;
  for (const auto& [_, u] : s.units) {
    if (u.participant_id == city.participant_id) continue;
    const Tile* t = board.tile(u.tile_id);
    if (t && hex_distance(t->pos, city_tile->pos) <= 1) return true;
  }
  return false;
}

// Shared preconditions of every unit action. Returns nullptr and fills *err on failure.
Unit* acting_unit(GameState& s, const ActionRequest& req, ActionResult* err) {
  Unit* u = find_ptr(s.units, req.unit_id);
  if (!u) {
    *err = ActionResult::failure(ErrorKind::InvalidTarget, "Unit " + std::to_string(req.unit_id) + " not found");
    return nullptr;
  }
  if (u->participant_id != req.actor_participant_id) {
    *err = ActionResult::failure(ErrorKind::InvalidTarget, "Unit " + std::to_string(u->id) +
                                                               " does not belong to the active participant");
    return nullptr;
  }
  if (u->has_acted) {
    *err = ActionResult::failure(ErrorKind::NoActionsLeft,
                                 "Unit " + std::to_string(u->id) + " has already acted this turn");
    return nullptr;
  }
  return u;
}

ActionResult apply_move(GameState& s, const ContentDB& content, const EngineConfig& cfg, const ActionRequest& req) {
  ActionResult err;
  Unit* u = acting_unit(s, req, &err);
  if (!u) return err;
  const UnitDefinition* def = find_unit_type(content, u->type_code);
  if (!def) return ActionResult::failure(ErrorKind::Internal, "Unknown unit type '" + u->type_code + "'");

  if (!req.destination) return ActionResult::failure(ErrorKind::InvalidTarget, "Move requires a destination");
  const GridPosition to = *req.destination;
  if (!in_bounds(to, s.map.width, s.map.height)) {
    return ActionResult::failure(ErrorKind::InvalidTarget, "Destination " + to_string(to) + " is out of map bounds");
  }

  BoardIndex board(s);
  const Tile* from = board.tile(u->tile_id);
  if (!from) return ActionResult::failure(ErrorKind::Internal, "Unit " + std::to_string(u->id) + " is on a missing tile");
  const Tile* dest = board.tile_at(to);
  if (!dest) return ActionResult::failure(ErrorKind::InvalidTarget, "No tile at " + to_string(to));
  if (dest->id == from->id) {
    return ActionResult::failure(ErrorKind::InvalidTarget, "Unit " + std::to_string(u->id) + " is already at " + to_string(to));
  }
  if (is_water(dest->terrain)) {
    return ActionResult::failure(ErrorKind::InvalidTarget, "Destination " + to_string(to) + " is water");
  }
  if (board.occupied(to)) {
    return ActionResult::failure(ErrorKind::InvalidTarget, "Destination " + to_string(to) + " is occupied");
  }

  City* dest_city = find_ptr(s.cities, board.city_on(dest->id));
  if (dest_city && dest_city->participant_id != u->participant_id && dest_city->hp > 0 &&
      cfg.block_live_enemy_cities) {
    return ActionResult::failure(ErrorKind::InvalidTarget,
                                 "Destination " + to_string(to) + " is an enemy city that still stands");
  }

  const Id self_tile = from->id;
  const BlockedFn blocked = [&board, self_tile](const GridPosition& p) {
    const Tile* t = board.tile_at(p);
    if (!t || is_water(t->terrain)) return true;
    const Id occupant = board.unit_on(t->id);
    return occupant != kInvalidId && t->id != self_tile;
  };

  // The destination was checked above, so the goal is never exempt here.
  PathOptions opt;
  const auto path = find_path(from->pos, to, def->move_points, s.map.width, s.map.height, blocked, opt);
  if (!path) {
    // Distinguish "too far" from "no way through" with an unbounded search.
    const int unbounded = s.map.width * s.map.height;
    const auto any_path = find_path(from->pos, to, unbounded, s.map.width, s.map.height, blocked, opt);
    if (any_path) {
      return ActionResult::failure(ErrorKind::OutOfRange,
                                   "Destination " + to_string(to) + " needs " + std::to_string(any_path->size() - 1) +
                                       " steps; unit has " + std::to_string(def->move_points));
    }
    return ActionResult::failure(ErrorKind::InvalidTarget, "No path from " + to_string(from->pos) + " to " + to_string(to));
  }

  const GridPosition from_pos = from->pos;
  board.move_unit(u->id, from->id, dest->id);
  u->tile_id = dest->id;
  u->has_acted = true;
  push_event(s, GameEventKind::UnitMoved, u->participant_id,
             unit_label(*u) + " moved " + to_string(from_pos) + " -> " + to_string(to), cfg.max_events);

  if (dest_city && dest_city->participant_id != u->participant_id && dest_city->hp <= 0 && !def->is_ranged) {
    capture_city(s, *dest_city, u->participant_id, cfg);
  }
  return ActionResult::success({});
}

ActionResult apply_attack_unit(GameState& s, const ContentDB& content, const EngineConfig& cfg,
                               const ActionRequest& req) {
  ActionResult err;
  Unit* attacker = acting_unit(s, req, &err);
  if (!attacker) return err;

  Unit* defender = find_ptr(s.units, req.target_unit_id);
  if (!defender) {
    return ActionResult::failure(ErrorKind::InvalidTarget, "Target unit " + std::to_string(req.target_unit_id) + " not found");
  }
  if (defender->participant_id == attacker->participant_id) {
    return ActionResult::failure(ErrorKind::InvalidTarget, "Target unit " + std::to_string(defender->id) + " is friendly");
  }

  const UnitDefinition* att_def = find_unit_type(content, attacker->type_code);
  const UnitDefinition* def_def = find_unit_type(content, defender->type_code);
  if (!att_def || !def_def) return ActionResult::failure(ErrorKind::Internal, "Unknown unit type in attack");

  BoardIndex board(s);
  const Tile* at = board.tile(attacker->tile_id);
  const Tile* dt = board.tile(defender->tile_id);
  if (!at || !dt) return ActionResult::failure(ErrorKind::Internal, "Attack involves a unit on a missing tile");

  const int distance = hex_distance(at->pos, dt->pos);
  if (!attack_in_range(*att_def, distance)) {
    return ActionResult::failure(ErrorKind::OutOfRange,
                                 "Target at distance " + std::to_string(distance) + " is out of range for " + att_def->code);
  }

  const AttackOutcome out = resolve_unit_attack(*attacker, *att_def, *defender, *def_def);

  std::string msg = unit_label(*attacker) + " hit " + unit_label(*defender) + " for " + std::to_string(out.damage) +
                    " (hp " + std::to_string(out.defender_hp_after) + ")";
  if (out.counter_damage) {
    msg += ", countered for " + std::to_string(*out.counter_damage) + " (hp " + std::to_string(out.attacker_hp_after) + ")";
  }
  push_event(s, GameEventKind::UnitAttacked, attacker->participant_id, msg, cfg.max_events);

  const Id attacker_id = attacker->id;
  const Id defender_id = defender->id;
  if (out.defender_destroyed) {
    push_event(s, GameEventKind::UnitDestroyed, defender->participant_id, unit_label(*defender) + " was destroyed",
               cfg.max_events);
    board.remove_unit(dt->id);
    s.units.erase(defender_id);
  }
  if (out.attacker_destroyed) {
    push_event(s, GameEventKind::UnitDestroyed, attacker->participant_id, unit_label(*attacker) + " was destroyed",
               cfg.max_events);
    board.remove_unit(at->id);
    s.units.erase(attacker_id);
  } else {
    s.units.at(attacker_id).has_acted = true;
  }
  return ActionResult::success({});
}

ActionResult apply_attack_city(GameState& s, const ContentDB& content, const EngineConfig& cfg,
                               const ActionRequest& req) {
  ActionResult err;
  Unit* attacker = acting_unit(s, req, &err);
  if (!attacker) return err;

  City* city = find_ptr(s.cities, req.target_city_id);
  if (!city) {
    return ActionResult::failure(ErrorKind::InvalidTarget, "Target city " + std::to_string(req.target_city_id) + " not found");
  }
  if (city->participant_id == attacker->participant_id) {
    return ActionResult::failure(ErrorKind::InvalidTarget, "Target city " + std::to_string(city->id) + " is friendly");
  }

  const UnitDefinition* att_def = find_unit_type(content, attacker->type_code);
  if (!att_def) return ActionResult::failure(ErrorKind::Internal, "Unknown unit type '" + attacker->type_code + "'");

  BoardIndex board(s);
  const Tile* at = board.tile(attacker->tile_id);
  const Tile* ct = board.tile(city->tile_id);
  if (!at || !ct) return ActionResult::failure(ErrorKind::Internal, "City attack involves a missing tile");

  const int distance = hex_distance(at->pos, ct->pos);
  if (!attack_in_range(*att_def, distance)) {
    return ActionResult::failure(ErrorKind::OutOfRange,
                                 "City at distance " + std::to_string(distance) + " is out of range for " + att_def->code);
  }

  const CityAttackOutcome out = resolve_city_attack(*attacker, *att_def, *city, cfg.city_defence);
  attacker->has_acted = true;

  std::string msg = unit_label(*attacker) + " hit " + city_label(*city) + " for " + std::to_string(out.damage) +
                    " (hp " + std::to_string(out.city_hp_after) + ")";
  if (out.city_defeated) msg += ", city defenses broken";
  push_event(s, GameEventKind::CityAttacked, attacker->participant_id, msg, cfg.max_events);
  return ActionResult::success({});
}

ActionResult apply_end_turn(GameState& s, const EngineConfig& cfg) {
  advance_turn(s, cfg);
  return ActionResult::success({});
}

} // namespace

ActionResult apply_action(GameState& s, const ContentDB& content, const EngineConfig& cfg, const ActionRequest& req) {
  if (s.status != GameStatus::Active) {
    return ActionResult::failure(ErrorKind::NotPlayerTurn, "Game " + std::to_string(s.id) + " is not active");
  }
  if (req.actor_participant_id == kInvalidId || req.actor_participant_id != s.active_participant_id) {
    return ActionResult::failure(ErrorKind::NotPlayerTurn,
                                 "Participant " + std::to_string(req.actor_participant_id) + " is not the active participant");
  }

  switch (req.kind) {
    case ActionKind::Move: return apply_move(s, content, cfg, req);
    case ActionKind::AttackUnit: return apply_attack_unit(s, content, cfg, req);
    case ActionKind::AttackCity: return apply_attack_city(s, content, cfg, req);
    case ActionKind::EndTurn: return apply_end_turn(s, cfg);
  }
  return ActionResult::failure(ErrorKind::Internal, "Unknown action kind");
}

void capture_city(GameState& s, City& city, Id new_owner, const EngineConfig& cfg) {
  if (city.hp > 0) return;
  const Id old_owner = city.participant_id;
  if (old_owner == new_owner) return;

  city.participant_id = new_owner;
  city.hp = 1;
  push_event(s, GameEventKind::CityCaptured, new_owner,
             city_label(city) + " captured from participant " + std::to_string(old_owner), cfg.max_events);

  if (!owns_any_city(s, old_owner)) {
    if (Participant* p = find_participant(s, old_owner)) {
      p->is_eliminated = true;
      push_event(s, GameEventKind::ParticipantEliminated, old_owner, p->display_name + " was eliminated",
                 cfg.max_events);
    }
  }

  bool enemy_city_left = false;
  for (const auto& [_, c] : s.cities) {
    if (c.participant_id != new_owner) {
      enemy_city_left = true;
      break;
    }
  }
  if (!enemy_city_left) {
    s.status = GameStatus::Finished;
    s.active_participant_id = kInvalidId;
    push_event(s, GameEventKind::GameFinished, new_owner,
               "Game won by participant " + std::to_string(new_owner), cfg.max_events);
  }
}

void harvest_city_resources(GameState& s, City& city, int storage_cap, HarvestTotals& totals) {
  const BoardIndex board(s);
  for (Id tile_id : city.tiles) {
    const Tile* t = board.tile(tile_id);
    if (!t || t->resource_type.empty()) continue;
    const int left = remaining_resource(s, *t);
    if (left <= 0) continue;

    const Id occupant = board.unit_on(tile_id);
    if (occupant != kInvalidId && s.units.at(occupant).participant_id != city.participant_id) continue;

    int& stock = city.resources[t->resource_type];
    if (stock >= storage_cap) {
      totals.overflow[t->resource_type] += 1;
      continue;
    }
    stock += 1;
    s.tile_resources[tile_id] = left - 1;
    totals.harvested[t->resource_type] += 1;
  }
}

void advance_turn(GameState& s, const EngineConfig& cfg) {
  const Id ending = s.active_participant_id;
  const BoardIndex board(s);

  for (Id cid : util::sorted_keys(s.cities)) {
    City& c = s.cities.at(cid);
    if (c.participant_id != ending || c.hp >= c.max_hp) continue;
    const int regen = city_under_siege(s, board, c) ? cfg.city_regen_under_siege : cfg.city_regen_normal;
    c.hp = std::min(c.max_hp, c.hp + std::max(0, regen));
  }

  HarvestTotals totals;
  for (Id cid : util::sorted_keys(s.cities)) {
    City& c = s.cities.at(cid);
    if (c.participant_id == ending) harvest_city_resources(s, c, cfg.resource_storage_cap, totals);
  }
  if (!totals.harvested.empty() || !totals.overflow.empty()) {
    std::string summary;
    for (const auto& [type, n] : totals.harvested) summary += " " + type + "+" + std::to_string(n);
    for (const auto& [type, n] : totals.overflow) summary += " " + type + " overflow " + std::to_string(n);
    log::debug("participant " + std::to_string(ending) + " harvested:" + summary);
  }

  for (auto& [_, u] : s.units) u.has_acted = false;

  const Id next = next_active_participant(s, ending);
  push_event(s, GameEventKind::TurnEnded, ending,
             "Turn " + std::to_string(s.turn_no) + " ended; next participant " + std::to_string(next), cfg.max_events);

  s.turn_no += 1;
  s.active_participant_id = next;
  if (next == kInvalidId) {
    s.status = GameStatus::Finished;
    push_event(s, GameEventKind::GameFinished, kInvalidId, "No participants remain", cfg.max_events);
  }
}

} // namespace tenx
