#include "tenx/core/state_validation.h"

#include <algorithm>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "tenx/core/hex_grid.h"
#include "tenx/util/sorted_keys.h"

namespace tenx {

namespace {

void push(std::vector<std::string>& out, std::string msg) { out.push_back(std::move(msg)); }

template <typename... Parts>
std::string join(Parts&&... parts) {
  std::ostringstream ss;
  (ss << ... << std::forward<Parts>(parts));
  return ss.str();
}

unsigned long long id_u64(Id id) { return static_cast<unsigned long long>(id); }

} // namespace

std::vector<std::string> validate_game_state(const GameState& s, const ContentDB* content) {
  std::vector<std::string> errors;

  if (s.schema_version != kCurrentSchemaVersion) {
    push(errors, join("schema_version ", s.schema_version, " != ", kCurrentSchemaVersion));
  }
  if (s.turn_no < 1) push(errors, join("turn_no must be >= 1 (got ", s.turn_no, ")"));

  Id max_id = 0;
  const auto bump_max = [&](Id id) {
    if (id != kInvalidId && id > max_id) max_id = id;
  };

  // --- Map ---
  const Map& m = s.map;
  if (m.width <= 0 || m.height <= 0) {
    push(errors, join("Map has invalid size ", m.width, "x", m.height));
  } else if (m.tiles.size() != static_cast<std::size_t>(m.width) * static_cast<std::size_t>(m.height)) {
    push(errors, join("Map tile count ", m.tiles.size(), " does not match ", m.width, "x", m.height));
  }

  std::unordered_set<Id> tile_ids;
  std::unordered_set<GridPosition, GridPositionHash> tile_positions;
  for (const auto& t : m.tiles) {
    if (t.id == kInvalidId) push(errors, join("Tile at ", to_string(t.pos), " has an invalid id"));
    if (!tile_ids.insert(t.id).second) push(errors, join("Duplicate tile id ", id_u64(t.id)));
    if (!tile_positions.insert(t.pos).second) push(errors, join("Duplicate tile position ", to_string(t.pos)));
    if (!in_bounds(t.pos, m.width, m.height)) {
      push(errors, join("Tile ", id_u64(t.id), " position ", to_string(t.pos), " is out of bounds"));
    }
    if (t.resource_amount < 0) push(errors, join("Tile ", id_u64(t.id), " has negative resource_amount"));
  }

  // --- Participants ---
  std::unordered_set<Id> participant_ids;
  for (const auto& p : s.participants) {
    bump_max(p.id);
    if (p.id == kInvalidId) push(errors, join("Participant '", p.display_name, "' has an invalid id"));
    if (!participant_ids.insert(p.id).second) push(errors, join("Duplicate participant id ", id_u64(p.id)));
  }

  // --- Units ---
  std::unordered_map<Id, Id> unit_on_tile;
  for (Id id : util::sorted_keys(s.units)) {
    const Unit& u = s.units.at(id);
    bump_max(id);
    if (u.id != id) push(errors, join("Unit id mismatch: key=", id_u64(id), " value.id=", id_u64(u.id)));
    if (!participant_ids.count(u.participant_id)) {
      push(errors, join("Unit ", id_u64(id), " has unknown owner ", id_u64(u.participant_id)));
    }
    if (!tile_ids.count(u.tile_id)) {
      push(errors, join("Unit ", id_u64(id), " stands on missing tile ", id_u64(u.tile_id)));
    } else {
      auto [it, inserted] = unit_on_tile.emplace(u.tile_id, id);
      if (!inserted) {
        push(errors, join("Tile ", id_u64(u.tile_id), " holds more than one unit (", id_u64(it->second), ", ",
                          id_u64(id), ")"));
      }
    }
    if (u.hp <= 0) push(errors, join("Unit ", id_u64(id), " has non-positive hp ", u.hp));

    if (content) {
      const UnitDefinition* def = find_ptr(content->unit_types, u.type_code);
      if (!def) {
        push(errors, join("Unit ", id_u64(id), " has unknown type '", u.type_code, "'"));
      } else if (u.hp > def->health) {
        push(errors, join("Unit ", id_u64(id), " hp ", u.hp, " exceeds max ", def->health));
      }
    }
  }

  // --- Cities ---
  std::unordered_set<Id> city_tiles;
  for (Id id : util::sorted_keys(s.cities)) {
    const City& c = s.cities.at(id);
    bump_max(id);
    if (c.id != id) push(errors, join("City id mismatch: key=", id_u64(id), " value.id=", id_u64(c.id)));
    if (!participant_ids.count(c.participant_id)) {
      push(errors, join("City ", id_u64(id), " has unknown owner ", id_u64(c.participant_id)));
    }
    if (!tile_ids.count(c.tile_id)) {
      push(errors, join("City ", id_u64(id), " stands on missing tile ", id_u64(c.tile_id)));
    } else if (!city_tiles.insert(c.tile_id).second) {
      push(errors, join("Tile ", id_u64(c.tile_id), " holds more than one city"));
    }
    if (c.max_hp <= 0) push(errors, join("City ", id_u64(id), " has non-positive max_hp ", c.max_hp));
    if (c.hp < 0 || c.hp > c.max_hp) {
      push(errors, join("City ", id_u64(id), " hp ", c.hp, " outside [0, ", c.max_hp, "]"));
    }
    for (Id tile_id : c.tiles) {
      if (!tile_ids.count(tile_id)) push(errors, join("City ", id_u64(id), " works missing tile ", id_u64(tile_id)));
    }
    for (const auto& type : util::sorted_keys(c.resources)) {
      if (c.resources.at(type) < 0) {
        push(errors, join("City ", id_u64(id), " has negative ", type, " stock ", c.resources.at(type)));
      }
    }
  }

  for (Id tile_id : util::sorted_keys(s.tile_resources)) {
    if (!tile_ids.count(tile_id)) {
      push(errors, join("Resource stock recorded for missing tile ", id_u64(tile_id)));
    } else if (s.tile_resources.at(tile_id) < 0) {
      push(errors, join("Tile ", id_u64(tile_id), " has negative remaining resource"));
    }
  }

  // --- Turn state ---
  if (s.status == GameStatus::Active) {
    const Participant* active = find_participant(s, s.active_participant_id);
    if (!active) {
      push(errors, join("Active participant ", id_u64(s.active_participant_id), " does not exist"));
    } else if (active->is_eliminated) {
      push(errors, join("Active participant ", id_u64(s.active_participant_id), " is eliminated"));
    }
  } else if (s.active_participant_id != kInvalidId && !participant_ids.count(s.active_participant_id)) {
    push(errors, join("Active participant ", id_u64(s.active_participant_id), " does not exist"));
  }

  if (s.next_id <= max_id) {
    push(errors, join("next_id ", id_u64(s.next_id), " is not greater than max entity id ", id_u64(max_id)));
  }

  std::uint64_t last_seq = 0;
  for (const auto& ev : s.events) {
    if (ev.seq <= last_seq) {
      push(errors, join("Event seq ", ev.seq, " is not increasing"));
    }
    last_seq = ev.seq;
  }
  if (!s.events.empty() && s.next_event_seq <= s.events.back().seq) {
    push(errors, join("next_event_seq ", s.next_event_seq, " is not greater than last event seq ",
                      s.events.back().seq));
  }

  std::sort(errors.begin(), errors.end());
  return errors;
}

} // namespace tenx
