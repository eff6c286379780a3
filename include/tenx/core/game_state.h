#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "tenx/core/entities.h"

namespace tenx {

// Static content shared read-only by every game.
struct ContentDB {
  std::unordered_map<std::string, UnitDefinition> unit_types;
};

// Current snapshot format. Snapshots with any other version are rejected.
constexpr int kCurrentSchemaVersion = 1;

// Full mutable state of one game. Entities reference each other only by id;
// occupancy is derived (see BoardIndex), never stored on both sides.
struct GameState {
  int schema_version{kCurrentSchemaVersion};
  Id id{kInvalidId};

  Map map;

  // Turn order. Exactly one participant is active while the game is active.
  std::vector<Participant> participants;
  std::unordered_map<Id, Unit> units;
  std::unordered_map<Id, City> cities;

  // Resource left on each harvested tile, keyed by tile id. A resource tile
  // without an entry still holds its Tile::resource_amount.
  std::unordered_map<Id, int> tile_resources;

  int turn_no{1};
  Id active_participant_id{kInvalidId};
  GameStatus status{GameStatus::Active};

  // Per-game action guard. Only the game store flips this.
  bool turn_in_progress{false};

  Id next_id{1};
  std::uint64_t next_event_seq{1};
  std::vector<GameEvent> events;
};

Id allocate_id(GameState& s);

// Stock left on t in this game (0 for tiles without a resource).
int remaining_resource(const GameState& s, const Tile& t);

// Small helper for safe lookups.
template <typename Map>
auto* find_ptr(Map& m, const typename Map::key_type& k) {
  auto it = m.find(k);
  if (it == m.end()) return static_cast<decltype(&it->second)>(nullptr);
  return &it->second;
}

template <typename Map>
const auto* find_ptr(const Map& m, const typename Map::key_type& k) {
  auto it = m.find(k);
  if (it == m.end()) return static_cast<const decltype(&it->second)>(nullptr);
  return &it->second;
}

Participant* find_participant(GameState& s, Id participant_id);
const Participant* find_participant(const GameState& s, Id participant_id);

// Next non-eliminated participant after `after_id` in turn order, wrapping.
// Returns after_id itself when it is the only one left standing, and
// kInvalidId when nobody is left.
Id next_active_participant(const GameState& s, Id after_id);

// Appends to the event log, trimming the oldest entries beyond max_events (0 = unlimited).
void push_event(GameState& s, GameEventKind kind, Id participant_id, std::string message, int max_events);

// Lookup tables derived from a GameState: tiles by id/position and which unit
// or city stands on each tile. Built once per action and kept in step with
// the mutations that action applies.
class BoardIndex {
 public:
  explicit BoardIndex(const GameState& s);

  const Tile* tile(Id tile_id) const;
  const Tile* tile_at(const GridPosition& p) const;

  Id unit_on(Id tile_id) const;
  Id city_on(Id tile_id) const;
  bool occupied(const GridPosition& p) const;

  void move_unit(Id unit_id, Id from_tile, Id to_tile);
  void remove_unit(Id tile_id);

 private:
  std::unordered_map<Id, const Tile*> tiles_by_id_;
  std::unordered_map<GridPosition, const Tile*, GridPositionHash> tiles_by_pos_;
  std::unordered_map<Id, Id> unit_by_tile_;
  std::unordered_map<Id, Id> city_by_tile_;
};

} // namespace tenx
