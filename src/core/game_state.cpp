#include "tenx/core/game_state.h"

#include <stdexcept>
#include <utility>

namespace tenx {

Id allocate_id(GameState& s) { return s.next_id++; }

int remaining_resource(const GameState& s, const Tile& t) {
  if (t.resource_type.empty()) return 0;
  const int* left = find_ptr(s.tile_resources, t.id);
  return left ? *left : t.resource_amount;
}

Participant* find_participant(GameState& s, Id participant_id) {
  for (auto& p : s.participants) {
    if (p.id == participant_id) return &p;
  }
  return nullptr;
}

const Participant* find_participant(const GameState& s, Id participant_id) {
  for (const auto& p : s.participants) {
    if (p.id == participant_id) return &p;
  }
  return nullptr;
}

Id next_active_participant(const GameState& s, Id after_id) {
  const std::size_t n = s.participants.size();
  if (n == 0) return kInvalidId;

  std::size_t start = n - 1;
  for (std::size_t i = 0; i < n; ++i) {
    if (s.participants[i].id == after_id) {
      start = i;
      break;
    }
  }

  for (std::size_t step = 1; step <= n; ++step) {
    const auto& p = s.participants[(start + step) % n];
    if (!p.is_eliminated) return p.id;
  }
  return kInvalidId;
}

void push_event(GameState& s, GameEventKind kind, Id participant_id, std::string message, int max_events) {
  GameEvent ev;
  ev.seq = s.next_event_seq++;
  ev.turn_no = s.turn_no;
  ev.kind = kind;
  ev.participant_id = participant_id;
  ev.message = std::move(message);
  s.events.push_back(std::move(ev));

  if (max_events > 0 && s.events.size() > static_cast<std::size_t>(max_events)) {
    const auto excess = s.events.size() - static_cast<std::size_t>(max_events);
    s.events.erase(s.events.begin(), s.events.begin() + static_cast<std::ptrdiff_t>(excess));
  }
}

BoardIndex::BoardIndex(const GameState& s) {
  tiles_by_id_.reserve(s.map.tiles.size());
  tiles_by_pos_.reserve(s.map.tiles.size());
  for (const auto& t : s.map.tiles) {
    tiles_by_id_[t.id] = &t;
    tiles_by_pos_[t.pos] = &t;
  }
  for (const auto& [id, u] : s.units) unit_by_tile_[u.tile_id] = id;
  for (const auto& [id, c] : s.cities) city_by_tile_[c.tile_id] = id;
}

const Tile* BoardIndex::tile(Id tile_id) const {
  auto it = tiles_by_id_.find(tile_id);
  return it == tiles_by_id_.end() ? nullptr : it->second;
}

const Tile* BoardIndex::tile_at(const GridPosition& p) const {
  auto it = tiles_by_pos_.find(p);
  return it == tiles_by_pos_.end() ? nullptr : it->second;
}

Id BoardIndex::unit_on(Id tile_id) const {
  auto it = unit_by_tile_.find(tile_id);
  return it == unit_by_tile_.end() ? kInvalidId : it->second;
}

Id BoardIndex::city_on(Id tile_id) const {
  auto it = city_by_tile_.find(tile_id);
  return it == city_by_tile_.end() ? kInvalidId : it->second;
}

bool BoardIndex::occupied(const GridPosition& p) const {
  const Tile* t = tile_at(p);
  return t && unit_on(t->id) != kInvalidId;
}

void BoardIndex::move_unit(Id unit_id, Id from_tile, Id to_tile) {
  auto it = unit_by_tile_.find(from_tile);
  if (it != unit_by_tile_.end() && it->second == unit_id) unit_by_tile_.erase(it);
  if (unit_on(to_tile) != kInvalidId) {
    throw std::logic_error("tile " + std::to_string(to_tile) + " already occupied");
  }
  unit_by_tile_[to_tile] = unit_id;
}

void BoardIndex::remove_unit(Id tile_id) { unit_by_tile_.erase(tile_id); }

} // namespace tenx
