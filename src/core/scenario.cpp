#include "tenx/core/scenario.h"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "tenx/core/enum_strings.h"

namespace tenx {

namespace {

const Tile& require_tile(const GameState& s, const GridPosition& at) {
  for (const auto& t : s.map.tiles) {
    if (t.pos == at) return t;
  }
  throw std::invalid_argument("no tile at " + to_string(at));
}

// Starting stockpile of a newly founded city.
constexpr int kStartingWood = 5;
constexpr int kStartingStone = 5;
constexpr int kStartingWheat = 5;
constexpr int kStartingIron = 0;

bool worked_by_any_city(const GameState& s, Id tile_id) {
  for (const auto& [_, c] : s.cities) {
    if (std::find(c.tiles.begin(), c.tiles.end(), tile_id) != c.tiles.end()) return true;
  }
  return false;
}

} // namespace

Map make_map(const std::string& code, int width, int height, Terrain fill) {
  if (width <= 0 || height <= 0) throw std::invalid_argument("map size must be positive");
  Map m;
  m.code = code;
  m.width = width;
  m.height = height;
  m.tiles.reserve(static_cast<std::size_t>(width) * static_cast<std::size_t>(height));
  for (int row = 0; row < height; ++row) {
    for (int col = 0; col < width; ++col) {
      Tile t;
      t.id = static_cast<Id>(row * width + col + 1);
      t.pos = GridPosition{row, col};
      t.terrain = fill;
      m.tiles.push_back(std::move(t));
    }
  }
  return m;
}

void set_terrain(Map& m, const GridPosition& p, Terrain t) {
  if (!in_bounds(p, m.width, m.height)) throw std::invalid_argument("set_terrain: " + to_string(p) + " is off the map");
  m.tiles[static_cast<std::size_t>(p.row * m.width + p.col)].terrain = t;
}

void set_resource(Map& m, const GridPosition& p, const std::string& type, int amount) {
  if (!in_bounds(p, m.width, m.height)) throw std::invalid_argument("set_resource: " + to_string(p) + " is off the map");
  if (amount < 0) throw std::invalid_argument("set_resource: amount must be >= 0");
  Tile& t = m.tiles[static_cast<std::size_t>(p.row * m.width + p.col)];
  t.resource_type = type;
  t.resource_amount = type.empty() ? 0 : amount;
}

Id add_participant(GameState& s, const std::string& display_name, ParticipantKind kind) {
  Participant p;
  p.id = allocate_id(s);
  p.display_name = display_name;
  p.kind = kind;
  s.participants.push_back(p);
  if (s.active_participant_id == kInvalidId) s.active_participant_id = p.id;
  return p.id;
}

Id add_unit(GameState& s, const ContentDB& content, Id participant_id, const std::string& type_code,
            const GridPosition& at) {
  const UnitDefinition* def = find_ptr(content.unit_types, type_code);
  if (!def) throw std::invalid_argument("unknown unit type '" + type_code + "'");
  if (!find_participant(s, participant_id)) {
    throw std::invalid_argument("unknown participant " + std::to_string(participant_id));
  }

  const Tile& tile = require_tile(s, at);
  if (is_water(tile.terrain)) throw std::invalid_argument("cannot place a unit on water at " + to_string(at));
  for (const auto& [_, other] : s.units) {
    if (other.tile_id == tile.id) throw std::invalid_argument("tile " + to_string(at) + " is already occupied");
  }

  Unit u;
  u.id = allocate_id(s);
  u.participant_id = participant_id;
  u.type_code = type_code;
  u.hp = def->health;
  u.tile_id = tile.id;
  s.units[u.id] = u;
  return u.id;
}

Id add_city(GameState& s, Id participant_id, const GridPosition& at, int max_hp, int hp) {
  if (!find_participant(s, participant_id)) {
    throw std::invalid_argument("unknown participant " + std::to_string(participant_id));
  }
  if (max_hp <= 0) throw std::invalid_argument("city max_hp must be positive");

  const Tile& tile = require_tile(s, at);
  for (const auto& [_, other] : s.cities) {
    if (other.tile_id == tile.id) throw std::invalid_argument("tile " + to_string(at) + " already has a city");
  }

  City c;
  c.id = allocate_id(s);
  c.participant_id = participant_id;
  c.tile_id = tile.id;
  c.max_hp = max_hp;
  c.hp = hp < 0 ? max_hp : hp;

  // The city tile plus every neighbour no other city works yet.
  c.tiles.push_back(tile.id);
  for (const auto& n : hex_neighbors(at)) {
    if (!in_bounds(n, s.map.width, s.map.height)) continue;
    const Tile& nt = s.map.tiles[static_cast<std::size_t>(n.row * s.map.width + n.col)];
    if (!worked_by_any_city(s, nt.id)) c.tiles.push_back(nt.id);
  }

  c.resources["wood"] = kStartingWood;
  c.resources["stone"] = kStartingStone;
  c.resources["wheat"] = kStartingWheat;
  c.resources["iron"] = kStartingIron;

  s.cities[c.id] = c;
  return c.id;
}

GameState make_demo_scenario(const ContentDB& content, Id game_id) {
  GameState s;
  s.id = game_id;
  s.map = make_map("skirmish_10x8", 10, 8);

  // Lake splitting the middle of the map.
  set_terrain(s.map, GridPosition{3, 4}, Terrain::Water);
  set_terrain(s.map, GridPosition{3, 5}, Terrain::Water);
  set_terrain(s.map, GridPosition{4, 4}, Terrain::Water);
  set_terrain(s.map, GridPosition{0, 9}, Terrain::Tundra);
  set_terrain(s.map, GridPosition{7, 0}, Terrain::Tropical);

  set_resource(s.map, GridPosition{2, 2}, "wheat", 20);
  set_resource(s.map, GridPosition{5, 7}, "iron", 10);

  const Id player = add_participant(s, "Aurelia", ParticipantKind::Human);
  const Id rival = add_participant(s, "Borvan", ParticipantKind::Ai);

  add_city(s, player, GridPosition{3, 1}, 100);
  add_unit(s, content, player, "warrior", GridPosition{3, 2});
  add_unit(s, content, player, "slinger", GridPosition{4, 1});

  add_city(s, rival, GridPosition{4, 8}, 100);
  add_unit(s, content, rival, "warrior", GridPosition{4, 7});
  add_unit(s, content, rival, "slinger", GridPosition{3, 8});

  s.active_participant_id = player;
  return s;
}

} // namespace tenx
