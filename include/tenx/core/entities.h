#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "tenx/core/hex_grid.h"
#include "tenx/core/ids.h"

namespace tenx {

// --- map ---

enum class Terrain : std::uint8_t { Grassland, Tundra, Tropical, Water, Ocean };

struct Tile {
  Id id{kInvalidId};
  GridPosition pos;
  Terrain terrain{Terrain::Grassland};

  // Optional harvestable resource. Empty type means none. resource_amount is
  // the starting stock; what a game has left lives in GameState::tile_resources.
  std::string resource_type;
  int resource_amount{0};
};

// Fixed-size map. tiles never change after construction; tile ids are unique.
struct Map {
  std::string code;
  int width{0};
  int height{0};
  std::vector<Tile> tiles;
};

// --- content ---

// Immutable stat template shared by every unit of that type.
struct UnitDefinition {
  std::string code;
  int attack{0};
  int defence{0};
  int health{0};       // max HP
  int move_points{0};
  bool is_ranged{false};
  int range_min{0};    // only meaningful for ranged units
  int range_max{0};
};

// --- game entities ---

enum class ParticipantKind : std::uint8_t { Human, Ai };

enum class GameStatus : std::uint8_t { Active, Finished };

struct Participant {
  Id id{kInvalidId};
  std::string display_name;
  ParticipantKind kind{ParticipantKind::Human};
  bool is_eliminated{false};
};

struct Unit {
  Id id{kInvalidId};
  Id participant_id{kInvalidId};
  std::string type_code;
  int hp{0};
  Id tile_id{kInvalidId};

  // Reset for everyone at end of turn.
  bool has_acted{false};
};

struct City {
  Id id{kInvalidId};
  Id participant_id{kInvalidId};
  Id tile_id{kInvalidId};
  int hp{0};
  int max_hp{0};

  // Tiles this city harvests from at the end of its owner's turn.
  std::vector<Id> tiles;

  // Stockpile by resource type ("wood", "stone", "wheat", "iron").
  std::unordered_map<std::string, int> resources;
};

// Persistent log entry appended by committed actions.
enum class GameEventKind : std::uint8_t {
  UnitMoved,
  UnitAttacked,
  CityAttacked,
  UnitDestroyed,
  CityCaptured,
  ParticipantEliminated,
  TurnEnded,
  GameFinished,
};

struct GameEvent {
  std::uint64_t seq{0};
  int turn_no{0};
  GameEventKind kind{GameEventKind::UnitMoved};
  Id participant_id{kInvalidId};
  std::string message;
};

} // namespace tenx
