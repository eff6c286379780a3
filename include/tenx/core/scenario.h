#pragma once

#include <string>

#include "tenx/core/game_state.h"

namespace tenx {

// Rectangular map filled with one terrain. Tile ids are assigned row-major
// starting at 1 (id = row * width + col + 1).
Map make_map(const std::string& code, int width, int height, Terrain fill = Terrain::Grassland);

// Overwrites the terrain of the tile at p. Throws std::invalid_argument if p is off the map.
void set_terrain(Map& m, const GridPosition& p, Terrain t);

// Places amount units of a resource on the tile at p. An empty type clears it.
// Throws std::invalid_argument if p is off the map or amount is negative.
void set_resource(Map& m, const GridPosition& p, const std::string& type, int amount);

// Builders used by scenarios and tests. Each allocates the entity id from
// GameState::next_id and throws std::invalid_argument when the placement would
// break a board invariant (missing tile, occupied tile, unknown unit type).
Id add_participant(GameState& s, const std::string& display_name, ParticipantKind kind = ParticipantKind::Human);
Id add_unit(GameState& s, const ContentDB& content, Id participant_id, const std::string& type_code,
            const GridPosition& at);
// A new city works its own tile and the unclaimed tiles around it, and starts
// with a small stockpile (5 wood, 5 stone, 5 wheat, 0 iron).
Id add_city(GameState& s, Id participant_id, const GridPosition& at, int max_hp, int hp = -1);

// Two-player skirmish on a 10x8 map with a small lake in the middle: each side
// owns one city, a warrior and a slinger. The first participant is active.
GameState make_demo_scenario(const ContentDB& content, Id game_id = 1);

} // namespace tenx
