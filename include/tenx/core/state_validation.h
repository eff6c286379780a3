#pragma once

#include <string>
#include <vector>

#include "tenx/core/game_state.h"

namespace tenx {

// Check referential integrity and the board invariants of a GameState:
// id/key agreement, map shape, units and cities on existing tiles, hit point
// ranges, one unit per tile, a legal active participant and a next_id that
// is ahead of every allocated id.
//
// If `content` is provided, unit type codes are checked against it and unit HP
// is bounded by the type's health.
//
// Returns a sorted list of human-readable error strings. Empty => valid.
std::vector<std::string> validate_game_state(const GameState& s, const ContentDB* content = nullptr);

} // namespace tenx
