#pragma once

#include <functional>
#include <optional>
#include <vector>

#include "tenx/core/hex_grid.h"

namespace tenx {

// Side-effect-free occupancy test supplied by the caller.
using BlockedFn = std::function<bool(const GridPosition&)>;

struct PathOptions {
  // When false (default) a goal reported as blocked yields no path.
  // When true the goal is exempt from the blocking check: callers that move onto
  // a tile being vacated in the same action must re-validate occupancy themselves.
  bool allow_blocked_goal{false};
};

// Shortest path (uniform cost, A* with hex distance as heuristic) from start to
// goal, both inclusive, using at most move_points steps.
//
// Returns std::nullopt when the goal is out of bounds, blocked (see PathOptions),
// unreachable, or only reachable with more than move_points steps. A path is
// never truncated to fit the budget.
//
// start == goal always yields {start}, regardless of budget or blocking.
//
// Deterministic: equal inputs give equal paths. Ties are broken by lower f,
// then lower h, then insertion order, with neighbors enumerated in
// kCubeDirections order.
std::optional<std::vector<GridPosition>> find_path(const GridPosition& start, const GridPosition& goal,
                                                   int move_points, int map_width, int map_height,
                                                   const BlockedFn& is_blocked, const PathOptions& opt = {});

// Every position reachable from start within move_points steps (start included),
// in breadth-first discovery order. Blocked positions are never entered.
std::vector<GridPosition> reachable_positions(const GridPosition& start, int move_points, int map_width,
                                              int map_height, const BlockedFn& is_blocked);

// In-bounds positions whose hex distance from origin lies in [range_min, range_max],
// in row-major order. Blocking is ignored (attacks target occupied tiles).
std::vector<GridPosition> positions_in_attack_range(const GridPosition& origin, int range_min, int range_max,
                                                    int map_width, int map_height);

} // namespace tenx
