#include <iostream>
#include <set>
#include <vector>

#include "tenx/core/pathfinder.h"

#define TENX_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool path_is_connected(const std::vector<tenx::GridPosition>& path) {
  for (std::size_t i = 1; i < path.size(); ++i) {
    if (tenx::hex_distance(path[i - 1], path[i]) != 1) return false;
  }
  return true;
}

} // namespace

int test_pathfinder() {
  using tenx::GridPosition;
  const tenx::BlockedFn open_grid = [](const GridPosition&) { return false; };

  // Empty grid: path length is distance + 1 whenever the budget allows it.
  {
    const GridPosition start{0, 0};
    for (int row = 0; row < 6; ++row) {
      for (int col = 0; col < 6; ++col) {
        const GridPosition goal{row, col};
        const int d = tenx::hex_distance(start, goal);
        const auto path = tenx::find_path(start, goal, d, 6, 6, open_grid);
        TENX_ASSERT(path.has_value());
        TENX_ASSERT(path->size() == static_cast<std::size_t>(d + 1));
        TENX_ASSERT(path->front() == start);
        TENX_ASSERT(path->back() == goal);
        TENX_ASSERT(path_is_connected(*path));
        if (d > 0) TENX_ASSERT(!tenx::find_path(start, goal, d - 1, 6, 6, open_grid).has_value());
      }
    }
  }

  // start == goal ignores budget and blocking.
  {
    const tenx::BlockedFn all_blocked = [](const GridPosition&) { return true; };
    const auto path = tenx::find_path(GridPosition{2, 2}, GridPosition{2, 2}, 0, 5, 5, all_blocked);
    TENX_ASSERT(path.has_value());
    TENX_ASSERT(path->size() == 1);
  }

  // Every neighbor of start blocked => no path.
  {
    const GridPosition start{2, 2};
    const auto nbs = tenx::hex_neighbors(start);
    const std::set<std::pair<int, int>> walls = [&] {
      std::set<std::pair<int, int>> w;
      for (const auto& n : nbs) w.insert({n.row, n.col});
      return w;
    }();
    const tenx::BlockedFn blocked = [&](const GridPosition& p) { return walls.count({p.row, p.col}) > 0; };
    TENX_ASSERT(!tenx::find_path(start, GridPosition{4, 4}, 10, 6, 6, blocked).has_value());
  }

  // Detour around a single blocker; the budget must cover the detour.
  {
    const tenx::BlockedFn blocked = [](const GridPosition& p) { return p.row == 0 && p.col == 1; };
    TENX_ASSERT(!tenx::find_path(GridPosition{0, 0}, GridPosition{0, 2}, 2, 5, 5, blocked).has_value());

    const auto path = tenx::find_path(GridPosition{0, 0}, GridPosition{0, 2}, 3, 5, 5, blocked);
    TENX_ASSERT(path.has_value());
    const std::vector<GridPosition> want{{0, 0}, {1, 0}, {1, 1}, {0, 2}};
    TENX_ASSERT(*path == want);
  }

  // Goal out of bounds.
  TENX_ASSERT(!tenx::find_path(GridPosition{0, 0}, GridPosition{0, 5}, 10, 5, 5, open_grid).has_value());
  TENX_ASSERT(!tenx::find_path(GridPosition{0, 0}, GridPosition{-1, 0}, 10, 5, 5, open_grid).has_value());

  // Blocked goal policy.
  {
    const tenx::BlockedFn goal_blocked = [](const GridPosition& p) { return p.row == 0 && p.col == 2; };
    TENX_ASSERT(!tenx::find_path(GridPosition{0, 0}, GridPosition{0, 2}, 5, 5, 5, goal_blocked).has_value());

    tenx::PathOptions opt;
    opt.allow_blocked_goal = true;
    const auto path = tenx::find_path(GridPosition{0, 0}, GridPosition{0, 2}, 5, 5, 5, goal_blocked, opt);
    TENX_ASSERT(path.has_value());
    TENX_ASSERT(path->size() == 3);
  }

  // Deterministic across calls.
  {
    const tenx::BlockedFn blocked = [](const GridPosition& p) { return p.col == 2 && p.row < 4; };
    const auto a = tenx::find_path(GridPosition{0, 0}, GridPosition{0, 4}, 12, 6, 6, blocked);
    const auto b = tenx::find_path(GridPosition{0, 0}, GridPosition{0, 4}, 12, 6, 6, blocked);
    TENX_ASSERT(a.has_value());
    TENX_ASSERT(b.has_value());
    TENX_ASSERT(*a == *b);
    TENX_ASSERT(path_is_connected(*a));
    for (const auto& p : *a) TENX_ASSERT(!blocked(p));
  }

  // Reachable set.
  {
    const auto one = tenx::reachable_positions(GridPosition{2, 2}, 1, 5, 5, open_grid);
    TENX_ASSERT(one.size() == 7);
    TENX_ASSERT(one.front() == (GridPosition{2, 2}));

    const auto corner = tenx::reachable_positions(GridPosition{0, 0}, 1, 5, 5, open_grid);
    TENX_ASSERT(corner.size() == 3);

    const tenx::BlockedFn wall = [](const GridPosition& p) { return p.col == 1; };
    const auto walled = tenx::reachable_positions(GridPosition{0, 0}, 3, 5, 5, wall);
    for (const auto& p : walled) TENX_ASSERT(p.col == 0);
  }

  // Attack ranges ignore blocking.
  {
    const auto ring = tenx::positions_in_attack_range(GridPosition{2, 2}, 1, 1, 5, 5);
    TENX_ASSERT(ring.size() == 6);
    const auto two = tenx::positions_in_attack_range(GridPosition{2, 2}, 1, 2, 5, 5);
    TENX_ASSERT(two.size() == 18);
    for (const auto& p : two) {
      const int d = tenx::hex_distance(GridPosition{2, 2}, p);
      TENX_ASSERT(d >= 1 && d <= 2);
    }
  }

  return 0;
}
