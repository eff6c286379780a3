#include "tenx/core/pathfinder.h"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <queue>
#include <unordered_map>
#include <unordered_set>

namespace tenx {

namespace {

struct OpenItem {
  int f{0};
  int h{0};
  std::uint64_t seq{0};
  CubeCoord node;
};

struct OpenItemComp {
  bool operator()(const OpenItem& a, const OpenItem& b) const {
    // priority_queue is max-heap; return true if a should come after b.
    if (a.f != b.f) return a.f > b.f;
    if (a.h != b.h) return a.h > b.h;
    return a.seq > b.seq;
  }
};

std::vector<GridPosition> reconstruct(const std::unordered_map<CubeCoord, CubeCoord, CubeCoordHash>& came_from,
                                      CubeCoord cur, const CubeCoord& start) {
  std::vector<GridPosition> path;
  path.push_back(cube_to_offset(cur));
  while (cur != start) {
    auto it = came_from.find(cur);
    if (it == came_from.end()) break;
    cur = it->second;
    path.push_back(cube_to_offset(cur));
  }
  std::reverse(path.begin(), path.end());
  return path;
}

} // namespace

std::optional<std::vector<GridPosition>> find_path(const GridPosition& start, const GridPosition& goal,
                                                   int move_points, int map_width, int map_height,
                                                   const BlockedFn& is_blocked, const PathOptions& opt) {
  if (start == goal) return std::vector<GridPosition>{start};
  if (!in_bounds(goal, map_width, map_height)) return std::nullopt;

  const bool goal_blocked = is_blocked && is_blocked(goal);
  if (goal_blocked && !opt.allow_blocked_goal) return std::nullopt;

  const CubeCoord start_cube = offset_to_cube(start);
  const CubeCoord goal_cube = offset_to_cube(goal);

  // Cheap reject: no detour can beat the straight-line hex distance.
  if (hex_distance(start_cube, goal_cube) > move_points) return std::nullopt;

  std::priority_queue<OpenItem, std::vector<OpenItem>, OpenItemComp> open;
  std::unordered_map<CubeCoord, int, CubeCoordHash> g_score;
  std::unordered_map<CubeCoord, CubeCoord, CubeCoordHash> came_from;
  std::unordered_set<CubeCoord, CubeCoordHash> closed;
  std::uint64_t seq = 0;

  g_score[start_cube] = 0;
  const int h0 = hex_distance(start_cube, goal_cube);
  open.push(OpenItem{h0, h0, seq++, start_cube});

  while (!open.empty()) {
    const OpenItem cur = open.top();
    open.pop();

    if (closed.count(cur.node)) continue;  // stale entry
    if (cur.node == goal_cube) return reconstruct(came_from, cur.node, start_cube);
    closed.insert(cur.node);

    const int g_cur = g_score[cur.node];
    for (const CubeCoord& nb : hex_neighbors(cur.node)) {
      if (closed.count(nb)) continue;

      const GridPosition nb_pos = cube_to_offset(nb);
      if (!in_bounds(nb_pos, map_width, map_height)) continue;
      if (nb != goal_cube && is_blocked && is_blocked(nb_pos)) continue;

      const int tentative = g_cur + 1;
      if (tentative > move_points) continue;

      auto it = g_score.find(nb);
      if (it != g_score.end() && tentative >= it->second) continue;

      g_score[nb] = tentative;
      came_from[nb] = cur.node;
      const int h = hex_distance(nb, goal_cube);
      open.push(OpenItem{tentative + h, h, seq++, nb});
    }
  }

  return std::nullopt;
}

std::vector<GridPosition> reachable_positions(const GridPosition& start, int move_points, int map_width,
                                              int map_height, const BlockedFn& is_blocked) {
  std::vector<GridPosition> out;
  std::unordered_set<GridPosition, GridPositionHash> visited;
  std::deque<std::pair<GridPosition, int>> queue;

  queue.emplace_back(start, 0);
  visited.insert(start);

  while (!queue.empty()) {
    const auto [pos, cost] = queue.front();
    queue.pop_front();
    out.push_back(pos);
    if (cost >= move_points) continue;

    for (const GridPosition& nb : hex_neighbors(pos)) {
      if (visited.count(nb)) continue;
      if (!in_bounds(nb, map_width, map_height)) continue;
      if (is_blocked && is_blocked(nb)) continue;
      visited.insert(nb);
      queue.emplace_back(nb, cost + 1);
    }
  }
  return out;
}

std::vector<GridPosition> positions_in_attack_range(const GridPosition& origin, int range_min, int range_max,
                                                    int map_width, int map_height) {
  std::vector<GridPosition> out;
  for (int row = 0; row < map_height; ++row) {
    for (int col = 0; col < map_width; ++col) {
      const GridPosition p{row, col};
      const int d = hex_distance(origin, p);
      if (d >= range_min && d <= range_max) out.push_back(p);
    }
  }
  return out;
}

} // namespace tenx
