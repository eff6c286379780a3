#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <string>

namespace tenx {

// Cube coordinate on a pointy-top hex grid. Invariant: x + y + z == 0.
struct CubeCoord {
  int x{0};
  int y{0};
  int z{0};

  CubeCoord operator+(const CubeCoord& o) const { return {x + o.x, y + o.y, z + o.z}; }
  CubeCoord operator-(const CubeCoord& o) const { return {x - o.x, y - o.y, z - o.z}; }
  bool operator==(const CubeCoord& o) const { return x == o.x && y == o.y && z == o.z; }
  bool operator!=(const CubeCoord& o) const { return !(*this == o); }
};

// "odd-r" offset position used for storage and bounds checks.
struct GridPosition {
  int row{0};
  int col{0};

  bool operator==(const GridPosition& o) const { return row == o.row && col == o.col; }
  bool operator!=(const GridPosition& o) const { return !(*this == o); }
};

struct CubeCoordHash {
  std::size_t operator()(const CubeCoord& c) const {
    std::size_t h = std::hash<int>{}(c.x);
    h ^= std::hash<int>{}(c.y) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    h ^= std::hash<int>{}(c.z) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
  }
};

struct GridPositionHash {
  std::size_t operator()(const GridPosition& p) const {
    std::size_t h = std::hash<int>{}(p.row);
    h ^= std::hash<int>{}(p.col) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
  }
};

// Neighbor direction order. Pathfinding explores in this order, so it is part
// of the reproducibility contract: changing it changes which of several equal
// length paths is returned.
inline constexpr std::array<CubeCoord, 6> kCubeDirections{{
    {+1, 0, -1},
    {+1, -1, 0},
    {0, -1, +1},
    {-1, 0, +1},
    {-1, +1, 0},
    {0, +1, -1},
}};

CubeCoord offset_to_cube(int col, int row);
CubeCoord offset_to_cube(const GridPosition& p);
GridPosition cube_to_offset(const CubeCoord& c);

std::array<CubeCoord, 6> hex_neighbors(const CubeCoord& c);

// Neighbors of an offset position (same order as hex_neighbors). Not bounds-checked.
std::array<GridPosition, 6> hex_neighbors(const GridPosition& p);

int hex_distance(const CubeCoord& a, const CubeCoord& b);
int hex_distance(const GridPosition& a, const GridPosition& b);

bool in_bounds(const GridPosition& p, int width, int height);

std::string to_string(const CubeCoord& c);
std::string to_string(const GridPosition& p);

} // namespace tenx
