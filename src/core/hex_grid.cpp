#include "tenx/core/hex_grid.h"

#include <cstdlib>

namespace tenx {

namespace {

// Floor division by 2 that also holds for negative rows, so the offset/cube
// mapping stays a bijection over all integers.
int floor_half(int v) { return (v - (v & 1)) / 2; }

} // namespace

CubeCoord offset_to_cube(int col, int row) {
  const int x = col - floor_half(row);
  const int z = row;
  return CubeCoord{x, -x - z, z};
}

CubeCoord offset_to_cube(const GridPosition& p) { return offset_to_cube(p.col, p.row); }

GridPosition cube_to_offset(const CubeCoord& c) {
  GridPosition p;
  p.row = c.z;
  p.col = c.x + floor_half(c.z);
  return p;
}

std::array<CubeCoord, 6> hex_neighbors(const CubeCoord& c) {
  std::array<CubeCoord, 6> out{};
  for (std::size_t i = 0; i < kCubeDirections.size(); ++i) out[i] = c + kCubeDirections[i];
  return out;
}

std::array<GridPosition, 6> hex_neighbors(const GridPosition& p) {
  const auto cubes = hex_neighbors(offset_to_cube(p));
  std::array<GridPosition, 6> out{};
  for (std::size_t i = 0; i < cubes.size(); ++i) out[i] = cube_to_offset(cubes[i]);
  return out;
}

int hex_distance(const CubeCoord& a, const CubeCoord& b) {
  return (std::abs(a.x - b.x) + std::abs(a.y - b.y) + std::abs(a.z - b.z)) / 2;
}

int hex_distance(const GridPosition& a, const GridPosition& b) {
  return hex_distance(offset_to_cube(a), offset_to_cube(b));
}

bool in_bounds(const GridPosition& p, int width, int height) {
  return p.row >= 0 && p.row < height && p.col >= 0 && p.col < width;
}

std::string to_string(const CubeCoord& c) {
  return "(" + std::to_string(c.x) + ", " + std::to_string(c.y) + ", " + std::to_string(c.z) + ")";
}

std::string to_string(const GridPosition& p) {
  return "(" + std::to_string(p.row) + ", " + std::to_string(p.col) + ")";
}

} // namespace tenx
