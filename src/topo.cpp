#include <algorithm>
#include <assert.h>
#include "topo.hpp"
#include "utils.hpp"
#include "errors.hpp"


// Specific distance functions ////////////////////////////////////////////////////


inline Float dist_circle_plane(int y, int x, int i, int j, int, int)
{
  return std::sqrt(static_cast<Float>(squared(i - y) + squared(j - x)));
}


inline Float dist_circle_torus(int y, int x, int i, int j, int height, int width)
{
  assert (0 <= x);
  assert (0 <= y);
  assert (x <= width);
  assert (y <= height);

  int dx = std::abs(j - x);
  int dy = std::abs(i - y);

  return std::sqrt(static_cast<Float>(squared(std::min(dx, width - dx)) + squared(std::min(dy, height - dy))));
}


// Hexagonal lattice layout with 'pointy top' and shifting odd rows by 1/2
// See https://www.redblobgames.com/grids/hexagons/
// Here we simplified the expression with Mathematica
inline Float dist_hexa_plane(int row1, int col1, int row2, int col2, int, int)
{
  int a = std::abs(row1 - row2);
  int b = std::abs(col1 - col2 - (row1 - (row1 & 1)) / 2 + (row2 - (row2 & 1)) / 2);
  int c = std::abs(col1 - col2 + row1 - row2 - (row1 - (row1 & 1)) / 2 + (row2 - (row2 & 1)) / 2);
  return static_cast<Float>(std::max({a, b, c}));
}


inline Float dist_hexa_torus(int row1, int col1, int row2, int col2, int height, int width)
{
  Float a = dist_hexa_plane(row1, col1, row2, col2, 0, 0);

  Float b = dist_hexa_plane(row1, col1, row2 + height, col2, 0, 0);
  Float c = dist_hexa_plane(row1, col1, row2, col2 + width, 0, 0);
  Float d = dist_hexa_plane(row1, col1, row2 + height, col2 + width, 0, 0);

  Float e = dist_hexa_plane(row1 + height, col1, row2, col2, 0, 0);
  Float f = dist_hexa_plane(row1, col1 + width, row2, col2, 0, 0);
  Float g = dist_hexa_plane(row1 + height, col1 + width, row2, col2, 0, 0);

  return std::min({a, b, c, d, e, f, g});
}


inline Float dist_rect_plane(int y, int x, int i, int j, int, int)
{
  return static_cast<Float>(std::max(std::abs(i - y), std::abs(j - x)));
}


inline Float dist_rect_torus(int y, int x, int i, int j, int height, int width)
{
  int dx = std::abs(j - x);
  int dy = std::abs(i - y);
  dx = std::min(dx, width - dx);
  dy = std::min(dy, height - dy);
  return static_cast<Float>(std::max(dx, dy));
}


// Implementation of distance_function ////////////////////////////////////////////


DistanceFunction distance_function(GlobalTopology global_topology, LocalTopology local_topology)
{
  switch (global_topology)
  {
  case GlobalTopology::PLANE:
    switch (local_topology)
    {
    case LocalTopology::CIRC:
      return dist_circle_plane;
      break;
    case LocalTopology::HEXA:
      return dist_hexa_plane;
      break;
    case LocalTopology::RECT:
      return dist_rect_plane;
    default:
      throw ConfigError("topology", "Invalid local topology");
      break;
    }
    break;
  case GlobalTopology::TORUS:
    switch (local_topology)
    {
    case LocalTopology::CIRC:
      return dist_circle_torus;
      break;
    case LocalTopology::HEXA:
      return dist_hexa_torus;
      break;
    case LocalTopology::RECT:
      return dist_rect_torus;
      break;
    default:
      throw ConfigError("topology", "Invalid local topology");
      break;
    }
    break;
  default:
    throw ConfigError("topology", "Invalid global topology");
    break;
  }
}


LocalTopology parse_local_topology(const std::string& name)
{
  if (name == "circ" || name == "euclidean")
    return LocalTopology::CIRC;
  if (name == "rect")
    return LocalTopology::RECT;
  if (name == "hexa")
    return LocalTopology::HEXA;
  throw ConfigError("local topology", "'" + name + "' is not one of (circ|rect|hexa)");
}


GlobalTopology parse_global_topology(const std::string& name)
{
  if (name == "plane")
    return GlobalTopology::PLANE;
  if (name == "torus")
    return GlobalTopology::TORUS;
  throw ConfigError("global topology", "'" + name + "' is not one of (plane|torus)");
}
