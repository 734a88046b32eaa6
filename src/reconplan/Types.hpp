#pragma once

#include <cmath>

namespace reconplan {

// Planar position in the projected coordinate system of the input data (metres).
//
// Coordinate systems and reprojection are handled by the loading layer; the core
// only needs a plain Euclidean plane.
struct Vec2 {
  double x = 0.0;
  double y = 0.0;
};

inline double Distance(const Vec2& a, const Vec2& b)
{
  return std::hypot(a.x - b.x, a.y - b.y);
}

} // namespace reconplan
