#pragma once
#include <trailfx/geom.hpp>

namespace trailfx {

// Axis-aligned box of a trail's sample points. The empty box is the zero box.
struct BoundingBox {
  Vec2 min{};
  Vec2 max{};

  Vec2 size() const { return max - min; }
};

// Widens b towards p. Per axis at most one of min/max moves: the max side is
// only considered when p does not lie below min.
inline void adapt_bounds(BoundingBox& b, Vec2 p) {
  if (p.x < b.min.x)
    b.min.x = p.x;
  else if (p.x > b.max.x)
    b.max.x = p.x;

  if (p.y < b.min.y)
    b.min.y = p.y;
  else if (p.y > b.max.y)
    b.max.y = p.y;
}

} // namespace trailfx
