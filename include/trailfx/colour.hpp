#pragma once
#include <algorithm>
#include <trailfx/geom.hpp>

namespace trailfx {

// Linear RGBA, each channel nominally in [0,1].
struct Colour4 {
  float r{1.0f};
  float g{1.0f};
  float b{1.0f};
  float a{1.0f};

  static Colour4 White() { return {}; }
};

inline bool operator==(const Colour4& x, const Colour4& y) {
  return x.r == y.r && x.g == y.g && x.b == y.b && x.a == y.a;
}

// Component-wise product.
inline Colour4 multiply(const Colour4& x, const Colour4& y) {
  return {x.r * y.r, x.g * y.g, x.b * y.b, x.a * y.a};
}

inline Colour4 lerp(const Colour4& x, const Colour4& y, float t) {
  return { x.r + (y.r - x.r) * t,
           x.g + (y.g - x.g) * t,
           x.b + (y.b - x.b) * t,
           x.a + (y.a - x.a) * t };
}

// Colour-by-position policy: one colour, or a gradient across the four corners
// of the trail's draw area.
struct ColourInfo {
  Colour4 top_left{};
  Colour4 top_right{};
  Colour4 bottom_left{};
  Colour4 bottom_right{};

  static ColourInfo SingleColour(const Colour4& c) { return {c, c, c, c}; }
  static ColourInfo Vertical(const Colour4& top, const Colour4& bottom) {
    return {top, top, bottom, bottom};
  }
  static ColourInfo Horizontal(const Colour4& left, const Colour4& right) {
    return {left, right, left, right};
  }

  bool has_single_colour() const {
    return top_left == top_right && top_left == bottom_left && top_left == bottom_right;
  }

  // Bilinear sample; rel is the position relative to the draw area, clamped to [0,1].
  Colour4 interpolate(Vec2 rel) const {
    const float u = std::clamp(rel.x, 0.0f, 1.0f);
    const float v = std::clamp(rel.y, 0.0f, 1.0f);
    return lerp(lerp(top_left, top_right, u), lerp(bottom_left, bottom_right, u), v);
  }

  // Single colour, or the gradient sampled at local_pos / draw_size.
  // A zero-sized axis samples at 0.
  Colour4 at_position(Vec2 local_pos, Vec2 draw_size) const {
    if (has_single_colour()) return top_left;
    const Vec2 rel{ draw_size.x != 0.0f ? local_pos.x / draw_size.x : 0.0f,
                    draw_size.y != 0.0f ? local_pos.y / draw_size.y : 0.0f };
    return interpolate(rel);
  }
};

} // namespace trailfx
