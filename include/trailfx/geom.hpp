#pragma once
#include <cmath>
#include <numbers>

namespace trailfx {

// Constant naming convention (kCamelCase)
inline constexpr float kPI  = std::numbers::pi_v<float>;
inline constexpr float kTAU = 2.0f * kPI;

struct Vec2 {
  float x{};
  float y{};
};

inline Vec2 operator+(Vec2 a, Vec2 b) { return {a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(Vec2 a, Vec2 b) { return {a.x - b.x, a.y - b.y}; }
inline Vec2 operator-(Vec2 a) { return {-a.x, -a.y}; }
inline Vec2 operator*(float s, Vec2 v) { return {s * v.x, s * v.y}; }
inline Vec2 operator*(Vec2 v, float s) { return {s * v.x, s * v.y}; }
inline Vec2& operator+=(Vec2& a, Vec2 b) { a.x += b.x; a.y += b.y; return a; }
inline bool operator==(Vec2 a, Vec2 b) { return a.x == b.x && a.y == b.y; }

inline float length(Vec2 v) { return std::sqrt(v.x*v.x + v.y*v.y); }

// Zero-length input yields the zero vector.
inline Vec2 normalize(Vec2 v) {
  const float len = length(v);
  if (len <= 0.0f) return {};
  return {v.x / len, v.y / len};
}

// Rotates 90 degrees counter-clockwise in y-down screen space.
inline Vec2 perpendicular_left(Vec2 v) { return {-v.y, v.x}; }

// Row-major 2D affine transform:
// | m00 m01 m02 |
// | m10 m11 m12 |
struct Transform2D {
  float m00{1.0f}, m01{0.0f}, m02{0.0f};
  float m10{0.0f}, m11{1.0f}, m12{0.0f};

  Vec2 apply(Vec2 p) const {
    return { m00*p.x + m01*p.y + m02,
             m10*p.x + m11*p.y + m12 };
  }

  static Transform2D Translation(float tx, float ty) {
    Transform2D t; t.m02 = tx; t.m12 = ty; return t;
  }
};

// a * b applies b first.
inline Transform2D operator*(const Transform2D& a, const Transform2D& b) {
  Transform2D r;
  r.m00 = a.m00*b.m00 + a.m01*b.m10;
  r.m01 = a.m00*b.m01 + a.m01*b.m11;
  r.m02 = a.m00*b.m02 + a.m01*b.m12 + a.m02;
  r.m10 = a.m10*b.m00 + a.m11*b.m10;
  r.m11 = a.m10*b.m01 + a.m11*b.m11;
  r.m12 = a.m10*b.m02 + a.m11*b.m12 + a.m12;
  return r;
}

} // namespace trailfx
