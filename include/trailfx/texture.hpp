#pragma once
#include <cstdint>
#include <trailfx/geom.hpp>

namespace trailfx {

// Normalized UV rectangle inside a texture.
struct UvRect {
  float left{0.0f};
  float top{0.0f};
  float right{1.0f};
  float bottom{1.0f};

  Vec2 top_left() const     { return {left, top}; }
  Vec2 top_right() const    { return {right, top}; }
  Vec2 bottom_left() const  { return {left, bottom}; }
  Vec2 bottom_right() const { return {right, bottom}; }
};

// Renderer-side texture reference. id 0 is the default opaque white texture.
struct TextureHandle {
  std::uint32_t id = 0;
  int width = 1;
  int height = 1;
  UvRect uv{};

  bool is_default() const { return id == 0; }
};

inline TextureHandle white_pixel() { return TextureHandle{}; }

} // namespace trailfx
