#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>
#include <trailfx/colour.hpp>
#include <trailfx/geom.hpp>
#include <trailfx/texture.hpp>
#include <trailfx/trail_state.hpp>

namespace trailfx {

struct RenderSnapshot;

// Colour-by-time policy: colour of a point given its time and the frame.
using TimeColourFn = std::function<Colour4(double point_time, const RenderSnapshot& frame)>;

// Per-trail style; may change between frames.
struct TrailStyle {
  float radius = 1.0f;
  std::uint32_t rotation_seed = 0;
  std::optional<TextureHandle> texture;    // unset -> white pixel
  TimeColourFn colour_by_time;             // unset -> opaque white
  ColourInfo colour_by_position{};
  Transform2D draw_matrix{};
};

// Immutable per-frame copy of a trail, the only input of geometry generation.
struct RenderSnapshot {
  std::vector<SmokePoint> points;
  float radius = 1.0f;
  Vec2 draw_size{};        // bounds.max - bounds.min
  Vec2 position_offset{};  // bounds.min (local origin)
  std::optional<TextureHandle> texture;
  double start_time = 0.0;
  std::optional<double> end_time;
  std::uint32_t rotation_seed = 0;
  double current_time = 0.0;  // render clock
  TimeColourFn colour_by_time;
  ColourInfo colour_by_position{};
  Transform2D draw_matrix{};
};

// Full value copy of state + style at render-clock time now.
RenderSnapshot capture_snapshot(const TrailState& st, const TrailStyle& style, double now);

} // namespace trailfx
