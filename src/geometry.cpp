#include <trailfx/geometry.hpp>
#include <cmath>
#include <spdlog/spdlog.h>

namespace trailfx {

QuadBatch::QuadBatch(std::size_t capacity) {
  verts_.reserve(capacity < 4 ? 4 : capacity);
}

void QuadBatch::add(const TexturedVertex2D& v) {
  if (verts_.size() == verts_.capacity()) {
    const std::size_t next = verts_.capacity() * 2;
    verts_.reserve(next);
    ++growths_;
    spdlog::debug("[QuadBatch] grew to {} vertices", next);
  }
  verts_.push_back(v);
}

std::size_t GeometryBuilder::build(const RenderSnapshot& snap, QuadBatch& batch) {
  if (snap.points.empty()) return 0;

  rotation_rng_.seed(snap.rotation_seed);
  unit_.reset();

  const TextureHandle tex = snap.texture.value_or(white_pixel());
  for (const auto& p : snap.points) draw_point_quad_(snap, p, tex.uv, batch);
  return snap.points.size();
}

Vec2 GeometryBuilder::next_texture_direction_() {
  const float angle = static_cast<float>(unit_(rotation_rng_)) * kTAU;
  return { std::sin(angle), -std::cos(angle) };
}

void GeometryBuilder::draw_point_quad_(const RenderSnapshot& snap, const SmokePoint& point,
                                       const UvRect& uv, QuadBatch& batch) {
  const Colour4 time_colour = snap.colour_by_time
    ? snap.colour_by_time(point.time, snap)
    : Colour4::White();

  // One draw per point, always, so orientations stay aligned with the sequence.
  const Vec2 dir = next_texture_direction_();
  const Vec2 ortho = perpendicular_left(dir);
  const float r = snap.radius;
  const Vec2 p = point.position;
  const Vec2 o = snap.position_offset;

  const Vec2 local_top_left  = p + r * (-ortho - dir) - o;
  const Vec2 local_top_right = p + r * (-ortho + dir) - o;
  const Vec2 local_bot_left  = p + r * (ortho - dir) - o;
  const Vec2 local_bot_right = p + r * (ortho + dir) - o;

  auto vertex = [&](Vec2 local, Vec2 tex_coord) {
    const Colour4 pos_colour = snap.colour_by_position.at_position(local, snap.draw_size);
    return TexturedVertex2D{
      snap.draw_matrix.apply(local),
      tex_coord,
      multiply(pos_colour, time_colour)
    };
  };

  batch.add(vertex(local_top_left,  uv.top_left()));
  batch.add(vertex(local_top_right, uv.top_right()));
  batch.add(vertex(local_bot_right, uv.bottom_right()));
  batch.add(vertex(local_bot_left,  uv.bottom_left()));
}

} // namespace trailfx
