#pragma once
#include <cstddef>
#include <random>
#include <vector>
#include <trailfx/colour.hpp>
#include <trailfx/geom.hpp>
#include <trailfx/snap.hpp>
#include <trailfx/texture.hpp>

namespace trailfx {

struct TexturedVertex2D {
  Vec2 position{};
  Vec2 tex_coord{};
  Colour4 colour{};
};

inline bool operator==(const TexturedVertex2D& a, const TexturedVertex2D& b) {
  return a.position == b.position && a.tex_coord == b.tex_coord && a.colour == b.colour;
}

// Reusable vertex storage, four vertices per quad. Storage survives clear()
// and is only reallocated when a frame needs more than the current capacity.
class QuadBatch {
public:
  static constexpr std::size_t kDefaultCapacity = 7200;

  explicit QuadBatch(std::size_t capacity = kDefaultCapacity);

  void add(const TexturedVertex2D& v);
  void clear() { verts_.clear(); }

  const std::vector<TexturedVertex2D>& vertices() const { return verts_; }
  std::size_t vertex_count() const { return verts_.size(); }
  std::size_t quad_count() const { return verts_.size() / 4; }
  std::size_t capacity() const { return verts_.capacity(); }
  std::size_t growth_count() const { return growths_; }

private:
  std::vector<TexturedVertex2D> verts_;
  std::size_t growths_{0};
};

// Emits one textured, coloured quad per snapshot point. Orientation comes from
// a generator reseeded from the snapshot every build, so equal snapshots give
// equal geometry.
class GeometryBuilder {
public:
  // Appends the snapshot's quads to batch; returns the number of quads added.
  std::size_t build(const RenderSnapshot& snap, QuadBatch& batch);

private:
  Vec2 next_texture_direction_();
  void draw_point_quad_(const RenderSnapshot& snap, const SmokePoint& point,
                        const UvRect& uv, QuadBatch& batch);

  std::mt19937 rotation_rng_{};
  std::uniform_real_distribution<double> unit_{0.0, 1.0};
};

} // namespace trailfx
