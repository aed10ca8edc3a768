#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <vector>
#include <trailfx/bounds.hpp>
#include <trailfx/colour.hpp>
#include <trailfx/event_channel.hpp>
#include <trailfx/geom.hpp>
#include <trailfx/path_sampler.hpp>
#include <trailfx/snap.hpp>
#include <trailfx/snap_buffer.hpp>
#include <trailfx/texture.hpp>
#include <trailfx/trail_config.hpp>
#include <trailfx/trail_state.hpp>

namespace trailfx {

using TrailId = std::uint64_t;

// Owns the live trails, broadcasts pointer events to them and publishes one
// snapshot per trail per frame.
//
// Frame order: move()/end() as input arrives -> update(now) ->
// publish_frames(now) -> snapshots() for the render phase.
class TrailHost {
public:
  explicit TrailHost(const TrailConfig& cfg);
  ~TrailHost();
  TrailHost(const TrailHost&) = delete;
  TrailHost& operator=(const TrailHost&) = delete;

  // Starts a new trail at now. A trail still Active from an earlier session
  // is ended first.
  TrailId begin_session(double now);

  void move(Vec2 position, double time) { moved_.publish(position, time); }
  void end(double time) { ended_.publish(time); }

  // Advances lifecycles and drops expired trails; returns how many were dropped.
  std::size_t update(double now);

  // Captures every trail into its snapshot buffer.
  void publish_frames(double now);

  // Render phase: latest snapshot of every trail that has published one.
  std::vector<RenderSnapshot> snapshots();

  std::size_t trail_count() const { return trails_.size(); }
  std::vector<TrailId> trail_ids() const;
  const TrailState* trail_state(TrailId id) const;
  std::optional<BoundingBox> bounds_of(TrailId id) const;
  std::size_t move_subscribers() const { return moved_.subscriber_count(); }
  std::size_t end_subscribers() const { return ended_.subscriber_count(); }

  const TrailConfig& config() const { return cfg_; }

  // Style applied to trails from the next published frame on.
  void set_texture(std::optional<TextureHandle> tex) { texture_ = tex; }
  void set_colour(const ColourInfo& c) { colour_ = c; }
  void set_draw_matrix(const Transform2D& m) { draw_matrix_ = m; }

private:
  struct Trail {
    TrailId id{0};
    TrailState state;
    TrailStyle style;
    SnapshotBuffer buffer;
    std::uint64_t cursor{0};
    std::optional<RenderSnapshot> last;
    SubscriptionId move_sub{0};
    SubscriptionId end_sub{0};
  };

  void detach_(Trail& t);
  const Trail* find_(TrailId id) const;

  TrailConfig cfg_;
  PathSampler sampler_;
  std::mt19937 seed_rng_;
  EventChannel<Vec2, double> moved_;
  EventChannel<double> ended_;
  std::vector<std::unique_ptr<Trail>> trails_;
  TrailId next_id_{0};

  std::optional<TextureHandle> texture_;
  ColourInfo colour_{};
  Transform2D draw_matrix_{};
};

} // namespace trailfx
