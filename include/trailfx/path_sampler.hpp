#pragma once
#include <trailfx/geom.hpp>
#include <trailfx/trail_config.hpp>
#include <trailfx/trail_state.hpp>

namespace trailfx {

struct SamplerParams {
  // Upper bound on points emitted by one move.
  static constexpr int kMaxPointsPerMove = 1 << 16;

  float radius = 1.0f;
  float spacing_multiplier = 7.0f / 8.0f;
  LifetimeParams lifetime{};

  // Distance between consecutive emitted points.
  float interval() const { return radius * spacing_multiplier; }
};

SamplerParams sampler_params(const TrailConfig& cfg);

// Turns pointer move/end events into evenly spaced SmokePoints on a TrailState.
// Holds no per-trail data; one sampler can drive any number of trails.
class PathSampler {
public:
  PathSampler() = default;
  explicit PathSampler(const SamplerParams& p) : params_(p) {}

  // Returns true if at least one point was emitted (trail needs a redraw).
  // Ignored unless the trail is Active, and when the position or the interval
  // is not usable. Ends the trail once time - start_time reaches
  // max_duration_ms.
  bool on_move(TrailState& st, Vec2 position, double time) const;

  // Idempotent; returns true only for the call that ended the trail.
  bool on_end(TrailState& st, double time) const;

  const SamplerParams& params() const { return params_; }
  void set_params(const SamplerParams& p) { params_ = p; }

private:
  // Drops every point later than time and rebuilds the bounds.
  static void truncate_after_(TrailState& st, double time);

  SamplerParams params_{};
};

} // namespace trailfx
