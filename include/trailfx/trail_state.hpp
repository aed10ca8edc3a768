#pragma once
#include <optional>
#include <vector>
#include <trailfx/bounds.hpp>
#include <trailfx/geom.hpp>

namespace trailfx {

// One time+position sample along the trail.
struct SmokePoint {
  Vec2 position{};
  double time = 0.0;   // ms
};

enum class TrailPhase : int {
  Uninitialized = 0,
  Active,
  Ending,
  Expired
};

const char* phase_name(TrailPhase p);

// Lifetime parameters, taken from TrailConfig.
struct LifetimeParams {
  double max_duration_ms = 60000.0;
  double afterlife_ms = 0.0;
  double fixed_buffer_ms = 100.0;
};

// Mutable per-trail state, owned by the update phase.
struct TrailState {
  std::vector<SmokePoint> points;   // non-decreasing time
  double start_time = 0.0;
  std::optional<double> end_time;
  std::optional<double> expiry;
  TrailPhase phase{TrailPhase::Uninitialized};
  BoundingBox bounds{};
  float carry_distance = 0.0f;      // path length not yet converted to points
  std::optional<Vec2> last_position;
  std::optional<double> last_time;

  bool is_active() const { return phase == TrailPhase::Active; }
};

// Uninitialized -> Active. Returns false if the trail was already attached.
bool attach(TrailState& st, double now);

// Active -> Ending; sets end_time and expiry. Returns false (no effect) if
// the trail is not Active.
bool end_trail(TrailState& st, const LifetimeParams& lp, double now);

// Ending -> Expired once now is strictly past expiry. Returns true on the
// transition tick only.
bool tick_lifecycle(TrailState& st, double now);

// Replays every point into an empty box.
void recalculate_bounds(TrailState& st);

} // namespace trailfx
