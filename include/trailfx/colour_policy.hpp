#pragma once
#include <trailfx/colour.hpp>
#include <trailfx/snap.hpp>
#include <trailfx/trail_config.hpp>

namespace trailfx {

// White with an alpha that decays with point age, and again over the
// afterlife once the trail has ended.
struct AgeFade {
  float initial_alpha = 1.0f;
  double point_fade_ms = 8000.0;
  double afterlife_ms = 0.0;

  Colour4 operator()(double point_time, const RenderSnapshot& frame) const;
};

AgeFade age_fade_from(const TrailConfig& cfg);

} // namespace trailfx
