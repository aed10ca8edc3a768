#include <trailfx/colour_policy.hpp>

namespace trailfx {

static inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

Colour4 AgeFade::operator()(double point_time, const RenderSnapshot& frame) const {
  const double now = frame.current_time;
  double alpha = initial_alpha;
  if (point_fade_ms > 0.0) alpha *= clamp01(1.0 - (now - point_time) / point_fade_ms);

  if (frame.end_time) {
    const double since_end = now - *frame.end_time;
    if (afterlife_ms > 0.0) alpha *= clamp01(1.0 - since_end / afterlife_ms);
    else if (since_end >= 0.0) alpha = 0.0;
  }
  return Colour4{1.0f, 1.0f, 1.0f, static_cast<float>(alpha)};
}

AgeFade age_fade_from(const TrailConfig& cfg) {
  return AgeFade{cfg.initial_alpha, cfg.point_fade_ms, cfg.afterlife_ms};
}

} // namespace trailfx
