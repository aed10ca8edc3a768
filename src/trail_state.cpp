#include <trailfx/trail_state.hpp>
#include <spdlog/spdlog.h>

namespace trailfx {

const char* phase_name(TrailPhase p) {
  switch (p) {
    case TrailPhase::Uninitialized: return "Uninitialized";
    case TrailPhase::Active:        return "Active";
    case TrailPhase::Ending:        return "Ending";
    case TrailPhase::Expired:       return "Expired";
    default: return "Unknown";
  }
}

bool attach(TrailState& st, double now) {
  if (st.phase != TrailPhase::Uninitialized) return false;
  st.phase = TrailPhase::Active;
  st.start_time = now;
  spdlog::debug("[Trail] attached at t={}", now);
  return true;
}

bool end_trail(TrailState& st, const LifetimeParams& lp, double now) {
  if (!st.is_active()) return false;
  st.phase = TrailPhase::Ending;
  st.end_time = now;
  st.expiry = now + lp.afterlife_ms + lp.fixed_buffer_ms;
  spdlog::debug("[Trail] ended at t={} ({} points), expires at t={}",
                now, st.points.size(), *st.expiry);
  return true;
}

bool tick_lifecycle(TrailState& st, double now) {
  if (st.phase != TrailPhase::Ending || !st.expiry) return false;
  if (now <= *st.expiry) return false;
  st.phase = TrailPhase::Expired;
  spdlog::debug("[Trail] expired at t={}", now);
  return true;
}

void recalculate_bounds(TrailState& st) {
  st.bounds = BoundingBox{};
  for (const auto& p : st.points) adapt_bounds(st.bounds, p.position);
}

} // namespace trailfx
