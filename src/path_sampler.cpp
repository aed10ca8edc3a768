#include <trailfx/path_sampler.hpp>
#include <algorithm>
#include <iterator>
#include <cmath>
#include <spdlog/spdlog.h>

namespace trailfx {

SamplerParams sampler_params(const TrailConfig& cfg) {
  SamplerParams p;
  p.radius = cfg.radius;
  p.spacing_multiplier = cfg.spacing_multiplier;
  p.lifetime.max_duration_ms = cfg.max_duration_ms;
  p.lifetime.afterlife_ms = cfg.afterlife_ms;
  p.lifetime.fixed_buffer_ms = cfg.fixed_buffer_ms;
  return p;
}

void PathSampler::truncate_after_(TrailState& st, double time) {
  // First point strictly later than time.
  auto it = std::upper_bound(st.points.begin(), st.points.end(), time,
                             [](double t, const SmokePoint& p){ return t < p.time; });
  const auto dropped = std::distance(it, st.points.end());
  st.points.erase(it, st.points.end());
  // Removal can only shrink the box; rebuild from scratch.
  recalculate_bounds(st);
  spdlog::debug("[PathSampler] late event at t={}: dropped {} points, {} remain",
                time, dropped, st.points.size());
}

bool PathSampler::on_move(TrailState& st, Vec2 position, double time) const {
  if (!st.is_active()) return false;
  if (!std::isfinite(position.x) || !std::isfinite(position.y)) return false;

  const float interval = params_.interval();
  if (!std::isfinite(interval) || interval <= 0.0f) {
    spdlog::warn("[PathSampler] interval {} is not positive, move ignored", interval);
    return false;
  }

  if (!st.last_position) st.last_position = position;
  if (!st.last_time) st.last_time = time;
  const Vec2 last = *st.last_position;

  const float delta = length(position - last);
  st.carry_distance += delta;

  const float ratio = st.carry_distance / interval;
  int count = 0;
  if (ratio >= static_cast<float>(SamplerParams::kMaxPointsPerMove)) {
    spdlog::warn("[PathSampler] move spans {} intervals, emitting {}",
                 ratio, SamplerParams::kMaxPointsPerMove);
    count = SamplerParams::kMaxPointsPerMove;
  } else if (ratio > 0.0f) {
    count = static_cast<int>(ratio);
  }

  bool emitted = false;
  if (count > 0) {
    const Vec2 dir = normalize(position - last);
    const float first_offset = interval - (st.carry_distance - delta);
    Vec2 point_pos = last + first_offset * dir;
    const Vec2 step = interval * dir;

    if (!st.points.empty() && st.points.back().time > time) {
      truncate_after_(st, time);
    }

    // Point times follow their distance along the segment. Starting from
    // min(last_time, time) keeps them at or after every surviving point.
    const double t0 = std::min(*st.last_time, time);
    float along = first_offset;
    for (int i = 0; i < count; ++i) {
      const double frac = delta > 0.0f ? std::clamp(double(along) / double(delta), 0.0, 1.0) : 1.0;
      st.points.push_back(SmokePoint{point_pos, std::min(time, t0 + (time - t0) * frac)});
      adapt_bounds(st.bounds, point_pos);
      point_pos += step;
      along += interval;
    }

    st.carry_distance = std::fmod(st.carry_distance, interval);
    emitted = true;
  }

  st.last_position = position;
  st.last_time = time;

  if (time - st.start_time >= params_.lifetime.max_duration_ms) {
    spdlog::info("[PathSampler] trail reached max duration ({} ms), ending at t={}",
                 params_.lifetime.max_duration_ms, time);
    (void)on_end(st, time);
  }
  return emitted;
}

bool PathSampler::on_end(TrailState& st, double time) const {
  return end_trail(st, params_.lifetime, time);
}

} // namespace trailfx
