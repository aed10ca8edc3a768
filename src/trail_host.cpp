#include <trailfx/trail_host.hpp>
#include <algorithm>
#include <trailfx/colour_policy.hpp>
#include <spdlog/spdlog.h>

namespace trailfx {

TrailHost::TrailHost(const TrailConfig& cfg)
  : cfg_(normalize(cfg)),
    sampler_(sampler_params(cfg_)),
    seed_rng_(cfg_.rotation_seed),
    colour_(ColourInfo::SingleColour(cfg_.colour)) {}

TrailHost::~TrailHost() {
  for (auto& t : trails_) detach_(*t);
}

TrailId TrailHost::begin_session(double now) {
  for (auto& t : trails_) {
    if (sampler_.on_end(t->state, now)) {
      spdlog::debug("[TrailHost] trail {} ended by new session", t->id);
    }
  }

  auto trail = std::make_unique<Trail>();
  trail->id = ++next_id_;
  trail->style.radius = cfg_.radius;
  trail->style.rotation_seed = static_cast<std::uint32_t>(seed_rng_());
  trail->style.colour_by_time = age_fade_from(cfg_);
  (void)attach(trail->state, now);

  Trail* raw = trail.get();
  trail->move_sub = moved_.subscribe([this, raw](Vec2 p, double t){
    (void)sampler_.on_move(raw->state, p, t);
  });
  trail->end_sub = ended_.subscribe([this, raw](double t){
    (void)sampler_.on_end(raw->state, t);
  });

  spdlog::debug("[TrailHost] session {} started at t={} (seed={})",
                trail->id, now, trail->style.rotation_seed);
  trails_.push_back(std::move(trail));
  return raw->id;
}

void TrailHost::detach_(Trail& t) {
  if (t.move_sub) { (void)moved_.unsubscribe(t.move_sub); t.move_sub = 0; }
  if (t.end_sub)  { (void)ended_.unsubscribe(t.end_sub);  t.end_sub = 0; }
}

std::size_t TrailHost::update(double now) {
  std::size_t reclaimed = 0;
  for (auto& t : trails_) {
    if (tick_lifecycle(t->state, now)) {
      detach_(*t);
      ++reclaimed;
    }
  }
  if (reclaimed == 0) return 0;

  trails_.erase(std::remove_if(trails_.begin(), trails_.end(),
                               [](const std::unique_ptr<Trail>& t){
                                 return t->state.phase == TrailPhase::Expired;
                               }),
                trails_.end());
  spdlog::debug("[TrailHost] reclaimed {} trail(s) at t={}, {} live", reclaimed, now, trails_.size());
  return reclaimed;
}

void TrailHost::publish_frames(double now) {
  for (auto& t : trails_) {
    t->style.texture = texture_;
    t->style.colour_by_position = colour_;
    // Geometry is local to bounds.min; move it back to host space.
    const Vec2 origin = t->state.bounds.min;
    t->style.draw_matrix = draw_matrix_ * Transform2D::Translation(origin.x, origin.y);
    t->buffer.publish(capture_snapshot(t->state, t->style, now));
  }
}

std::vector<RenderSnapshot> TrailHost::snapshots() {
  std::vector<RenderSnapshot> out;
  out.reserve(trails_.size());
  for (auto& t : trails_) {
    RenderSnapshot s;
    if (t->buffer.try_consume_latest(t->cursor, s)) t->last = std::move(s);
    if (t->last) out.push_back(*t->last);
  }
  return out;
}

std::vector<TrailId> TrailHost::trail_ids() const {
  std::vector<TrailId> ids;
  ids.reserve(trails_.size());
  for (const auto& t : trails_) ids.push_back(t->id);
  return ids;
}

const TrailHost::Trail* TrailHost::find_(TrailId id) const {
  for (const auto& t : trails_) if (t->id == id) return t.get();
  return nullptr;
}

const TrailState* TrailHost::trail_state(TrailId id) const {
  const Trail* t = find_(id);
  return t ? &t->state : nullptr;
}

std::optional<BoundingBox> TrailHost::bounds_of(TrailId id) const {
  const Trail* t = find_(id);
  if (!t) return std::nullopt;
  return t->state.bounds;
}

} // namespace trailfx
