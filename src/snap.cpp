#include <trailfx/snap.hpp>

namespace trailfx {

RenderSnapshot capture_snapshot(const TrailState& st, const TrailStyle& style, double now) {
  RenderSnapshot s;
  s.points = st.points;
  s.radius = style.radius;
  s.draw_size = st.bounds.size();
  s.position_offset = st.bounds.min;
  s.texture = style.texture;
  s.start_time = st.start_time;
  s.end_time = st.end_time;
  s.rotation_seed = style.rotation_seed;
  s.current_time = now;
  s.colour_by_time = style.colour_by_time;
  s.colour_by_position = style.colour_by_position;
  s.draw_matrix = style.draw_matrix;
  return s;
}

} // namespace trailfx
