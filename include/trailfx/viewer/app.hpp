#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <trailfx/geometry.hpp>
#include <trailfx/snap.hpp>

namespace trailfx {

class TrailHost;

// RAII application that feeds mouse drags into a TrailHost and renders the
// resulting quad batches.
class ViewerApp {
public:
  ViewerApp(TrailHost& host, std::string texture_path);
  ~ViewerApp();
  ViewerApp(const ViewerApp&) = delete;
  ViewerApp& operator=(const ViewerApp&) = delete;

  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_(double now_ms);
  // Rendering
  void render_frame_();
  void draw_batch_(const RenderSnapshot& snap);
  void draw_hud_();

  // Dependencies
  TrailHost& host_;
  std::string texture_path_;

  // Loaded inside run(), which owns the GL context.
  struct TextureTable;
  std::unique_ptr<TextureTable> textures_;

  GeometryBuilder builder_{};
  QuadBatch batch_{};

  // Frame stats
  std::size_t quads_drawn_{0};
  bool show_bounds_{false};
  bool gradient_{false};
};

} // namespace trailfx
