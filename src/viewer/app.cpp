#include <raylib.h>
#include <rlgl.h>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <trailfx/viewer/app.hpp>
#include <trailfx/trail_host.hpp>

namespace trailfx {

namespace {

static constexpr int kWindowW = 1280;
static constexpr int kWindowH = 800;

static Color toColor(const Colour4& c) {
  auto ch = [](float v){ return (unsigned char)(v <= 0.0f ? 0 : (v >= 1.0f ? 255 : v * 255.0f + 0.5f)); };
  return Color{ch(c.r), ch(c.g), ch(c.b), ch(c.a)};
}

} // namespace

// ---- ViewerApp ----

// Renderer texture table: TextureHandle::id -> raylib texture.
struct ViewerApp::TextureTable {
  Texture2D white{};
  Texture2D smoke{};
  bool has_smoke{false};

  const Texture2D& lookup(const std::optional<TextureHandle>& h) const {
    if (h && !h->is_default() && has_smoke && h->id == smoke.id) return smoke;
    return white;
  }
};

ViewerApp::ViewerApp(TrailHost& host, std::string texture_path)
  : host_(host), texture_path_(std::move(texture_path)),
    textures_(std::make_unique<TextureTable>()) {}

ViewerApp::~ViewerApp() = default;

int ViewerApp::run() {
  InitWindow(kWindowW, kWindowH, "trailfx - Viewer");
  SetTargetFPS(144);

  // 1x1 opaque white fallback
  Image px = GenImageColor(1, 1, WHITE);
  textures_->white = LoadTextureFromImage(px);
  UnloadImage(px);

  if (!texture_path_.empty()) {
    textures_->smoke = LoadTexture(texture_path_.c_str());
    textures_->has_smoke = textures_->smoke.id != 0;
    if (textures_->has_smoke) {
      host_.set_texture(TextureHandle{textures_->smoke.id, textures_->smoke.width,
                                      textures_->smoke.height, UvRect{}});
      spdlog::info("[Viewer] loaded texture '{}' ({}x{})", texture_path_,
                   textures_->smoke.width, textures_->smoke.height);
    } else {
      spdlog::warn("[Viewer] could not load texture '{}', using white pixel", texture_path_);
    }
  }

  while (!WindowShouldClose()) {
    const double now_ms = GetTime() * 1000.0;
    process_input_(now_ms);
    (void)host_.update(now_ms);
    host_.publish_frames(now_ms);
    render_frame_();
  }

  if (textures_->has_smoke) UnloadTexture(textures_->smoke);
  UnloadTexture(textures_->white);
  CloseWindow();
  return 0;
}

void ViewerApp::process_input_(double now_ms) {
  const Vector2 m = GetMousePosition();
  const Vec2 pos{m.x, m.y};

  if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
    (void)host_.begin_session(now_ms);
    host_.move(pos, now_ms);
  } else if (IsMouseButtonDown(MOUSE_BUTTON_LEFT)) {
    const Vector2 d = GetMouseDelta();
    if (d.x != 0.0f || d.y != 0.0f) host_.move(pos, now_ms);
  }
  if (IsMouseButtonReleased(MOUSE_BUTTON_LEFT)) {
    host_.end(now_ms);
  }

  if (IsKeyPressed(KEY_B)) show_bounds_ = !show_bounds_;
  if (IsKeyPressed(KEY_G)) {
    gradient_ = !gradient_;
    const Colour4 base = host_.config().colour;
    host_.set_colour(gradient_
      ? ColourInfo::Horizontal(Colour4{1.0f, 0.55f, 0.2f, base.a}, Colour4{0.3f, 0.6f, 1.0f, base.a})
      : ColourInfo::SingleColour(base));
  }
}

void ViewerApp::render_frame_() {
  // Render phase reads snapshots only.
  const std::vector<RenderSnapshot> frames = host_.snapshots();

  BeginDrawing();
  ClearBackground(Color{18, 18, 24, 255});

  quads_drawn_ = 0;
  for (const auto& snap : frames) {
    draw_batch_(snap);
    if (show_bounds_ && !snap.points.empty()) {
      DrawRectangleLinesEx(Rectangle{snap.position_offset.x, snap.position_offset.y,
                                     snap.draw_size.x, snap.draw_size.y},
                           1.0f, Color{90, 200, 120, 160});
    }
  }

  draw_hud_();
  EndDrawing();
}

void ViewerApp::draw_batch_(const RenderSnapshot& snap) {
  batch_.clear();
  const std::size_t quads = builder_.build(snap, batch_);
  if (quads == 0) return;
  quads_drawn_ += quads;

  const auto& verts = batch_.vertices();
  rlSetTexture(textures_->lookup(snap.texture).id);
  rlBegin(RL_QUADS);
  for (std::size_t i = 0; i + 3 < verts.size(); i += 4) {
    // Batch order is TL, TR, BR, BL; rlgl quads are counter-clockwise: TL, BL, BR, TR.
    const std::size_t order[4] = {i, i + 3, i + 2, i + 1};
    for (std::size_t k : order) {
      const auto& v = verts[k];
      const Color c = toColor(v.colour);
      rlColor4ub(c.r, c.g, c.b, c.a);
      rlTexCoord2f(v.tex_coord.x, v.tex_coord.y);
      rlVertex2f(v.position.x, v.position.y);
    }
  }
  rlEnd();
  rlSetTexture(0);
}

void ViewerApp::draw_hud_() {
  const auto ids = host_.trail_ids();
  char bounds_line[160] = "bounds: --";
  if (!ids.empty()) {
    if (auto b = host_.bounds_of(ids.back())) {
      std::snprintf(bounds_line, sizeof(bounds_line), "bounds: (%.0f, %.0f) - (%.0f, %.0f)",
                    b->min.x, b->min.y, b->max.x, b->max.y);
    }
  }

  DrawText(TextFormat("trails=%d  quads=%d  batch_cap=%d  fps=%d",
                      (int)host_.trail_count(), (int)quads_drawn_,
                      (int)batch_.capacity(), GetFPS()),
           20, 20, 20, Color{220,235,220,255});
  DrawText(bounds_line, 20, 46, 18, Color{235,220,220,255});
  DrawText("LMB drag: Draw trail | B: Bounds | G: Gradient | Esc: Quit",
           20, 72, 14, Color{190,205,190,255});
}

} // namespace trailfx
