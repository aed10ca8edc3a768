#include <spdlog/spdlog.h>
#include <trailfx/trail_config.hpp>
#include <trailfx/trail_host.hpp>
#include <trailfx/viewer/app.hpp>

using namespace trailfx;

int main(int argc, char** argv) {
  spdlog::set_level(spdlog::level::info);

  TrailConfig cfg{};
  cfg.radius = 16.0f;
  cfg.afterlife_ms = 4000.0;
  cfg.initial_alpha = 0.6f;
  cfg.point_fade_ms = 6000.0;

  if (argc > 1) {
    if (auto loaded = load_trail_config(argv[1])) {
      cfg = *loaded;
      spdlog::info("[Viewer] config loaded from '{}'", argv[1]);
    } else {
      spdlog::warn("[Viewer] cannot open '{}', using built-in defaults", argv[1]);
    }
  }

  TrailHost host(cfg);
  ViewerApp app(host, host.config().texture_path);
  return app.run();
}
