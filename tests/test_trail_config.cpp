#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include <sstream>
#include <string>

#include <trailfx/trail_config.hpp>

using Catch::Approx;
using namespace trailfx;

static std::string cfg_minimal = R"(key,value
radius,16
spacing_multiplier,0.5
max_duration_ms,30000
afterlife_ms,4000
fixed_buffer_ms,120
rotation_seed,42
initial_alpha,0.6
point_fade_ms,6000
colour,1 0.5 0.25 0.8
texture,assets/smoke.png
)";

static std::string cfg_with_noise = R"( key , value
# comment lines are ignored
radius , 12
, 3                 # bad row skipped
unknown_key, 7
afterlife_ms, soon
spacing_multiplier , 0.75
)";

TEST_CASE("trail_config_from_stream parses every key") {
  std::istringstream ss(cfg_minimal);
  const auto cfg = trail_config_from_stream(ss);

  REQUIRE(cfg.radius == Approx(16.0));
  REQUIRE(cfg.spacing_multiplier == Approx(0.5));
  REQUIRE(cfg.point_interval() == Approx(8.0));
  REQUIRE(cfg.max_duration_ms == Approx(30000.0));
  REQUIRE(cfg.afterlife_ms == Approx(4000.0));
  REQUIRE(cfg.fixed_buffer_ms == Approx(120.0));
  REQUIRE(cfg.rotation_seed == 42u);
  REQUIRE(cfg.initial_alpha == Approx(0.6));
  REQUIRE(cfg.point_fade_ms == Approx(6000.0));
  REQUIRE(cfg.colour.r == Approx(1.0));
  REQUIRE(cfg.colour.g == Approx(0.5));
  REQUIRE(cfg.colour.b == Approx(0.25));
  REQUIRE(cfg.colour.a == Approx(0.8));
  REQUIRE(cfg.texture_path == "assets/smoke.png");
}

TEST_CASE("trail_config_from_stream handles spaces, comments and bad rows") {
  std::istringstream ss(cfg_with_noise);
  const auto cfg = trail_config_from_stream(ss);
  const TrailConfig def{};

  REQUIRE(cfg.radius == Approx(12.0));
  REQUIRE(cfg.spacing_multiplier == Approx(0.75));
  REQUIRE(cfg.afterlife_ms == Approx(def.afterlife_ms));
  REQUIRE(cfg.max_duration_ms == Approx(def.max_duration_ms));
}

TEST_CASE("trail_config_from_stream defaults on empty input") {
  std::istringstream ss("");
  const auto cfg = trail_config_from_stream(ss);
  REQUIRE(cfg.radius == Approx(1.0));
  REQUIRE(cfg.spacing_multiplier == Approx(7.0 / 8.0));
  REQUIRE(cfg.max_duration_ms == Approx(60000.0));
  REQUIRE(cfg.fixed_buffer_ms == Approx(100.0));
  REQUIRE(cfg.texture_path.empty());
}

TEST_CASE("normalize maps invalid values to safe defaults") {
  TrailConfig cfg;
  cfg.radius = -3.0f;
  cfg.spacing_multiplier = 0.0f;
  cfg.max_duration_ms = std::numeric_limits<double>::quiet_NaN();
  cfg.afterlife_ms = -1.0;
  cfg.fixed_buffer_ms = -5.0;
  cfg.point_fade_ms = 0.0;
  cfg.initial_alpha = 1.7f;
  cfg.colour = Colour4{-0.5f, 2.0f, 0.5f, std::numeric_limits<float>::infinity()};

  const auto n = normalize(cfg);
  REQUIRE(n.radius == Approx(1.0));
  REQUIRE(n.spacing_multiplier == Approx(7.0 / 8.0));
  REQUIRE(n.max_duration_ms == Approx(60000.0));
  REQUIRE(n.afterlife_ms == Approx(0.0));
  REQUIRE(n.fixed_buffer_ms == Approx(100.0));
  REQUIRE(n.point_fade_ms == Approx(8000.0));
  REQUIRE(n.initial_alpha == Approx(1.0));
  REQUIRE(n.colour.r == Approx(0.0));
  REQUIRE(n.colour.g == Approx(1.0));
  REQUIRE(n.colour.b == Approx(0.5));
  REQUIRE(n.colour.a == Approx(1.0));
}

TEST_CASE("normalize keeps valid values") {
  TrailConfig cfg;
  cfg.radius = 20.0f;
  cfg.afterlife_ms = 3000.0;
  const auto n = normalize(cfg);
  REQUIRE(n.radius == Approx(20.0));
  REQUIRE(n.afterlife_ms == Approx(3000.0));
}

TEST_CASE("normalize raises a tiny point interval to the minimum") {
  TrailConfig cfg;
  cfg.radius = 0.000001f;
  cfg.spacing_multiplier = 0.5f;
  const auto n = normalize(cfg);
  REQUIRE(n.radius == Approx(1.0));
  REQUIRE(n.spacing_multiplier == Approx(0.5));
  REQUIRE(n.point_interval() == Approx(kMinPointInterval));

  // Exactly at the minimum is left alone
  cfg.radius = 1.0f;
  REQUIRE(normalize(cfg).radius == Approx(1.0));
}

TEST_CASE("load_trail_config returns nullopt on missing file") {
  auto none = load_trail_config("this_file_does_not_exist.cfg");
  REQUIRE_FALSE(none.has_value());
}
