#include <trailfx/trail_config.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <spdlog/spdlog.h>

namespace trailfx {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::vector<std::string> split_csv_line(const std::string& line) {
  // No quoted fields; a value never contains a comma.
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

static bool is_header_row(const std::vector<std::string>& cols) {
  return cols.size() >= 2 && (cols[0] == "key" || cols[0] == "Key");
}

static double to_double_safe(const std::string& s, bool& ok) {
  try {
    size_t idx = 0;
    double v = std::stod(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::exception&) {
    ok = false;
    return 0.0;
  }
}

// "r g b a" with channels in [0,1]; alpha optional.
static std::optional<Colour4> parse_colour(const std::string& s) {
  std::istringstream ss(s);
  float ch[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  int n = 0;
  std::string tok;
  while (ss >> tok) {
    if (n == 4) return std::nullopt;
    bool ok = false;
    const double v = to_double_safe(tok, ok);
    if (!ok) return std::nullopt;
    ch[n++] = static_cast<float>(v);
  }
  if (n < 3) return std::nullopt;
  return Colour4{ch[0], ch[1], ch[2], ch[3]};
}

static bool apply_row(TrailConfig& cfg, const std::string& key, const std::string& value) {
  if (key == "texture") { cfg.texture_path = value; return true; }
  if (key == "colour" || key == "color") {
    auto c = parse_colour(value);
    if (!c) return false;
    cfg.colour = *c;
    return true;
  }

  bool ok = false;
  const double v = to_double_safe(value, ok);
  if (!ok) return false;

  if (key == "radius")                  cfg.radius = static_cast<float>(v);
  else if (key == "spacing_multiplier") cfg.spacing_multiplier = static_cast<float>(v);
  else if (key == "max_duration_ms")    cfg.max_duration_ms = v;
  else if (key == "afterlife_ms")       cfg.afterlife_ms = v;
  else if (key == "fixed_buffer_ms")    cfg.fixed_buffer_ms = v;
  else if (key == "initial_alpha")      cfg.initial_alpha = static_cast<float>(v);
  else if (key == "point_fade_ms")      cfg.point_fade_ms = v;
  else if (key == "rotation_seed") {
    if (v < 0.0) return false;
    cfg.rotation_seed = static_cast<std::uint32_t>(v);
  }
  else return false;
  return true;
}

TrailConfig normalize(TrailConfig cfg) {
  const TrailConfig def{};

  if (!std::isfinite(cfg.radius) || cfg.radius <= 0.0f) {
    spdlog::warn("[TrailConfig] radius {} invalid, using {}", cfg.radius, def.radius);
    cfg.radius = def.radius;
  }
  if (!std::isfinite(cfg.spacing_multiplier) || cfg.spacing_multiplier <= 0.0f) {
    spdlog::warn("[TrailConfig] spacing_multiplier {} invalid, using {}",
                 cfg.spacing_multiplier, def.spacing_multiplier);
    cfg.spacing_multiplier = def.spacing_multiplier;
  }
  if (cfg.point_interval() < kMinPointInterval) {
    const float radius = kMinPointInterval / cfg.spacing_multiplier;
    spdlog::warn("[TrailConfig] point interval {} below {}, radius {} raised to {}",
                 cfg.point_interval(), kMinPointInterval, cfg.radius, radius);
    cfg.radius = radius;
  }
  if (!std::isfinite(cfg.max_duration_ms) || cfg.max_duration_ms <= 0.0) {
    spdlog::warn("[TrailConfig] max_duration_ms {} invalid, using {}",
                 cfg.max_duration_ms, def.max_duration_ms);
    cfg.max_duration_ms = def.max_duration_ms;
  }
  if (!std::isfinite(cfg.afterlife_ms) || cfg.afterlife_ms < 0.0) {
    spdlog::warn("[TrailConfig] afterlife_ms {} invalid, using {}", cfg.afterlife_ms, def.afterlife_ms);
    cfg.afterlife_ms = def.afterlife_ms;
  }
  if (!std::isfinite(cfg.fixed_buffer_ms) || cfg.fixed_buffer_ms < 0.0) {
    spdlog::warn("[TrailConfig] fixed_buffer_ms {} invalid, using {}",
                 cfg.fixed_buffer_ms, def.fixed_buffer_ms);
    cfg.fixed_buffer_ms = def.fixed_buffer_ms;
  }
  if (!std::isfinite(cfg.point_fade_ms) || cfg.point_fade_ms <= 0.0) {
    spdlog::warn("[TrailConfig] point_fade_ms {} invalid, using {}", cfg.point_fade_ms, def.point_fade_ms);
    cfg.point_fade_ms = def.point_fade_ms;
  }

  auto clamp01 = [](float x){ return x < 0.0f ? 0.0f : (x > 1.0f ? 1.0f : x); };
  auto fix01 = [&](float x, float fallback){ return std::isfinite(x) ? clamp01(x) : fallback; };
  cfg.initial_alpha = fix01(cfg.initial_alpha, def.initial_alpha);
  cfg.colour.r = fix01(cfg.colour.r, 1.0f);
  cfg.colour.g = fix01(cfg.colour.g, 1.0f);
  cfg.colour.b = fix01(cfg.colour.b, 1.0f);
  cfg.colour.a = fix01(cfg.colour.a, 1.0f);
  return cfg;
}

TrailConfig trail_config_from_stream(std::istream& in) {
  TrailConfig cfg{};
  std::string line;
  bool header_consumed = false;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string raw = trim(line);
    if (raw.empty()) continue;
    if (raw[0] == '#') continue;

    auto cols = split_csv_line(raw);

    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }

    if (cols.size() < 2 || cols[0].empty() || !apply_row(cfg, cols[0], cols[1])) {
      spdlog::debug("[TrailConfig] skipping line {}: '{}'", line_no, raw);
    }
  }
  return normalize(cfg);
}

std::optional<TrailConfig> load_trail_config(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return trail_config_from_stream(f);
}

} // namespace trailfx
