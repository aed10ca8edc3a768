#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <trailfx/colour.hpp>

namespace trailfx {

// Smallest spacing normalize() lets through; keeps per-move point counts bounded.
inline constexpr float kMinPointInterval = 0.5f;

struct TrailConfig {
  float radius = 1.0f;                     // quad half-extent, also drives spacing
  float spacing_multiplier = 7.0f / 8.0f;  // interval = radius * multiplier
  double max_duration_ms = 60000.0;        // watchdog
  double afterlife_ms = 0.0;               // render grace after end
  double fixed_buffer_ms = 100.0;          // added on top of afterlife
  std::uint32_t rotation_seed = 0;         // seeds per-trail rotation seeds
  float initial_alpha = 1.0f;              // age fade start alpha
  double point_fade_ms = 8000.0;           // age fade duration per point
  Colour4 colour{};                        // single position colour
  std::string texture_path;                // empty -> default white texture

  float point_interval() const { return radius * spacing_multiplier; }
};

// Maps non-finite or out-of-range values to their defaults; logs each fix.
// A point interval below kMinPointInterval is raised to it through radius.
TrailConfig normalize(TrailConfig cfg);

// Stream-based loader (test-friendly; no filesystem required).
// One "key,value" row per line. Accepts an optional "key,value" header row;
// ignores blank lines and lines starting with '#'. Whitespace around fields
// is trimmed. Unknown keys and unparsable values are skipped. The result is
// normalized.
TrailConfig trail_config_from_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<TrailConfig> load_trail_config(const std::string& path);

} // namespace trailfx
