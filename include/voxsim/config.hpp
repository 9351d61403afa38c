#pragma once
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

namespace voxsim {

struct SimConfig {
  float tick_seconds = 0.05f;
  std::size_t history_capacity = 512;
  float noise_floor = 0.001f;
  float hard_teleport_distance = 3.0f;
  float smoothing_decay = 0.15f;
  std::uint32_t fly_toggle_window_ticks = 7;
  std::uint32_t position_resend_ticks = 20;
  bool spectator = false;
};

// Parses `key = value` lines. Blank lines and '#' comments are ignored;
// unknown keys and bad values are skipped with a warning.
SimConfig sim_config_from_stream(std::istream& in);

// Empty if the file cannot be opened.
std::optional<SimConfig> load_sim_config(const std::string& path);

} // namespace voxsim
