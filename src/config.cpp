#include <voxsim/config.hpp>
#include <voxsim/log.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <string>

namespace voxsim {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::optional<double> to_double(const std::string& s) {
  if (s.empty()) return std::nullopt;
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size()) return std::nullopt;
  return v;
}

static std::optional<bool> to_bool(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (s == "true" || s == "1" || s == "yes" || s == "on") return true;
  if (s == "false" || s == "0" || s == "no" || s == "off") return false;
  return std::nullopt;
}

static double clamp(double v, double lo, double hi) { return v < lo ? lo : (v > hi ? hi : v); }

// Returns false when the value could not be used.
static bool apply_entry(SimConfig& c, const std::string& key, const std::string& value) {
  if (key == "spectator") {
    auto b = to_bool(value);
    if (!b) return false;
    c.spectator = *b;
    return true;
  }
  auto v = to_double(value);
  if (!v) return false;
  if (key == "tick_seconds") {
    if (*v <= 0.0) return false;
    c.tick_seconds = static_cast<float>(clamp(*v, 0.001, 1.0));
  } else if (key == "history_capacity") {
    c.history_capacity = static_cast<std::size_t>(clamp(*v, 1.0, 65536.0));
  } else if (key == "noise_floor") {
    c.noise_floor = static_cast<float>(clamp(*v, 0.0, 1.0));
  } else if (key == "hard_teleport_distance") {
    c.hard_teleport_distance = static_cast<float>(clamp(*v, 0.01, 1000.0));
  } else if (key == "smoothing_decay") {
    c.smoothing_decay = static_cast<float>(clamp(*v, 0.0, 1.0));
  } else if (key == "fly_toggle_window_ticks") {
    c.fly_toggle_window_ticks = static_cast<std::uint32_t>(clamp(*v, 0.0, 200.0));
  } else if (key == "position_resend_ticks") {
    c.position_resend_ticks = static_cast<std::uint32_t>(clamp(*v, 1.0, 1200.0));
  } else {
    return false;
  }
  return true;
}

SimConfig sim_config_from_stream(std::istream& in) {
  SimConfig c;
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    line = trim(line);
    if (line.empty() || line[0] == '#') continue;
    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      log_warn("config", "line " + std::to_string(lineno) + ": expected key = value");
      continue;
    }
    const std::string key = trim(line.substr(0, eq));
    const std::string value = trim(line.substr(eq + 1));
    if (!apply_entry(c, key, value)) {
      log_warn("config", "line " + std::to_string(lineno) + ": ignoring '" + key + "' = '" + value + "'");
    }
  }
  return c;
}

std::optional<SimConfig> load_sim_config(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return sim_config_from_stream(f);
}

} // namespace voxsim
