#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>
#include <vector>

#include <voxsim/config.hpp>
#include <voxsim/log.hpp>

using Catch::Approx;
using namespace voxsim;

namespace {

// Captures log output for the lifetime of the object.
struct LogCapture {
  std::vector<std::string> lines;
  LogCapture() {
    set_log_sink([this](LogLevel level, std::string_view tag, std::string_view msg) {
      lines.push_back(std::string(log_level_name(level)) + " " + std::string(tag) + " " + std::string(msg));
    });
  }
  ~LogCapture() { set_log_sink({}); }
};

} // namespace

TEST_CASE("Config defaults") {
  std::istringstream in("");
  const SimConfig c = sim_config_from_stream(in);
  REQUIRE(c.tick_seconds == Approx(0.05f));
  REQUIRE(c.history_capacity == 512);
  REQUIRE(c.noise_floor == Approx(0.001f));
  REQUIRE(c.hard_teleport_distance == Approx(3.0f));
  REQUIRE(c.smoothing_decay == Approx(0.15f));
  REQUIRE(c.fly_toggle_window_ticks == 7);
  REQUIRE(c.position_resend_ticks == 20);
  REQUIRE_FALSE(c.spectator);
}

TEST_CASE("Config parses key = value with comments") {
  LogCapture cap;
  std::istringstream in(
      "# client tuning\n"
      "\n"
      "tick_seconds = 0.02\n"
      "  history_capacity=128  \n"
      "noise_floor = 0.01\n"
      "hard_teleport_distance = 8\n"
      "smoothing_decay = 0.3\n"
      "fly_toggle_window_ticks = 5\n"
      "position_resend_ticks = 40\n"
      "spectator = yes\n");
  const SimConfig c = sim_config_from_stream(in);
  REQUIRE(c.tick_seconds == Approx(0.02f));
  REQUIRE(c.history_capacity == 128);
  REQUIRE(c.noise_floor == Approx(0.01f));
  REQUIRE(c.hard_teleport_distance == Approx(8.0f));
  REQUIRE(c.smoothing_decay == Approx(0.3f));
  REQUIRE(c.fly_toggle_window_ticks == 5);
  REQUIRE(c.position_resend_ticks == 40);
  REQUIRE(c.spectator);
  REQUIRE(cap.lines.empty());
}

TEST_CASE("Config clamps ranges and warns on bad lines") {
  LogCapture cap;
  std::istringstream in(
      "history_capacity = 0\n"
      "smoothing_decay = 4\n"
      "tick_seconds = -1\n"
      "noise_floor = abc\n"
      "speed = 3\n"
      "just some words\n"
      "spectator = maybe\n");
  const SimConfig c = sim_config_from_stream(in);
  REQUIRE(c.history_capacity == 1);
  REQUIRE(c.smoothing_decay == Approx(1.0f));
  REQUIRE(c.tick_seconds == Approx(0.05f));
  REQUIRE(c.noise_floor == Approx(0.001f));
  REQUIRE_FALSE(c.spectator);

  REQUIRE(cap.lines.size() == 5);
  REQUIRE(cap.lines[0].rfind("warn config line 3", 0) == 0);
  REQUIRE(cap.lines[3].find("expected key = value") != std::string::npos);
}

TEST_CASE("load_sim_config reports a missing file") {
  REQUIRE_FALSE(load_sim_config("/nonexistent/voxsim.cfg").has_value());
}

TEST_CASE("Log level filters messages") {
  LogCapture cap;
  const LogLevel before = log_level();
  set_log_level(LogLevel::Warn);
  log_info("test", "hidden");
  log_debug("test", "hidden too");
  log_error("test", "shown " + std::to_string(2));
  set_log_level(before);

  REQUIRE(cap.lines.size() == 1);
  REQUIRE(cap.lines[0] == "error test shown 2");
}

TEST_CASE("Long log messages are not truncated") {
  LogCapture cap;
  const std::string big(600, 'x');
  log_warn("test", big);
  REQUIRE(cap.lines.size() == 1);
  REQUIRE(cap.lines[0].size() == std::string("warn test ").size() + 600);
}
