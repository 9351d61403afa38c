#pragma once
#include <cstdint>
#include <functional>
#include <string_view>

namespace voxsim {

enum class LogLevel : std::uint8_t { Debug = 0, Info, Warn, Error };

// Receives every message at or above the current level.
using LogSink = std::function<void(LogLevel, std::string_view tag, std::string_view msg)>;

void set_log_level(LogLevel level);
LogLevel log_level();

// Pass an empty sink to restore the default stderr writer.
void set_log_sink(LogSink sink);

const char* log_level_name(LogLevel level);

// tag names the subsystem ("sim", "config", ...).
void log_debug(std::string_view tag, std::string_view msg);
void log_info(std::string_view tag, std::string_view msg);
void log_warn(std::string_view tag, std::string_view msg);
void log_error(std::string_view tag, std::string_view msg);

} // namespace voxsim
