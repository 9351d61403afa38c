#include <voxsim/log.hpp>
#include <atomic>
#include <cstdio>
#include <mutex>

namespace voxsim {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_sink_mu;
LogSink g_sink;

void default_sink(LogLevel level, std::string_view tag, std::string_view msg) {
  std::fprintf(stderr, "[%s] %.*s: %.*s\n", log_level_name(level),
               static_cast<int>(tag.size()), tag.data(),
               static_cast<int>(msg.size()), msg.data());
}

void dispatch(LogLevel level, std::string_view tag, std::string_view msg) {
  if (level < log_level()) return;
  std::lock_guard<std::mutex> lock(g_sink_mu);
  if (g_sink) g_sink(level, tag, msg);
  else default_sink(level, tag, msg);
}

} // namespace

void set_log_level(LogLevel level) { g_level.store(level, std::memory_order_relaxed); }
LogLevel log_level() { return g_level.load(std::memory_order_relaxed); }

void set_log_sink(LogSink sink) {
  std::lock_guard<std::mutex> lock(g_sink_mu);
  g_sink = std::move(sink);
}

const char* log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info: return "info";
    case LogLevel::Warn: return "warn";
    case LogLevel::Error: return "error";
  }
  return "?";
}

void log_debug(std::string_view tag, std::string_view msg) { dispatch(LogLevel::Debug, tag, msg); }
void log_info(std::string_view tag, std::string_view msg) { dispatch(LogLevel::Info, tag, msg); }
void log_warn(std::string_view tag, std::string_view msg) { dispatch(LogLevel::Warn, tag, msg); }
void log_error(std::string_view tag, std::string_view msg) { dispatch(LogLevel::Error, tag, msg); }

} // namespace voxsim
