#pragma once
#include <sstream>
#include <string>
#include <string_view>

namespace cs {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void set_log_level(LogLevel lvl) noexcept;
LogLevel log_level() noexcept;
bool log_enabled(LogLevel lvl) noexcept;

// Accepts "debug" | "info" | "warn" | "warning" | "error" (case-insensitive).
bool parse_log_level(std::string_view s, LogLevel* out);

// Writes "[tag] message" to stderr; lines from concurrent sessions never interleave.
void log_line(LogLevel lvl, std::string_view tag, const std::string& msg);

void log_debug(std::string_view tag, const std::string& msg);
void log_info(std::string_view tag, const std::string& msg);
void log_warn(std::string_view tag, const std::string& msg);
void log_error(std::string_view tag, const std::string& msg);

// Streams every argument into one string.
template <typename... Args>
std::string concat(const Args&... args) {
  std::ostringstream os;
  (os << ... << args);
  return os.str();
}

}
