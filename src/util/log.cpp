#include "csv_stream/log.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>

namespace cs {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
static std::mutex g_log_mu;

void set_log_level(LogLevel lvl) noexcept { g_level.store(static_cast<int>(lvl)); }
LogLevel log_level() noexcept { return static_cast<LogLevel>(g_level.load()); }
bool log_enabled(LogLevel lvl) noexcept { return static_cast<int>(lvl) >= g_level.load(); }

bool parse_log_level(std::string_view s, LogLevel* out) {
  std::string v;
  v.reserve(s.size());
  for (char c : s) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  LogLevel lvl;
  if (v == "debug") lvl = LogLevel::Debug;
  else if (v == "info") lvl = LogLevel::Info;
  else if (v == "warn" || v == "warning") lvl = LogLevel::Warn;
  else if (v == "error") lvl = LogLevel::Error;
  else return false;
  if (out) *out = lvl;
  return true;
}

static const char* level_name(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "?";
}

void log_line(LogLevel lvl, std::string_view tag, const std::string& msg) {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&now, &tm);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%dT%H:%M:%SZ", &tm);

  std::lock_guard<std::mutex> lk(g_log_mu);
  std::cerr << ts << ' ' << level_name(lvl) << " [" << tag << "] " << msg << '\n';
}

void log_debug(std::string_view tag, const std::string& msg) {
  if (log_enabled(LogLevel::Debug)) log_line(LogLevel::Debug, tag, msg);
}

void log_info(std::string_view tag, const std::string& msg) {
  if (log_enabled(LogLevel::Info)) log_line(LogLevel::Info, tag, msg);
}

void log_warn(std::string_view tag, const std::string& msg) {
  if (log_enabled(LogLevel::Warn)) log_line(LogLevel::Warn, tag, msg);
}

void log_error(std::string_view tag, const std::string& msg) {
  if (log_enabled(LogLevel::Error)) log_line(LogLevel::Error, tag, msg);
}

}
