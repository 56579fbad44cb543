#include "log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace tapotoggle {

static std::atomic<LogLevel> g_level{LogLevel::info};
static std::mutex g_log_mu;

void set_log_level(LogLevel level) { g_level = level; }
LogLevel log_level() { return g_level; }

std::optional<LogLevel> parse_log_level(const std::string &name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (s == "debug")
    return LogLevel::debug;
  if (s == "info")
    return LogLevel::info;
  if (s == "warning" || s == "warn")
    return LogLevel::warning;
  if (s == "error")
    return LogLevel::error;
  return std::nullopt;
}

std::string now_stamp() {
  using clock = std::chrono::system_clock;
  auto t = clock::to_time_t(clock::now());
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream os;
  os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return os.str();
}

void log_line(LogLevel level, const std::string &tag,
              const std::string &message) {
  if (level < g_level.load())
    return;
  std::scoped_lock lk(g_log_mu);
  std::cerr << "[" << now_stamp() << "] [" << tag << "] " << message << "\n";
}

} // namespace tapotoggle
