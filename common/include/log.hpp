#pragma once
#include <optional>
#include <string>

namespace tapotoggle {

enum class LogLevel { debug = 0, info = 1, warning = 2, error = 3 };

void set_log_level(LogLevel level);
LogLevel log_level();

// Accepts "debug", "info", "warning"/"warn", "error" in any case.
std::optional<LogLevel> parse_log_level(const std::string &name);

std::string now_stamp();

// Writes "[stamp] [tag] message" to stderr when level passes the threshold.
void log_line(LogLevel level, const std::string &tag,
              const std::string &message);

} // namespace tapotoggle
