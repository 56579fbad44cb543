#pragma once
#include "discovery.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace tapotoggle {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
};

struct AccountConfig {
  std::string email;
  std::string password;
  std::string device_label;
  std::string device_mac;
};

struct AppConfig {
  AccountConfig account;
  DiscoveryOptions discovery;
  LogLevel log_level = LogLevel::info;
};

// "home" -> "home.json"; names already ending in .json (any case) are kept.
std::string config_file_path(const std::string &input);

// Reads the "TapoConfig", "Discovery" and "Logging" sections. Missing keys
// keep their defaults; wrongly typed values raise ConfigError.
AppConfig parse_config(const nlohmann::json &doc);

AppConfig load_config_file(const std::string &path);

// TAPO_EMAIL, TAPO_PASSWORD, TAPO_DEVICE_LABEL, TAPO_DEVICE_MAC and
// TAPOTOGGLE_LOG_LEVEL override whatever the file said.
void apply_environment(AppConfig &config);

} // namespace tapotoggle
