#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace tapotoggle {

using json = nlohmann::json;

std::string config_file_path(const std::string &input) {
  static const std::string ext = ".json";
  if (input.size() >= ext.size()) {
    std::string tail = input.substr(input.size() - ext.size());
    std::transform(tail.begin(), tail.end(), tail.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (tail == ext)
      return input;
  }
  return input + ext;
}

template <typename T>
static void read_key(const json &section, const char *section_name,
                     const char *key, T &out) {
  auto it = section.find(key);
  if (it == section.end() || it->is_null())
    return;
  try {
    out = it->get<T>();
  } catch (const json::exception &) {
    throw ConfigError(std::string(section_name) + ":" + key +
                      " has the wrong type (" + it->type_name() + ")");
  }
}

static void read_millis(const json &section, const char *section_name,
                        const char *key, std::chrono::milliseconds &out) {
  long long ms = out.count();
  read_key(section, section_name, key, ms);
  if (ms <= 0)
    throw ConfigError(std::string(section_name) + ":" + key +
                      " must be positive");
  out = std::chrono::milliseconds(ms);
}

static const json &section_of(const json &doc, const char *name) {
  static const json empty = json::object();
  auto it = doc.find(name);
  if (it == doc.end() || it->is_null())
    return empty;
  if (!it->is_object())
    throw ConfigError(std::string(name) + " must be an object");
  return *it;
}

AppConfig parse_config(const json &doc) {
  if (!doc.is_object())
    throw ConfigError("configuration root must be an object");

  AppConfig cfg;

  const auto &tapo = section_of(doc, "TapoConfig");
  read_key(tapo, "TapoConfig", "Email", cfg.account.email);
  read_key(tapo, "TapoConfig", "Password", cfg.account.password);
  read_key(tapo, "TapoConfig", "DeviceLabel", cfg.account.device_label);
  read_key(tapo, "TapoConfig", "DeviceMac", cfg.account.device_mac);

  const auto &disc = section_of(doc, "Discovery");
  auto &opts = cfg.discovery;
  read_key(disc, "Discovery", "Prescan", opts.prescan);
  read_millis(disc, "Discovery", "PingTimeoutMs", opts.ping_timeout);
  read_millis(disc, "Discovery", "ReceiveTimeoutMs",
              opts.broadcast.receive_timeout);
  read_millis(disc, "Discovery", "NeighborTimeoutMs", opts.neighbor_timeout);

  int port = opts.broadcast.port;
  read_key(disc, "Discovery", "BroadcastPort", port);
  if (port <= 0 || port > 65535)
    throw ConfigError("Discovery:BroadcastPort out of range: " +
                      std::to_string(port));
  opts.broadcast.port = static_cast<unsigned short>(port);

  std::vector<std::string> command;
  read_key(disc, "Discovery", "NeighborCommand", command);
  if (!command.empty()) {
    opts.neighbor_command.program = command.front();
    opts.neighbor_command.args.assign(command.begin() + 1, command.end());
  }

  const auto &logging = section_of(doc, "Logging");
  std::string level;
  read_key(logging, "Logging", "Level", level);
  if (!level.empty()) {
    auto parsed = parse_log_level(level);
    if (!parsed)
      throw ConfigError("Logging:Level unknown: " + level);
    cfg.log_level = *parsed;
  }

  return cfg;
}

AppConfig load_config_file(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw ConfigError("configuration file '" + path + "' not found");

  json doc;
  try {
    in >> doc;
  } catch (const json::parse_error &ex) {
    throw ConfigError("configuration file '" + path +
                      "' is not valid JSON: " + ex.what());
  }
  return parse_config(doc);
}

void apply_environment(AppConfig &config) {
  if (const char *v = std::getenv("TAPO_EMAIL"); v && *v)
    config.account.email = v;
  if (const char *v = std::getenv("TAPO_PASSWORD"); v && *v)
    config.account.password = v;
  if (const char *v = std::getenv("TAPO_DEVICE_LABEL"); v && *v)
    config.account.device_label = v;
  if (const char *v = std::getenv("TAPO_DEVICE_MAC"); v && *v)
    config.account.device_mac = v;
  if (const char *v = std::getenv("TAPOTOGGLE_LOG_LEVEL"); v && *v) {
    auto parsed = parse_log_level(v);
    if (!parsed)
      throw ConfigError("TAPOTOGGLE_LOG_LEVEL unknown: " + std::string(v));
    config.log_level = *parsed;
  }
}

} // namespace tapotoggle
