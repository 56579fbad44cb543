#include "toggle.hpp"

#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <stdexcept>

namespace tapotoggle {

static bool iequals(const std::string &a, const std::string &b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(),
                    [](unsigned char x, unsigned char y) {
                      return std::tolower(x) == std::tolower(y);
                    });
}

std::optional<std::size_t>
find_device_by_label(const std::vector<DeviceRecord> &devices,
                     const std::string &label) {
  for (std::size_t i = 0; i < devices.size(); i++)
    if (iequals(devices[i].alias, label))
      return i;
  return std::nullopt;
}

std::optional<std::size_t> choose_device(const std::vector<DeviceRecord> &devices,
                                         std::istream &in, std::ostream &out) {
  if (devices.empty())
    return std::nullopt;

  out << "\n--- Available Devices ---\n";
  for (std::size_t i = 0; i < devices.size(); i++)
    out << " " << i + 1 << ". " << devices[i].alias << " ("
        << devices[i].device_model << ")\n";

  std::string line;
  for (;;) {
    out << "\nSelect a device (1-" << devices.size() << "): " << std::flush;
    if (!std::getline(in, line))
      return std::nullopt;
    try {
      std::size_t pos = 0;
      long choice = std::stol(line, &pos);
      const bool trailing_ok =
          std::all_of(line.begin() + pos, line.end(),
                      [](unsigned char c) { return std::isspace(c); });
      if (trailing_ok && choice >= 1 &&
          choice <= static_cast<long>(devices.size()))
        return static_cast<std::size_t>(choice - 1);
    } catch (const std::logic_error &) {
      // not a number, fall through to the retry prompt
    }
    out << "Invalid selection.\n";
  }
}

ToggleOutcome ToggleWorkflow::run(const AccountConfig &account,
                                  const DeviceSelector &select) {
  ToggleOutcome outcome;

  log_line(LogLevel::info, "cloud", "authenticating with Tapo cloud");
  const auto token = cloud_.login(account.email, account.password);
  const auto devices = cloud_.list_devices(token);
  log_line(LogLevel::info, "cloud",
           std::to_string(devices.size()) + " device(s) on the account");

  std::optional<std::size_t> index;
  if (select)
    index = select(devices);
  if (!index || *index >= devices.size()) {
    outcome.status = ToggleOutcome::Status::device_not_selected;
    return outcome;
  }
  outcome.device = devices[*index];
  log_line(LogLevel::info, "cloud",
           "selected " + outcome.device.alias +
               " (MAC: " + outcome.device.device_mac + ")");

  const auto found = locator_.discover(outcome.device.device_mac);
  if (!found.resolved()) {
    outcome.status = ToggleOutcome::Status::device_not_found;
    return outcome;
  }
  outcome.ip = found.address->to_string();
  log_line(LogLevel::info, "discover",
           "resolved local IP " + outcome.ip + " via " +
               to_string(found.source));

  const auto session =
      control_.login_by_ip(outcome.ip, account.email, account.password);
  const auto before = control_.get_device_info(session);
  outcome.previous_state = before.device_on;

  control_.set_power(session, !before.device_on);

  const auto after = control_.get_device_info(session);
  outcome.new_state = after.device_on;
  outcome.nickname = after.nickname;
  outcome.status = ToggleOutcome::Status::toggled;
  return outcome;
}

} // namespace tapotoggle
