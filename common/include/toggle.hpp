#pragma once
#include "config.hpp"
#include "discovery.hpp"

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tapotoggle {

class AuthError : public std::runtime_error {
public:
  explicit AuthError(const std::string &what) : std::runtime_error(what) {}
};

class LoginError : public std::runtime_error {
public:
  explicit LoginError(const std::string &what) : std::runtime_error(what) {}
};

struct DeviceRecord {
  std::string alias;
  std::string device_mac;
  std::string device_model;
  std::string nickname;
};

struct DeviceInfo {
  bool device_on = false;
  std::string nickname;
};

// Remote account service. login() throws AuthError on bad credentials or
// network failure.
class CloudAccount {
public:
  virtual ~CloudAccount() = default;
  virtual std::string login(const std::string &email,
                            const std::string &password) = 0;
  virtual std::vector<DeviceRecord> list_devices(const std::string &token) = 0;
};

// Authenticated local protocol of the plug. login_by_ip() throws LoginError
// when the handshake fails.
class DeviceControl {
public:
  virtual ~DeviceControl() = default;
  virtual std::string login_by_ip(const std::string &ip,
                                  const std::string &email,
                                  const std::string &password) = 0;
  virtual DeviceInfo get_device_info(const std::string &session) = 0;
  virtual void set_power(const std::string &session, bool on) = 0;
};

// Case-insensitive alias match; first hit wins.
std::optional<std::size_t>
find_device_by_label(const std::vector<DeviceRecord> &devices,
                     const std::string &label);

// Numbered menu "N. alias (model)"; asks again until a valid number is
// entered. nullopt for an empty list or when input ends.
std::optional<std::size_t> choose_device(const std::vector<DeviceRecord> &devices,
                                         std::istream &in, std::ostream &out);

using DeviceSelector = std::function<std::optional<std::size_t>(
    const std::vector<DeviceRecord> &)>;

struct ToggleOutcome {
  enum class Status { toggled, device_not_selected, device_not_found };

  Status status = Status::device_not_selected;
  DeviceRecord device;
  std::string ip;
  bool previous_state = false;
  bool new_state = false;
  std::string nickname;
};

// cloud login -> device list -> selection -> discovery -> local login ->
// read state -> flip -> read back. Collaborator exceptions propagate.
class ToggleWorkflow {
public:
  ToggleWorkflow(CloudAccount &cloud, DeviceControl &control,
                 DeviceLocator &locator)
      : cloud_(cloud), control_(control), locator_(locator) {}

  ToggleOutcome run(const AccountConfig &account,
                    const DeviceSelector &select);

private:
  CloudAccount &cloud_;
  DeviceControl &control_;
  DeviceLocator &locator_;
};

} // namespace tapotoggle
