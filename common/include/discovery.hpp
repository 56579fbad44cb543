#pragma once
#include "broadcast_discovery.hpp"
#include "mac_resolver.hpp"
#include "neighbor_table.hpp"
#include "subnet_prescan.hpp"

#include <boost/asio/ip/address_v4.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace tapotoggle {

struct DiscoveryResult {
  enum class Source { none, broadcast, neighbor_table };

  std::optional<boost::asio::ip::address_v4> address;
  Source source = Source::none;

  bool resolved() const { return address.has_value(); }
};

const char *to_string(DiscoveryResult::Source source);

// Anything that can find a device's IP from its MAC.
class DeviceLocator {
public:
  virtual ~DeviceLocator() = default;
  virtual DiscoveryResult discover(const std::string &mac) = 0;
};

// prescan -> broadcast -> neighbor table. The prescan always runs and its
// outcome is ignored; a broadcast hit ends the search; otherwise the neighbor
// table has the final word.
class DiscoveryOrchestrator : public DeviceLocator {
public:
  DiscoveryOrchestrator(NetworkPrimer &primer, MacResolver &broadcast,
                        MacResolver &neighbors)
      : primer_(primer), broadcast_(broadcast), neighbors_(neighbors) {}

  DiscoveryResult discover(const std::string &mac) override;

private:
  NetworkPrimer &primer_;
  MacResolver &broadcast_;
  MacResolver &neighbors_;
};

struct DiscoveryOptions {
  bool prescan = true;
  std::chrono::milliseconds ping_timeout = PING_TIMEOUT_DEFAULT;
  BroadcastOptions broadcast;
  std::chrono::milliseconds neighbor_timeout = NEIGHBOR_TIMEOUT_DEFAULT;
  NeighborCommand neighbor_command = default_neighbor_command();
};

// Builds the real phases from options and runs one discovery.
DiscoveryResult locate_device(const std::string &mac,
                              const DiscoveryOptions &options = {});

} // namespace tapotoggle
