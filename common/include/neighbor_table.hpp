#pragma once
#include "mac_resolver.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace tapotoggle {

static constexpr std::chrono::milliseconds NEIGHBOR_TIMEOUT_DEFAULT{5000};

struct NeighborCommand {
  std::string program;
  std::vector<std::string> args;
};

// "arp -a" on Windows, "ip neighbor show" elsewhere.
NeighborCommand default_neighbor_command();

// First IPv4 literal on the first line mentioning the MAC. Typical line:
// "192.168.1.42 dev eth0 lladdr aa:bb:cc:dd:ee:ff REACHABLE"
std::optional<boost::asio::ip::address_v4>
find_ip_for_mac(const std::string &table, const std::string &mac);

// Full text of the OS neighbor table, or nullopt when it could not be read.
class NeighborTableSource {
public:
  virtual ~NeighborTableSource() = default;
  virtual std::optional<std::string> read() = 0;
};

// Runs the neighbor command and captures its stdout. The child is killed if
// it has not finished within the timeout.
class CommandNeighborTable : public NeighborTableSource {
public:
  explicit CommandNeighborTable(
      NeighborCommand command = default_neighbor_command(),
      std::chrono::milliseconds timeout = NEIGHBOR_TIMEOUT_DEFAULT);

  std::optional<std::string> read() override;

private:
  NeighborCommand command_;
  std::chrono::milliseconds timeout_;
};

class NeighborTableResolver : public MacResolver {
public:
  explicit NeighborTableResolver(NeighborTableSource &source)
      : source_(source) {}

  std::optional<boost::asio::ip::address_v4>
  resolve(const std::string &mac) override;

private:
  NeighborTableSource &source_;
};

} // namespace tapotoggle
