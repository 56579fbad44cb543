#pragma once
#include "net_interfaces.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace tapotoggle {

static constexpr std::chrono::milliseconds PING_TIMEOUT_DEFAULT{150};
static constexpr std::size_t ECHO_REQUEST_SIZE = 16;

// Something that warms the OS neighbor cache before lookups. Best effort:
// the returned probe count is informational and never signals failure.
class NetworkPrimer {
public:
  virtual ~NetworkPrimer() = default;
  virtual std::size_t prime() = 0;
};

// RFC 1071 one's complement checksum.
std::uint16_t internet_checksum(const unsigned char *data, std::size_t len);

std::array<unsigned char, ECHO_REQUEST_SIZE>
make_echo_request(std::uint16_t identifier, std::uint16_t sequence);

// x.y.z.1 .. x.y.z.254 for the /24 containing local.
std::vector<boost::asio::ip::address_v4>
prescan_hosts(const boost::asio::ip::address_v4 &local);

// Pings every host of the first interface's /24 at once and waits until each
// probe has been answered or timed out.
class SubnetPrescanner : public NetworkPrimer {
public:
  explicit SubnetPrescanner(
      InterfaceSource interfaces = enumerate_interfaces,
      std::chrono::milliseconds timeout = PING_TIMEOUT_DEFAULT);

  std::size_t prime() override;

private:
  InterfaceSource interfaces_;
  std::chrono::milliseconds timeout_;
};

} // namespace tapotoggle
