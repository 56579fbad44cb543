#pragma once
#include <boost/asio/ip/address_v4.hpp>

#include <optional>
#include <string>

namespace tapotoggle {

// One way of turning a MAC address into the device's current IPv4 address.
// Implementations never throw for network trouble; no answer is nullopt.
class MacResolver {
public:
  virtual ~MacResolver() = default;
  virtual std::optional<boost::asio::ip::address_v4>
  resolve(const std::string &mac) = 0;
};

} // namespace tapotoggle
