#pragma once
#include <boost/asio/ip/address_v4.hpp>

#include <functional>
#include <string>
#include <vector>

namespace tapotoggle {

struct NetworkInterfaceInfo {
  std::string name;
  boost::asio::ip::address_v4 address;
  boost::asio::ip::address_v4 netmask;
};

// Anything that yields the host's usable interfaces. Phases take one of these
// so tests can feed fixed interface lists.
using InterfaceSource = std::function<std::vector<NetworkInterfaceInfo>()>;

// Interfaces that are up and running, not loopback, and carry an IPv4
// address and netmask, in the order the OS reports them. Empty when none
// exist or the system query fails.
std::vector<NetworkInterfaceInfo> enumerate_interfaces();

// unicast | ~mask, e.g. 192.168.1.37/255.255.255.0 -> 192.168.1.255
boost::asio::ip::address_v4
directed_broadcast(const NetworkInterfaceInfo &iface);

// 255.255.255.255 first, then each interface's directed broadcast in
// enumeration order, without duplicates.
std::vector<boost::asio::ip::address_v4>
broadcast_targets(const std::vector<NetworkInterfaceInfo> &interfaces);

} // namespace tapotoggle
