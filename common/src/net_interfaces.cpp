#include "net_interfaces.hpp"

#include "log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace tapotoggle {

using boost::asio::ip::address_v4;

static address_v4 to_address(const sockaddr *sa) {
  const auto *in = reinterpret_cast<const sockaddr_in *>(sa);
  return address_v4(ntohl(in->sin_addr.s_addr));
}

std::vector<NetworkInterfaceInfo> enumerate_interfaces() {
  std::vector<NetworkInterfaceInfo> res;
  struct ifaddrs *addrs = nullptr;

  if (getifaddrs(&addrs) != 0) {
    log_line(LogLevel::warning, "net",
             std::string("getifaddrs() failed: ") + std::strerror(errno));
    return res;
  }

  for (auto *p = addrs; p; p = p->ifa_next) {
    if (!p->ifa_addr || p->ifa_addr->sa_family != AF_INET || !p->ifa_netmask)
      continue;
    const bool up = (p->ifa_flags & IFF_UP) && (p->ifa_flags & IFF_RUNNING);
    if (!up || (p->ifa_flags & IFF_LOOPBACK))
      continue;

    NetworkInterfaceInfo item;
    item.name = p->ifa_name ? p->ifa_name : "";
    item.address = to_address(p->ifa_addr);
    item.netmask = to_address(p->ifa_netmask);
    res.push_back(item);
  }

  freeifaddrs(addrs);
  return res;
}

address_v4 directed_broadcast(const NetworkInterfaceInfo &iface) {
  return address_v4(iface.address.to_uint() | ~iface.netmask.to_uint());
}

std::vector<address_v4>
broadcast_targets(const std::vector<NetworkInterfaceInfo> &interfaces) {
  std::vector<address_v4> out{address_v4::broadcast()};
  for (const auto &iface : interfaces) {
    auto bc = directed_broadcast(iface);
    if (std::find(out.begin(), out.end(), bc) == out.end())
      out.push_back(bc);
  }
  return out;
}

} // namespace tapotoggle
