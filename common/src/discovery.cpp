#include "discovery.hpp"

#include "log.hpp"
#include "mac_address.hpp"

namespace tapotoggle {

using boost::asio::ip::address_v4;

const char *to_string(DiscoveryResult::Source source) {
  switch (source) {
  case DiscoveryResult::Source::none:
    return "none";
  case DiscoveryResult::Source::broadcast:
    return "broadcast";
  case DiscoveryResult::Source::neighbor_table:
    return "neighbor_table";
  }
  return "unknown";
}

// A phase that throws is logged and counts as "no result".
static std::optional<address_v4> run_phase(const char *name,
                                           MacResolver &resolver,
                                           const std::string &mac) {
  try {
    return resolver.resolve(mac);
  } catch (const std::exception &ex) {
    log_line(LogLevel::warning, "discover",
             std::string(name) + " phase failed: " + ex.what());
    return std::nullopt;
  }
}

DiscoveryResult DiscoveryOrchestrator::discover(const std::string &mac) {
  DiscoveryResult res;
  const auto target = normalize_mac(mac);

  try {
    primer_.prime();
  } catch (const std::exception &ex) {
    log_line(LogLevel::warning, "discover",
             std::string("prescan phase failed: ") + ex.what());
  }

  if (auto ip = run_phase("broadcast", broadcast_, target)) {
    res.address = ip;
    res.source = DiscoveryResult::Source::broadcast;
    return res;
  }

  log_line(LogLevel::info, "discover",
           "UDP discovery found nothing, falling back to the neighbor table");
  if (auto ip = run_phase("neighbor table", neighbors_, target)) {
    res.address = ip;
    res.source = DiscoveryResult::Source::neighbor_table;
  }
  return res;
}

namespace {
struct NoPrimer : NetworkPrimer {
  std::size_t prime() override { return 0; }
};
} // namespace

DiscoveryResult locate_device(const std::string &mac,
                              const DiscoveryOptions &options) {
  SubnetPrescanner prescanner(enumerate_interfaces, options.ping_timeout);
  NoPrimer no_prescan;
  UdpDatagramExchange udp;
  BroadcastDiscoveryClient broadcast(udp, enumerate_interfaces,
                                     options.broadcast);
  CommandNeighborTable table(options.neighbor_command,
                             options.neighbor_timeout);
  NeighborTableResolver neighbors(table);

  NetworkPrimer &primer =
      options.prescan ? static_cast<NetworkPrimer &>(prescanner) : no_prescan;
  DiscoveryOrchestrator orchestrator(primer, broadcast, neighbors);
  return orchestrator.discover(mac);
}

} // namespace tapotoggle
