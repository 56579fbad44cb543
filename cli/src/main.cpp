// =====================================================================================
// TAPOTOGGLE - find a Tapo plug on the LAN by MAC address
// =====================================================================================
//
//  - prescan: ICMP sweep of the local /24 to fill the neighbor cache
//  - broadcast: {"method":"discovery"} to every broadcast address, port 20002
//  - fallback: parse `ip neighbor show` / `arp -a`
//
// Prints the resolved IPv4 address on stdout. Exit codes: 0 found, 1 not
// found, 2 usage or configuration error.
// =====================================================================================

#include "config.hpp"
#include "discovery.hpp"
#include "log.hpp"
#include "net_interfaces.hpp"

#include <getopt.h>

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace tapotoggle;

// ===== CLI
// ===========================================================================
static void print_usage(std::ostream &os, const char *prog) {
  os << "usage: " << prog << " [options] [MAC]\n"
     << "  -c, --config FILE     configuration file (.json may be omitted)\n"
     << "  -p, --port PORT       UDP discovery port (default "
     << DISCOVERY_PORT_DEFAULT << ")\n"
     << "  -t, --timeout MS      per-address receive timeout (default "
     << RECEIVE_TIMEOUT_DEFAULT.count() << ")\n"
     << "      --no-prescan      skip the ICMP sweep\n"
     << "  -i, --interfaces      list interfaces and broadcast targets\n"
     << "  -v, --verbose         debug logging\n"
     << "  -h, --help            this text\n"
     << "MAC defaults to TapoConfig:DeviceMac or $TAPO_DEVICE_MAC.\n";
}

static long parse_number(const char *text, const char *what, long max) {
  try {
    std::size_t pos = 0;
    long v = std::stol(text, &pos);
    if (text[pos] == '\0' && v > 0 && v <= max)
      return v;
  } catch (const std::logic_error &) {
    // reported below
  }
  throw ConfigError(std::string("invalid ") + what + ": " + text);
}

static void print_interfaces() {
  const auto ifaces = enumerate_interfaces();
  if (ifaces.empty())
    std::cout << "no active IPv4 interface\n";
  for (const auto &i : ifaces)
    std::cout << i.name << "  " << i.address << "/" << i.netmask
              << "  broadcast " << directed_broadcast(i) << "\n";
  std::cout << "broadcast targets:";
  for (const auto &bc : broadcast_targets(ifaces))
    std::cout << " " << bc;
  std::cout << "\n";
}

// ===== MAIN
// ==========================================================================
int main(int argc, char **argv) {
  enum { OPT_NO_PRESCAN = 1000 };
  static const option long_opts[] = {
      {"config", required_argument, nullptr, 'c'},
      {"port", required_argument, nullptr, 'p'},
      {"timeout", required_argument, nullptr, 't'},
      {"no-prescan", no_argument, nullptr, OPT_NO_PRESCAN},
      {"interfaces", no_argument, nullptr, 'i'},
      {"verbose", no_argument, nullptr, 'v'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0}};

  try {
    std::string config_arg;
    long port = 0, timeout_ms = 0;
    bool no_prescan = false, list_interfaces = false, verbose = false;

    int opt;
    while ((opt = getopt_long(argc, argv, "c:p:t:ivh", long_opts, nullptr)) !=
           -1) {
      switch (opt) {
      case 'c':
        config_arg = optarg;
        break;
      case 'p':
        port = parse_number(optarg, "port", 65535);
        break;
      case 't':
        timeout_ms = parse_number(optarg, "timeout", 600000);
        break;
      case OPT_NO_PRESCAN:
        no_prescan = true;
        break;
      case 'i':
        list_interfaces = true;
        break;
      case 'v':
        verbose = true;
        break;
      case 'h':
        print_usage(std::cout, argv[0]);
        return 0;
      default:
        print_usage(std::cerr, argv[0]);
        return 2;
      }
    }

    AppConfig cfg;
    if (!config_arg.empty()) {
      const auto path = config_file_path(config_arg);
      cfg = load_config_file(path);
      log_line(LogLevel::debug, "config", "using configuration " + path);
    }
    apply_environment(cfg);

    if (port)
      cfg.discovery.broadcast.port = static_cast<unsigned short>(port);
    if (timeout_ms)
      cfg.discovery.broadcast.receive_timeout =
          std::chrono::milliseconds(timeout_ms);
    if (no_prescan)
      cfg.discovery.prescan = false;
    if (verbose)
      cfg.log_level = LogLevel::debug;
    set_log_level(cfg.log_level);

    if (list_interfaces) {
      print_interfaces();
      return 0;
    }

    const std::string mac =
        optind < argc ? argv[optind] : cfg.account.device_mac;
    if (mac.empty()) {
      print_usage(std::cerr, argv[0]);
      return 2;
    }

    log_line(LogLevel::info, "discover", "resolving local IP for " + mac);
    const auto res = locate_device(mac, cfg.discovery);
    if (!res.resolved()) {
      log_line(LogLevel::error, "discover",
               "could not find the device on the local network");
      return 1;
    }

    log_line(LogLevel::info, "discover",
             "resolved " + res.address->to_string() + " via " +
                 to_string(res.source));
    std::cout << res.address->to_string() << "\n";
    return 0;
  } catch (const ConfigError &ex) {
    log_line(LogLevel::error, "config", ex.what());
    return 2;
  } catch (const std::exception &ex) {
    log_line(LogLevel::error, "main", std::string("Fatal: ") + ex.what());
    return 1;
  }
}
