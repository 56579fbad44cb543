#include "neighbor_table.hpp"

#include "log.hpp"
#include "mac_address.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/process/args.hpp>
#include <boost/process/async.hpp>
#include <boost/process/child.hpp>
#include <boost/process/io.hpp>
#include <boost/process/search_path.hpp>

#include <future>
#include <regex>
#include <sstream>
#include <system_error>
#include <utility>

namespace tapotoggle {

namespace net = boost::asio;
namespace bp = boost::process;
using net::ip::address_v4;

NeighborCommand default_neighbor_command() {
#ifdef _WIN32
  return {"arp", {"-a"}};
#else
  return {"ip", {"neighbor", "show"}};
#endif
}

std::optional<address_v4> find_ip_for_mac(const std::string &table,
                                          const std::string &mac) {
  if (normalize_mac(mac).empty())
    return std::nullopt;

  static const std::regex ipv4_literal(
      R"(\b\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)");

  std::istringstream in(table);
  std::string line;
  while (std::getline(in, line)) {
    if (!mac_in_text(line, mac))
      continue;
    for (std::sregex_iterator it(line.begin(), line.end(), ipv4_literal), end;
         it != end; ++it) {
      boost::system::error_code ec;
      auto ip = net::ip::make_address_v4(it->str(), ec);
      if (!ec)
        return ip;
    }
  }
  return std::nullopt;
}

CommandNeighborTable::CommandNeighborTable(NeighborCommand command,
                                           std::chrono::milliseconds timeout)
    : command_(std::move(command)), timeout_(timeout) {}

std::optional<std::string> CommandNeighborTable::read() {
  const auto exe = bp::search_path(command_.program);
  if (exe.empty()) {
    log_line(LogLevel::warning, "neigh",
             "'" + command_.program + "' not found in PATH");
    return std::nullopt;
  }

  try {
    net::io_context ioc;
    std::future<std::string> output;
    std::error_code spawn_ec;
    bp::child child(exe, bp::args(command_.args), bp::std_out > output,
                    bp::std_err > bp::null, ioc, spawn_ec);
    if (spawn_ec) {
      log_line(LogLevel::warning, "neigh",
               "cannot start '" + command_.program + "': " +
                   spawn_ec.message());
      return std::nullopt;
    }

    ioc.run_for(timeout_);
    if (output.wait_for(std::chrono::seconds(0)) !=
        std::future_status::ready) {
      std::error_code kill_ec;
      child.terminate(kill_ec);
      log_line(LogLevel::warning, "neigh",
               "'" + command_.program + "' timed out after " +
                   std::to_string(timeout_.count()) + "ms");
      return std::nullopt;
    }

    // stdout reached EOF, so the child is exiting
    std::error_code wait_ec;
    child.wait(wait_ec);
    if (wait_ec) {
      log_line(LogLevel::warning, "neigh", "wait failed: " + wait_ec.message());
      return std::nullopt;
    }
    if (child.exit_code() != 0) {
      log_line(LogLevel::warning, "neigh",
               "'" + command_.program + "' exited with " +
                   std::to_string(child.exit_code()));
      return std::nullopt;
    }
    return output.get();
  } catch (const std::exception &ex) {
    log_line(LogLevel::warning, "neigh",
             "reading neighbor table failed: " + std::string(ex.what()));
    return std::nullopt;
  }
}

std::optional<address_v4> NeighborTableResolver::resolve(const std::string &mac) {
  if (normalize_mac(mac).empty())
    return std::nullopt;

  const auto table = source_.read();
  if (!table)
    return std::nullopt;

  auto ip = find_ip_for_mac(*table, mac);
  if (ip)
    log_line(LogLevel::debug, "neigh",
             "neighbor table maps " + mac + " to " + ip->to_string());
  return ip;
}

} // namespace tapotoggle
