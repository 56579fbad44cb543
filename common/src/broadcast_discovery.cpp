#include "broadcast_discovery.hpp"

#include "log.hpp"
#include "mac_address.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include <array>
#include <utility>

namespace tapotoggle {

namespace net = boost::asio;
using net::ip::address_v4;
using net::ip::udp;
using json = nlohmann::json;

static constexpr std::size_t REPLY_BUFFER_SIZE = 4096;

std::string discovery_payload() {
  return json{{"method", "discovery"}, {"params", json::object()}}.dump();
}

const char *to_string(AttemptStatus status) {
  switch (status) {
  case AttemptStatus::matched:
    return "matched";
  case AttemptStatus::mismatch:
    return "mismatch";
  case AttemptStatus::no_reply:
    return "no_reply";
  case AttemptStatus::transport_error:
    return "transport_error";
  }
  return "unknown";
}

std::optional<DatagramReply>
UdpDatagramExchange::exchange(const udp::endpoint &target,
                              const std::string &payload,
                              std::chrono::milliseconds timeout,
                              boost::system::error_code &ec) {
  ec.clear();
  ioc_.restart();

  udp::socket socket(ioc_);
  socket.open(udp::v4(), ec);
  if (ec)
    return std::nullopt;
  socket.set_option(net::socket_base::broadcast(true), ec);
  if (ec)
    return std::nullopt;
  socket.send_to(net::buffer(payload), target, 0, ec);
  if (ec)
    return std::nullopt;

  std::array<char, REPLY_BUFFER_SIZE> buf{};
  udp::endpoint sender;
  std::optional<std::size_t> received;
  boost::system::error_code rx_ec;
  bool timed_out = false;

  // receive races the timer; whichever completes first cancels the other
  net::steady_timer timer(ioc_);
  timer.expires_after(timeout);
  timer.async_wait([&](const boost::system::error_code &err) {
    if (err == net::error::operation_aborted)
      return;
    timed_out = true;
    boost::system::error_code ignored;
    socket.cancel(ignored);
  });
  socket.async_receive_from(
      net::buffer(buf), sender,
      [&](const boost::system::error_code &err, std::size_t n) {
        timer.cancel();
        if (err)
          rx_ec = err;
        else
          received = n;
      });
  ioc_.run();

  if (received)
    return DatagramReply{sender.address().to_v4(),
                         std::string(buf.data(), *received)};
  if (!timed_out)
    ec = rx_ec;
  return std::nullopt;
}

BroadcastDiscoveryClient::BroadcastDiscoveryClient(DatagramExchange &exchange,
                                                   InterfaceSource interfaces,
                                                   BroadcastOptions options)
    : exchange_(exchange), interfaces_(std::move(interfaces)),
      options_(options) {}

std::optional<address_v4>
BroadcastDiscoveryClient::resolve(const std::string &mac) {
  attempts_.clear();
  const auto target_mac = normalize_mac(mac);
  if (target_mac.empty())
    return std::nullopt;

  const auto payload = discovery_payload();
  const auto interfaces =
      interfaces_ ? interfaces_() : std::vector<NetworkInterfaceInfo>{};

  for (const auto &bc : broadcast_targets(interfaces)) {
    boost::system::error_code ec;
    const auto reply = exchange_.exchange(udp::endpoint(bc, options_.port),
                                          payload, options_.receive_timeout,
                                          ec);
    if (ec) {
      attempts_.push_back({bc, AttemptStatus::transport_error, ec.message()});
      log_line(LogLevel::debug, "broadcast",
               bc.to_string() + ": " + ec.message());
      continue;
    }
    if (!reply) {
      attempts_.push_back({bc, AttemptStatus::no_reply, ""});
      continue;
    }
    if (!mac_in_text(reply->payload, target_mac)) {
      attempts_.push_back(
          {bc, AttemptStatus::mismatch, reply->sender.to_string()});
      log_line(LogLevel::debug, "broadcast",
               bc.to_string() + ": reply from " + reply->sender.to_string() +
                   " is another device");
      continue;
    }

    attempts_.push_back({bc, AttemptStatus::matched, reply->sender.to_string()});
    log_line(LogLevel::debug, "broadcast",
             "device answered from " + reply->sender.to_string() + " via " +
                 bc.to_string());
    return reply->sender;
  }
  return std::nullopt;
}

} // namespace tapotoggle
