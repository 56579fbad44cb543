#pragma once
#include "mac_resolver.hpp"
#include "net_interfaces.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace tapotoggle {

static constexpr unsigned short DISCOVERY_PORT_DEFAULT = 20002;
static constexpr std::chrono::milliseconds RECEIVE_TIMEOUT_DEFAULT{1500};

// {"method":"discovery","params":{}}
std::string discovery_payload();

struct DatagramReply {
  boost::asio::ip::address_v4 sender;
  std::string payload;
};

// Sends one datagram and waits for one answer. nullopt with a clear ec means
// nothing arrived before the timeout; a set ec reports a transport failure.
class DatagramExchange {
public:
  virtual ~DatagramExchange() = default;
  virtual std::optional<DatagramReply>
  exchange(const boost::asio::ip::udp::endpoint &target,
           const std::string &payload, std::chrono::milliseconds timeout,
           boost::system::error_code &ec) = 0;
};

// Broadcast-enabled UDP socket opened and closed within each exchange.
class UdpDatagramExchange : public DatagramExchange {
public:
  std::optional<DatagramReply>
  exchange(const boost::asio::ip::udp::endpoint &target,
           const std::string &payload, std::chrono::milliseconds timeout,
           boost::system::error_code &ec) override;

private:
  boost::asio::io_context ioc_;
};

enum class AttemptStatus { matched, mismatch, no_reply, transport_error };

const char *to_string(AttemptStatus status);

struct BroadcastAttempt {
  boost::asio::ip::address_v4 target;
  AttemptStatus status;
  std::string detail; // sender address or error text
};

struct BroadcastOptions {
  unsigned short port = DISCOVERY_PORT_DEFAULT;
  std::chrono::milliseconds receive_timeout = RECEIVE_TIMEOUT_DEFAULT;
};

// Queries every broadcast target in turn and stops at the first reply that
// mentions the MAC. The reply's source address is the answer.
class BroadcastDiscoveryClient : public MacResolver {
public:
  BroadcastDiscoveryClient(DatagramExchange &exchange,
                           InterfaceSource interfaces = enumerate_interfaces,
                           BroadcastOptions options = {});

  std::optional<boost::asio::ip::address_v4>
  resolve(const std::string &mac) override;

  // Outcomes of the last resolve() call, in the order attempted.
  const std::vector<BroadcastAttempt> &attempts() const { return attempts_; }

private:
  DatagramExchange &exchange_;
  InterfaceSource interfaces_;
  BroadcastOptions options_;
  std::vector<BroadcastAttempt> attempts_;
};

} // namespace tapotoggle
