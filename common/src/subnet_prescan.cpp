#include "subnet_prescan.hpp"

#include "log.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/generic/datagram_protocol.hpp>
#include <boost/asio/generic/raw_protocol.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/icmp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstring>
#include <memory>
#include <utility>

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace tapotoggle {

namespace net = boost::asio;
using net::ip::address_v4;

static constexpr unsigned char ICMP_ECHO_REQUEST = 8;

std::uint16_t internet_checksum(const unsigned char *data, std::size_t len) {
  std::uint32_t sum = 0;
  for (std::size_t i = 0; i + 1 < len; i += 2)
    sum += (static_cast<std::uint32_t>(data[i]) << 8) | data[i + 1];
  if (len & 1)
    sum += static_cast<std::uint32_t>(data[len - 1]) << 8;
  while (sum >> 16)
    sum = (sum & 0xFFFF) + (sum >> 16);
  return static_cast<std::uint16_t>(~sum & 0xFFFF);
}

std::array<unsigned char, ECHO_REQUEST_SIZE>
make_echo_request(std::uint16_t identifier, std::uint16_t sequence) {
  std::array<unsigned char, ECHO_REQUEST_SIZE> pkt{};
  pkt[0] = ICMP_ECHO_REQUEST;
  pkt[1] = 0; // code
  pkt[4] = static_cast<unsigned char>(identifier >> 8);
  pkt[5] = static_cast<unsigned char>(identifier & 0xFF);
  pkt[6] = static_cast<unsigned char>(sequence >> 8);
  pkt[7] = static_cast<unsigned char>(sequence & 0xFF);
  std::memcpy(&pkt[8], "tapotggl", 8);

  const auto sum = internet_checksum(pkt.data(), pkt.size());
  pkt[2] = static_cast<unsigned char>(sum >> 8);
  pkt[3] = static_cast<unsigned char>(sum & 0xFF);
  return pkt;
}

std::vector<address_v4> prescan_hosts(const address_v4 &local) {
  const auto base = local.to_uint() & 0xFFFFFF00u;
  std::vector<address_v4> out;
  out.reserve(254);
  for (std::uint32_t host = 1; host <= 254; host++)
    out.push_back(address_v4(base | host));
  return out;
}

// One echo request and one wait for any answer, bounded by a timer. The
// probe is done once its socket is closed and both handlers have run.
template <typename Protocol> class EchoProbe {
public:
  EchoProbe(net::io_context &ioc, const address_v4 &target,
            std::uint16_t sequence)
      : socket_(ioc), timer_(ioc), target_(target),
        request_(make_echo_request(static_cast<std::uint16_t>(::getpid()),
                                   sequence)) {}

  bool start(const Protocol &protocol, std::chrono::milliseconds timeout) {
    boost::system::error_code open_ec;
    socket_.open(protocol, open_ec);
    if (open_ec)
      return false;

    typename Protocol::endpoint dest(net::ip::icmp::endpoint(target_, 0));

    timer_.expires_after(timeout);
    timer_.async_wait([this](const boost::system::error_code &ec) {
      if (ec != net::error::operation_aborted)
        close();
    });

    socket_.async_send_to(
        net::buffer(request_), dest,
        [this](const boost::system::error_code &ec, std::size_t) {
          if (ec) {
            finish();
            return;
          }
          socket_.async_receive(
              net::buffer(reply_),
              [this](const boost::system::error_code &, std::size_t) {
                finish();
              });
        });
    return true;
  }

private:
  void finish() {
    timer_.cancel();
    close();
  }
  void close() {
    boost::system::error_code ignored;
    socket_.close(ignored);
  }

  typename Protocol::socket socket_;
  net::steady_timer timer_;
  address_v4 target_;
  std::array<unsigned char, ECHO_REQUEST_SIZE> request_;
  std::array<unsigned char, 128> reply_{};
};

template <typename Protocol> static bool can_open(const Protocol &protocol) {
  net::io_context ioc;
  typename Protocol::socket s(ioc);
  boost::system::error_code ec;
  s.open(protocol, ec);
  return !ec;
}

template <typename Protocol>
static std::size_t sweep(const Protocol &protocol,
                         const std::vector<address_v4> &hosts,
                         std::chrono::milliseconds timeout) {
  net::io_context ioc;
  std::vector<std::unique_ptr<EchoProbe<Protocol>>> probes;
  probes.reserve(hosts.size());

  std::uint16_t sequence = 0;
  for (const auto &host : hosts) {
    auto probe = std::make_unique<EchoProbe<Protocol>>(ioc, host, ++sequence);
    if (probe->start(protocol, timeout))
      probes.push_back(std::move(probe));
  }

  // join point: returns once every probe finished or timed out
  ioc.run();
  return probes.size();
}

SubnetPrescanner::SubnetPrescanner(InterfaceSource interfaces,
                                   std::chrono::milliseconds timeout)
    : interfaces_(std::move(interfaces)), timeout_(timeout) {}

std::size_t SubnetPrescanner::prime() {
  const auto ifaces = interfaces_ ? interfaces_()
                                  : std::vector<NetworkInterfaceInfo>{};
  if (ifaces.empty()) {
    log_line(LogLevel::debug, "prescan", "no IPv4 interface, skipped");
    return 0;
  }

  const auto hosts = prescan_hosts(ifaces.front().address);
  const auto started = std::chrono::steady_clock::now();
  std::size_t launched = 0;

  net::generic::datagram_protocol ping_socket(AF_INET, IPPROTO_ICMP);
  net::generic::raw_protocol raw_socket(AF_INET, IPPROTO_ICMP);
  if (can_open(ping_socket)) {
    launched = sweep(ping_socket, hosts, timeout_);
  } else if (can_open(raw_socket)) {
    launched = sweep(raw_socket, hosts, timeout_);
  } else {
    log_line(LogLevel::debug, "prescan",
             "cannot open ICMP socket, sweep skipped");
    return 0;
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  log_line(LogLevel::debug, "prescan",
           "pinged " + std::to_string(launched) + " hosts around " +
               ifaces.front().address.to_string() + " in " +
               std::to_string(elapsed.count()) + "ms");
  return launched;
}

} // namespace tapotoggle
