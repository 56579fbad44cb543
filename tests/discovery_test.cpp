#include "discovery.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using boost::asio::ip::address_v4;
using boost::asio::ip::make_address_v4;
using namespace tapotoggle;

namespace {

struct RecordingPrimer : NetworkPrimer {
  std::vector<std::string> &trace;
  bool fail = false;

  explicit RecordingPrimer(std::vector<std::string> &t) : trace(t) {}
  std::size_t prime() override {
    trace.push_back("prescan");
    if (fail)
      throw std::runtime_error("icmp exploded");
    return 254;
  }
};

struct ScriptedResolver : MacResolver {
  std::vector<std::string> &trace;
  std::string name;
  std::optional<address_v4> answer;
  bool fail = false;
  std::vector<std::string> macs;

  ScriptedResolver(std::vector<std::string> &t, std::string n)
      : trace(t), name(std::move(n)) {}
  std::optional<address_v4> resolve(const std::string &mac) override {
    trace.push_back(name);
    macs.push_back(mac);
    if (fail)
      throw std::runtime_error(name + " exploded");
    return answer;
  }
};

struct DiscoveryFixture : ::testing::Test {
  std::vector<std::string> trace;
  RecordingPrimer primer{trace};
  ScriptedResolver broadcast{trace, "broadcast"};
  ScriptedResolver neighbors{trace, "neighbors"};
  DiscoveryOrchestrator orchestrator{primer, broadcast, neighbors};
};

} // namespace

TEST_F(DiscoveryFixture, BroadcastHitSkipsNeighborTable) {
  broadcast.answer = make_address_v4("192.168.1.50");
  neighbors.answer = make_address_v4("192.168.1.99");

  auto res = orchestrator.discover("AA:BB:CC:DD:EE:FF");

  ASSERT_TRUE(res.resolved());
  EXPECT_EQ(*res.address, make_address_v4("192.168.1.50"));
  EXPECT_EQ(res.source, DiscoveryResult::Source::broadcast);
  EXPECT_EQ(trace, (std::vector<std::string>{"prescan", "broadcast"}));
  EXPECT_TRUE(neighbors.macs.empty());
}

TEST_F(DiscoveryFixture, FallsBackToNeighborTableResult) {
  neighbors.answer = make_address_v4("10.0.0.42");

  auto res = orchestrator.discover("aa-bb-cc-dd-ee-ff");

  ASSERT_TRUE(res.resolved());
  EXPECT_EQ(res.address, neighbors.answer);
  EXPECT_EQ(res.source, DiscoveryResult::Source::neighbor_table);
  EXPECT_EQ(trace,
            (std::vector<std::string>{"prescan", "broadcast", "neighbors"}));
}

TEST_F(DiscoveryFixture, NothingFoundIsAResultNotAnError) {
  DiscoveryResult res;
  EXPECT_NO_THROW(res = orchestrator.discover("aa:bb:cc:dd:ee:ff"));
  EXPECT_FALSE(res.resolved());
  EXPECT_EQ(res.source, DiscoveryResult::Source::none);
}

TEST_F(DiscoveryFixture, PhasesSeeTheNormalizedMac) {
  orchestrator.discover("AA:BB:CC:DD:EE:FF");
  ASSERT_EQ(broadcast.macs.size(), 1u);
  EXPECT_EQ(broadcast.macs[0], "aabbccddeeff");
  ASSERT_EQ(neighbors.macs.size(), 1u);
  EXPECT_EQ(neighbors.macs[0], "aabbccddeeff");
}

TEST_F(DiscoveryFixture, ThrowingPhasesDoNotEscape) {
  primer.fail = true;
  broadcast.fail = true;
  neighbors.answer = make_address_v4("192.168.1.50");

  DiscoveryResult res;
  EXPECT_NO_THROW(res = orchestrator.discover("aa:bb:cc:dd:ee:ff"));
  ASSERT_TRUE(res.resolved());
  EXPECT_EQ(res.source, DiscoveryResult::Source::neighbor_table);

  neighbors.fail = true;
  EXPECT_NO_THROW(res = orchestrator.discover("aa:bb:cc:dd:ee:ff"));
  EXPECT_FALSE(res.resolved());
}

TEST(DiscoveryResultNames, SourceNames) {
  EXPECT_STREQ(to_string(DiscoveryResult::Source::broadcast), "broadcast");
  EXPECT_STREQ(to_string(DiscoveryResult::Source::neighbor_table),
               "neighbor_table");
  EXPECT_STREQ(to_string(DiscoveryResult::Source::none), "none");
}
