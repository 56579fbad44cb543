#include "toggle.hpp"

#include <gtest/gtest.h>

#include <sstream>

using boost::asio::ip::make_address_v4;
using namespace tapotoggle;

namespace {

std::vector<DeviceRecord> sample_devices() {
  return {{"Desk Lamp", "AA-BB-CC-DD-EE-FF", "P100", "desk"},
          {"Heater", "11-22-33-44-55-66", "P110", "heater"}};
}

struct FakeCloud : CloudAccount {
  bool reject = false;
  std::string seen_email, seen_password, seen_token;

  std::string login(const std::string &email,
                    const std::string &password) override {
    seen_email = email;
    seen_password = password;
    if (reject)
      throw AuthError("bad credentials");
    return "token-1";
  }
  std::vector<DeviceRecord> list_devices(const std::string &token) override {
    seen_token = token;
    return sample_devices();
  }
};

struct FakeControl : DeviceControl {
  bool on = false;
  std::string nickname = "Desk Lamp";
  std::string seen_ip;
  std::vector<bool> power_calls;

  std::string login_by_ip(const std::string &ip, const std::string &,
                          const std::string &) override {
    seen_ip = ip;
    return "session-1";
  }
  DeviceInfo get_device_info(const std::string &) override {
    return {on, nickname};
  }
  void set_power(const std::string &, bool value) override {
    power_calls.push_back(value);
    on = value;
  }
};

struct FakeLocator : DeviceLocator {
  DiscoveryResult result;
  std::vector<std::string> macs;

  DiscoveryResult discover(const std::string &mac) override {
    macs.push_back(mac);
    return result;
  }
};

AccountConfig account() {
  AccountConfig a;
  a.email = "me@example.com";
  a.password = "pw";
  a.device_label = "desk lamp";
  return a;
}

DeviceSelector by_label(const std::string &label) {
  return [label](const std::vector<DeviceRecord> &devices) {
    return find_device_by_label(devices, label);
  };
}

} // namespace

TEST(DeviceSelection, LabelMatchIgnoresCase) {
  auto devices = sample_devices();
  EXPECT_EQ(find_device_by_label(devices, "desk lamp"), 0u);
  EXPECT_EQ(find_device_by_label(devices, "HEATER"), 1u);
  EXPECT_FALSE(find_device_by_label(devices, "Desk"));
}

TEST(DeviceSelection, MenuRepromptsUntilValidChoice) {
  std::istringstream in("abc\n7\n0\n2x\n2\n");
  std::ostringstream out;
  auto choice = choose_device(sample_devices(), in, out);
  ASSERT_TRUE(choice);
  EXPECT_EQ(*choice, 1u);
  EXPECT_NE(out.str().find(" 1. Desk Lamp (P100)"), std::string::npos);
  EXPECT_NE(out.str().find(" 2. Heater (P110)"), std::string::npos);
  EXPECT_NE(out.str().find("Invalid selection."), std::string::npos);
}

TEST(DeviceSelection, MenuGivesUpOnEmptyListOrEndOfInput) {
  std::istringstream in("1\n");
  std::ostringstream out;
  EXPECT_FALSE(choose_device({}, in, out));

  std::istringstream eof("");
  EXPECT_FALSE(choose_device(sample_devices(), eof, out));
}

TEST(ToggleWorkflow, TogglesResolvedDevice) {
  FakeCloud cloud;
  FakeControl control;
  FakeLocator locator;
  locator.result.address = make_address_v4("192.168.1.50");
  locator.result.source = DiscoveryResult::Source::broadcast;

  ToggleWorkflow workflow(cloud, control, locator);
  auto outcome = workflow.run(account(), by_label("Desk Lamp"));

  EXPECT_EQ(outcome.status, ToggleOutcome::Status::toggled);
  EXPECT_EQ(cloud.seen_email, "me@example.com");
  EXPECT_EQ(cloud.seen_token, "token-1");
  ASSERT_EQ(locator.macs.size(), 1u);
  EXPECT_EQ(locator.macs[0], "AA-BB-CC-DD-EE-FF");
  EXPECT_EQ(control.seen_ip, "192.168.1.50");
  EXPECT_EQ(control.power_calls, std::vector<bool>{true});
  EXPECT_FALSE(outcome.previous_state);
  EXPECT_TRUE(outcome.new_state);
  EXPECT_EQ(outcome.ip, "192.168.1.50");
  EXPECT_EQ(outcome.nickname, "Desk Lamp");
  EXPECT_EQ(outcome.device.alias, "Desk Lamp");
}

TEST(ToggleWorkflow, NoSelectionStopsBeforeDiscovery) {
  FakeCloud cloud;
  FakeControl control;
  FakeLocator locator;

  ToggleWorkflow workflow(cloud, control, locator);
  auto outcome = workflow.run(account(), by_label("Garage"));

  EXPECT_EQ(outcome.status, ToggleOutcome::Status::device_not_selected);
  EXPECT_TRUE(locator.macs.empty());
  EXPECT_TRUE(control.seen_ip.empty());
}

TEST(ToggleWorkflow, UnresolvedDeviceStopsBeforeLocalLogin) {
  FakeCloud cloud;
  FakeControl control;
  FakeLocator locator;

  ToggleWorkflow workflow(cloud, control, locator);
  auto outcome = workflow.run(account(), by_label("heater"));

  EXPECT_EQ(outcome.status, ToggleOutcome::Status::device_not_found);
  ASSERT_EQ(locator.macs.size(), 1u);
  EXPECT_EQ(locator.macs[0], "11-22-33-44-55-66");
  EXPECT_TRUE(control.seen_ip.empty());
  EXPECT_TRUE(control.power_calls.empty());
}

TEST(ToggleWorkflow, CloudRejectionPropagates) {
  FakeCloud cloud;
  cloud.reject = true;
  FakeControl control;
  FakeLocator locator;

  ToggleWorkflow workflow(cloud, control, locator);
  EXPECT_THROW(workflow.run(account(), by_label("Desk Lamp")), AuthError);
  EXPECT_TRUE(locator.macs.empty());
}
