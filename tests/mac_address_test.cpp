#include "mac_address.hpp"

#include <gtest/gtest.h>

using tapotoggle::mac_in_text;
using tapotoggle::normalize_mac;

TEST(MacAddress, SeparatorAndCaseVariantsNormalizeAlike) {
  EXPECT_EQ(normalize_mac("AA:BB:CC:DD:EE:FF"), "aabbccddeeff");
  EXPECT_EQ(normalize_mac("aa-bb-cc-dd-ee-ff"), "aabbccddeeff");
  EXPECT_EQ(normalize_mac("AABBCCDDEEFF"), "aabbccddeeff");
  EXPECT_EQ(normalize_mac("Aa:bB-cc:DD-ee:Ff"), "aabbccddeeff");
}

TEST(MacAddress, NormalizeIsIdempotent) {
  for (const char *raw : {"AA:BB:CC:DD:EE:FF", "11-22-33-44-55-66", "", "::"}) {
    const auto once = normalize_mac(raw);
    EXPECT_EQ(normalize_mac(once), once) << raw;
  }
}

TEST(MacAddress, FindsMacInsideReplyPayload) {
  const std::string reply =
      R"({"result":{"ip":"192.168.1.50","deviceMac":"AA-BB-CC-DD-EE-FF"}})";
  EXPECT_TRUE(mac_in_text(reply, "aa:bb:cc:dd:ee:ff"));
  EXPECT_FALSE(mac_in_text(reply, "11:22:33:44:55:66"));
}

TEST(MacAddress, EmptyMacNeverMatches) {
  EXPECT_FALSE(mac_in_text("anything at all", ""));
  EXPECT_FALSE(mac_in_text("anything at all", ":-:"));
}
