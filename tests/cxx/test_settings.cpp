// Configuration validation and identity parsing.

#include <gtest/gtest.h>

#include <stdexcept>

#include "comfoq/hex.hpp"
#include "comfoq/settings.hpp"

using namespace comfoq;
using namespace std::chrono_literals;

TEST(Settings, DefaultsAreValid) {
  Settings s;
  EXPECT_NO_THROW(s.validate());
  EXPECT_EQ(s.port, kDefaultPort);
  EXPECT_EQ(s.idle_timeout, 15s);
  EXPECT_EQ(s.keepalive_interval, 5s);
  EXPECT_EQ(s.effective_connect_timeout(), 15s);
  EXPECT_EQ(s.effective_discovery_port(), kDefaultPort);
  EXPECT_FALSE(s.discovered());
}

TEST(Settings, RemoteIdentityRequiresAddress) {
  Settings s;
  s.remote_uuid = Uuid{};
  EXPECT_THROW(s.validate(), std::invalid_argument);

  s.remote_address = "192.168.1.20";
  EXPECT_NO_THROW(s.validate());
  EXPECT_TRUE(s.discovered());
}

TEST(Settings, AddressWithoutIdentityIsUnicastDiscovery) {
  Settings s;
  s.remote_address = "192.168.1.20";
  EXPECT_NO_THROW(s.validate());
  EXPECT_FALSE(s.discovered());
}

TEST(Settings, RejectsMalformedAddresses) {
  Settings s;
  s.remote_address = "gateway.local";
  EXPECT_THROW(s.validate(), std::invalid_argument);

  Settings m;
  m.multicast_group = "not-an-ip";
  EXPECT_THROW(m.validate(), std::invalid_argument);
}

TEST(Settings, ConnectTimeoutNeverExceedsIdleTimeout) {
  Settings s;
  s.idle_timeout = 2s;
  s.connect_timeout = 10s;
  EXPECT_EQ(s.effective_connect_timeout(), 2s);
  s.connect_timeout = 500ms;
  EXPECT_EQ(s.effective_connect_timeout(), 500ms);
}

TEST(Hex, ParseUuid) {
  auto u = parse_uuid("000102030405060708090a0b0c0d0e0f");
  for (size_t i = 0; i < kUuidSize; ++i) EXPECT_EQ(u[i], i);

  EXPECT_EQ(parse_uuid("00010203-0405-0607-0809-0A0B0C0D0E0F"), u);
  EXPECT_EQ(to_hex(u), "000102030405060708090a0b0c0d0e0f");
}

TEST(Hex, ParseUuidRejectsBadInput) {
  EXPECT_THROW(parse_uuid("0001"), std::invalid_argument);
  EXPECT_THROW(parse_uuid("zz0102030405060708090a0b0c0d0e0f"), std::invalid_argument);
  EXPECT_THROW(parse_uuid("000102030405060708090a0b0c0d0e0f00"), std::invalid_argument);
  EXPECT_THROW(parse_uuid("000102030405060708090a0b0c0d0e0"), std::invalid_argument);
}
