#include "wits/io/socket_address.hpp"

#include <gtest/gtest.h>

namespace wits::io::test {

TEST(SocketAddressTest, FromIpv4) {
  auto addr = SocketAddress::from_ipv4("192.168.1.20", 12345);
  ASSERT_TRUE(addr);
  EXPECT_TRUE(addr->is_ipv4());
  EXPECT_EQ(addr->port(), 12345);
  EXPECT_EQ(addr->to_string(), "192.168.1.20:12345");
}

TEST(SocketAddressTest, FromIpv4_InvalidAddress) {
  EXPECT_FALSE(SocketAddress::from_ipv4("300.1.1.1", 80));
  EXPECT_FALSE(SocketAddress::from_ipv4("rig-01", 80));
}

TEST(SocketAddressTest, FromString) {
  auto addr = SocketAddress::from_string("127.0.0.1:8080");
  ASSERT_TRUE(addr);
  EXPECT_EQ(addr->port(), 8080);

  EXPECT_FALSE(SocketAddress::from_string("127.0.0.1"));
  EXPECT_FALSE(SocketAddress::from_string("127.0.0.1:80abc"));
  EXPECT_FALSE(SocketAddress::from_string("[::1]:80"));
}

TEST(SocketAddressTest, ResolveNumericHost) {
  auto addr = SocketAddress::resolve("10.0.0.5", 5000);
  ASSERT_TRUE(addr);
  EXPECT_EQ(addr->to_string(), "10.0.0.5:5000");
}

TEST(SocketAddressTest, ResolveLocalhost) {
  auto addr = SocketAddress::resolve("localhost", 9000);
  ASSERT_TRUE(addr);
  EXPECT_TRUE(addr->is_ipv4());
  EXPECT_EQ(addr->port(), 9000);
}

TEST(SocketAddressTest, Loopback) {
  auto addr = SocketAddress::loopback_ipv4(0);
  EXPECT_EQ(addr.to_string(), "127.0.0.1:0");
}

}  // namespace wits::io::test
