/**
 * @file test_ip_address.cpp
 * @brief Unit tests for IP address, range and network arithmetic
 */

#include <gtest/gtest.h>
#include "segipam/ip_address.hpp"
#include <stdexcept>

using namespace segipam;

// ============================================================================
// IpAddress
// ============================================================================

TEST(IpAddressTest, ParseIPv4) {
    auto address = IpAddress::parse("203.0.113.10");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->version(), 4);
    EXPECT_EQ(address->to_string(), "203.0.113.10");
}

TEST(IpAddressTest, ParseIPv6) {
    auto address = IpAddress::parse("2001:db8::1");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->version(), 6);
    EXPECT_EQ(address->bit_length(), 128);
    EXPECT_EQ(address->to_string(), "2001:db8::1");
}

TEST(IpAddressTest, ParseRejectsGarbage) {
    EXPECT_FALSE(IpAddress::parse("").has_value());
    EXPECT_FALSE(IpAddress::parse("203.0.113").has_value());
    EXPECT_FALSE(IpAddress::parse("203.0.113.256").has_value());
    EXPECT_FALSE(IpAddress::parse("not-an-address").has_value());
    EXPECT_THROW(IpAddress::from_string("bogus"), std::invalid_argument);
}

TEST(IpAddressTest, NextAndPrev) {
    IpAddress address = IpAddress::from_string("198.51.100.255");
    EXPECT_EQ(address.next().to_string(), "198.51.101.0");
    EXPECT_EQ(address.prev().to_string(), "198.51.100.254");
}

TEST(IpAddressTest, OrderingAcrossVersions) {
    IpAddress v4 = IpAddress::from_string("255.255.255.255");
    IpAddress v6 = IpAddress::from_string("::1");
    EXPECT_TRUE(v4 < v6);
    EXPECT_NE(v4, v6);
    EXPECT_EQ(IpAddress::from_string("10.0.0.1"), IpAddress::from_string("10.0.0.1"));
}

// ============================================================================
// IpRange
// ============================================================================

TEST(IpRangeTest, SizeAndContains) {
    IpRange range = IpRange::from_strings("203.0.113.2", "203.0.113.254");
    EXPECT_EQ(saturate_to_u64(range.size()), 253u);
    EXPECT_TRUE(range.contains(IpAddress::from_string("203.0.113.2")));
    EXPECT_TRUE(range.contains(IpAddress::from_string("203.0.113.254")));
    EXPECT_FALSE(range.contains(IpAddress::from_string("203.0.113.1")));
    EXPECT_EQ(range.to_string(), "203.0.113.2-203.0.113.254");
}

TEST(IpRangeTest, RejectsReversedOrMixed) {
    EXPECT_THROW(IpRange::from_strings("10.0.0.9", "10.0.0.1"), std::invalid_argument);
    EXPECT_THROW(IpRange::from_strings("10.0.0.1", "::1"), std::invalid_argument);
}

TEST(IpRangeTest, Overlaps) {
    IpRange a = IpRange::from_strings("10.0.0.1", "10.0.0.10");
    IpRange b = IpRange::from_strings("10.0.0.10", "10.0.0.20");
    IpRange c = IpRange::from_strings("10.0.0.21", "10.0.0.30");
    EXPECT_TRUE(a.overlaps(b));
    EXPECT_FALSE(a.overlaps(c));
    EXPECT_FALSE(b.overlaps(c));
}

// ============================================================================
// IpNetwork
// ============================================================================

TEST(IpNetworkTest, ParseCanonical) {
    auto network = IpNetwork::parse("198.51.100.0/24");
    ASSERT_TRUE(network.has_value());
    EXPECT_EQ(network->prefix_length(), 24);
    EXPECT_EQ(saturate_to_u64(network->size()), 256u);
    EXPECT_EQ(network->last_address().to_string(), "198.51.100.255");
    EXPECT_EQ(network->to_string(), "198.51.100.0/24");
}

TEST(IpNetworkTest, ParseRejectsHostBitsAndBadPrefix) {
    EXPECT_FALSE(IpNetwork::parse("198.51.100.1/24").has_value());
    EXPECT_FALSE(IpNetwork::parse("198.51.100.0/33").has_value());
    EXPECT_FALSE(IpNetwork::parse("198.51.100.0").has_value());
    EXPECT_FALSE(IpNetwork::parse("198.51.100.0/").has_value());
    EXPECT_FALSE(IpNetwork::parse("198.51.100.0/2x").has_value());
}

TEST(IpNetworkTest, HostRangeIPv4) {
    IpRange hosts = IpNetwork::from_string("203.0.113.0/24").host_range();
    EXPECT_EQ(hosts.first.to_string(), "203.0.113.1");
    EXPECT_EQ(hosts.last.to_string(), "203.0.113.254");

    // Point-to-point and host routes use every address
    IpRange p2p = IpNetwork::from_string("10.0.0.0/31").host_range();
    EXPECT_EQ(saturate_to_u64(p2p.size()), 2u);
}

TEST(IpNetworkTest, HostRangeIPv6KeepsLastAddress) {
    IpRange hosts = IpNetwork::from_string("2001:db8::/120").host_range();
    EXPECT_EQ(hosts.first.to_string(), "2001:db8::1");
    EXPECT_EQ(hosts.last.to_string(), "2001:db8::ff");
}

TEST(IpNetworkTest, ContainsAndOverlaps) {
    IpNetwork wide = IpNetwork::from_string("10.0.0.0/16");
    IpNetwork narrow = IpNetwork::from_string("10.0.5.0/24");
    IpNetwork other = IpNetwork::from_string("10.1.0.0/16");

    EXPECT_TRUE(wide.contains(IpAddress::from_string("10.0.5.7")));
    EXPECT_FALSE(wide.contains(IpAddress::from_string("10.1.0.1")));
    EXPECT_FALSE(wide.contains(IpAddress::from_string("::1")));
    EXPECT_TRUE(wide.overlaps(narrow));
    EXPECT_TRUE(narrow.overlaps(wide));
    EXPECT_FALSE(wide.overlaps(other));
}

TEST(IpNetworkTest, SaturateLargeIPv6Sizes) {
    IpNetwork network = IpNetwork::from_string("2001:db8::/32");
    EXPECT_EQ(saturate_to_u64(network.size()), UINT64_MAX);
}
