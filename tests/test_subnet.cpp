#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/net/Subnet.h"
#include "../src/core/Errors.h"

namespace wiz_scan {
namespace net {

class SubnetTest : public ::testing::Test {};

TEST_F(SubnetTest, IpIntegerRoundTripAtExtremes) {
    EXPECT_EQ(ip_to_integer("0.0.0.0"), 0u);
    EXPECT_EQ(ip_to_integer("255.255.255.255"), 0xFFFFFFFFu);
    EXPECT_EQ(integer_to_ip(0u), "0.0.0.0");
    EXPECT_EQ(integer_to_ip(0xFFFFFFFFu), "255.255.255.255");
    EXPECT_EQ(ip_to_integer("192.168.1.10"), 0xC0A8010Au);
    EXPECT_EQ(integer_to_ip(ip_to_integer("10.20.30.40")), "10.20.30.40");
}

TEST_F(SubnetTest, IpToIntegerRejectsMalformed) {
    EXPECT_THROW(ip_to_integer("192.168.1"), InvalidAddressError);
    EXPECT_THROW(ip_to_integer("192.168.1.256"), InvalidAddressError);
    EXPECT_THROW(ip_to_integer("a.b.c.d"), InvalidAddressError);
}

TEST_F(SubnetTest, IsValidIPv4) {
    EXPECT_TRUE(is_valid_ipv4("192.168.1.1"));
    EXPECT_TRUE(is_valid_ipv4("0.0.0.0"));
    EXPECT_FALSE(is_valid_ipv4("256.1.1.1"));
    EXPECT_FALSE(is_valid_ipv4("1.2.3"));
    EXPECT_FALSE(is_valid_ipv4("1.2.3.4.5"));
    EXPECT_FALSE(is_valid_ipv4("01.2.3.4"));
    EXPECT_FALSE(is_valid_ipv4("1..3.4"));
    EXPECT_FALSE(is_valid_ipv4(" 1.2.3.4"));
}

TEST_F(SubnetTest, ParseCidrSlash24) {
    CidrInfo info = parse_cidr("192.168.1.0/24");
    EXPECT_EQ(info.network, "192.168.1.0");
    EXPECT_EQ(info.prefix_length, 24);
    EXPECT_EQ(info.first_host, "192.168.1.1");
    EXPECT_EQ(info.last_host, "192.168.1.254");
    EXPECT_EQ(info.total_hosts, 254u);
}

TEST_F(SubnetTest, ParseCidrMasksHostBits) {
    CidrInfo info = parse_cidr("192.168.1.77/24");
    EXPECT_EQ(info.network, "192.168.1.0");
    EXPECT_EQ(info.first_host, "192.168.1.1");
}

TEST_F(SubnetTest, ParseCidrPointToPointAndHostRoutes) {
    EXPECT_EQ(parse_cidr("10.0.0.0/31").total_hosts, 0u);
    EXPECT_EQ(parse_cidr("10.0.0.5/32").total_hosts, 0u);
    EXPECT_EQ(parse_cidr("0.0.0.0/0").total_hosts, 4294967294ull);
}

TEST_F(SubnetTest, ParseCidrRejectsBadInput) {
    EXPECT_THROW(parse_cidr("192.168.1.0/33"), InvalidCidrError);
    EXPECT_THROW(parse_cidr("192.168.1.0/-1"), InvalidCidrError);
    EXPECT_THROW(parse_cidr("192.168.1.0"), InvalidCidrError);
    EXPECT_THROW(parse_cidr("192.168.1.0/"), InvalidCidrError);
    EXPECT_THROW(parse_cidr("192.168.1/24"), InvalidCidrError);
    EXPECT_THROW(parse_cidr("192.168.1.0/24/8"), InvalidCidrError);
}

TEST_F(SubnetTest, EnumerateSlash30) {
    auto hosts = enumerate_hosts("192.168.1.0/30");
    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(hosts[0], "192.168.1.1");
    EXPECT_EQ(hosts[1], "192.168.1.2");
}

TEST_F(SubnetTest, EnumerateIsAscending) {
    auto hosts = enumerate_hosts("10.0.0.0/23");
    ASSERT_EQ(hosts.size(), 510u);
    EXPECT_EQ(hosts.front(), "10.0.0.1");
    EXPECT_EQ(hosts[254], "10.0.0.255");
    EXPECT_EQ(hosts[255], "10.0.1.0");
    EXPECT_EQ(hosts.back(), "10.0.1.254");
}

TEST_F(SubnetTest, EnumerateEmptyForSlash31) {
    EXPECT_TRUE(enumerate_hosts("10.0.0.0/31").empty());
    EXPECT_TRUE(enumerate_hosts("10.0.0.1/32").empty());
}

TEST_F(SubnetTest, EnumerateSizeGuard) {
    EXPECT_EQ(enumerate_hosts("10.0.0.0/16").size(), 65534u);
    EXPECT_THROW(enumerate_hosts("10.0.0.0/15"), SubnetTooLargeError);
    EXPECT_THROW(enumerate_hosts("10.0.0.0/8"), SubnetTooLargeError);
}

TEST_F(SubnetTest, CalculateCidr) {
    EXPECT_EQ(calculate_cidr("192.168.1.42", "255.255.255.0"), "192.168.1.0/24");
    EXPECT_EQ(calculate_cidr("10.1.2.3", "255.255.0.0"), "10.1.0.0/16");
    EXPECT_EQ(calculate_cidr("172.16.5.9", "255.255.255.252"), "172.16.5.8/30");
}

TEST_F(SubnetTest, LooksVirtual) {
    EXPECT_TRUE(looks_virtual("docker0"));
    EXPECT_TRUE(looks_virtual("vEthernet (WSL)"));
    EXPECT_TRUE(looks_virtual("br-1234abcd"));
    EXPECT_TRUE(looks_virtual("tun0"));
    EXPECT_FALSE(looks_virtual("eth0"));
    EXPECT_FALSE(looks_virtual("wlp3s0"));
}

TEST_F(SubnetTest, SelectSubnetPrefersPhysical192168) {
    std::vector<NetworkInterface> ifs = {
        {"eth0", "10.0.0.5", "255.255.255.0", "10.0.0.0/24"},
        {"docker0", "192.168.99.1", "255.255.255.0", "192.168.99.0/24"},
        {"wlan0", "192.168.0.23", "255.255.255.0", "192.168.0.0/24"},
    };
    EXPECT_EQ(select_subnet(ifs), "192.168.0.0/24");
}

TEST_F(SubnetTest, SelectSubnetFallsBackToFirstInterface) {
    std::vector<NetworkInterface> ifs = {
        {"eth0", "10.0.0.5", "255.255.255.0", "10.0.0.0/24"},
        {"eth1", "172.16.0.5", "255.255.0.0", "172.16.0.0/16"},
    };
    EXPECT_EQ(select_subnet(ifs), "10.0.0.0/24");
}

TEST_F(SubnetTest, SelectSubnetHardcodedFallback) {
    EXPECT_EQ(select_subnet({}), "192.168.1.0/24");
}

TEST_F(SubnetTest, AutoDetectReturnsParseableCidr) {
    std::string subnet = auto_detect_subnet();
    EXPECT_NO_THROW(parse_cidr(subnet));
}

} // namespace net
} // namespace wiz_scan
