#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace wiz_scan {
namespace net {

constexpr uint64_t kMaxEnumeratedHosts = 65536;
constexpr const char* kFallbackSubnet = "192.168.1.0/24";

struct CidrInfo {
    std::string network;
    int prefix_length = 0;
    std::string first_host;
    std::string last_host;
    uint64_t total_hosts = 0; // network and broadcast excluded
};

struct NetworkInterface {
    std::string name;
    std::string address;
    std::string netmask;
    std::string cidr;
};

// Dotted quad <-> host-order integer, most significant octet first.
// ip_to_integer throws InvalidAddressError on malformed input.
uint32_t ip_to_integer(const std::string& ip);
std::string integer_to_ip(uint32_t value);
bool is_valid_ipv4(const std::string& ip);

// Throws InvalidCidrError.
CidrInfo parse_cidr(const std::string& cidr);
// Throws InvalidCidrError or SubnetTooLargeError.
std::vector<std::string> enumerate_hosts(const std::string& cidr);
std::string calculate_cidr(const std::string& ip, const std::string& netmask);

std::vector<NetworkInterface> get_local_interfaces();
bool looks_virtual(const std::string& interface_name);
std::string select_subnet(const std::vector<NetworkInterface>& interfaces);
std::string auto_detect_subnet();

}
}
