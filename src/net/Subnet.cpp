#include "Subnet.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <bitset>
#include <cctype>
#include <sstream>

namespace wiz_scan {
namespace net {

static bool parse_octet(const std::string& part, uint32_t& out){
    if(part.empty() || part.size() > 3) return false;
    for(char c : part) if(!std::isdigit(static_cast<unsigned char>(c))) return false;
    if(part.size() > 1 && part[0] == '0') return false; // no leading zeros
    uint32_t v = static_cast<uint32_t>(std::stoul(part));
    if(v > 255) return false;
    out = v;
    return true;
}

bool is_valid_ipv4(const std::string& ip){
    auto parts = utils::split(ip, '.');
    if(parts.size() != 4) return false;
    uint32_t tmp = 0;
    for(const auto& p : parts) if(!parse_octet(p, tmp)) return false;
    return true;
}

uint32_t ip_to_integer(const std::string& ip){
    auto parts = utils::split(ip, '.');
    if(parts.size() != 4) throw InvalidAddressError("Invalid IPv4 address: " + ip);
    uint32_t value = 0;
    for(const auto& p : parts){
        uint32_t octet = 0;
        if(!parse_octet(p, octet)) throw InvalidAddressError("Invalid IPv4 address: " + ip);
        value = (value << 8) | octet;
    }
    return value;
}

std::string integer_to_ip(uint32_t value){
    std::ostringstream os;
    os << ((value >> 24) & 0xFF) << '.' << ((value >> 16) & 0xFF) << '.' << ((value >> 8) & 0xFF) << '.' << (value & 0xFF);
    return os.str();
}

CidrInfo parse_cidr(const std::string& cidr){
    auto slash = cidr.find('/');
    if(slash == std::string::npos || cidr.find('/', slash + 1) != std::string::npos)
        throw InvalidCidrError("Invalid CIDR notation: " + cidr);
    std::string addr = cidr.substr(0, slash);
    std::string prefix_str = cidr.substr(slash + 1);
    if(!is_valid_ipv4(addr)) throw InvalidCidrError("Invalid CIDR network address: " + cidr);
    long long prefix = -1;
    if(prefix_str.empty() || !std::isdigit(static_cast<unsigned char>(prefix_str[0])) || !utils::parse_int(prefix_str, prefix) || prefix < 0 || prefix > 32)
        throw InvalidCidrError("Invalid CIDR prefix: " + cidr);

    uint32_t mask = prefix == 0 ? 0u : static_cast<uint32_t>(0xFFFFFFFFull << (32 - prefix));
    uint32_t network = ip_to_integer(addr) & mask;
    uint64_t block = 1ull << (32 - prefix);

    CidrInfo info;
    info.network = integer_to_ip(network);
    info.prefix_length = static_cast<int>(prefix);
    info.total_hosts = block > 2 ? block - 2 : 0;
    if(info.total_hosts == 0){
        info.first_host = info.network;
        info.last_host = info.network;
    } else {
        info.first_host = integer_to_ip(network + 1);
        info.last_host = integer_to_ip(static_cast<uint32_t>(network + info.total_hosts));
    }
    return info;
}

std::vector<std::string> enumerate_hosts(const std::string& cidr){
    CidrInfo info = parse_cidr(cidr);
    if(info.total_hosts > kMaxEnumeratedHosts)
        throw SubnetTooLargeError("CIDR range too large (max /16): " + cidr);
    std::vector<std::string> hosts;
    if(info.total_hosts == 0) return hosts;
    hosts.reserve(static_cast<size_t>(info.total_hosts));
    uint32_t first = ip_to_integer(info.first_host);
    for(uint64_t i = 0; i < info.total_hosts; ++i) hosts.push_back(integer_to_ip(static_cast<uint32_t>(first + i)));
    return hosts;
}

std::string calculate_cidr(const std::string& ip, const std::string& netmask){
    uint32_t addr = ip_to_integer(ip);
    uint32_t mask = ip_to_integer(netmask);
    size_t prefix = std::bitset<32>(mask).count();
    return integer_to_ip(addr & mask) + "/" + std::to_string(prefix);
}

std::vector<NetworkInterface> get_local_interfaces(){
    std::vector<NetworkInterface> out;
    struct ifaddrs* list = nullptr;
    if(getifaddrs(&list) != 0){
        Logger::instance().warn("getifaddrs failed; no local interfaces available");
        return out;
    }
    for(struct ifaddrs* it = list; it; it = it->ifa_next){
        if(!it->ifa_addr || !it->ifa_netmask) continue;
        if(it->ifa_addr->sa_family != AF_INET) continue;
        if(it->ifa_flags & IFF_LOOPBACK) continue;
        char addr[INET_ADDRSTRLEN] = {0};
        char mask[INET_ADDRSTRLEN] = {0};
        auto* sin = reinterpret_cast<struct sockaddr_in*>(it->ifa_addr);
        auto* smask = reinterpret_cast<struct sockaddr_in*>(it->ifa_netmask);
        if(!inet_ntop(AF_INET, &sin->sin_addr, addr, sizeof(addr))) continue;
        if(!inet_ntop(AF_INET, &smask->sin_addr, mask, sizeof(mask))) continue;
        NetworkInterface ni;
        ni.name = it->ifa_name ? it->ifa_name : "";
        ni.address = addr;
        ni.netmask = mask;
        ni.cidr = calculate_cidr(ni.address, ni.netmask);
        out.push_back(std::move(ni));
    }
    freeifaddrs(list);
    return out;
}

bool looks_virtual(const std::string& interface_name){
    static const char* markers[] = {
        "virtual", "vethernet", "docker", "veth", "br-", "virbr", "vmnet", "vbox", "tun", "tap", "wg", "zt"
    };
    std::string lower = utils::to_lower(interface_name);
    for(const char* m : markers) if(lower.find(m) != std::string::npos) return true;
    return false;
}

std::string select_subnet(const std::vector<NetworkInterface>& interfaces){
    for(const auto& iface : interfaces){
        if(!looks_virtual(iface.name) && iface.address.rfind("192.168.", 0) == 0) return iface.cidr;
    }
    if(!interfaces.empty()) return interfaces.front().cidr;
    return kFallbackSubnet;
}

std::string auto_detect_subnet(){
    std::string subnet = select_subnet(get_local_interfaces());
    Logger::instance().debug("Auto-detected subnet: " + subnet);
    return subnet;
}

}
}
