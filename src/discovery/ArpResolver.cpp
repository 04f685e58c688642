#include "ArpResolver.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include "../net/Subnet.h"
#include <array>
#include <cstdio>
#include <memory>
#include <regex>
#include <sstream>
#include <sys/wait.h>

namespace wiz_scan {
namespace discovery {

static void add_entry(NeighborTable& table, const std::string& ip, const std::string& raw_mac){
    if(!net::is_valid_ipv4(ip)) return;
    auto mac = utils::normalize_mac(raw_mac);
    if(!mac || *mac == "00:00:00:00:00:00" || *mac == "ff:ff:ff:ff:ff:ff") return;
    table[ip] = *mac;
}

// IP address  HW type  Flags  HW address  Mask  Device
NeighborTable ProcNetArpResolver::parse(const std::string& content){
    NeighborTable table;
    std::istringstream in(content);
    std::string line;
    bool header = true;
    while(std::getline(in, line)){
        if(header){ header = false; continue; }
        std::istringstream fields(line);
        std::string ip, hw_type, flags, mac;
        if(!(fields >> ip >> hw_type >> flags >> mac)) continue;
        if(flags == "0x0") continue; // incomplete
        add_entry(table, ip, mac);
    }
    return table;
}

NeighborTable ProcNetArpResolver::resolve_neighbor_table(){
    auto content = utils::read_file(path_);
    if(!content){
        Logger::instance().warn("Failed to read ARP table: " + path_);
        return {};
    }
    NeighborTable table = parse(*content);
    Logger::instance().debug("ARP table: " + std::to_string(table.size()) + " entries");
    return table;
}

NeighborTable CommandArpResolver::parse(const std::string& output){
    // linux `arp -n`:  192.168.1.20  ether  a8:bb:50:01:02:03  C  wlan0
    // bsd `arp -a`:    ? (192.168.1.20) at a8:bb:50:1:2:3 on en0
    // windows:         192.168.1.20  a8-bb-50-01-02-03  dynamic
    static const std::regex re(R"((\d+\.\d+\.\d+\.\d+)\)?\s+(?:\S+\s+)?([0-9a-fA-F]{1,2}(?:[:-][0-9a-fA-F]{1,2}){5}))");
    NeighborTable table;
    std::istringstream in(output);
    std::string line;
    while(std::getline(in, line)){
        std::smatch m;
        if(std::regex_search(line, m, re)) add_entry(table, m[1].str(), m[2].str());
    }
    return table;
}

NeighborTable CommandArpResolver::resolve_neighbor_table(){
    std::string output;
    FILE* pipe = ::popen((command_ + " 2>/dev/null").c_str(), "r");
    if(!pipe){
        Logger::instance().warn("Failed to read ARP table: cannot run '" + command_ + "'");
        return {};
    }
    std::array<char, 512> buf{};
    size_t n;
    while((n = fread(buf.data(), 1, buf.size(), pipe)) > 0) output.append(buf.data(), n);
    int status = ::pclose(pipe);
    if(status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0){
        Logger::instance().warn("Failed to read ARP table: '" + command_ + "' exited with status " + std::to_string(status));
        return {};
    }
    NeighborTable table = parse(output);
    Logger::instance().debug("ARP table: " + std::to_string(table.size()) + " entries");
    return table;
}

}
}
