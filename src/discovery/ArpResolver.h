#pragma once
#include <map>
#include <string>

namespace wiz_scan {
namespace discovery {

// ip -> normalized mac
using NeighborTable = std::map<std::string, std::string>;

// Best-effort neighbour table snapshot. Implementations never throw; failures
// produce an empty table and a warning.
class NeighborResolver {
public:
    virtual ~NeighborResolver() = default;
    virtual NeighborTable resolve_neighbor_table() = 0;
};

// --arp none: scans run without MAC hints; identity comes from the lights themselves.
class NullNeighborResolver : public NeighborResolver {
public:
    NeighborTable resolve_neighbor_table() override { return {}; }
};

// Linux: reads /proc/net/arp
class ProcNetArpResolver : public NeighborResolver {
public:
    explicit ProcNetArpResolver(std::string path = "/proc/net/arp") : path_(std::move(path)) {}
    NeighborTable resolve_neighbor_table() override;
    static NeighborTable parse(const std::string& content);
private:
    std::string path_;
};

// Runs the platform arp command (`arp -n`, or `arp -a` output with dashed MACs)
class CommandArpResolver : public NeighborResolver {
public:
    explicit CommandArpResolver(std::string command = "arp -n") : command_(std::move(command)) {}
    NeighborTable resolve_neighbor_table() override;
    static NeighborTable parse(const std::string& output);
private:
    std::string command_;
};

}
}
