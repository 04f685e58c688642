#pragma once
#include "Device.h"
#include <chrono>
#include <string>
#include <vector>

namespace wiz_scan {

// Outcome of one CLI run: the pass (if any) plus the registry snapshot afterwards.
struct ScanReport {
    std::string subnet;                 // empty when no scan ran
    bool scanned = false;
    std::chrono::system_clock::time_point start_time{};
    std::chrono::system_clock::time_point end_time{};
    size_t hosts_scanned = 0;
    size_t total_hosts = 0;
    size_t devices_found = 0;           // newly inserted this pass
    std::vector<Device> discovered;     // inserted or replaced this pass
    std::vector<Device> known;          // registry contents
    std::vector<std::string> evicted;
    std::vector<std::string> retired;   // synthetic ids replaced by MAC ids this pass
};

}
