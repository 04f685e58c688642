#pragma once
#include <string>
#include <vector>
#include <optional>

namespace wiz_scan {

struct Config {
    // Scan
    std::string subnet;             // empty = auto-detect
    int concurrency = 20;           // probes per batch (5-50)
    int timeout_ms = 2000;          // per probe
    int batch_delay_ms = 10;        // pause between batches
    bool system_config = true;      // query getSystemConfig after a successful probe
    bool model_config = false;      // also query getModelConfig (logged at debug)
    std::string arp_source = "proc"; // proc | command | none
    std::string arp_command = "arp -n";
    std::string oui_file;           // IEEE oui.txt; empty = built-in table only
    bool identity_migration = true;
    // Registry / store
    std::string store_file;         // empty = in-memory only
    int stale_minutes = 5;
    // Modes
    bool list_only = false;         // print known devices, no scan
    bool list_interfaces = false;
    bool evict_stale = false;
    bool refresh = false;           // re-query known devices instead of sweeping
    // Output
    std::string output_file;
    bool pretty = false;
    bool compact = false;
    std::string log_level = "info";
    bool progress = false;          // progress line on stderr
    // Device control
    std::string target;             // device IP
    std::optional<bool> power;
    std::optional<int> brightness;
    std::optional<int> color_temp;
    std::vector<int> rgb;           // r,g,b
    std::optional<int> scene_id;
    std::optional<int> speed;
    bool get_state = false;
    bool get_system_config = false;
    // Groups
    std::string group;              // fan-out control target
    std::string group_add;
    std::string group_remove;
    std::string device_id;          // member for --group-add / --group-remove
    bool list_groups = false;

    bool has_control_action() const { return power || brightness || color_temp || !rgb.empty() || scene_id || speed; }
};

Config& config();
void set_config(const Config& c);

}
