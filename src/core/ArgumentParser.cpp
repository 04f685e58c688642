#include "ArgumentParser.h"
#include "Utils.h"
#include "BuildInfo.h" // configured header (CMake adds generated dir to include path)
#include <iostream>
#include <limits>

namespace wiz_scan {

bool ArgumentParser::need_int(const std::string& v, const char* flag, int& out) {
    long long n = 0;
    if(!utils::parse_int(v, n) || n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
        std::cerr << "Invalid integer for " << flag << "\n";
        return false;
    }
    out = static_cast<int>(n);
    return true;
}

ArgumentParser::ArgumentParser() {
    specs_ = {
        // scanning
        {"--subnet", ArgKind::String, "CIDR", "Subnet to scan (default: auto-detect)",
            [](const std::string& v, Config& c){ c.subnet = v; return true; }},
        {"--concurrency", ArgKind::Int, "N", "Probes per batch (5-50, default 20)",
            [](const std::string& v, Config& c){ return need_int(v, "--concurrency", c.concurrency); }},
        {"--timeout", ArgKind::Int, "MS", "Per-probe timeout in milliseconds (default 2000)",
            [](const std::string& v, Config& c){ return need_int(v, "--timeout", c.timeout_ms); }},
        {"--batch-delay", ArgKind::Int, "MS", "Pause between batches (default 10)",
            [](const std::string& v, Config& c){ return need_int(v, "--batch-delay", c.batch_delay_ms); }},
        {"--no-system-config", ArgKind::None, nullptr, "Skip getSystemConfig enrichment",
            [](const std::string&, Config& c){ c.system_config = false; return true; }},
        {"--model-config", ArgKind::None, nullptr, "Also query getModelConfig",
            [](const std::string&, Config& c){ c.model_config = true; return true; }},
        {"--arp", ArgKind::String, "proc|command|none", "Neighbor table source (default proc)",
            [](const std::string& v, Config& c){ c.arp_source = v; return true; }},
        {"--arp-command", ArgKind::String, "CMD", "Command used with --arp command (default 'arp -n')",
            [](const std::string& v, Config& c){ c.arp_command = v; return true; }},
        {"--oui-file", ArgKind::String, "FILE", "IEEE oui.txt to extend the vendor table",
            [](const std::string& v, Config& c){ c.oui_file = v; return true; }},
        {"--no-identity-migration", ArgKind::None, nullptr, "Keep ip- ids when a MAC appears later",
            [](const std::string&, Config& c){ c.identity_migration = false; return true; }},
        {"--progress", ArgKind::None, nullptr, "Print scan progress to stderr",
            [](const std::string&, Config& c){ c.progress = true; return true; }},
        // registry
        {"--store", ArgKind::String, "FILE", "Persist devices and groups in FILE",
            [](const std::string& v, Config& c){ c.store_file = v; return true; }},
        {"--list", ArgKind::None, nullptr, "Print known devices without scanning",
            [](const std::string&, Config& c){ c.list_only = true; return true; }},
        {"--refresh", ArgKind::None, nullptr, "Re-query the state of known devices without sweeping",
            [](const std::string&, Config& c){ c.refresh = true; return true; }},
        {"--interfaces", ArgKind::None, nullptr, "Print local IPv4 interfaces and exit",
            [](const std::string&, Config& c){ c.list_interfaces = true; return true; }},
        {"--evict-stale", ArgKind::OptionalInt, "[MINUTES]", "Drop devices not seen recently (default 5)",
            [](const std::string& v, Config& c){ c.evict_stale = true; return v.empty() || need_int(v, "--evict-stale", c.stale_minutes); }},
        // output
        {"--output", ArgKind::String, "FILE", "Write JSON to FILE (default stdout)",
            [](const std::string& v, Config& c){ c.output_file = v; return true; }},
        {"--pretty", ArgKind::None, nullptr, "Pretty-print JSON",
            [](const std::string&, Config& c){ c.pretty = true; return true; }},
        {"--compact", ArgKind::None, nullptr, "Minified JSON output",
            [](const std::string&, Config& c){ c.compact = true; return true; }},
        {"--log-level", ArgKind::String, "LEVEL", "error|warn|info|debug|trace",
            [](const std::string& v, Config& c){ c.log_level = v; return true; }},
        {"--verbose", ArgKind::None, nullptr, "Same as --log-level debug",
            [](const std::string&, Config& c){ c.log_level = "debug"; return true; }},
        {"--quiet", ArgKind::None, nullptr, "Same as --log-level error",
            [](const std::string&, Config& c){ c.log_level = "error"; return true; }},
        // device control
        {"--target", ArgKind::String, "IP", "Device to control or query",
            [](const std::string& v, Config& c){ c.target = v; return true; }},
        {"--power", ArgKind::String, "on|off", "Switch the light on or off",
            [](const std::string& v, Config& c){
                std::string s = utils::to_lower(v);
                if(s=="on" || s=="true" || s=="1") { c.power = true; return true; }
                if(s=="off" || s=="false" || s=="0") { c.power = false; return true; }
                std::cerr << "Invalid value for --power: " << v << "\n";
                return false; }},
        {"--brightness", ArgKind::Int, "N", "Brightness percent (10-100)",
            [](const std::string& v, Config& c){ int n=0; if(!need_int(v, "--brightness", n)) return false; c.brightness = n; return true; }},
        {"--temp", ArgKind::Int, "K", "White color temperature (2200-6500)",
            [](const std::string& v, Config& c){ int n=0; if(!need_int(v, "--temp", n)) return false; c.color_temp = n; return true; }},
        {"--rgb", ArgKind::CSV, "R,G,B", "RGB color, each channel 0-255",
            [](const std::string& v, Config& c){
                c.rgb.clear();
                for(const auto& part : utils::split_csv(v)) { int n=0; if(!need_int(utils::trim(part), "--rgb", n)) return false; c.rgb.push_back(n); }
                return true; }},
        {"--scene", ArgKind::Int, "ID", "Activate a built-in scene",
            [](const std::string& v, Config& c){ int n=0; if(!need_int(v, "--scene", n)) return false; c.scene_id = n; return true; }},
        {"--speed", ArgKind::Int, "N", "Dynamic scene speed (0-200)",
            [](const std::string& v, Config& c){ int n=0; if(!need_int(v, "--speed", n)) return false; c.speed = n; return true; }},
        {"--get-state", ArgKind::None, nullptr, "Print the device's current state",
            [](const std::string&, Config& c){ c.get_state = true; return true; }},
        {"--system-config", ArgKind::None, nullptr, "Print the device's system configuration",
            [](const std::string&, Config& c){ c.get_system_config = true; return true; }},
        // groups
        {"--group", ArgKind::String, "ID", "Apply control flags to every member of a group",
            [](const std::string& v, Config& c){ c.group = v; return true; }},
        {"--group-add", ArgKind::String, "ID", "Add --device to group ID",
            [](const std::string& v, Config& c){ c.group_add = v; return true; }},
        {"--group-remove", ArgKind::String, "ID", "Remove --device from group ID",
            [](const std::string& v, Config& c){ c.group_remove = v; return true; }},
        {"--device", ArgKind::String, "ID", "Device id for group membership changes",
            [](const std::string& v, Config& c){ c.device_id = v; return true; }},
        {"--list-groups", ArgKind::None, nullptr, "Print stored groups",
            [](const std::string&, Config& c){ c.list_groups = true; return true; }},
    };
}

const ArgumentParser::FlagSpec* ArgumentParser::find_spec(const std::string& flag) const {
    for(const auto& s : specs_) if(flag == s.name) return &s;
    return nullptr;
}

void ArgumentParser::print_help() const {
    std::cout << "wiz-scan options:\n";
    for(const auto& s : specs_) {
        std::string name = s.name;
        if(s.value_hint) { name += ' '; name += s.value_hint; }
        std::cout << "  " << name;
        if(name.size() < 30) for(size_t i=name.size(); i<30; ++i) std::cout << ' '; else std::cout << ' ';
        std::cout << s.help << "\n";
    }
    std::cout << "  --version                     Print version & exit\n";
    std::cout << "  --help                        Show this help\n";
}

void ArgumentParser::print_version() {
    std::cout << "wiz-scan " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT
              << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
              << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg) {
    exit_code_ = 0;
    for(int i=1; i<argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        if(a == "--help") { print_help(); return false; }
        if(a == "--version") { print_version(); return false; }
        const FlagSpec* spec = find_spec(a);
        if(!spec) { std::cerr << "Unknown arg: " << a << "\n"; exit_code_ = 2; return false; }
        std::string val;
        switch(spec->kind) {
            case ArgKind::None: break;
            case ArgKind::String: case ArgKind::Int: case ArgKind::CSV: {
                if(i+1 >= argc || !argv[i+1]) { std::cerr << "Missing value for " << a << "\n"; exit_code_ = 2; return false; }
                val = argv[++i];
                break;
            }
            case ArgKind::OptionalInt: {
                if(i+1 < argc && argv[i+1] && argv[i+1][0] != '-' && argv[i+1][0] != '\0') val = argv[++i];
                break;
            }
        }
        if(!spec->apply(val, cfg)) { exit_code_ = 2; return false; }
    }
    return true;
}

}
