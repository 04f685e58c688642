#include "core/ArgumentParser.h"
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/DeviceRegistry.h"
#include "core/Errors.h"
#include "core/JSONWriter.h"
#include "core/JsonFileDeviceStore.h"
#include "core/Logging.h"
#include "core/Report.h"
#include "control/GroupController.h"
#include "discovery/ArpResolver.h"
#include "discovery/VendorClassifier.h"
#include "net/Subnet.h"
#include "protocol/UdpTransport.h"
#include "protocol/WizClient.h"
#include "scanners/DeviceScanner.h"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>

using namespace wiz_scan;

namespace {

constexpr int kExitUsage = 2;
constexpr int kExitScanSetup = 3;
constexpr int kExitControlFailed = 4;

int emit(const std::string& text, const Config& cfg) {
    if(cfg.output_file.empty()) { std::cout << text; return 0; }
    std::ofstream ofs(cfg.output_file);
    if(!ofs) { std::cerr << "Cannot open output file: " << cfg.output_file << "\n"; return kExitUsage; }
    ofs << text;
    return 0;
}

StatePatch patch_from_config(const Config& cfg) {
    StatePatch patch;
    patch.power = cfg.power;
    patch.brightness = cfg.brightness;
    patch.color_temp = cfg.color_temp;
    if(cfg.rgb.size() == 3) patch.rgb = Rgb{cfg.rgb[0], cfg.rgb[1], cfg.rgb[2]};
    patch.speed = cfg.speed;
    return patch;
}

std::unique_ptr<discovery::NeighborResolver> make_resolver(const Config& cfg) {
    if(cfg.arp_source == "command") return std::make_unique<discovery::CommandArpResolver>(cfg.arp_command);
    if(cfg.arp_source == "none") return std::make_unique<discovery::NullNeighborResolver>();
    return std::make_unique<discovery::ProcNetArpResolver>();
}

int run_device_control(const Config& cfg, protocol::WizClient& client, const JSONWriter& writer) {
    const std::string& ip = cfg.target;
    if(cfg.get_state) {
        auto state = client.get_state(ip);
        if(!state) { std::cerr << "No state reply from " << ip << "\n"; return kExitControlFailed; }
        return emit(writer.write_state(ip, *state, cfg), cfg);
    }
    if(cfg.get_system_config) {
        auto sys = client.get_system_config(ip);
        if(!sys) { std::cerr << "No system config reply from " << ip << "\n"; return kExitControlFailed; }
        nlohmann::json doc = {{"ip", ip}, {"systemConfig", *sys}};
        return emit(writer.write_document(doc, cfg), cfg);
    }
    bool ok = false;
    if(cfg.scene_id) ok = client.set_scene(ip, *cfg.scene_id, cfg.speed.value_or(100));
    else ok = client.set_state(ip, patch_from_config(cfg));
    if(!ok) { std::cerr << "Device " << ip << " did not accept the command\n"; return kExitControlFailed; }
    Logger::instance().info("Command applied to " + ip);
    return 0;
}

int run_group_control(const Config& cfg, GroupController& groups, const JSONWriter& writer) {
    GroupControlResult r;
    if(cfg.scene_id) r = groups.set_scene(cfg.group, *cfg.scene_id, cfg.speed.value_or(100));
    else {
        StatePatch patch = patch_from_config(cfg);
        if(patch.power && !patch.brightness && !patch.color_temp && !patch.rgb && !patch.speed) r = groups.set_power(cfg.group, *patch.power);
        else r = groups.set_state(cfg.group, patch);
    }
    nlohmann::json doc = {{"group", cfg.group}, {"total", r.total}, {"successes", r.successes}, {"failures", r.failures}};
    int rc = emit(writer.write_document(doc, cfg), cfg);
    if(rc != 0) return rc;
    return (r.total > 0 && r.successes == 0) ? kExitControlFailed : 0;
}

int run_group_membership(const Config& cfg, JsonFileDeviceStore& store) {
    if(!cfg.group_add.empty()) {
        store.add_device_to_group(cfg.device_id, cfg.group_add);
        Logger::instance().info("Added " + cfg.device_id + " to group " + cfg.group_add);
    }
    if(!cfg.group_remove.empty()) {
        if(!store.remove_device_from_group(cfg.device_id, cfg.group_remove)) {
            std::cerr << cfg.device_id << " is not a member of group " << cfg.group_remove << "\n";
            return kExitControlFailed;
        }
        Logger::instance().info("Removed " + cfg.device_id + " from group " + cfg.group_remove);
    }
    return 0;
}

int run_list_groups(const Config& cfg, JsonFileDeviceStore& store, const JSONWriter& writer) {
    nlohmann::json arr = nlohmann::json::array();
    for(const auto& g : store.groups()) {
        arr.push_back({{"id", g.id}, {"name", g.name}, {"description", g.description}, {"devices", g.devices}});
    }
    return emit(writer.write_document(nlohmann::json{{"groups", arr}}, cfg), cfg);
}

int run_list_interfaces(const Config& cfg, const JSONWriter& writer) {
    auto interfaces = net::get_local_interfaces();
    nlohmann::json arr = nlohmann::json::array();
    for(const auto& i : interfaces) {
        arr.push_back({{"name", i.name}, {"address", i.address}, {"netmask", i.netmask}, {"cidr", i.cidr}, {"virtual", net::looks_virtual(i.name)}});
    }
    nlohmann::json doc = {{"interfaces", arr}, {"selected", net::select_subnet(interfaces)}};
    return emit(writer.write_document(doc, cfg), cfg);
}

void print_progress(const ScanProgress& p) {
    std::cerr << "\r[" << std::fixed << std::setprecision(1) << std::setw(5) << p.progress << "%] "
              << p.hosts_scanned << "/" << p.total_hosts << " hosts, "
              << p.devices_found << " found";
    if(!p.scanning) std::cerr << "\n";
    std::cerr.flush();
}

}

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    Config parsed;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, parsed)) return parser.exit_code();

    ConfigValidator validator;
    if(!validator.validate(parsed)) return kExitUsage;
    set_config(parsed);
    const Config& cfg = config();
    LogLevel lvl = LogLevel::Info;
    parse_log_level(cfg.log_level, lvl);
    Logger::instance().set_level(lvl);

    JSONWriter writer;
    if(cfg.list_interfaces) return run_list_interfaces(cfg, writer);

    std::unique_ptr<JsonFileDeviceStore> store;
    if(!cfg.store_file.empty()) store = std::make_unique<JsonFileDeviceStore>(cfg.store_file);

    try {
        if(!cfg.group_add.empty() || !cfg.group_remove.empty()) return run_group_membership(cfg, *store);
        if(cfg.list_groups) return run_list_groups(cfg, *store, writer);
    } catch(const StoreError& ex) {
        std::cerr << ex.what() << "\n";
        return kExitScanSetup;
    }

    RegistryOptions options;
    options.stale_threshold = std::chrono::minutes(cfg.stale_minutes);
    options.migrate_ip_identity = cfg.identity_migration;
    DeviceRegistry registry(store.get(), options);

    protocol::UdpTransport transport;
    protocol::WizClient client(transport);

    try {
        if(!cfg.target.empty()) return run_device_control(cfg, client, writer);
        if(!cfg.group.empty()) {
            GroupController groups(registry, client, *store);
            return run_group_control(cfg, groups, writer);
        }
    } catch(const FatalError& ex) {
        Logger::instance().error(ex.what());
        return kExitControlFailed;
    }

    ScanReport report;
    if(cfg.evict_stale) {
        report.evicted = registry.remove_stale(std::chrono::minutes(cfg.stale_minutes));
        Logger::instance().info("Evicted " + std::to_string(report.evicted.size()) + " stale devices");
    }

    if(!cfg.list_only && !cfg.evict_stale) {
        discovery::VendorClassifier vendors;
        if(!cfg.oui_file.empty()) {
            size_t n = vendors.load_ieee_file(cfg.oui_file);
            if(n == 0) Logger::instance().warn("No OUI entries read from " + cfg.oui_file);
        }
        auto resolver = make_resolver(cfg);

        ScannerSettings settings;
        settings.concurrency = cfg.concurrency;
        settings.timeout = std::chrono::milliseconds(cfg.timeout_ms);
        settings.batch_delay = std::chrono::milliseconds(cfg.batch_delay_ms);
        settings.query_system_config = cfg.system_config;
        settings.query_model_config = cfg.model_config;
        DeviceScanner scanner(registry, client, *resolver, vendors, settings);
        scanner.on_progress([&report, progress = cfg.progress](const ScanProgress& p) {
            if(progress) print_progress(p);
            report.hosts_scanned = p.hosts_scanned;
            report.total_hosts = p.total_hosts;
            report.devices_found = p.devices_found;
        });

        if(cfg.refresh) {
            size_t n = scanner.refresh_devices();
            Logger::instance().info("Refreshed " + std::to_string(n) + " of " + std::to_string(registry.size()) + " known devices");
            report.known = registry.list();
            return emit(writer.write(report, cfg), cfg);
        }

        ScanOptions scan_options;
        report.subnet = cfg.subnet.empty() ? net::auto_detect_subnet() : cfg.subnet;
        scan_options.subnet = report.subnet;
        report.start_time = std::chrono::system_clock::now();
        try {
            report.discovered = scanner.scan(scan_options);
        } catch(const WizError& ex) {
            Logger::instance().error(std::string("Scan failed: ") + ex.what());
            return kExitScanSetup;
        }
        report.end_time = std::chrono::system_clock::now();
        report.scanned = true;
        report.retired = scanner.last_retired();
    }

    report.known = registry.list();
    return emit(writer.write(report, cfg), cfg);
}
