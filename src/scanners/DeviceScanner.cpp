#include "DeviceScanner.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include "../net/Subnet.h"
#include <algorithm>
#include <future>
#include <map>
#include <thread>

namespace wiz_scan {

struct DeviceScanner::PassState {
    std::mutex mutex;
    size_t total = 0;
    size_t hosts_scanned = 0;
    size_t devices_found = 0;
    std::vector<Device> results;
    std::map<std::string, size_t> result_index;
    std::vector<std::string> retired;
};

namespace {
struct ScanFlagGuard {
    std::atomic<bool>& flag;
    ~ScanFlagGuard(){ flag.store(false); }
};
}

DeviceScanner::DeviceScanner(DeviceRegistry& registry,
                             protocol::WizClient& client,
                             discovery::NeighborResolver& resolver,
                             const discovery::VendorClassifier& vendors,
                             ScannerSettings settings)
    : registry_(registry), client_(client), resolver_(resolver), vendors_(vendors),
      settings_(settings), detector_(net::auto_detect_subnet) {}

void DeviceScanner::on_progress(ProgressCallback callback){
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer_ = std::move(callback);
}

void DeviceScanner::clear_progress_observer(){
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer_ = nullptr;
}

std::vector<std::string> DeviceScanner::last_retired() const {
    std::lock_guard<std::mutex> lock(retired_mutex_);
    return last_retired_;
}

void DeviceScanner::set_subnet_detector(SubnetDetector detector){
    detector_ = detector ? std::move(detector) : SubnetDetector(net::auto_detect_subnet);
}

void DeviceScanner::emit(const ScanProgress& progress){
    ProgressCallback cb;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        cb = observer_;
    }
    if(!cb) return;
    try {
        cb(progress);
    } catch(const std::exception& ex){
        Logger::instance().warn(std::string("Progress observer failed: ") + ex.what());
    }
}

std::optional<Device> DeviceScanner::probe_host(const std::string& ip,
                                                const std::optional<std::string>& arp_mac,
                                                std::chrono::milliseconds timeout){
    auto response = client_.probe(ip, timeout);
    if(!response) return std::nullopt;
    protocol::PilotResult pilot = response->pilot();

    std::optional<nlohmann::json> sys_config;
    if(settings_.query_system_config) sys_config = client_.get_system_config(ip);
    if(settings_.query_model_config) client_.get_model_config(ip);

    std::optional<std::string> mac = arp_mac;
    if(!mac && pilot.mac) mac = utils::normalize_mac(*pilot.mac);
    if(!mac && sys_config){
        auto it = sys_config->find("mac");
        if(it != sys_config->end() && it->is_string()) mac = utils::normalize_mac(it->get<std::string>());
    }

    Device device;
    device.id = mac ? *mac : synthetic_device_id(ip);
    device.ip = ip;
    device.mac = mac;
    device.confidence = Confidence::High; // answered the control protocol
    if(mac){
        discovery::VendorVerdict verdict = vendors_.classify(mac);
        if(!verdict.is_known_vendor){
            device.confidence = Confidence::Medium;
            Logger::instance().debug(ip + ": unexpected vendor " + verdict.vendor_name.value_or("(unknown)") + " for " + *mac);
        }
    }
    device.last_seen = std::chrono::system_clock::now();
    device.rssi = pilot.rssi;
    device.state.power = pilot.state.value_or(false);
    device.state.brightness = pilot.dimming;
    device.state.color_temp = pilot.temp;
    device.state.scene_id = pilot.scene_id;
    if(sys_config){
        auto it = sys_config->find("moduleName");
        if(it != sys_config->end() && it->is_string()) device.model = it->get<std::string>();
    }
    return device;
}

void DeviceScanner::handle_host(const std::string& ip, const discovery::NeighborTable& arp,
                                std::chrono::milliseconds timeout, PassState& pass){
    std::optional<MergeResult> merged;
    try {
        std::optional<std::string> arp_mac;
        auto it = arp.find(ip);
        if(it != arp.end()) arp_mac = it->second;
        auto candidate = probe_host(ip, arp_mac, timeout);
        if(candidate) merged = registry_.merge(std::move(*candidate));
    } catch(const std::exception& ex){
        Logger::instance().debug("probe " + ip + " failed: " + ex.what());
    }

    std::lock_guard<std::mutex> lock(pass.mutex);
    ++pass.hosts_scanned;
    if(merged){
        for(const auto& old_id : merged->retired_ids) pass.retired.push_back(old_id);
    }
    if(merged && merged->outcome != MergeOutcome::Refreshed){
        if(merged->outcome == MergeOutcome::Inserted){
            ++pass.devices_found;
            Logger::instance().info("Discovered " + merged->device.id + " at " + ip + " (confidence " + confidence_name(merged->device.confidence) + ")");
        }
        auto idx = pass.result_index.find(merged->device.id);
        if(idx == pass.result_index.end()){
            pass.result_index[merged->device.id] = pass.results.size();
            pass.results.push_back(merged->device);
        } else {
            pass.results[idx->second] = merged->device;
        }
    }
    if(settings_.progress_interval && pass.hosts_scanned % settings_.progress_interval == 0){
        ScanProgress p;
        p.scanning = true;
        p.progress = pass.total ? (static_cast<double>(pass.hosts_scanned) / pass.total) * 100.0 : 100.0;
        p.current_host = ip;
        p.devices_found = pass.devices_found;
        p.hosts_scanned = pass.hosts_scanned;
        p.total_hosts = pass.total;
        p.retired_ids = pass.retired;
        emit(p);
    }
}

std::vector<Device> DeviceScanner::scan(const ScanOptions& options){
    bool expected = false;
    if(!scanning_.compare_exchange_strong(expected, true)) throw ScanInProgressError();
    ScanFlagGuard guard{scanning_};

    std::string subnet = options.subnet ? *options.subnet : detector_();
    size_t concurrency = static_cast<size_t>(std::max(1, options.concurrency.value_or(settings_.concurrency)));
    std::chrono::milliseconds timeout = options.timeout.value_or(settings_.timeout);

    net::parse_cidr(subnet);
    std::vector<std::string> hosts = net::enumerate_hosts(subnet);
    Logger::instance().info("Starting scan on " + subnet + " (" + std::to_string(hosts.size()) +
                            " hosts, concurrency " + std::to_string(concurrency) + ")");

    discovery::NeighborTable arp = resolver_.resolve_neighbor_table();

    {
        std::lock_guard<std::mutex> lock(retired_mutex_);
        last_retired_.clear();
    }
    PassState pass;
    pass.total = hosts.size();
    for(size_t start = 0; start < hosts.size(); start += concurrency){
        size_t end = std::min(hosts.size(), start + concurrency);
        std::vector<std::future<void>> batch;
        batch.reserve(end - start);
        for(size_t i = start; i < end; ++i){
            const std::string& ip = hosts[i];
            batch.push_back(std::async(std::launch::async, [this, &ip, &arp, timeout, &pass]{
                handle_host(ip, arp, timeout, pass);
            }));
        }
        for(auto& f : batch) f.get();
        if(end < hosts.size() && settings_.batch_delay.count() > 0) std::this_thread::sleep_for(settings_.batch_delay);
    }

    ScanProgress done;
    {
        std::lock_guard<std::mutex> lock(pass.mutex);
        done.scanning = false;
        done.progress = 100.0;
        done.devices_found = pass.devices_found;
        done.hosts_scanned = pass.hosts_scanned;
        done.total_hosts = pass.total;
        done.retired_ids = pass.retired;
    }
    {
        std::lock_guard<std::mutex> lock(retired_mutex_);
        last_retired_ = pass.retired;
    }
    Logger::instance().info("Scan complete. Found " + std::to_string(done.devices_found) + " new devices, " +
                            std::to_string(pass.results.size()) + " inserted or updated, " +
                            std::to_string(done.retired_ids.size()) + " synthetic ids retired");
    emit(done);
    return std::move(pass.results);
}

size_t DeviceScanner::refresh_devices(){
    std::vector<Device> devices = registry_.list();
    std::atomic<size_t> refreshed{0};
    size_t concurrency = static_cast<size_t>(std::max(1, settings_.concurrency));
    for(size_t start = 0; start < devices.size(); start += concurrency){
        size_t end = std::min(devices.size(), start + concurrency);
        std::vector<std::future<void>> batch;
        for(size_t i = start; i < end; ++i){
            const Device& d = devices[i];
            batch.push_back(std::async(std::launch::async, [this, &d, &refreshed]{
                auto state = client_.get_state(d.ip);
                if(!state) return;
                DevicePatch patch;
                patch.state = *state;
                if(registry_.update(d.id, patch)) ++refreshed;
            }));
        }
        for(auto& f : batch) f.get();
    }
    Logger::instance().debug("Refreshed " + std::to_string(refreshed.load()) + "/" + std::to_string(devices.size()) + " devices");
    return refreshed.load();
}

}
