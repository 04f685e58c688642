#pragma once
#include "../core/Device.h"
#include "../core/DeviceRegistry.h"
#include "../discovery/ArpResolver.h"
#include "../discovery/VendorClassifier.h"
#include "../protocol/WizClient.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wiz_scan {

struct ScanOptions {
    std::optional<std::string> subnet;
    std::optional<int> concurrency;
    std::optional<std::chrono::milliseconds> timeout;
};

struct ScanProgress {
    bool scanning = false;
    double progress = 0.0; // 0-100
    std::optional<std::string> current_host;
    size_t devices_found = 0;
    size_t hosts_scanned = 0;
    size_t total_hosts = 0;
    std::vector<std::string> retired_ids; // synthetic ids folded into MAC records so far this pass
};

struct ScannerSettings {
    int concurrency = 20;
    std::chrono::milliseconds timeout{2000};
    std::chrono::milliseconds batch_delay{10};
    size_t progress_interval = 10;
    bool query_system_config = true;  // MAC / model fallback after a successful probe
    bool query_model_config = false;
};

using ProgressCallback = std::function<void(const ScanProgress&)>;
using SubnetDetector = std::function<std::string()>;

// Drives scan passes over a subnet: ARP snapshot, batched concurrent probes,
// registry merge and progress reporting. At most one pass runs at a time.
class DeviceScanner {
public:
    DeviceScanner(DeviceRegistry& registry,
                  protocol::WizClient& client,
                  discovery::NeighborResolver& resolver,
                  const discovery::VendorClassifier& vendors,
                  ScannerSettings settings = {});

    // Returns devices inserted or replaced during this pass. Throws
    // ScanInProgressError, InvalidCidrError or SubnetTooLargeError before probing.
    std::vector<Device> scan(const ScanOptions& options = {});
    bool is_scanning() const { return scanning_.load(); }
    // Synthetic ids retired by identity migration during the most recent pass.
    std::vector<std::string> last_retired() const;

    // Single observer; invoked synchronously from scan workers, never concurrently.
    void on_progress(ProgressCallback callback);
    void clear_progress_observer();

    void set_subnet_detector(SubnetDetector detector);

    // Builds a candidate record for `ip`, or nullopt when nothing answered.
    std::optional<Device> probe_host(const std::string& ip,
                                     const std::optional<std::string>& arp_mac,
                                     std::chrono::milliseconds timeout);

    // Re-queries the state of every known device; returns how many answered.
    size_t refresh_devices();

    std::vector<Device> list_devices() const { return registry_.list(); }
    std::optional<Device> get_device(const std::string& id) const { return registry_.get(id); }
    bool update_device(const std::string& id, const DevicePatch& patch) { return registry_.update(id, patch); }
    std::vector<std::string> remove_stale_devices() { return registry_.remove_stale(); }

    const ScannerSettings& settings() const { return settings_; }

private:
    struct PassState;
    void handle_host(const std::string& ip, const discovery::NeighborTable& arp,
                     std::chrono::milliseconds timeout, PassState& pass);
    void emit(const ScanProgress& progress);

    DeviceRegistry& registry_;
    protocol::WizClient& client_;
    discovery::NeighborResolver& resolver_;
    const discovery::VendorClassifier& vendors_;
    ScannerSettings settings_;
    SubnetDetector detector_;
    std::atomic<bool> scanning_{false};
    std::mutex observer_mutex_;
    ProgressCallback observer_;
    mutable std::mutex retired_mutex_;
    std::vector<std::string> last_retired_;
};

}
