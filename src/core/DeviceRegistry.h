#pragma once
#include "Device.h"
#include "DeviceStore.h"
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wiz_scan {

enum class MergeOutcome { Inserted, Replaced, Refreshed };

struct MergeResult {
    MergeOutcome outcome = MergeOutcome::Inserted;
    Device device;                          // record as stored after the merge
    std::vector<std::string> retired_ids;   // synthetic ids folded into `device`
};

struct RegistryOptions {
    std::chrono::milliseconds stale_threshold{std::chrono::minutes(5)};
    // Fold an "ip-<addr>" record into the MAC-identified record for the same
    // address once the MAC becomes known. When false both records coexist
    // until the synthetic one goes stale.
    bool migrate_ip_identity = true;
};

// Authoritative in-memory view of known devices. All mutations are serialized;
// reads return snapshots. Persistence happens after the in-memory mutation and
// its failures are logged, never propagated.
class DeviceRegistry {
public:
    using TimePoint = std::chrono::system_clock::time_point;
    using Clock = std::function<TimePoint()>;

    explicit DeviceRegistry(DeviceStore* store = nullptr, RegistryOptions options = {}, Clock clock = {});

    MergeResult merge(Device candidate);

    std::vector<Device> list() const;
    std::optional<Device> get(const std::string& id) const;
    // Shallow merge of the present patch fields; refreshes last_seen. False if unknown id.
    bool update(const std::string& id, const DevicePatch& patch);

    std::vector<std::string> remove_stale();
    std::vector<std::string> remove_stale(std::chrono::milliseconds threshold);

    size_t size() const;
    const RegistryOptions& options() const { return options_; }

    static int count_features(const Device& d);
    static bool should_replace(const Device& existing, const Device& candidate);
    static Device merge_records(const Device& existing, const Device& candidate, TimePoint now);

private:
    size_t load();
    TimePoint now_after(const Device* existing) const;
    void persist(const Device& d) const;
    void migrate_group_membership(const std::string& from, const std::string& to) const;
    void attach_groups(Device& d) const;

    DeviceStore* store_;
    RegistryOptions options_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::map<std::string, Device> devices_;
};

const char* merge_outcome_name(MergeOutcome o);

}
