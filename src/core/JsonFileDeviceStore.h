#pragma once
#include "DeviceStore.h"
#include <map>
#include <mutex>

namespace wiz_scan {

// DeviceStore backed by a single JSON document on disk:
//   {"version":1, "devices":[...], "groups":[{"id":..,"name":..,"description":..,"devices":[..]}]}
// The whole document is rewritten (via a temp file + rename) on each mutation.
class JsonFileDeviceStore : public DeviceStore {
public:
    explicit JsonFileDeviceStore(std::string path);

    std::vector<Device> load_all_devices() override;
    void save_device(const Device& device) override;
    size_t delete_stale(std::chrono::milliseconds threshold) override;

    void add_device_to_group(const std::string& device_id, const std::string& group_id) override;
    bool remove_device_from_group(const std::string& device_id, const std::string& group_id) override;
    std::set<std::string> get_device_groups(const std::string& device_id) override;
    std::set<std::string> get_group_devices(const std::string& group_id) override;

    void upsert_group(const Group& group);
    std::vector<Group> groups();

    const std::string& path() const { return path_; }

private:
    void load_locked();
    void flush_locked();

    std::string path_;
    bool loaded_ = false;
    std::map<std::string, Device> devices_;
    std::map<std::string, Group> groups_;
    std::mutex mutex_;
};

}
