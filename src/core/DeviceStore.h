#pragma once
#include "Device.h"
#include <chrono>
#include <set>
#include <string>
#include <vector>

namespace wiz_scan {

// Persistence collaborator. Implementations serialize their own writes and may
// throw StoreError; callers treat every call as best-effort.
class DeviceStore {
public:
    virtual ~DeviceStore() = default;

    virtual std::vector<Device> load_all_devices() = 0;
    virtual void save_device(const Device& device) = 0; // upsert by id
    virtual size_t delete_stale(std::chrono::milliseconds threshold) = 0;

    virtual void add_device_to_group(const std::string& device_id, const std::string& group_id) = 0;
    virtual bool remove_device_from_group(const std::string& device_id, const std::string& group_id) = 0;
    virtual std::set<std::string> get_device_groups(const std::string& device_id) = 0;
    virtual std::set<std::string> get_group_devices(const std::string& group_id) = 0;
};

}
