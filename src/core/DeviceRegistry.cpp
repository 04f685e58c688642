#include "DeviceRegistry.h"
#include "Logging.h"
#include <algorithm>

namespace wiz_scan {

const char* merge_outcome_name(MergeOutcome o){
    switch(o){
        case MergeOutcome::Inserted: return "inserted";
        case MergeOutcome::Replaced: return "replaced";
        case MergeOutcome::Refreshed: return "refreshed";
    }
    return "";
}

DeviceRegistry::DeviceRegistry(DeviceStore* store, RegistryOptions options, Clock clock)
    : store_(store), options_(options), clock_(std::move(clock)) {
    if(!clock_) clock_ = []{ return std::chrono::system_clock::now(); };
    load();
}

size_t DeviceRegistry::load(){
    if(!store_) return 0;
    std::vector<Device> stored;
    try {
        stored = store_->load_all_devices();
    } catch(const std::exception& ex){
        Logger::instance().error(std::string("Error loading devices from store: ") + ex.what());
        return 0;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for(auto& d : stored){
        if(d.id.empty()) continue;
        d.state = d.state.clamped();
        d.groups.clear();
        devices_[d.id] = std::move(d);
    }
    Logger::instance().info("Loaded " + std::to_string(devices_.size()) + " devices from store");
    return devices_.size();
}

int DeviceRegistry::count_features(const Device& d){
    int count = 0;
    if(d.mac) ++count;
    if(d.rssi) ++count;
    if(d.state.brightness) ++count;
    if(d.state.color_temp) ++count;
    if(d.state.scene_id) ++count;
    ++count; // power is always reported
    return count;
}

bool DeviceRegistry::should_replace(const Device& existing, const Device& candidate){
    if(count_features(candidate) > count_features(existing)) return true;
    return confidence_rank(candidate.confidence) > confidence_rank(existing.confidence);
}

template<typename T>
static std::optional<T> prefer(const std::optional<T>& candidate, const std::optional<T>& existing){
    return candidate ? candidate : existing;
}

Device DeviceRegistry::merge_records(const Device& existing, const Device& candidate, TimePoint now){
    Device merged;
    merged.id = existing.id;
    merged.ip = candidate.ip.empty() ? existing.ip : candidate.ip;
    merged.mac = prefer(candidate.mac, existing.mac);
    merged.name = prefer(candidate.name, existing.name);
    merged.model = prefer(candidate.model, existing.model);
    merged.confidence = (candidate.confidence == Confidence::High || existing.confidence == Confidence::High)
                            ? Confidence::High : existing.confidence;
    merged.rssi = prefer(candidate.rssi, existing.rssi);
    merged.state.power = candidate.state.power;
    merged.state.brightness = prefer(candidate.state.brightness, existing.state.brightness);
    merged.state.color_temp = prefer(candidate.state.color_temp, existing.state.color_temp);
    merged.state.scene_id = prefer(candidate.state.scene_id, existing.state.scene_id);
    merged.state.rgb = prefer(candidate.state.rgb, existing.state.rgb);
    merged.state.speed = prefer(candidate.state.speed, existing.state.speed);
    merged.last_seen = now;
    return merged;
}

DeviceRegistry::TimePoint DeviceRegistry::now_after(const Device* existing) const {
    TimePoint now = clock_();
    if(existing && existing->last_seen > now) return existing->last_seen;
    return now;
}

MergeResult DeviceRegistry::merge(Device candidate){
    MergeResult result;
    candidate.state = candidate.state.clamped();
    candidate.groups.clear();
    {
        std::lock_guard<std::mutex> lock(mutex_);

        bool migrated = false;
        if(options_.migrate_ip_identity && candidate.mac && !is_synthetic_id(candidate.id) && !candidate.ip.empty()){
            auto syn = devices_.find(synthetic_device_id(candidate.ip));
            if(syn != devices_.end()){
                Device old = std::move(syn->second);
                devices_.erase(syn);
                result.retired_ids.push_back(old.id);
                migrated = true;
                if(devices_.find(candidate.id) == devices_.end()){
                    old.id = candidate.id;
                    devices_[candidate.id] = std::move(old);
                }
            }
        }

        auto it = devices_.find(candidate.id);
        if(it == devices_.end()){
            candidate.last_seen = now_after(nullptr);
            result.outcome = MergeOutcome::Inserted;
            result.device = candidate;
            devices_[candidate.id] = std::move(candidate);
        } else if(migrated || should_replace(it->second, candidate)){
            // a folded record always takes the candidate's identity fields
            it->second = merge_records(it->second, candidate, now_after(&it->second));
            result.outcome = MergeOutcome::Replaced;
            result.device = it->second;
        } else {
            it->second.last_seen = now_after(&it->second);
            result.outcome = MergeOutcome::Refreshed;
            result.device = it->second;
        }
    }

    for(const auto& old_id : result.retired_ids){
        Logger::instance().info("Device " + old_id + " identified as " + result.device.id);
        migrate_group_membership(old_id, result.device.id);
    }
    persist(result.device);
    return result;
}

void DeviceRegistry::persist(const Device& d) const {
    if(!store_) return;
    try {
        store_->save_device(d);
    } catch(const std::exception& ex){
        Logger::instance().error("Error saving device " + d.id + " to store: " + ex.what());
    }
}

void DeviceRegistry::migrate_group_membership(const std::string& from, const std::string& to) const {
    if(!store_) return;
    try {
        for(const auto& group : store_->get_device_groups(from)){
            store_->add_device_to_group(to, group);
            store_->remove_device_from_group(from, group);
        }
    } catch(const std::exception& ex){
        Logger::instance().error("Error moving group membership of " + from + ": " + ex.what());
    }
}

void DeviceRegistry::attach_groups(Device& d) const {
    if(!store_) return;
    try {
        d.groups = store_->get_device_groups(d.id);
    } catch(const std::exception& ex){
        Logger::instance().warn("Error reading groups of " + d.id + ": " + ex.what());
    }
}

std::vector<Device> DeviceRegistry::list() const {
    std::vector<Device> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(devices_.size());
        for(const auto& kv : devices_) out.push_back(kv.second);
    }
    for(auto& d : out) attach_groups(d);
    return out;
}

std::optional<Device> DeviceRegistry::get(const std::string& id) const {
    Device copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(id);
        if(it == devices_.end()) return std::nullopt;
        copy = it->second;
    }
    attach_groups(copy);
    return copy;
}

bool DeviceRegistry::update(const std::string& id, const DevicePatch& patch){
    Device snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(id);
        if(it == devices_.end()) return false;
        Device& d = it->second;
        if(patch.ip) d.ip = *patch.ip;
        if(patch.mac) d.mac = *patch.mac;
        if(patch.name) d.name = *patch.name;
        if(patch.model) d.model = *patch.model;
        if(patch.rssi) d.rssi = *patch.rssi;
        if(patch.state) d.state = patch.state->clamped();
        d.last_seen = now_after(&d);
        snapshot = d;
    }
    persist(snapshot);
    return true;
}

std::vector<std::string> DeviceRegistry::remove_stale(){
    return remove_stale(options_.stale_threshold);
}

std::vector<std::string> DeviceRegistry::remove_stale(std::chrono::milliseconds threshold){
    std::vector<std::string> removed;
    TimePoint cutoff = clock_() - threshold;
    std::lock_guard<std::mutex> lock(mutex_);
    for(auto it = devices_.begin(); it != devices_.end();){
        if(it->second.last_seen < cutoff){
            removed.push_back(it->first);
            it = devices_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

}
