#include "JsonFileDeviceStore.h"
#include "Errors.h"
#include "Logging.h"
#include "Utils.h"
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace wiz_scan {

JsonFileDeviceStore::JsonFileDeviceStore(std::string path) : path_(std::move(path)) {}

void JsonFileDeviceStore::load_locked(){
    if(loaded_) return;
    auto content = utils::read_file(path_);
    loaded_ = true;
    if(!content || utils::trim(*content).empty()) return; // fresh store
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(*content);
    } catch(const nlohmann::json::exception& ex){
        throw StoreError("Corrupt device store " + path_ + ": " + ex.what());
    }
    try {
        if(doc.contains("devices")){
            for(const auto& jd : doc["devices"]){
                Device d = jd.get<Device>();
                d.groups.clear();
                devices_[d.id] = std::move(d);
            }
        }
        if(doc.contains("groups")){
            for(const auto& jg : doc["groups"]){
                Group g;
                g.id = jg.at("id").get<std::string>();
                g.name = jg.value("name", g.id);
                g.description = jg.value("description", std::string());
                if(jg.contains("devices")) g.devices = jg["devices"].get<std::set<std::string>>();
                groups_[g.id] = std::move(g);
            }
        }
    } catch(const std::exception& ex){
        throw StoreError("Invalid record in device store " + path_ + ": " + ex.what());
    }
}

void JsonFileDeviceStore::flush_locked(){
    nlohmann::json doc;
    doc["version"] = 1;
    doc["devices"] = nlohmann::json::array();
    for(const auto& kv : devices_) doc["devices"].push_back(kv.second);
    doc["groups"] = nlohmann::json::array();
    for(const auto& kv : groups_){
        const Group& g = kv.second;
        doc["groups"].push_back({{"id", g.id}, {"name", g.name}, {"description", g.description}, {"devices", g.devices}});
    }

    fs::path target(path_);
    std::error_code ec;
    if(target.has_parent_path()) fs::create_directories(target.parent_path(), ec);
    std::string tmp = path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if(!ofs) throw StoreError("Cannot write device store " + tmp);
        ofs << doc.dump(2) << '\n';
        if(!ofs) throw StoreError("Short write on device store " + tmp);
    }
    if(std::rename(tmp.c_str(), path_.c_str()) != 0) throw StoreError("Cannot replace device store " + path_);
}

std::vector<Device> JsonFileDeviceStore::load_all_devices(){
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();
    std::vector<Device> out;
    out.reserve(devices_.size());
    for(const auto& kv : devices_) out.push_back(kv.second);
    return out;
}

void JsonFileDeviceStore::save_device(const Device& device){
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();
    Device copy = device;
    copy.groups.clear(); // membership lives in groups_
    devices_[copy.id] = std::move(copy);
    flush_locked();
}

size_t JsonFileDeviceStore::delete_stale(std::chrono::milliseconds threshold){
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();
    auto cutoff = std::chrono::system_clock::now() - threshold;
    size_t removed = 0;
    for(auto it = devices_.begin(); it != devices_.end();){
        if(it->second.last_seen < cutoff){
            for(auto& g : groups_) g.second.devices.erase(it->first);
            it = devices_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if(removed) flush_locked();
    return removed;
}

void JsonFileDeviceStore::add_device_to_group(const std::string& device_id, const std::string& group_id){
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();
    Group& g = groups_[group_id];
    if(g.id.empty()){ g.id = group_id; g.name = group_id; }
    g.devices.insert(device_id);
    flush_locked();
}

bool JsonFileDeviceStore::remove_device_from_group(const std::string& device_id, const std::string& group_id){
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();
    auto it = groups_.find(group_id);
    if(it == groups_.end()) return false;
    bool erased = it->second.devices.erase(device_id) > 0;
    if(erased) flush_locked();
    return erased;
}

std::set<std::string> JsonFileDeviceStore::get_device_groups(const std::string& device_id){
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();
    std::set<std::string> out;
    for(const auto& kv : groups_) if(kv.second.devices.count(device_id)) out.insert(kv.first);
    return out;
}

std::set<std::string> JsonFileDeviceStore::get_group_devices(const std::string& group_id){
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();
    auto it = groups_.find(group_id);
    if(it == groups_.end()) return {};
    return it->second.devices;
}

void JsonFileDeviceStore::upsert_group(const Group& group){
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();
    groups_[group.id] = group;
    flush_locked();
}

std::vector<Group> JsonFileDeviceStore::groups(){
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();
    std::vector<Group> out;
    for(const auto& kv : groups_) out.push_back(kv.second);
    return out;
}

}
