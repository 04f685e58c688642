#include "GroupController.h"
#include "../core/Logging.h"
#include <future>
#include <vector>

namespace wiz_scan {

GroupController::GroupController(DeviceRegistry& registry, protocol::WizClient& client, DeviceStore& store)
    : registry_(registry), client_(client), store_(store) {}

template<typename Fn>
GroupControlResult GroupController::fan_out(const std::string& group_id, const char* what, Fn&& command){
    GroupControlResult result;
    std::set<std::string> members;
    try {
        members = store_.get_group_devices(group_id);
    } catch(const std::exception& ex){
        Logger::instance().error("Cannot resolve group " + group_id + ": " + ex.what());
        return result;
    }
    result.total = members.size();

    std::vector<std::future<bool>> pending;
    for(const auto& id : members){
        auto device = registry_.get(id);
        if(!device){
            Logger::instance().warn("Group " + group_id + ": device " + id + " is not known");
            ++result.failures;
            continue;
        }
        std::string ip = device->ip;
        pending.push_back(std::async(std::launch::async, [&command, ip]{ return command(ip); }));
    }
    for(auto& f : pending){
        if(f.get()) ++result.successes; else ++result.failures;
    }
    Logger::instance().info(std::string("Group ") + group_id + " " + what + ": " + std::to_string(result.successes) +
                            "/" + std::to_string(result.total) + " succeeded");
    return result;
}

GroupControlResult GroupController::set_power(const std::string& group_id, bool on){
    return fan_out(group_id, "power", [this, on](const std::string& ip){ return client_.set_power(ip, on); });
}

GroupControlResult GroupController::set_state(const std::string& group_id, const StatePatch& patch){
    return fan_out(group_id, "state", [this, &patch](const std::string& ip){ return client_.set_state(ip, patch); });
}

GroupControlResult GroupController::set_scene(const std::string& group_id, int scene_id, int speed){
    return fan_out(group_id, "scene", [this, scene_id, speed](const std::string& ip){ return client_.set_scene(ip, scene_id, speed); });
}

}
