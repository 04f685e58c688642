#pragma once
#include "../core/Device.h"
#include "../core/DeviceRegistry.h"
#include "../core/DeviceStore.h"
#include "../protocol/WizClient.h"
#include <string>

namespace wiz_scan {

struct GroupControlResult {
    size_t total = 0;
    size_t successes = 0;
    size_t failures = 0;
};

// Resolves group membership through the store and fans a command out to every
// member concurrently. Members unknown to the registry count as failures.
class GroupController {
public:
    GroupController(DeviceRegistry& registry, protocol::WizClient& client, DeviceStore& store);

    GroupControlResult set_power(const std::string& group_id, bool on);
    GroupControlResult set_state(const std::string& group_id, const StatePatch& patch);
    GroupControlResult set_scene(const std::string& group_id, int scene_id, int speed = 100);

private:
    template<typename Fn>
    GroupControlResult fan_out(const std::string& group_id, const char* what, Fn&& command);

    DeviceRegistry& registry_;
    protocol::WizClient& client_;
    DeviceStore& store_;
};

}
