#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/control/GroupController.h"
#include "../src/core/Errors.h"

namespace wiz_scan {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class MockTransport : public protocol::Transport {
public:
    MOCK_METHOD(std::string, exchange,
                (const std::string& address, uint16_t port, const std::string& payload, std::chrono::milliseconds timeout),
                (override));
};

class MockDeviceStore : public DeviceStore {
public:
    MOCK_METHOD(std::vector<Device>, load_all_devices, (), (override));
    MOCK_METHOD(void, save_device, (const Device& device), (override));
    MOCK_METHOD(size_t, delete_stale, (std::chrono::milliseconds threshold), (override));
    MOCK_METHOD(void, add_device_to_group, (const std::string& device_id, const std::string& group_id), (override));
    MOCK_METHOD(bool, remove_device_from_group, (const std::string& device_id, const std::string& group_id), (override));
    MOCK_METHOD(std::set<std::string>, get_device_groups, (const std::string& device_id), (override));
    MOCK_METHOD(std::set<std::string>, get_group_devices, (const std::string& group_id), (override));
};

class GroupControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        add_device("a8:bb:50:00:00:01", "192.168.1.11");
        add_device("a8:bb:50:00:00:02", "192.168.1.12");
        add_device("a8:bb:50:00:00:03", "192.168.1.13");
        ON_CALL(store, get_group_devices("living"))
            .WillByDefault(Return(std::set<std::string>{"a8:bb:50:00:00:01", "a8:bb:50:00:00:02", "a8:bb:50:00:00:03"}));
        ON_CALL(transport, exchange(_, _, _, _))
            .WillByDefault(Return(R"({"method":"setPilot","result":{"success":true}})"));
    }

    void add_device(const std::string& id, const std::string& ip) {
        Device d;
        d.id = id;
        d.ip = ip;
        d.mac = id;
        registry.merge(d);
    }

    NiceMock<MockTransport> transport;
    NiceMock<MockDeviceStore> store;
    protocol::WizClient client{transport};
    DeviceRegistry registry{&store};
    GroupController controller{registry, client, store};
};

TEST_F(GroupControllerTest, PowerFansOutToEveryMember) {
    EXPECT_CALL(transport, exchange("192.168.1.11", 38899, HasSubstr(R"("state":false)"), _));
    EXPECT_CALL(transport, exchange("192.168.1.12", 38899, HasSubstr(R"("state":false)"), _));
    EXPECT_CALL(transport, exchange("192.168.1.13", 38899, HasSubstr(R"("state":false)"), _));

    GroupControlResult r = controller.set_power("living", false);
    EXPECT_EQ(r.total, 3u);
    EXPECT_EQ(r.successes, 3u);
    EXPECT_EQ(r.failures, 0u);
}

TEST_F(GroupControllerTest, PartialFailureIsCounted) {
    ON_CALL(transport, exchange("192.168.1.12", _, _, _)).WillByDefault(Throw(TimeoutError("timed out")));
    ON_CALL(transport, exchange("192.168.1.13", _, _, _))
        .WillByDefault(Return(R"({"method":"setPilot","error":{"code":-32602,"message":"Invalid params"}})"));

    StatePatch patch;
    patch.brightness = 40;
    testing::internal::CaptureStderr();
    GroupControlResult r = controller.set_state("living", patch);
    testing::internal::GetCapturedStderr();

    EXPECT_EQ(r.total, 3u);
    EXPECT_EQ(r.successes, 1u);
    EXPECT_EQ(r.failures, 2u);
}

TEST_F(GroupControllerTest, UnknownMembersAreFailures) {
    ON_CALL(store, get_group_devices("porch"))
        .WillByDefault(Return(std::set<std::string>{"a8:bb:50:00:00:01", "ghost"}));
    testing::internal::CaptureStderr();
    GroupControlResult r = controller.set_scene("porch", 4, 150);
    testing::internal::GetCapturedStderr();
    EXPECT_EQ(r.total, 2u);
    EXPECT_EQ(r.successes, 1u);
    EXPECT_EQ(r.failures, 1u);
}

TEST_F(GroupControllerTest, SceneCarriesClampedSpeed) {
    ON_CALL(store, get_group_devices("one")).WillByDefault(Return(std::set<std::string>{"a8:bb:50:00:00:01"}));
    EXPECT_CALL(transport, exchange("192.168.1.11", _, HasSubstr(R"("speed":200)"), _));
    EXPECT_EQ(controller.set_scene("one", 7, 900).successes, 1u);
}

TEST_F(GroupControllerTest, EmptyGroup) {
    EXPECT_CALL(transport, exchange(_, _, _, _)).Times(0);
    GroupControlResult r = controller.set_power("nobody", true);
    EXPECT_EQ(r.total, 0u);
    EXPECT_EQ(r.successes, 0u);
}

TEST_F(GroupControllerTest, StoreFailureYieldsEmptyResult) {
    ON_CALL(store, get_group_devices("broken")).WillByDefault(Throw(StoreError("corrupt")));
    testing::internal::CaptureStderr();
    GroupControlResult r = controller.set_power("broken", true);
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(r.total, 0u);
    EXPECT_THAT(err, HasSubstr("corrupt"));
}

} // namespace wiz_scan
