#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/ConfigValidator.h"

namespace wiz_scan {

class ConfigValidatorTest : public ::testing::Test {
protected:
    bool validate() {
        testing::internal::CaptureStderr();
        bool ok = validator.validate(cfg);
        err = testing::internal::GetCapturedStderr();
        return ok;
    }

    ConfigValidator validator;
    Config cfg;
    std::string err;
};

TEST_F(ConfigValidatorTest, DefaultsAreValid) {
    EXPECT_TRUE(validate());
    EXPECT_TRUE(err.empty());
}

TEST_F(ConfigValidatorTest, CompactWinsOverPretty) {
    cfg.pretty = true;
    cfg.compact = true;
    EXPECT_TRUE(validate());
    EXPECT_FALSE(cfg.pretty);
    EXPECT_TRUE(cfg.compact);
}

TEST_F(ConfigValidatorTest, ConcurrencyBounds) {
    cfg.concurrency = 4;
    EXPECT_FALSE(validate());
    EXPECT_THAT(err, testing::HasSubstr("--concurrency"));
    cfg.concurrency = 51;
    EXPECT_FALSE(validate());
    cfg.concurrency = 5;
    EXPECT_TRUE(validate());
    cfg.concurrency = 50;
    EXPECT_TRUE(validate());
}

TEST_F(ConfigValidatorTest, TimeoutBounds) {
    cfg.timeout_ms = 99;
    EXPECT_FALSE(validate());
    cfg.timeout_ms = 60001;
    EXPECT_FALSE(validate());
    cfg.timeout_ms = 100;
    EXPECT_TRUE(validate());
}

TEST_F(ConfigValidatorTest, NegativeBatchDelay) {
    cfg.batch_delay_ms = -1;
    EXPECT_FALSE(validate());
}

TEST_F(ConfigValidatorTest, SubnetMustParse) {
    cfg.subnet = "192.168.1.0/33";
    EXPECT_FALSE(validate());
    EXPECT_THAT(err, testing::HasSubstr("192.168.1.0/33"));
    cfg.subnet = "192.168.1.0/24";
    EXPECT_TRUE(validate());
}

TEST_F(ConfigValidatorTest, ArpSource) {
    cfg.arp_source = "netlink";
    EXPECT_FALSE(validate());
    cfg.arp_source = "none";
    EXPECT_TRUE(validate());
    cfg.arp_source = "command";
    cfg.arp_command.clear();
    EXPECT_FALSE(validate());
}

TEST_F(ConfigValidatorTest, LogLevel) {
    cfg.log_level = "loud";
    EXPECT_FALSE(validate());
    cfg.log_level = "TRACE";
    EXPECT_TRUE(validate());
}

TEST_F(ConfigValidatorTest, ControlRequiresTarget) {
    cfg.power = true;
    EXPECT_FALSE(validate());
    EXPECT_THAT(err, testing::HasSubstr("--target"));
    cfg.target = "192.168.1.20";
    EXPECT_TRUE(validate());
}

TEST_F(ConfigValidatorTest, TargetMustBeIpv4) {
    cfg.target = "lamp.local";
    cfg.power = true;
    EXPECT_FALSE(validate());
}

TEST_F(ConfigValidatorTest, TargetWithoutAction) {
    cfg.target = "192.168.1.20";
    EXPECT_FALSE(validate());
    cfg.get_state = true;
    EXPECT_TRUE(validate());
}

TEST_F(ConfigValidatorTest, QueriesNeedTarget) {
    cfg.get_system_config = true;
    EXPECT_FALSE(validate());
}

TEST_F(ConfigValidatorTest, RgbNeedsThreeChannels) {
    cfg.target = "192.168.1.20";
    cfg.rgb = {255, 0};
    EXPECT_FALSE(validate());
    cfg.rgb = {255, 0, 0};
    EXPECT_TRUE(validate());
}

TEST_F(ConfigValidatorTest, TargetAndGroupExclusive) {
    cfg.power = false;
    cfg.target = "192.168.1.20";
    cfg.group = "kitchen";
    cfg.store_file = "store.json";
    EXPECT_FALSE(validate());
}

TEST_F(ConfigValidatorTest, GroupOperationsNeedStore) {
    cfg.group = "kitchen";
    cfg.power = true;
    EXPECT_FALSE(validate());
    EXPECT_THAT(err, testing::HasSubstr("--store"));
    cfg.store_file = "store.json";
    EXPECT_TRUE(validate());
}

TEST_F(ConfigValidatorTest, MembershipNeedsDevice) {
    cfg.store_file = "store.json";
    cfg.group_add = "kitchen";
    EXPECT_FALSE(validate());
    cfg.device_id = "a8:bb:50:01:02:03";
    EXPECT_TRUE(validate());
}

TEST_F(ConfigValidatorTest, StaleMinutesPositive) {
    cfg.stale_minutes = 0;
    EXPECT_FALSE(validate());
}

TEST_F(ConfigValidatorTest, ControlValueRanges) {
    cfg.target = "192.168.1.20";
    cfg.brightness = 150;
    EXPECT_FALSE(validate());
    EXPECT_THAT(err, testing::HasSubstr("--brightness"));
    cfg.brightness = 5;
    EXPECT_TRUE(validate());

    cfg.color_temp = 500;
    EXPECT_FALSE(validate());
    cfg.color_temp = 2200;

    cfg.speed = 300;
    EXPECT_FALSE(validate());
    cfg.speed = 20;

    cfg.rgb = {300, 0, 0};
    EXPECT_FALSE(validate());
    cfg.rgb = {255, 0, 0};
    EXPECT_TRUE(validate());
}

TEST_F(ConfigValidatorTest, NegativeScene) {
    cfg.target = "192.168.1.20";
    cfg.scene_id = -1;
    EXPECT_FALSE(validate());
    cfg.scene_id = 4;
    EXPECT_TRUE(validate());
}

} // namespace wiz_scan
