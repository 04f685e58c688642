#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/discovery/ArpResolver.h"
#include <fstream>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

namespace wiz_scan {
namespace discovery {

class ArpResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / ("wiz_scan_arp_" + std::to_string(::getpid()));
        fs::create_directories(temp_dir);
    }
    void TearDown() override {
        fs::remove_all(temp_dir);
    }
    fs::path write_file(const std::string& name, const std::string& content) {
        auto p = temp_dir / name;
        std::ofstream(p) << content;
        return p;
    }
    fs::path temp_dir;
};

static const char* kProcArp =
    "IP address       HW type     Flags       HW address            Mask     Device\n"
    "192.168.1.20     0x1         0x2         A8:BB:50:01:02:03     *        wlan0\n"
    "192.168.1.21     0x1         0x0         00:00:00:00:00:00     *        wlan0\n"
    "192.168.1.22     0x1         0x2         d8:a0:11:22:33:44     *        wlan0\n"
    "192.168.1.255    0x1         0x2         ff:ff:ff:ff:ff:ff     *        wlan0\n";

TEST_F(ArpResolverTest, ParsesProcNetArp) {
    NeighborTable t = ProcNetArpResolver::parse(kProcArp);
    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t["192.168.1.20"], "a8:bb:50:01:02:03");
    EXPECT_EQ(t["192.168.1.22"], "d8:a0:11:22:33:44");
    EXPECT_EQ(t.count("192.168.1.21"), 0u);
    EXPECT_EQ(t.count("192.168.1.255"), 0u);
}

TEST_F(ArpResolverTest, ProcResolverReadsFile) {
    auto p = write_file("arp", kProcArp);
    ProcNetArpResolver resolver(p.string());
    EXPECT_EQ(resolver.resolve_neighbor_table().size(), 2u);
}

TEST_F(ArpResolverTest, MissingFileYieldsEmptyTable) {
    ProcNetArpResolver resolver((temp_dir / "nope").string());
    testing::internal::CaptureStderr();
    EXPECT_TRUE(resolver.resolve_neighbor_table().empty());
    EXPECT_THAT(testing::internal::GetCapturedStderr(), testing::HasSubstr("[WARN]"));
}

TEST_F(ArpResolverTest, ParsesLinuxArpCommand) {
    NeighborTable t = CommandArpResolver::parse(
        "Address                  HWtype  HWaddress           Flags Mask            Iface\n"
        "192.168.1.20             ether   a8:bb:50:01:02:03   C                     wlan0\n"
        "192.168.1.30                     (incomplete)                              wlan0\n");
    ASSERT_EQ(t.size(), 1u);
    EXPECT_EQ(t["192.168.1.20"], "a8:bb:50:01:02:03");
}

TEST_F(ArpResolverTest, ParsesBsdArpCommand) {
    NeighborTable t = CommandArpResolver::parse(
        "? (192.168.1.20) at a8:bb:50:1:2:3 on en0 ifscope [ethernet]\n"
        "? (192.168.1.1) at (incomplete) on en0 ifscope [ethernet]\n");
    ASSERT_EQ(t.size(), 1u);
    EXPECT_EQ(t["192.168.1.20"], "a8:bb:50:01:02:03");
}

TEST_F(ArpResolverTest, ParsesWindowsArpOutput) {
    NeighborTable t = CommandArpResolver::parse(
        "Interface: 192.168.1.5 --- 0x7\n"
        "  Internet Address      Physical Address      Type\n"
        "  192.168.1.20          a8-bb-50-01-02-03     dynamic\n"
        "  192.168.1.255         ff-ff-ff-ff-ff-ff     static\n");
    ASSERT_EQ(t.size(), 1u);
    EXPECT_EQ(t["192.168.1.20"], "a8:bb:50:01:02:03");
}

TEST_F(ArpResolverTest, CommandResolverRunsCommand) {
    auto p = write_file("arp.txt", "192.168.1.40  ether  a8:bb:50:aa:bb:cc  C  eth0\n");
    CommandArpResolver resolver("cat " + p.string());
    NeighborTable t = resolver.resolve_neighbor_table();
    ASSERT_EQ(t.size(), 1u);
    EXPECT_EQ(t["192.168.1.40"], "a8:bb:50:aa:bb:cc");
}

TEST_F(ArpResolverTest, FailingCommandYieldsEmptyTable) {
    CommandArpResolver resolver("false");
    testing::internal::CaptureStderr();
    EXPECT_TRUE(resolver.resolve_neighbor_table().empty());
    EXPECT_THAT(testing::internal::GetCapturedStderr(), testing::HasSubstr("[WARN]"));
}

TEST_F(ArpResolverTest, NullResolverIsEmpty) {
    NullNeighborResolver resolver;
    EXPECT_TRUE(resolver.resolve_neighbor_table().empty());
}

} // namespace discovery
} // namespace wiz_scan
