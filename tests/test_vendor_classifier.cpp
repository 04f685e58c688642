#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/discovery/VendorClassifier.h"
#include <fstream>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

namespace wiz_scan {
namespace discovery {

class VendorClassifierTest : public ::testing::Test {
protected:
    VendorClassifier classifier;
};

TEST_F(VendorClassifierTest, OuiOfAcceptsSeveralSpellings) {
    EXPECT_EQ(VendorClassifier::oui_of("A8:BB:50:01:02:03"), std::optional<std::string>("a8:bb:50"));
    EXPECT_EQ(VendorClassifier::oui_of("a8bb50010203"), std::optional<std::string>("a8:bb:50"));
    EXPECT_EQ(VendorClassifier::oui_of("A8-BB-50"), std::optional<std::string>("a8:bb:50"));
    EXPECT_EQ(VendorClassifier::oui_of("A8BB50"), std::optional<std::string>("a8:bb:50"));
    EXPECT_FALSE(VendorClassifier::oui_of("xyz").has_value());
    EXPECT_FALSE(VendorClassifier::oui_of("").has_value());
}

TEST_F(VendorClassifierTest, WizOuiIsKnown) {
    VendorVerdict v = classifier.classify(std::string("a8:bb:50:11:22:33"));
    EXPECT_TRUE(v.is_known_vendor);
    ASSERT_TRUE(v.vendor_name.has_value());
    EXPECT_THAT(*v.vendor_name, testing::HasSubstr("WiZ"));
}

TEST_F(VendorClassifierTest, EspressifOuiIsKnown) {
    VendorVerdict v = classifier.classify(std::string("24:0A:C4:00:00:01"));
    EXPECT_TRUE(v.is_known_vendor);
    EXPECT_EQ(v.vendor_name, std::optional<std::string>("Espressif Inc."));
}

TEST_F(VendorClassifierTest, UnknownOuiIsNotKnown) {
    VendorVerdict v = classifier.classify(std::string("00:11:22:33:44:55"));
    EXPECT_FALSE(v.is_known_vendor);
    EXPECT_FALSE(v.vendor_name.has_value());
}

TEST_F(VendorClassifierTest, MissingOrGarbageMacIsNotKnown) {
    EXPECT_FALSE(classifier.classify(std::nullopt).is_known_vendor);
    EXPECT_FALSE(classifier.classify(std::string("garbage")).is_known_vendor);
}

TEST_F(VendorClassifierTest, VendorOutsideAllowListIsNotKnown) {
    VendorClassifier custom({{"00:17:88", "Philips Lighting BV"}, {"b0:0c:d1", "Signify Netherlands B.V."}});
    VendorVerdict philips = custom.classify(std::string("00:17:88:01:02:03"));
    EXPECT_FALSE(philips.is_known_vendor);
    EXPECT_EQ(philips.vendor_name, std::optional<std::string>("Philips Lighting BV"));
    EXPECT_TRUE(custom.classify(std::string("b0:0c:d1:01:02:03")).is_known_vendor);
}

TEST_F(VendorClassifierTest, LoadsIeeeOuiFile) {
    auto path = fs::temp_directory_path() / ("wiz_scan_oui_" + std::to_string(::getpid()) + ".txt");
    {
        std::ofstream out(path);
        out << "OUI/MA-L                                                    Organization\n"
            << "company_id                                                  Organization\n\n"
            << "44-4F-8E   (hex)\t\tWiZ Connected Lighting Co. Ltd\n"
            << "444F8E     (base 16)\t\tWiZ Connected Lighting Co. Ltd\n"
            << "00-11-22   (hex)\t\tCIMSYS Inc\n"
            << "ZZ-11-22   (hex)\t\tBroken Line\n";
    }
    size_t before = classifier.size();
    EXPECT_EQ(classifier.load_ieee_file(path.string()), 2u);
    EXPECT_EQ(classifier.size(), before + 2);
    EXPECT_TRUE(classifier.classify(std::string("44:4f:8e:00:00:01")).is_known_vendor);
    EXPECT_FALSE(classifier.classify(std::string("00:11:22:00:00:01")).is_known_vendor);
    fs::remove(path);
}

TEST_F(VendorClassifierTest, UnreadableFileLoadsNothing) {
    testing::internal::CaptureStderr();
    EXPECT_EQ(classifier.load_ieee_file("/nonexistent/oui.txt"), 0u);
    testing::internal::GetCapturedStderr();
}

} // namespace discovery
} // namespace wiz_scan
