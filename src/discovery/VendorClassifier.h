#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wiz_scan {
namespace discovery {

struct VendorVerdict {
    bool is_known_vendor = false;
    std::optional<std::string> vendor_name;
};

// OUI (first three octets) -> vendor name lookup with an allow-list of
// vendor substrings for chips shipped in WiZ lights.
class VendorClassifier {
public:
    // Built-in OUI table only.
    VendorClassifier();
    explicit VendorClassifier(std::map<std::string, std::string> oui_table);

    // Loads an IEEE oui.txt file ("A8-BB-50   (hex)\t\tVendor") on top of the
    // current table. Returns the number of entries read, 0 when unreadable.
    size_t load_ieee_file(const std::string& path);
    void add_entry(const std::string& oui, const std::string& vendor);

    std::optional<std::string> lookup(const std::string& mac) const;
    VendorVerdict classify(const std::optional<std::string>& mac) const;

    size_t size() const { return table_.size(); }

    static const std::vector<std::string>& allow_list();
    static std::map<std::string, std::string> builtin_table();
    // "aa:bb:cc" from any accepted MAC spelling, or nullopt.
    static std::optional<std::string> oui_of(const std::string& mac);

private:
    std::map<std::string, std::string> table_;
};

}
}
