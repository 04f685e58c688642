#include "VendorClassifier.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <cctype>
#include <fstream>

namespace wiz_scan {
namespace discovery {

VendorClassifier::VendorClassifier() : table_(builtin_table()) {}

VendorClassifier::VendorClassifier(std::map<std::string, std::string> oui_table) {
    for(const auto& kv : oui_table) add_entry(kv.first, kv.second);
}

const std::vector<std::string>& VendorClassifier::allow_list(){
    static const std::vector<std::string> vendors = {"espressif", "wiz", "wizconnected", "signify"};
    return vendors;
}

std::map<std::string, std::string> VendorClassifier::builtin_table(){
    static const char* espressif[] = {
        "18:fe:34", "24:0a:c4", "24:62:ab", "24:6f:28", "2c:3a:e8", "30:ae:a4", "3c:71:bf",
        "5c:cf:7f", "60:01:94", "68:c6:3a", "7c:9e:bd", "80:7d:3a", "84:0d:8e", "84:f3:eb",
        "8c:aa:b5", "98:f4:ab", "a0:20:a6", "a4:cf:12", "b4:e6:2d", "bc:dd:c2", "c8:2b:96",
        "cc:50:e3", "dc:4f:22", "e8:db:84", "ec:fa:bc"
    };
    std::map<std::string, std::string> table;
    for(const char* oui : espressif) table[oui] = "Espressif Inc.";
    table["a8:bb:50"] = "WiZ IoT Company Limited";
    return table;
}

std::optional<std::string> VendorClassifier::oui_of(const std::string& mac){
    auto full = utils::normalize_mac(mac);
    if(full) return full->substr(0, 8);
    // bare prefix as found in OUI databases: "A8-BB-50", "A8:BB:50", "A8BB50"
    std::string hex;
    for(char c : utils::to_lower(utils::trim(mac))){
        if(c == ':' || c == '-') continue;
        if(!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
        hex.push_back(c);
    }
    if(hex.size() != 6) return std::nullopt;
    return hex.substr(0, 2) + ":" + hex.substr(2, 2) + ":" + hex.substr(4, 2);
}

void VendorClassifier::add_entry(const std::string& oui, const std::string& vendor){
    auto key = oui_of(oui);
    if(!key || vendor.empty()) return;
    table_[*key] = vendor;
}

size_t VendorClassifier::load_ieee_file(const std::string& path){
    std::ifstream in(path);
    if(!in){
        Logger::instance().warn("OUI database not readable: " + path);
        return 0;
    }
    size_t count = 0;
    std::string line;
    while(std::getline(in, line)){
        auto pos = line.find("(hex)");
        if(pos == std::string::npos) continue;
        std::string prefix = utils::trim(line.substr(0, pos));
        std::string vendor = utils::trim(line.substr(pos + 5));
        auto key = oui_of(prefix);
        if(!key || vendor.empty()) continue;
        table_[*key] = vendor;
        ++count;
    }
    Logger::instance().debug("Loaded " + std::to_string(count) + " OUI entries from " + path);
    return count;
}

std::optional<std::string> VendorClassifier::lookup(const std::string& mac) const {
    auto key = oui_of(mac);
    if(!key) return std::nullopt;
    auto it = table_.find(*key);
    if(it == table_.end()) return std::nullopt;
    return it->second;
}

VendorVerdict VendorClassifier::classify(const std::optional<std::string>& mac) const {
    VendorVerdict verdict;
    if(!mac) return verdict;
    verdict.vendor_name = lookup(*mac);
    if(!verdict.vendor_name) return verdict;
    for(const auto& v : allow_list()){
        if(utils::contains_ci(*verdict.vendor_name, v)){ verdict.is_known_vendor = true; break; }
    }
    return verdict;
}

}
}
