#pragma once
#include "Config.h"
#include "Device.h"
#include "Report.h"
#include <nlohmann/json.hpp>
#include <string>

namespace wiz_scan {

class JSONWriter {
public:
    std::string write(const ScanReport& report, const Config& cfg) const;
    // Single-device views used by the control modes.
    std::string write_state(const std::string& ip, const DeviceState& state, const Config& cfg) const;
    std::string write_document(const nlohmann::json& doc, const Config& cfg) const;

    static nlohmann::json build_meta(const Config& cfg);
    static nlohmann::json build_summary(const ScanReport& report);
};

}
