#pragma once
#include "Config.h"
#include <string>

namespace wiz_scan {

class ConfigValidator {
public:
    // Normalizes and checks cross-flag constraints. Prints the reason to
    // stderr and returns false on the first violation.
    bool validate(Config& cfg);

    static constexpr int kMinConcurrency = 5;
    static constexpr int kMaxConcurrency = 50;
    static constexpr int kMinTimeoutMs = 100;
    static constexpr int kMaxTimeoutMs = 60000;
    static constexpr int kMaxBatchDelayMs = 1000;
    static constexpr int kMinTempInput = 1000;
    static constexpr int kMaxTempInput = 10000;

private:
    bool validate_range(int value, int lo, int hi, const std::string& flag_name);
    bool validate_scan(Config& cfg);
    bool validate_control(const Config& cfg);
    bool validate_groups(const Config& cfg);
};

}
