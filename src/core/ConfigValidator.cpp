#include "ConfigValidator.h"
#include "Errors.h"
#include "Logging.h"
#include "Device.h"
#include "../net/Subnet.h"
#include <iostream>

namespace wiz_scan {

bool ConfigValidator::validate(Config& cfg) {
    // pretty vs compact: if both set, compact wins
    if(cfg.pretty && cfg.compact) {
        cfg.pretty = false;
    }

    LogLevel lvl;
    if(!parse_log_level(cfg.log_level, lvl)) {
        std::cerr << "Invalid --log-level value: " << cfg.log_level << "\n";
        return false;
    }

    if(!validate_scan(cfg)) return false;
    if(!validate_control(cfg)) return false;
    if(!validate_groups(cfg)) return false;
    return true;
}

bool ConfigValidator::validate_range(int value, int lo, int hi, const std::string& flag_name) {
    if(value < lo || value > hi) {
        std::cerr << flag_name << " must be between " << lo << " and " << hi << " (got " << value << ")\n";
        return false;
    }
    return true;
}

bool ConfigValidator::validate_scan(Config& cfg) {
    if(!validate_range(cfg.concurrency, kMinConcurrency, kMaxConcurrency, "--concurrency")) return false;
    if(!validate_range(cfg.timeout_ms, kMinTimeoutMs, kMaxTimeoutMs, "--timeout")) return false;
    if(!validate_range(cfg.batch_delay_ms, 0, kMaxBatchDelayMs, "--batch-delay")) return false;
    if(cfg.stale_minutes < 1) {
        std::cerr << "--evict-stale minutes must be positive\n";
        return false;
    }

    if(!cfg.subnet.empty()) {
        try {
            net::parse_cidr(cfg.subnet);
        } catch(const WizError& ex) {
            std::cerr << ex.what() << "\n";
            return false;
        }
    }

    if(cfg.arp_source != "proc" && cfg.arp_source != "command" && cfg.arp_source != "none") {
        std::cerr << "Invalid --arp value: " << cfg.arp_source << " (expected proc, command or none)\n";
        return false;
    }
    if(cfg.arp_source == "command" && cfg.arp_command.empty()) {
        std::cerr << "--arp command requires a non-empty --arp-command\n";
        return false;
    }
    return true;
}

bool ConfigValidator::validate_control(const Config& cfg) {
    // values inside these ranges are clamped to the firmware limits by the client
    if(cfg.brightness && !validate_range(*cfg.brightness, 0, kMaxBrightness, "--brightness")) return false;
    if(cfg.color_temp && !validate_range(*cfg.color_temp, kMinTempInput, kMaxTempInput, "--temp")) return false;
    if(cfg.speed && !validate_range(*cfg.speed, kMinSpeed, kMaxSpeed, "--speed")) return false;
    if(cfg.scene_id && *cfg.scene_id < 0) {
        std::cerr << "--scene must be a non-negative scene id\n";
        return false;
    }
    if(!cfg.rgb.empty() && cfg.rgb.size() != 3) {
        std::cerr << "--rgb expects three comma-separated values R,G,B\n";
        return false;
    }
    for(int ch : cfg.rgb) if(!validate_range(ch, kMinChannel, kMaxChannel, "--rgb")) return false;

    bool needs_target = cfg.get_state || cfg.get_system_config;
    if(needs_target && cfg.target.empty()) {
        std::cerr << "--get-state and --system-config require --target IP\n";
        return false;
    }
    if(cfg.has_control_action() && cfg.target.empty() && cfg.group.empty()) {
        std::cerr << "Control flags require --target IP or --group ID\n";
        return false;
    }
    if(!cfg.target.empty() && !cfg.group.empty()) {
        std::cerr << "--target and --group are mutually exclusive\n";
        return false;
    }
    if(!cfg.target.empty() && !net::is_valid_ipv4(cfg.target)) {
        std::cerr << "Invalid --target address: " << cfg.target << "\n";
        return false;
    }
    if((!cfg.target.empty() || !cfg.group.empty()) && !cfg.has_control_action() && !needs_target) {
        std::cerr << "--target/--group given without an action\n";
        return false;
    }
    return true;
}

bool ConfigValidator::validate_groups(const Config& cfg) {
    bool membership = !cfg.group_add.empty() || !cfg.group_remove.empty();
    if(membership && cfg.device_id.empty()) {
        std::cerr << "--group-add/--group-remove require --device ID\n";
        return false;
    }
    if((membership || !cfg.group.empty() || cfg.list_groups) && cfg.store_file.empty()) {
        std::cerr << "Group operations require --store FILE\n";
        return false;
    }
    return true;
}

}
