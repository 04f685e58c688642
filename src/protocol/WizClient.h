#pragma once
#include "Transport.h"
#include "WizMessage.h"
#include "../core/Device.h"
#include <chrono>
#include <optional>
#include <string>

namespace wiz_scan {
namespace protocol {

class WizClient {
public:
    static constexpr uint16_t kDefaultPort = 38899;
    static constexpr std::chrono::milliseconds kDefaultTimeout{2000};

    explicit WizClient(Transport& transport, uint16_t port = kDefaultPort);

    // Opens a fresh endpoint per call. Throws TimeoutError, ProtocolError,
    // NetworkError or FatalError.
    WizResponse send_command(const std::string& address, const std::string& method,
                             const nlohmann::json& params,
                             std::chrono::milliseconds timeout = kDefaultTimeout);

    // getPilot; present only when the reply carries a result object. Never throws
    // for per-host failures and never logs them above trace level.
    std::optional<WizResponse> probe(const std::string& address,
                                     std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    std::optional<DeviceState> get_state(const std::string& address);
    std::optional<nlohmann::json> get_system_config(const std::string& address);
    std::optional<nlohmann::json> get_model_config(const std::string& address);

    // Setters report "a reply arrived without an error field"; they do not
    // confirm that the light applied the change.
    bool set_power(const std::string& address, bool on);
    bool set_brightness(const std::string& address, int brightness);
    bool set_color_temp(const std::string& address, int kelvin);
    bool set_rgb(const std::string& address, int r, int g, int b);
    bool set_state(const std::string& address, const StatePatch& patch);
    bool set_scene(const std::string& address, int scene_id, int speed = 100);

    static nlohmann::json build_state_params(const StatePatch& patch);
    static DeviceState state_from_pilot(const PilotResult& pilot);

    uint16_t port() const { return port_; }

private:
    std::optional<nlohmann::json> query_result(const std::string& address, const char* method);
    bool send_setter(const std::string& address, const nlohmann::json& params, const char* what);

    Transport& transport_;
    uint16_t port_;
};

}
}
