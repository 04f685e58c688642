#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace wiz_scan {
namespace protocol {

// Method names fixed by the device firmware
constexpr const char* kGetPilot = "getPilot";
constexpr const char* kSetPilot = "setPilot";
constexpr const char* kGetSystemConfig = "getSystemConfig";
constexpr const char* kGetModelConfig = "getModelConfig";

struct ResponseError {
    int code = 0;
    std::string message;
};

// Typed view over a getPilot result object. Fields are absent when the
// firmware did not report them or reported them with an unexpected type.
struct PilotResult {
    std::optional<std::string> mac;
    std::optional<int> rssi;
    std::optional<bool> state;
    std::optional<int> scene_id;
    std::optional<int> temp;
    std::optional<int> dimming;
    std::optional<int> speed;
    std::optional<int> r;
    std::optional<int> g;
    std::optional<int> b;
    std::optional<int> c;
    std::optional<int> w;
};

struct WizResponse {
    std::string method;
    std::optional<std::string> env;
    std::optional<nlohmann::json> result; // always an object when present
    std::optional<ResponseError> error;

    bool has_result() const { return result.has_value(); }
    PilotResult pilot() const;
};

std::string encode_request(const std::string& method, const nlohmann::json& params);
// Throws ProtocolError when the datagram is not a JSON object.
WizResponse decode_response(const std::string& datagram);

}
}
