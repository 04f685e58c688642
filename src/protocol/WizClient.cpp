#include "WizClient.h"
#include "../core/Errors.h"
#include "../core/Logging.h"

namespace wiz_scan {
namespace protocol {

WizClient::WizClient(Transport& transport, uint16_t port) : transport_(transport), port_(port) {}

WizResponse WizClient::send_command(const std::string& address, const std::string& method,
                                    const nlohmann::json& params,
                                    std::chrono::milliseconds timeout){
    std::string reply = transport_.exchange(address, port_, encode_request(method, params), timeout);
    return decode_response(reply);
}

std::optional<WizResponse> WizClient::probe(const std::string& address,
                                            std::optional<std::chrono::milliseconds> timeout){
    try {
        WizResponse resp = send_command(address, kGetPilot, nlohmann::json::object(), timeout.value_or(kDefaultTimeout));
        if(resp.has_result()) return resp;
        Logger::instance().trace("probe " + address + ": reply without result");
    } catch(const TimeoutError&){
        // nothing listening; the common case during a sweep
    } catch(const ProtocolError& ex){
        Logger::instance().trace("probe " + address + ": " + ex.what());
    } catch(const NetworkError& ex){
        Logger::instance().trace("probe " + address + ": " + ex.what());
    } catch(const FatalError& ex){
        Logger::instance().error("probe " + address + ": " + ex.what());
    }
    return std::nullopt;
}

std::optional<nlohmann::json> WizClient::query_result(const std::string& address, const char* method){
    try {
        WizResponse resp = send_command(address, method, nlohmann::json::object());
        if(resp.has_result()) return resp.result;
    } catch(const TimeoutError& ex){
        Logger::instance().debug(std::string(method) + " " + address + ": " + ex.what());
    } catch(const WizError& ex){
        Logger::instance().warn(std::string(method) + " " + address + ": " + ex.what());
    }
    return std::nullopt;
}

DeviceState WizClient::state_from_pilot(const PilotResult& pilot){
    DeviceState s;
    s.power = pilot.state.value_or(false);
    s.brightness = pilot.dimming;
    s.color_temp = pilot.temp;
    if(pilot.r && pilot.g && pilot.b) s.rgb = Rgb{*pilot.r, *pilot.g, *pilot.b};
    s.speed = pilot.speed;
    s.scene_id = pilot.scene_id;
    return s;
}

std::optional<DeviceState> WizClient::get_state(const std::string& address){
    try {
        WizResponse resp = send_command(address, kGetPilot, nlohmann::json::object());
        if(!resp.has_result()) return std::nullopt;
        return state_from_pilot(resp.pilot());
    } catch(const WizError& ex){
        Logger::instance().error("Failed to get state for " + address + ": " + ex.what());
        return std::nullopt;
    }
}

std::optional<nlohmann::json> WizClient::get_system_config(const std::string& address){
    auto result = query_result(address, kGetSystemConfig);
    if(result) Logger::instance().debug("[" + address + "] System config: " + result->dump());
    return result;
}

std::optional<nlohmann::json> WizClient::get_model_config(const std::string& address){
    auto result = query_result(address, kGetModelConfig);
    if(result) Logger::instance().debug("[" + address + "] Model config: " + result->dump());
    return result;
}

bool WizClient::send_setter(const std::string& address, const nlohmann::json& params, const char* what){
    try {
        WizResponse resp = send_command(address, kSetPilot, params);
        if(resp.error){
            Logger::instance().warn(std::string("Device rejected ") + what + " for " + address + ": " +
                                    std::to_string(resp.error->code) + " " + resp.error->message);
            return false;
        }
        return true;
    } catch(const WizError& ex){
        Logger::instance().error(std::string("Failed to ") + what + " for " + address + ": " + ex.what());
        return false;
    }
}

bool WizClient::set_power(const std::string& address, bool on){
    return send_setter(address, {{"state", on}}, "set power");
}

bool WizClient::set_brightness(const std::string& address, int brightness){
    return send_setter(address, {{"dimming", clamp_brightness(brightness)}, {"state", true}}, "set brightness");
}

bool WizClient::set_color_temp(const std::string& address, int kelvin){
    return send_setter(address, {{"temp", clamp_color_temp(kelvin)}, {"state", true}}, "set color temp");
}

bool WizClient::set_rgb(const std::string& address, int r, int g, int b){
    nlohmann::json params = {{"r", clamp_channel(r)}, {"g", clamp_channel(g)}, {"b", clamp_channel(b)}, {"state", true}};
    return send_setter(address, params, "set RGB");
}

nlohmann::json WizClient::build_state_params(const StatePatch& patch){
    nlohmann::json params = nlohmann::json::object();
    if(patch.power) params["state"] = *patch.power;
    if(patch.brightness) params["dimming"] = clamp_brightness(*patch.brightness);
    if(patch.color_temp) params["temp"] = clamp_color_temp(*patch.color_temp);
    if(patch.rgb){
        params["r"] = clamp_channel(patch.rgb->r);
        params["g"] = clamp_channel(patch.rgb->g);
        params["b"] = clamp_channel(patch.rgb->b);
    }
    if(patch.speed) params["speed"] = clamp_speed(*patch.speed);
    if(patch.scene_id) params["sceneId"] = *patch.scene_id;
    return params;
}

bool WizClient::set_state(const std::string& address, const StatePatch& patch){
    return send_setter(address, build_state_params(patch), "set state");
}

bool WizClient::set_scene(const std::string& address, int scene_id, int speed){
    nlohmann::json params = {{"sceneId", scene_id}, {"speed", clamp_speed(speed)}, {"state", true}};
    return send_setter(address, params, "set scene");
}

}
}
