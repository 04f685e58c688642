#include "Device.h"
#include "Utils.h"
#include <algorithm>
#include <stdexcept>

namespace wiz_scan {

const char* confidence_name(Confidence c){
    switch(c){
        case Confidence::Low: return "low";
        case Confidence::Medium: return "medium";
        case Confidence::High: return "high";
    }
    return "low";
}

Confidence parse_confidence(const std::string& name){
    std::string n = utils::to_lower(name);
    if(n=="high") return Confidence::High;
    if(n=="medium") return Confidence::Medium;
    if(n=="low") return Confidence::Low;
    throw std::invalid_argument("unknown confidence level: " + name);
}

int clamp_brightness(int v){ return std::clamp(v, kMinBrightness, kMaxBrightness); }
int clamp_color_temp(int v){ return std::clamp(v, kMinColorTemp, kMaxColorTemp); }
int clamp_channel(int v){ return std::clamp(v, kMinChannel, kMaxChannel); }
int clamp_speed(int v){ return std::clamp(v, kMinSpeed, kMaxSpeed); }

DeviceState DeviceState::clamped() const {
    DeviceState s = *this;
    if(s.brightness) s.brightness = clamp_brightness(*s.brightness);
    if(s.color_temp) s.color_temp = clamp_color_temp(*s.color_temp);
    if(s.rgb){ s.rgb->r = clamp_channel(s.rgb->r); s.rgb->g = clamp_channel(s.rgb->g); s.rgb->b = clamp_channel(s.rgb->b); }
    if(s.speed) s.speed = clamp_speed(*s.speed);
    return s;
}

std::string synthetic_device_id(const std::string& ip){ return "ip-" + ip; }
bool is_synthetic_id(const std::string& id){ return id.rfind("ip-", 0) == 0; }

void to_json(nlohmann::json& j, const Rgb& rgb){
    j = nlohmann::json{{"r", rgb.r}, {"g", rgb.g}, {"b", rgb.b}};
}

void from_json(const nlohmann::json& j, Rgb& rgb){
    rgb.r = j.at("r").get<int>();
    rgb.g = j.at("g").get<int>();
    rgb.b = j.at("b").get<int>();
}

template<typename T>
static void put_opt(nlohmann::json& j, const char* key, const std::optional<T>& v){
    if(v) j[key] = *v;
}

template<typename T>
static void get_opt(const nlohmann::json& j, const char* key, std::optional<T>& out){
    auto it = j.find(key);
    if(it != j.end() && !it->is_null()) out = it->template get<T>();
}

void to_json(nlohmann::json& j, const DeviceState& s){
    j = nlohmann::json::object();
    j["power"] = s.power;
    put_opt(j, "brightness", s.brightness);
    put_opt(j, "colorTemp", s.color_temp);
    put_opt(j, "rgb", s.rgb);
    put_opt(j, "speed", s.speed);
    put_opt(j, "sceneId", s.scene_id);
}

void from_json(const nlohmann::json& j, DeviceState& s){
    s = DeviceState{};
    s.power = j.value("power", false);
    get_opt(j, "brightness", s.brightness);
    get_opt(j, "colorTemp", s.color_temp);
    get_opt(j, "rgb", s.rgb);
    get_opt(j, "speed", s.speed);
    get_opt(j, "sceneId", s.scene_id);
}

void to_json(nlohmann::json& j, const Device& d){
    j = nlohmann::json::object();
    j["id"] = d.id;
    j["ip"] = d.ip;
    put_opt(j, "mac", d.mac);
    put_opt(j, "name", d.name);
    put_opt(j, "model", d.model);
    j["confidence"] = confidence_name(d.confidence);
    j["lastSeen"] = utils::to_epoch_ms(d.last_seen);
    put_opt(j, "rssi", d.rssi);
    j["state"] = d.state;
    if(!d.groups.empty()) j["groups"] = d.groups;
}

void from_json(const nlohmann::json& j, Device& d){
    d = Device{};
    d.id = j.at("id").get<std::string>();
    d.ip = j.at("ip").get<std::string>();
    get_opt(j, "mac", d.mac);
    get_opt(j, "name", d.name);
    get_opt(j, "model", d.model);
    d.confidence = parse_confidence(j.value("confidence", std::string("low")));
    d.last_seen = utils::from_epoch_ms(j.value("lastSeen", 0LL));
    get_opt(j, "rssi", d.rssi);
    if(j.contains("state") && j["state"].is_object()) d.state = j["state"].get<DeviceState>();
    if(j.contains("groups") && j["groups"].is_array()) d.groups = j["groups"].get<std::set<std::string>>();
}

}
