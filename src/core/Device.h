#pragma once
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace wiz_scan {

enum class Confidence { Low = 0, Medium = 1, High = 2 };

const char* confidence_name(Confidence c);
// Throws std::invalid_argument on unknown names.
Confidence parse_confidence(const std::string& name);
inline int confidence_rank(Confidence c) { return static_cast<int>(c); }

// Value ranges accepted by the firmware
constexpr int kMinBrightness = 10;
constexpr int kMaxBrightness = 100;
constexpr int kMinColorTemp = 2200;
constexpr int kMaxColorTemp = 6500;
constexpr int kMinChannel = 0;
constexpr int kMaxChannel = 255;
constexpr int kMinSpeed = 0;
constexpr int kMaxSpeed = 200;

int clamp_brightness(int v);
int clamp_color_temp(int v);
int clamp_channel(int v);
int clamp_speed(int v);

struct Rgb {
    int r = 0;
    int g = 0;
    int b = 0;
    bool operator==(const Rgb& o) const { return r==o.r && g==o.g && b==o.b; }
};

struct DeviceState {
    bool power = false;
    std::optional<int> brightness;  // percent
    std::optional<int> color_temp;  // Kelvin
    std::optional<Rgb> rgb;
    std::optional<int> speed;       // scene animation rate
    std::optional<int> scene_id;

    DeviceState clamped() const;
};

// Partial state for control commands; only present fields are transmitted.
struct StatePatch {
    std::optional<bool> power;
    std::optional<int> brightness;
    std::optional<int> color_temp;
    std::optional<Rgb> rgb;
    std::optional<int> speed;
    std::optional<int> scene_id;

    bool empty() const { return !power && !brightness && !color_temp && !rgb && !speed && !scene_id; }
};

struct Device {
    std::string id;
    std::string ip;
    std::optional<std::string> mac;
    std::optional<std::string> name;
    std::optional<std::string> model;
    Confidence confidence = Confidence::High;
    std::chrono::system_clock::time_point last_seen{};
    std::optional<int> rssi;
    DeviceState state;
    std::set<std::string> groups;
};

// Shallow update applied through DeviceRegistry::update.
struct DevicePatch {
    std::optional<std::string> ip;
    std::optional<std::string> mac;
    std::optional<std::string> name;
    std::optional<std::string> model;
    std::optional<int> rssi;
    std::optional<DeviceState> state;
};

struct Group {
    std::string id;
    std::string name;
    std::string description;
    std::set<std::string> devices;
};

std::string synthetic_device_id(const std::string& ip);
bool is_synthetic_id(const std::string& id);

void to_json(nlohmann::json& j, const Rgb& rgb);
void from_json(const nlohmann::json& j, Rgb& rgb);
void to_json(nlohmann::json& j, const DeviceState& s);
void from_json(const nlohmann::json& j, DeviceState& s);
void to_json(nlohmann::json& j, const Device& d);
void from_json(const nlohmann::json& j, Device& d);

}
