#include "WizMessage.h"
#include "../core/Errors.h"
#include <cstdint>
#include <limits>

namespace wiz_scan {
namespace protocol {

static std::optional<int> int_field(const nlohmann::json& obj, const char* key){
    auto it = obj.find(key);
    if(it == obj.end() || !it->is_number()) return std::nullopt;
    // values outside int range are treated as absent
    if(it->is_number_float()){
        double v = it->get<double>();
        if(!(v >= static_cast<double>(std::numeric_limits<int>::min()) && v <= static_cast<double>(std::numeric_limits<int>::max())))
            return std::nullopt;
        return static_cast<int>(v);
    }
    if(it->is_number_unsigned()){
        auto v = it->get<std::uint64_t>();
        if(v > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
        return static_cast<int>(v);
    }
    auto v = it->get<std::int64_t>();
    if(v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return std::nullopt;
    return static_cast<int>(v);
}

PilotResult WizResponse::pilot() const {
    PilotResult p;
    if(!result) return p;
    const nlohmann::json& r = *result;
    auto mac = r.find("mac");
    if(mac != r.end() && mac->is_string()) p.mac = mac->get<std::string>();
    auto st = r.find("state");
    if(st != r.end() && st->is_boolean()) p.state = st->get<bool>();
    p.rssi = int_field(r, "rssi");
    p.scene_id = int_field(r, "sceneId");
    p.temp = int_field(r, "temp");
    p.dimming = int_field(r, "dimming");
    p.speed = int_field(r, "speed");
    p.r = int_field(r, "r");
    p.g = int_field(r, "g");
    p.b = int_field(r, "b");
    p.c = int_field(r, "c");
    p.w = int_field(r, "w");
    return p;
}

std::string encode_request(const std::string& method, const nlohmann::json& params){
    nlohmann::json msg;
    msg["method"] = method;
    msg["params"] = params.is_null() ? nlohmann::json::object() : params;
    return msg.dump();
}

WizResponse decode_response(const std::string& datagram){
    nlohmann::json doc = nlohmann::json::parse(datagram, nullptr, false);
    if(doc.is_discarded()) throw ProtocolError("Invalid JSON response");
    if(!doc.is_object()) throw ProtocolError("Response is not a JSON object");

    WizResponse resp;
    auto m = doc.find("method");
    if(m != doc.end() && m->is_string()) resp.method = m->get<std::string>();
    auto env = doc.find("env");
    if(env != doc.end() && env->is_string()) resp.env = env->get<std::string>();
    auto res = doc.find("result");
    if(res != doc.end() && res->is_object()) resp.result = *res;
    auto err = doc.find("error");
    if(err != doc.end() && !err->is_null()){
        ResponseError e;
        if(err->is_object()){
            auto code = err->find("code");
            if(code != err->end() && code->is_number_integer()) e.code = code->get<int>();
            auto msg = err->find("message");
            if(msg != err->end() && msg->is_string()) e.message = msg->get<std::string>();
        } else {
            e.message = err->dump();
        }
        resp.error = e;
    }
    return resp;
}

}
}
