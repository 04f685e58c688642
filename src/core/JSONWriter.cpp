#include "JSONWriter.h"
#include "Utils.h"
#include "BuildInfo.h"
#include <sys/utsname.h>
#include <cstdlib>
#include <map>

namespace wiz_scan {
namespace {
    std::string host_name() {
        if(const char* v = getenv("WIZ_SCAN_META_HOSTNAME"); v && *v) return v;
        struct utsname u{};
        if(uname(&u) == 0) return u.nodename;
        return {};
    }
}

nlohmann::json JSONWriter::build_meta(const Config& cfg) {
    nlohmann::json meta = nlohmann::json::object();
    meta["tool"] = "wiz-scan";
    meta["version"] = buildinfo::APP_VERSION;
    meta["git_commit"] = buildinfo::GIT_COMMIT;
    meta["hostname"] = host_name();
    if(!cfg.store_file.empty()) meta["store"] = cfg.store_file;
    meta["concurrency"] = cfg.concurrency;
    meta["timeout_ms"] = cfg.timeout_ms;
    return meta;
}

nlohmann::json JSONWriter::build_summary(const ScanReport& report) {
    nlohmann::json summary = nlohmann::json::object();
    summary["scanned"] = report.scanned;
    if(report.scanned) {
        summary["subnet"] = report.subnet;
        summary["start_time"] = utils::time_to_iso(report.start_time);
        summary["end_time"] = utils::time_to_iso(report.end_time);
        summary["duration_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(report.end_time - report.start_time).count();
        summary["hosts_scanned"] = report.hosts_scanned;
        summary["total_hosts"] = report.total_hosts;
        summary["devices_found"] = report.devices_found;
        summary["devices_changed"] = report.discovered.size();
    }
    summary["known_devices"] = report.known.size();
    std::map<std::string, size_t> by_confidence{{"low",0},{"medium",0},{"high",0}};
    for(const auto& d : report.known) by_confidence[confidence_name(d.confidence)]++;
    summary["confidence_counts"] = by_confidence;
    if(!report.evicted.empty()) summary["evicted"] = report.evicted;
    if(!report.retired.empty()) summary["retired"] = report.retired;
    return summary;
}

std::string JSONWriter::write_document(const nlohmann::json& doc, const Config& cfg) const {
    // compact wins over pretty
    int indent = (cfg.pretty && !cfg.compact) ? 2 : -1;
    return doc.dump(indent) + "\n";
}

std::string JSONWriter::write(const ScanReport& report, const Config& cfg) const {
    nlohmann::json doc = nlohmann::json::object();
    doc["meta"] = build_meta(cfg);
    doc["summary"] = build_summary(report);
    doc["devices"] = report.known;
    if(report.scanned) {
        nlohmann::json ids = nlohmann::json::array();
        for(const auto& d : report.discovered) ids.push_back(d.id);
        doc["discovered"] = ids;
    }
    return write_document(doc, cfg);
}

std::string JSONWriter::write_state(const std::string& ip, const DeviceState& state, const Config& cfg) const {
    nlohmann::json doc = nlohmann::json::object();
    doc["ip"] = ip;
    doc["state"] = state;
    return write_document(doc, cfg);
}

}
