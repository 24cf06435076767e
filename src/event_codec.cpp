#include "lanwatch/event_codec.hpp"

#include <cmath>

#include "lanwatch/util/time_format.hpp"

namespace lanwatch::control::codec {

namespace {

Json optional_time(const std::optional<TimePoint>& tp) {
    if (!tp) {
        return nullptr;
    }
    return util::to_iso8601(*tp);
}

Json optional_name(const std::optional<std::string>& name) {
    if (!name) {
        return nullptr;
    }
    return *name;
}

Json state_payload(const std::string& type, const Snapshot& snapshot) {
    Json devices = Json::array();
    for (const auto& device : snapshot.devices) {
        devices.push_back(device_to_json(device));
    }
    return Json{
        {"type", type},
        {"devices", std::move(devices)},
        {"count", snapshot.devices.size()},
        {"timestamp", optional_time(snapshot.timestamp)},
        {"next_scan", optional_time(snapshot.next_scan)},
        {"scan_interval", snapshot.interval.count()},
        {"scanning", snapshot.scanning},
        {"cycle", snapshot.cycle},
    };
}

}  // namespace

Json record_to_json(const DeviceRecord& record) {
    return Json{
        {"ip", record.address},
        {"mac", record.hardware_id},
        {"hostname", optional_name(record.name)},
        {"notes", record.note},
        {"first_seen", util::to_iso8601(record.first_seen)},
        {"last_seen", util::to_iso8601(record.last_seen)},
        {"last_seen_online", optional_time(record.last_seen_online)},
        {"total_scans", record.total_scans},
        {"scans_seen_online", record.scans_online},
        {"consecutive_offline", record.consecutive_offline},
        {"appearance_rate", record.appearance_rate()},
    };
}

Json device_to_json(const DeviceView& view) {
    auto node = record_to_json(view.record);
    node["status"] = std::string(to_string(view.status));
    node["category"] = std::string(to_string(view.category));
    node["device_status"] = std::string(to_string(view.presence));
    return node;
}

Json make_message(const std::string& type, const std::string& message) {
    return Json{{"type", type}, {"message", message}};
}

Json make_initial_state(const Snapshot& snapshot) {
    return state_payload("initial_state", snapshot);
}

Json make_scan_update(const Snapshot& snapshot) {
    auto payload = state_payload("scan_update", snapshot);
    payload["online_count"] = snapshot.counts.online_count;
    payload["new_count"] = snapshot.counts.new_count;
    payload["offline_count"] = snapshot.counts.offline_count;
    payload["back_online_count"] = snapshot.counts.back_online_count;
    return payload;
}

Json make_snapshot_reply(const Snapshot& snapshot) {
    return state_payload("snapshot", snapshot);
}

Json make_history_stats(const HistoryStats& stats) {
    Json devices = Json::array();
    for (const auto& entry : stats.devices) {
        const auto& record = entry.record;
        const double percent = std::round(record.appearance_rate() * 1000.0) / 10.0;
        devices.push_back(Json{
            {"ip", record.address},
            {"mac", record.hardware_id},
            {"hostname", optional_name(record.name)},
            {"total_scans", record.total_scans},
            {"scans_seen_online", record.scans_online},
            {"appearance_rate", percent},
            {"category", std::string(to_string(entry.category))},
            {"notes", record.note},
        });
    }
    return Json{
        {"type", "history_stats"},
        {"success", true},
        {"total_devices", stats.total_devices},
        {"total_scans", stats.total_scans},
        {"active_24h", stats.active_24h},
        {"devices", std::move(devices)},
    };
}

Json make_scan_history(const std::vector<ScanRecord>& scans) {
    Json entries = Json::array();
    for (const auto& scan : scans) {
        entries.push_back(Json{
            {"scan_time", util::to_iso8601(scan.timestamp)},
            {"devices_found", scan.devices_found},
            {"scan_method", scan.method},
        });
    }
    return Json{{"type", "scan_history"}, {"scans", std::move(entries)}};
}

Json make_error(const std::string& code, const std::string& message) {
    return Json{{"type", "error"}, {"code", code}, {"message", message}};
}

}  // namespace lanwatch::control::codec
