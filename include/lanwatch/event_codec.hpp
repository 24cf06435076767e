#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lanwatch/device_types.hpp"

namespace lanwatch::control::codec {

using Json = nlohmann::json;

Json device_to_json(const DeviceView& view);
Json record_to_json(const DeviceRecord& record);

Json make_message(const std::string& type, const std::string& message);
Json make_initial_state(const Snapshot& snapshot);
Json make_scan_update(const Snapshot& snapshot);
Json make_snapshot_reply(const Snapshot& snapshot);
Json make_history_stats(const HistoryStats& stats);
Json make_scan_history(const std::vector<ScanRecord>& scans);
Json make_error(const std::string& code, const std::string& message);

}  // namespace lanwatch::control::codec
