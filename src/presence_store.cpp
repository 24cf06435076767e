#include "lanwatch/presence_store.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <utility>

#include <nlohmann/json.hpp>

#include "lanwatch/categorizer.hpp"
#include "lanwatch/util/logging.hpp"
#include "lanwatch/util/time_format.hpp"

namespace lanwatch::control {

namespace {

using json = nlohmann::json;

constexpr auto kActiveWindow = std::chrono::hours(24);

json optional_time(const std::optional<TimePoint>& tp) {
    if (!tp) {
        return nullptr;
    }
    return util::to_iso8601(*tp);
}

json record_to_json(const DeviceRecord& record) {
    json node;
    node["hardware_id"] = record.hardware_id;
    node["address"] = record.address;
    node["name"] = record.name ? json(*record.name) : json(nullptr);
    node["note"] = record.note;
    node["total_scans"] = record.total_scans;
    node["scans_online"] = record.scans_online;
    node["consecutive_offline"] = record.consecutive_offline;
    node["first_seen"] = util::to_iso8601(record.first_seen);
    node["last_seen"] = util::to_iso8601(record.last_seen);
    node["last_seen_online"] = optional_time(record.last_seen_online);
    return node;
}

DeviceRecord record_from_json(const json& node) {
    DeviceRecord record;
    record.hardware_id = normalize_hardware_id(node.at("hardware_id").get<std::string>());
    record.address = node.value("address", "");
    if (node.contains("name") && !node.at("name").is_null()) {
        record.name = node.at("name").get<std::string>();
    }
    record.note = node.value("note", "");
    record.total_scans = node.value("total_scans", std::uint64_t{0});
    record.scans_online = node.value("scans_online", std::uint64_t{0});
    record.consecutive_offline = node.value("consecutive_offline", std::uint64_t{0});
    record.first_seen = util::from_iso8601(node.at("first_seen").get<std::string>());
    record.last_seen = util::from_iso8601(node.at("last_seen").get<std::string>());
    if (node.contains("last_seen_online") && !node.at("last_seen_online").is_null()) {
        record.last_seen_online = util::from_iso8601(node.at("last_seen_online").get<std::string>());
    }
    if (record.scans_online > record.total_scans) {
        throw PersistenceError("Device " + record.hardware_id + " has more online scans than scans");
    }
    return record;
}

json scan_to_json(const ScanRecord& scan) {
    return json{{"scan_time", util::to_iso8601(scan.timestamp)},
                {"devices_found", scan.devices_found},
                {"scan_method", scan.method}};
}

ScanRecord scan_from_json(const json& node) {
    ScanRecord scan;
    scan.timestamp = util::from_iso8601(node.at("scan_time").get<std::string>());
    scan.devices_found = node.value("devices_found", std::size_t{0});
    scan.method = node.value("scan_method", "");
    return scan;
}

}  // namespace

PresenceStore::PresenceStore(std::filesystem::path data_dir, std::size_t max_history_entries)
    : data_dir_(std::move(data_dir)), max_history_(max_history_entries) {}

std::filesystem::path PresenceStore::devices_path() const {
    return data_dir_ / "devices.json";
}

std::filesystem::path PresenceStore::scans_path() const {
    return data_dir_ / "scans.jsonl";
}

void PresenceStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_.clear();
    history_.clear();
    scan_count_ = 0;

    std::error_code ec;
    std::filesystem::create_directories(data_dir_, ec);
    if (ec) {
        throw PersistenceError("Failed to create data directory " + data_dir_.string() + ": " + ec.message());
    }

    if (std::filesystem::exists(devices_path())) {
        std::ifstream input(devices_path());
        if (!input) {
            throw PersistenceError("Failed to open device table: " + devices_path().string());
        }
        try {
            json root;
            input >> root;
            if (!root.is_array()) {
                throw PersistenceError("Device table must be a JSON array");
            }
            for (const auto& entry : root) {
                auto record = record_from_json(entry);
                auto key = record.hardware_id;
                devices_.insert_or_assign(std::move(key), std::move(record));
            }
        } catch (const json::exception& ex) {
            throw PersistenceError("Corrupt device table " + devices_path().string() + ": " + ex.what());
        } catch (const std::runtime_error& ex) {
            throw PersistenceError("Corrupt device table " + devices_path().string() + ": " + ex.what());
        }
    }

    if (std::filesystem::exists(scans_path())) {
        std::ifstream input(scans_path());
        if (!input) {
            throw PersistenceError("Failed to open scan log: " + scans_path().string());
        }
        std::string line;
        std::size_t line_number = 0;
        while (std::getline(input, line)) {
            ++line_number;
            if (line.empty()) {
                continue;
            }
            try {
                history_.push_back(scan_from_json(json::parse(line)));
            } catch (const std::exception& ex) {
                // A torn final line is what an interrupted append leaves behind.
                util::log::warn("Skipping scan log line " + std::to_string(line_number) + ": " + ex.what());
                continue;
            }
            ++scan_count_;
            if (history_.size() > max_history_) {
                history_.pop_front();
            }
        }
    }

    util::log::info("Presence store loaded from " + data_dir_.string() + " (" + std::to_string(devices_.size()) +
                    " devices, " + std::to_string(scan_count_) + " scans)");
}

std::vector<DeviceRecord> PresenceStore::devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceRecord> result;
    result.reserve(devices_.size());
    for (const auto& [_, record] : devices_) {
        result.push_back(record);
    }
    return result;
}

const DeviceRecord* PresenceStore::lookup_locked(std::string_view hardware_id_or_address) const {
    auto it = devices_.find(normalize_hardware_id(hardware_id_or_address));
    if (it != devices_.end()) {
        return &it->second;
    }

    // Addresses move between devices; the one seen online there most recently wins.
    const DeviceRecord* best = nullptr;
    for (const auto& [_, record] : devices_) {
        if (record.address != hardware_id_or_address) {
            continue;
        }
        if (!best || record.last_seen_online.value_or(TimePoint{}) > best->last_seen_online.value_or(TimePoint{})) {
            best = &record;
        }
    }
    return best;
}

std::optional<DeviceRecord> PresenceStore::find(std::string_view hardware_id_or_address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* record = lookup_locked(hardware_id_or_address);
    if (!record) {
        return std::nullopt;
    }
    return *record;
}

void PresenceStore::write_devices(const DeviceTable& table) const {
    std::vector<const DeviceRecord*> ordered;
    ordered.reserve(table.size());
    for (const auto& [_, record] : table) {
        ordered.push_back(&record);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const DeviceRecord* a, const DeviceRecord* b) { return a->hardware_id < b->hardware_id; });

    json root = json::array();
    for (const auto* record : ordered) {
        root.push_back(record_to_json(*record));
    }

    auto temp_path = devices_path();
    temp_path += ".tmp";
    {
        std::ofstream output(temp_path, std::ios::trunc);
        if (!output) {
            throw PersistenceError("Failed to write device table: " + temp_path.string());
        }
        output << std::setw(2) << root;
        output.flush();
        if (!output) {
            throw PersistenceError("Failed to flush device table: " + temp_path.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, devices_path(), ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        throw PersistenceError("Failed to replace device table " + devices_path().string());
    }
}

void PresenceStore::append_scan(const ScanRecord& scan) const {
    std::ofstream output(scans_path(), std::ios::app);
    if (!output) {
        throw PersistenceError("Failed to open scan log: " + scans_path().string());
    }
    output << scan_to_json(scan).dump() << '\n';
    output.flush();
    if (!output) {
        throw PersistenceError("Failed to append to scan log: " + scans_path().string());
    }
}

std::vector<DeviceRecord> PresenceStore::commit_cycle(const std::vector<DeviceRecord>& devices,
                                                      const ScanRecord& scan) {
    std::lock_guard<std::mutex> lock(mutex_);

    DeviceTable next = devices_;
    std::vector<DeviceRecord> committed;
    committed.reserve(devices.size());
    for (const auto& incoming : devices) {
        DeviceRecord record = incoming;
        record.hardware_id = normalize_hardware_id(incoming.hardware_id);
        if (auto it = devices_.find(record.hardware_id); it != devices_.end()) {
            record.note = it->second.note;
        }
        committed.push_back(record);
        next.insert_or_assign(record.hardware_id, std::move(record));
    }

    write_devices(next);
    devices_ = std::move(next);

    append_scan(scan);
    history_.push_back(scan);
    ++scan_count_;
    if (history_.size() > max_history_) {
        history_.pop_front();
    }
    return committed;
}

std::optional<DeviceRecord> PresenceStore::set_note(std::string_view hardware_id_or_address, const std::string& note) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* current = lookup_locked(hardware_id_or_address);
    if (!current) {
        return std::nullopt;
    }

    DeviceTable next = devices_;
    auto& record = next.at(current->hardware_id);
    record.note = note;
    DeviceRecord updated = record;

    write_devices(next);
    devices_ = std::move(next);
    return updated;
}

HistoryStats PresenceStore::stats(TimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    HistoryStats stats;
    stats.total_devices = devices_.size();
    stats.total_scans = scan_count_;
    stats.devices.reserve(devices_.size());
    for (const auto& [_, record] : devices_) {
        if (record.last_seen_online && now - *record.last_seen_online < kActiveWindow) {
            ++stats.active_24h;
        }
        stats.devices.push_back(DeviceHistory{.record = record, .category = Categorizer::categorize(record)});
    }
    // Most recently considered first, like the history view expects.
    std::sort(stats.devices.begin(), stats.devices.end(), [](const DeviceHistory& a, const DeviceHistory& b) {
        if (a.record.last_seen != b.record.last_seen) {
            return a.record.last_seen > b.record.last_seen;
        }
        return a.record.hardware_id < b.record.hardware_id;
    });
    return stats;
}

std::vector<ScanRecord> PresenceStore::scan_history(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t available = history_.size();
    const std::size_t count = limit == 0 ? available : std::min(limit, available);
    std::vector<ScanRecord> result;
    result.reserve(count);
    if (count == 0) {
        return result;
    }
    for (auto it = history_.end() - static_cast<std::ptrdiff_t>(count); it != history_.end(); ++it) {
        result.push_back(*it);
    }
    return result;
}

std::size_t PresenceStore::scan_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scan_count_;
}

}  // namespace lanwatch::control
