#pragma once

#include <cstddef>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "lanwatch/device_types.hpp"

namespace lanwatch::control {

class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Durable device table plus the append-only scan log. Every mutation reaches
// disk before it becomes visible to readers.
class PresenceStore {
public:
    explicit PresenceStore(std::filesystem::path data_dir, std::size_t max_history_entries = 1024);

    void load();

    std::vector<DeviceRecord> devices() const;
    std::optional<DeviceRecord> find(std::string_view hardware_id_or_address) const;

    // One transaction per scan cycle: either every record in `devices` is
    // committed or none is. Notes already stored win over the notes carried by
    // `devices`. Returns the committed rows.
    std::vector<DeviceRecord> commit_cycle(const std::vector<DeviceRecord>& devices, const ScanRecord& scan);

    std::optional<DeviceRecord> set_note(std::string_view hardware_id_or_address, const std::string& note);

    HistoryStats stats(TimePoint now) const;
    std::vector<ScanRecord> scan_history(std::size_t limit = 0) const;
    std::size_t scan_count() const;

    const std::filesystem::path& data_dir() const { return data_dir_; }

private:
    using DeviceTable = std::unordered_map<std::string, DeviceRecord>;

    std::filesystem::path devices_path() const;
    std::filesystem::path scans_path() const;

    void write_devices(const DeviceTable& table) const;
    void append_scan(const ScanRecord& scan) const;
    const DeviceRecord* lookup_locked(std::string_view hardware_id_or_address) const;

    std::filesystem::path data_dir_;
    const std::size_t max_history_;
    mutable std::mutex mutex_;
    DeviceTable devices_;
    std::deque<ScanRecord> history_;
    std::size_t scan_count_{0};
};

}  // namespace lanwatch::control
