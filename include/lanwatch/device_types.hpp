#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lanwatch::control {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class Category { New, Regular, Occasional, Rare };
enum class Status { Online, Offline };

std::string_view to_string(Category category);
std::string_view to_string(Status status);

// One row per hardware address ever observed. The network address is only the
// last known location of the device and is never used as a key.
struct DeviceRecord {
    std::string hardware_id;
    std::string address;
    std::optional<std::string> name;
    std::string note;
    std::uint64_t total_scans{0};
    std::uint64_t scans_online{0};
    std::uint64_t consecutive_offline{0};
    TimePoint first_seen{};
    TimePoint last_seen{};
    std::optional<TimePoint> last_seen_online;

    double appearance_rate() const;
};

struct ScanRecord {
    TimePoint timestamp{};
    std::size_t devices_found{0};
    std::string method;
};

// How a device relates to the previous published snapshot.
enum class Presence { New, Existing, Offline };

std::string_view to_string(Presence presence);

struct DeviceView {
    DeviceRecord record;
    Status status{Status::Online};
    Category category{Category::New};
    Presence presence{Presence::Existing};
};

struct CycleCounts {
    std::size_t online_count{0};
    std::size_t new_count{0};
    std::size_t offline_count{0};
    std::size_t back_online_count{0};
};

// Immutable once published; replaced as a whole by the scan loop.
struct Snapshot {
    std::vector<DeviceView> devices;
    std::optional<TimePoint> timestamp;
    std::optional<TimePoint> next_scan;
    std::chrono::seconds interval{30};
    bool scanning{false};
    std::uint64_t cycle{0};
    CycleCounts counts{};

    std::optional<DeviceView> find(std::string_view hardware_id) const;
};

struct DeviceHistory {
    DeviceRecord record;
    Category category{Category::New};
};

struct HistoryStats {
    std::size_t total_devices{0};
    std::size_t total_scans{0};
    std::size_t active_24h{0};
    std::vector<DeviceHistory> devices;
};

std::string normalize_hardware_id(std::string_view hardware_id);

}  // namespace lanwatch::control
