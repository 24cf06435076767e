#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "lanwatch/device_types.hpp"
#include "lanwatch/discovery_provider.hpp"

namespace lanwatch::control {

// Applies one discovery cycle to the known device table.
//
// Every known device is charged one scan per cycle whether it answered or not,
// so devices that never come back drift towards the "rare" category. A device
// keeps status online until it has missed `grace_limit` consecutive cycles.
class Reconciler {
public:
    // Feeds log lines only; the records are the source of truth.
    struct Events {
        std::vector<std::string> new_devices;
        std::vector<std::string> became_offline;
        std::vector<std::string> became_online;
        CycleCounts counts{};
    };

    struct Result {
        std::vector<DeviceRecord> records;
        std::vector<DeviceView> views;
        Events events;
    };

    explicit Reconciler(std::uint64_t grace_limit = 3);

    Result reconcile(const std::vector<DeviceRecord>& known,
                     const Snapshot* previous,
                     const std::vector<DiscoveredHost>& hits,
                     TimePoint now) const;

    Status status_of(const DeviceRecord& record) const;
    DeviceView view_of(const DeviceRecord& record, Presence presence) const;

    std::uint64_t grace_limit() const { return grace_limit_; }

    // Orders views by numeric IPv4 address, unknown addresses last.
    static void sort_views(std::vector<DeviceView>& views);

private:
    std::uint64_t grace_limit_;
};

}  // namespace lanwatch::control
