#pragma once

#include <cstdint>

#include "lanwatch/device_types.hpp"

namespace lanwatch::control {

// Long-run stability classification. Independent of the current online status.
class Categorizer {
public:
    static constexpr std::uint64_t kMinimumScans = 5;
    static constexpr double kRegularRate = 0.7;
    static constexpr double kOccasionalRate = 0.3;

    static Category categorize(std::uint64_t total_scans, double appearance_rate);
    static Category categorize(const DeviceRecord& record);
};

}  // namespace lanwatch::control
