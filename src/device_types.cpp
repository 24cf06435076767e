#include "lanwatch/device_types.hpp"

#include <cctype>

namespace lanwatch::control {

std::string_view to_string(Category category) {
    switch (category) {
    case Category::New:
        return "new";
    case Category::Regular:
        return "regular";
    case Category::Occasional:
        return "occasional";
    case Category::Rare:
        return "rare";
    }
    return "new";
}

std::string_view to_string(Status status) {
    return status == Status::Online ? "online" : "offline";
}

std::string_view to_string(Presence presence) {
    switch (presence) {
    case Presence::New:
        return "new";
    case Presence::Existing:
        return "existing";
    case Presence::Offline:
        return "offline";
    }
    return "existing";
}

double DeviceRecord::appearance_rate() const {
    if (total_scans == 0) {
        return 0.0;
    }
    return static_cast<double>(scans_online) / static_cast<double>(total_scans);
}

std::optional<DeviceView> Snapshot::find(std::string_view hardware_id) const {
    for (const auto& device : devices) {
        if (device.record.hardware_id == hardware_id) {
            return device;
        }
    }
    return std::nullopt;
}

// Accepts "AA-BB-CC-DD-EE-FF", "aabb.ccdd.eeff" or "aa:bb:cc:dd:ee:ff" and
// returns the colon separated lower-case form. Anything that is not 12 hex
// digits is returned lower-cased without separators reinserted.
std::string normalize_hardware_id(std::string_view hardware_id) {
    std::string digits;
    digits.reserve(hardware_id.size());
    for (char c : hardware_id) {
        if (c == ':' || c == '-' || c == '.') {
            continue;
        }
        digits.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    bool all_hex = digits.size() == 12;
    for (char c : digits) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            all_hex = false;
            break;
        }
    }
    if (!all_hex) {
        return digits;
    }

    std::string out;
    out.reserve(17);
    for (std::size_t i = 0; i < digits.size(); i += 2) {
        if (!out.empty()) {
            out.push_back(':');
        }
        out.append(digits, i, 2);
    }
    return out;
}

}  // namespace lanwatch::control
