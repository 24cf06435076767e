#include "lanwatch/categorizer.hpp"

namespace lanwatch::control {

Category Categorizer::categorize(std::uint64_t total_scans, double appearance_rate) {
    // Low-sample devices stay "new" whatever their rate looks like.
    if (total_scans < kMinimumScans) {
        return Category::New;
    }
    if (appearance_rate >= kRegularRate) {
        return Category::Regular;
    }
    if (appearance_rate >= kOccasionalRate) {
        return Category::Occasional;
    }
    return Category::Rare;
}

Category Categorizer::categorize(const DeviceRecord& record) {
    return categorize(record.total_scans, record.appearance_rate());
}

}  // namespace lanwatch::control
