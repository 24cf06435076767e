#include "lanwatch/util/time_format.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace lanwatch::util {

namespace {

std::time_t to_utc_time_t(std::tm tm) {
#if defined(_WIN32)
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

}  // namespace

std::string to_iso8601(std::chrono::system_clock::time_point tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::chrono::system_clock::time_point from_iso8601(const std::string& iso) {
    std::tm tm{};
    std::istringstream iss(iso);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (iss.fail()) {
        throw std::runtime_error("Failed to parse ISO8601 timestamp: " + iso);
    }
    return std::chrono::system_clock::from_time_t(to_utc_time_t(tm));
}

}  // namespace lanwatch::util
