#pragma once

#include <chrono>
#include <string>

namespace lanwatch::util {

std::string to_iso8601(std::chrono::system_clock::time_point tp);

// Throws std::runtime_error when `iso` is not "YYYY-MM-DDTHH:MM:SSZ".
std::chrono::system_clock::time_point from_iso8601(const std::string& iso);

}  // namespace lanwatch::util
