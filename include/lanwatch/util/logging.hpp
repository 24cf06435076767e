#pragma once

#include <string>

namespace lanwatch::util::log {

// Installs the console sink (and a file sink when `file_path` is not empty)
// as the default spdlog logger. Unknown level names fall back to "info".
void configure(const std::string& level, const std::string& file_path = {});

void debug(const std::string& message);
void info(const std::string& message);
void warn(const std::string& message);
void error(const std::string& message);

}  // namespace lanwatch::util::log
