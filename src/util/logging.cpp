#include "lanwatch/util/logging.hpp"

#include <map>
#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace lanwatch::util::log {

namespace {

spdlog::level::level_enum parse_level(const std::string& name) {
    static const std::map<std::string, spdlog::level::level_enum> kLevels = {
        {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},   {"critical", spdlog::level::critical}};
    auto it = kLevels.find(name);
    if (it == kLevels.end()) {
        spdlog::warn("Unknown log level '{}', fallback to 'info'", name);
        return spdlog::level::info;
    }
    return it->second;
}

}  // namespace

void configure(const std::string& level, const std::string& file_path) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!file_path.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path));
    }

    auto logger = std::make_shared<spdlog::logger>("lanwatch", sinks.begin(), sinks.end());
    logger->set_level(parse_level(level));
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(std::move(logger));
}

void debug(const std::string& message) {
    spdlog::debug(message);
}

void info(const std::string& message) {
    spdlog::info(message);
}

void warn(const std::string& message) {
    spdlog::warn(message);
}

void error(const std::string& message) {
    spdlog::error(message);
}

}  // namespace lanwatch::util::log
