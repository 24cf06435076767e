#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace lanwatch::control {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ServerSettings {
    std::string host{"0.0.0.0"};
    std::uint16_t port{8000};
};

struct ScanSettings {
    std::chrono::seconds interval{30};
    std::uint64_t grace_limit{3};
    std::string subnet{"auto"};
    std::chrono::milliseconds timeout{3000};
    int retries{3};
    std::uint16_t probe_port{9};
    std::filesystem::path arp_table{"/proc/net/arp"};
    bool resolve_hostnames{true};
    std::chrono::milliseconds hostname_timeout{500};
    bool include_local_host{true};
};

struct BroadcastSettings {
    std::chrono::milliseconds send_timeout{2000};
    std::size_t max_pending{8};
};

struct StorageSettings {
    std::filesystem::path data_dir{"./data"};
};

struct LoggingSettings {
    std::string level{"info"};
    std::string file;
};

struct LanwatchConfig {
    ServerSettings server;
    ScanSettings scan;
    BroadcastSettings broadcast;
    StorageSettings storage;
    LoggingSettings logging;
};

LanwatchConfig load_config(const std::string& path);
LanwatchConfig load_config_from_string(const std::string& yaml_text);

}  // namespace lanwatch::control
