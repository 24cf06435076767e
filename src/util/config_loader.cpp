#include "lanwatch/util/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include "lanwatch/subnet.hpp"

namespace lanwatch::control {

namespace {

template <typename T>
T scalar_or(const YAML::Node& parent, const char* key, const std::string& section, T fallback) {
    const auto node = parent[key];
    if (!node) {
        return fallback;
    }
    if (!node.IsScalar()) {
        throw ConfigError("Field '" + section + "." + key + "' must be a scalar");
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception& ex) {
        throw ConfigError("Field '" + section + "." + key + "' has invalid value: " + ex.what());
    }
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigError(message);
    }
}

void load_server(const YAML::Node& node, ServerSettings& server) {
    if (!node) {
        return;
    }
    server.host = scalar_or<std::string>(node, "host", "server", server.host);
    const int port = scalar_or<int>(node, "port", "server", server.port);
    require(port >= 1 && port <= 65535, "server.port must be between 1 and 65535");
    server.port = static_cast<std::uint16_t>(port);
}

void load_scan(const YAML::Node& node, ScanSettings& scan) {
    if (!node) {
        return;
    }
    const auto interval = scalar_or<long long>(node, "interval_seconds", "scan", scan.interval.count());
    require(interval >= 1, "scan.interval_seconds must be at least 1");
    scan.interval = std::chrono::seconds(interval);

    const auto grace = scalar_or<long long>(node, "grace_limit", "scan", static_cast<long long>(scan.grace_limit));
    require(grace >= 1, "scan.grace_limit must be at least 1");
    scan.grace_limit = static_cast<std::uint64_t>(grace);

    scan.subnet = scalar_or<std::string>(node, "subnet", "scan", scan.subnet);
    if (scan.subnet != "auto") {
        try {
            const auto subnet = Subnet::parse(scan.subnet);
            require(subnet.prefix_length() >= 16 && subnet.prefix_length() <= 30,
                    "scan.subnet prefix must be between 16 and 30");
        } catch (const std::invalid_argument& ex) {
            throw ConfigError(std::string("scan.subnet: ") + ex.what());
        }
    }

    const auto timeout = scalar_or<long long>(node, "timeout_ms", "scan", scan.timeout.count());
    require(timeout >= 100, "scan.timeout_ms must be at least 100");
    scan.timeout = std::chrono::milliseconds(timeout);

    scan.retries = scalar_or<int>(node, "retries", "scan", scan.retries);
    require(scan.retries >= 0 && scan.retries <= 10, "scan.retries must be between 0 and 10");

    const int probe_port = scalar_or<int>(node, "probe_port", "scan", scan.probe_port);
    require(probe_port >= 1 && probe_port <= 65535, "scan.probe_port must be between 1 and 65535");
    scan.probe_port = static_cast<std::uint16_t>(probe_port);

    scan.arp_table = scalar_or<std::string>(node, "arp_table", "scan", scan.arp_table.string());
    scan.resolve_hostnames = scalar_or<bool>(node, "resolve_hostnames", "scan", scan.resolve_hostnames);

    const auto hostname_timeout =
        scalar_or<long long>(node, "hostname_timeout_ms", "scan", scan.hostname_timeout.count());
    require(hostname_timeout >= 1, "scan.hostname_timeout_ms must be positive");
    scan.hostname_timeout = std::chrono::milliseconds(hostname_timeout);

    scan.include_local_host = scalar_or<bool>(node, "include_local_host", "scan", scan.include_local_host);
}

void load_broadcast(const YAML::Node& node, BroadcastSettings& broadcast) {
    if (!node) {
        return;
    }
    const auto send_timeout =
        scalar_or<long long>(node, "send_timeout_ms", "broadcast", broadcast.send_timeout.count());
    require(send_timeout >= 10, "broadcast.send_timeout_ms must be at least 10");
    broadcast.send_timeout = std::chrono::milliseconds(send_timeout);

    const auto max_pending =
        scalar_or<long long>(node, "max_pending", "broadcast", static_cast<long long>(broadcast.max_pending));
    require(max_pending >= 1, "broadcast.max_pending must be at least 1");
    broadcast.max_pending = static_cast<std::size_t>(max_pending);
}

LanwatchConfig parse_root(const YAML::Node& root) {
    LanwatchConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("Configuration root must be a mapping");
    }

    load_server(root["server"], config.server);
    load_scan(root["scan"], config.scan);
    load_broadcast(root["broadcast"], config.broadcast);

    if (auto storage = root["storage"]; storage) {
        config.storage.data_dir =
            scalar_or<std::string>(storage, "data_dir", "storage", config.storage.data_dir.string());
        require(!config.storage.data_dir.empty(), "storage.data_dir must not be empty");
    }
    if (auto logging = root["logging"]; logging) {
        config.logging.level = scalar_or<std::string>(logging, "level", "logging", config.logging.level);
        config.logging.file = scalar_or<std::string>(logging, "file", "logging", config.logging.file);
    }
    return config;
}

}  // namespace

LanwatchConfig load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& ex) {
        throw ConfigError("Failed to load config '" + path + "': " + ex.what());
    }
    return parse_root(root);
}

LanwatchConfig load_config_from_string(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& ex) {
        throw ConfigError(std::string("Failed to parse config: ") + ex.what());
    }
    return parse_root(root);
}

}  // namespace lanwatch::control
