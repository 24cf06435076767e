#include "lanwatch/app.hpp"

#include <csignal>
#include <utility>

#include <boost/asio/signal_set.hpp>

#include "lanwatch/util/logging.hpp"

namespace lanwatch::control {

namespace {

ArpDiscovery::Options discovery_options(const ScanSettings& scan) {
    ArpDiscovery::Options options;
    options.arp_table = scan.arp_table;
    options.probe_port = scan.probe_port;
    options.resolve_hostnames = scan.resolve_hostnames;
    options.hostname_timeout = scan.hostname_timeout;
    options.include_local_host = scan.include_local_host;
    return options;
}

}  // namespace

LanwatchApp::LanwatchApp(boost::asio::io_context& io_context, LanwatchConfig config, PresenceStore& store,
                         Subnet subnet)
    : io_context_(io_context),
      config_(std::move(config)),
      store_(store),
      discovery_(discovery_options(config_.scan)),
      hub_(io_context_, config_.broadcast.send_timeout, config_.broadcast.max_pending),
      scan_loop_(io_context_, discovery_, store_, hub_, std::move(subnet), config_.scan),
      ws_server_(io_context_),
      command_gateway_(ws_server_, hub_, scan_loop_, store_) {}

void LanwatchApp::start() {
    hub_.set_snapshot_source([this] { return scan_loop_.snapshot(); });

    ws_server_.set_open_handler([this](WsServer::SessionId session_id) { command_gateway_.handle_open(session_id); });
    ws_server_.set_close_handler([this](WsServer::SessionId session_id) { command_gateway_.handle_close(session_id); });
    ws_server_.set_message_handler(
        [this](const nlohmann::json& message, WsServer::SessionId session_id) { command_gateway_.handle_message(message, session_id); });
    ws_server_.set_http_handler(
        [this](const WsServer::HttpRequest& request) { return command_gateway_.handle_http(request); });

    ws_server_.start(config_.server.host, config_.server.port);
    scan_loop_.start();
}

void LanwatchApp::stop() {
    scan_loop_.stop();
    hub_.close_all();
    ws_server_.stop();
}

Subnet resolve_subnet(const std::string& setting) {
    if (setting == "auto") {
        return Subnet::detect_local();
    }
    return Subnet::parse(setting);
}

int run(const std::string& config_path) {
    try {
        auto config = load_config(config_path);
        util::log::configure(config.logging.level, config.logging.file);

        PresenceStore store(config.storage.data_dir);
        try {
            store.load();
        } catch (const PersistenceError& ex) {
            util::log::error(std::string("Cannot open device history: ") + ex.what());
            return 1;
        }
        util::log::info("Loaded " + std::to_string(store.devices().size()) + " known devices from " +
                        store.data_dir().string());

        auto subnet = resolve_subnet(config.scan.subnet);

        boost::asio::io_context io_context;
        LanwatchApp app(io_context, config, store, std::move(subnet));
        app.start();

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int) {
            util::log::info("Signal received, shutting down...");
            app.stop();
            io_context.stop();
        });

        io_context.run();
    } catch (const ConfigError& ex) {
        util::log::error(std::string("Invalid configuration: ") + ex.what());
        return 1;
    } catch (const std::exception& ex) {
        util::log::error(std::string("Fatal error: ") + ex.what());
        return 1;
    }
    return 0;
}

}  // namespace lanwatch::control
