#pragma once

#include <string>

#include <boost/asio/io_context.hpp>

#include "lanwatch/arp_discovery.hpp"
#include "lanwatch/broadcast_hub.hpp"
#include "lanwatch/command_gateway.hpp"
#include "lanwatch/presence_store.hpp"
#include "lanwatch/scan_loop.hpp"
#include "lanwatch/subnet.hpp"
#include "lanwatch/util/config_loader.hpp"
#include "lanwatch/ws_server.hpp"

namespace lanwatch::control {

// The store must already be loaded: the scan loop seeds its first snapshot
// from it.
class LanwatchApp {
public:
    LanwatchApp(boost::asio::io_context& io_context, LanwatchConfig config, PresenceStore& store, Subnet subnet);

    void start();
    void stop();

private:
    boost::asio::io_context& io_context_;
    LanwatchConfig config_;
    PresenceStore& store_;
    ArpDiscovery discovery_;
    BroadcastHub hub_;
    ScanLoop scan_loop_;
    WsServer ws_server_;
    CommandGateway command_gateway_;
};

Subnet resolve_subnet(const std::string& setting);

int run(const std::string& config_path);

}  // namespace lanwatch::control
