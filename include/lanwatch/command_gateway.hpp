#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "lanwatch/broadcast_hub.hpp"
#include "lanwatch/presence_store.hpp"
#include "lanwatch/scan_loop.hpp"
#include "lanwatch/ws_server.hpp"

namespace lanwatch::control {

// Binds transport sessions to the engine: every WebSocket session becomes a
// hub observer, and inbound commands or HTTP requests are answered here.
class CommandGateway {
public:
    CommandGateway(WsServer& ws_server, BroadcastHub& hub, ScanLoop& scan_loop, PresenceStore& store);

    void handle_open(WsServer::SessionId session_id);
    void handle_close(WsServer::SessionId session_id);
    void handle_message(const nlohmann::json& message, WsServer::SessionId session_id);
    WsServer::HttpResponse handle_http(const WsServer::HttpRequest& request);

    // Shared by the WebSocket and HTTP paths. Returns the reply document and
    // whether the device was found.
    nlohmann::json set_note(const std::string& id, const std::string& note, bool* found = nullptr);
    nlohmann::json scan_now();

private:
    WsServer& ws_server_;
    BroadcastHub& hub_;
    ScanLoop& scan_loop_;
    PresenceStore& store_;

    std::mutex mutex_;
    std::unordered_map<WsServer::SessionId, BroadcastHub::ObserverId> observers_;
};

}  // namespace lanwatch::control
