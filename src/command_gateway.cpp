#include "lanwatch/command_gateway.hpp"

#include <cctype>
#include <memory>
#include <string_view>

#include <boost/asio/error.hpp>

#include "lanwatch/event_codec.hpp"
#include "lanwatch/util/logging.hpp"

namespace lanwatch::control {

namespace {

namespace http = boost::beast::http;
using Json = nlohmann::json;

constexpr std::string_view kNotesPrefix = "/api/devices/";
constexpr std::string_view kNotesSuffix = "/notes";

class SessionObserver : public Observer {
public:
    SessionObserver(WsServer& ws_server, WsServer::SessionId session_id)
        : ws_server_(ws_server), session_id_(session_id) {}

    void deliver(std::shared_ptr<const std::string> payload, DeliveryHandler on_complete) override {
        if (!ws_server_.send(session_id_, std::move(payload), on_complete)) {
            on_complete(boost::asio::error::not_connected);
        }
    }

    void close() override { ws_server_.close(session_id_); }

    std::string describe() const override { return "session-" + std::to_string(session_id_); }

private:
    WsServer& ws_server_;
    const WsServer::SessionId session_id_;
};

std::string percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size() &&
            std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(std::string(text.substr(i + 1, 2)), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(text[i]);
        }
    }
    return out;
}

std::size_t query_limit(std::string_view query, std::size_t fallback) {
    const auto pos = query.find("limit=");
    if (pos == std::string_view::npos) {
        return fallback;
    }
    std::size_t value = 0;
    bool any = false;
    for (auto i = pos + 6; i < query.size() && std::isdigit(static_cast<unsigned char>(query[i])); ++i) {
        value = value * 10 + static_cast<std::size_t>(query[i] - '0');
        any = true;
    }
    return any ? value : fallback;
}

WsServer::HttpResponse json_response(const WsServer::HttpRequest& request, http::status status, const Json& body) {
    WsServer::HttpResponse response{status, request.version()};
    response.set(http::field::server, "lanwatch/0.1");
    response.set(http::field::content_type, "application/json");
    response.set(http::field::access_control_allow_origin, "*");
    response.keep_alive(request.keep_alive());
    response.body() = body.dump();
    response.prepare_payload();
    return response;
}

}  // namespace

CommandGateway::CommandGateway(WsServer& ws_server, BroadcastHub& hub, ScanLoop& scan_loop, PresenceStore& store)
    : ws_server_(ws_server), hub_(hub), scan_loop_(scan_loop), store_(store) {}

void CommandGateway::handle_open(WsServer::SessionId session_id) {
    auto observer = std::make_shared<SessionObserver>(ws_server_, session_id);
    const auto observer_id = hub_.register_observer(std::move(observer));
    std::lock_guard<std::mutex> lock(mutex_);
    observers_[session_id] = observer_id;
}

void CommandGateway::handle_close(WsServer::SessionId session_id) {
    BroadcastHub::ObserverId observer_id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = observers_.find(session_id);
        if (it == observers_.end()) {
            return;
        }
        observer_id = it->second;
        observers_.erase(it);
    }
    hub_.deregister_observer(observer_id);
}

Json CommandGateway::scan_now() {
    const bool started = scan_loop_.trigger_scan_now();
    if (started) {
        util::log::info("Client requested immediate scan");
    } else {
        util::log::info("Client requested immediate scan while one is running; reusing it");
    }
    return Json{{"type", "scan_ack"}, {"started", started}, {"scanning", true}};
}

Json CommandGateway::set_note(const std::string& id, const std::string& note, bool* found) {
    if (found) {
        *found = false;
    }
    try {
        auto updated = store_.set_note(id, note);
        if (!updated) {
            util::log::debug("Note update for unknown device " + id);
            return codec::make_error("not_found", "Unknown device: " + id);
        }
        if (found) {
            *found = true;
        }
        util::log::info("Updated note for " + updated->hardware_id);
        return Json{{"type", "note_updated"}, {"success", true}, {"device", codec::record_to_json(*updated)}};
    } catch (const PersistenceError& ex) {
        util::log::error(std::string("Failed to store note: ") + ex.what());
        if (found) {
            *found = true;
        }
        return codec::make_error("persistence_error", ex.what());
    }
}

void CommandGateway::handle_message(const Json& message, WsServer::SessionId session_id) {
    if (!message.is_object()) {
        ws_server_.send(session_id, codec::make_error("bad_request", "Messages must be JSON objects"));
        return;
    }
    Json reply;
    try {
        const auto type = message.value("type", std::string{});
        if (type == "scan_now") {
            reply = scan_now();
        } else if (type == "set_note") {
            const auto id = message.value("id", message.value("mac", message.value("ip", std::string{})));
            if (id.empty()) {
                reply = codec::make_error("bad_request", "set_note requires 'id'");
            } else {
                reply = set_note(id, message.value("note", message.value("notes", std::string{})));
            }
        } else if (type == "get_snapshot") {
            reply = codec::make_snapshot_reply(*scan_loop_.snapshot());
        } else if (type == "get_stats") {
            reply = codec::make_history_stats(store_.stats(Clock::now()));
        } else if (type == "get_scans") {
            reply = codec::make_scan_history(store_.scan_history(message.value("limit", std::size_t{50})));
        } else if (type == "ping") {
            reply = Json{{"type", "pong"}};
        } else {
            reply = codec::make_error("unknown_type", "Unsupported message type: " + type);
        }
    } catch (const Json::exception& ex) {
        reply = codec::make_error("bad_request", ex.what());
    }
    ws_server_.send(session_id, reply);
}

WsServer::HttpResponse CommandGateway::handle_http(const WsServer::HttpRequest& request) {
    const std::string_view target(request.target().data(), request.target().size());
    const auto query_pos = target.find('?');
    const auto path = target.substr(0, query_pos);
    const auto query = query_pos == std::string_view::npos ? std::string_view{} : target.substr(query_pos + 1);

    if (request.method() == http::verb::options) {
        auto response = json_response(request, http::status::no_content, Json::object());
        response.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
        response.set(http::field::access_control_allow_headers, "Content-Type");
        response.body().clear();
        response.prepare_payload();
        return response;
    }

    if (request.method() == http::verb::get) {
        if (path == "/") {
            return json_response(request, http::status::ok,
                                 Json{{"message", "Local Network Device Control Plane API"},
                                      {"websocket", "/ws"},
                                      {"rest_api", "/api/devices"}});
        }
        if (path == "/api/devices") {
            auto body = codec::make_snapshot_reply(*scan_loop_.snapshot());
            body["success"] = true;
            return json_response(request, http::status::ok, body);
        }
        if (path == "/api/database/stats") {
            return json_response(request, http::status::ok, codec::make_history_stats(store_.stats(Clock::now())));
        }
        if (path == "/api/scans") {
            return json_response(request, http::status::ok,
                                 codec::make_scan_history(store_.scan_history(query_limit(query, 50))));
        }
    }

    if (request.method() == http::verb::post) {
        if (path == "/api/scan") {
            return json_response(request, http::status::accepted, scan_now());
        }
        if (path.size() > kNotesPrefix.size() + kNotesSuffix.size() && path.substr(0, kNotesPrefix.size()) == kNotesPrefix &&
            path.substr(path.size() - kNotesSuffix.size()) == kNotesSuffix) {
            const auto id = percent_decode(
                path.substr(kNotesPrefix.size(), path.size() - kNotesPrefix.size() - kNotesSuffix.size()));
            Json body;
            try {
                body = Json::parse(request.body());
            } catch (const Json::exception&) {
                return json_response(request, http::status::bad_request,
                                     Json{{"success", false}, {"message", "Body must be JSON"}});
            }
            if (!body.is_object()) {
                return json_response(request, http::status::bad_request,
                                     Json{{"success", false}, {"message", "Body must be a JSON object"}});
            }
            if (!body.contains("notes") || !body.at("notes").is_string()) {
                return json_response(request, http::status::bad_request,
                                     Json{{"success", false}, {"message", "'notes' must be a string"}});
            }
            bool found = false;
            auto reply = set_note(id, body.at("notes").get<std::string>(), &found);
            if (!found) {
                return json_response(request, http::status::not_found,
                                     Json{{"success", false}, {"message", reply.value("message", "")}});
            }
            if (reply.value("type", "") == "error") {
                return json_response(request, http::status::internal_server_error,
                                     Json{{"success", false}, {"message", reply.value("message", "")}});
            }
            return json_response(request, http::status::ok,
                                 Json{{"success", true}, {"message", "Notes updated"}, {"device", reply["device"]}});
        }
    }

    return json_response(request, http::status::not_found,
                         Json{{"success", false}, {"message", "No route for " + std::string(path)}});
}

}  // namespace lanwatch::control
