#include "lanwatch/ws_server.hpp"

#include <chrono>
#include <deque>
#include <utility>
#include <vector>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "lanwatch/util/logging.hpp"

namespace lanwatch::control {

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

constexpr auto kHttpReadTimeout = std::chrono::seconds(30);
constexpr const char* kServerName = "lanwatch/0.1";

WsServer::HttpResponse make_plain_response(const WsServer::HttpRequest& request, http::status status,
                                           const std::string& body) {
    WsServer::HttpResponse response{status, request.version()};
    response.set(http::field::server, kServerName);
    response.set(http::field::content_type, "application/json");
    response.keep_alive(request.keep_alive());
    response.body() = body;
    response.prepare_payload();
    return response;
}

}  // namespace

class WsServer::WsSession : public std::enable_shared_from_this<WsSession> {
public:
    WsSession(WsServer& server, SessionId id, tcp::socket&& socket)
        : server_(server), id_(id), ws_(std::move(socket)) {}

    SessionId id() const { return id_; }

    void run(HttpRequest request) {
        upgrade_ = std::move(request);
        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::response_type& res) { res.set(http::field::server, kServerName); }));
        ws_.async_accept(upgrade_, beast::bind_front_handler(&WsSession::on_accept, shared_from_this()));
    }

    void send(std::shared_ptr<const std::string> payload, SendHandler handler) {
        asio::post(ws_.get_executor(), [self = shared_from_this(), payload = std::move(payload),
                                        handler = std::move(handler)]() mutable {
            if (self->finished_) {
                if (handler) {
                    handler(asio::error::not_connected);
                }
                return;
            }
            self->queue_.push_back(Outgoing{std::move(payload), std::move(handler)});
            if (self->queue_.size() == 1) {
                self->do_write();
            }
        });
    }

    void close() {
        asio::post(ws_.get_executor(), [self = shared_from_this()] {
            beast::error_code ec;
            beast::get_lowest_layer(self->ws_).socket().shutdown(tcp::socket::shutdown_both, ec);
            beast::get_lowest_layer(self->ws_).close();
        });
    }

private:
    struct Outgoing {
        std::shared_ptr<const std::string> payload;
        SendHandler handler;
    };

    void on_accept(beast::error_code ec) {
        if (ec) {
            util::log::warn("WebSocket handshake failed: " + ec.message());
            return;
        }
        accepted_ = true;
        server_.on_session_open(shared_from_this());
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_, beast::bind_front_handler(&WsSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec != websocket::error::closed && ec != asio::error::operation_aborted) {
                util::log::debug("WebSocket session " + std::to_string(id_) + " read error: " + ec.message());
            }
            finish(ec);
            return;
        }
        auto text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        server_.dispatch_message(text, id_);
        do_read();
    }

    void do_write() {
        writing_ = true;
        ws_.text(true);
        ws_.async_write(asio::buffer(*queue_.front().payload),
                        beast::bind_front_handler(&WsSession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        writing_ = false;
        auto sent = std::move(queue_.front());
        queue_.pop_front();
        if (sent.handler) {
            sent.handler(ec);
        }
        if (finished_) {
            return;
        }
        if (ec) {
            finish(ec);
            return;
        }
        if (!queue_.empty()) {
            do_write();
        }
    }

    void finish(beast::error_code ec) {
        if (finished_) {
            return;
        }
        finished_ = true;

        // The frame being written is settled by on_write; the rest never leave.
        const std::size_t keep = writing_ ? 1 : 0;
        while (queue_.size() > keep) {
            auto item = std::move(queue_.back());
            queue_.pop_back();
            if (item.handler) {
                item.handler(ec ? ec : beast::error_code(asio::error::operation_aborted));
            }
        }

        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);
        if (accepted_) {
            server_.on_session_closed(id_);
        }
    }

    WsServer& server_;
    const SessionId id_;
    websocket::stream<beast::tcp_stream> ws_;
    HttpRequest upgrade_;
    beast::flat_buffer buffer_;
    std::deque<Outgoing> queue_;
    bool accepted_{false};
    bool writing_{false};
    bool finished_{false};
};

class WsServer::HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(WsServer& server, tcp::socket&& socket) : server_(server), stream_(std::move(socket)) {}

    void run() {
        asio::dispatch(stream_.get_executor(), beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
    }

private:
    void do_read() {
        request_ = {};
        stream_.expires_after(kHttpReadTimeout);
        http::async_read(stream_, buffer_, request_,
                         beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            return;
        }
        if (ec) {
            return;
        }

        if (websocket::is_upgrade(request_)) {
            if (request_.target() != "/ws") {
                send_response(make_plain_response(request_, http::status::not_found,
                                                  R"({"success":false,"message":"WebSocket endpoint is /ws"})"));
                return;
            }
            const auto id = server_.next_session_id_++;
            auto session = std::make_shared<WsSession>(server_, id, stream_.release_socket());
            session->run(std::move(request_));
            return;
        }

        send_response(server_.handle_http(request_));
    }

    void send_response(HttpResponse response) {
        auto shared = std::make_shared<HttpResponse>(std::move(response));
        http::async_write(stream_, *shared,
                          [self = shared_from_this(), shared](beast::error_code ec, std::size_t) {
                              self->on_write(shared->need_eof(), ec);
                          });
    }

    void on_write(bool close, beast::error_code ec) {
        if (ec) {
            return;
        }
        if (close) {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            return;
        }
        do_read();
    }

    WsServer& server_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    HttpRequest request_;
};

WsServer::WsServer(asio::io_context& io_context) : io_context_(io_context), acceptor_(io_context) {}

WsServer::~WsServer() {
    stop();
}

void WsServer::set_open_handler(OpenHandler handler) {
    open_handler_ = std::move(handler);
}

void WsServer::set_close_handler(CloseHandler handler) {
    close_handler_ = std::move(handler);
}

void WsServer::set_message_handler(MessageHandler handler) {
    message_handler_ = std::move(handler);
}

void WsServer::set_http_handler(HttpHandler handler) {
    http_handler_ = std::move(handler);
}

void WsServer::start(const std::string& host, std::uint16_t port) {
    const tcp::endpoint endpoint(asio::ip::make_address(host), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    port_ = acceptor_.local_endpoint().port();
    running_ = true;
    util::log::info("Listening on " + host + ":" + std::to_string(port_.load()) + " (WebSocket: /ws)");
    do_accept();
}

void WsServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    beast::error_code ec;
    acceptor_.close(ec);

    std::vector<std::shared_ptr<WsSession>> open_sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& [_, weak] : sessions_) {
            if (auto session = weak.lock()) {
                open_sessions.push_back(std::move(session));
            }
        }
    }
    for (const auto& session : open_sessions) {
        session->close();
    }
}

void WsServer::do_accept() {
    acceptor_.async_accept(asio::make_strand(io_context_), [this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                util::log::warn("Accept failed: " + ec.message());
            }
        } else {
            std::make_shared<HttpSession>(*this, std::move(socket))->run();
        }
        if (running_) {
            do_accept();
        }
    });
}

void WsServer::on_session_open(const std::shared_ptr<WsSession>& session) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[session->id()] = session;
    }
    if (open_handler_) {
        open_handler_(session->id());
    }
}

void WsServer::on_session_closed(SessionId session_id) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.erase(session_id);
    }
    if (close_handler_) {
        close_handler_(session_id);
    }
}

void WsServer::dispatch_message(const std::string& text, SessionId session_id) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& ex) {
        util::log::warn("Session " + std::to_string(session_id) + " sent invalid JSON: " + ex.what());
        send(session_id, nlohmann::json{{"type", "error"}, {"code", "bad_request"}, {"message", "Invalid JSON"}});
        return;
    }
    if (message_handler_) {
        message_handler_(message, session_id);
    }
}

WsServer::HttpResponse WsServer::handle_http(const HttpRequest& request) const {
    if (!http_handler_) {
        return make_plain_response(request, http::status::not_found, R"({"success":false})");
    }
    return http_handler_(request);
}

bool WsServer::send(SessionId session_id, std::shared_ptr<const std::string> payload, SendHandler handler) {
    std::shared_ptr<WsSession> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        session = it->second.lock();
    }
    if (!session) {
        return false;
    }
    session->send(std::move(payload), std::move(handler));
    return true;
}

bool WsServer::send(SessionId session_id, const nlohmann::json& message) {
    return send(session_id, std::make_shared<const std::string>(message.dump()));
}

void WsServer::close(SessionId session_id) {
    std::shared_ptr<WsSession> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end()) {
            session = it->second.lock();
        }
    }
    if (session) {
        session->close();
    }
}

std::size_t WsServer::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

}  // namespace lanwatch::control
