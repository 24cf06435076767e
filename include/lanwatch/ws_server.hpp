#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>
#include <boost/system/error_code.hpp>
#include <nlohmann/json.hpp>

namespace lanwatch::control {

// WebSocket endpoint on "/ws" plus plain HTTP on every other target. Each
// session owns a strand and a write queue; handlers run on session strands.
class WsServer {
public:
    using SessionId = std::uint64_t;
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

    using OpenHandler = std::function<void(SessionId)>;
    using CloseHandler = std::function<void(SessionId)>;
    using MessageHandler = std::function<void(const nlohmann::json&, SessionId)>;
    using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;
    using SendHandler = std::function<void(const boost::system::error_code&)>;

    explicit WsServer(boost::asio::io_context& io_context);
    ~WsServer();

    WsServer(const WsServer&) = delete;
    WsServer& operator=(const WsServer&) = delete;

    void set_open_handler(OpenHandler handler);
    void set_close_handler(CloseHandler handler);
    void set_message_handler(MessageHandler handler);
    void set_http_handler(HttpHandler handler);

    // Port 0 binds an ephemeral port; `port()` reports the one bound.
    void start(const std::string& host, std::uint16_t port);
    void stop();
    std::uint16_t port() const { return port_.load(); }

    // Queues `payload`; `handler` fires once the frame is written or dropped.
    // Returns false when the session is gone, in which case `handler` is not called.
    bool send(SessionId session_id, std::shared_ptr<const std::string> payload, SendHandler handler = {});
    bool send(SessionId session_id, const nlohmann::json& message);
    void close(SessionId session_id);

    std::size_t session_count() const;

private:
    class HttpSession;
    class WsSession;

    void do_accept();
    void on_session_open(const std::shared_ptr<WsSession>& session);
    void on_session_closed(SessionId session_id);
    void dispatch_message(const std::string& text, SessionId session_id);
    HttpResponse handle_http(const HttpRequest& request) const;

    boost::asio::io_context& io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> port_{0};
    std::atomic<SessionId> next_session_id_{1};

    mutable std::mutex sessions_mutex_;
    std::unordered_map<SessionId, std::weak_ptr<WsSession>> sessions_;

    OpenHandler open_handler_;
    CloseHandler close_handler_;
    MessageHandler message_handler_;
    HttpHandler http_handler_;
};

}  // namespace lanwatch::control
