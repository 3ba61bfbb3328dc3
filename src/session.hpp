#pragma once

#include "metrics.hpp"
#include "router.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace portgate {

struct ProxySettings {
    // Target of the 307 sent for unmapped subdomains.
    std::string dashboard_url = "http://127.0.0.1:8080";
    std::chrono::seconds connect_timeout{5};
    std::chrono::seconds idle_timeout{60};
    std::chrono::seconds response_timeout{60};
    std::uint64_t body_limit = 64ull * 1024 * 1024;
};

// One accepted proxy connection. Serves keep-alive requests one at a time,
// forwarding each to the backend picked by the Router and streaming the
// response back; a WebSocket upgrade hands both sockets over to a Tunnel and
// ends the session.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(boost::asio::ip::tcp::socket client_socket,
            std::shared_ptr<const Router> router,
            ProxySettings settings,
            MetricsPtr metrics);
    ~Session();

    void start();

private:
    using tcp = boost::asio::ip::tcp;
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    void do_read_request();
    void on_read_request(const boost::beast::error_code& ec, std::size_t length);
    void route_request();

    void connect_backend(bool upgrade);
    void on_backend_connect(const boost::beast::error_code& ec, bool upgrade);
    void forward_request();
    void on_forward_write(const boost::beast::error_code& ec, std::size_t length);
    void on_backend_header(const boost::beast::error_code& ec, std::size_t length);

    // Response relay: backend body chunks pass through relay_buffer_ as they arrive.
    void do_relay_read();
    void on_relay_read(boost::beast::error_code ec, std::size_t length);
    void do_relay_write();
    void on_relay_write(boost::beast::error_code ec, std::size_t length);
    void finish_relay();
    void abort_relay(const boost::beast::error_code& ec, const char* where);

    void start_tunnel();
    void on_upgrade_written(const boost::beast::error_code& ec, std::size_t length);

    void send_redirect();
    void send_bad_gateway(const boost::beast::error_code& ec);
    void send_error(boost::beast::http::status status, std::string text);
    void write_response();
    void on_write_response(const boost::beast::error_code& ec, std::size_t length);

    void close_backend();
    void close_client();

    std::shared_ptr<const Router> router_;
    ProxySettings settings_;
    MetricsPtr metrics_;

    boost::beast::tcp_stream client_;
    boost::beast::tcp_stream backend_;
    boost::beast::flat_buffer client_buffer_;
    boost::beast::flat_buffer backend_buffer_;

    std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> request_parser_;
    std::optional<boost::beast::http::response_parser<boost::beast::http::buffer_body>> relay_parser_;
    std::optional<boost::beast::http::response_serializer<boost::beast::http::buffer_body>> relay_serializer_;
    std::array<char, 16384> relay_buffer_{};
    Request request_;
    Response response_;
    RouteDecision route_;
    bool keep_alive_ = false;
    bool head_request_ = false;

    std::string remote_address_;
    std::string remote_label_;
};

} // namespace portgate
