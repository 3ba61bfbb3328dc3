#include "session.hpp"

#include "tunnel.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/address_v4.hpp>

#include <iostream>
#include <string_view>
#include <vector>

namespace portgate {

namespace {

namespace beast = boost::beast;
namespace http = boost::beast::http;

std::string_view to_view(beast::string_view sv) {
    return std::string_view(sv.data(), sv.size());
}

std::string_view trim_view(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
    return text;
}

// RFC 7230 6.1: fixed hop-by-hop set plus whatever Connection names.
void strip_hop_by_hop(http::fields& fields) {
    std::vector<std::string> listed;
    std::string_view connection = to_view(fields[http::field::connection]);
    while (!connection.empty()) {
        const auto comma = connection.find(',');
        const auto token = trim_view(connection.substr(0, comma));
        if (!token.empty()) listed.emplace_back(token);
        if (comma == std::string_view::npos) break;
        connection.remove_prefix(comma + 1);
    }

    fields.erase(http::field::connection);
    fields.erase(http::field::keep_alive);
    fields.erase(http::field::proxy_authenticate);
    fields.erase(http::field::proxy_authorization);
    fields.erase(http::field::te);
    fields.erase(http::field::trailer);
    fields.erase(http::field::transfer_encoding);
    fields.erase(http::field::upgrade);
    fields.erase("Proxy-Connection");
    for (const auto& name : listed) {
        fields.erase(name);
    }
}

bool is_bodyless_status(unsigned status) {
    return (status >= 100 && status < 200) || status == 204 || status == 304;
}

bool is_quiet_error(const beast::error_code& ec) {
    return ec == boost::asio::error::operation_aborted ||
           ec == boost::asio::error::eof ||
           ec == boost::asio::error::connection_reset ||
           ec == beast::error::timeout;
}

} // namespace

Session::Session(tcp::socket client_socket,
                 std::shared_ptr<const Router> router,
                 ProxySettings settings,
                 MetricsPtr metrics)
    : router_(std::move(router)),
      settings_(std::move(settings)),
      metrics_(std::move(metrics)),
      client_(std::move(client_socket)),
      backend_(client_.get_executor()) {
    boost::system::error_code ec;
    auto remote = client_.socket().remote_endpoint(ec);
    if (!ec) {
        remote_address_ = remote.address().to_string();
        remote_label_ = remote_address_ + ":" + std::to_string(remote.port());
    } else {
        remote_label_ = "unknown";
    }
    if (metrics_) {
        metrics_->proxy_connections.fetch_add(1, std::memory_order_relaxed);
        metrics_->active_proxy_sessions.fetch_add(1, std::memory_order_relaxed);
    }
}

Session::~Session() {
    if (metrics_) {
        metrics_->active_proxy_sessions.fetch_sub(1, std::memory_order_relaxed);
    }
}

void Session::start() {
    boost::asio::dispatch(client_.get_executor(),
                          beast::bind_front_handler(&Session::do_read_request, shared_from_this()));
}

void Session::do_read_request() {
    request_parser_.emplace();
    request_parser_->body_limit(settings_.body_limit);
    client_.expires_after(settings_.idle_timeout);
    http::async_read(client_, client_buffer_, *request_parser_,
                     beast::bind_front_handler(&Session::on_read_request, shared_from_this()));
}

void Session::on_read_request(const beast::error_code& ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        close_client();
        return;
    }
    if (ec) {
        if (!is_quiet_error(ec)) {
            std::cerr << "[proxy] Read error from " << remote_label_ << ": " << ec.message() << "\n";
        }
        close_client();
        return;
    }

    request_ = request_parser_->release();
    keep_alive_ = request_.keep_alive();
    head_request_ = request_.method() == http::verb::head;
    route_request();
}

void Session::route_request() {
    route_ = router_->select(to_view(request_[http::field::host]));
    if (metrics_) {
        metrics_->proxied_requests.fetch_add(1, std::memory_order_relaxed);
    }

    if (route_.kind == RouteKind::Unmapped) {
        send_redirect();
        return;
    }

    const bool upgrade = is_websocket_upgrade(to_view(request_[http::field::connection]),
                                              to_view(request_[http::field::upgrade]));
    connect_backend(upgrade);
}

void Session::connect_backend(bool upgrade) {
    const tcp::endpoint endpoint(boost::asio::ip::address_v4::loopback(), route_.port);
    backend_.expires_after(settings_.connect_timeout);
    backend_.async_connect(endpoint,
        [self = shared_from_this(), upgrade](const beast::error_code& ec) {
            self->on_backend_connect(ec, upgrade);
        });
}

void Session::on_backend_connect(const beast::error_code& ec, bool upgrade) {
    if (ec) {
        send_bad_gateway(ec);
        return;
    }
    if (upgrade) {
        start_tunnel();
    } else {
        forward_request();
    }
}

void Session::forward_request() {
    const std::string host(request_[http::field::host]);
    const std::string prior_for(request_["X-Forwarded-For"]);

    strip_hop_by_hop(request_);
    if (!remote_address_.empty()) {
        request_.set("X-Forwarded-For", prior_for.empty() ? remote_address_ : prior_for + ", " + remote_address_);
    }
    request_.set("X-Forwarded-Host", host);
    request_.set("X-Forwarded-Proto", "http");
    if (!request_.body().empty()) {
        request_.content_length(request_.body().size());
    }
    // One upstream connection per request.
    request_.keep_alive(false);

    backend_.expires_after(settings_.response_timeout);
    http::async_write(backend_, request_,
                      beast::bind_front_handler(&Session::on_forward_write, shared_from_this()));
}

void Session::on_forward_write(const beast::error_code& ec, std::size_t) {
    if (ec) {
        send_bad_gateway(ec);
        return;
    }

    relay_parser_.emplace();
    // Streams and downloads have no size bound; the body never sits in memory.
    relay_parser_->body_limit(boost::none);
    if (head_request_) {
        relay_parser_->skip(true);
    }
    backend_.expires_after(settings_.response_timeout);
    http::async_read_header(backend_, backend_buffer_, *relay_parser_,
                            beast::bind_front_handler(&Session::on_backend_header, shared_from_this()));
}

void Session::on_backend_header(const beast::error_code& ec, std::size_t) {
    if (ec) {
        relay_parser_.reset();
        send_bad_gateway(ec);
        return;
    }

    auto& res = relay_parser_->get();
    const auto length = relay_parser_->content_length();
    const bool header_only = head_request_ || is_bodyless_status(res.result_int());

    strip_hop_by_hop(res);
    res.version(request_.version());
    if (length) {
        res.content_length(*length);
    } else if (!header_only) {
        if (request_.version() >= 11) {
            res.chunked(true);
        } else {
            // HTTP/1.0 client: the body ends when the connection does.
            keep_alive_ = false;
        }
    }
    res.keep_alive(keep_alive_);

    relay_serializer_.emplace(res);
    client_.expires_after(settings_.response_timeout);
    http::async_write_header(client_, *relay_serializer_,
                             beast::bind_front_handler(&Session::on_relay_write, shared_from_this()));
}

void Session::do_relay_read() {
    auto& body = relay_parser_->get().body();
    if (relay_parser_->is_done()) {
        body.data = nullptr;
        body.size = 0;
        body.more = false;
        do_relay_write();
        return;
    }

    body.data = relay_buffer_.data();
    body.size = relay_buffer_.size();
    backend_.expires_after(settings_.idle_timeout);
    http::async_read(backend_, backend_buffer_, *relay_parser_,
                     beast::bind_front_handler(&Session::on_relay_read, shared_from_this()));
}

void Session::on_relay_read(beast::error_code ec, std::size_t) {
    // need_buffer only means relay_buffer_ is full.
    if (ec == http::error::need_buffer) ec = {};
    if (ec) {
        abort_relay(ec, "read from backend");
        return;
    }

    auto& body = relay_parser_->get().body();
    body.size = relay_buffer_.size() - body.size;
    body.data = relay_buffer_.data();
    body.more = !relay_parser_->is_done();
    do_relay_write();
}

void Session::do_relay_write() {
    client_.expires_after(settings_.response_timeout);
    http::async_write(client_, *relay_serializer_,
                      beast::bind_front_handler(&Session::on_relay_write, shared_from_this()));
}

void Session::on_relay_write(beast::error_code ec, std::size_t) {
    if (ec == http::error::need_buffer) ec = {};
    if (ec) {
        abort_relay(ec, "write to client");
        return;
    }
    if (relay_serializer_->is_done()) {
        finish_relay();
        return;
    }
    do_relay_read();
}

void Session::finish_relay() {
    const bool close = !keep_alive_ || relay_parser_->get().need_eof();
    relay_serializer_.reset();
    relay_parser_.reset();
    close_backend();
    if (close) {
        close_client();
        return;
    }
    do_read_request();
}

void Session::abort_relay(const beast::error_code& ec, const char* where) {
    // The status line is already out, so the only signal left is closing.
    if (!is_quiet_error(ec)) {
        std::cerr << "[proxy] Relay " << where << " failed for " << remote_label_
                  << " (127.0.0.1:" << route_.port << "): " << ec.message() << "\n";
    }
    relay_serializer_.reset();
    relay_parser_.reset();
    close_backend();
    close_client();
}

void Session::start_tunnel() {
    if (!client_.socket().is_open()) {
        std::cerr << "[proxy] Cannot take over client socket " << remote_label_ << "\n";
        close_backend();
        send_error(http::status::internal_server_error, "websocket hijack failed");
        return;
    }

    // The upgrade request goes to the backend exactly as received.
    backend_.expires_after(settings_.connect_timeout);
    http::async_write(backend_, request_,
                      beast::bind_front_handler(&Session::on_upgrade_written, shared_from_this()));
}

void Session::on_upgrade_written(const beast::error_code& ec, std::size_t) {
    if (ec) {
        std::cerr << "[proxy] Upgrade forward to 127.0.0.1:" << route_.port << " failed: " << ec.message() << "\n";
        close_backend();
        close_client();
        return;
    }

    std::string pending = beast::buffers_to_string(client_buffer_.data());
    client_buffer_.consume(client_buffer_.size());
    client_.expires_never();
    backend_.expires_never();

    std::string label = remote_label_ + " -> 127.0.0.1:" + std::to_string(route_.port);
    std::cout << "[proxy] WebSocket tunnel " << label << "\n";
    auto tunnel = std::make_shared<Tunnel>(client_.release_socket(), backend_.release_socket(),
                                           metrics_, std::move(label));
    tunnel->start(std::move(pending));
}

void Session::send_redirect() {
    if (metrics_) {
        metrics_->redirects.fetch_add(1, std::memory_order_relaxed);
    }
    response_ = Response{http::status::temporary_redirect, request_.version()};
    response_.set(http::field::location, settings_.dashboard_url);
    response_.set(http::field::content_type, "text/html; charset=utf-8");
    response_.body() = "<a href=\"" + settings_.dashboard_url + "\">Temporary Redirect</a>.\n";
    response_.keep_alive(keep_alive_);
    response_.prepare_payload();
    write_response();
}

void Session::send_bad_gateway(const beast::error_code& ec) {
    std::cerr << "[proxy] Backend 127.0.0.1:" << route_.port;
    if (!route_.subdomain.empty()) std::cerr << " (" << route_.subdomain << ")";
    std::cerr << " error for " << remote_label_ << ": " << ec.message() << "\n";
    if (metrics_) {
        metrics_->bad_gateway.fetch_add(1, std::memory_order_relaxed);
    }
    close_backend();
    send_error(http::status::bad_gateway, "502 Bad Gateway");
}

void Session::send_error(http::status status, std::string text) {
    response_ = Response{status, request_.version()};
    response_.set(http::field::content_type, "text/plain; charset=utf-8");
    response_.set("X-Content-Type-Options", "nosniff");
    response_.body() = std::move(text) + "\n";
    response_.keep_alive(keep_alive_);
    response_.prepare_payload();
    write_response();
}

void Session::write_response() {
    client_.expires_after(settings_.response_timeout);
    http::async_write(client_, response_,
                      beast::bind_front_handler(&Session::on_write_response, shared_from_this()));
}

void Session::on_write_response(const beast::error_code& ec, std::size_t) {
    if (ec) {
        if (!is_quiet_error(ec)) {
            std::cerr << "[proxy] Write error to " << remote_label_ << ": " << ec.message() << "\n";
        }
        close_client();
        return;
    }
    if (!keep_alive_ || response_.need_eof()) {
        close_client();
        return;
    }
    response_ = {};
    do_read_request();
}

void Session::close_backend() {
    backend_buffer_.consume(backend_buffer_.size());
    beast::error_code ignored;
    backend_.socket().shutdown(tcp::socket::shutdown_both, ignored);
    backend_.close();
}

void Session::close_client() {
    beast::error_code ignored;
    client_.socket().shutdown(tcp::socket::shutdown_send, ignored);
    client_.close();
}

} // namespace portgate
