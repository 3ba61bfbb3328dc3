#include "dashboard.hpp"

#include "channel.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <iostream>
#include <optional>

namespace portgate {

namespace {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

constexpr std::uint64_t kApiBodyLimit = 1024 * 1024;
constexpr std::chrono::seconds kApiIdleTimeout{30};

bool is_quiet_error(const beast::error_code& ec) {
    return ec == boost::asio::error::operation_aborted ||
           ec == boost::asio::error::eof ||
           ec == boost::asio::error::connection_reset ||
           ec == beast::error::timeout ||
           ec == websocket::error::closed;
}

// One /ws client. Hub broadcasts land in a bounded queue and are written one
// at a time on the socket's strand.
class DashboardSocket : public Subscriber, public std::enable_shared_from_this<DashboardSocket> {
public:
    DashboardSocket(tcp::socket socket, Hub& hub, std::size_t capacity)
        : ws_(std::move(socket)), hub_(hub), queue_(capacity) {}

    void run(http::request<http::string_body> req) {
        upgrade_request_ = std::move(req);
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(http::field::server, "portgate");
        }));
        ws_.async_accept(upgrade_request_,
                         beast::bind_front_handler(&DashboardSocket::on_accept, shared_from_this()));
    }

    bool deliver(Message message) override {
        if (!queue_.try_push(std::move(message))) return false;
        boost::asio::post(ws_.get_executor(), [self = shared_from_this()]() { self->flush(); });
        return true;
    }

    void close() override {
        queue_.close();
        boost::asio::post(ws_.get_executor(), [self = shared_from_this()]() { self->shutdown(); });
    }

private:
    void on_accept(const beast::error_code& ec) {
        if (ec) {
            std::cerr << "[dashboard] WebSocket handshake failed: " << ec.message() << "\n";
            return;
        }
        hub_.subscribe(shared_from_this());
        do_read();
    }

    // Client frames are ignored; the read only detects disconnects.
    void do_read() {
        ws_.async_read(read_buffer_, [self = shared_from_this()](const beast::error_code& ec, std::size_t) {
            if (ec) {
                if (!is_quiet_error(ec)) {
                    std::cerr << "[dashboard] WebSocket read error: " << ec.message() << "\n";
                }
                self->hub_.unsubscribe(self);
                return;
            }
            self->read_buffer_.consume(self->read_buffer_.size());
            self->do_read();
        });
    }

    void flush() {
        if (writing_ || closed_) return;
        auto next = queue_.try_pop();
        if (!next) return;
        current_ = std::move(*next);
        writing_ = true;
        ws_.text(true);
        ws_.async_write(boost::asio::buffer(*current_),
                        [self = shared_from_this()](const beast::error_code& ec, std::size_t) {
                            self->writing_ = false;
                            self->current_.reset();
                            if (ec) {
                                if (!is_quiet_error(ec)) {
                                    std::cerr << "[dashboard] WebSocket write error: " << ec.message() << "\n";
                                }
                                self->hub_.unsubscribe(self);
                                self->shutdown();
                                return;
                            }
                            self->flush();
                        });
    }

    void shutdown() {
        if (closed_) return;
        closed_ = true;
        beast::get_lowest_layer(ws_).close();
    }

    websocket::stream<beast::tcp_stream> ws_;
    Hub& hub_;
    Channel<Message> queue_;
    http::request<http::string_body> upgrade_request_;
    beast::flat_buffer read_buffer_;
    Message current_;
    bool writing_ = false;
    bool closed_ = false;
};

// Plain HTTP connection to the dashboard; hands itself over to a
// DashboardSocket on a /ws upgrade.
class DashboardSession : public std::enable_shared_from_this<DashboardSession> {
public:
    DashboardSession(tcp::socket socket, std::shared_ptr<ApiHandler> api, Hub& hub, std::size_t queue)
        : stream_(std::move(socket)), api_(std::move(api)), hub_(hub), subscriber_queue_(queue) {}

    void start() {
        boost::asio::dispatch(stream_.get_executor(),
                              beast::bind_front_handler(&DashboardSession::do_read, shared_from_this()));
    }

private:
    void do_read() {
        parser_.emplace();
        parser_->body_limit(kApiBodyLimit);
        stream_.expires_after(kApiIdleTimeout);
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&DashboardSession::on_read, shared_from_this()));
    }

    void on_read(const beast::error_code& ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            do_close();
            return;
        }
        if (ec) {
            if (!is_quiet_error(ec)) {
                std::cerr << "[dashboard] Read error: " << ec.message() << "\n";
            }
            return;
        }

        auto req = parser_->release();
        if (websocket::is_upgrade(req)) {
            const auto target = req.target();
            const auto path = target.substr(0, target.find('?'));
            if (path == "/ws") {
                stream_.expires_never();
                std::make_shared<DashboardSocket>(stream_.release_socket(), hub_, subscriber_queue_)
                    ->run(std::move(req));
                return;
            }
        }

        response_ = api_->handle(req);
        stream_.expires_after(kApiIdleTimeout);
        http::async_write(stream_, response_,
                          beast::bind_front_handler(&DashboardSession::on_write, shared_from_this()));
    }

    void on_write(const beast::error_code& ec, std::size_t) {
        if (ec) {
            if (!is_quiet_error(ec)) {
                std::cerr << "[dashboard] Write error: " << ec.message() << "\n";
            }
            return;
        }
        if (response_.need_eof()) {
            do_close();
            return;
        }
        response_ = {};
        do_read();
    }

    void do_close() {
        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    ApiResponse response_;
    std::shared_ptr<ApiHandler> api_;
    Hub& hub_;
    std::size_t subscriber_queue_;
};

} // namespace

DashboardServer::DashboardServer(boost::asio::io_context& io,
                                 const std::string& address,
                                 uint16_t port,
                                 ConfigStore& config,
                                 Hub& hub,
                                 MetricsPtr metrics,
                                 std::size_t subscriber_queue)
    : io_(io),
      acceptor_(io, tcp::endpoint(boost::asio::ip::make_address(address), port)),
      port_(acceptor_.local_endpoint().port()),
      hub_(hub),
      api_(std::make_shared<ApiHandler>(config, hub, std::move(metrics))),
      subscriber_queue_(subscriber_queue) {
    std::cout << "[dashboard] Listening on " << address << ":" << port_ << "\n";
}

void DashboardServer::start() {
    do_accept();
}

void DashboardServer::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
}

void DashboardServer::do_accept() {
    acceptor_.async_accept(boost::asio::make_strand(io_), [this](auto ec, auto socket) {
        if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
            return;
        }
        if (!ec) {
            std::make_shared<DashboardSession>(std::move(socket), api_, hub_, subscriber_queue_)->start();
        } else {
            std::cerr << "[dashboard] Accept error: " << ec.message() << "\n";
        }
        do_accept();
    });
}

} // namespace portgate
