#pragma once

#include "metrics.hpp"

#include <array>
#include <atomic>
#include <memory>
#include <string>

#include <boost/asio/ip/tcp.hpp>

namespace portgate {

// Full-duplex byte relay between two connected sockets. Each direction is an
// independent read/write chain; the first one to end closes both sockets.
class Tunnel : public std::enable_shared_from_this<Tunnel> {
public:
    Tunnel(boost::asio::ip::tcp::socket client_socket,
           boost::asio::ip::tcp::socket backend_socket,
           MetricsPtr metrics,
           std::string label);

    // `pending` holds bytes already read from the client; they reach the
    // backend before anything else.
    void start(std::string pending = {});

private:
    using tcp = boost::asio::ip::tcp;

    void do_read_from_client();
    void do_write_to_backend(std::size_t length);
    void do_read_from_backend();
    void do_write_to_client(std::size_t length);
    void close_sockets(const boost::system::error_code& ec);

    tcp::socket client_socket_;
    tcp::socket backend_socket_;
    MetricsPtr metrics_;
    std::string label_;
    std::string pending_;

    std::array<char, 16384> client_buffer_{};
    std::array<char, 16384> backend_buffer_{};
    std::atomic<bool> closed_{false};
};

} // namespace portgate
