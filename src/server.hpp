#pragma once

#include "metrics.hpp"
#include "router.hpp"
#include "session.hpp"

#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio.hpp>

namespace portgate {

// Accept loop of the public reverse proxy. Every connection gets its own
// Session on a fresh strand.
class ProxyServer {
public:
    ProxyServer(boost::asio::io_context& io,
                const std::string& address,
                uint16_t port,
                std::shared_ptr<const Router> router,
                ProxySettings settings,
                MetricsPtr metrics);

    void start();
    void stop();
    uint16_t port() const { return port_; }

private:
    void do_accept();

    using tcp = boost::asio::ip::tcp;

    boost::asio::io_context& io_;
    tcp::acceptor acceptor_;
    uint16_t port_;
    std::shared_ptr<const Router> router_;
    ProxySettings settings_;
    MetricsPtr metrics_;
};

} // namespace portgate
