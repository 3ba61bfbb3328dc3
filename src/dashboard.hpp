#pragma once

#include "api.hpp"
#include "config.hpp"
#include "hub.hpp"
#include "metrics.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio.hpp>

namespace portgate {

// HTTP server for the dashboard: REST API, metrics, the built-in page and the
// /ws subscription endpoint fed by the hub.
class DashboardServer {
public:
    DashboardServer(boost::asio::io_context& io,
                    const std::string& address,
                    uint16_t port,
                    ConfigStore& config,
                    Hub& hub,
                    MetricsPtr metrics,
                    std::size_t subscriber_queue);

    void start();
    void stop();
    uint16_t port() const { return port_; }

private:
    void do_accept();

    using tcp = boost::asio::ip::tcp;

    boost::asio::io_context& io_;
    tcp::acceptor acceptor_;
    uint16_t port_;
    Hub& hub_;
    std::shared_ptr<ApiHandler> api_;
    std::size_t subscriber_queue_;
};

} // namespace portgate
