#include "server.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/strand.hpp>

#include <iostream>

namespace portgate {

ProxyServer::ProxyServer(boost::asio::io_context& io,
                         const std::string& address,
                         uint16_t port,
                         std::shared_ptr<const Router> router,
                         ProxySettings settings,
                         MetricsPtr metrics)
    : io_(io),
      acceptor_(io, tcp::endpoint(boost::asio::ip::make_address(address), port)),
      port_(acceptor_.local_endpoint().port()),
      router_(std::move(router)),
      settings_(std::move(settings)),
      metrics_(std::move(metrics)) {
    std::cout << "[server] Proxy listening on " << address << ":" << port_ << "\n";
    std::cout << "[server] Unmapped hosts redirect to " << settings_.dashboard_url << "\n";
}

void ProxyServer::start() {
    do_accept();
}

void ProxyServer::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
}

void ProxyServer::do_accept() {
    acceptor_.async_accept(boost::asio::make_strand(io_), [this](auto ec, auto socket) {
        if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
            return;
        }
        if (!ec) {
            std::make_shared<Session>(std::move(socket), router_, settings_, metrics_)->start();
        } else {
            std::cerr << "[server] Accept error: " << ec.message() << "\n";
        }
        do_accept();
    });
}

} // namespace portgate
