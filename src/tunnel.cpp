#include "tunnel.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

#include <iostream>

namespace portgate {

Tunnel::Tunnel(tcp::socket client_socket,
               tcp::socket backend_socket,
               MetricsPtr metrics,
               std::string label)
    : client_socket_(std::move(client_socket)),
      backend_socket_(std::move(backend_socket)),
      metrics_(std::move(metrics)),
      label_(std::move(label)) {
    if (metrics_) {
        metrics_->websocket_tunnels.fetch_add(1, std::memory_order_relaxed);
    }
}

void Tunnel::start(std::string pending) {
    pending_ = std::move(pending);
    if (pending_.empty()) {
        do_read_from_client();
        do_read_from_backend();
        return;
    }

    boost::asio::async_write(
        backend_socket_,
        boost::asio::buffer(pending_),
        [self = shared_from_this()](const boost::system::error_code& ec, std::size_t length) {
            if (ec) {
                self->close_sockets(ec);
                return;
            }
            if (self->metrics_) {
                self->metrics_->bytes_upstream.fetch_add(length, std::memory_order_relaxed);
            }
            self->pending_.clear();
            self->do_read_from_client();
            self->do_read_from_backend();
        });
}

void Tunnel::do_read_from_client() {
    client_socket_.async_read_some(
        boost::asio::buffer(client_buffer_),
        [self = shared_from_this()](const boost::system::error_code& ec, std::size_t len) {
            if (!ec) {
                self->do_write_to_backend(len);
            } else {
                self->close_sockets(ec);
            }
        });
}

void Tunnel::do_write_to_backend(std::size_t length) {
    boost::asio::async_write(
        backend_socket_,
        boost::asio::buffer(client_buffer_.data(), length),
        [self = shared_from_this(), length](const boost::system::error_code& ec, std::size_t) {
            if (!ec) {
                if (self->metrics_) {
                    self->metrics_->bytes_upstream.fetch_add(length, std::memory_order_relaxed);
                }
                self->do_read_from_client();
            } else {
                self->close_sockets(ec);
            }
        });
}

void Tunnel::do_read_from_backend() {
    backend_socket_.async_read_some(
        boost::asio::buffer(backend_buffer_),
        [self = shared_from_this()](const boost::system::error_code& ec, std::size_t len) {
            if (!ec) {
                self->do_write_to_client(len);
            } else {
                self->close_sockets(ec);
            }
        });
}

void Tunnel::do_write_to_client(std::size_t length) {
    boost::asio::async_write(
        client_socket_,
        boost::asio::buffer(backend_buffer_.data(), length),
        [self = shared_from_this(), length](const boost::system::error_code& ec, std::size_t) {
            if (!ec) {
                if (self->metrics_) {
                    self->metrics_->bytes_downstream.fetch_add(length, std::memory_order_relaxed);
                }
                self->do_read_from_backend();
            } else {
                self->close_sockets(ec);
            }
        });
}

void Tunnel::close_sockets(const boost::system::error_code& ec) {
    auto self = shared_from_this();
    boost::asio::post(client_socket_.get_executor(), [self, ec]() {
        if (self->closed_.exchange(true)) return;
        if (ec && ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
            std::cerr << "[proxy] Closing tunnel " << self->label_ << ": " << ec.message() << "\n";
        }
        boost::system::error_code ignored;
        if (self->client_socket_.is_open()) {
            self->client_socket_.shutdown(tcp::socket::shutdown_both, ignored);
            self->client_socket_.close(ignored);
        }
        if (self->backend_socket_.is_open()) {
            self->backend_socket_.shutdown(tcp::socket::shutdown_both, ignored);
            self->backend_socket_.close(ignored);
        }
    });
}

} // namespace portgate
