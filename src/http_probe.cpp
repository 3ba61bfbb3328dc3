#include "http_probe.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <string>

namespace portgate {

namespace beast = boost::beast;
namespace http = beast::http;
using boost::asio::ip::tcp;

namespace {

std::string trim_copy(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

class HttpProbe : public std::enable_shared_from_this<HttpProbe> {
public:
    HttpProbe(boost::asio::io_context& io, tcp::endpoint endpoint,
              std::chrono::milliseconds timeout, ProbeHandler handler)
        : stream_(io),
          endpoint_(std::move(endpoint)),
          deadline_(std::chrono::steady_clock::now() + timeout),
          handler_(std::move(handler)) {}

    void start() {
        stream_.expires_at(deadline_);
        stream_.async_connect(endpoint_, [self = shared_from_this()](beast::error_code ec) {
            self->on_connect(ec);
        });
    }

private:
    void on_connect(beast::error_code ec) {
        if (ec) return finish();

        request_ = http::request<http::empty_body>{http::verb::get, "/", 11};
        request_.set(http::field::host, endpoint_.address().to_string() + ":" + std::to_string(endpoint_.port()));
        request_.set(http::field::user_agent, "portgate-scanner");
        request_.set(http::field::accept, "*/*");
        request_.keep_alive(false);

        stream_.expires_at(deadline_);
        http::async_write(stream_, request_, [self = shared_from_this()](beast::error_code write_ec, std::size_t) {
            self->on_write(write_ec);
        });
    }

    void on_write(beast::error_code ec) {
        if (ec) return finish();
        stream_.expires_at(deadline_);
        http::async_read_header(stream_, buffer_, parser_,
            [self = shared_from_this()](beast::error_code read_ec, std::size_t) {
                self->on_header(read_ec);
            });
    }

    void on_header(beast::error_code ec) {
        if (ec) return finish();
        result_.http = true;
        result_.server = std::string(parser_.get()[http::field::server]);
        read_body();
    }

    void read_body() {
        if (parser_.is_done() || body_.size() >= kProbeBodyLimit) return finish();

        const auto room = std::min(chunk_.size(), kProbeBodyLimit - body_.size());
        parser_.get().body().data = chunk_.data();
        parser_.get().body().size = room;
        stream_.expires_at(deadline_);
        http::async_read(stream_, buffer_, parser_,
            [self = shared_from_this(), room](beast::error_code ec, std::size_t) {
                self->on_body(ec, room);
            });
    }

    void on_body(beast::error_code ec, std::size_t room) {
        const auto filled = room - parser_.get().body().size;
        body_.append(chunk_.data(), filled);
        if (ec == http::error::need_buffer) ec = {};
        if (ec) return finish();
        read_body();
    }

    void finish() {
        if (done_) return;
        done_ = true;
        if (result_.http) {
            result_.title = extract_title(body_);
            if (result_.title.empty()) result_.title = result_.server;
        }
        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
        stream_.close();
        handler_(std::move(result_));
    }

    beast::tcp_stream stream_;
    tcp::endpoint endpoint_;
    std::chrono::steady_clock::time_point deadline_;
    ProbeHandler handler_;

    beast::flat_buffer buffer_;
    http::request<http::empty_body> request_;
    http::response_parser<http::buffer_body> parser_;
    std::array<char, 8192> chunk_{};
    std::string body_;
    ProbeResult result_;
    bool done_ = false;
};

} // namespace

std::string extract_title(std::string_view body) {
    std::string lowered(body);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::size_t pos = 0;
    while ((pos = lowered.find("<title", pos)) != std::string::npos) {
        const auto open_end = lowered.find('>', pos);
        if (open_end == std::string::npos) return {};
        const auto close = lowered.find('<', open_end + 1);
        if (close == std::string::npos) return {};
        if (close > open_end + 1 && lowered.compare(close, 8, "</title>") == 0) {
            return trim_copy(std::string(body.substr(open_end + 1, close - open_end - 1)));
        }
        pos = close;
    }
    return {};
}

void async_probe_http(boost::asio::io_context& io,
                      const tcp::endpoint& endpoint,
                      std::chrono::milliseconds timeout,
                      ProbeHandler handler) {
    std::make_shared<HttpProbe>(io, endpoint, timeout, std::move(handler))->start();
}

} // namespace portgate
