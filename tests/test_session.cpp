#include "config_fixture.hpp"
#include "metrics.hpp"
#include "net_common.hpp"
#include "router.hpp"
#include "server.hpp"
#include "session.hpp"
#include "test_common.hpp"

#include <array>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio.hpp>

using namespace portgate;
using namespace net_shared;
using config_fixture::LoadedStore;
using namespace std::chrono_literals;

namespace {

constexpr const char* kDashboardUrl = "http://localhost:18080";

// Last request seen by a backend, guarded for cross-thread reads.
struct Captured {
    void store(const HttpRequest& req) {
        std::lock_guard<std::mutex> lock(mu);
        last = req;
        ++count;
    }
    HttpRequest get() {
        std::lock_guard<std::mutex> lock(mu);
        return last;
    }

    std::mutex mu;
    HttpRequest last;
    int count = 0;
};

std::string mapping(const std::string& domain, uint16_t port) {
    return "{\"domain\": \"" + domain + "\", \"targetPort\": " + std::to_string(port) + "}";
}

// Proxy on an ephemeral port in front of the given mappings.
struct ProxyFixture {
    ProxyFixture(const std::string& mappings_json, uint16_t dashboard_port)
        : config("{\"mappings\": [" + mappings_json + "]}", "portgate_session_test"),
          router(std::make_shared<const Router>(config.store, dashboard_port)),
          metrics(make_metrics()),
          runner(2),
          server(runner.io(), "127.0.0.1", 0, router, make_settings(), metrics) {
        server.start();
    }
    ~ProxyFixture() { runner.stop(); }

    static ProxySettings make_settings() {
        ProxySettings settings;
        settings.dashboard_url = kDashboardUrl;
        settings.connect_timeout = 2s;
        settings.idle_timeout = 5s;
        settings.response_timeout = 5s;
        return settings;
    }

    uint16_t port() const { return server.port(); }

    LoadedStore config;
    std::shared_ptr<const Router> router;
    MetricsPtr metrics;
    IoRunner runner;
    ProxyServer server;
};

tcp::socket connect_to(boost::asio::io_context& io, uint16_t port) {
    tcp::socket socket(io);
    socket.connect(tcp::endpoint(boost::asio::ip::address_v4::loopback(), port));
    return socket;
}

// Accepts an upgrade, echoes any frames that arrived with the request, then
// echoes everything else until the peer goes away.
void echo_upgrade_backend(tcp::socket& socket) {
    boost::beast::flat_buffer buffer;
    HttpRequest req;
    boost::system::error_code ec;
    http::read(socket, buffer, req, ec);
    if (ec || std::string(req[http::field::upgrade]) != "websocket") return;
    const std::string accept =
        "HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n\r\n";
    boost::asio::write(socket, boost::asio::buffer(accept), ec);
    if (!ec && buffer.size() > 0) {
        boost::asio::write(socket, buffer.data(), ec);
        buffer.consume(buffer.size());
    }
    std::array<char, 1024> chunk{};
    while (!ec) {
        const auto n = socket.read_some(boost::asio::buffer(chunk), ec);
        if (n > 0) boost::asio::write(socket, boost::asio::buffer(chunk.data(), n), ec);
    }
}

const std::string kUpgradeRequest =
    "GET /chat HTTP/1.1\r\n"
    "Host: ws.localhost\r\n"
    "Connection: keep-alive, Upgrade\r\n"
    "Upgrade: websocket\r\n"
    "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
    "Sec-WebSocket-Version: 13\r\n\r\n";

} // namespace

int main() {
    auto test_forwarded_headers = [] {
        Captured captured;
        TestServer backend(http_handler([&captured](const HttpRequest& req) {
            captured.store(req);
            auto res = make_text_response(http::status::ok, "hello from api", "text/plain");
            res.set("X-Backend", "yes");
            res.set(http::field::connection, "close, X-Backend-Private");
            res.set("X-Backend-Private", "secret");
            return res;
        }));
        ProxyFixture proxy(mapping("api", backend.port()), 1);

        const std::string host = "api.localhost:" + std::to_string(proxy.port());
        HttpRequest req{http::verb::get, "/path?q=1", 11};
        req.set(http::field::host, host);
        req.set("X-Forwarded-For", "10.0.0.9");
        req.set("Proxy-Authorization", "Basic Zm9vOmJhcg==");
        const auto res = send_request(proxy.port(), std::move(req));

        EXPECT_EQ(res.result_int(), 200u);
        EXPECT_EQ(res.body(), "hello from api");
        EXPECT_EQ(std::string(res["X-Backend"]), "yes");
        EXPECT_EQ(std::string(res["X-Backend-Private"]), "");

        const auto seen = captured.get();
        EXPECT_EQ(std::string(seen.target()), "/path?q=1");
        EXPECT_EQ(std::string(seen[http::field::host]), host);
        EXPECT_EQ(std::string(seen["X-Forwarded-Host"]), host);
        EXPECT_EQ(std::string(seen["X-Forwarded-For"]), "10.0.0.9, 127.0.0.1");
        EXPECT_EQ(std::string(seen["X-Forwarded-Proto"]), "http");
        EXPECT_EQ(std::string(seen["Proxy-Authorization"]), "");
        EXPECT_EQ(proxy.metrics->proxied_requests.load(), 1u);
    };

    auto test_request_body_forwarded = [] {
        TestServer backend(http_handler([](const HttpRequest& req) {
            return make_text_response(http::status::created, "got:" + req.body(), "text/plain");
        }));
        ProxyFixture proxy(mapping("api", backend.port()), 1);

        HttpRequest req{http::verb::post, "/items", 11};
        req.set(http::field::host, "api.localhost");
        req.set(http::field::content_type, "application/json");
        req.body() = "{\"name\":\"widget\"}";
        const auto res = send_request(proxy.port(), std::move(req));

        EXPECT_EQ(res.result_int(), 201u);
        EXPECT_EQ(res.body(), "got:{\"name\":\"widget\"}");
    };

    auto test_dead_backend_is_502 = [] {
        const auto dead = unused_loopback_port();
        ProxyFixture proxy(mapping("down", dead), 1);

        const auto res = http_get(proxy.port(), "/", "down.localhost");
        EXPECT_EQ(res.result_int(), 502u);
        EXPECT_EQ(res.body(), "502 Bad Gateway\n");
        EXPECT_EQ(proxy.metrics->bad_gateway.load(), 1u);
    };

    auto test_unmapped_redirects = [] {
        ProxyFixture proxy(mapping("api", 3000), 1);

        const auto res = http_get(proxy.port(), "/deep/link", "nope.localhost");
        EXPECT_EQ(res.result_int(), 307u);
        EXPECT_EQ(std::string(res[http::field::location]), kDashboardUrl);
        EXPECT_EQ(proxy.metrics->redirects.load(), 1u);
    };

    auto test_dashboard_hosts = [] {
        Captured captured;
        TestServer dashboard(http_handler([&captured](const HttpRequest& req) {
            captured.store(req);
            return make_text_response(http::status::ok, "dashboard");
        }));
        ProxyFixture proxy(mapping("api", 3000), dashboard.port());

        EXPECT_EQ(http_get(proxy.port(), "/", "localhost").body(), "dashboard");
        EXPECT_EQ(http_get(proxy.port(), "/", "portgate.localhost").body(), "dashboard");
        EXPECT_EQ(http_get(proxy.port(), "/", "127.0.0.1").body(), "dashboard");
        EXPECT_TRUE(wait_until([&]() { return dashboard.connections() == 3; }));
    };

    auto test_keep_alive_serves_several_requests = [] {
        TestServer backend(http_handler([](const HttpRequest& req) {
            return make_text_response(http::status::ok, std::string(req.target()), "text/plain");
        }));
        ProxyFixture proxy(mapping("api", backend.port()), 1);

        boost::asio::io_context io;
        auto socket = connect_to(io, proxy.port());
        boost::beast::flat_buffer buffer;
        for (const char* target : {"/one", "/two"}) {
            HttpRequest req{http::verb::get, target, 11};
            req.set(http::field::host, "api.localhost");
            req.keep_alive(true);
            http::write(socket, req);
            HttpResponse res;
            http::read(socket, buffer, res);
            EXPECT_EQ(res.body(), target);
            EXPECT_TRUE(res.keep_alive());
        }
        EXPECT_EQ(backend.connections(), 2u);
        EXPECT_EQ(proxy.metrics->proxy_connections.load(), 1u);
        EXPECT_EQ(proxy.metrics->proxied_requests.load(), 2u);
    };

    auto test_websocket_tunnel = [] {
        TestServer backend(echo_upgrade_backend);
        ProxyFixture proxy(mapping("ws", backend.port()), 1);

        boost::asio::io_context io;
        auto socket = connect_to(io, proxy.port());
        boost::asio::write(socket, boost::asio::buffer(kUpgradeRequest));

        std::string head;
        const auto head_len = boost::asio::read_until(socket, boost::asio::dynamic_buffer(head), "\r\n\r\n");
        EXPECT_EQ(head.rfind("HTTP/1.1 101", 0), 0u);
        EXPECT_EQ(head.size(), head_len);

        const std::string payload("\x81\x05hello\x00\xff binary tail", 20);
        boost::asio::write(socket, boost::asio::buffer(payload));
        std::string echoed(payload.size(), '\0');
        boost::asio::read(socket, boost::asio::buffer(echoed));
        EXPECT_TRUE(echoed == payload);

        boost::system::error_code ignored;
        socket.shutdown(tcp::socket::shutdown_both, ignored);
        socket.close(ignored);

        EXPECT_EQ(proxy.metrics->websocket_tunnels.load(), 1u);
        EXPECT_TRUE(proxy.metrics->bytes_upstream.load() >= payload.size());
        EXPECT_TRUE(wait_until([&]() { return proxy.metrics->bytes_downstream.load() >= payload.size(); }));
    };

    auto test_frames_sent_with_upgrade_are_relayed = [] {
        TestServer backend(echo_upgrade_backend);
        ProxyFixture proxy(mapping("ws", backend.port()), 1);

        boost::asio::io_context io;
        auto socket = connect_to(io, proxy.port());
        const std::string payload("\x81\x05hello\x00\xff binary tail", 20);
        boost::asio::write(socket, boost::asio::buffer(kUpgradeRequest + payload));

        std::string received;
        const auto head_len = boost::asio::read_until(socket, boost::asio::dynamic_buffer(received), "\r\n\r\n");
        EXPECT_EQ(received.rfind("HTTP/1.1 101", 0), 0u);

        std::string echoed = received.substr(head_len);
        if (echoed.size() < payload.size()) {
            std::string rest(payload.size() - echoed.size(), '\0');
            boost::asio::read(socket, boost::asio::buffer(rest));
            echoed += rest;
        }
        EXPECT_EQ(echoed.size(), payload.size());
        EXPECT_TRUE(echoed == payload);

        boost::system::error_code ignored;
        socket.shutdown(tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
        EXPECT_TRUE(proxy.metrics->bytes_upstream.load() >= payload.size());
    };

    auto test_streamed_response_arrives_incrementally = [] {
        std::promise<void> first_seen;
        std::shared_future<void> first_seen_future = first_seen.get_future().share();
        TestServer backend([first_seen_future](tcp::socket& socket) {
            boost::beast::flat_buffer buffer;
            HttpRequest req;
            boost::system::error_code ec;
            http::read(socket, buffer, req, ec);
            if (ec) return;
            const std::string head =
                "HTTP/1.1 200 OK\r\n"
                "Content-Type: text/event-stream\r\n"
                "Transfer-Encoding: chunked\r\n\r\n"
                "d\r\ndata: first\n\n\r\n";
            boost::asio::write(socket, boost::asio::buffer(head), ec);
            if (ec || first_seen_future.wait_for(5s) != std::future_status::ready) return;
            const std::string tail = "e\r\ndata: second\n\n\r\n0\r\n\r\n";
            boost::asio::write(socket, boost::asio::buffer(tail), ec);
        });
        ProxyFixture proxy(mapping("events", backend.port()), 1);

        boost::asio::io_context io;
        auto socket = connect_to(io, proxy.port());
        HttpRequest req{http::verb::get, "/stream", 11};
        req.set(http::field::host, "events.localhost");
        http::write(socket, req);

        boost::beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        http::read_header(socket, buffer, parser);
        EXPECT_EQ(parser.get().result_int(), 200u);
        EXPECT_EQ(std::string(parser.get()[http::field::content_type]), "text/event-stream");
        EXPECT_TRUE(parser.get().chunked());

        // The backend holds the rest of the stream until the first event is seen.
        while (!parser.is_done() && parser.get().body().find("data: first") == std::string::npos) {
            http::read_some(socket, buffer, parser);
        }
        EXPECT_FALSE(parser.is_done());
        EXPECT_EQ(parser.get().body(), "data: first\n\n");
        first_seen.set_value();

        http::read(socket, buffer, parser);
        EXPECT_EQ(parser.get().body(), "data: first\n\ndata: second\n\n");
        EXPECT_EQ(proxy.metrics->bad_gateway.load(), 0u);
    };

    auto test_sessions_are_released = [] {
        TestServer backend(http_handler([](const HttpRequest&) {
            return make_text_response(http::status::no_content, "");
        }));
        ProxyFixture proxy(mapping("api", backend.port()), 1);

        for (int i = 0; i < 5; ++i) {
            EXPECT_EQ(http_get(proxy.port(), "/", "api.localhost").result_int(), 204u);
        }
        EXPECT_EQ(proxy.metrics->proxy_connections.load(), 5u);
        EXPECT_TRUE(wait_until([&]() { return proxy.metrics->active_proxy_sessions.load() == 0; }));
    };

    return run_tests({
        {"forwarded_headers", test_forwarded_headers},
        {"request_body_forwarded", test_request_body_forwarded},
        {"dead_backend_is_502", test_dead_backend_is_502},
        {"unmapped_redirects", test_unmapped_redirects},
        {"dashboard_hosts", test_dashboard_hosts},
        {"keep_alive_serves_several_requests", test_keep_alive_serves_several_requests},
        {"websocket_tunnel", test_websocket_tunnel},
        {"frames_sent_with_upgrade_are_relayed", test_frames_sent_with_upgrade_are_relayed},
        {"streamed_response_arrives_incrementally", test_streamed_response_arrives_incrementally},
        {"sessions_are_released", test_sessions_are_released},
    });
}
