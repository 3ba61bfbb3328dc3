#include "config.hpp"
#include "config_fixture.hpp"
#include "router.hpp"
#include "test_common.hpp"

using namespace portgate;
using config_fixture::LoadedStore;

int main() {
    auto test_strip_host_port = [] {
        EXPECT_EQ(strip_host_port("api.localhost:8080"), "api.localhost");
        EXPECT_EQ(strip_host_port("API.LocalHost"), "api.localhost");
        EXPECT_EQ(strip_host_port("[::1]:80"), "::1");
        EXPECT_EQ(strip_host_port("::1"), "::1");
        EXPECT_EQ(strip_host_port(" localhost "), "localhost");
        EXPECT_EQ(strip_host_port(""), "");
    };

    auto test_extract_subdomain = [] {
        EXPECT_EQ(extract_subdomain("api.localhost", "localhost"), "api");
        EXPECT_EQ(extract_subdomain("a.b.localhost", "localhost"), "a.b");
        EXPECT_EQ(extract_subdomain("localhost", "localhost"), "");
        EXPECT_EQ(extract_subdomain(".localhost", "localhost"), "");
        EXPECT_EQ(extract_subdomain("portgate.localhost", "localhost"), "");
        EXPECT_EQ(extract_subdomain("api.example.com", "localhost"), "");
        EXPECT_EQ(extract_subdomain("apilocalhost", "localhost"), "");
    };

    auto test_websocket_upgrade_detection = [] {
        EXPECT_TRUE(is_websocket_upgrade("Upgrade", "websocket"));
        EXPECT_TRUE(is_websocket_upgrade("keep-alive, Upgrade", "WebSocket"));
        EXPECT_TRUE(is_websocket_upgrade("upgrade", " websocket "));
        EXPECT_FALSE(is_websocket_upgrade("keep-alive", "websocket"));
        EXPECT_FALSE(is_websocket_upgrade("Upgrade", "h2c"));
        EXPECT_FALSE(is_websocket_upgrade("", ""));
        EXPECT_FALSE(is_websocket_upgrade("upgraded", "websocket"));
    };

    auto test_routes = [] {
        LoadedStore s(R"({"mappings": [{"domain": "api", "targetPort": 3000},
                                       {"domain": "portgate", "targetPort": 3999}]})");
        Router router(s.store, 8080);

        auto d = router.select("api.localhost");
        EXPECT_TRUE(d.kind == RouteKind::Backend);
        EXPECT_EQ(d.subdomain, "api");
        EXPECT_EQ(d.port, 3000);

        d = router.select("api.localhost:8080");
        EXPECT_TRUE(d.kind == RouteKind::Backend);
        EXPECT_EQ(d.port, 3000);

        d = router.select("API.LOCALHOST");
        EXPECT_TRUE(d.kind == RouteKind::Backend);

        d = router.select("localhost");
        EXPECT_TRUE(d.kind == RouteKind::Dashboard);
        EXPECT_EQ(d.port, 8080);

        // The reserved name wins over mapping data.
        d = router.select("portgate.localhost");
        EXPECT_TRUE(d.kind == RouteKind::Dashboard);
        EXPECT_EQ(d.port, 8080);

        d = router.select("example.com");
        EXPECT_TRUE(d.kind == RouteKind::Dashboard);

        d = router.select("");
        EXPECT_TRUE(d.kind == RouteKind::Dashboard);

        d = router.select("web.localhost");
        EXPECT_TRUE(d.kind == RouteKind::Unmapped);
        EXPECT_EQ(d.subdomain, "web");
    };

    auto test_custom_suffix = [] {
        LoadedStore s(R"({"domainSuffix": "test", "mappings": [{"domain": "api", "targetPort": 3000}]})");
        Router router(s.store, 9000);
        EXPECT_TRUE(router.select("api.test").kind == RouteKind::Backend);
        EXPECT_TRUE(router.select("api.localhost").kind == RouteKind::Dashboard);
        EXPECT_EQ(router.dashboard_port(), 9000);
    };

    return run_tests({
        {"strip_host_port", test_strip_host_port},
        {"extract_subdomain", test_extract_subdomain},
        {"websocket_upgrade_detection", test_websocket_upgrade_detection},
        {"routes", test_routes},
        {"custom_suffix", test_custom_suffix},
    });
}
