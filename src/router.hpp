#pragma once

#include "config.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace portgate {

enum class RouteKind {
    Dashboard,
    Backend,
    Unmapped
};

struct RouteDecision {
    RouteKind kind = RouteKind::Dashboard;
    std::string subdomain;
    uint16_t port = 0;
};

// "api.localhost:8080" -> "api.localhost", "[::1]:80" -> "::1". Lowercased.
std::string strip_host_port(std::string_view host);

// Subdomain of `host` under `suffix`; empty when the host is the bare suffix,
// the reserved name, or not under the suffix at all.
std::string extract_subdomain(std::string_view host, std::string_view suffix);

// Connection carries an "upgrade" token and Upgrade is "websocket".
bool is_websocket_upgrade(std::string_view connection, std::string_view upgrade);

class Router {
public:
    Router(const ConfigStore& config, uint16_t dashboard_port);

    RouteDecision select(std::string_view host_header) const;
    uint16_t dashboard_port() const { return dashboard_port_; }

private:
    const ConfigStore& config_;
    uint16_t dashboard_port_;
};

} // namespace portgate
