#include "router.hpp"

#include "types.hpp"

#include <algorithm>
#include <cctype>

namespace portgate {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view trim_view(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
    return text;
}

} // namespace

std::string strip_host_port(std::string_view host) {
    host = trim_view(host);
    if (!host.empty() && host.front() == '[') {
        const auto close = host.find(']');
        if (close != std::string_view::npos) host = host.substr(1, close - 1);
    } else {
        const auto colon = host.find(':');
        // More than one colon is a bare IPv6 literal without a port.
        if (colon != std::string_view::npos && host.find(':', colon + 1) == std::string_view::npos) {
            host = host.substr(0, colon);
        }
    }
    std::string out(host);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string extract_subdomain(std::string_view host, std::string_view suffix) {
    if (suffix.empty()) return {};
    if (host.size() <= suffix.size() + 1) return {};
    const auto dot = host.size() - suffix.size() - 1;
    if (host[dot] != '.' || host.substr(dot + 1) != suffix) return {};
    const auto sub = host.substr(0, dot);
    if (sub == kReservedSubdomain) return {};
    return std::string(sub);
}

bool is_websocket_upgrade(std::string_view connection, std::string_view upgrade) {
    if (!iequals(trim_view(upgrade), "websocket")) return false;
    while (!connection.empty()) {
        const auto comma = connection.find(',');
        const auto token = trim_view(connection.substr(0, comma));
        if (iequals(token, "upgrade")) return true;
        if (comma == std::string_view::npos) break;
        connection.remove_prefix(comma + 1);
    }
    return false;
}

Router::Router(const ConfigStore& config, uint16_t dashboard_port)
    : config_(config), dashboard_port_(dashboard_port) {}

RouteDecision Router::select(std::string_view host_header) const {
    const auto host = strip_host_port(host_header);
    auto subdomain = extract_subdomain(host, config_.domain_suffix());
    if (subdomain.empty()) {
        return RouteDecision{RouteKind::Dashboard, {}, dashboard_port_};
    }
    if (auto port = config_.lookup_port(subdomain)) {
        return RouteDecision{RouteKind::Backend, std::move(subdomain), *port};
    }
    return RouteDecision{RouteKind::Unmapped, std::move(subdomain), 0};
}

} // namespace portgate
