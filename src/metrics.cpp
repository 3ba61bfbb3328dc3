#include "metrics.hpp"

#include <sstream>

namespace portgate {

MetricsPtr make_metrics() {
    return std::make_shared<MetricsRegistry>();
}

std::string render_metrics(const MetricsRegistry& metrics) {
    std::ostringstream os;
    os << "portgate_proxy_connections " << metrics.proxy_connections.load() << "\n";
    os << "portgate_active_proxy_sessions " << metrics.active_proxy_sessions.load() << "\n";
    os << "portgate_proxied_requests " << metrics.proxied_requests.load() << "\n";
    os << "portgate_websocket_tunnels " << metrics.websocket_tunnels.load() << "\n";
    os << "portgate_bad_gateway " << metrics.bad_gateway.load() << "\n";
    os << "portgate_redirects " << metrics.redirects.load() << "\n";
    os << "portgate_bytes_upstream " << metrics.bytes_upstream.load() << "\n";
    os << "portgate_bytes_downstream " << metrics.bytes_downstream.load() << "\n";
    os << "portgate_scan_cycles " << metrics.scan_cycles.load() << "\n";
    os << "portgate_subscribers_dropped " << metrics.subscribers_dropped.load() << "\n";
    return os.str();
}

} // namespace portgate
