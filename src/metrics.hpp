#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace portgate {

struct MetricsRegistry {
    std::atomic<uint64_t> proxy_connections{0};
    std::atomic<uint64_t> active_proxy_sessions{0};
    std::atomic<uint64_t> proxied_requests{0};
    std::atomic<uint64_t> websocket_tunnels{0};
    std::atomic<uint64_t> bad_gateway{0};
    std::atomic<uint64_t> redirects{0};
    std::atomic<uint64_t> bytes_upstream{0};
    std::atomic<uint64_t> bytes_downstream{0};
    std::atomic<uint64_t> scan_cycles{0};
    std::atomic<uint64_t> subscribers_dropped{0};
};

using MetricsPtr = std::shared_ptr<MetricsRegistry>;

MetricsPtr make_metrics();

// Plain-text exposition, one "portgate_<name> <value>" line per counter.
std::string render_metrics(const MetricsRegistry& metrics);

} // namespace portgate
