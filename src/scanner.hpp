#pragma once

#include "channel.hpp"
#include "config.hpp"
#include "metrics.hpp"
#include "process_resolver.hpp"
#include "types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>

namespace portgate {

using SnapshotChannel = Channel<std::vector<DiscoveredPort>>;

struct ScannerOptions {
    std::string host = "127.0.0.1";
    std::chrono::milliseconds connect_timeout{500};
    std::chrono::milliseconds probe_timeout{2000};
    std::size_t max_in_flight = 256;
};

class Scanner {
public:
    Scanner(const ConfigStore& config,
            std::shared_ptr<ProcessResolver> resolver,
            ScannerOptions options = {},
            MetricsPtr metrics = nullptr);

    // One full cycle. Never throws for per-port failures; the result is
    // sorted by port with at most one entry per port.
    std::vector<DiscoveredPort> scan_once();

    // Scans immediately, then every scan_interval() until `stop` fires or the
    // channel is closed.
    void run(std::stop_token stop, SnapshotChannel& out);

private:
    std::set<uint16_t> sweep(boost::asio::io_context& io, const std::vector<uint16_t>& ports);
    void probe(boost::asio::io_context& io, std::vector<DiscoveredPort*>& targets);

    const ConfigStore& config_;
    std::shared_ptr<ProcessResolver> resolver_;
    ScannerOptions options_;
    MetricsPtr metrics_;
    boost::asio::ip::address address_;

    std::mutex wait_mu_;
    std::condition_variable_any wait_cv_;
};

} // namespace portgate
