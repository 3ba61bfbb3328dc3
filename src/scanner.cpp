#include "scanner.hpp"

#include "http_probe.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <iostream>
#include <map>
#include <optional>

namespace portgate {

namespace {

using boost::asio::ip::tcp;

// Connects to every port in `ports` with at most `window` attempts in flight.
// A timed-out attempt is cancelled by closing its socket.
class ConnectSweep : public std::enable_shared_from_this<ConnectSweep> {
public:
    ConnectSweep(boost::asio::io_context& io,
                 boost::asio::ip::address address,
                 std::vector<uint16_t> ports,
                 std::chrono::milliseconds timeout,
                 std::size_t window,
                 std::set<uint16_t>& open)
        : io_(io),
          address_(std::move(address)),
          ports_(std::move(ports)),
          timeout_(timeout),
          window_(window == 0 ? 1 : window),
          open_(open) {}

    void start() {
        for (std::size_t i = 0; i < window_; ++i) {
            launch_next();
        }
    }

private:
    struct Attempt {
        explicit Attempt(boost::asio::io_context& io) : socket(io), timer(io) {}
        tcp::socket socket;
        boost::asio::steady_timer timer;
    };

    void launch_next() {
        if (next_ >= ports_.size()) return;
        const uint16_t port = ports_[next_++];

        auto attempt = std::make_shared<Attempt>(io_);
        attempt->timer.expires_after(timeout_);
        attempt->timer.async_wait([attempt](const boost::system::error_code& ec) {
            if (ec) return;
            boost::system::error_code ignored;
            attempt->socket.close(ignored);
        });
        attempt->socket.async_connect(tcp::endpoint(address_, port),
            [self = shared_from_this(), attempt, port](const boost::system::error_code& ec) {
                attempt->timer.cancel();
                if (!ec) self->open_.insert(port);
                boost::system::error_code ignored;
                attempt->socket.close(ignored);
                self->launch_next();
            });
    }

    boost::asio::io_context& io_;
    boost::asio::ip::address address_;
    std::vector<uint16_t> ports_;
    std::chrono::milliseconds timeout_;
    std::size_t window_;
    std::size_t next_ = 0;
    std::set<uint16_t>& open_;
};

} // namespace

Scanner::Scanner(const ConfigStore& config,
                 std::shared_ptr<ProcessResolver> resolver,
                 ScannerOptions options,
                 MetricsPtr metrics)
    : config_(config),
      resolver_(std::move(resolver)),
      options_(std::move(options)),
      metrics_(std::move(metrics)),
      address_(boost::asio::ip::make_address(options_.host)) {
    if (!resolver_) resolver_ = std::make_shared<NullResolver>();
}

std::set<uint16_t> Scanner::sweep(boost::asio::io_context& io, const std::vector<uint16_t>& ports) {
    std::set<uint16_t> open;
    if (ports.empty()) return open;
    std::make_shared<ConnectSweep>(io, address_, ports, options_.connect_timeout, options_.max_in_flight, open)->start();
    io.restart();
    io.run();
    return open;
}

void Scanner::probe(boost::asio::io_context& io, std::vector<DiscoveredPort*>& targets) {
    if (targets.empty()) return;
    for (auto* entry : targets) {
        async_probe_http(io, tcp::endpoint(address_, entry->port), options_.probe_timeout,
            [entry](ProbeResult result) {
                entry->service_name = result.http ? "http" : "tcp";
                entry->title = std::move(result.title);
            });
    }
    io.restart();
    io.run();
}

std::vector<DiscoveredPort> Scanner::scan_once() {
    const auto ranges = config_.scan_ranges();
    const auto manual = config_.manual_ports();
    const auto now = Clock::now();

    std::set<uint16_t> covered;
    for (const auto& r : ranges) {
        for (uint32_t p = r.start; p <= r.end; ++p) {
            covered.insert(static_cast<uint16_t>(p));
        }
    }

    boost::asio::io_context io;
    const auto scan_open = sweep(io, std::vector<uint16_t>(covered.begin(), covered.end()));

    std::map<uint16_t, DiscoveredPort> entries;
    for (uint16_t port : scan_open) {
        DiscoveredPort dp;
        dp.port = port;
        dp.healthy = true;
        dp.last_seen = now;
        dp.source = kSourceScan;
        entries.emplace(port, std::move(dp));
    }

    std::map<uint16_t, const ManualPort*> manual_by_port;
    std::vector<uint16_t> manual_targets;
    for (const auto& mp : manual) {
        if (mp.port == 0) continue;
        manual_by_port[mp.port] = &mp;
        if (!entries.count(mp.port)) manual_targets.push_back(mp.port);
    }

    const auto manual_open = sweep(io, manual_targets);
    for (uint16_t port : manual_targets) {
        DiscoveredPort dp;
        dp.port = port;
        dp.source = kSourceManual;
        if (manual_open.count(port)) {
            dp.healthy = true;
            dp.last_seen = now;
        }
        entries.emplace(port, std::move(dp));
    }

    std::vector<DiscoveredPort*> live;
    for (auto& [port, dp] : entries) {
        if (dp.healthy) live.push_back(&dp);
    }
    probe(io, live);

    std::vector<DiscoveredPort> result;
    result.reserve(entries.size());
    for (auto& [port, dp] : entries) {
        const auto manual_it = manual_by_port.find(port);
        const ManualPort* registered = manual_it == manual_by_port.end() ? nullptr : manual_it->second;

        if (dp.title.empty() && registered) dp.title = registered->name;
        if (dp.healthy) dp.exe_path = resolver_->resolve(port);
        if (dp.exe_path.empty() && registered) dp.exe_path = registered->install_path;
        result.push_back(std::move(dp));
    }

    if (metrics_) metrics_->scan_cycles.fetch_add(1, std::memory_order_relaxed);
    return result;
}

void Scanner::run(std::stop_token stop, SnapshotChannel& out) {
    std::cout << "[scanner] Started, resolver=" << resolver_->name() << "\n";
    while (!stop.stop_requested()) {
        std::optional<std::vector<DiscoveredPort>> snapshot;
        try {
            snapshot = scan_once();
        } catch (const std::exception& ex) {
            // The hub keeps the previous snapshot until a cycle succeeds.
            std::cerr << "[scanner] Scan cycle failed: " << ex.what() << "\n";
        }
        if (snapshot && !out.push(std::move(*snapshot))) break;

        std::unique_lock<std::mutex> lock(wait_mu_);
        wait_cv_.wait_for(lock, stop, config_.scan_interval(), [] { return false; });
    }
    std::cout << "[scanner] Stopped\n";
}

} // namespace portgate
