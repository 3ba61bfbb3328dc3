#include "hub.hpp"

#include "codec.hpp"

#include <boost/asio/post.hpp>

#include <iostream>
#include <mutex>

namespace portgate {

Hub::Hub(boost::asio::io_context& io, const ConfigStore& config, MetricsPtr metrics)
    : strand_(boost::asio::make_strand(io)),
      config_(config),
      metrics_(std::move(metrics)) {}

void Hub::set_ports(std::vector<DiscoveredPort> ports) {
    {
        std::unique_lock<std::shared_mutex> lock(ports_mu_);
        ports_ = std::move(ports);
    }
    broadcast_update();
}

std::vector<DiscoveredPort> Hub::get_ports() const {
    std::shared_lock<std::shared_mutex> lock(ports_mu_);
    return ports_;
}

StateUpdate Hub::current_state() const {
    StateUpdate update;
    update.ports = get_ports();
    update.mappings = config_.mappings();
    update.scan_ranges = config_.scan_ranges();
    update.domain_suffix = config_.domain_suffix();
    return update;
}

std::string Hub::render_state() const {
    return render_update(current_state());
}

void Hub::broadcast_update() {
    // Rendered on the strand so subscribers never see an older state after a newer one.
    boost::asio::post(strand_, [this]() {
        do_broadcast(std::make_shared<const std::string>(render_state()));
    });
}

void Hub::subscribe(SubscriberPtr subscriber) {
    boost::asio::post(strand_, [this, subscriber = std::move(subscriber)]() {
        if (!subscribers_.insert(subscriber).second) return;
        subscriber_count_.store(subscribers_.size());
        auto snapshot = std::make_shared<const std::string>(render_state());
        if (!subscriber->deliver(snapshot)) {
            subscribers_.erase(subscriber);
            subscriber_count_.store(subscribers_.size());
            subscriber->close();
        }
    });
}

void Hub::unsubscribe(SubscriberPtr subscriber) {
    boost::asio::post(strand_, [this, subscriber = std::move(subscriber)]() {
        if (subscribers_.erase(subscriber) == 0) return;
        subscriber_count_.store(subscribers_.size());
        subscriber->close();
    });
}

void Hub::do_broadcast(const Message& message) {
    for (auto it = subscribers_.begin(); it != subscribers_.end();) {
        if ((*it)->deliver(message)) {
            ++it;
            continue;
        }
        std::cerr << "[hub] Dropping subscriber with full outgoing queue\n";
        if (metrics_) metrics_->subscribers_dropped.fetch_add(1, std::memory_order_relaxed);
        auto dropped = *it;
        it = subscribers_.erase(it);
        dropped->close();
    }
    subscriber_count_.store(subscribers_.size());
}

void Hub::consume(Channel<std::vector<DiscoveredPort>>& snapshots) {
    while (auto ports = snapshots.pop()) {
        std::cout << "[hub] Snapshot with " << ports->size() << " port(s)\n";
        set_ports(std::move(*ports));
    }
}

} // namespace portgate
