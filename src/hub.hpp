#pragma once

#include "channel.hpp"
#include "config.hpp"
#include "metrics.hpp"
#include "types.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

namespace portgate {

using Message = std::shared_ptr<const std::string>;

// A consumer of hub broadcasts. deliver() must not block: it either enqueues
// the message on the subscriber's bounded queue or returns false when full.
class Subscriber {
public:
    virtual ~Subscriber() = default;
    virtual bool deliver(Message message) = 0;
    // Called once when the hub drops the subscriber.
    virtual void close() = 0;
};

using SubscriberPtr = std::shared_ptr<Subscriber>;

// Subscriber backed by a bounded Channel, consumed by pop()/pop_for().
class QueuedSubscriber : public Subscriber {
public:
    explicit QueuedSubscriber(std::size_t capacity) : queue_(capacity) {}

    bool deliver(Message message) override { return queue_.try_push(std::move(message)); }
    void close() override { queue_.close(); }

    Channel<Message>& queue() { return queue_; }

private:
    Channel<Message> queue_;
};

class Hub {
public:
    Hub(boost::asio::io_context& io, const ConfigStore& config, MetricsPtr metrics = nullptr);

    // Replaces the snapshot and broadcasts the full state.
    void set_ports(std::vector<DiscoveredPort> ports);
    std::vector<DiscoveredPort> get_ports() const;

    // Broadcasts the full state without touching the snapshot (config changed).
    void broadcast_update();

    // The subscriber first receives the current state, then every later broadcast.
    void subscribe(SubscriberPtr subscriber);
    void unsubscribe(SubscriberPtr subscriber);

    // Feeds set_ports from the scanner until the channel is closed.
    void consume(Channel<std::vector<DiscoveredPort>>& snapshots);

    StateUpdate current_state() const;
    std::string render_state() const;
    std::size_t subscriber_count() const { return subscriber_count_.load(); }

private:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    void do_broadcast(const Message& message);

    Strand strand_;
    const ConfigStore& config_;
    MetricsPtr metrics_;

    mutable std::shared_mutex ports_mu_;
    std::vector<DiscoveredPort> ports_;

    // Only touched on strand_.
    std::unordered_set<SubscriberPtr> subscribers_;
    std::atomic<std::size_t> subscriber_count_{0};
};

} // namespace portgate
