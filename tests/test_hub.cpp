#include "channel.hpp"
#include "config.hpp"
#include "hub.hpp"
#include "test_common.hpp"

#include <utility>

#include <boost/asio.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <chrono>
#include <sstream>
#include <thread>

using namespace portgate;
using namespace std::chrono_literals;

namespace {

DiscoveredPort make_port(uint16_t port, const std::string& title) {
    DiscoveredPort dp;
    dp.port = port;
    dp.service_name = "http";
    dp.title = title;
    dp.healthy = true;
    dp.last_seen = Clock::now();
    dp.source = kSourceScan;
    return dp;
}

// Runs the hub's strand on a background thread.
struct HubFixture {
    HubFixture()
        : store("unused_hub_test.json", log),
          metrics(make_metrics()),
          guard(boost::asio::make_work_guard(io)),
          hub(io, store, metrics) {
        runner = std::thread([this]() { io.run(); });
    }
    ~HubFixture() {
        guard.reset();
        io.stop();
        runner.join();
    }

    std::stringstream log;
    ConfigStore store;
    MetricsPtr metrics;
    boost::asio::io_context io;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> guard;
    Hub hub;
    std::thread runner;
};

boost::property_tree::ptree parse(const Message& message) {
    boost::property_tree::ptree tree;
    std::istringstream in(*message);
    boost::property_tree::read_json(in, tree);
    return tree;
}

} // namespace

int main() {
    auto test_channel_bounded_fifo = [] {
        Channel<int> ch(2);
        EXPECT_TRUE(ch.try_push(1));
        EXPECT_TRUE(ch.try_push(2));
        EXPECT_FALSE(ch.try_push(3));
        EXPECT_EQ(ch.size(), 2u);
        EXPECT_EQ(ch.pop().value_or(-1), 1);
        EXPECT_EQ(ch.pop().value_or(-1), 2);
        EXPECT_FALSE(ch.pop_for(10ms).has_value());
    };

    auto test_channel_close_wakes_consumer = [] {
        Channel<int> ch(1);
        std::thread consumer([&ch]() {
            while (ch.pop()) {
            }
        });
        EXPECT_TRUE(ch.push(7));
        ch.close();
        consumer.join();
        EXPECT_FALSE(ch.push(8));
        EXPECT_TRUE(ch.closed());
    };

    auto test_channel_blocking_push = [] {
        Channel<int> ch(1);
        EXPECT_TRUE(ch.push(1));
        std::thread producer([&ch]() { ch.push(2); });
        std::this_thread::sleep_for(20ms);
        EXPECT_EQ(ch.size(), 1u);
        EXPECT_EQ(ch.pop().value_or(-1), 1);
        EXPECT_EQ(ch.pop().value_or(-1), 2);
        producer.join();
    };

    auto test_get_ports_is_a_copy = [] {
        HubFixture f;
        f.hub.set_ports({make_port(3000, "one")});
        auto copy = f.hub.get_ports();
        EXPECT_EQ(copy.size(), 1u);
        copy[0].title = "mutated";
        copy.push_back(make_port(3001, "two"));
        const auto fresh = f.hub.get_ports();
        EXPECT_EQ(fresh.size(), 1u);
        EXPECT_EQ(fresh[0].title, "one");
    };

    auto test_subscriber_gets_state_first = [] {
        HubFixture f;
        f.hub.set_ports({make_port(3000, "one")});
        auto sub = std::make_shared<QueuedSubscriber>(8);
        f.hub.subscribe(sub);

        auto first = sub->queue().pop_for(2s);
        EXPECT_TRUE(first.has_value());
        auto tree = parse(*first);
        EXPECT_EQ(tree.get<std::string>("type"), "update");
        EXPECT_EQ(tree.get_child("data.ports").size(), 1u);
        EXPECT_EQ(tree.get<std::string>("data.domain_suffix"), "localhost");
        EXPECT_EQ(tree.get_child("data.scan_ranges").size(), 4u);

        f.hub.set_ports({make_port(3000, "one"), make_port(3001, "two")});
        auto second = sub->queue().pop_for(2s);
        EXPECT_TRUE(second.has_value());
        EXPECT_EQ(parse(*second).get_child("data.ports").size(), 2u);
        EXPECT_EQ(f.hub.subscriber_count(), 1u);
    };

    auto test_slow_subscriber_is_dropped = [] {
        HubFixture f;
        auto stalled = std::make_shared<QueuedSubscriber>(2);
        auto active = std::make_shared<QueuedSubscriber>(64);
        f.hub.subscribe(stalled);
        f.hub.subscribe(active);

        std::size_t received = 0;
        for (int i = 0; i < 10; ++i) {
            f.hub.set_ports({make_port(static_cast<uint16_t>(3000 + i), "p")});
            // The active subscriber keeps draining.
            while (auto m = active->queue().pop_for(200ms)) {
                ++received;
                const auto ports = parse(*m).get_child("data.ports");
                if (!ports.empty() && ports.front().second.get<int>("port") == 3000 + i) break;
            }
        }

        EXPECT_TRUE(received >= 10u);
        EXPECT_TRUE(stalled->queue().closed());
        EXPECT_FALSE(active->queue().closed());
        EXPECT_EQ(f.hub.subscriber_count(), 1u);
        EXPECT_EQ(f.metrics->subscribers_dropped.load(), 1u);
    };

    auto test_unsubscribe_closes = [] {
        HubFixture f;
        auto sub = std::make_shared<QueuedSubscriber>(4);
        f.hub.subscribe(sub);
        EXPECT_TRUE(sub->queue().pop_for(2s).has_value());
        f.hub.unsubscribe(sub);
        for (int i = 0; i < 100 && !sub->queue().closed(); ++i) {
            std::this_thread::sleep_for(10ms);
        }
        EXPECT_TRUE(sub->queue().closed());
        EXPECT_EQ(f.hub.subscriber_count(), 0u);
    };

    auto test_consume_until_closed = [] {
        HubFixture f;
        Channel<std::vector<DiscoveredPort>> snapshots(2);
        std::thread consumer([&]() { f.hub.consume(snapshots); });
        EXPECT_TRUE(snapshots.push({make_port(3000, "a")}));
        EXPECT_TRUE(snapshots.push({make_port(3000, "a"), make_port(4000, "b")}));
        snapshots.close();
        consumer.join();
        EXPECT_EQ(f.hub.get_ports().size(), 2u);
    };

    return run_tests({
        {"channel_bounded_fifo", test_channel_bounded_fifo},
        {"channel_close_wakes_consumer", test_channel_close_wakes_consumer},
        {"channel_blocking_push", test_channel_blocking_push},
        {"get_ports_is_a_copy", test_get_ports_is_a_copy},
        {"subscriber_gets_state_first", test_subscriber_gets_state_first},
        {"slow_subscriber_is_dropped", test_slow_subscriber_is_dropped},
        {"unsubscribe_closes", test_unsubscribe_closes},
        {"consume_until_closed", test_consume_until_closed},
    });
}
