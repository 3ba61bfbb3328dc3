#include "config.hpp"
#include "control_client.hpp"
#include "dashboard.hpp"
#include "hub.hpp"
#include "metrics.hpp"
#include "process_resolver.hpp"
#include "router.hpp"
#include "scanner.hpp"
#include "server.hpp"

#include <boost/asio.hpp>

#include <algorithm>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace portgate;

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage:\n"
              << "  " << prog << " [start] [--proxy-port N] [--dashboard-port N] [--listen ADDR]\n"
              << "          [-c|--config PATH] [--threads N] [--queue N]\n"
              << "  " << prog << " add <domain> <port> [--dashboard-port N]\n"
              << "  " << prog << " remove <domain> [--dashboard-port N]\n"
              << "  " << prog << " list [--dashboard-port N]\n"
              << "  " << prog << " status [--dashboard-port N]\n";
}

unsigned long parse_number(const std::string& text, const std::string& what, unsigned long max) {
    std::size_t used = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(text, &used);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid " + what + ": " + text);
    }
    if (used != text.size() || value == 0 || value > max) {
        throw std::runtime_error("invalid " + what + ": " + text);
    }
    return value;
}

uint16_t parse_port(const std::string& text, const std::string& what) {
    return static_cast<uint16_t>(parse_number(text, what, 65535));
}

int run_service(const AppOptions& options) {
    const std::string config_path = options.config_path.empty() ? default_config_path() : options.config_path;
    ConfigStore config(config_path, std::cerr);
    config.load();
    if (config.ensure_system_mapping(options.dashboard_port) != StoreResult::Ok) {
        std::cerr << "[config] Could not save the " << kReservedSubdomain << " mapping to " << config_path << "\n";
    }

    boost::asio::io_context io;
    auto metrics = make_metrics();
    Hub hub(io, config, metrics);
    auto router = std::make_shared<const Router>(config, options.dashboard_port);

    ProxySettings settings;
    settings.dashboard_url = "http://" + options.dashboard_host + ":" + std::to_string(options.dashboard_port);

    DashboardServer dashboard(io, options.listen_address, options.dashboard_port, config, hub, metrics,
                              options.subscriber_queue);
    ProxyServer proxy(io, options.listen_address, options.proxy_port, router, settings, metrics);
    dashboard.start();
    proxy.start();

    Scanner scanner(config, make_process_resolver(), ScannerOptions{}, metrics);
    SnapshotChannel snapshots(2);
    std::thread hub_thread([&hub, &snapshots]() { hub.consume(snapshots); });
    std::jthread scan_thread([&scanner, &snapshots](std::stop_token stop) { scanner.run(stop, snapshots); });

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (ec) return;
        std::cout << "[server] Shutting down on signal " << signal_number << "\n";
        scan_thread.request_stop();
        snapshots.close();
        proxy.stop();
        dashboard.stop();
        io.stop();
    });

    std::cout << "[server] portgate started, config " << config_path << "\n";

    const auto workers = options.threads != 0 ? options.threads : std::max(2u, std::thread::hardware_concurrency());
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (unsigned int i = 0; i < workers; ++i) {
        threads.emplace_back([&io]() { io.run(); });
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }

    scan_thread.request_stop();
    snapshots.close();
    scan_thread.join();
    hub_thread.join();
    return 0;
}

int run_control(const std::string& command, const std::vector<std::string>& args, const AppOptions& options) {
    ControlClient client(options.dashboard_host, options.dashboard_port);
    try {
        if (command == "add") {
            if (args.size() != 2) {
                std::cerr << "usage: portgate add <domain> <port>\n";
                return 1;
            }
            return run_add(client, args[0], parse_port(args[1], "port"), std::cout, std::cerr);
        }
        if (command == "remove") {
            if (args.size() != 1) {
                std::cerr << "usage: portgate remove <domain>\n";
                return 1;
            }
            return run_remove(client, args[0], std::cout, std::cerr);
        }
        if (command == "list") return run_list(client, std::cout, std::cerr);
        return run_status(client, std::cout, std::cerr);
    } catch (const boost::system::system_error& ex) {
        std::cerr << "error: " << ex.what() << " (is portgate running on "
                  << client.host() << ":" << client.port() << "?)\n";
        return 1;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        AppOptions options;
        std::vector<std::string> positional;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            const bool has_value = i + 1 < argc;
            if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if ((arg == "-c" || arg == "--config") && has_value) {
                options.config_path = argv[++i];
            } else if (arg == "--proxy-port" && has_value) {
                options.proxy_port = parse_port(argv[++i], "proxy port");
            } else if (arg == "--dashboard-port" && has_value) {
                options.dashboard_port = parse_port(argv[++i], "dashboard port");
            } else if (arg == "--dashboard-host" && has_value) {
                options.dashboard_host = argv[++i];
            } else if (arg == "--listen" && has_value) {
                options.listen_address = argv[++i];
            } else if (arg == "--threads" && has_value) {
                options.threads = static_cast<unsigned int>(parse_number(argv[++i], "thread count", 1024));
            } else if (arg == "--queue" && has_value) {
                options.subscriber_queue = parse_number(argv[++i], "queue size", 1u << 20);
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            } else {
                positional.push_back(arg);
            }
        }

        std::string command = "start";
        if (!positional.empty()) {
            command = positional.front();
            positional.erase(positional.begin());
        }

        if (command == "start") {
            return run_service(options);
        }
        if (command == "add" || command == "remove" || command == "list" || command == "status") {
            return run_control(command, positional, options);
        }
        std::cerr << "unknown command: " << command << "\ncommands: start, add, remove, list, status\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "[fatal] " << ex.what() << "\n";
        return 1;
    }
}
