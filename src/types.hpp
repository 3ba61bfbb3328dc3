#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace portgate {

using Clock = std::chrono::system_clock;

struct DiscoveredPort {
    uint16_t port = 0;
    std::string protocol = "tcp";
    std::string service_name; // "http", "tcp" or empty when closed
    std::string title;
    bool healthy = false;
    Clock::time_point last_seen{}; // epoch means "not seen this cycle"
    std::string source;            // "scan" or "manual"
    std::string exe_path;
};

struct ManualPort {
    uint16_t port = 0;
    std::string name;
    std::string install_path;
};

struct ScanRange {
    uint16_t start = 0;
    uint16_t end = 0;

    bool operator==(const ScanRange& other) const {
        return start == other.start && end == other.end;
    }
};

struct DomainMapping {
    std::string domain;
    uint16_t target_port = 0;
    Clock::time_point created_at{};
    bool is_system = false;
};

// Full state pushed to hub subscribers.
struct StateUpdate {
    std::vector<DiscoveredPort> ports;
    std::vector<DomainMapping> mappings;
    std::vector<ScanRange> scan_ranges;
    std::string domain_suffix;
};

inline constexpr const char* kSourceScan = "scan";
inline constexpr const char* kSourceManual = "manual";
inline constexpr const char* kReservedSubdomain = "portgate";

} // namespace portgate
