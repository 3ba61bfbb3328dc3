#pragma once

#include "types.hpp"

#include <chrono>
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace portgate {

// Process-level options, filled from the command line.
struct AppOptions {
    std::string listen_address = "0.0.0.0";
    uint16_t proxy_port = 80;
    uint16_t dashboard_port = 8080;
    std::string dashboard_host = "127.0.0.1";
    std::string config_path; // empty means default_config_path()
    unsigned int threads = 0; // 0 means hardware_concurrency
    std::size_t subscriber_queue = 256;
};

// Persisted, user-owned state.
struct StoredConfig {
    std::vector<DomainMapping> mappings;
    int scan_interval_sec = 10;
    std::vector<ScanRange> scan_ranges; // empty means default_scan_ranges()
    std::vector<ManualPort> manual_ports;
    std::string domain_suffix = "localhost";
};

struct ConfigError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

enum class StoreResult {
    Ok,
    Duplicate,
    NotFound,
    Invalid,
    Reserved,
    SystemMapping,
    PersistFailed
};

const char* to_string(StoreResult result);

std::vector<ScanRange> default_scan_ranges();

// Throws ConfigError when the JSON is malformed.
StoredConfig parse_config(std::istream& in, std::ostream& log);
std::string serialize_config(const StoredConfig& config);

// $XDG_CONFIG_HOME/portgate/config.json, ~/.config/portgate/config.json,
// or %APPDATA%\portgate\config.json. Throws ConfigError if no base dir exists.
std::string default_config_path();

// Lowercases, trims and strips a trailing ".<suffix>".
std::string normalize_domain(std::string_view raw, std::string_view suffix);

bool valid_scan_range(const ScanRange& range);

// Thread-safe owner of StoredConfig. Readers take a shared lock, mutations are
// serialized and only committed to memory once the file write succeeded.
class ConfigStore {
public:
    explicit ConfigStore(std::string path, std::ostream& log);

    // Missing file keeps defaults. Throws ConfigError on unreadable or malformed files.
    void load();
    const std::string& path() const { return path_; }

    std::vector<ScanRange> scan_ranges() const;
    std::vector<ManualPort> manual_ports() const;
    std::vector<DomainMapping> mappings() const;
    std::optional<uint16_t> lookup_port(std::string_view domain) const;
    std::string domain_suffix() const;
    std::chrono::seconds scan_interval() const;

    StoreResult add_mapping(DomainMapping mapping);
    StoreResult remove_mapping(std::string_view domain);
    StoreResult add_manual_port(ManualPort port);
    StoreResult remove_manual_port(uint16_t port);
    StoreResult add_scan_range(ScanRange range);
    StoreResult remove_scan_range(ScanRange range);

    // Installs (or repoints) the reserved dashboard mapping.
    StoreResult ensure_system_mapping(uint16_t dashboard_port);

private:
    template <typename Fn>
    StoreResult mutate(Fn&& fn);
    bool persist(const StoredConfig& config);

    std::string path_;
    std::ostream& log_;
    mutable std::shared_mutex mu_;
    StoredConfig config_;
};

} // namespace portgate
