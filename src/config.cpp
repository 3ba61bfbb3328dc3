#include "config.hpp"

#include "codec.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>

namespace pt = boost::property_tree;
namespace fs = std::filesystem;

namespace portgate {

namespace {

bool valid_port(int port) {
    return port >= 1 && port <= 65535;
}

std::string trim(std::string_view text) {
    auto begin = text.begin();
    auto end = text.end();
    while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) ++begin;
    while (end != begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) --end;
    return std::string(begin, end);
}

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<ScanRange>& ranges_or_defaults(StoredConfig& config) {
    if (config.scan_ranges.empty()) {
        config.scan_ranges = default_scan_ranges();
    }
    return config.scan_ranges;
}

} // namespace

const char* to_string(StoreResult result) {
    switch (result) {
        case StoreResult::Ok: return "ok";
        case StoreResult::Duplicate: return "duplicate";
        case StoreResult::NotFound: return "not found";
        case StoreResult::Invalid: return "invalid";
        case StoreResult::Reserved: return "reserved domain";
        case StoreResult::SystemMapping: return "cannot delete system mapping";
        case StoreResult::PersistFailed: return "save failed";
    }
    return "unknown";
}

std::vector<ScanRange> default_scan_ranges() {
    return {
        ScanRange{3000, 3999},
        ScanRange{4000, 4099},
        ScanRange{5000, 5999},
        ScanRange{8000, 8999},
    };
}

bool valid_scan_range(const ScanRange& range) {
    return range.start >= 1 && range.start <= range.end;
}

std::string normalize_domain(std::string_view raw, std::string_view suffix) {
    std::string domain = to_lower(trim(raw));
    const std::string dot_suffix = "." + to_lower(suffix);
    if (!suffix.empty() && domain.size() >= dot_suffix.size() &&
        domain.compare(domain.size() - dot_suffix.size(), dot_suffix.size(), dot_suffix) == 0) {
        domain.erase(domain.size() - dot_suffix.size());
    }
    return domain;
}

StoredConfig parse_config(std::istream& in, std::ostream& log) {
    pt::ptree tree;
    try {
        pt::read_json(in, tree);
    } catch (const pt::json_parser_error& ex) {
        throw ConfigError(std::string("malformed config JSON: ") + ex.what());
    }

    StoredConfig config;
    try {
        config.scan_interval_sec = tree.get<int>("scanIntervalSec", config.scan_interval_sec);
        if (config.scan_interval_sec <= 0) {
            log << "[config] scanIntervalSec must be positive, using 10.\n";
            config.scan_interval_sec = 10;
        }
        config.domain_suffix = to_lower(trim(tree.get<std::string>("domainSuffix", config.domain_suffix)));
        if (config.domain_suffix.empty()) config.domain_suffix = "localhost";

        if (auto node = tree.get_child_optional("mappings")) {
            for (const auto& entry : *node) {
                const auto& item = entry.second;
                DomainMapping m;
                m.domain = normalize_domain(item.get<std::string>("domain", ""), config.domain_suffix);
                const int port = item.get<int>("targetPort", 0);
                m.is_system = item.get<bool>("system", false);
                if (m.domain.empty() || !valid_port(port)) {
                    log << "[config] Skip mapping '" << m.domain << "' due to invalid domain or port.\n";
                    continue;
                }
                m.target_port = static_cast<uint16_t>(port);
                if (auto created = parse_timestamp(item.get<std::string>("createdAt", ""))) {
                    m.created_at = *created;
                } else {
                    m.created_at = Clock::now();
                }
                auto same = std::find_if(config.mappings.begin(), config.mappings.end(),
                                         [&](const DomainMapping& other) { return other.domain == m.domain; });
                if (same != config.mappings.end()) {
                    *same = std::move(m);
                } else {
                    config.mappings.push_back(std::move(m));
                }
            }
        }

        if (auto node = tree.get_child_optional("scanRanges")) {
            for (const auto& entry : *node) {
                const int start = entry.second.get<int>("start", 0);
                const int end = entry.second.get<int>("end", 0);
                if (!valid_port(start) || !valid_port(end) || start > end) {
                    log << "[config] Skip scan range " << start << "-" << end << ".\n";
                    continue;
                }
                ScanRange range{static_cast<uint16_t>(start), static_cast<uint16_t>(end)};
                if (std::find(config.scan_ranges.begin(), config.scan_ranges.end(), range) == config.scan_ranges.end()) {
                    config.scan_ranges.push_back(range);
                }
            }
        }

        if (auto node = tree.get_child_optional("manualPorts")) {
            for (const auto& entry : *node) {
                const int port = entry.second.get<int>("port", 0);
                if (!valid_port(port)) {
                    log << "[config] Skip manual port " << port << ".\n";
                    continue;
                }
                ManualPort mp;
                mp.port = static_cast<uint16_t>(port);
                mp.name = entry.second.get<std::string>("name", "");
                mp.install_path = entry.second.get<std::string>("path", "");
                auto same = std::find_if(config.manual_ports.begin(), config.manual_ports.end(),
                                         [&](const ManualPort& other) { return other.port == mp.port; });
                if (same != config.manual_ports.end()) {
                    *same = std::move(mp);
                } else {
                    config.manual_ports.push_back(std::move(mp));
                }
            }
        }
    } catch (const pt::ptree_error& ex) {
        throw ConfigError(std::string("invalid config value: ") + ex.what());
    }
    return config;
}

std::string serialize_config(const StoredConfig& config) {
    const Json root{
        {"mappings", config.mappings},
        {"scanIntervalSec", config.scan_interval_sec},
        {"scanRanges", config.scan_ranges},
        {"manualPorts", config.manual_ports},
        {"domainSuffix", config.domain_suffix},
    };
    return dump_json(root, 2) + "\n";
}

std::string default_config_path() {
#ifdef _WIN32
    if (const char* appdata = std::getenv("APPDATA"); appdata && *appdata) {
        return (fs::path(appdata) / "portgate" / "config.json").string();
    }
    if (const char* profile = std::getenv("USERPROFILE"); profile && *profile) {
        return (fs::path(profile) / "AppData" / "Roaming" / "portgate" / "config.json").string();
    }
#else
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return (fs::path(xdg) / "portgate" / "config.json").string();
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return (fs::path(home) / ".config" / "portgate" / "config.json").string();
    }
#endif
    throw ConfigError("cannot determine a configuration directory");
}

ConfigStore::ConfigStore(std::string path, std::ostream& log)
    : path_(std::move(path)), log_(log) {}

void ConfigStore::load() {
    std::ifstream in(path_);
    if (!in) {
        std::error_code ec;
        if (fs::exists(path_, ec)) {
            throw ConfigError("cannot read config file " + path_);
        }
        log_ << "[config] No config at " << path_ << ". Using defaults.\n";
        return;
    }
    auto parsed = parse_config(in, log_);
    std::unique_lock<std::shared_mutex> lock(mu_);
    config_ = std::move(parsed);
    log_ << "[config] Loaded " << config_.mappings.size() << " mapping(s), "
         << config_.manual_ports.size() << " manual port(s) from " << path_ << "\n";
}

std::vector<ScanRange> ConfigStore::scan_ranges() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    if (config_.scan_ranges.empty()) return default_scan_ranges();
    return config_.scan_ranges;
}

std::vector<ManualPort> ConfigStore::manual_ports() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return config_.manual_ports;
}

std::vector<DomainMapping> ConfigStore::mappings() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return config_.mappings;
}

std::optional<uint16_t> ConfigStore::lookup_port(std::string_view domain) const {
    const auto key = to_lower(domain);
    std::shared_lock<std::shared_mutex> lock(mu_);
    for (const auto& m : config_.mappings) {
        if (m.domain == key) return m.target_port;
    }
    return std::nullopt;
}

std::string ConfigStore::domain_suffix() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return config_.domain_suffix;
}

std::chrono::seconds ConfigStore::scan_interval() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return std::chrono::seconds(config_.scan_interval_sec);
}

template <typename Fn>
StoreResult ConfigStore::mutate(Fn&& fn) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    StoredConfig next = config_;
    const StoreResult result = fn(next);
    if (result != StoreResult::Ok) return result;
    if (!persist(next)) return StoreResult::PersistFailed;
    config_ = std::move(next);
    return StoreResult::Ok;
}

bool ConfigStore::persist(const StoredConfig& config) {
    const fs::path target(path_);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            log_ << "[config] Cannot create " << target.parent_path().string() << ": " << ec.message() << "\n";
            return false;
        }
    }

    const fs::path tmp = target.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out) {
            log_ << "[config] Cannot open " << tmp.string() << " for writing\n";
            return false;
        }
        out << serialize_config(config);
        out.flush();
        if (!out) {
            log_ << "[config] Write to " << tmp.string() << " failed\n";
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        log_ << "[config] Rename " << tmp.string() << " -> " << path_ << " failed: " << ec.message() << "\n";
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }
    return true;
}

StoreResult ConfigStore::add_mapping(DomainMapping mapping) {
    return mutate([&](StoredConfig& config) {
        mapping.domain = normalize_domain(mapping.domain, config.domain_suffix);
        if (mapping.domain.empty() || mapping.target_port == 0) return StoreResult::Invalid;
        if (mapping.domain == kReservedSubdomain) return StoreResult::Reserved;
        mapping.is_system = false;
        if (mapping.created_at == Clock::time_point{}) mapping.created_at = Clock::now();

        auto it = std::find_if(config.mappings.begin(), config.mappings.end(),
                               [&](const DomainMapping& m) { return m.domain == mapping.domain; });
        if (it != config.mappings.end()) {
            *it = std::move(mapping);
        } else {
            config.mappings.push_back(std::move(mapping));
        }
        return StoreResult::Ok;
    });
}

StoreResult ConfigStore::remove_mapping(std::string_view domain) {
    return mutate([&](StoredConfig& config) {
        const auto key = normalize_domain(domain, config.domain_suffix);
        auto it = std::find_if(config.mappings.begin(), config.mappings.end(),
                               [&](const DomainMapping& m) { return m.domain == key; });
        if (it == config.mappings.end()) return StoreResult::NotFound;
        if (it->is_system) return StoreResult::SystemMapping;
        config.mappings.erase(it);
        return StoreResult::Ok;
    });
}

StoreResult ConfigStore::add_manual_port(ManualPort port) {
    return mutate([&](StoredConfig& config) {
        if (port.port == 0) return StoreResult::Invalid;
        auto it = std::find_if(config.manual_ports.begin(), config.manual_ports.end(),
                               [&](const ManualPort& p) { return p.port == port.port; });
        if (it != config.manual_ports.end()) {
            *it = std::move(port);
        } else {
            config.manual_ports.push_back(std::move(port));
        }
        return StoreResult::Ok;
    });
}

StoreResult ConfigStore::remove_manual_port(uint16_t port) {
    return mutate([&](StoredConfig& config) {
        auto it = std::find_if(config.manual_ports.begin(), config.manual_ports.end(),
                               [&](const ManualPort& p) { return p.port == port; });
        if (it == config.manual_ports.end()) return StoreResult::NotFound;
        config.manual_ports.erase(it);
        return StoreResult::Ok;
    });
}

StoreResult ConfigStore::add_scan_range(ScanRange range) {
    return mutate([&](StoredConfig& config) {
        if (!valid_scan_range(range)) return StoreResult::Invalid;
        auto& ranges = ranges_or_defaults(config);
        if (std::find(ranges.begin(), ranges.end(), range) != ranges.end()) return StoreResult::Duplicate;
        ranges.push_back(range);
        return StoreResult::Ok;
    });
}

StoreResult ConfigStore::remove_scan_range(ScanRange range) {
    return mutate([&](StoredConfig& config) {
        auto& ranges = ranges_or_defaults(config);
        auto it = std::find(ranges.begin(), ranges.end(), range);
        if (it == ranges.end()) return StoreResult::NotFound;
        ranges.erase(it);
        return StoreResult::Ok;
    });
}

StoreResult ConfigStore::ensure_system_mapping(uint16_t dashboard_port) {
    {
        std::shared_lock<std::shared_mutex> lock(mu_);
        for (const auto& m : config_.mappings) {
            if (m.domain == kReservedSubdomain && m.is_system && m.target_port == dashboard_port) {
                return StoreResult::Ok;
            }
        }
    }
    return mutate([&](StoredConfig& config) {
        DomainMapping system{kReservedSubdomain, dashboard_port, Clock::now(), true};
        auto it = std::find_if(config.mappings.begin(), config.mappings.end(),
                               [](const DomainMapping& m) { return m.domain == kReservedSubdomain; });
        if (it != config.mappings.end()) {
            *it = std::move(system);
        } else {
            config.mappings.insert(config.mappings.begin(), std::move(system));
        }
        return StoreResult::Ok;
    });
}

} // namespace portgate
