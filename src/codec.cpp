#include "codec.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace portgate {

namespace {

std::time_t utc_to_time_t(std::tm* tm) {
#ifdef _WIN32
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

} // namespace

std::string format_timestamp(Clock::time_point tp) {
    const std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::optional<Clock::time_point> parse_timestamp(std::string_view text) {
    if (text.size() < 19) return std::nullopt;
    std::tm tm{};
    std::istringstream in(std::string(text.substr(0, 19)));
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) return std::nullopt;

    std::size_t pos = 19;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
    }

    long offset_seconds = 0;
    if (pos < text.size()) {
        const char zone = text[pos];
        if (zone == '+' || zone == '-') {
            if (text.size() < pos + 6 || text[pos + 3] != ':') return std::nullopt;
            int hh = 0;
            int mm = 0;
            try {
                hh = std::stoi(std::string(text.substr(pos + 1, 2)));
                mm = std::stoi(std::string(text.substr(pos + 4, 2)));
            } catch (const std::exception&) {
                return std::nullopt;
            }
            offset_seconds = (hh * 3600L + mm * 60L) * (zone == '+' ? 1 : -1);
        } else if (zone != 'Z' && zone != 'z') {
            return std::nullopt;
        }
    }

    const std::time_t t = utc_to_time_t(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return Clock::from_time_t(t - offset_seconds);
}

void to_json(Json& j, const DiscoveredPort& port) {
    j = Json{
        {"port", port.port},
        {"protocol", port.protocol},
        {"serviceName", port.service_name},
        {"title", port.title},
        {"healthy", port.healthy},
        {"lastSeen", nullptr},
        {"source", port.source},
        {"exePath", port.exe_path},
    };
    if (port.last_seen != Clock::time_point{}) j["lastSeen"] = format_timestamp(port.last_seen);
}

void to_json(Json& j, const ManualPort& port) {
    j = Json{{"port", port.port}, {"name", port.name}, {"path", port.install_path}};
}

void to_json(Json& j, const ScanRange& range) {
    j = Json{{"start", range.start}, {"end", range.end}};
}

void to_json(Json& j, const DomainMapping& mapping) {
    j = Json{
        {"domain", mapping.domain},
        {"targetPort", mapping.target_port},
        {"createdAt", format_timestamp(mapping.created_at)},
        {"system", mapping.is_system},
    };
}

std::string dump_json(const Json& value, int indent) {
    return value.dump(indent, ' ', false, Json::error_handler_t::replace);
}

std::string to_json(const DiscoveredPort& port) { return dump_json(Json(port)); }
std::string to_json(const ManualPort& port) { return dump_json(Json(port)); }
std::string to_json(const ScanRange& range) { return dump_json(Json(range)); }
std::string to_json(const DomainMapping& mapping) { return dump_json(Json(mapping)); }

std::string to_json(const std::vector<DiscoveredPort>& ports) { return dump_json(Json(ports)); }
std::string to_json(const std::vector<ManualPort>& ports) { return dump_json(Json(ports)); }
std::string to_json(const std::vector<ScanRange>& ranges) { return dump_json(Json(ranges)); }
std::string to_json(const std::vector<DomainMapping>& mappings) { return dump_json(Json(mappings)); }

std::string render_update(const StateUpdate& update) {
    const Json envelope{
        {"type", "update"},
        {"data",
         {
             {"ports", update.ports},
             {"mappings", update.mappings},
             {"scan_ranges", update.scan_ranges},
             {"domain_suffix", update.domain_suffix},
         }},
    };
    return dump_json(envelope);
}

} // namespace portgate
