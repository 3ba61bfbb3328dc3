#include "api.hpp"

#include "codec.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <charconv>
#include <iostream>
#include <optional>
#include <sstream>

namespace pt = boost::property_tree;

namespace portgate {

namespace {

namespace http = boost::beast::http;

constexpr const char* kIndexPage = R"HTML(<!DOCTYPE html>
<html>
<head>
<meta charset="utf-8">
<title>portgate</title>
<style>
body { font-family: sans-serif; margin: 2em; }
table { border-collapse: collapse; margin-bottom: 2em; }
td, th { border: 1px solid #ccc; padding: 4px 8px; text-align: left; }
.down { color: #999; }
</style>
</head>
<body>
<h1>portgate</h1>
<h2>Ports</h2>
<table id="ports"><thead><tr><th>Port</th><th>Service</th><th>Title</th><th>Source</th><th>Process</th></tr></thead><tbody></tbody></table>
<h2>Mappings</h2>
<table id="mappings"><thead><tr><th>Domain</th><th>Port</th></tr></thead><tbody></tbody></table>
<script>
function cell(row, text) { const td = document.createElement("td"); td.textContent = text; row.appendChild(td); }
function render(data) {
  const suffix = data.domain_suffix || "localhost";
  const ports = document.querySelector("#ports tbody");
  ports.innerHTML = "";
  for (const p of data.ports || []) {
    const row = document.createElement("tr");
    if (!p.healthy) row.className = "down";
    cell(row, p.port); cell(row, p.serviceName); cell(row, p.title); cell(row, p.source); cell(row, p.exePath);
    ports.appendChild(row);
  }
  const mappings = document.querySelector("#mappings tbody");
  mappings.innerHTML = "";
  for (const m of data.mappings || []) {
    const row = document.createElement("tr");
    cell(row, m.domain + "." + suffix); cell(row, m.targetPort);
    mappings.appendChild(row);
  }
}
function connect() {
  const ws = new WebSocket((location.protocol === "https:" ? "wss://" : "ws://") + location.host + "/ws");
  ws.onmessage = (ev) => { const msg = JSON.parse(ev.data); if (msg.type === "update") render(msg.data); };
  ws.onclose = () => setTimeout(connect, 2000);
}
connect();
</script>
</body>
</html>
)HTML";

std::string_view to_view(boost::beast::string_view sv) {
    return std::string_view(sv.data(), sv.size());
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<int> parse_int(std::string_view text) {
    int value = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end) return std::nullopt;
    return value;
}

bool valid_port(int port) {
    return port >= 1 && port <= 65535;
}

ApiResponse make_response(const ApiRequest& req, http::status status) {
    ApiResponse res{status, req.version()};
    res.set(http::field::server, "portgate");
    res.keep_alive(req.keep_alive());
    return res;
}

ApiResponse json_response(const ApiRequest& req, http::status status, std::string body) {
    auto res = make_response(req, status);
    res.set(http::field::content_type, "application/json");
    res.body() = std::move(body) + "\n";
    res.prepare_payload();
    return res;
}

ApiResponse text_response(const ApiRequest& req, http::status status, std::string_view text) {
    auto res = make_response(req, status);
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.body() = std::string(text) + "\n";
    res.prepare_payload();
    return res;
}

ApiResponse no_content(const ApiRequest& req) {
    return make_response(req, http::status::no_content);
}

ApiResponse store_error(const ApiRequest& req, StoreResult result) {
    return text_response(req, status_for(result), to_string(result));
}

ApiResponse method_not_allowed(const ApiRequest& req, std::string_view allow) {
    auto res = text_response(req, http::status::method_not_allowed, "method not allowed");
    res.set(http::field::allow, std::string(allow));
    return res;
}

// Body must be a JSON object; nullopt on anything else.
std::optional<pt::ptree> parse_body(const ApiRequest& req) {
    pt::ptree tree;
    try {
        std::istringstream in(req.body());
        pt::read_json(in, tree);
    } catch (const pt::json_parser_error&) {
        return std::nullopt;
    }
    return tree;
}

std::optional<int> body_int(const pt::ptree& tree, const std::string& key) {
    auto value = tree.get_optional<std::string>(key);
    if (!value) return 0;
    if (value->empty()) return std::nullopt;
    return parse_int(*value);
}

} // namespace

std::string url_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < text.size() && hex_value(text[i + 1]) >= 0 && hex_value(text[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::map<std::string, std::string> parse_query(std::string_view query) {
    std::map<std::string, std::string> params;
    while (!query.empty()) {
        const auto amp = query.find('&');
        const auto pair = query.substr(0, amp);
        if (!pair.empty()) {
            const auto eq = pair.find('=');
            auto key = url_decode(pair.substr(0, eq));
            auto value = eq == std::string_view::npos ? std::string() : url_decode(pair.substr(eq + 1));
            params.emplace(std::move(key), std::move(value));
        }
        if (amp == std::string_view::npos) break;
        query.remove_prefix(amp + 1);
    }
    return params;
}

http::status status_for(StoreResult result) {
    switch (result) {
        case StoreResult::Ok: return http::status::ok;
        case StoreResult::Duplicate: return http::status::conflict;
        case StoreResult::NotFound: return http::status::not_found;
        case StoreResult::Invalid: return http::status::bad_request;
        case StoreResult::Reserved: return http::status::bad_request;
        case StoreResult::SystemMapping: return http::status::forbidden;
        case StoreResult::PersistFailed: return http::status::internal_server_error;
    }
    return http::status::internal_server_error;
}

ApiHandler::ApiHandler(ConfigStore& config, Hub& hub, MetricsPtr metrics)
    : config_(config), hub_(hub), metrics_(std::move(metrics)) {}

ApiResponse ApiHandler::handle(const ApiRequest& req) {
    const auto target = to_view(req.target());
    const auto qmark = target.find('?');
    const auto path = target.substr(0, qmark);
    const Query query = qmark == std::string_view::npos ? Query{} : parse_query(target.substr(qmark + 1));

    if (path == "/api/ports") return handle_ports(req, query);
    if (path == "/api/scan-ranges") return handle_scan_ranges(req, query);
    if (path == "/api/mappings") return handle_mappings(req, query);
    if (path == "/metrics") return handle_metrics(req);
    if (path == "/" || path == "/index.html") return handle_index(req);
    return text_response(req, http::status::not_found, "404 page not found");
}

ApiResponse ApiHandler::handle_ports(const ApiRequest& req, const Query& query) {
    switch (req.method()) {
        case http::verb::get:
            return json_response(req, http::status::ok, to_json(hub_.get_ports()));

        case http::verb::post: {
            const auto body = parse_body(req);
            if (!body) return text_response(req, http::status::bad_request, "bad request");
            const auto port = body_int(*body, "port");
            if (!port) return text_response(req, http::status::bad_request, "bad request");
            if (!valid_port(*port)) return text_response(req, http::status::bad_request, "port must be 1-65535");

            ManualPort mp;
            mp.port = static_cast<uint16_t>(*port);
            mp.name = body->get<std::string>("name", "");
            mp.install_path = body->get<std::string>("path", "");
            const auto result = config_.add_manual_port(mp);
            if (result != StoreResult::Ok) return store_error(req, result);
            hub_.broadcast_update();
            return json_response(req, http::status::created, to_json(mp));
        }

        case http::verb::delete_: {
            const auto it = query.find("port");
            if (it == query.end() || it->second.empty()) {
                return text_response(req, http::status::bad_request, "port required");
            }
            const auto port = parse_int(it->second);
            if (!port || !valid_port(*port)) return text_response(req, http::status::bad_request, "invalid port");
            const auto result = config_.remove_manual_port(static_cast<uint16_t>(*port));
            if (result != StoreResult::Ok) return store_error(req, result);
            hub_.broadcast_update();
            return no_content(req);
        }

        default:
            return method_not_allowed(req, "GET, POST, DELETE");
    }
}

ApiResponse ApiHandler::handle_scan_ranges(const ApiRequest& req, const Query& query) {
    switch (req.method()) {
        case http::verb::get:
            return json_response(req, http::status::ok, to_json(config_.scan_ranges()));

        case http::verb::post: {
            const auto body = parse_body(req);
            if (!body) return text_response(req, http::status::bad_request, "bad request");
            const auto start = body_int(*body, "start");
            const auto end = body_int(*body, "end");
            if (!start || !end) return text_response(req, http::status::bad_request, "bad request");
            if (!valid_port(*start) || !valid_port(*end) || *start > *end) {
                return text_response(req, http::status::bad_request, "invalid range");
            }
            const ScanRange range{static_cast<uint16_t>(*start), static_cast<uint16_t>(*end)};
            const auto result = config_.add_scan_range(range);
            if (result != StoreResult::Ok) return store_error(req, result);
            hub_.broadcast_update();
            return json_response(req, http::status::created, to_json(range));
        }

        case http::verb::delete_: {
            const auto start_it = query.find("start");
            const auto end_it = query.find("end");
            if (start_it == query.end() || end_it == query.end() ||
                start_it->second.empty() || end_it->second.empty()) {
                return text_response(req, http::status::bad_request, "start and end required");
            }
            const auto start = parse_int(start_it->second);
            if (!start || !valid_port(*start)) return text_response(req, http::status::bad_request, "invalid start");
            const auto end = parse_int(end_it->second);
            if (!end || !valid_port(*end)) return text_response(req, http::status::bad_request, "invalid end");
            const auto result = config_.remove_scan_range(
                ScanRange{static_cast<uint16_t>(*start), static_cast<uint16_t>(*end)});
            if (result != StoreResult::Ok) return store_error(req, result);
            hub_.broadcast_update();
            return no_content(req);
        }

        default:
            return method_not_allowed(req, "GET, POST, DELETE");
    }
}

ApiResponse ApiHandler::handle_mappings(const ApiRequest& req, const Query& query) {
    switch (req.method()) {
        case http::verb::get:
            return json_response(req, http::status::ok, to_json(config_.mappings()));

        case http::verb::post: {
            const auto body = parse_body(req);
            if (!body) return text_response(req, http::status::bad_request, "bad request");
            const auto port = body_int(*body, "port");
            if (!port) return text_response(req, http::status::bad_request, "bad request");
            const auto raw_domain = body->get<std::string>("domain", "");
            if (raw_domain.empty() || *port == 0) {
                return text_response(req, http::status::bad_request, "domain and port required");
            }
            if (!valid_port(*port)) return text_response(req, http::status::bad_request, "port must be 1-65535");

            DomainMapping mapping;
            mapping.domain = normalize_domain(raw_domain, config_.domain_suffix());
            if (mapping.domain.empty() || mapping.domain == kReservedSubdomain) {
                return text_response(req, http::status::bad_request, "reserved domain");
            }
            mapping.target_port = static_cast<uint16_t>(*port);
            mapping.created_at = Clock::now();

            const auto result = config_.add_mapping(mapping);
            if (result != StoreResult::Ok) return store_error(req, result);
            std::cout << "[dashboard] Mapped " << mapping.domain << " -> " << mapping.target_port << "\n";
            hub_.broadcast_update();
            return json_response(req, http::status::created, to_json(mapping));
        }

        case http::verb::delete_: {
            const auto it = query.find("domain");
            if (it == query.end() || it->second.empty()) {
                return text_response(req, http::status::bad_request, "domain required");
            }
            const auto result = config_.remove_mapping(it->second);
            if (result != StoreResult::Ok) return store_error(req, result);
            std::cout << "[dashboard] Unmapped " << it->second << "\n";
            hub_.broadcast_update();
            return no_content(req);
        }

        default:
            return method_not_allowed(req, "GET, POST, DELETE");
    }
}

ApiResponse ApiHandler::handle_metrics(const ApiRequest& req) {
    if (req.method() != http::verb::get) return method_not_allowed(req, "GET");
    auto res = make_response(req, http::status::ok);
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.body() = metrics_ ? render_metrics(*metrics_) : std::string();
    res.prepare_payload();
    return res;
}

ApiResponse ApiHandler::handle_index(const ApiRequest& req) {
    if (req.method() != http::verb::get) return method_not_allowed(req, "GET");
    auto res = make_response(req, http::status::ok);
    res.set(http::field::content_type, "text/html; charset=utf-8");
    res.body() = kIndexPage;
    res.prepare_payload();
    return res;
}

} // namespace portgate
