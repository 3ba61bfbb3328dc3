#pragma once

#include "config.hpp"
#include "hub.hpp"
#include "metrics.hpp"

#include <map>
#include <string>
#include <string_view>

#include <boost/beast/http.hpp>

namespace portgate {

using ApiRequest = boost::beast::http::request<boost::beast::http::string_body>;
using ApiResponse = boost::beast::http::response<boost::beast::http::string_body>;

// "%41+b" -> "A b". Malformed escapes are kept verbatim.
std::string url_decode(std::string_view text);
std::map<std::string, std::string> parse_query(std::string_view query);

boost::beast::http::status status_for(StoreResult result);

// REST surface of the dashboard: /api/ports, /api/scan-ranges, /api/mappings,
// /metrics and the built-in page. Successful mutations broadcast the new
// state through the hub.
class ApiHandler {
public:
    ApiHandler(ConfigStore& config, Hub& hub, MetricsPtr metrics);

    ApiResponse handle(const ApiRequest& req);

private:
    using Query = std::map<std::string, std::string>;

    ApiResponse handle_ports(const ApiRequest& req, const Query& query);
    ApiResponse handle_scan_ranges(const ApiRequest& req, const Query& query);
    ApiResponse handle_mappings(const ApiRequest& req, const Query& query);
    ApiResponse handle_metrics(const ApiRequest& req);
    ApiResponse handle_index(const ApiRequest& req);

    ConfigStore& config_;
    Hub& hub_;
    MetricsPtr metrics_;
};

} // namespace portgate
