#include "control_client.hpp"

#include "codec.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace pt = boost::property_tree;

namespace portgate {

namespace {

namespace beast = boost::beast;
namespace http = boost::beast::http;

constexpr std::chrono::seconds kControlTimeout{5};

bool parse_json(const std::string& body, pt::ptree& tree, std::ostream& err) {
    try {
        std::istringstream in(body);
        pt::read_json(in, tree);
        return true;
    } catch (const pt::json_parser_error& ex) {
        err << "unexpected response: " << ex.what() << "\n";
        return false;
    }
}

int report_failure(const ControlResponse& res, std::ostream& err) {
    std::string body = res.body;
    while (!body.empty() && (body.back() == '\n' || body.back() == '\r')) body.pop_back();
    err << "error " << res.status;
    if (!body.empty()) err << ": " << body;
    err << "\n";
    return 1;
}

} // namespace

ControlClient::ControlClient(std::string host, uint16_t port)
    : host_(std::move(host)), port_(port) {}

ControlResponse ControlClient::request(http::verb method, const std::string& target, const std::string& body) {
    boost::asio::io_context io;
    boost::asio::ip::tcp::resolver resolver(io);
    beast::tcp_stream stream(io);

    stream.expires_after(kControlTimeout);
    stream.connect(resolver.resolve(host_, std::to_string(port_)));

    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, host_ + ":" + std::to_string(port_));
    req.set(http::field::user_agent, "portgate-cli");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    req.prepare_payload();
    req.keep_alive(false);

    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);

    return ControlResponse{res.result_int(), std::move(res.body())};
}

int run_add(ControlClient& client, const std::string& domain, int port, std::ostream& out, std::ostream& err) {
    const Json body{{"domain", domain}, {"port", port}};
    const auto res = client.request(http::verb::post, "/api/mappings", dump_json(body));
    if (res.status != 201) return report_failure(res, err);

    pt::ptree mapping;
    if (!parse_json(res.body, mapping, err)) return 1;
    out << "Mapped " << mapping.get<std::string>("domain", domain) << " -> 127.0.0.1:"
        << mapping.get<int>("targetPort", port) << "\n";
    return 0;
}

int run_remove(ControlClient& client, const std::string& domain, std::ostream& out, std::ostream& err) {
    std::ostringstream target;
    target << "/api/mappings?domain=";
    for (unsigned char c : domain) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            target << c;
        } else {
            target << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
                   << static_cast<int>(c) << std::dec << std::nouppercase;
        }
    }
    const auto res = client.request(http::verb::delete_, target.str());
    if (res.status != 204) return report_failure(res, err);
    out << "Removed " << domain << "\n";
    return 0;
}

int run_list(ControlClient& client, std::ostream& out, std::ostream& err) {
    const auto res = client.request(http::verb::get, "/api/mappings");
    if (res.status != 200) return report_failure(res, err);

    pt::ptree mappings;
    if (!parse_json(res.body, mappings, err)) return 1;
    if (mappings.empty()) {
        out << "No mappings.\n";
        return 0;
    }
    for (const auto& entry : mappings) {
        const auto& m = entry.second;
        out << std::left << std::setw(24) << m.get<std::string>("domain", "")
            << " -> " << m.get<int>("targetPort", 0);
        if (m.get<bool>("system", false)) out << " (system)";
        out << "\n";
    }
    return 0;
}

int run_status(ControlClient& client, std::ostream& out, std::ostream& err) {
    const auto res = client.request(http::verb::get, "/api/ports");
    if (res.status != 200) return report_failure(res, err);

    pt::ptree ports;
    if (!parse_json(res.body, ports, err)) return 1;
    out << "portgate at " << client.host() << ":" << client.port() << ", "
        << ports.size() << " port(s)\n";
    for (const auto& entry : ports) {
        const auto& p = entry.second;
        out << std::right << std::setw(6) << p.get<int>("port", 0) << "  "
            << std::left << std::setw(5) << p.get<std::string>("serviceName", "-") << "  "
            << std::setw(7) << (p.get<bool>("healthy", false) ? "up" : "down") << "  "
            << std::setw(7) << p.get<std::string>("source", "") << "  "
            << p.get<std::string>("title", "");
        const auto exe = p.get<std::string>("exePath", "");
        if (!exe.empty()) out << "  [" << exe << "]";
        out << "\n";
    }
    return 0;
}

} // namespace portgate
