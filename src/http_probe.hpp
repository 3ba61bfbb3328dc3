#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace portgate {

struct ProbeResult {
    bool http = false;   // a well-formed HTTP response header arrived
    std::string title;   // <title> text, or the Server header when there is none
    std::string server;
};

inline constexpr std::size_t kProbeBodyLimit = 64 * 1024;

// First <title ...>text</title> in the body, case-insensitive, trimmed.
std::string extract_title(std::string_view body);

using ProbeHandler = std::function<void(ProbeResult)>;

// Sends `GET /` to the endpoint. The whole exchange shares one deadline; the
// handler runs exactly once on the io_context.
void async_probe_http(boost::asio::io_context& io,
                      const boost::asio::ip::tcp::endpoint& endpoint,
                      std::chrono::milliseconds timeout,
                      ProbeHandler handler);

} // namespace portgate
