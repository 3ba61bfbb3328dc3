#pragma once

#include <cstdint>
#include <ostream>
#include <string>

#include <boost/beast/http/verb.hpp>

namespace portgate {

struct ControlResponse {
    unsigned status = 0;
    std::string body;
};

// Blocking HTTP client for the dashboard API of a running instance.
class ControlClient {
public:
    ControlClient(std::string host, uint16_t port);

    // Throws boost::system::system_error when the instance is unreachable.
    ControlResponse request(boost::beast::http::verb method,
                            const std::string& target,
                            const std::string& body = {});

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

private:
    std::string host_;
    uint16_t port_;
};

// Each returns a process exit code and prints a human readable result.
int run_add(ControlClient& client, const std::string& domain, int port, std::ostream& out, std::ostream& err);
int run_remove(ControlClient& client, const std::string& domain, std::ostream& out, std::ostream& err);
int run_list(ControlClient& client, std::ostream& out, std::ostream& err);
int run_status(ControlClient& client, std::ostream& out, std::ostream& err);

} // namespace portgate
