#include "process_resolver.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace portgate {

namespace {

constexpr std::string_view kListenState = "0A";
constexpr std::string_view kDeletedMarker = " (deleted)";

std::vector<std::string_view> split_fields(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
        const std::size_t start = i;
        while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) ++i;
        if (i > start) fields.push_back(line.substr(start, i - start));
    }
    return fields;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// "0BB8" -> 3000; the column holds the two port bytes in network order.
int decode_hex_port(std::string_view hex) {
    if (hex.size() != 4) return -1;
    int value = 0;
    for (char c : hex) {
        const int digit = hex_value(c);
        if (digit < 0) return -1;
        value = (value << 4) | digit;
    }
    return value;
}

bool all_digits(std::string_view text) {
    if (text.empty()) return false;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) return {};
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

std::string find_listen_inode(std::string_view table, uint16_t port) {
    bool header = true;
    while (!table.empty()) {
        const auto eol = table.find('\n');
        const auto line = table.substr(0, eol);
        table = eol == std::string_view::npos ? std::string_view{} : table.substr(eol + 1);
        if (header) {
            header = false;
            continue;
        }
        const auto fields = split_fields(line);
        if (fields.size() < 10) continue;
        if (fields[3] != kListenState) continue;
        const auto local = fields[1];
        const auto colon = local.rfind(':');
        if (colon == std::string_view::npos) continue;
        if (decode_hex_port(local.substr(colon + 1)) != port) continue;
        return std::string(fields[9]);
    }
    return {};
}

unsigned long find_listening_pid(std::string_view netstat_output, uint16_t port) {
    const std::string wanted = std::to_string(port);
    while (!netstat_output.empty()) {
        const auto eol = netstat_output.find('\n');
        const auto line = netstat_output.substr(0, eol);
        netstat_output = eol == std::string_view::npos ? std::string_view{} : netstat_output.substr(eol + 1);
        if (line.find("LISTENING") == std::string_view::npos) continue;

        const auto fields = split_fields(line);
        // Proto  Local Address  Foreign Address  State  PID
        if (fields.size() < 5) continue;
        const auto local = fields[1];
        const auto colon = local.rfind(':');
        if (colon == std::string_view::npos) continue;
        if (local.substr(colon + 1) != wanted) continue;

        const auto pid_field = fields.back();
        if (!all_digits(pid_field)) continue;
        try {
            return std::stoul(std::string(pid_field));
        } catch (const std::exception&) {
            continue;
        }
    }
    return 0;
}

std::string strip_deleted_marker(std::string path) {
    if (path.size() >= kDeletedMarker.size() &&
        path.compare(path.size() - kDeletedMarker.size(), kDeletedMarker.size(), kDeletedMarker) == 0) {
        path.erase(path.size() - kDeletedMarker.size());
    }
    return path;
}

ProcTableResolver::ProcTableResolver(std::string proc_root)
    : proc_root_(std::move(proc_root)) {}

std::string ProcTableResolver::resolve(uint16_t port) const {
    const auto inode = find_socket_inode(port);
    if (inode.empty()) return {};
    const auto pid = find_pid_by_inode(inode);
    if (pid.empty()) return {};

    std::error_code ec;
    auto exe = fs::read_symlink(fs::path(proc_root_) / pid / "exe", ec);
    if (ec) return {};
    return strip_deleted_marker(exe.string());
}

std::string ProcTableResolver::find_socket_inode(uint16_t port) const {
    for (const char* table : {"net/tcp", "net/tcp6"}) {
        const auto content = read_file(fs::path(proc_root_) / table);
        if (content.empty()) continue;
        auto inode = find_listen_inode(content, port);
        // inode 0 means the socket is orphaned or owned by another namespace.
        if (!inode.empty() && inode != "0") return inode;
    }
    return {};
}

std::string ProcTableResolver::find_pid_by_inode(const std::string& inode) const {
    const std::string target = "socket:[" + inode + "]";
    std::error_code ec;
    fs::directory_iterator procs(proc_root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) return {};

    try {
        for (const auto& entry : procs) {
            const auto pid = entry.path().filename().string();
            if (!all_digits(pid)) continue;
            try {
                // Processes may exit while their fd table is being walked.
                fs::directory_iterator fds(entry.path() / "fd", fs::directory_options::skip_permission_denied, ec);
                if (ec) continue;
                for (const auto& fd : fds) {
                    std::error_code link_ec;
                    const auto link = fs::read_symlink(fd.path(), link_ec);
                    if (!link_ec && link.string() == target) return pid;
                }
            } catch (const fs::filesystem_error&) {
                continue;
            }
        }
    } catch (const fs::filesystem_error&) {
        return {};
    }
    return {};
}

#ifndef _WIN32
std::shared_ptr<ProcessResolver> make_process_resolver() {
#ifdef __linux__
    return std::make_shared<ProcTableResolver>();
#else
    return std::make_shared<NullResolver>();
#endif
}
#endif

} // namespace portgate
