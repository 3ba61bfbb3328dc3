#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace portgate {

// Maps a listening TCP port to the executable of the owning process.
// Implementations never throw; any failure yields an empty string.
class ProcessResolver {
public:
    virtual ~ProcessResolver() = default;
    virtual std::string name() const = 0;
    virtual std::string resolve(uint16_t port) const = 0;
};

// Walks /proc/net/tcp{,6} and /proc/<pid>/fd.
class ProcTableResolver : public ProcessResolver {
public:
    explicit ProcTableResolver(std::string proc_root = "/proc");

    std::string name() const override { return "proc-table"; }
    std::string resolve(uint16_t port) const override;

private:
    std::string find_socket_inode(uint16_t port) const;
    std::string find_pid_by_inode(const std::string& inode) const;

    std::string proc_root_;
};

#ifdef _WIN32
// Runs `netstat -ano` and asks the OS for the process image path.
class NetstatResolver : public ProcessResolver {
public:
    std::string name() const override { return "netstat"; }
    std::string resolve(uint16_t port) const override;
};
#endif

class NullResolver : public ProcessResolver {
public:
    std::string name() const override { return "none"; }
    std::string resolve(uint16_t) const override { return {}; }
};

// Selected at build time for the target platform.
std::shared_ptr<ProcessResolver> make_process_resolver();

// Returns the inode of a LISTEN row for `port` in a /proc/net/tcp style table.
std::string find_listen_inode(std::string_view table, uint16_t port);

// Returns the PID of a LISTENING row whose local address ends in exactly ":<port>", or 0.
unsigned long find_listening_pid(std::string_view netstat_output, uint16_t port);

// Strips the " (deleted)" marker the kernel appends to replaced binaries.
std::string strip_deleted_marker(std::string path);

} // namespace portgate
