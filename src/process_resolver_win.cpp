#include "process_resolver.hpp"

#include <array>
#include <cstdio>
#include <string>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

namespace portgate {

namespace {

std::string run_netstat() {
    FILE* pipe = _popen("netstat -ano -p tcp", "r");
    if (!pipe) return {};
    std::string output;
    std::array<char, 4096> buf{};
    while (std::fgets(buf.data(), static_cast<int>(buf.size()), pipe)) {
        output += buf.data();
    }
    _pclose(pipe);
    return output;
}

std::string narrow(const wchar_t* wide, DWORD length) {
    if (length == 0) return {};
    const int needed = WideCharToMultiByte(CP_UTF8, 0, wide, static_cast<int>(length), nullptr, 0, nullptr, nullptr);
    if (needed <= 0) return {};
    std::string out(static_cast<std::size_t>(needed), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide, static_cast<int>(length), out.data(), needed, nullptr, nullptr);
    return out;
}

std::string image_path_for_pid(unsigned long pid) {
    HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (!process) return {};
    std::array<wchar_t, 1024> buf{};
    DWORD size = static_cast<DWORD>(buf.size());
    const BOOL ok = QueryFullProcessImageNameW(process, 0, buf.data(), &size);
    CloseHandle(process);
    if (!ok) return {};
    return narrow(buf.data(), size);
}

} // namespace

std::string NetstatResolver::resolve(uint16_t port) const {
    const auto pid = find_listening_pid(run_netstat(), port);
    if (pid == 0) return {};
    return image_path_for_pid(pid);
}

std::shared_ptr<ProcessResolver> make_process_resolver() {
    return std::make_shared<NetstatResolver>();
}

} // namespace portgate
