#include "platform.hpp"
#include <cstdlib>
#include <system_error>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace platform {

HostOs host_os() {
#if defined(_WIN32)
    return HostOs::WINDOWS;
#elif defined(__APPLE__)
    return HostOs::MACOS;
#elif defined(__linux__)
    return HostOs::LINUX;
#else
    return HostOs::OTHER_UNIX;
#endif
}

const char* os_name(HostOs os) {
    switch (os) {
        case HostOs::WINDOWS:    return "Windows";
        case HostOs::MACOS:      return "Darwin";
        case HostOs::LINUX:      return "Linux";
        case HostOs::OTHER_UNIX: return "Unix";
    }
    return "Unknown";
}

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

static bool is_executable_file(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) return false;
#ifdef _WIN32
    return true;
#else
    return access(p.c_str(), X_OK) == 0;
#endif
}

std::optional<fs::path> find_executable(const std::string& name) {
    if (name.empty()) return std::nullopt;

    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        if (is_executable_file(name)) return fs::path(name);
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return std::nullopt;

#ifdef _WIN32
    const char sep = ';';
    const char* suffixes[] = {".exe", ".cmd", ".bat", ""};
#else
    const char sep = ':';
    const char* suffixes[] = {""};
#endif

    std::string paths(path_env);
    size_t start = 0;
    while (start <= paths.size()) {
        size_t end = paths.find(sep, start);
        if (end == std::string::npos) end = paths.size();
        std::string dir = paths.substr(start, end - start);
        if (!dir.empty()) {
            for (const char* suffix : suffixes) {
                fs::path candidate = fs::path(dir) / (name + suffix);
                if (is_executable_file(candidate)) return candidate;
            }
        }
        start = end + 1;
    }
    return std::nullopt;
}

void sleep_ms(int ms) {
    if (ms <= 0) return;
#ifdef _WIN32
    Sleep(ms);
#else
    usleep(static_cast<useconds_t>(ms) * 1000);
#endif
}

} // namespace platform
