#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <core/types.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string shellpush_log_path() {
    static std::string path = (platform::temp_dir() / "shellpush_debug.log").string();
    return path;
}

inline void shellpush_log(const std::string& msg) {
    std::ofstream out(shellpush_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

// Chunk commands are thousands of characters long; only the head is kept.
inline void shellpush_log_ssh(const std::string& label, const std::string& cmd,
                              const SSHResult& r) {
    shellpush_log(fmt::format("{} CMD: {}", label, cmd.substr(0, 120)));
    shellpush_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                              r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        shellpush_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
