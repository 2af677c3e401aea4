#include "utils.hpp"
#include <cctype>
#include <stdexcept>
#include <fmt/format.h>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::optional<std::uint64_t> parse_byte_count(const std::string& text) {
    std::string s = text;
    trim(s);
    if (s.empty() || s.size() > 19) return std::nullopt;

    std::uint64_t value = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return value;
}

std::string shell_quote(const std::string& path) {
    bool safe = !path.empty();
    for (char c : path) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) ||
              c == '/' || c == '.' || c == '_' || c == '-' || c == '~' ||
              c == '+' || c == ',' || c == ':' || c == '@')) {
            safe = false;
            break;
        }
    }
    // A leading ~ only expands when unquoted, and only in first position.
    if (safe && path.find('~', 1) != std::string::npos) safe = false;
    if (safe) return path;

    std::string quoted = "'";
    for (char c : path) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    quoted += "'";
    return quoted;
}

std::string format_progress(std::size_t current, std::size_t total) {
    double pct = total == 0 ? 100.0 : (static_cast<double>(current) / total) * 100.0;
    return fmt::format("{}/{} ({:.1f}%)", current, total, pct);
}

const char* backend_name(Backend backend) {
    switch (backend) {
        case Backend::CLIENT_LIBRARY:  return "client-library";
        case Backend::PASSWORD_HELPER: return "password-helper";
        case Backend::NATIVE_OPENSSH:  return "native-openssh";
        case Backend::RAW_PIPE:        return "raw-pipe";
    }
    return "unknown";
}

std::optional<Backend> parse_backend(const std::string& name) {
    std::string key;
    for (char c : name) {
        key += (c == '_') ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (key == "client-library" || key == "libssh2") return Backend::CLIENT_LIBRARY;
    if (key == "password-helper" || key == "sshpass") return Backend::PASSWORD_HELPER;
    if (key == "native-openssh" || key == "openssh") return Backend::NATIVE_OPENSSH;
    if (key == "raw-pipe" || key == "pipe") return Backend::RAW_PIPE;
    return std::nullopt;
}
