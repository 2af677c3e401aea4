#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <cstddef>
#include "types.hpp"

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Parse a non-negative decimal byte count such as "  2048\n".
// Returns nullopt unless the trimmed text is all digits.
std::optional<std::uint64_t> parse_byte_count(const std::string& text);

// Quote a path for a POSIX shell. Paths made only of safe characters are
// returned unchanged so that "~/" still expands remotely.
std::string shell_quote(const std::string& path);

// "current/total (pct%)" with one decimal place.
std::string format_progress(std::size_t current, std::size_t total);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Stable lowercase names: "client-library", "password-helper",
// "native-openssh", "raw-pipe".
const char* backend_name(Backend backend);
std::optional<Backend> parse_backend(const std::string& name);
