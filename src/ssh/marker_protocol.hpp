#pragma once

#include <string>

// BEGIN/DONE framing for commands written into a long-lived shell's stdin.
// Pipe-driven sessions have no per-command exit status, so a query is
// echoed between two markers and the exit status rides on the DONE line.

struct MarkerResult {
    std::string output;
    int exit_code;
    bool found;
};

// Build a command line wrapped with BEGIN/DONE markers, newline-terminated.
std::string build_marker_command(const std::string& cmd);

// Parse raw stdout for BEGIN/DONE markers.
// found stays false until the DONE line (with its exit code) is complete.
MarkerResult parse_marker_output(const std::string& raw);

inline constexpr const char* SHELLPUSH_BEGIN_MARKER = "__SHELLPUSH_BEGIN__";
inline constexpr const char* SHELLPUSH_DONE_MARKER  = "__SHELLPUSH_DONE__";
