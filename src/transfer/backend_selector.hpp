#pragma once

#include <vector>
#include <optional>
#include <core/types.hpp>
#include <platform/platform.hpp>

// What this machine can run. Detected once per invocation.
struct ToolAvailability {
    bool client_library = false;   // libssh2 initialises
    bool password_helper = false;  // sshpass on PATH
    bool openssh_client = false;   // "ssh -V" exits 0
};

// Probe the local tools. Backends listed in settings.disabled_backends are
// reported unavailable.
ToolAvailability detect_tools(const TransferSettings& settings);

// True if backend can be attempted given tools. raw-pipe always can.
bool backend_usable(Backend backend, const ToolAvailability& tools, bool has_password);

// Ordered candidates for this OS, unavailable ones already removed.
//   Windows: client-library, native-openssh, raw-pipe
//   others:  password-helper (password given), client-library, raw-pipe
// A forced backend yields just that backend, or nothing if it cannot run.
std::vector<Backend> select_backends(platform::HostOs os, const ToolAvailability& tools,
                                     bool has_password,
                                     std::optional<Backend> forced = std::nullopt);
