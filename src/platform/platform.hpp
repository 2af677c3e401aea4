#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace platform {

enum class HostOs {
    WINDOWS,
    MACOS,
    LINUX,
    OTHER_UNIX,
};

// OS of the machine this binary runs on (not the remote host).
HostOs host_os();

// Human-readable name for a HostOs ("Windows", "Darwin", "Linux", ...).
const char* os_name(HostOs os);

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Search PATH for an executable. Names containing a directory separator
// are checked as-is.
std::optional<std::filesystem::path> find_executable(const std::string& name);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
