#pragma once

#include <string>
#include <optional>
#include <map>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Connection settings for one named host (or the defaults block)
struct HostProfile {
    std::string host;
    int port = 22;
    std::string user;
    std::optional<std::string> password;
    std::optional<std::string> ssh_key_path;
    int timeout = 30;
};

class Config {
public:
    // Load ~/.shellpush/config.yaml (or the given file). A missing file
    // yields the built-in defaults; a malformed one is an error.
    static Result<Config> load(const fs::path& path = get_config_path());

    // Parse YAML text directly
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const HostProfile& defaults() const { return defaults_; }
    const TransferSettings& transfer() const { return transfer_; }
    const std::map<std::string, HostProfile>& hosts() const { return hosts_; }
    const fs::path& source() const { return source_; }

    // Named profile lookup
    std::optional<HostProfile> find_host(const std::string& name) const;

    // Build a request for host_or_profile. A profile name pulls its
    // connection settings; anything else is a hostname on top of defaults.
    TransferRequest make_request(const std::string& host_or_profile,
                                 const std::string& local_path,
                                 const std::string& remote_path) const;

    static fs::path get_config_dir();
    static fs::path get_config_path();

public:
    Config() = default;

private:
    HostProfile defaults_;
    TransferSettings transfer_;
    std::map<std::string, HostProfile> hosts_;
    fs::path source_;

    friend class ConfigBuilder;
};

// Write a commented default config. Existing files are left alone.
Result<void> create_default_config(const fs::path& path = Config::get_config_path());
