#include "config.hpp"
#include "utils.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

fs::path Config::get_config_dir() {
    return platform::home_dir() / ".shellpush";
}

fs::path Config::get_config_path() {
    return get_config_dir() / "config.yaml";
}

Result<void> create_default_config(const fs::path& config_path) {
    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# shellpush configuration

# Connection defaults for hosts given on the command line
defaults:
  port: 22
  user: ""
  timeout: 30
  # ssh_key_path: "~/.ssh/id_ed25519"

transfer:
  abort_on_chunk_failure: true   # false: log a failed chunk and keep going
  strict_verify: false           # true: an unreadable remote size fails the transfer
  pacing: true                   # fixed settle / per-chunk delays
  chunk_size: 0                  # 0 = backend default (800, 500 for native OpenSSH), max 4096
  ssh_program: "ssh"
  password_helper: "sshpass"
  disabled_backends: []          # client-library, password-helper, native-openssh

# Named hosts, usable as --host <name>
hosts: {}
#  build-box:
#    host: "10.0.0.5"
#    port: 2222
#    user: "deploy"
#    ssh_key_path: "~/.ssh/deploy"
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

// "~/x" → "$HOME/x"; everything else unchanged
static std::string expand_home(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && (path[1] == '/' || path[1] == '\\')) {
        return (platform::home_dir() / path.substr(2)).string();
    }
    if (path == "~") return platform::home_dir().string();
    return path;
}

static HostProfile parse_host_profile(const YAML::Node& node, const HostProfile& base) {
    HostProfile profile = base;
    if (!node || !node.IsMap()) return profile;

    profile.host = node["host"].as<std::string>(profile.host);
    profile.port = node["port"].as<int>(profile.port);
    profile.user = node["user"].as<std::string>(profile.user);
    profile.timeout = node["timeout"].as<int>(profile.timeout);

    if (node["password"]) {
        std::string pw = node["password"].as<std::string>("");
        if (!pw.empty()) profile.password = pw;
    }

    if (node["ssh_key_path"]) {
        std::string key = node["ssh_key_path"].as<std::string>("");
        if (!key.empty()) profile.ssh_key_path = expand_home(key);
    }

    return profile;
}

static TransferSettings parse_transfer_settings(const YAML::Node& node) {
    TransferSettings settings;
    if (!node || !node.IsMap()) return settings;

    settings.abort_on_chunk_failure = node["abort_on_chunk_failure"].as<bool>(true);
    settings.strict_verify = node["strict_verify"].as<bool>(false);
    settings.pacing = node["pacing"].as<bool>(true);
    settings.chunk_size = node["chunk_size"].as<int>(0);
    settings.ssh_program = node["ssh_program"].as<std::string>(SSH_PROGRAM);
    settings.password_helper = node["password_helper"].as<std::string>(PASSWORD_HELPER_PROGRAM);

    if (settings.chunk_size < 0) {
        throw std::runtime_error("transfer.chunk_size must not be negative");
    }
    if (settings.chunk_size > MAX_CHUNK_SIZE) {
        throw std::runtime_error(fmt::format(
            "transfer.chunk_size {} exceeds the maximum of {} bytes",
            settings.chunk_size, MAX_CHUNK_SIZE));
    }

    // Accept a single name or a list
    auto disabled = node["disabled_backends"];
    std::vector<std::string> names;
    if (disabled && disabled.IsScalar()) {
        names.push_back(disabled.as<std::string>());
    } else if (disabled && disabled.IsSequence()) {
        names = disabled.as<std::vector<std::string>>(std::vector<std::string>());
    }
    for (const auto& name : names) {
        auto backend = parse_backend(name);
        if (!backend) {
            throw std::runtime_error("Unknown backend in transfer.disabled_backends: " + name);
        }
        settings.disabled_backends.push_back(*backend);
    }

    return settings;
}

// Assembles a Config from a parsed YAML document
class ConfigBuilder {
public:
    static Config build(const YAML::Node& root);
};

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        return Result<Config>::Ok(ConfigBuilder::build(root));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        Config config;
        config.source_ = path;
        return Result<Config>::Ok(config);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        Config config = ConfigBuilder::build(root);
        config.source_ = path;
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err("Failed to parse " + path.string() + ": " + e.what());
    }
}

Config ConfigBuilder::build(const YAML::Node& root) {
    Config config;
    if (!root || root.IsNull()) return config;
    if (!root.IsMap()) {
        throw std::runtime_error("top level must be a mapping");
    }

    config.defaults_ = parse_host_profile(root["defaults"], HostProfile{});
    config.transfer_ = parse_transfer_settings(root["transfer"]);

    if (root["hosts"] && root["hosts"].IsMap()) {
        for (const auto& kv : root["hosts"]) {
            std::string name = kv.first.as<std::string>();
            HostProfile profile = parse_host_profile(kv.second, config.defaults_);
            if (profile.host.empty()) profile.host = name;
            config.hosts_[name] = profile;
        }
    }

    return config;
}

std::optional<HostProfile> Config::find_host(const std::string& name) const {
    auto it = hosts_.find(name);
    if (it == hosts_.end()) return std::nullopt;
    return it->second;
}

TransferRequest Config::make_request(const std::string& host_or_profile,
                                     const std::string& local_path,
                                     const std::string& remote_path) const {
    HostProfile profile = defaults_;
    if (auto named = find_host(host_or_profile)) {
        profile = *named;
    } else {
        profile.host = host_or_profile;
    }

    TransferRequest req;
    req.host = profile.host;
    req.port = profile.port;
    req.user = profile.user;
    req.password = profile.password;
    req.ssh_key_path = profile.ssh_key_path;
    req.timeout = profile.timeout;
    req.local_path = local_path;
    req.remote_path = remote_path;
    return req;
}
