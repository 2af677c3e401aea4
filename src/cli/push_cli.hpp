#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include <core/config.hpp>

// Parsed "shellpush push" command line
struct PushArgs {
    std::string local_path;
    std::string remote_path;
    std::string host;                        // hostname or config profile name
    std::optional<int> port;
    std::optional<std::string> user;
    std::optional<std::string> ssh_key_path;
    std::optional<std::string> password_env; // name of the variable holding the password
    bool ask_password = false;
    std::optional<std::string> backend;
    std::optional<std::string> config_path;
};

// Parse the arguments that follow "push". Errors name the offending flag.
Result<PushArgs> parse_push_args(const std::vector<std::string>& args);

// Fold a config and the parsed flags into one request. Explicit flags win
// over the profile, the profile over defaults.
Result<TransferRequest> build_request(const Config& config, const PushArgs& args);

// Command handlers for main(). Each returns the process exit status.
class PushCLI {
public:
    int run_push(const std::vector<std::string>& args);
    int run_backends(const std::vector<std::string>& args);
    int run_init(const std::vector<std::string>& args);

private:
    std::optional<Config> load_config(const std::optional<std::string>& path);
    void print_failure_hints(const TransferResult& result) const;
};
