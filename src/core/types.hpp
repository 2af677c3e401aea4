#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>
#include <cstddef>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Remote command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Connection parameters and paths for one upload
struct TransferRequest {
    std::string host;
    int port = 22;
    std::string user;
    std::optional<std::string> password;
    std::optional<std::string> ssh_key_path;
    std::string local_path;
    std::string remote_path;
    int timeout = 30;
};

enum class Backend {
    CLIENT_LIBRARY,   // libssh2 exec channels
    PASSWORD_HELPER,  // sshpass wrapping the OpenSSH client
    NATIVE_OPENSSH,   // OpenSSH client with key auth (Windows path)
    RAW_PIPE,         // plain ssh subprocess, last resort
};

enum class TransferPhase {
    DISCONNECTED,
    CONNECTED,
    TRUNCATED,
    STREAMING,
    VERIFYING,
    SUCCESS,
    FAILURE,
};

struct TransferResult {
    bool success = false;
    std::size_t local_size = 0;
    std::optional<std::uint64_t> remote_size;    // absent when the reply was unparsable
    std::optional<Backend> backend;
    TransferPhase phase = TransferPhase::DISCONNECTED;
    std::size_t chunks_sent = 0;
    std::size_t chunks_total = 0;
    std::size_t failed_chunks = 0;
    std::string error;
};

// Knobs that shape every transfer regardless of backend
struct TransferSettings {
    bool abort_on_chunk_failure = true;  // false keeps streaming past a failed append
    bool strict_verify = false;          // true fails when the byte count is unparsable
    bool pacing = true;                  // false drops the fixed settle/chunk delays
    int chunk_size = 0;                  // 0 = backend default
    std::string ssh_program = "ssh";
    std::string password_helper = "sshpass";
    std::vector<Backend> disabled_backends;
    std::optional<Backend> forced_backend;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;

// Progress callback: chunks completed so far, total chunks
using ProgressCallback = std::function<void(std::size_t, std::size_t)>;
