#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

struct SessionTarget {
    std::string host;
    int port = 22;
    std::string user;
    std::string password;
    int timeout = 30;
    std::optional<std::string> ssh_key_path;
};

// True if libssh2 can be initialised in this process.
bool client_library_available();

// One authenticated libssh2 session. Commands run on a fresh exec channel
// each, so there is no PTY and output is binary-clean.
class SessionManager {
public:
    explicit SessionManager(const SessionTarget& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    SSHResult establish(StatusCallback callback = nullptr);
    void close();
    bool is_active() const;

    // Execute a command and wait for its exit status.
    SSHResult exec(const std::string& command, int timeout_secs = 0);

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    bool active_;

    SSHResult establish_connection(StatusCallback callback);
    SSHResult ssh_userauth(StatusCallback callback);
    bool try_publickey(const std::string& private_key, StatusCallback callback);
    std::vector<std::string> candidate_keys() const;
    void free_session(const char* reason);
};
