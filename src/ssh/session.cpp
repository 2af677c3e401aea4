#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <filesystem>
#include <cstring>
#include <chrono>

namespace fs = std::filesystem;

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
    StatusCallback callback;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                          const char* /*instruction*/, int /*instruction_len*/,
                          int num_prompts,
                          const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                          LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                          void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        std::string prompt_text(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
        if (data->callback && prompt_text.find("assword") != std::string::npos) {
            data->callback("Sending password...");
        }
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

bool client_library_available() {
    static const int rc = libssh2_init(0);
    return rc == 0;
}

SessionManager::SessionManager(const SessionTarget& target)
    : target_(target), session_(nullptr), sock_(SHELLPUSH_INVALID_SOCKET), active_(false) {
}

SessionManager::~SessionManager() {
    close();
}

SSHResult SessionManager::establish(StatusCallback callback) {
    return establish_connection(callback);
}

void SessionManager::free_session(const char* reason) {
    if (session_) {
        libssh2_session_disconnect(session_, reason);
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != SHELLPUSH_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = SHELLPUSH_INVALID_SOCKET;
    }
}

SSHResult SessionManager::establish_connection(StatusCallback callback) {
    if (callback) {
        callback(fmt::format("Connecting to {}:{}...", target_.host, target_.port));
    }

    if (!client_library_available()) {
        return SSHResult{-1, "", "Failed to initialize libssh2"};
    }

    std::string error;
    sock_ = platform::connect_tcp(target_.host, target_.port, target_.timeout * 1000, error);
    if (sock_ == SHELLPUSH_INVALID_SOCKET) {
        return SSHResult{-1, "", error};
    }

    if (callback) callback("TCP connected, starting SSH handshake...");

    // Create SSH session
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        platform::close_socket(sock_);
        sock_ = SHELLPUSH_INVALID_SOCKET;
        return SSHResult{-1, "", "Failed to create SSH session"};
    }

    libssh2_session_set_blocking(session_, 0);

    // SSH handshake (key exchange)
    int ret;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(target_.timeout);
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() > deadline) break;
        platform::sleep_ms(100);
    }

    if (ret != 0) {
        free_session("Handshake failed");
        return SSHResult{-1, "", "SSH handshake failed"};
    }

    platform::enable_keepalive(sock_);

    // The host key is accepted without a known_hosts check, matching
    // StrictHostKeyChecking=no on the subprocess backends.
    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.failed()) {
        free_session("Authentication failed");
        return auth_result;
    }

    active_ = true;

    if (callback) {
        callback("Connected to " + target_.host);
    }

    return SSHResult{0, "", ""};
}

std::vector<std::string> SessionManager::candidate_keys() const {
    std::vector<std::string> keys;
    if (target_.ssh_key_path) {
        keys.push_back(*target_.ssh_key_path);
        return keys;
    }

    fs::path ssh_dir = platform::home_dir() / ".ssh";
    for (const char* name : {"id_ed25519", "id_ecdsa", "id_rsa"}) {
        fs::path key = ssh_dir / name;
        std::error_code ec;
        if (fs::exists(key, ec)) keys.push_back(key.string());
    }
    return keys;
}

bool SessionManager::try_publickey(const std::string& private_key, StatusCallback callback) {
    if (callback) callback("Trying key " + private_key + "...");

    // libssh2 derives the public half from the private key when none is given
    std::string public_key = private_key + ".pub";
    std::error_code ec;
    const char* pub = fs::exists(public_key, ec) ? public_key.c_str() : nullptr;

    int ret;
    while ((ret = libssh2_userauth_publickey_fromfile(session_, target_.user.c_str(),
                pub, private_key.c_str(), nullptr)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(100);
    }
    if (ret != 0) {
        shellpush_log(fmt::format("publickey auth with {} failed ({})", private_key, ret));
    }
    return ret == 0;
}

SSHResult SessionManager::ssh_userauth(StatusCallback callback) {
    int ret;

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                static_cast<unsigned int>(target_.user.length()))) == nullptr) {
        if (libssh2_userauth_authenticated(session_)) {
            return SSHResult{0, "", ""};  // "none" auth accepted
        }
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        platform::sleep_ms(100);
    }

    std::string methods = auth_list ? auth_list : "";
    shellpush_log("Auth methods: " + methods);

    if (target_.password.empty()) {
        if (methods.empty() || methods.find("publickey") != std::string::npos) {
            for (const auto& key : candidate_keys()) {
                if (try_publickey(key, callback)) {
                    if (callback) callback("Authentication successful");
                    return SSHResult{0, "", ""};
                }
            }
        }
        return SSHResult{-1, "", "Public key authentication failed (no usable key)"};
    }

    // Try keyboard-interactive (PAM setups often disable plain password)
    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data;
        kbd_data.password = target_.password;
        kbd_data.prompt_round = 0;
        kbd_data.callback = callback;

        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                target_.user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }
        *libssh2_session_abstract(session_) = nullptr;

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }

        if (callback) callback("Keyboard-interactive failed, trying password...");
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");

        while ((ret = libssh2_userauth_password(session_,
                target_.user.c_str(), target_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
    }

    return SSHResult{-1, "", "Authentication failed (check username/password)"};
}

SSHResult SessionManager::exec(const std::string& command, int timeout_secs) {
    if (!active_ || !session_) {
        return SSHResult{-1, "", "No session available"};
    }

    // Open a new exec channel (no PTY, binary-clean)
    LIBSSH2_CHANNEL* exec_ch = nullptr;
    auto open_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(SSH_CONNECT_TIMEOUT_SECS);
    while (std::chrono::steady_clock::now() < open_deadline) {
        exec_ch = libssh2_channel_open_session(session_);
        if (exec_ch) break;
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            return SSHResult{-1, "", "Failed to open exec channel"};
        }
        platform::sleep_ms(10);
    }
    if (!exec_ch) {
        return SSHResult{-1, "", "Timed out opening exec channel"};
    }

    // Execute the command
    int rc = LIBSSH2_ERROR_EAGAIN;
    auto exec_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(SSH_CONNECT_TIMEOUT_SECS);
    while (std::chrono::steady_clock::now() < exec_deadline) {
        rc = libssh2_channel_exec(exec_ch, command.c_str());
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        platform::sleep_ms(10);
    }
    if (rc != 0) {
        libssh2_channel_free(exec_ch);
        return SSHResult{-1, "", "Failed to exec command on channel"};
    }

    // Read stdout and stderr until the channel reports EOF
    std::string output;
    std::string stderr_data;
    char buf[SSH_READ_BUF_SIZE];
    int effective_timeout = (timeout_secs > 0) ? timeout_secs : SSH_CMD_TIMEOUT_SECS;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);
    bool timed_out = true;

    while (std::chrono::steady_clock::now() < deadline) {
        ssize_t n = libssh2_channel_read(exec_ch, buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
            continue;
        }
        ssize_t m = libssh2_channel_read_stderr(exec_ch, buf, sizeof(buf));
        if (m > 0) {
            stderr_data.append(buf, static_cast<size_t>(m));
            continue;
        }
        if ((n == 0 || n == LIBSSH2_ERROR_EAGAIN) && libssh2_channel_eof(exec_ch)) {
            timed_out = false;
            break;
        }
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            timed_out = false;
            stderr_data += "SSH channel read error";
            break;
        }
        platform::sleep_ms(10);
    }

    // Get exit status
    int exit_status = -1;
    do {
        rc = libssh2_channel_close(exec_ch);
    } while (rc == LIBSSH2_ERROR_EAGAIN && (platform::sleep_ms(10), true));
    if (rc == 0 && !timed_out) {
        exit_status = libssh2_channel_get_exit_status(exec_ch);
    }
    libssh2_channel_free(exec_ch);

    if (timed_out) {
        return SSHResult{-1, output,
                         "Command timed out after " + std::to_string(effective_timeout) + "s"};
    }
    return SSHResult{exit_status, output, stderr_data};
}

void SessionManager::close() {
    active_ = false;
    free_session("Normal disconnection");
}

bool SessionManager::is_active() const {
    return active_;
}
