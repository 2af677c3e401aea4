#include "exec_shell.hpp"
#include <core/log.hpp>

ExecShell::ExecShell(const SessionTarget& target)
    : session_(std::make_unique<SessionManager>(target)) {
}

SSHResult ExecShell::open(StatusCallback callback) {
    return session_->establish(callback);
}

SSHResult ExecShell::send(const std::string& command) {
    auto result = session_->exec(command);
    if (result.failed()) {
        shellpush_log_ssh("exec", command, result);
    }
    return result;
}

SSHResult ExecShell::query(const std::string& command) {
    auto result = session_->exec(command);
    shellpush_log_ssh("query", command, result);
    return result;
}

SSHResult ExecShell::close() {
    if (session_->is_active()) session_->close();
    return SSHResult{0, "", ""};
}
