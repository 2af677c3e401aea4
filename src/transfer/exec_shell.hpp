#pragma once

#include <memory>
#include "remote_shell.hpp"
#include <ssh/session.hpp>

// Client-library driver: one libssh2 exec channel per command, each
// awaited to completion before the next is issued.
class ExecShell : public RemoteShell {
public:
    explicit ExecShell(const SessionTarget& target);

    SSHResult open(StatusCallback callback = nullptr) override;
    SSHResult send(const std::string& command) override;
    SSHResult query(const std::string& command) override;
    SSHResult close() override;
    bool reports_exit_status() const override { return true; }

private:
    std::unique_ptr<SessionManager> session_;
};
