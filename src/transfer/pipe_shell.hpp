#pragma once

#include <string>
#include <vector>
#include <utility>
#include "remote_shell.hpp"
#include <platform/process.hpp>

// Program line for a local ssh client whose stdin becomes the remote shell
struct PipeCommand {
    std::string program;
    std::vector<std::string> args;
    std::vector<std::pair<std::string, std::string>> env;
};

struct PipeShellOptions {
    int settle_ms = 3000;          // wait after spawning before the first command
    int exit_timeout_secs = 30;    // wait for the process after "exit"
    int query_timeout_secs = 30;   // wait for a query's DONE marker
};

// Interactive-pipe driver: one long-lived ssh process, commands written to
// its stdin as text lines. Queries are framed with BEGIN/DONE markers.
class PipeShell : public RemoteShell {
public:
    PipeShell(PipeCommand command, PipeShellOptions options);
    ~PipeShell() override;

    SSHResult open(StatusCallback callback = nullptr) override;
    SSHResult send(const std::string& command) override;
    SSHResult query(const std::string& command) override;
    SSHResult close() override;
    bool reports_exit_status() const override { return false; }

private:
    PipeCommand command_;
    PipeShellOptions options_;
    platform::ProcessHandle proc_;

    bool write_line(const std::string& line);
    void drain_stdout();
};
