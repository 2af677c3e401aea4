#include "pipe_shell.hpp"
#include <ssh/marker_protocol.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>

PipeShell::PipeShell(PipeCommand command, PipeShellOptions options)
    : command_(std::move(command)), options_(options) {
}

PipeShell::~PipeShell() {
    if (proc_.valid() && proc_.running()) {
        shellpush_log(fmt::format("{}: still running at teardown, terminating", command_.program));
        proc_.terminate();
    }
}

SSHResult PipeShell::open(StatusCallback callback) {
    if (callback) callback("Starting " + command_.program + "...");

    platform::SpawnOptions spawn_opts;
    spawn_opts.pipe_stdin = true;
    spawn_opts.pipe_stdout = true;
    spawn_opts.stderr_log = shellpush_log_path();
    spawn_opts.env = command_.env;

    std::string line = command_.program;
    for (const auto& arg : command_.args) line += " " + arg;
    shellpush_log("spawn: " + line);
    proc_ = platform::spawn(command_.program, command_.args, spawn_opts);
    if (!proc_.valid()) {
        return SSHResult{-1, "", "Failed to start " + command_.program};
    }

    // Give ssh time to connect and authenticate before the first command
    if (callback) callback("Waiting for the remote shell...");
    platform::sleep_ms(options_.settle_ms);

    if (!proc_.running()) {
        auto code = proc_.wait(0);
        int exit_code = code ? *code : -1;
        if (exit_code == 127) {
            return SSHResult{exit_code, "", command_.program + " could not be executed"};
        }
        return SSHResult{exit_code == 0 ? -1 : exit_code, "",
                         fmt::format("{} exited while connecting (code {}); see {}",
                                     command_.program, exit_code, shellpush_log_path())};
    }

    if (callback) callback("Remote shell ready");
    return SSHResult{0, "", ""};
}

bool PipeShell::write_line(const std::string& line) {
    if (!proc_.running()) return false;
    return proc_.write_stdin(line);
}

void PipeShell::drain_stdout() {
    // Appends print nothing; anything here is login noise. Keep the pipe empty
    // so the remote side never blocks on a full buffer.
    std::string noise;
    while (proc_.read_stdout(noise, 0) > 0) {}
    if (!noise.empty()) {
        shellpush_log(fmt::format("{} stdout: {}", command_.program, noise.substr(0, 200)));
    }
}

SSHResult PipeShell::send(const std::string& command) {
    drain_stdout();
    if (!write_line(command + "\n")) {
        return SSHResult{-1, "", "Remote shell is gone (write to " + command_.program + " failed)"};
    }
    return SSHResult{0, "", ""};
}

SSHResult PipeShell::query(const std::string& command) {
    drain_stdout();
    if (!write_line(build_marker_command(command))) {
        return SSHResult{-1, "", "Remote shell is gone (write to " + command_.program + " failed)"};
    }

    std::string raw;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(options_.query_timeout_secs);
    while (std::chrono::steady_clock::now() < deadline) {
        int n = proc_.read_stdout(raw, 100);
        if (n > 0) {
            auto parsed = parse_marker_output(raw);
            if (parsed.found) {
                SSHResult result{parsed.exit_code, parsed.output, ""};
                shellpush_log_ssh("query", command, result);
                return result;
            }
        } else if (n < 0) {
            return SSHResult{-1, raw, "Remote shell closed before replying"};
        }
    }

    return SSHResult{-1, raw,
                     fmt::format("No reply within {}s", options_.query_timeout_secs)};
}

SSHResult PipeShell::close() {
    if (!proc_.valid()) {
        return SSHResult{0, "", ""};
    }

    if (!write_line("exit\n")) {
        shellpush_log(command_.program + ": already gone at close");
    }
    proc_.close_stdin();

    auto code = proc_.wait(options_.exit_timeout_secs * 1000);
    if (!code) {
        proc_.terminate();
        return SSHResult{-1, "", fmt::format("{} did not exit within {}s; killed",
                                             command_.program, options_.exit_timeout_secs)};
    }
    if (*code != 0) {
        return SSHResult{*code, "", fmt::format("{} exited with code {}", command_.program, *code)};
    }
    return SSHResult{0, "", ""};
}
