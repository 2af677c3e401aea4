#pragma once

#include <string>
#include <vector>
#include <utility>
#include <optional>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#endif

namespace platform {

struct SpawnOptions {
    bool pipe_stdin = false;     // parent writes the child's stdin
    bool pipe_stdout = false;    // parent reads the child's stdout (otherwise discarded)
    std::string stderr_log;      // if non-empty, child's stderr is appended to this file
    std::vector<std::pair<std::string, std::string>> env;  // extra environment variables
};

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running.
    bool running();

    // Wait for the process to exit. Returns the exit code, or nullopt if
    // timeout_ms elapsed first. timeout_ms = -1 means indefinite wait.
    std::optional<int> wait(int timeout_ms = -1);

    // Terminate the process (SIGTERM then SIGKILL on Unix, TerminateProcess on Windows).
    void terminate();

    // Write all of data to the child's stdin. False once the pipe is gone.
    bool write_stdin(const std::string& data);

    // Close the child's stdin so it sees EOF.
    void close_stdin();

    // Append whatever the child has written to stdout, waiting up to
    // timeout_ms for it. Returns bytes read, 0 on timeout, -1 at EOF or error.
    int read_stdout(std::string& out, int timeout_ms);

    // Get the raw pid/handle.
#ifdef _WIN32
    HANDLE native_handle() const { return handle_; }
#else
    int native_handle() const { return pid_; }
#endif

private:
#ifdef _WIN32
    HANDLE handle_ = INVALID_HANDLE_VALUE;
    HANDLE thread_ = INVALID_HANDLE_VALUE;
    HANDLE stdin_ = INVALID_HANDLE_VALUE;
    HANDLE stdout_ = INVALID_HANDLE_VALUE;
#else
    int pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    std::optional<int> exit_code_;   // set once the child has been reaped
#endif
    void close_pipes();

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const SpawnOptions& options);
};

// Spawn a child process.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& options = SpawnOptions{});

// Run a program to completion with stdout discarded.
// Returns its exit code, or -1 if it could not be started or timed out.
int run_quiet(const std::string& program,
              const std::vector<std::string>& args,
              int timeout_ms,
              const std::string& stderr_log = "");

} // namespace platform
