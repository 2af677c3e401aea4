#include "process.hpp"
#include "platform.hpp"

#ifdef _WIN32
#  include <windows.h>
#else
#  include <unistd.h>
#  include <sys/wait.h>
#  include <signal.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <cerrno>
#  include <cstdlib>
#  include <cstring>
#endif

#include <sstream>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_pipes();
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
    if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
#endif
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
#ifdef _WIN32
    handle_ = other.handle_;
    thread_ = other.thread_;
    stdin_ = other.stdin_;
    stdout_ = other.stdout_;
    other.handle_ = INVALID_HANDLE_VALUE;
    other.thread_ = INVALID_HANDLE_VALUE;
    other.stdin_ = INVALID_HANDLE_VALUE;
    other.stdout_ = INVALID_HANDLE_VALUE;
#else
    pid_ = other.pid_;
    stdin_fd_ = other.stdin_fd_;
    stdout_fd_ = other.stdout_fd_;
    exit_code_ = other.exit_code_;
    other.pid_ = -1;
    other.stdin_fd_ = -1;
    other.stdout_fd_ = -1;
    other.exit_code_.reset();
#endif
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_pipes();
#ifdef _WIN32
        if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
        if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
        handle_ = other.handle_;
        thread_ = other.thread_;
        stdin_ = other.stdin_;
        stdout_ = other.stdout_;
        other.handle_ = INVALID_HANDLE_VALUE;
        other.thread_ = INVALID_HANDLE_VALUE;
        other.stdin_ = INVALID_HANDLE_VALUE;
        other.stdout_ = INVALID_HANDLE_VALUE;
#else
        pid_ = other.pid_;
        stdin_fd_ = other.stdin_fd_;
        stdout_fd_ = other.stdout_fd_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.stdin_fd_ = -1;
        other.stdout_fd_ = -1;
        other.exit_code_.reset();
#endif
    }
    return *this;
}

void ProcessHandle::close_pipes() {
    close_stdin();
#ifdef _WIN32
    if (stdout_ != INVALID_HANDLE_VALUE) {
        CloseHandle(stdout_);
        stdout_ = INVALID_HANDLE_VALUE;
    }
#else
    if (stdout_fd_ >= 0) {
        close(stdout_fd_);
        stdout_fd_ = -1;
    }
#endif
}

bool ProcessHandle::valid() const {
#ifdef _WIN32
    return handle_ != INVALID_HANDLE_VALUE;
#else
    return pid_ > 0;
#endif
}

#ifdef _WIN32

bool ProcessHandle::running() {
    if (handle_ == INVALID_HANDLE_VALUE) return false;
    DWORD code;
    if (GetExitCodeProcess(handle_, &code))
        return code == STILL_ACTIVE;
    return false;
}

std::optional<int> ProcessHandle::wait(int timeout_ms) {
    if (handle_ == INVALID_HANDLE_VALUE) return -1;
    DWORD ms = (timeout_ms < 0) ? INFINITE : static_cast<DWORD>(timeout_ms);
    if (WaitForSingleObject(handle_, ms) == WAIT_TIMEOUT) return std::nullopt;
    DWORD code = 1;
    GetExitCodeProcess(handle_, &code);
    return static_cast<int>(code);
}

void ProcessHandle::terminate() {
    if (handle_ != INVALID_HANDLE_VALUE) {
        TerminateProcess(handle_, 1);
        WaitForSingleObject(handle_, 2000);
    }
}

bool ProcessHandle::write_stdin(const std::string& data) {
    if (stdin_ == INVALID_HANDLE_VALUE) return false;
    size_t sent = 0;
    while (sent < data.size()) {
        DWORD written = 0;
        if (!WriteFile(stdin_, data.data() + sent,
                       static_cast<DWORD>(data.size() - sent), &written, nullptr)) {
            return false;
        }
        sent += written;
    }
    return true;
}

void ProcessHandle::close_stdin() {
    if (stdin_ != INVALID_HANDLE_VALUE) {
        CloseHandle(stdin_);
        stdin_ = INVALID_HANDLE_VALUE;
    }
}

int ProcessHandle::read_stdout(std::string& out, int timeout_ms) {
    if (stdout_ == INVALID_HANDLE_VALUE) return -1;
    int waited = 0;
    while (true) {
        DWORD avail = 0;
        if (!PeekNamedPipe(stdout_, nullptr, 0, nullptr, &avail, nullptr)) {
            return -1;  // broken pipe: child closed stdout
        }
        if (avail > 0) {
            char buf[4096];
            DWORD to_read = avail < sizeof(buf) ? avail : static_cast<DWORD>(sizeof(buf));
            DWORD n = 0;
            if (!ReadFile(stdout_, buf, to_read, &n, nullptr) || n == 0) return -1;
            out.append(buf, n);
            return static_cast<int>(n);
        }
        if (waited >= timeout_ms) return 0;
        sleep_ms(10);
        waited += 10;
    }
}

#else // Unix

bool ProcessHandle::running() {
    if (pid_ <= 0 || exit_code_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        return false;
    }
    return ret == 0;  // 0 means still running
}

std::optional<int> ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (exit_code_) return exit_code_;
    if (timeout_ms < 0) {
        int status;
        if (waitpid(pid_, &status, 0) != pid_) return -1;
        exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        return exit_code_;
    }
    // Poll with timeout
    int elapsed = 0;
    while (true) {
        int status;
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return exit_code_;
        }
        if (ret < 0) return -1;
        if (elapsed >= timeout_ms) break;
        sleep_ms(100);
        elapsed += 100;
    }
    return std::nullopt;  // timed out
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || exit_code_) return;
    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    for (int i = 0; i < 20; i++) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            exit_code_ = -1;
            return;
        }
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    exit_code_ = -1;
}

bool ProcessHandle::write_stdin(const std::string& data) {
    if (stdin_fd_ < 0) return false;
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t w = write(stdin_fd_, data.data() + sent, data.size() - sent);
        if (w < 0) {
            if (errno == EINTR) continue;
            return false;  // EPIPE: child is gone
        }
        sent += static_cast<size_t>(w);
    }
    return true;
}

void ProcessHandle::close_stdin() {
    if (stdin_fd_ >= 0) {
        close(stdin_fd_);
        stdin_fd_ = -1;
    }
}

int ProcessHandle::read_stdout(std::string& out, int timeout_ms) {
    if (stdout_fd_ < 0) return -1;
    struct pollfd pfd;
    pfd.fd = stdout_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    if (ret == 0) return 0;
    if (ret < 0) return errno == EINTR ? 0 : -1;

    char buf[4096];
    ssize_t n = read(stdout_fd_, buf, sizeof(buf));
    if (n < 0) return errno == EINTR || errno == EAGAIN ? 0 : -1;
    if (n == 0) return -1;  // EOF
    out.append(buf, static_cast<size_t>(n));
    return static_cast<int>(n);
}

#endif

// ── spawn ────────────────────────────────────────────────────

#ifdef _WIN32

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& options) {
    ProcessHandle handle;

    // Build command line
    std::ostringstream cmdline;
    cmdline << "\"" << program << "\"";
    for (const auto& arg : args) {
        cmdline << " \"" << arg << "\"";
    }
    std::string cmd_str = cmdline.str();

    SECURITY_ATTRIBUTES sa = {};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    si.dwFlags |= STARTF_USESTDHANDLES;
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    si.hStdOutput = GetStdHandle(STD_OUTPUT_HANDLE);
    si.hStdError = GetStdHandle(STD_ERROR_HANDLE);
    PROCESS_INFORMATION pi = {};

    HANDLE child_stdin = INVALID_HANDLE_VALUE;
    HANDLE child_stdout = INVALID_HANDLE_VALUE;
    HANDLE hStderr = INVALID_HANDLE_VALUE;

    if (options.pipe_stdin) {
        if (!CreatePipe(&child_stdin, &handle.stdin_, &sa, 0)) return handle;
        SetHandleInformation(handle.stdin_, HANDLE_FLAG_INHERIT, 0);
        si.hStdInput = child_stdin;
    }

    if (options.pipe_stdout) {
        if (!CreatePipe(&handle.stdout_, &child_stdout, &sa, 0)) {
            if (child_stdin != INVALID_HANDLE_VALUE) CloseHandle(child_stdin);
            return handle;
        }
        SetHandleInformation(handle.stdout_, HANDLE_FLAG_INHERIT, 0);
        si.hStdOutput = child_stdout;
    } else {
        child_stdout = CreateFileA("NUL", GENERIC_WRITE, FILE_SHARE_WRITE, &sa,
                                   OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (child_stdout != INVALID_HANDLE_VALUE) si.hStdOutput = child_stdout;
    }

    // Redirect stderr if requested
    if (!options.stderr_log.empty()) {
        hStderr = CreateFileA(options.stderr_log.c_str(), FILE_APPEND_DATA,
                              FILE_SHARE_READ | FILE_SHARE_WRITE, &sa,
                              OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (hStderr != INVALID_HANDLE_VALUE) si.hStdError = hStderr;
    }

    // Extra variables are inherited from our own environment block.
    for (const auto& [key, value] : options.env) {
        SetEnvironmentVariableA(key.c_str(), value.c_str());
    }

    if (CreateProcessA(nullptr, cmd_str.data(), nullptr, nullptr, TRUE,
                       CREATE_NO_WINDOW, nullptr, nullptr, &si, &pi)) {
        handle.handle_ = pi.hProcess;
        handle.thread_ = pi.hThread;
    }

    for (const auto& [key, value] : options.env) {
        SetEnvironmentVariableA(key.c_str(), nullptr);
    }

    if (child_stdin != INVALID_HANDLE_VALUE) CloseHandle(child_stdin);
    if (child_stdout != INVALID_HANDLE_VALUE) CloseHandle(child_stdout);
    if (hStderr != INVALID_HANDLE_VALUE) CloseHandle(hStderr);
    if (!handle.valid()) handle.close_pipes();
    return handle;
}

#else // Unix

static void set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD, 0);
    fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& options) {
    ProcessHandle handle;

    // A dead child must surface as a failed write, not kill us.
    static bool sigpipe_ignored = false;
    if (!sigpipe_ignored) {
        signal(SIGPIPE, SIG_IGN);
        sigpipe_ignored = true;
    }

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    if (options.pipe_stdin && pipe(in_pipe) != 0) return handle;
    if (options.pipe_stdout && pipe(out_pipe) != 0) {
        if (in_pipe[0] >= 0) { close(in_pipe[0]); close(in_pipe[1]); }
        return handle;
    }

    // Build argv array before forking
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        // fork failed
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1]}) {
            if (fd >= 0) close(fd);
        }
        return handle;
    }

    if (pid == 0) {
        // Child process
        if (options.pipe_stdin) {
            dup2(in_pipe[0], STDIN_FILENO);
            close(in_pipe[0]);
            close(in_pipe[1]);
        } else {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
                close(devnull);
            }
        }

        if (options.pipe_stdout) {
            dup2(out_pipe[1], STDOUT_FILENO);
            close(out_pipe[0]);
            close(out_pipe[1]);
        } else {
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0) {
                dup2(devnull, STDOUT_FILENO);
                close(devnull);
            }
        }

        if (!options.stderr_log.empty()) {
            int fd = open(options.stderr_log.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd >= 0) {
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
        }

        for (const auto& [key, value] : options.env) {
            setenv(key.c_str(), value.c_str(), 1);
        }

        signal(SIGPIPE, SIG_DFL);
        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    handle.pid_ = pid;
    if (options.pipe_stdin) {
        close(in_pipe[0]);
        handle.stdin_fd_ = in_pipe[1];
        set_cloexec(handle.stdin_fd_);
    }
    if (options.pipe_stdout) {
        close(out_pipe[1]);
        handle.stdout_fd_ = out_pipe[0];
        set_cloexec(handle.stdout_fd_);
    }
    return handle;
}

#endif

int run_quiet(const std::string& program,
              const std::vector<std::string>& args,
              int timeout_ms,
              const std::string& stderr_log) {
    SpawnOptions options;
    options.stderr_log = stderr_log;
    ProcessHandle proc = spawn(program, args, options);
    if (!proc.valid()) return -1;

    auto code = proc.wait(timeout_ms);
    if (!code) {
        proc.terminate();
        return -1;
    }
    return *code;
}

} // namespace platform
