#include "terminal.hpp"
#include <iostream>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <windows.h>
#  include <io.h>
#  include <conio.h>
#else
#  include <termios.h>
#  include <unistd.h>
#  include <poll.h>
#endif

namespace platform {

bool stdin_is_tty() {
#ifdef _WIN32
    return _isatty(_fileno(stdin)) != 0;
#else
    return isatty(STDIN_FILENO) != 0;
#endif
}

// ── NoEchoGuard ──────────────────────────────────────────────

#ifdef _WIN32

NoEchoGuard::NoEchoGuard() {
    HANDLE h = GetStdHandle(STD_INPUT_HANDLE);
    GetConsoleMode(h, &old_mode_);
    DWORD new_mode = old_mode_;
    new_mode &= ~(ENABLE_LINE_INPUT | ENABLE_ECHO_INPUT);
    SetConsoleMode(h, new_mode);
}

NoEchoGuard::~NoEchoGuard() {
    SetConsoleMode(GetStdHandle(STD_INPUT_HANDLE), old_mode_);
}

#else // Unix

struct NoEchoGuard::Impl {
    struct termios old_term;
    bool saved = false;
};

NoEchoGuard::NoEchoGuard() : impl_(new Impl) {
    if (tcgetattr(STDIN_FILENO, &impl_->old_term) != 0) return;
    impl_->saved = true;
    struct termios raw = impl_->old_term;
    // Canonical off, echo off; keep ISIG so Ctrl-C still works
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
}

NoEchoGuard::~NoEchoGuard() {
    if (impl_) {
        if (impl_->saved) tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
}

#endif

// ── poll_stdin ───────────────────────────────────────────────

bool poll_stdin(int timeout_ms) {
#ifdef _WIN32
    HANDLE h = GetStdHandle(STD_INPUT_HANDLE);
    DWORD result = WaitForSingleObject(h, timeout_ms);
    if (result == WAIT_OBJECT_0) {
        // Check that there's actual input (not just a window event)
        INPUT_RECORD rec;
        DWORD count;
        while (PeekConsoleInputW(h, &rec, 1, &count) && count > 0) {
            if (rec.EventType == KEY_EVENT && rec.Event.KeyEvent.bKeyDown)
                return true;
            // Consume non-key events
            ReadConsoleInputW(h, &rec, 1, &count);
        }
        return false;
    }
    return false;
#else
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & POLLIN);
#endif
}

static bool read_char(char& c) {
#ifdef _WIN32
    int ch = _getch();
    if (ch == EOF) return false;
    c = static_cast<char>(ch);
    return true;
#else
    return read(STDIN_FILENO, &c, 1) == 1;
#endif
}

std::string read_secret(const std::string& prompt, int timeout_ms) {
    std::cout << prompt;
    std::cout.flush();

    NoEchoGuard guard;

    std::string secret;
    // Read character by character (no echo, no canonical)
    while (true) {
        if (!poll_stdin(timeout_ms)) break;
        char c;
        if (!read_char(c)) break;
        if (c == '\n' || c == '\r') break;
        if (c == 127 || c == 8) {  // backspace
            if (!secret.empty()) secret.pop_back();
            continue;
        }
        if (c >= 32) secret += c;
    }

    std::cout << "\n";
    return secret;
}

} // namespace platform
