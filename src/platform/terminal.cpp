#include "terminal.hpp"

#include <termios.h>
#include <unistd.h>
#include <poll.h>

namespace platform {

// ── NoEchoGuard ──────────────────────────────────────────────

struct NoEchoGuard::Impl {
    struct termios old_term;
};

NoEchoGuard::NoEchoGuard() {
    if (!stdin_is_tty()) return;
    impl_ = new Impl;
    tcgetattr(STDIN_FILENO, &impl_->old_term);
    struct termios raw = impl_->old_term;
    // Canonical off, echo off; keep ISIG so Ctrl-C still interrupts
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
}

NoEchoGuard::~NoEchoGuard() {
    if (impl_) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
}

bool stdin_is_tty() {
    return isatty(STDIN_FILENO) == 1;
}

// ── poll_stdin ───────────────────────────────────────────────

bool poll_stdin(int timeout_ms) {
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & POLLIN);
}

} // namespace platform
