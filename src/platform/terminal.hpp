#pragma once

namespace platform {

// RAII guard that turns off echo and canonical mode on stdin (password input).
// Destructor restores the saved mode. No-op when stdin is not a terminal.
struct NoEchoGuard {
    NoEchoGuard();
    ~NoEchoGuard();

    NoEchoGuard(const NoEchoGuard&) = delete;
    NoEchoGuard& operator=(const NoEchoGuard&) = delete;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// True if stdin is attached to a terminal.
bool stdin_is_tty();

// Poll stdin for input readability with a timeout.
// Returns true if stdin has data to read.
bool poll_stdin(int timeout_ms);

} // namespace platform
