#include "signals.hpp"

#include <cerrno>
#include <stdexcept>
#include <string>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

namespace platform {

static int g_signal_fd = -1;
static struct sigaction g_old_int;
static struct sigaction g_old_term;

static void interrupt_handler(int signo) {
    if (g_signal_fd < 0) return;
    int saved = errno;
    unsigned char b = static_cast<unsigned char>(signo);
    ssize_t n = write(g_signal_fd, &b, 1);
    (void)n;    // pipe full: a signal is already pending
    errno = saved;
}

InterruptWatcher::InterruptWatcher(Callback on_signal) : on_signal_(std::move(on_signal)) {
    if (g_signal_fd >= 0) {
        throw std::logic_error("InterruptWatcher already installed");
    }
    if (pipe(pipe_) != 0) {
        throw std::runtime_error(std::string("pipe: ") + std::strerror(errno));
    }
    for (int fd : pipe_) {
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);
        fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
    g_signal_fd = pipe_[1];

    struct sigaction sa;
    sa.sa_handler = interrupt_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGINT, &sa, &g_old_int);
    sigaction(SIGTERM, &sa, &g_old_term);

    thread_ = std::thread(&InterruptWatcher::watch, this);
}

InterruptWatcher::~InterruptWatcher() {
    sigaction(SIGINT, &g_old_int, nullptr);
    sigaction(SIGTERM, &g_old_term, nullptr);
    g_signal_fd = -1;

    stop_ = true;
    if (thread_.joinable()) thread_.join();
    close(pipe_[0]);
    close(pipe_[1]);
}

void InterruptWatcher::raise(int signo) {
    unsigned char b = static_cast<unsigned char>(signo);
    ssize_t n = write(pipe_[1], &b, 1);
    (void)n;
}

void InterruptWatcher::watch() {
    while (!stop_) {
        struct pollfd pfd = {pipe_[0], POLLIN, 0};
        int rc = poll(&pfd, 1, 100);
        if (rc <= 0 || !(pfd.revents & POLLIN)) continue;

        unsigned char b;
        while (read(pipe_[0], &b, 1) == 1) {
            on_signal_(static_cast<int>(b));
        }
    }
}

} // namespace platform
