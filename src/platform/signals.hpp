#pragma once

#include <atomic>
#include <functional>
#include <thread>

namespace platform {

// Turns SIGINT/SIGTERM into a callback on an ordinary thread.
//
// The handler only writes the signal number to a pipe; a watcher thread reads
// it and calls on_signal, so the callback may lock mutexes and log. The old
// handlers are restored on destruction. Only one instance may be alive.
class InterruptWatcher {
public:
    using Callback = std::function<void(int signo)>;

    explicit InterruptWatcher(Callback on_signal);
    ~InterruptWatcher();

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

    // Feed a signal as if it had been delivered (tests).
    void raise(int signo);

private:
    void watch();

    Callback on_signal_;
    int pipe_[2] = {-1, -1};
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

} // namespace platform
