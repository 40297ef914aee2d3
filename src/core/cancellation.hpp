#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>

// Process-run cancellation state: running -> canceling, at most once.
// Passed by reference to every component that does interruptible work.
//
// Listeners run exactly once, on the thread that calls cancel(), while the
// token's lock is held. They must be quick and must not call back into the
// token.
class CancellationToken {
public:
    using Listener = std::function<void()>;

    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // Returns true only for the call that performed the transition.
    bool cancel();

    bool is_canceled() const { return canceled_.load(std::memory_order_acquire); }

    // Register a listener. If already canceled it runs immediately.
    size_t add_listener(Listener cb);
    void remove_listener(size_t id);

    // Sleep for up to `timeout`. Returns true if canceled (possibly early).
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return is_canceled(); });
    }

private:
    std::atomic<bool> canceled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::map<size_t, Listener> listeners_;
    size_t next_id_ = 0;
};

// Registers a listener for the lifetime of the guard.
class ScopedCancelListener {
public:
    ScopedCancelListener(CancellationToken& token, CancellationToken::Listener cb)
        : token_(token), id_(token.add_listener(std::move(cb))) {}
    ~ScopedCancelListener() { token_.remove_listener(id_); }

    ScopedCancelListener(const ScopedCancelListener&) = delete;
    ScopedCancelListener& operator=(const ScopedCancelListener&) = delete;

private:
    CancellationToken& token_;
    size_t id_;
};
