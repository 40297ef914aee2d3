#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <core/cancellation.hpp>

// Unbounded FIFO shared by one producer and many consumer threads.
//
// pop() blocks until an item is available or the queue is closed. After
// close() the remaining items are still handed out (drain); once empty, pop()
// returns nullopt. abort() drops pending items and wakes everyone.
template <typename T>
class WorkQueue {
public:
    WorkQueue() = default;
    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    // Returns false if the queue no longer accepts items.
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    // Returns the item and the number left behind it.
    std::optional<T> pop(size_t* remaining = nullptr) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return !items_.empty() || closed_; });
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        if (remaining) *remaining = items_.size();
        return item;
    }

    // No more pushes; consumers drain what is left, then stop.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
    }

    // No more pushes and discard pending items. Returns how many were dropped.
    size_t abort() {
        size_t dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            dropped = items_.size();
            items_.clear();
        }
        not_empty_.notify_all();
        return dropped;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
    bool closed_ = false;
};

// Completion counter. The producer add()s once per job; workers call done()
// once per job whatever the outcome. wait() returns when the count reaches
// zero or the token is canceled.
class WaitGroup {
public:
    WaitGroup() = default;
    WaitGroup(const WaitGroup&) = delete;
    WaitGroup& operator=(const WaitGroup&) = delete;

    void add(size_t n = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ += n;
    }

    void done() {
        bool zero;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_ > 0) --pending_;
            zero = pending_ == 0;
        }
        if (zero) cv_.notify_all();
    }

    // Returns true if every job completed, false if canceled first.
    bool wait(CancellationToken& token) {
        ScopedCancelListener wake(token, [this] {
            std::lock_guard<std::mutex> lock(mutex_);
            cv_.notify_all();
        });
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return pending_ == 0 || token.is_canceled(); });
        return pending_ == 0;
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t pending_ = 0;
};
