#include "cancellation.hpp"

bool CancellationToken::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (canceled_.exchange(true, std::memory_order_acq_rel)) {
        return false;
    }
    for (auto& [id, cb] : listeners_) {
        if (cb) cb();
    }
    cv_.notify_all();
    return true;
}

size_t CancellationToken::add_listener(Listener cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t id = next_id_++;
    if (is_canceled()) {
        if (cb) cb();
        return id;
    }
    listeners_.emplace(id, std::move(cb));
    return id;
}

void CancellationToken::remove_listener(size_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(id);
}
