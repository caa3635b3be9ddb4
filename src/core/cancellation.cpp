#include <kiln/core/cancellation.h>

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace kiln {

namespace detail {
struct CancellationState {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    uint64_t nextId{1};
    std::map<uint64_t, std::function<void()>> callbacks;
    // Callback currently being run by cancel(), 0 when none.
    uint64_t runningId{0};
    std::thread::id runningThread;
    std::condition_variable callbackDone;
};
} // namespace detail

bool CancellationToken::isCancelled() const noexcept {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
}

uint64_t CancellationToken::subscribe(std::function<void()> callback) const {
    if (!state_) {
        return 0;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled.load(std::memory_order_acquire)) {
            auto id = state_->nextId++;
            state_->callbacks.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CancellationToken::unsubscribe(uint64_t id) const {
    if (!state_) {
        return;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (state_->callbacks.erase(id) > 0) {
        return;
    }
    // A callback unsubscribing itself must not wait for its own return.
    if (state_->runningId == id && state_->runningThread == std::this_thread::get_id()) {
        return;
    }
    state_->callbackDone.wait(lock, [&] { return state_->runningId != id; });
}

CancellationSource::CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

bool CancellationSource::cancel() {
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (state_->cancelled.exchange(true, std::memory_order_acq_rel)) {
        return false;
    }
    // Callbacks run one at a time so unsubscribe() can wait for the one in flight.
    while (!state_->callbacks.empty()) {
        auto it = state_->callbacks.begin();
        auto id = it->first;
        auto cb = std::move(it->second);
        state_->callbacks.erase(it);
        state_->runningId = id;
        state_->runningThread = std::this_thread::get_id();
        lock.unlock();
        if (cb) {
            cb();
        }
        lock.lock();
        state_->runningId = 0;
        state_->runningThread = {};
        state_->callbackDone.notify_all();
    }
    return true;
}

bool CancellationSource::isCancelled() const noexcept {
    return state_->cancelled.load(std::memory_order_acquire);
}

} // namespace kiln
