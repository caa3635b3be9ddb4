#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace kiln {

namespace detail {
struct CancellationState;
}

/**
 * @brief Read side of a cancellation signal
 *
 * Cheap to copy. A default constructed token is never cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancelled() const noexcept;

    /**
     * @brief Register a callback run once when cancellation is requested
     *
     * Runs immediately (on the calling thread) if already cancelled. Returns an
     * id usable with unsubscribe(), or 0 if the callback already ran.
     *
     * unsubscribe() blocks while the callback is running on another thread, so
     * state captured by the callback may be destroyed once it returns.
     */
    uint64_t subscribe(std::function<void()> callback) const;
    void unsubscribe(uint64_t id) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

/**
 * @brief Write side of a cancellation signal
 *
 * cancel() is idempotent and may be called from any thread; callbacks run on
 * the thread that first requests cancellation.
 */
class CancellationSource {
public:
    CancellationSource();

    CancellationToken token() const { return CancellationToken{state_}; }

    // Returns true for the call that actually triggered cancellation.
    bool cancel();
    bool isCancelled() const noexcept;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

/**
 * @brief RAII registration of a cancellation callback
 */
class CancellationSubscription {
public:
    CancellationSubscription(const CancellationToken& token, std::function<void()> callback)
        : token_(token), id_(token.subscribe(std::move(callback))) {}
    ~CancellationSubscription() {
        if (id_ != 0) {
            token_.unsubscribe(id_);
        }
    }

    CancellationSubscription(const CancellationSubscription&) = delete;
    CancellationSubscription& operator=(const CancellationSubscription&) = delete;

private:
    CancellationToken token_;
    uint64_t id_{0};
};

} // namespace kiln
