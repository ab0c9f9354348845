/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation shared between a transfer and its owner
 *
 * Copies of a token share one flag. The owner calls cancel(); workers poll
 * is_cancelled() between blocking steps and use wait_for() instead of
 * sleeping so that a backoff wait ends as soon as cancellation arrives.
 *
 * EXAMPLE:
 * CancellationToken token;
 * std::thread worker([token] { while (!token.is_cancelled()) { ... } });
 * token.cancel();
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace relay {

class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    /**
     * @brief Request cancellation and wake every waiter
     *
     * THREAD SAFE: Yes
     * Not async-signal-safe; signal handlers should set a flag and let a
     * regular thread call cancel().
     */
    void cancel() {
        {
            std::lock_guard lock(state_->mutex);
            state_->cancelled.store(true, std::memory_order_release);
        }
        state_->cv.notify_all();
    }

    bool is_cancelled() const noexcept {
        return state_->cancelled.load(std::memory_order_acquire);
    }

    /**
     * @brief Sleep for up to `timeout`, returning early on cancellation
     *
     * RETURNS: true if the token was cancelled
     */
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock lock(state_->mutex);
        return state_->cv.wait_for(lock, timeout, [this]() {
            return state_->cancelled.load(std::memory_order_acquire);
        });
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };

    std::shared_ptr<State> state_;
};

} // namespace relay
