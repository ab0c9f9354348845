#pragma once

#include "relay/core/cancellation.hpp"
#include "relay/core/error.hpp"
#include "relay/core/result.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace relay::transfer {

/**
 * @brief Bounded retry with exponential backoff
 *
 * max_attempts counts every attempt including the first one.
 */
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{1000};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds max_backoff{32000};
    bool jitter = false;

    /// Delay after the given failed attempt (1-based), without jitter.
    std::chrono::milliseconds backoff_for(int failed_attempt) const;
};

/**
 * @brief Map an HTTP status (and optional error reason) to a failure class
 *
 * 408, 429 and 5xx are transient. A 403 whose reason is a rate limit is
 * transient too; every other 4xx is permanent.
 */
relay::Retryability classify_http_status(int status_code, const std::string& reason = {});

struct RetryNotice {
    std::string operation;
    int failed_attempt = 0;
    std::chrono::milliseconds delay{0};
    relay::DestinationError error;
};

using RetryObserver = std::function<void(const RetryNotice&)>;

/**
 * @brief Final failure of a governed operation
 */
struct RetryFailure {
    relay::DestinationError error;
    int attempts = 0;
};

/**
 * @brief Runs destination calls under a RetryPolicy
 *
 * Transient failures are retried after a backoff wait; permanent failures
 * and cancellation return at once. After an ambiguous failure the optional
 * reconcile step asks the destination what it already holds: a value means
 * the work was applied and is returned without resending, nullopt means
 * resend.
 *
 * The governor is stateless between calls and may be shared by concurrent
 * transfers.
 */
class RetryGovernor {
public:
    template<typename T>
    using Operation = std::function<relay::Result<T, relay::DestinationError>()>;

    template<typename T>
    using Reconcile = std::function<relay::Result<std::optional<T>, relay::DestinationError>()>;

    explicit RetryGovernor(RetryPolicy policy = {}, RetryObserver observer = {});

    template<typename T>
    relay::Result<T, RetryFailure> execute(const std::string& operation_name,
                                           const Operation<T>& operation,
                                           const relay::CancellationToken& cancel,
                                           const Reconcile<T>& reconcile = {}) const;

    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }

private:
    std::chrono::milliseconds delay_after(int failed_attempt) const;
    void announce_retry(const std::string& operation_name,
                        int failed_attempt,
                        std::chrono::milliseconds delay,
                        const relay::DestinationError& error) const;
    void announce_reconciled(const std::string& operation_name, int attempt) const;

    RetryPolicy policy_;
    RetryObserver observer_;
};

template<typename T>
relay::Result<T, RetryFailure> RetryGovernor::execute(const std::string& operation_name,
                                                      const Operation<T>& operation,
                                                      const relay::CancellationToken& cancel,
                                                      const Reconcile<T>& reconcile) const {
    const int max_attempts = policy_.max_attempts < 1 ? 1 : policy_.max_attempts;
    relay::DestinationError last_error = relay::DestinationError::transient("no attempt made");
    bool outcome_unknown = false;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (cancel.is_cancelled()) {
            return relay::Err(RetryFailure{relay::DestinationError::cancellation(), attempt - 1});
        }

        bool resend = true;
        if (outcome_unknown && reconcile) {
            auto state = reconcile();
            if (state.is_ok()) {
                outcome_unknown = false;
                if (state.value().has_value()) {
                    announce_reconciled(operation_name, attempt);
                    return relay::Ok(std::move(*state.value()));
                }
            } else {
                last_error = state.error();
                if (last_error.cancelled || !last_error.is_transient()) {
                    return relay::Err(RetryFailure{last_error, attempt});
                }
                resend = false;
            }
        }

        if (resend) {
            auto result = operation();
            if (result.is_ok()) {
                return relay::Ok(std::move(result.value()));
            }
            last_error = result.error();
            if (last_error.cancelled || !last_error.is_transient()) {
                return relay::Err(RetryFailure{last_error, attempt});
            }
            outcome_unknown = last_error.ambiguous;
        }

        if (attempt == max_attempts) {
            break;
        }

        const auto delay = delay_after(attempt);
        announce_retry(operation_name, attempt, delay, last_error);
        if (cancel.wait_for(delay)) {
            return relay::Err(RetryFailure{relay::DestinationError::cancellation(), attempt});
        }
    }

    // The final attempt may have been applied even though its answer was lost.
    if (outcome_unknown && reconcile && !cancel.is_cancelled()) {
        auto state = reconcile();
        if (state.is_ok() && state.value().has_value()) {
            announce_reconciled(operation_name, max_attempts);
            return relay::Ok(std::move(*state.value()));
        }
        if (state.is_error() && state.error().cancelled) {
            return relay::Err(RetryFailure{state.error(), max_attempts});
        }
    }

    return relay::Err(RetryFailure{last_error, max_attempts});
}

} // namespace relay::transfer
