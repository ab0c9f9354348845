#include "relay/transfer/retry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <random>

namespace relay::transfer {

std::chrono::milliseconds RetryPolicy::backoff_for(int failed_attempt) const {
    auto delay = static_cast<double>(initial_backoff.count());
    for (int i = 1; i < failed_attempt; ++i) {
        delay *= backoff_multiplier;
        if (delay >= static_cast<double>(max_backoff.count())) {
            break;
        }
    }
    delay = std::min(delay, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(delay));
}

relay::Retryability classify_http_status(int status_code, const std::string& reason) {
    if (status_code == 408 || status_code == 429 || status_code >= 500) {
        return relay::Retryability::Transient;
    }
    if (status_code == 403 && (reason == "rateLimitExceeded" || reason == "userRateLimitExceeded")) {
        return relay::Retryability::Transient;
    }
    return relay::Retryability::Permanent;
}

RetryGovernor::RetryGovernor(RetryPolicy policy, RetryObserver observer)
    : policy_(policy),
      observer_(std::move(observer)) {
}

std::chrono::milliseconds RetryGovernor::delay_after(int failed_attempt) const {
    auto delay = policy_.backoff_for(failed_attempt);
    if (policy_.jitter && delay.count() > 0) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_real_distribution<> dis(0.5, 1.5);
        delay = std::chrono::milliseconds(
            static_cast<std::int64_t>(std::llround(static_cast<double>(delay.count()) * dis(gen))));
    }
    return delay;
}

void RetryGovernor::announce_retry(const std::string& operation_name,
                                   int failed_attempt,
                                   std::chrono::milliseconds delay,
                                   const relay::DestinationError& error) const {
    spdlog::warn("{} failed (attempt {}/{}, status {}): {}; retrying in {}ms",
                 operation_name, failed_attempt, policy_.max_attempts, error.status_code,
                 error.message, delay.count());
    if (observer_) {
        observer_(RetryNotice{operation_name, failed_attempt, delay, error});
    }
}

void RetryGovernor::announce_reconciled(const std::string& operation_name, int attempt) const {
    spdlog::info("{}: destination already holds the data, skipping resend (attempt {})",
                 operation_name, attempt);
}

} // namespace relay::transfer
