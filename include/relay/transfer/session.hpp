#pragma once

#include "relay/core/result.hpp"
#include "relay/transfer/types.hpp"

#include <chrono>
#include <string>

namespace relay::transfer {

/**
 * @brief Summary of an active or finished transfer
 */
struct TransferInfo {
    std::string transfer_id;
    std::string name;
    std::chrono::system_clock::time_point started_at{};
    TransferState state = TransferState::Idle;
    std::uint64_t bytes_staged = 0;
    std::uint64_t bytes_confirmed = 0;
    std::string last_error; ///< Populated when state == Failed
};

/**
 * @brief Lifecycle of one transfer
 *
 * Idle -> Staging -> Downloading -> Uploading -> Finalizing -> Completed,
 * with Failed reachable from every non-terminal state. Terminal states
 * accept no further transitions except re-entering the same state.
 */
class TransferSession {
public:
    TransferSession(std::string transfer_id, std::string name);

    [[nodiscard]] const std::string& transfer_id() const noexcept { return info_.transfer_id; }
    [[nodiscard]] TransferState state() const noexcept { return info_.state; }
    [[nodiscard]] const TransferInfo& info() const noexcept { return info_; }
    [[nodiscard]] bool is_terminal() const noexcept {
        return info_.state == TransferState::Completed || info_.state == TransferState::Failed;
    }

    relay::Result<void> start();
    relay::Result<void> transition_to(TransferState next_state);
    relay::Result<void> mark_failed(std::string error_message);

    void update_bytes(std::uint64_t staged, std::uint64_t confirmed);

    [[nodiscard]] std::chrono::system_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool can_transition(TransferState target) const noexcept;

    TransferInfo info_;
    std::chrono::system_clock::time_point last_transition_{};
};

} // namespace relay::transfer
