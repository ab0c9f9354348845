/**
 * @file events.hpp
 * @brief Event types published by the transfer pipeline
 *
 * NAMING CONVENTION:
 * Events are past-tense (TransferStartedEvent, RetryScheduledEvent).
 * Progress snapshots are relay::transfer::ProgressEvent and travel on the
 * same bus.
 */

#pragma once

#include "relay/core/error.hpp"
#include "relay/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace relay::events {

using transfer::ProgressEvent;

// ════════════════════════════════════════════════════════
// Lifecycle Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when the orchestrator accepts a request
 *
 * WHO EMITS: TransferOrchestrator::run
 * WHO SUBSCRIBES: Logger, presentation layer
 */
struct TransferStartedEvent {
    std::string transfer_id;
    std::string name;
    std::string mime_type;
    std::optional<std::uint64_t> declared_size;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted on every state machine transition
 */
struct TransferStateChangedEvent {
    std::string transfer_id;
    transfer::TransferState from = transfer::TransferState::Idle;
    transfer::TransferState to = transfer::TransferState::Idle;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted before the retry governor waits to retry a destination call
 *
 * Diagnostic only; never turned into a user-visible outcome.
 */
struct RetryScheduledEvent {
    std::string transfer_id;
    std::string operation;
    int failed_attempt = 0;
    std::chrono::milliseconds delay{0};
    int status_code = 0;
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted once the staged file of a transfer has been removed
 */
struct StagingReleasedEvent {
    std::string transfer_id;
    std::string path;
    std::uint64_t bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Terminal Events (exactly one per transfer)
// ════════════════════════════════════════════════════════

struct TransferCompletedEvent {
    std::string transfer_id;
    transfer::RemoteObject object;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct TransferFailedEvent {
    std::string transfer_id;
    relay::TransferError error;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace relay::events
