#pragma once

#include "relay/core/error.hpp"
#include "relay/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace relay::transfer {

class ByteSource;

inline constexpr std::uint64_t kMiB = 1024 * 1024;

enum class TransferState {
    Idle,
    Staging,
    Downloading,
    Uploading,
    Finalizing,
    Completed,
    Failed
};

enum class Phase {
    Downloading,
    Uploading,
    Finalizing
};

/**
 * @brief Everything needed to start one transfer
 *
 * Built by the caller, never modified afterwards. The source is shared so
 * the request stays a value type; only the orchestrator reads from it.
 */
struct TransferRequest {
    std::shared_ptr<ByteSource> source;
    std::string name;                          ///< Declared object name, used for MIME and display only
    std::optional<std::uint64_t> declared_size;
    std::string folder_id;                     ///< Destination container, empty for the default
};

/**
 * @brief Point-in-time progress snapshot
 *
 * Emitted in order on the event bus; carries no identity beyond that order.
 */
struct ProgressEvent {
    std::string transfer_id;
    Phase phase = Phase::Downloading;
    std::uint64_t bytes_transferred = 0;
    std::optional<std::uint64_t> bytes_total;
};

/**
 * @brief Handle identifying a finished remote object
 */
struct RemoteObject {
    std::string id;
    std::string name;
    std::string mime_type;
    std::uint64_t size = 0;
    std::string link;          ///< Retrieval link, empty when the destination has none
    bool published = false;
};

using TransferOutcome = relay::Result<RemoteObject, relay::TransferError>;

const char* to_string(TransferState state) noexcept;
const char* to_string(Phase phase) noexcept;

} // namespace relay::transfer
