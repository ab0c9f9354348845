#pragma once

#include <cstdint>
#include <string>

namespace relay {

enum class ErrorCategory {
    Staging,     ///< Disk or permission failure in the staging area, fatal
    Transfer,    ///< Failure while moving bytes (download, upload, finalize)
    Cancelled    ///< Cooperative cancellation
};

enum class TransferStage {
    Staging,
    Download,
    Upload,
    Finalize
};

enum class Retryability {
    Transient,   ///< A later attempt may succeed (overload, timeout, 5xx)
    Permanent    ///< Retrying cannot help without an external change
};

/**
 * @brief Failure reported by a destination call
 *
 * `ambiguous` is set when the request reached the wire but no
 * acknowledgement came back; the destination may have applied it.
 */
struct DestinationError {
    Retryability retryability = Retryability::Permanent;
    int status_code = 0;       ///< HTTP status when the destination answered
    std::string message;
    bool ambiguous = false;
    bool cancelled = false;

    bool is_transient() const noexcept { return retryability == Retryability::Transient; }

    static DestinationError transient(std::string msg, int status = 0);
    static DestinationError permanent(std::string msg, int status = 0);
    static DestinationError lost_acknowledgement(std::string msg);
    static DestinationError cancellation(std::string msg = "cancelled");
};

/**
 * @brief The single error type surfaced by the transfer pipeline
 *
 * Spelled the way the rest of the system talks about failures:
 * StagingError, TransferError{download}, TransferError{upload, transient},
 * TransferError{upload, permanent}, TransferError{finalize, ...},
 * CancelledError.
 */
struct TransferError {
    ErrorCategory category = ErrorCategory::Transfer;
    TransferStage stage = TransferStage::Download;
    Retryability retryability = Retryability::Permanent;
    std::string message;
    std::uint64_t cursor = 0;   ///< Bytes confirmed by the destination when the error occurred
    int attempts = 0;           ///< Attempts spent on the failing operation
    int status_code = 0;

    bool is_cancelled() const noexcept { return category == ErrorCategory::Cancelled; }
    bool is_staging() const noexcept { return category == ErrorCategory::Staging; }
    bool is_transient() const noexcept { return retryability == Retryability::Transient; }

    /// e.g. "upload/transient: HTTP 503 (cursor=8388608, attempts=3)"
    std::string describe() const;

    static TransferError staging(std::string msg);
    static TransferError download(std::string msg);
    static TransferError upload(const DestinationError& cause, std::uint64_t cursor, int attempts);
    static TransferError finalize(const DestinationError& cause, int attempts);
    static TransferError protocol(TransferStage stage, std::string msg, std::uint64_t cursor);
    static TransferError cancelled(TransferStage stage, std::uint64_t cursor = 0);
};

const char* to_string(TransferStage stage) noexcept;
const char* to_string(Retryability retryability) noexcept;

} // namespace relay
