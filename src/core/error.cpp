#include "relay/core/error.hpp"

#include <sstream>

namespace relay {

DestinationError DestinationError::transient(std::string msg, int status) {
    DestinationError error;
    error.retryability = Retryability::Transient;
    error.status_code = status;
    error.message = std::move(msg);
    return error;
}

DestinationError DestinationError::permanent(std::string msg, int status) {
    DestinationError error;
    error.retryability = Retryability::Permanent;
    error.status_code = status;
    error.message = std::move(msg);
    return error;
}

DestinationError DestinationError::lost_acknowledgement(std::string msg) {
    DestinationError error = transient(std::move(msg));
    error.ambiguous = true;
    return error;
}

DestinationError DestinationError::cancellation(std::string msg) {
    DestinationError error = permanent(std::move(msg));
    error.cancelled = true;
    return error;
}

std::string TransferError::describe() const {
    std::ostringstream oss;
    if (category == ErrorCategory::Cancelled) {
        oss << "cancelled during " << to_string(stage);
    } else if (category == ErrorCategory::Staging) {
        oss << "staging: " << message;
    } else {
        oss << to_string(stage);
        if (stage == TransferStage::Upload || stage == TransferStage::Finalize) {
            oss << "/" << to_string(retryability);
        }
        oss << ": " << message;
    }

    if (stage == TransferStage::Upload || category == ErrorCategory::Cancelled) {
        oss << " (cursor=" << cursor;
        if (attempts > 0) {
            oss << ", attempts=" << attempts;
        }
        oss << ")";
    } else if (attempts > 0) {
        oss << " (attempts=" << attempts << ")";
    }
    return oss.str();
}

TransferError TransferError::staging(std::string msg) {
    TransferError error;
    error.category = ErrorCategory::Staging;
    error.stage = TransferStage::Staging;
    error.message = std::move(msg);
    return error;
}

TransferError TransferError::download(std::string msg) {
    TransferError error;
    error.stage = TransferStage::Download;
    error.message = std::move(msg);
    return error;
}

TransferError TransferError::upload(const DestinationError& cause, std::uint64_t cursor, int attempts) {
    if (cause.cancelled) {
        TransferError error = cancelled(TransferStage::Upload, cursor);
        error.attempts = attempts;
        return error;
    }
    TransferError error;
    error.stage = TransferStage::Upload;
    error.retryability = cause.retryability;
    error.message = cause.message;
    error.cursor = cursor;
    error.attempts = attempts;
    error.status_code = cause.status_code;
    return error;
}

TransferError TransferError::finalize(const DestinationError& cause, int attempts) {
    if (cause.cancelled) {
        TransferError error = cancelled(TransferStage::Finalize);
        error.attempts = attempts;
        return error;
    }
    TransferError error;
    error.stage = TransferStage::Finalize;
    error.retryability = cause.retryability;
    error.message = cause.message;
    error.attempts = attempts;
    error.status_code = cause.status_code;
    return error;
}

TransferError TransferError::protocol(TransferStage stage, std::string msg, std::uint64_t cursor) {
    TransferError error;
    error.stage = stage;
    error.retryability = Retryability::Permanent;
    error.message = std::move(msg);
    error.cursor = cursor;
    return error;
}

TransferError TransferError::cancelled(TransferStage stage, std::uint64_t cursor) {
    TransferError error;
    error.category = ErrorCategory::Cancelled;
    error.stage = stage;
    error.message = "cancelled";
    error.cursor = cursor;
    return error;
}

const char* to_string(TransferStage stage) noexcept {
    switch (stage) {
        case TransferStage::Staging: return "staging";
        case TransferStage::Download: return "download";
        case TransferStage::Upload: return "upload";
        case TransferStage::Finalize: return "finalize";
    }
    return "unknown";
}

const char* to_string(Retryability retryability) noexcept {
    switch (retryability) {
        case Retryability::Transient: return "transient";
        case Retryability::Permanent: return "permanent";
    }
    return "unknown";
}

} // namespace relay
