#pragma once

#include "relay/core/cancellation.hpp"
#include "relay/core/error.hpp"
#include "relay/core/result.hpp"
#include "relay/transfer/destination.hpp"
#include "relay/transfer/drain.hpp"
#include "relay/transfer/retry.hpp"
#include "relay/transfer/staging.hpp"
#include "relay/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace relay::transfer {

inline constexpr std::uint64_t kDefaultChunkSize = 8 * kMiB;

/**
 * @brief State of one resumable upload
 *
 * The cursor is the destination-confirmed offset. It only moves forward and
 * never past the total; the owning uploader is its only writer.
 */
class UploadSession {
public:
    UploadSession(SessionHandle handle, std::uint64_t chunk_size, std::uint64_t total);

    [[nodiscard]] const SessionHandle& handle() const noexcept { return handle_; }
    [[nodiscard]] std::uint64_t cursor() const noexcept { return cursor_; }
    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    [[nodiscard]] bool complete() const noexcept { return cursor_ == total_; }

    /// Byte count of the chunk starting at the cursor.
    [[nodiscard]] std::uint64_t next_chunk_length() const noexcept;

    relay::Result<void> advance_to(std::uint64_t confirmed);

private:
    SessionHandle handle_;
    std::uint64_t chunk_size_;
    std::uint64_t total_;
    std::uint64_t cursor_ = 0;
};

struct UploadTarget {
    std::string name;
    std::string mime_type;
    std::string folder_id;
};

struct UploaderOptions {
    std::uint64_t chunk_size = kDefaultChunkSize;
    std::chrono::milliseconds call_timeout{60000};   ///< Per destination call
};

/**
 * @brief Streams a staged object to a Destination chunk by chunk
 *
 * Chunks are sent sequentially, each through the RetryGovernor. Only one
 * chunk buffer is held at a time.
 */
class ChunkUploader {
public:
    ChunkUploader(Destination& destination, const RetryGovernor& governor, UploaderOptions options = {});

    /**
     * @brief Upload `total` bytes of `staged` and finalize the session
     *
     * A zero-byte object is sent as one empty push so the destination can
     * complete the session.
     */
    relay::Result<RemoteObject, relay::TransferError> upload(const StagedObject& staged,
                                                             std::uint64_t total,
                                                             const UploadTarget& target,
                                                             const std::string& transfer_id,
                                                             const relay::CancellationToken& cancel,
                                                             const ProgressSink& progress) const;

    [[nodiscard]] const UploaderOptions& options() const noexcept { return options_; }

private:
    /// Chunk loop and finalize for an open session.
    relay::Result<RemoteObject, relay::TransferError> send_chunks(const StagedObject& staged,
                                                                  UploadSession& session,
                                                                  const std::string& transfer_id,
                                                                  const CallOptions& call,
                                                                  const ProgressSink& progress) const;

    Destination& destination_;
    const RetryGovernor& governor_;
    UploaderOptions options_;
};

} // namespace relay::transfer
