#include "relay/transfer/uploader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <optional>
#include <vector>

namespace relay::transfer {

namespace {

std::string describe_range(std::uint64_t offset, std::uint64_t length, std::uint64_t total) {
    if (length == 0) {
        return "push bytes */" + std::to_string(total);
    }
    return "push bytes " + std::to_string(offset) + "-" + std::to_string(offset + length - 1) + "/" +
           std::to_string(total);
}

} // namespace

// ──────────────────────────────────────────────────────────
// UploadSession
// ──────────────────────────────────────────────────────────

UploadSession::UploadSession(SessionHandle handle, std::uint64_t chunk_size, std::uint64_t total)
    : handle_(std::move(handle)),
      chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size),
      total_(total) {
}

std::uint64_t UploadSession::next_chunk_length() const noexcept {
    return std::min(chunk_size_, total_ - cursor_);
}

relay::Result<void> UploadSession::advance_to(std::uint64_t confirmed) {
    if (confirmed < cursor_) {
        return relay::Err("Destination rewound its confirmed offset from " + std::to_string(cursor_) +
                          " to " + std::to_string(confirmed));
    }
    if (confirmed > total_) {
        return relay::Err("Destination confirmed " + std::to_string(confirmed) + " bytes of a " +
                          std::to_string(total_) + " byte object");
    }
    cursor_ = confirmed;
    return relay::Ok();
}

// ──────────────────────────────────────────────────────────
// ChunkUploader
// ──────────────────────────────────────────────────────────

ChunkUploader::ChunkUploader(Destination& destination, const RetryGovernor& governor, UploaderOptions options)
    : destination_(destination),
      governor_(governor),
      options_(options) {
    if (options_.chunk_size == 0) {
        options_.chunk_size = kDefaultChunkSize;
    }
}

relay::Result<RemoteObject, relay::TransferError> ChunkUploader::upload(const StagedObject& staged,
                                                                        std::uint64_t total,
                                                                        const UploadTarget& target,
                                                                        const std::string& transfer_id,
                                                                        const relay::CancellationToken& cancel,
                                                                        const ProgressSink& progress) const {
    using relay::TransferError;
    using relay::TransferStage;

    if (total > staged.size()) {
        return relay::Err(TransferError::protocol(TransferStage::Upload,
            "Upload of " + std::to_string(total) + " bytes requested but only " +
            std::to_string(staged.size()) + " are staged", 0));
    }

    const CallOptions call{options_.call_timeout, cancel};

    SessionRequest request{target.name, target.mime_type, target.folder_id, total};
    auto created = governor_.execute<SessionHandle>(
        "create-session",
        [&]() { return destination_.create_session(request, call); },
        cancel);
    if (created.is_error()) {
        return relay::Err(TransferError::upload(created.error().error, 0, created.error().attempts));
    }

    UploadSession session(created.value(), options_.chunk_size, total);
    spdlog::debug("[{}] Opened upload session for {} ({} bytes, chunk size {})",
                  transfer_id, target.name, total, session.chunk_size());

    auto sent = send_chunks(staged, session, transfer_id, call, progress);
    if (sent.is_error()) {
        destination_.abandon_session(session.handle());
        return relay::Err(sent.error());
    }

    RemoteObject object = std::move(sent.value());
    if (object.name.empty()) {
        object.name = target.name;
    }
    if (object.mime_type.empty()) {
        object.mime_type = target.mime_type;
    }
    if (object.size == 0) {
        object.size = total;
    }

    spdlog::info("[{}] Uploaded {} ({} bytes) as {}", transfer_id, object.name, object.size, object.id);
    return relay::Ok(std::move(object));
}

relay::Result<RemoteObject, relay::TransferError> ChunkUploader::send_chunks(const StagedObject& staged,
                                                                             UploadSession& session,
                                                                             const std::string& transfer_id,
                                                                             const CallOptions& call,
                                                                             const ProgressSink& progress) const {
    using relay::DestinationError;
    using relay::TransferError;
    using relay::TransferStage;

    const std::uint64_t total = session.total();
    const relay::CancellationToken& cancel = call.cancel;

    std::ifstream input(staged.path(), std::ios::binary);
    if (!input) {
        return relay::Err(TransferError::protocol(TransferStage::Upload,
            "Failed to open staged file for reading: " + staged.path().string(), 0));
    }

    std::vector<std::uint8_t> chunk;
    int stalled_pushes = 0;
    bool first_push = true;

    while (first_push || !session.complete()) {
        first_push = false;

        if (cancel.is_cancelled()) {
            return relay::Err(TransferError::cancelled(TransferStage::Upload, session.cursor()));
        }

        const std::uint64_t offset = session.cursor();
        const std::uint64_t length = session.next_chunk_length();
        const std::uint64_t chunk_end = offset + length;

        // The byte range is fixed here, before any attempt; retries resend exactly this buffer.
        chunk.resize(static_cast<std::size_t>(length));
        if (length > 0) {
            input.clear();
            input.seekg(static_cast<std::streamoff>(offset));
            input.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(length));
            if (static_cast<std::uint64_t>(input.gcount()) != length) {
                return relay::Err(TransferError::protocol(TransferStage::Upload,
                    "Short read from staged file at offset " + std::to_string(offset), offset));
            }
        }

        const std::string operation = describe_range(offset, length, total);
        auto pushed = governor_.execute<std::uint64_t>(
            operation,
            [&]() { return destination_.push_chunk(session.handle(), offset, chunk, total, call); },
            cancel,
            [&]() -> relay::Result<std::optional<std::uint64_t>, DestinationError> {
                auto state = destination_.query_session(session.handle(), total, call);
                if (state.is_error()) {
                    return relay::Err(state.error());
                }
                const std::uint64_t confirmed = state.value();
                if (confirmed > offset || length == 0) {
                    return relay::Ok(std::optional<std::uint64_t>(confirmed));
                }
                return relay::Ok(std::optional<std::uint64_t>());
            });

        if (pushed.is_error()) {
            const auto& failure = pushed.error();
            return relay::Err(TransferError::upload(failure.error, session.cursor(), failure.attempts));
        }

        const std::uint64_t confirmed = pushed.value();
        if (confirmed > chunk_end) {
            return relay::Err(TransferError::protocol(TransferStage::Upload,
                "Destination confirmed offset " + std::to_string(confirmed) +
                " beyond the pushed range ending at " + std::to_string(chunk_end), session.cursor()));
        }

        auto advanced = session.advance_to(confirmed);
        if (advanced.is_error()) {
            return relay::Err(TransferError::protocol(TransferStage::Upload, advanced.error(), session.cursor()));
        }

        if (confirmed == offset && length > 0) {
            if (++stalled_pushes >= governor_.policy().max_attempts) {
                return relay::Err(TransferError::upload(
                    DestinationError::transient("Destination accepted no bytes of the chunk at offset " +
                                                std::to_string(offset)),
                    session.cursor(), stalled_pushes));
            }
            if (cancel.wait_for(governor_.policy().backoff_for(stalled_pushes))) {
                return relay::Err(TransferError::cancelled(TransferStage::Upload, session.cursor()));
            }
            continue;
        }
        stalled_pushes = 0;

        spdlog::debug("[{}] Destination confirmed {}/{} bytes", transfer_id, session.cursor(), total);
        if (progress) {
            progress(ProgressEvent{transfer_id, Phase::Uploading, session.cursor(), total});
        }
    }

    auto finalized = governor_.execute<RemoteObject>(
        "finalize",
        [&]() { return destination_.finalize(session.handle(), total, call); },
        cancel);
    if (finalized.is_error()) {
        return relay::Err(TransferError::finalize(finalized.error().error, finalized.error().attempts));
    }

    return relay::Ok(std::move(finalized.value()));
}

} // namespace relay::transfer
