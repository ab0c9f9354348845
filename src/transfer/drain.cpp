#include "relay/transfer/drain.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <vector>

namespace relay::transfer {

SourceDrain::SourceDrain(DrainOptions options)
    : options_(options) {
    if (options_.block_size == 0) {
        options_.block_size = kMiB;
    }
    if (options_.progress_interval == 0) {
        options_.progress_interval = options_.block_size;
    }
}

relay::Result<std::uint64_t, relay::TransferError> SourceDrain::drain(ByteSource& source,
                                                                       StagedObject& staged,
                                                                       const std::string& transfer_id,
                                                                       std::optional<std::uint64_t> expected_size,
                                                                       const relay::CancellationToken& cancel,
                                                                       const ProgressSink& progress) const {
    std::ofstream output(staged.path(), std::ios::binary | std::ios::trunc);
    if (!output) {
        return relay::Err(relay::TransferError::download("Failed to open staged file for writing: " +
                                                         staged.path().string()));
    }

    const std::optional<std::uint64_t> total_hint = expected_size ? expected_size : source.size_hint();
    auto report = [&](std::uint64_t bytes) {
        if (progress) {
            progress(ProgressEvent{transfer_id, Phase::Downloading, bytes, total_hint});
        }
    };

    std::vector<std::uint8_t> block(options_.block_size);
    std::uint64_t total = 0;
    std::uint64_t last_reported = 0;

    while (true) {
        if (cancel.is_cancelled()) {
            return relay::Err(relay::TransferError::cancelled(relay::TransferStage::Download));
        }

        auto read = source.read(block.data(), block.size(), cancel);
        if (read.is_error()) {
            if (cancel.is_cancelled()) {
                return relay::Err(relay::TransferError::cancelled(relay::TransferStage::Download));
            }
            return relay::Err(relay::TransferError::download(read.error()));
        }

        const std::size_t count = read.value();
        if (count == 0) {
            break;
        }

        output.write(reinterpret_cast<const char*>(block.data()), static_cast<std::streamsize>(count));
        if (!output) {
            return relay::Err(relay::TransferError::download("Failed to write staged file " +
                                                             staged.path().string()));
        }

        total += count;
        staged.record_written(count);

        if (expected_size && total > *expected_size) {
            return relay::Err(relay::TransferError::download(
                "Inbound stream exceeded declared size of " + std::to_string(*expected_size) + " bytes"));
        }

        if (total - last_reported >= options_.progress_interval) {
            last_reported = total;
            report(total);
        }
    }

    output.flush();
    if (!output) {
        return relay::Err(relay::TransferError::download("Failed to flush staged file " +
                                                         staged.path().string()));
    }
    output.close();

    if (expected_size && total != *expected_size) {
        return relay::Err(relay::TransferError::download(
            "Inbound stream ended after " + std::to_string(total) + " of " +
            std::to_string(*expected_size) + " declared bytes"));
    }

    if (last_reported != total || total == 0) {
        report(total);
    }

    staged.mark_complete();
    spdlog::debug("[{}] Staged {} bytes into {}", transfer_id, total, staged.path().string());
    return relay::Ok(total);
}

} // namespace relay::transfer
