#pragma once

#include "relay/core/cancellation.hpp"
#include "relay/core/error.hpp"
#include "relay/core/result.hpp"
#include "relay/transfer/source.hpp"
#include "relay/transfer/staging.hpp"
#include "relay/transfer/types.hpp"

#include <functional>
#include <optional>
#include <string>

namespace relay::transfer {

using ProgressSink = std::function<void(const ProgressEvent&)>;

struct DrainOptions {
    std::size_t block_size = kMiB;            ///< Largest buffer held in memory
    std::uint64_t progress_interval = kMiB;   ///< Bytes between progress events
};

/**
 * @brief Copies an inbound stream into a staged file, one block at a time
 *
 * Peak memory is one block regardless of object size. Progress is reported
 * by byte count so tests see the same events on every run.
 */
class SourceDrain {
public:
    explicit SourceDrain(DrainOptions options = {});

    /**
     * @brief Read `source` to exhaustion into `staged`
     *
     * When `expected_size` is set, ending with a different byte count is a
     * download error. Partially written bytes stay in `staged`; removing
     * them is the owner's job.
     *
     * RETURNS: total bytes staged
     */
    relay::Result<std::uint64_t, relay::TransferError> drain(ByteSource& source,
                                                             StagedObject& staged,
                                                             const std::string& transfer_id,
                                                             std::optional<std::uint64_t> expected_size,
                                                             const relay::CancellationToken& cancel,
                                                             const ProgressSink& progress) const;

    [[nodiscard]] const DrainOptions& options() const noexcept { return options_; }

private:
    DrainOptions options_;
};

} // namespace relay::transfer
