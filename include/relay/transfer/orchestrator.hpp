#pragma once

#include "relay/core/cancellation.hpp"
#include "relay/core/error.hpp"
#include "relay/events/event_bus.hpp"
#include "relay/transfer/destination.hpp"
#include "relay/transfer/drain.hpp"
#include "relay/transfer/retry.hpp"
#include "relay/transfer/session.hpp"
#include "relay/transfer/staging.hpp"
#include "relay/transfer/types.hpp"
#include "relay/transfer/uploader.hpp"

#include <atomic>
#include <functional>
#include <string>

namespace relay::transfer {

struct OrchestratorOptions {
    DrainOptions drain;
    UploaderOptions upload;
    RetryPolicy retry;
    bool make_public = false;                         ///< Publish the object after upload
    std::uint64_t large_object_threshold = 50 * kMiB;
};

/**
 * @brief Runs transfers: stage, drain, upload, finalize
 *
 * Owns each transfer's StagedObject and releases it on every exit path
 * before the single terminal event (TransferCompletedEvent or
 * TransferFailedEvent) is emitted. Progress from both phases is published
 * on the event bus in emission order.
 *
 * run() may be called from several threads at once; transfers share only
 * the staging store, the destination and the bus.
 */
class TransferOrchestrator {
public:
    TransferOrchestrator(OrchestratorOptions options,
                         StagingStore& staging,
                         Destination& destination,
                         relay::events::EventBus& bus);

    TransferOutcome run(const TransferRequest& request,
                        const relay::CancellationToken& cancel = relay::CancellationToken());

    /// Progress channel; returns the bus subscription id.
    size_t subscribe_progress(std::function<void(const ProgressEvent&)> handler);
    void unsubscribe_progress(size_t subscription_id);

    [[nodiscard]] const OrchestratorOptions& options() const noexcept { return options_; }

private:
    struct RunContext;

    TransferOutcome execute(RunContext& ctx, StagedObject& staged);
    relay::Result<void, relay::TransferError> advance(RunContext& ctx, TransferState next);
    relay::Result<void, relay::TransferError> finalize_object(RunContext& ctx, RemoteObject& object);
    void release_staging(RunContext& ctx, StagedObject& staged);

    std::string next_transfer_id();

    OrchestratorOptions options_;
    StagingStore& staging_;
    Destination& destination_;
    relay::events::EventBus& bus_;
    SourceDrain drain_;
    std::atomic<std::uint64_t> transfer_counter_{0};
};

} // namespace relay::transfer
