#include "relay/transfer/orchestrator.hpp"

#include "relay/events/events.hpp"
#include "relay/transfer/mime.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace relay::transfer {

using relay::DestinationError;
using relay::TransferError;
using relay::TransferStage;

struct TransferOrchestrator::RunContext {
    const TransferRequest& request;
    const relay::CancellationToken& cancel;
    TransferSession session;
    std::string mime_type;
    RetryGovernor governor;
    std::chrono::steady_clock::time_point started_at;
};

namespace {

TransferStage stage_of(TransferState state) {
    switch (state) {
        case TransferState::Idle:
        case TransferState::Staging: return TransferStage::Staging;
        case TransferState::Downloading: return TransferStage::Download;
        case TransferState::Uploading: return TransferStage::Upload;
        case TransferState::Finalizing:
        case TransferState::Completed:
        case TransferState::Failed: return TransferStage::Finalize;
    }
    return TransferStage::Staging;
}

} // namespace

TransferOrchestrator::TransferOrchestrator(OrchestratorOptions options,
                                           StagingStore& staging,
                                           Destination& destination,
                                           relay::events::EventBus& bus)
    : options_(options),
      staging_(staging),
      destination_(destination),
      bus_(bus),
      drain_(options.drain) {
}

size_t TransferOrchestrator::subscribe_progress(std::function<void(const ProgressEvent&)> handler) {
    return bus_.subscribe<ProgressEvent>(std::move(handler));
}

void TransferOrchestrator::unsubscribe_progress(size_t subscription_id) {
    bus_.unsubscribe<ProgressEvent>(subscription_id);
}

TransferOutcome TransferOrchestrator::run(const TransferRequest& request, const relay::CancellationToken& cancel) {
    const std::string transfer_id = next_transfer_id();

    RetryObserver observer = [this, transfer_id](const RetryNotice& notice) {
        bus_.emit(relay::events::RetryScheduledEvent{transfer_id, notice.operation, notice.failed_attempt,
                                                     notice.delay, notice.error.status_code,
                                                     notice.error.message});
    };

    RunContext ctx{request,
                   cancel,
                   TransferSession(transfer_id, request.name),
                   mime_type_for(request.name),
                   RetryGovernor(options_.retry, std::move(observer)),
                   std::chrono::steady_clock::now()};

    bus_.emit(relay::events::TransferStartedEvent{transfer_id, request.name, ctx.mime_type, request.declared_size});

    StagedObject staged;
    TransferOutcome outcome = execute(ctx, staged);
    release_staging(ctx, staged);

    // Cancellation wins over whatever the interrupted step reported.
    if (outcome.is_error() && cancel.is_cancelled() && !outcome.error().is_cancelled()) {
        const auto cursor = outcome.error().cursor;
        outcome = relay::Err(TransferError::cancelled(stage_of(ctx.session.state()), cursor));
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - ctx.started_at);

    if (outcome.is_ok()) {
        auto completed = advance(ctx, TransferState::Completed);
        if (completed.is_ok()) {
            bus_.emit(relay::events::TransferCompletedEvent{transfer_id, outcome.value(), duration});
            return outcome;
        }
        outcome = relay::Err(completed.error());
    }

    const TransferState from = ctx.session.state();
    auto marked = ctx.session.mark_failed(outcome.error().describe());
    if (marked.is_ok()) {
        if (from != TransferState::Failed) {
            bus_.emit(relay::events::TransferStateChangedEvent{transfer_id, from, TransferState::Failed});
        }
    } else {
        spdlog::error("[{}] Could not record failure: {}", transfer_id, marked.error());
    }

    bus_.emit(relay::events::TransferFailedEvent{transfer_id, outcome.error(), duration});
    return outcome;
}

TransferOutcome TransferOrchestrator::execute(RunContext& ctx, StagedObject& staged) {
    const auto& request = ctx.request;
    const auto& transfer_id = ctx.session.transfer_id();

    if (auto started = advance(ctx, TransferState::Staging); started.is_error()) {
        return relay::Err(started.error());
    }

    if (!request.source) {
        return relay::Err(TransferError::download("Transfer request has no source stream"));
    }

    auto acquired = staging_.acquire();
    if (acquired.is_error()) {
        return relay::Err(acquired.error());
    }
    staged = std::move(acquired.value());

    if (ctx.cancel.is_cancelled()) {
        return relay::Err(TransferError::cancelled(TransferStage::Staging));
    }

    if (auto downloading = advance(ctx, TransferState::Downloading); downloading.is_error()) {
        return relay::Err(downloading.error());
    }

    const auto size_hint = request.declared_size ? request.declared_size : request.source->size_hint();
    if (size_hint && *size_hint >= options_.large_object_threshold) {
        spdlog::info("[{}] Large object ({} bytes): staging on disk before upload", transfer_id, *size_hint);
    }

    const ProgressSink progress = [this](const ProgressEvent& event) { bus_.emit(event); };

    auto drained = drain_.drain(*request.source, staged, transfer_id, request.declared_size, ctx.cancel, progress);
    if (drained.is_error()) {
        return relay::Err(drained.error());
    }
    const std::uint64_t total = drained.value();
    ctx.session.update_bytes(total, 0);

    if (auto uploading = advance(ctx, TransferState::Uploading); uploading.is_error()) {
        return relay::Err(uploading.error());
    }

    ChunkUploader uploader(destination_, ctx.governor, options_.upload);
    auto uploaded = uploader.upload(staged,
                                    total,
                                    UploadTarget{request.name, ctx.mime_type, request.folder_id},
                                    transfer_id,
                                    ctx.cancel,
                                    progress);
    if (uploaded.is_error()) {
        ctx.session.update_bytes(total, uploaded.error().cursor);
        return relay::Err(uploaded.error());
    }
    ctx.session.update_bytes(total, total);

    if (auto finalizing = advance(ctx, TransferState::Finalizing); finalizing.is_error()) {
        return relay::Err(finalizing.error());
    }

    RemoteObject object = std::move(uploaded.value());
    if (auto finished = finalize_object(ctx, object); finished.is_error()) {
        return relay::Err(finished.error());
    }

    bus_.emit(ProgressEvent{transfer_id, Phase::Finalizing, total, total});
    return relay::Ok(std::move(object));
}

relay::Result<void, TransferError> TransferOrchestrator::finalize_object(RunContext& ctx, RemoteObject& object) {
    const CallOptions call{options_.upload.call_timeout, ctx.cancel};

    if (options_.make_public && !object.published) {
        auto published = ctx.governor.execute<bool>(
            "publish " + object.id,
            [&]() -> relay::Result<bool, DestinationError> {
                auto result = destination_.publish(object.id, call);
                if (result.is_error()) {
                    return relay::Err(result.error());
                }
                return relay::Ok(true);
            },
            ctx.cancel);
        if (published.is_error()) {
            return relay::Err(TransferError::finalize(published.error().error, published.error().attempts));
        }
        object.published = true;
    }

    if (object.link.empty()) {
        auto link = ctx.governor.execute<std::string>(
            "retrieve-link " + object.id,
            [&]() { return destination_.retrieve_link(object.id, call); },
            ctx.cancel);
        if (link.is_error()) {
            return relay::Err(TransferError::finalize(link.error().error, link.error().attempts));
        }
        object.link = link.value();
    }

    return relay::Ok();
}

relay::Result<void, TransferError> TransferOrchestrator::advance(RunContext& ctx, TransferState next) {
    const TransferState from = ctx.session.state();
    auto result = from == TransferState::Idle && next == TransferState::Staging
                      ? ctx.session.start()
                      : ctx.session.transition_to(next);
    if (result.is_error()) {
        return relay::Err(TransferError::protocol(stage_of(from), result.error(), ctx.session.info().bytes_confirmed));
    }
    if (from != next) {
        bus_.emit(relay::events::TransferStateChangedEvent{ctx.session.transfer_id(), from, next});
    }
    return relay::Ok();
}

void TransferOrchestrator::release_staging(RunContext& ctx, StagedObject& staged) {
    if (staged.released()) {
        return;
    }

    const std::string path = staged.path().string();
    const std::uint64_t bytes = staged.size();
    auto released = staged.release();
    if (released.is_error()) {
        // StagedObject's destructor tries again when the handle goes out of scope.
        spdlog::error("[{}] {}", ctx.session.transfer_id(), released.error().message);
        return;
    }
    bus_.emit(relay::events::StagingReleasedEvent{ctx.session.transfer_id(), path, bytes});
}

std::string TransferOrchestrator::next_transfer_id() {
    return "transfer-" + std::to_string(++transfer_counter_);
}

} // namespace relay::transfer
