/**
 * @file components.hpp
 * @brief Ready-made subscribers for transfer events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Every transfer run against `bus` is now logged and counted.
 */

#pragma once

#include "relay/events/event_bus.hpp"
#include "relay/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace relay::events {

/**
 * @brief Logger component - logs every transfer event through spdlog
 *
 * Progress is logged at debug level, retries at warn, failures at error.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<TransferStartedEvent>([this](const TransferStartedEvent& e) {
            on_transfer_started(e);
        });

        bus_.subscribe<TransferStateChangedEvent>([this](const TransferStateChangedEvent& e) {
            on_state_changed(e);
        });

        bus_.subscribe<ProgressEvent>([this](const ProgressEvent& e) {
            on_progress(e);
        });

        bus_.subscribe<RetryScheduledEvent>([this](const RetryScheduledEvent& e) {
            on_retry_scheduled(e);
        });

        bus_.subscribe<StagingReleasedEvent>([this](const StagingReleasedEvent& e) {
            on_staging_released(e);
        });

        bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            on_transfer_completed(e);
        });

        bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent& e) {
            on_transfer_failed(e);
        });
    }

private:
    void on_transfer_started(const TransferStartedEvent& e) {
        if (e.declared_size) {
            spdlog::info("[TransferStarted] id={} name={} mime={} size={}",
                         e.transfer_id, e.name, e.mime_type, *e.declared_size);
        } else {
            spdlog::info("[TransferStarted] id={} name={} mime={} size=unknown",
                         e.transfer_id, e.name, e.mime_type);
        }
    }

    void on_state_changed(const TransferStateChangedEvent& e) {
        spdlog::debug("[StateChanged] id={} {} -> {}",
                      e.transfer_id, transfer::to_string(e.from), transfer::to_string(e.to));
    }

    void on_progress(const ProgressEvent& e) {
        if (e.bytes_total && *e.bytes_total > 0) {
            const double percent = 100.0 * static_cast<double>(e.bytes_transferred) /
                                   static_cast<double>(*e.bytes_total);
            spdlog::debug("[Progress] id={} phase={} bytes={}/{} ({:.1f}%)",
                          e.transfer_id, transfer::to_string(e.phase),
                          e.bytes_transferred, *e.bytes_total, percent);
        } else {
            spdlog::debug("[Progress] id={} phase={} bytes={}",
                          e.transfer_id, transfer::to_string(e.phase), e.bytes_transferred);
        }
    }

    void on_retry_scheduled(const RetryScheduledEvent& e) {
        spdlog::warn("[RetryScheduled] id={} op=\"{}\" attempt={} status={} delay={}ms reason={}",
                     e.transfer_id, e.operation, e.failed_attempt, e.status_code,
                     e.delay.count(), e.message);
    }

    void on_staging_released(const StagingReleasedEvent& e) {
        spdlog::debug("[StagingReleased] id={} path={} bytes={}", e.transfer_id, e.path, e.bytes);
    }

    void on_transfer_completed(const TransferCompletedEvent& e) {
        spdlog::info("[TransferCompleted] id={} object={} name={} bytes={} link={} duration={}ms",
                     e.transfer_id, e.object.id, e.object.name, e.object.size,
                     e.object.link.empty() ? "-" : e.object.link, e.duration.count());
    }

    void on_transfer_failed(const TransferFailedEvent& e) {
        if (e.error.is_cancelled()) {
            spdlog::warn("[TransferCancelled] id={} {}", e.transfer_id, e.error.describe());
        } else {
            spdlog::error("[TransferFailed] id={} {}", e.transfer_id, e.error.describe());
        }
    }

    EventBus& bus_;
};

/**
 * @brief Metrics component - counts transfer outcomes and volume
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> transfers_started{0};
        std::atomic<uint64_t> transfers_completed{0};
        std::atomic<uint64_t> transfers_failed{0};
        std::atomic<uint64_t> transfers_cancelled{0};
        std::atomic<uint64_t> bytes_staged{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> retries_scheduled{0};
        std::atomic<uint64_t> staged_files_released{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<TransferStartedEvent>([this](const TransferStartedEvent&) {
            stats_.transfers_started++;
        });

        bus_.subscribe<RetryScheduledEvent>([this](const RetryScheduledEvent&) {
            stats_.retries_scheduled++;
        });

        bus_.subscribe<StagingReleasedEvent>([this](const StagingReleasedEvent& e) {
            on_staging_released(e);
        });

        bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            on_transfer_completed(e);
        });

        bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent& e) {
            on_transfer_failed(e);
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Transfer Statistics:");
        spdlog::info("  Started:         {}", stats_.transfers_started.load());
        spdlog::info("  Completed:       {}", stats_.transfers_completed.load());
        spdlog::info("  Failed:          {}", stats_.transfers_failed.load());
        spdlog::info("  Cancelled:       {}", stats_.transfers_cancelled.load());
        spdlog::info("  Bytes staged:    {}", stats_.bytes_staged.load());
        spdlog::info("  Bytes uploaded:  {}", stats_.bytes_uploaded.load());
        spdlog::info("  Retries:         {}", stats_.retries_scheduled.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_staging_released(const StagingReleasedEvent& e) {
        stats_.staged_files_released++;
        stats_.bytes_staged += e.bytes;
    }

    void on_transfer_completed(const TransferCompletedEvent& e) {
        stats_.transfers_completed++;
        stats_.bytes_uploaded += e.object.size;
    }

    void on_transfer_failed(const TransferFailedEvent& e) {
        if (e.error.is_cancelled()) {
            stats_.transfers_cancelled++;
        } else {
            stats_.transfers_failed++;
        }
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace relay::events
