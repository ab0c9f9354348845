#include "relay/events/components.hpp"
#include "relay/events/event_bus.hpp"
#include "relay/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using relay::TransferError;
using relay::TransferStage;
using relay::events::EventBus;
using relay::events::LoggerComponent;
using relay::events::MetricsComponent;
using relay::events::ProgressEvent;
using relay::events::RetryScheduledEvent;
using relay::events::StagingReleasedEvent;
using relay::events::TransferCompletedEvent;
using relay::events::TransferFailedEvent;
using relay::events::TransferStartedEvent;
using relay::events::TransferStateChangedEvent;

TEST(MetricsComponentTest, CountsTransferOutcomesAndVolume) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(TransferStartedEvent{"t-1", "a.pdf", "application/pdf", 1024});
    bus.emit(TransferStartedEvent{"t-2", "b.png", "image/png", std::nullopt});
    bus.emit(TransferStartedEvent{"t-3", "c.txt", "text/plain", 7});

    bus.emit(RetryScheduledEvent{"t-1", "push bytes 0-1023/1024", 1, std::chrono::milliseconds{1000}, 503});
    bus.emit(StagingReleasedEvent{"t-1", "/tmp/a.part", 1024});
    bus.emit(StagingReleasedEvent{"t-2", "/tmp/b.part", 512});

    relay::transfer::RemoteObject object;
    object.id = "file-1";
    object.size = 1024;
    bus.emit(TransferCompletedEvent{"t-1", object, std::chrono::milliseconds{250}});
    bus.emit(TransferFailedEvent{"t-2", TransferError::download("connection reset")});
    bus.emit(TransferFailedEvent{"t-3", TransferError::cancelled(TransferStage::Upload, 0)});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.transfers_started.load(), 3u);
    EXPECT_EQ(stats.transfers_completed.load(), 1u);
    EXPECT_EQ(stats.transfers_failed.load(), 1u);
    EXPECT_EQ(stats.transfers_cancelled.load(), 1u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 1024u);
    EXPECT_EQ(stats.bytes_staged.load(), 1536u);
    EXPECT_EQ(stats.retries_scheduled.load(), 1u);
    EXPECT_EQ(stats.staged_files_released.load(), 2u);
}

TEST(MetricsComponentTest, IgnoresProgressAndStateChanges) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(ProgressEvent{"t-1", relay::transfer::Phase::Uploading, 10, 20});
    bus.emit(TransferStateChangedEvent{"t-1"});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.transfers_started.load(), 0u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 0u);
}

TEST(LoggerComponentTest, SubscribesToEveryTransferEvent) {
    EventBus bus;
    LoggerComponent logger(bus);

    EXPECT_EQ(bus.subscriber_count<TransferStartedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<TransferStateChangedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<ProgressEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<RetryScheduledEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<StagingReleasedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<TransferCompletedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<TransferFailedEvent>(), 1u);

    bus.emit(ProgressEvent{"t-1", relay::transfer::Phase::Downloading, 5, std::nullopt});
    bus.emit(TransferFailedEvent{"t-1", TransferError::staging("disk full")});
}
