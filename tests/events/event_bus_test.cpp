#include <gtest/gtest.h>
#include "relay/events/event_bus.hpp"
#include "relay/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace relay::events;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    bool handler_called = false;
    std::uint64_t received_bytes = 0;

    bus.subscribe<ProgressEvent>([&](const ProgressEvent& e) {
        handler_called = true;
        received_bytes = e.bytes_transferred;
    });

    bus.emit(ProgressEvent{"t-1", relay::transfer::Phase::Uploading, 42, 100});

    EXPECT_TRUE(handler_called);
    EXPECT_EQ(received_bytes, 42u);
}

TEST(EventBus, MultipleSubscribers) {
    EventBus bus;

    int count = 0;

    bus.subscribe<TransferStartedEvent>([&](const TransferStartedEvent&) { count++; });
    bus.subscribe<TransferStartedEvent>([&](const TransferStartedEvent&) { count++; });
    bus.subscribe<TransferStartedEvent>([&](const TransferStartedEvent&) { count++; });

    bus.emit(TransferStartedEvent{"t-1", "report.pdf", "application/pdf", 10});

    EXPECT_EQ(count, 3);
}

TEST(EventBus, DifferentEventTypes) {
    EventBus bus;

    int progress_count = 0;
    int retry_count = 0;

    bus.subscribe<ProgressEvent>([&](const ProgressEvent&) { progress_count++; });
    bus.subscribe<RetryScheduledEvent>([&](const RetryScheduledEvent&) { retry_count++; });

    bus.emit(ProgressEvent{"t-1", relay::transfer::Phase::Downloading, 1, std::nullopt});
    bus.emit(RetryScheduledEvent{"t-1", "push bytes 0-9/10", 1});
    bus.emit(ProgressEvent{"t-1", relay::transfer::Phase::Downloading, 2, std::nullopt});

    EXPECT_EQ(progress_count, 2);
    EXPECT_EQ(retry_count, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<ProgressEvent>([&](const ProgressEvent&) { count++; });

    bus.emit(ProgressEvent{});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<ProgressEvent>(id);

    bus.emit(ProgressEvent{});
    EXPECT_EQ(count, 1);  // Still 1, handler was removed
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;

    EXPECT_NO_THROW(bus.emit(TransferCompletedEvent{}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int before = 0;
    int after = 0;
    bus.subscribe<StagingReleasedEvent>([&](const StagingReleasedEvent&) { before++; });
    bus.subscribe<StagingReleasedEvent>([](const StagingReleasedEvent&) {
        throw std::runtime_error("renderer gone");
    });
    bus.subscribe<StagingReleasedEvent>([&](const StagingReleasedEvent&) { after++; });

    EXPECT_NO_THROW(bus.emit(StagingReleasedEvent{"t-1", "/tmp/x.part", 10}));
    EXPECT_EQ(before, 1);
    EXPECT_EQ(after, 1);
}

TEST(EventBus, HandlerMaySubscribeDuringEmit) {
    EventBus bus;

    int late_calls = 0;
    bus.subscribe<ProgressEvent>([&](const ProgressEvent&) {
        bus.subscribe<ProgressEvent>([&](const ProgressEvent&) { late_calls++; });
    });

    bus.emit(ProgressEvent{});
    EXPECT_EQ(late_calls, 0);
    EXPECT_EQ(bus.subscriber_count<ProgressEvent>(), 2u);
}

TEST(EventBus, ThreadSafety) {
    EventBus bus;
    std::atomic<int> count{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&bus, &count]() {
            bus.subscribe<ProgressEvent>([&count](const ProgressEvent&) {
                count++;
            });
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    bus.emit(ProgressEvent{});

    EXPECT_EQ(count, 10);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<std::uint64_t> total{0};

    bus.subscribe<ProgressEvent>([&total](const ProgressEvent& e) {
        total += e.bytes_transferred;
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 100; ++i) {
        threads.emplace_back([&bus, i]() {
            bus.emit(ProgressEvent{"t-" + std::to_string(i), relay::transfer::Phase::Uploading, 1, 1});
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(total, 100u);
}

TEST(EventBus, SubscriberCount) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<ProgressEvent>(), 0u);

    auto id1 = bus.subscribe<ProgressEvent>([](const ProgressEvent&) {});
    EXPECT_EQ(bus.subscriber_count<ProgressEvent>(), 1u);

    bus.subscribe<ProgressEvent>([](const ProgressEvent&) {});
    EXPECT_EQ(bus.subscriber_count<ProgressEvent>(), 2u);

    bus.unsubscribe<ProgressEvent>(id1);
    EXPECT_EQ(bus.subscriber_count<ProgressEvent>(), 1u);
}

TEST(EventBus, Clear) {
    EventBus bus;

    bus.subscribe<ProgressEvent>([](const ProgressEvent&) {});
    bus.subscribe<TransferFailedEvent>([](const TransferFailedEvent&) {});

    EXPECT_EQ(bus.subscriber_count<ProgressEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<TransferFailedEvent>(), 1u);

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<ProgressEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<TransferFailedEvent>(), 0u);
}
