#include "relay/transfer/memory_destination.hpp"
#include "relay/transfer/uploader.hpp"

#include "support/test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

using relay::CancellationToken;
using relay::test::PatternSource;
using relay::test::create_temp_dir;
using relay::test::make_pattern;
using relay::transfer::ChunkUploader;
using relay::transfer::DrainOptions;
using relay::transfer::MemoryDestination;
using relay::transfer::ProgressEvent;
using relay::transfer::RetryGovernor;
using relay::transfer::RetryPolicy;
using relay::transfer::SessionHandle;
using relay::transfer::SourceDrain;
using relay::transfer::StagedObject;
using relay::transfer::StagingStore;
using relay::transfer::UploaderOptions;
using relay::transfer::UploadSession;
using relay::transfer::UploadTarget;
using relay::transfer::kMiB;

using CallKind = MemoryDestination::CallKind;
using Fault = MemoryDestination::Fault;

namespace {

RetryPolicy fast_policy(int attempts = 3) {
    RetryPolicy policy;
    policy.max_attempts = attempts;
    policy.initial_backoff = std::chrono::milliseconds(1);
    policy.max_backoff = std::chrono::milliseconds(2);
    return policy;
}

class ChunkUploaderTest : public ::testing::Test {
protected:
    ChunkUploaderTest() : store_(create_temp_dir("relay_uploader_test_")) {}

    StagedObject stage(const std::vector<std::uint8_t>& data) {
        auto staged = store_.acquire();
        EXPECT_TRUE(staged.is_ok());
        PatternSource source(data);
        SourceDrain drain(DrainOptions{64 * 1024, kMiB});
        auto drained = drain.drain(source, staged.value(), "t", std::nullopt, CancellationToken(), {});
        EXPECT_TRUE(drained.is_ok());
        return std::move(staged.value());
    }

    relay::Result<relay::transfer::RemoteObject, relay::TransferError> upload(
            const StagedObject& staged, std::uint64_t chunk_size, int attempts = 3,
            const CancellationToken& cancel = CancellationToken(),
            std::vector<ProgressEvent>* progress = nullptr) {
        RetryGovernor governor(fast_policy(attempts));
        ChunkUploader uploader(destination_, governor, UploaderOptions{chunk_size, std::chrono::milliseconds(1000)});
        return uploader.upload(staged, staged.size(), UploadTarget{"file.bin", "application/octet-stream", ""},
                               "t", cancel, [progress](const ProgressEvent& e) {
                                   if (progress) {
                                       progress->push_back(e);
                                   }
                               });
    }

    StagingStore store_;
    MemoryDestination destination_;
};

} // namespace

TEST(UploadSessionTest, CursorOnlyMovesForwardWithinTotal) {
    UploadSession session(SessionHandle{"s"}, 10, 25);
    EXPECT_EQ(session.next_chunk_length(), 10u);

    ASSERT_TRUE(session.advance_to(10).is_ok());
    EXPECT_EQ(session.next_chunk_length(), 10u);
    ASSERT_TRUE(session.advance_to(10).is_ok());

    EXPECT_TRUE(session.advance_to(5).is_error());
    EXPECT_EQ(session.cursor(), 10u);

    EXPECT_TRUE(session.advance_to(26).is_error());
    EXPECT_EQ(session.cursor(), 10u);

    ASSERT_TRUE(session.advance_to(20).is_ok());
    EXPECT_EQ(session.next_chunk_length(), 5u);
    ASSERT_TRUE(session.advance_to(25).is_ok());
    EXPECT_TRUE(session.complete());
}

TEST_F(ChunkUploaderTest, SplitsIntoFixedChunksAndFinalizesOnce) {
    const auto data = make_pattern(20 * kMiB);
    auto staged = stage(data);
    std::vector<ProgressEvent> progress;

    auto result = upload(staged, 8 * kMiB, 3, CancellationToken(), &progress);

    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(destination_.push_lengths(), (std::vector<std::uint64_t>{8 * kMiB, 8 * kMiB, 4 * kMiB}));
    EXPECT_EQ(destination_.count_calls(CallKind::Finalize), 1u);
    EXPECT_EQ(destination_.count_calls(CallKind::CreateSession), 1u);
    EXPECT_EQ(result.value().size, 20 * kMiB);
    EXPECT_EQ(destination_.content(result.value().id), data);

    std::vector<std::uint64_t> confirmed;
    for (const auto& e : progress) {
        confirmed.push_back(e.bytes_transferred);
    }
    EXPECT_EQ(confirmed, (std::vector<std::uint64_t>{8 * kMiB, 16 * kMiB, 20 * kMiB}));
}

TEST_F(ChunkUploaderTest, ExactMultipleOfChunkSize) {
    const auto data = make_pattern(3000);
    auto staged = stage(data);

    auto result = upload(staged, 1000);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(destination_.push_lengths(), (std::vector<std::uint64_t>{1000, 1000, 1000}));
}

TEST_F(ChunkUploaderTest, ZeroByteObjectSendsOneEmptyPush) {
    auto staged = stage({});

    auto result = upload(staged, 1000);
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(destination_.push_lengths(), (std::vector<std::uint64_t>{0}));
    EXPECT_EQ(destination_.count_calls(CallKind::Finalize), 1u);
    EXPECT_EQ(result.value().size, 0u);
    ASSERT_TRUE(destination_.content(result.value().id).has_value());
    EXPECT_TRUE(destination_.content(result.value().id)->empty());
}

TEST_F(ChunkUploaderTest, TransientFailuresBelowLimitRecover) {
    const auto data = make_pattern(2500);
    auto staged = stage(data);
    destination_.inject_fault(CallKind::PushChunk, Fault::transient(503));
    destination_.inject_fault(CallKind::PushChunk, Fault::transient(500));

    auto result = upload(staged, 1000);
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(destination_.push_lengths(), (std::vector<std::uint64_t>{1000, 1000, 1000, 1000, 500}));
    EXPECT_EQ(destination_.content(result.value().id), data);
}

TEST_F(ChunkUploaderTest, ExhaustedRetriesAreTransientUploadError) {
    auto staged = stage(make_pattern(2500));
    // Chunk two fails on every attempt.
    destination_.set_push_hook([this](std::uint64_t offset, std::size_t) {
        if (offset == 1000) {
            destination_.inject_fault(CallKind::PushChunk, Fault::transient(503));
        }
    });

    auto result = upload(staged, 1000, 3);
    ASSERT_TRUE(result.is_error());
    const auto& error = result.error();
    EXPECT_EQ(error.stage, relay::TransferStage::Upload);
    EXPECT_TRUE(error.is_transient());
    EXPECT_EQ(error.attempts, 3);
    EXPECT_EQ(error.cursor, 1000u);
    EXPECT_EQ(error.status_code, 503);
    EXPECT_EQ(destination_.count_calls(CallKind::PushChunk), 4u);
    EXPECT_EQ(destination_.count_calls(CallKind::Finalize), 0u);
}

TEST_F(ChunkUploaderTest, PermanentFailureIsNotRetried) {
    auto staged = stage(make_pattern(2500));
    destination_.inject_fault(CallKind::PushChunk, Fault::permanent(400));

    auto result = upload(staged, 1000, 5);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().stage, relay::TransferStage::Upload);
    EXPECT_FALSE(result.error().is_transient());
    EXPECT_EQ(result.error().attempts, 1);
    EXPECT_EQ(destination_.count_calls(CallKind::PushChunk), 1u);
}

TEST_F(ChunkUploaderTest, LostAcknowledgementNeverDuplicatesBytes) {
    const auto data = make_pattern(3000);
    auto staged = stage(data);
    destination_.inject_fault(CallKind::PushChunk, Fault::transient(503));
    destination_.inject_fault(CallKind::PushChunk, Fault::ack_lost());

    auto result = upload(staged, 1000);
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(destination_.content(result.value().id), data);
    EXPECT_EQ(destination_.count_calls(CallKind::QuerySession), 1u);
    // 503, then an applied push whose ack was lost, then chunks two and three.
    EXPECT_EQ(destination_.push_lengths(), (std::vector<std::uint64_t>{1000, 1000, 1000, 1000}));
}

TEST_F(ChunkUploaderTest, PartialAcceptResendsRemainder) {
    const auto data = make_pattern(2000);
    auto staged = stage(data);
    destination_.inject_fault(CallKind::PushChunk, Fault::partial_accept(300));

    auto result = upload(staged, 1000);
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(destination_.content(result.value().id), data);

    const auto calls = destination_.calls();
    std::vector<std::uint64_t> offsets;
    for (const auto& call : calls) {
        if (call.kind == CallKind::PushChunk) {
            offsets.push_back(call.offset);
        }
    }
    EXPECT_EQ(offsets, (std::vector<std::uint64_t>{0, 300, 1300}));
}

TEST_F(ChunkUploaderTest, StalledDestinationFailsTransiently) {
    auto staged = stage(make_pattern(2000));
    for (int i = 0; i < 3; ++i) {
        destination_.inject_fault(CallKind::PushChunk, Fault::partial_accept(0));
    }

    auto result = upload(staged, 1000, 3);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().stage, relay::TransferStage::Upload);
    EXPECT_TRUE(result.error().is_transient());
    EXPECT_EQ(result.error().cursor, 0u);
    EXPECT_EQ(destination_.count_calls(CallKind::PushChunk), 3u);
    EXPECT_EQ(destination_.count_calls(CallKind::AbandonSession), 1u);
}

TEST_F(ChunkUploaderTest, StalledPushWaitsBeforeResending) {
    const auto data = make_pattern(1000);
    auto staged = stage(data);
    destination_.inject_fault(CallKind::PushChunk, Fault::partial_accept(0));
    destination_.inject_fault(CallKind::PushChunk, Fault::partial_accept(0));

    RetryPolicy policy = fast_policy(5);
    policy.initial_backoff = std::chrono::milliseconds(50);
    policy.max_backoff = std::chrono::milliseconds(200);
    RetryGovernor governor(policy);
    ChunkUploader uploader(destination_, governor, UploaderOptions{1000, std::chrono::milliseconds(1000)});

    const auto started = std::chrono::steady_clock::now();
    auto result = uploader.upload(staged, staged.size(), UploadTarget{"file.bin", "application/octet-stream", ""},
                                  "t", CancellationToken(), {});
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(destination_.content(result.value().id), data);
    EXPECT_EQ(destination_.count_calls(CallKind::PushChunk), 3u);
    // 50ms after the first stall, 100ms after the second.
    EXPECT_GE(elapsed, std::chrono::milliseconds(150));
    EXPECT_EQ(destination_.count_calls(CallKind::AbandonSession), 0u);
}

TEST_F(ChunkUploaderTest, CancelDuringStallWaitReturnsCancelled) {
    auto staged = stage(make_pattern(1000));
    destination_.inject_fault(CallKind::PushChunk, Fault::partial_accept(0));

    RetryPolicy policy = fast_policy(5);
    policy.initial_backoff = std::chrono::milliseconds(30000);
    policy.max_backoff = std::chrono::milliseconds(30000);
    RetryGovernor governor(policy);
    ChunkUploader uploader(destination_, governor, UploaderOptions{1000, std::chrono::milliseconds(1000)});

    CancellationToken cancel;
    std::thread canceller([cancel]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.cancel();
    });

    const auto started = std::chrono::steady_clock::now();
    auto result = uploader.upload(staged, staged.size(), UploadTarget{"file.bin", "application/octet-stream", ""},
                                  "t", cancel, {});
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is_cancelled());
    EXPECT_LT(elapsed, std::chrono::seconds(10));
    EXPECT_EQ(destination_.count_calls(CallKind::PushChunk), 1u);
    EXPECT_EQ(destination_.count_calls(CallKind::AbandonSession), 1u);
}

TEST_F(ChunkUploaderTest, CancellationDuringPushReturnsCancelled) {
    auto staged = stage(make_pattern(5000));
    CancellationToken cancel;
    destination_.set_push_hook([cancel](std::uint64_t offset, std::size_t) mutable {
        if (offset >= 2000) {
            cancel.cancel();
        }
    });

    auto result = upload(staged, 1000, 3, cancel);
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is_cancelled());
    EXPECT_EQ(result.error().cursor, 2000u);
    EXPECT_EQ(destination_.count_calls(CallKind::Finalize), 0u);
}

TEST_F(ChunkUploaderTest, FinalizeFailureIsFinalizeError) {
    auto staged = stage(make_pattern(100));
    destination_.inject_fault(CallKind::Finalize, Fault::permanent(400));

    auto result = upload(staged, 1000);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().stage, relay::TransferStage::Finalize);
    EXPECT_EQ(result.error().attempts, 1);
}

TEST_F(ChunkUploaderTest, SessionCreationRetriedOnTransientFailure) {
    auto staged = stage(make_pattern(100));
    destination_.inject_fault(CallKind::CreateSession, Fault::transient(503));

    auto result = upload(staged, 1000);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(destination_.count_calls(CallKind::CreateSession), 2u);
}

TEST_F(ChunkUploaderTest, RequestingMoreThanStagedIsRejected) {
    auto staged = stage(make_pattern(100));
    RetryGovernor governor(fast_policy());
    ChunkUploader uploader(destination_, governor, UploaderOptions{1000, std::chrono::milliseconds(1000)});

    auto result = uploader.upload(staged, 200, UploadTarget{"f", "text/plain", ""}, "t", CancellationToken(), {});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().stage, relay::TransferStage::Upload);
    EXPECT_EQ(destination_.count_calls(CallKind::CreateSession), 0u);
}
