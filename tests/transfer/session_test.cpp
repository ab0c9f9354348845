#include "relay/transfer/session.hpp"

#include <gtest/gtest.h>

using relay::transfer::TransferSession;
using relay::transfer::TransferState;

TEST(TransferSessionTest, StartEntersStaging) {
    TransferSession session{"transfer-1", "photo.jpg"};
    EXPECT_EQ(session.state(), TransferState::Idle);

    auto result = session.start();
    ASSERT_TRUE(result.is_ok());

    const auto& info = session.info();
    EXPECT_EQ(info.transfer_id, "transfer-1");
    EXPECT_EQ(info.name, "photo.jpg");
    EXPECT_EQ(info.state, TransferState::Staging);
    EXPECT_NE(info.started_at.time_since_epoch().count(), 0);

    EXPECT_TRUE(session.start().is_error());
}

TEST(TransferSessionTest, EnforcesTransitionOrder) {
    TransferSession session{"transfer-1", "a.bin"};
    ASSERT_TRUE(session.start().is_ok());

    EXPECT_TRUE(session.transition_to(TransferState::Uploading).is_error());
    EXPECT_TRUE(session.transition_to(TransferState::Downloading).is_ok());
    EXPECT_TRUE(session.transition_to(TransferState::Uploading).is_ok());
    EXPECT_TRUE(session.transition_to(TransferState::Finalizing).is_ok());
    EXPECT_TRUE(session.transition_to(TransferState::Completed).is_ok());
    EXPECT_TRUE(session.is_terminal());

    auto illegal = session.transition_to(TransferState::Uploading);
    EXPECT_TRUE(illegal.is_error());
    EXPECT_TRUE(session.mark_failed("late").is_error());
    EXPECT_EQ(session.state(), TransferState::Completed);
}

TEST(TransferSessionTest, AllowsFailureFromAnyActiveState) {
    TransferSession session{"transfer-1", "a.bin"};
    ASSERT_TRUE(session.start().is_ok());
    ASSERT_TRUE(session.transition_to(TransferState::Downloading).is_ok());

    auto failed = session.mark_failed("download: connection reset");
    ASSERT_TRUE(failed.is_ok());
    EXPECT_EQ(session.state(), TransferState::Failed);
    EXPECT_EQ(session.info().last_error, "download: connection reset");

    EXPECT_TRUE(session.transition_to(TransferState::Failed).is_ok());
    EXPECT_TRUE(session.transition_to(TransferState::Staging).is_error());
}

TEST(TransferSessionTest, FailureBeforeStartIsAllowed) {
    TransferSession session{"transfer-1", "a.bin"};
    EXPECT_TRUE(session.mark_failed("no source").is_ok());
    EXPECT_TRUE(session.is_terminal());
    EXPECT_TRUE(session.start().is_error());
}

TEST(TransferSessionTest, TracksByteCounters) {
    TransferSession session{"transfer-1", "a.bin"};
    session.update_bytes(100, 40);
    EXPECT_EQ(session.info().bytes_staged, 100u);
    EXPECT_EQ(session.info().bytes_confirmed, 40u);
}

TEST(TransferStateTest, NamesAreStable) {
    EXPECT_STREQ(relay::transfer::to_string(TransferState::Idle), "idle");
    EXPECT_STREQ(relay::transfer::to_string(TransferState::Downloading), "downloading");
    EXPECT_STREQ(relay::transfer::to_string(TransferState::Completed), "completed");
    EXPECT_STREQ(relay::transfer::to_string(relay::transfer::Phase::Finalizing), "finalizing");
}
