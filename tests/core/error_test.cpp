#include "relay/core/error.hpp"

#include <gtest/gtest.h>

using relay::DestinationError;
using relay::TransferError;
using relay::TransferStage;

TEST(DestinationErrorTest, FactoriesSetClassification) {
    auto transient = DestinationError::transient("busy", 503);
    EXPECT_TRUE(transient.is_transient());
    EXPECT_EQ(transient.status_code, 503);
    EXPECT_FALSE(transient.ambiguous);

    auto lost = DestinationError::lost_acknowledgement("reset");
    EXPECT_TRUE(lost.is_transient());
    EXPECT_TRUE(lost.ambiguous);

    auto cancelled = DestinationError::cancellation();
    EXPECT_FALSE(cancelled.is_transient());
    EXPECT_TRUE(cancelled.cancelled);
}

TEST(TransferErrorTest, UploadErrorCarriesCauseAndCursor) {
    auto error = TransferError::upload(DestinationError::transient("HTTP 503", 503), 8388608, 3);
    EXPECT_EQ(error.stage, TransferStage::Upload);
    EXPECT_TRUE(error.is_transient());
    EXPECT_EQ(error.status_code, 503);
    EXPECT_EQ(error.describe(), "upload/transient: HTTP 503 (cursor=8388608, attempts=3)");
}

TEST(TransferErrorTest, CancelledCauseBecomesCancelledError) {
    auto error = TransferError::upload(DestinationError::cancellation(), 2000, 1);
    EXPECT_TRUE(error.is_cancelled());
    EXPECT_EQ(error.stage, TransferStage::Upload);
    EXPECT_EQ(error.cursor, 2000u);
    EXPECT_EQ(error.describe(), "cancelled during upload (cursor=2000, attempts=1)");

    auto finalize = TransferError::finalize(DestinationError::cancellation(), 1);
    EXPECT_TRUE(finalize.is_cancelled());
    EXPECT_EQ(finalize.stage, TransferStage::Finalize);
}

TEST(TransferErrorTest, DescribeOtherStages) {
    EXPECT_EQ(TransferError::staging("disk full").describe(), "staging: disk full");
    EXPECT_EQ(TransferError::download("stream ended early").describe(), "download: stream ended early");
    EXPECT_EQ(TransferError::finalize(DestinationError::permanent("HTTP 403", 403), 1).describe(),
              "finalize/permanent: HTTP 403 (attempts=1)");
    EXPECT_EQ(TransferError::cancelled(TransferStage::Download).describe(), "cancelled during download (cursor=0)");
}

TEST(TransferErrorTest, StagingErrorIsItsOwnCategory) {
    auto error = TransferError::staging("permission denied");
    EXPECT_TRUE(error.is_staging());
    EXPECT_FALSE(error.is_cancelled());
    EXPECT_EQ(error.stage, TransferStage::Staging);
    EXPECT_STREQ(relay::to_string(error.stage), "staging");
}
