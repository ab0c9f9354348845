#include "relay/core/cancellation.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using relay::CancellationToken;

TEST(CancellationTokenTest, CopiesShareOneFlag) {
    CancellationToken token;
    CancellationToken copy = token;
    EXPECT_FALSE(copy.is_cancelled());

    token.cancel();
    EXPECT_TRUE(copy.is_cancelled());

    CancellationToken unrelated;
    EXPECT_FALSE(unrelated.is_cancelled());
}

TEST(CancellationTokenTest, WaitForTimesOutWhenNotCancelled) {
    CancellationToken token;
    EXPECT_FALSE(token.wait_for(std::chrono::milliseconds(5)));
}

TEST(CancellationTokenTest, WaitForReturnsEarlyOnCancel) {
    CancellationToken token;
    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.cancel();
    });

    const auto started = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.wait_for(std::chrono::seconds(30)));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
    canceller.join();
}

TEST(CancellationTokenTest, AlreadyCancelledWaitReturnsImmediately) {
    CancellationToken token;
    token.cancel();
    token.cancel();
    EXPECT_TRUE(token.wait_for(std::chrono::seconds(30)));
}
