/**
 * @file BackoffTest.cpp
 * @brief Backoff delays, attempt bounds and cancellation
 */

#include "Backoff.h"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using std::chrono::milliseconds;

namespace {

BackoffPolicy fastPolicy(int attempts) {
    return BackoffPolicy{attempts, milliseconds(1), milliseconds(4), 2.0};
}

} // namespace

TEST(BackoffTest, DelayGrowsAndIsCapped) {
    BackoffPolicy policy{5, milliseconds(500), milliseconds(3000), 2.0};
    EXPECT_EQ(policy.delayAfter(1), milliseconds(500));
    EXPECT_EQ(policy.delayAfter(2), milliseconds(1000));
    EXPECT_EQ(policy.delayAfter(3), milliseconds(2000));
    EXPECT_EQ(policy.delayAfter(4), milliseconds(3000));
    EXPECT_EQ(policy.delayAfter(20), milliseconds(3000));
}

TEST(BackoffTest, SucceedsAfterTransientFailures) {
    int calls = 0;
    CancelToken cancel;
    Status status = retryWithBackoff(fastPolicy(4), cancel, "test", [&]() {
        return ++calls < 3 ? Status::error(ErrorCode::TIMEOUT, "slow")
                           : Status::success();
    });
    EXPECT_TRUE(status.ok());
    EXPECT_EQ(calls, 3);
}

TEST(BackoffTest, StopsAtMaxAttempts) {
    int calls = 0;
    CancelToken cancel;
    Status status = retryWithBackoff(fastPolicy(5), cancel, "test", [&]() {
        ++calls;
        return Status::error(ErrorCode::HTTP_SERVER_ERROR, "503");
    });
    EXPECT_EQ(status.code, ErrorCode::HTTP_SERVER_ERROR);
    EXPECT_EQ(calls, 5);
}

TEST(BackoffTest, PermanentFailureIsNotRetried) {
    int calls = 0;
    CancelToken cancel;
    Status status = retryWithBackoff(fastPolicy(5), cancel, "test", [&]() {
        ++calls;
        return Status::error(ErrorCode::HTTP_CLIENT_ERROR, "404");
    });
    EXPECT_EQ(status.code, ErrorCode::HTTP_CLIENT_ERROR);
    EXPECT_EQ(calls, 1);
}

TEST(BackoffTest, CustomPredicateDecidesRetry) {
    int calls = 0;
    CancelToken cancel;
    Status status = retryWithBackoff(fastPolicy(3), cancel, "test", [&]() {
        ++calls;
        return Status::error(ErrorCode::MALFORMED_RESPONSE, "garbage");
    }, [](const Status& s) { return s.code == ErrorCode::MALFORMED_RESPONSE; });
    EXPECT_EQ(status.code, ErrorCode::MALFORMED_RESPONSE);
    EXPECT_EQ(calls, 3);
}

TEST(BackoffTest, CancelledBeforeFirstAttempt) {
    int calls = 0;
    CancelToken cancel;
    cancel.cancel();
    Status status = retryWithBackoff(fastPolicy(3), cancel, "test", [&]() {
        ++calls;
        return Status::success();
    });
    EXPECT_EQ(status.code, ErrorCode::CANCELLED);
    EXPECT_EQ(calls, 0);
}

TEST(BackoffTest, CancelInterruptsWait) {
    BackoffPolicy slow{3, milliseconds(10000), milliseconds(10000), 1.0};
    CancelToken cancel;
    std::thread canceller([cancel]() mutable {
        std::this_thread::sleep_for(milliseconds(20));
        cancel.cancel();
    });

    auto started = std::chrono::steady_clock::now();
    Status status = retryWithBackoff(slow, cancel, "test", []() {
        return Status::error(ErrorCode::TIMEOUT, "slow");
    });
    auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_EQ(status.code, ErrorCode::CANCELLED);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(BackoffTest, CancelTokenCopiesShareState) {
    CancelToken a;
    CancelToken b = a;
    EXPECT_FALSE(b.isCancelled());
    a.cancel();
    EXPECT_TRUE(b.isCancelled());
    EXPECT_FALSE(b.sleepFor(milliseconds(1000)));
    EXPECT_TRUE(CancelToken().sleepFor(milliseconds(1)));
}
