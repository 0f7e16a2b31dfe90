/// @file retry_test.cpp
/// @brief Tests for bounded provider retries

#include <gtest/gtest.h>

#include <chrono>
#include <vector>

#include "llm/retry.h"

namespace tracescore::llm {
namespace {

using std::chrono::milliseconds;
using std::chrono::steady_clock;

constexpr steady_clock::time_point kNoDeadline = steady_clock::time_point::max();

class RetryTest : public ::testing::Test {
protected:
    void SetUp() override {
        policy_.max_attempts = 4;
        policy_.initial_backoff = std::chrono::milliseconds(100);
        policy_.max_backoff = std::chrono::milliseconds(300);
        policy_.multiplier = 2.0;
    }

    std::function<void(std::chrono::milliseconds)> RecordSleeps() {
        return [this](std::chrono::milliseconds d) { sleeps_.push_back(d.count()); };
    }

    RetryPolicy policy_;
    std::vector<int64_t> sleeps_;
};

TEST_F(RetryTest, BackoffGrowsAndIsCapped) {
    EXPECT_EQ(policy_.BackoffBefore(2).count(), 100);
    EXPECT_EQ(policy_.BackoffBefore(3).count(), 200);
    EXPECT_EQ(policy_.BackoffBefore(4).count(), 300);
    EXPECT_EQ(policy_.BackoffBefore(9).count(), 300);
}

TEST_F(RetryTest, SuccessNeedsNoRetry) {
    int calls = 0;
    auto result = CallWithRetry<int>(
        policy_, kNoDeadline, [&calls]() -> absl::StatusOr<int> { return ++calls; }, RecordSleeps());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(*result, 1);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(RetryTest, TransientFailuresAreRetried) {
    int calls = 0;
    auto result = CallWithRetry<int>(
        policy_, kNoDeadline,
        [&calls]() -> absl::StatusOr<int> {
            if (++calls < 3) {
                return MakeError(ErrorCode::kRateLimited, "slow down");
            }
            return 42;
        },
        RecordSleeps());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(*result, 42);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(sleeps_, (std::vector<int64_t>{100, 200}));
}

TEST_F(RetryTest, PermanentFailureStopsImmediately) {
    int calls = 0;
    auto result = CallWithRetry<int>(
        policy_, kNoDeadline,
        [&calls]() -> absl::StatusOr<int> {
            ++calls;
            return MakeError(ErrorCode::kPermanentRequestError, "bad request");
        },
        RecordSleeps());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryTest, LastFailureIsReturnedWhenAttemptsRunOut) {
    int calls = 0;
    auto result = CallWithRetry<int>(
        policy_, kNoDeadline,
        [&calls]() -> absl::StatusOr<int> {
            ++calls;
            return MakeError(ErrorCode::kTransientProviderError, "attempt " + std::to_string(calls));
        },
        RecordSleeps());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kUnavailable);
    EXPECT_EQ(result.status().message(), "attempt 4");
    EXPECT_EQ(calls, 4);
    EXPECT_EQ(sleeps_.size(), 3u);
}

TEST_F(RetryTest, SingleAttemptPolicyNeverRetries) {
    policy_.max_attempts = 1;
    int calls = 0;
    auto result = CallWithRetry<int>(
        policy_, kNoDeadline,
        [&calls]() -> absl::StatusOr<int> {
            ++calls;
            return absl::UnavailableError("down");
        },
        RecordSleeps());
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryTest, BackoffPastTheDeadlineIsNotSlept) {
    RetryPolicy defaults;
    int calls = 0;
    const auto started = steady_clock::now();
    auto result = CallWithRetry<int>(
        defaults, started + milliseconds(100),
        [&calls]() -> absl::StatusOr<int> {
            ++calls;
            return MakeError(ErrorCode::kTransientProviderError, "connection refused");
        });
    EXPECT_EQ(result.status().code(), absl::StatusCode::kUnavailable);
    EXPECT_EQ(calls, 1);
    EXPECT_LT(steady_clock::now() - started, milliseconds(100));
}

TEST_F(RetryTest, RetriesStopWhenTheNextBackoffWouldPassTheDeadline) {
    int calls = 0;
    auto result = CallWithRetry<int>(
        policy_, steady_clock::now() + milliseconds(250),
        [&calls]() -> absl::StatusOr<int> {
            ++calls;
            return absl::UnavailableError("down");
        },
        RecordSleeps());
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(sleeps_, (std::vector<int64_t>{100, 200}));
}

TEST_F(RetryTest, TimeoutAfterTheDeadlineIsNotRetried) {
    int calls = 0;
    auto result = CallWithRetry<int>(
        policy_, steady_clock::now() - milliseconds(1),
        [&calls]() -> absl::StatusOr<int> {
            ++calls;
            return MakeError(ErrorCode::kTimeout, "call exceeded 100ms");
        },
        RecordSleeps());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kDeadlineExceeded);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeps_.empty());
}

}  // namespace
}  // namespace tracescore::llm
