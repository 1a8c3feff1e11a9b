#include <gtest/gtest.h>
#include <vellum/core/retry_policy.h>

#include <vector>

using namespace vellum;
using namespace vellum::core;

namespace {

RetryPolicy noJitter(std::size_t retries) {
    RetryPolicy p;
    p.maxRetries = retries;
    p.initialBackoff = std::chrono::milliseconds(100);
    p.maxBackoff = std::chrono::milliseconds(350);
    p.jitterFraction = 0.0;
    return p;
}

} // namespace

TEST(RetryPolicyTest, BackoffGrowsAndIsCapped) {
    auto p = noJitter(5);
    EXPECT_EQ(p.delayFor(0).count(), 100);
    EXPECT_EQ(p.delayFor(1).count(), 200);
    EXPECT_EQ(p.delayFor(2).count(), 350);
    EXPECT_EQ(p.delayFor(7).count(), 350);
}

TEST(RetryPolicyTest, TransientErrorsAreRetriedUntilSuccess) {
    std::vector<long long> sleeps;
    int calls = 0;
    auto result = retryTransient(
        noJitter(4), "test",
        [&]() -> Result<int> {
            if (++calls < 3)
                return Error{ErrorCode::RateLimited, "slow down"};
            return 42;
        },
        [&](std::chrono::milliseconds d) { sleeps.push_back(d.count()); });

    ASSERT_TRUE(result);
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(sleeps, (std::vector<long long>{100, 200}));
}

TEST(RetryPolicyTest, PermanentErrorIsNotRetried) {
    int calls = 0;
    auto result = retryTransient(
        noJitter(4), "test",
        [&]() -> Result<int> {
            ++calls;
            return Error{ErrorCode::InvalidData, "bad"};
        },
        [](std::chrono::milliseconds) {});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidData);
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, RetryBudgetIsBounded) {
    int calls = 0;
    auto result = retryTransient(
        noJitter(2), "test",
        [&]() -> Result<void> {
            ++calls;
            return Error{ErrorCode::Timeout, "timeout"};
        },
        [](std::chrono::milliseconds) {});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::Timeout);
    EXPECT_EQ(calls, 3);
}
