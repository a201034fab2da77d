#include <gtest/gtest.h>

#include <cstddef>
#include <vector>

#include "net/retry.hpp"

namespace {
struct attempt_result {
    bool success = false;
    std::size_t attempt = 0;
};
} // namespace

TEST(RetryTest, StopsAtFirstSuccess) {
    std::size_t calls = 0;
    auto result = retry::with_attempts(3, [&](std::size_t attempt) {
        ++calls;
        return attempt_result{true, attempt};
    });
    EXPECT_TRUE(result.success);
    EXPECT_EQ(calls, 1u);
    EXPECT_EQ(result.attempt, 1u);
}

TEST(RetryTest, SucceedsOnLastAttempt) {
    std::vector<std::size_t> attempts;
    auto result = retry::with_attempts(3, [&](std::size_t attempt) {
        attempts.push_back(attempt);
        return attempt_result{attempt == 3, attempt};
    });
    EXPECT_TRUE(result.success);
    EXPECT_EQ(attempts, (std::vector<std::size_t>{1, 2, 3}));
}

TEST(RetryTest, ReturnsLastFailureWhenExhausted) {
    std::size_t calls = 0;
    auto result = retry::with_attempts(retry::DEFAULT_MAX_ATTEMPTS, [&](std::size_t attempt) {
        ++calls;
        return attempt_result{false, attempt};
    });
    EXPECT_FALSE(result.success);
    EXPECT_EQ(calls, 3u);
    EXPECT_EQ(result.attempt, 3u);
}

TEST(RetryTest, ZeroAttemptsNeverCalls) {
    std::size_t calls = 0;
    auto result = retry::with_attempts(0, [&](std::size_t attempt) {
        ++calls;
        return attempt_result{true, attempt};
    });
    EXPECT_FALSE(result.success);
    EXPECT_EQ(calls, 0u);
}
