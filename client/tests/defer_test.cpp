#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "util/defer.hpp"

namespace {
int run_with_early_return(int& calls, bool leave_early) {
    DEFER(++calls;);
    if (leave_early)
        return 1;
    return 2;
}
} // namespace

TEST(DeferTest, RunsOnceOnEveryReturnPath) {
    int calls = 0;
    EXPECT_EQ(run_with_early_return(calls, true), 1);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(run_with_early_return(calls, false), 2);
    EXPECT_EQ(calls, 2);
}

TEST(DeferTest, RunsInReverseOrder) {
    std::string trace;
    {
        DEFER(trace += "a";);
        DEFER(trace += "b";);
    }
    EXPECT_EQ(trace, "ba");
}

TEST(DeferTest, RunsWhenUnwinding) {
    int calls = 0;
    EXPECT_THROW(
        {
            DEFER(++calls;);
            throw std::runtime_error("boom");
        },
        std::runtime_error);
    EXPECT_EQ(calls, 1);
}
