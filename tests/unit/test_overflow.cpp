#include <gtest/gtest.h>
#include "ledger/overflow.hpp"

namespace {

using streamcore::ledger::is_overflow;

TEST(OverflowTest, ReservesDefaultOutputBudget) {
    // usable = 200,000 - 32,000 = 168,000
    EXPECT_TRUE(is_overflow(190'000, 0, 0, 200'000));
    EXPECT_FALSE(is_overflow(100'000, 0, 0, 200'000));
    EXPECT_FALSE(is_overflow(168'000, 0, 0, 200'000));
    EXPECT_TRUE(is_overflow(168'001, 0, 0, 200'000));
}

TEST(OverflowTest, CountsCacheReadAndOutput) {
    EXPECT_TRUE(is_overflow(100'000, 60'000, 8'001, 200'000));
    EXPECT_FALSE(is_overflow(100'000, 60'000, 8'000, 200'000));
}

TEST(OverflowTest, SmallerModelOutputLimitWidensUsableRoom) {
    // usable = 200,000 - 8,192
    EXPECT_FALSE(is_overflow(190'000, 0, 0, 200'000, 8'192));
    EXPECT_TRUE(is_overflow(191'809, 0, 0, 200'000, 8'192));
}

TEST(OverflowTest, LargerModelOutputLimitIsCappedAtDefault) {
    EXPECT_FALSE(is_overflow(168'000, 0, 0, 200'000, 100'000));
}

TEST(OverflowTest, UnknownContextLimitNeverOverflows) {
    EXPECT_FALSE(is_overflow(10'000'000, 0, 0, 0));
}

TEST(OverflowTest, ContextSmallerThanOutputBudgetAlwaysOverflows) {
    EXPECT_TRUE(is_overflow(0, 0, 0, 8'192));
}

}  // namespace
