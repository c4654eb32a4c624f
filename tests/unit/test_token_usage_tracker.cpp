#include <cstdint>
#include <vector>
#include <gtest/gtest.h>
#include "ledger/model_pricing.hpp"
#include "ledger/token_usage_tracker.hpp"

namespace {

using streamcore::ledger::LimitStatus;
using streamcore::ledger::ModelPricing;
using streamcore::ledger::TokenUsageTracker;

ModelPricing make_pricing() {
    ModelPricing pricing;
    pricing.input_per_1m = 3.0;
    pricing.output_per_1m = 15.0;
    pricing.cache_read_per_1m = 0.3;
    pricing.max_tokens = 1000;
    return pricing;
}

TEST(TokenUsageTrackerTest, TotalsAndCostAccumulate) {
    TokenUsageTracker tracker("test-model", make_pricing());
    const std::vector<std::uint64_t> prompts = {100, 250, 0};
    const std::vector<std::uint64_t> completions = {40, 60};

    double expected_cost = 0.0;
    for (const auto n : prompts) {
        tracker.record_prompt(n);
        expected_cost += static_cast<double>(n) / 1e6 * 3.0;
        EXPECT_EQ(tracker.total_tokens(),
                  tracker.prompt_tokens() + tracker.completion_tokens());
    }
    for (const auto n : completions) {
        tracker.record_completion(n);
        expected_cost += static_cast<double>(n) / 1e6 * 15.0;
        EXPECT_EQ(tracker.total_tokens(),
                  tracker.prompt_tokens() + tracker.completion_tokens());
    }

    EXPECT_EQ(tracker.prompt_tokens(), 350u);
    EXPECT_EQ(tracker.completion_tokens(), 100u);
    EXPECT_EQ(tracker.total_tokens(), 450u);
    EXPECT_DOUBLE_EQ(tracker.estimated_cost(), expected_cost);
}

TEST(TokenUsageTrackerTest, ReasoningBilledAsCompletion) {
    TokenUsageTracker tracker("test-model", make_pricing());
    tracker.record_reasoning(200);

    EXPECT_EQ(tracker.reasoning_tokens(), 200u);
    EXPECT_EQ(tracker.completion_tokens(), 200u);
    EXPECT_EQ(tracker.total_tokens(), 200u);
    EXPECT_DOUBLE_EQ(tracker.estimated_cost(), 200.0 / 1e6 * 15.0);
}

TEST(TokenUsageTrackerTest, CacheTrafficUsesOptionalRates) {
    TokenUsageTracker tracker("test-model", make_pricing());
    tracker.record_cache_read(1000);
    tracker.record_cache_write(1000);  // no write rate: free

    EXPECT_EQ(tracker.cache_read_tokens(), 1000u);
    EXPECT_EQ(tracker.cache_write_tokens(), 1000u);
    EXPECT_EQ(tracker.total_tokens(), 0u);
    EXPECT_DOUBLE_EQ(tracker.estimated_cost(), 1000.0 / 1e6 * 0.3);
}

TEST(TokenUsageTrackerTest, LimitStatusThresholds) {
    TokenUsageTracker tracker("test-model", make_pricing());
    EXPECT_EQ(tracker.limit_status(), LimitStatus::Normal);

    tracker.record_prompt(749);
    EXPECT_EQ(tracker.limit_status(), LimitStatus::Normal);
    tracker.record_prompt(1);
    EXPECT_DOUBLE_EQ(tracker.usage_percentage(), 75.0);
    EXPECT_EQ(tracker.limit_status(), LimitStatus::Warning);
    tracker.record_completion(149);
    EXPECT_EQ(tracker.limit_status(), LimitStatus::Warning);
    tracker.record_completion(1);
    EXPECT_EQ(tracker.limit_status(), LimitStatus::Critical);
}

TEST(TokenUsageTrackerTest, ZeroLimitReportsZeroPercent) {
    ModelPricing pricing = make_pricing();
    pricing.max_tokens = 0;
    TokenUsageTracker tracker("test-model", pricing);
    tracker.record_prompt(500);

    EXPECT_DOUBLE_EQ(tracker.usage_percentage(), 0.0);
    EXPECT_EQ(tracker.limit_status(), LimitStatus::Normal);
}

TEST(TokenUsageTrackerTest, ResetClearsCountersButKeepsLimit) {
    TokenUsageTracker tracker("test-model", make_pricing());
    tracker.record_prompt(10);
    tracker.record_completion(10);
    tracker.record_cache_read(10);
    tracker.reset();

    EXPECT_EQ(tracker.total_tokens(), 0u);
    EXPECT_EQ(tracker.prompt_tokens(), 0u);
    EXPECT_EQ(tracker.cache_read_tokens(), 0u);
    EXPECT_DOUBLE_EQ(tracker.estimated_cost(), 0.0);
    EXPECT_EQ(tracker.token_limit(), 1000u);
}

}  // namespace
