#include <gtest/gtest.h>
#include "ledger/model_pricing.hpp"

namespace {

using streamcore::ledger::cost_for_tokens;
using streamcore::ledger::default_pricing;
using streamcore::ledger::find_model_pricing;
using streamcore::ledger::pricing_or_default;

TEST(ModelPricingTest, ExactLookup) {
    auto pricing = find_model_pricing("claude-3-5-sonnet");
    ASSERT_TRUE(pricing.has_value());
    EXPECT_DOUBLE_EQ(pricing->input_per_1m, 3.0);
    EXPECT_DOUBLE_EQ(pricing->output_per_1m, 15.0);
    EXPECT_EQ(pricing->max_tokens, 200000u);
    ASSERT_TRUE(pricing->cache_write_per_1m.has_value());
    EXPECT_DOUBLE_EQ(pricing->cache_write_per_1m.value(), 3.75);
}

TEST(ModelPricingTest, DatedNameUsesLongestPrefix) {
    auto mini = find_model_pricing("gpt-4o-mini-2024-07-18");
    ASSERT_TRUE(mini.has_value());
    EXPECT_DOUBLE_EQ(mini->input_per_1m, 0.15);

    auto gpt4 = find_model_pricing("gpt-4-0613");
    ASSERT_TRUE(gpt4.has_value());
    EXPECT_EQ(gpt4->max_tokens, 8192u);
}

TEST(ModelPricingTest, UnknownModelFallsBackToDefault) {
    EXPECT_FALSE(find_model_pricing("llama-local").has_value());

    const auto pricing = pricing_or_default("llama-local");
    const auto fallback = default_pricing();
    EXPECT_DOUBLE_EQ(pricing.input_per_1m, fallback.input_per_1m);
    EXPECT_EQ(pricing.max_tokens, fallback.max_tokens);
    EXPECT_FALSE(pricing.cache_read_per_1m.has_value());
}

TEST(ModelPricingTest, CostIsPerMillionTokens) {
    EXPECT_DOUBLE_EQ(cost_for_tokens(1'000'000, 2.5), 2.5);
    EXPECT_DOUBLE_EQ(cost_for_tokens(500, 3.0), 0.0015);
    EXPECT_DOUBLE_EQ(cost_for_tokens(0, 60.0), 0.0);
}

}  // namespace
