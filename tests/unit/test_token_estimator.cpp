#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "ledger/model_pricing.hpp"
#include "ledger/token_estimator.hpp"
#include "ledger/tokenizer.hpp"

namespace {

using streamcore::ledger::ApproximateTokenizer;
using streamcore::ledger::count_characters;
using streamcore::ledger::TokenEstimator;
using streamcore::ledger::Tokenizer;
using streamcore::ledger::TokenizerCache;

// Counts one token per whitespace-separated word.
class WordTokenizer : public Tokenizer {
public:
    std::size_t count_tokens(const std::string& text) const override {
        std::size_t words = 0;
        bool in_word = false;
        for (const char c : text) {
            const bool space = c == ' ';
            if (!space && !in_word) {
                ++words;
            }
            in_word = !space;
        }
        return words;
    }
    std::string encoding_name() const override { return "words"; }
};

TEST(TokenizerTest, ApproximateTokenizerRoundsUp) {
    ApproximateTokenizer tokenizer("cl100k_base", 4.0);
    EXPECT_EQ(tokenizer.count_tokens(""), 0u);
    EXPECT_EQ(tokenizer.count_tokens("a"), 1u);
    EXPECT_EQ(tokenizer.count_tokens("abcd"), 1u);
    EXPECT_EQ(tokenizer.count_tokens("abcde"), 2u);
}

TEST(TokenizerTest, CountsUtf8CodePoints) {
    EXPECT_EQ(count_characters("h\xC3\xA9llo"), 5u);      // "héllo"
    EXPECT_EQ(count_characters("\xE2\x82\xAC"), 1u);      // euro sign
}

TEST(TokenizerTest, ModelFamiliesPickEncodings) {
    EXPECT_EQ(streamcore::ledger::make_tokenizer_for_model("gpt-4o")->encoding_name(),
              "o200k_base");
    EXPECT_EQ(streamcore::ledger::make_tokenizer_for_model("claude-3-opus")->encoding_name(),
              "claude");
    EXPECT_EQ(streamcore::ledger::make_tokenizer_for_model("mystery")->encoding_name(),
              "cl100k_base");
}

TEST(TokenizerCacheTest, BuildsEachModelOnce) {
    auto builds = std::make_shared<std::atomic<int>>(0);
    TokenizerCache cache([builds](const std::string&) {
        ++*builds;
        return std::make_shared<WordTokenizer>();
    });

    auto first = cache.get_or_create("gpt-4o");
    auto second = cache.get_or_create("gpt-4o");
    cache.get_or_create("claude-3-opus");

    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(builds->load(), 2);
    EXPECT_EQ(cache.size(), 2u);
}

TEST(TokenizerCacheTest, ConcurrentSessionsShareOneTokenizer) {
    auto builds = std::make_shared<std::atomic<int>>(0);
    auto cache = std::make_shared<TokenizerCache>([builds](const std::string&) {
        ++*builds;
        return std::make_shared<WordTokenizer>();
    });

    std::vector<std::thread> workers;
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([cache]() {
            TokenEstimator estimator(cache);
            for (int j = 0; j < 100; ++j) {
                estimator.estimate_tokens("one two three", std::string("gpt-4o"));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(builds->load(), 1);
}

TEST(TokenEstimatorTest, EstimatesWithInjectedTokenizer) {
    auto cache = std::make_shared<TokenizerCache>(
        [](const std::string&) { return std::make_shared<WordTokenizer>(); });
    TokenEstimator estimator(cache);

    const auto estimate = estimator.estimate_tokens("find the bug now", std::string("gpt-4o"));
    EXPECT_EQ(estimate.tokens, 4u);
    EXPECT_EQ(estimate.characters, 16u);
    EXPECT_EQ(estimate.model, "gpt-4o");
    EXPECT_DOUBLE_EQ(estimate.estimated_cost, 4.0 / 1e6 * 2.5);
}

TEST(TokenEstimatorTest, MissingModelUsesDefault) {
    TokenEstimator estimator;
    const auto estimate = estimator.estimate_tokens("abcdefgh");

    EXPECT_EQ(estimate.model, streamcore::ledger::kDefaultModel);
    EXPECT_EQ(estimate.tokens, 2u);
    EXPECT_DOUBLE_EQ(estimate.estimated_cost,
                     2.0 / 1e6 * streamcore::ledger::default_pricing().input_per_1m);
}

TEST(TokenEstimatorTest, CreatesTrackerFromPricing) {
    TokenEstimator estimator;

    const auto known = estimator.create_usage_tracker("claude-3-5-sonnet");
    EXPECT_EQ(known.model(), "claude-3-5-sonnet");
    EXPECT_EQ(known.token_limit(), 200000u);
    EXPECT_EQ(known.total_tokens(), 0u);

    const auto unknown = estimator.create_usage_tracker("llama-local");
    EXPECT_EQ(unknown.token_limit(), streamcore::ledger::default_pricing().max_tokens);
}

}  // namespace
