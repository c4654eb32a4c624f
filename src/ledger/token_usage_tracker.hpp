#pragma once

#include <cstdint>
#include <string>
#include "ledger/model_pricing.hpp"

namespace streamcore::ledger {

enum class LimitStatus {
    Normal,    // below 75%
    Warning,   // 75% up to 90%
    Critical   // 90% and above
};

std::string to_string(LimitStatus status);

// Per-session usage ledger. total_tokens == prompt_tokens + completion_tokens
// after every call; reasoning counts as completion, cache traffic is billed
// but kept out of the total.
class TokenUsageTracker {
public:
    TokenUsageTracker(std::string model, ModelPricing pricing);

    void record_prompt(std::uint64_t tokens);
    void record_completion(std::uint64_t tokens);
    void record_cache_read(std::uint64_t tokens);
    void record_cache_write(std::uint64_t tokens);
    void record_reasoning(std::uint64_t tokens);

    double usage_percentage() const;
    LimitStatus limit_status() const;
    void reset();

    const std::string& model() const { return model_; }
    const ModelPricing& pricing() const { return pricing_; }
    std::uint64_t total_tokens() const { return total_tokens_; }
    std::uint64_t prompt_tokens() const { return prompt_tokens_; }
    std::uint64_t completion_tokens() const { return completion_tokens_; }
    std::uint64_t reasoning_tokens() const { return reasoning_tokens_; }
    std::uint64_t cache_read_tokens() const { return cache_read_tokens_; }
    std::uint64_t cache_write_tokens() const { return cache_write_tokens_; }
    double estimated_cost() const { return estimated_cost_; }
    std::uint64_t token_limit() const { return token_limit_; }

private:
    std::string model_;
    ModelPricing pricing_;
    std::uint64_t total_tokens_ = 0;
    std::uint64_t prompt_tokens_ = 0;
    std::uint64_t completion_tokens_ = 0;
    std::uint64_t reasoning_tokens_ = 0;
    std::uint64_t cache_read_tokens_ = 0;
    std::uint64_t cache_write_tokens_ = 0;
    double estimated_cost_ = 0.0;
    std::uint64_t token_limit_ = 0;
};

}  // namespace streamcore::ledger
