#include "ledger/token_usage_tracker.hpp"

#include <utility>

namespace streamcore::ledger {

std::string to_string(const LimitStatus status) {
    switch (status) {
        case LimitStatus::Normal:
            return "normal";
        case LimitStatus::Warning:
            return "warning";
        case LimitStatus::Critical:
            return "critical";
        default:
            return "unknown";
    }
}

TokenUsageTracker::TokenUsageTracker(std::string model, ModelPricing pricing)
    : model_(std::move(model)),
      pricing_(std::move(pricing)),
      token_limit_(pricing_.max_tokens) {}

void TokenUsageTracker::record_prompt(const std::uint64_t tokens) {
    prompt_tokens_ += tokens;
    total_tokens_ += tokens;
    estimated_cost_ += cost_for_tokens(tokens, pricing_.input_per_1m);
}

void TokenUsageTracker::record_completion(const std::uint64_t tokens) {
    completion_tokens_ += tokens;
    total_tokens_ += tokens;
    estimated_cost_ += cost_for_tokens(tokens, pricing_.output_per_1m);
}

void TokenUsageTracker::record_reasoning(const std::uint64_t tokens) {
    reasoning_tokens_ += tokens;
    record_completion(tokens);
}

void TokenUsageTracker::record_cache_read(const std::uint64_t tokens) {
    cache_read_tokens_ += tokens;
    estimated_cost_ += cost_for_tokens(tokens, pricing_.cache_read_per_1m.value_or(0.0));
}

void TokenUsageTracker::record_cache_write(const std::uint64_t tokens) {
    cache_write_tokens_ += tokens;
    estimated_cost_ += cost_for_tokens(tokens, pricing_.cache_write_per_1m.value_or(0.0));
}

double TokenUsageTracker::usage_percentage() const {
    if (token_limit_ == 0) {
        return 0.0;
    }
    return static_cast<double>(total_tokens_) * 100.0 / static_cast<double>(token_limit_);
}

LimitStatus TokenUsageTracker::limit_status() const {
    const double percentage = usage_percentage();
    if (percentage >= 90.0) {
        return LimitStatus::Critical;
    }
    if (percentage >= 75.0) {
        return LimitStatus::Warning;
    }
    return LimitStatus::Normal;
}

void TokenUsageTracker::reset() {
    total_tokens_ = 0;
    prompt_tokens_ = 0;
    completion_tokens_ = 0;
    reasoning_tokens_ = 0;
    cache_read_tokens_ = 0;
    cache_write_tokens_ = 0;
    estimated_cost_ = 0.0;
}

}  // namespace streamcore::ledger
