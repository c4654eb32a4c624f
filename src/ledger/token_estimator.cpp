#include "ledger/token_estimator.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace streamcore::ledger {

TokenEstimator::TokenEstimator(std::shared_ptr<TokenizerCache> cache)
    : cache_(cache ? std::move(cache) : std::make_shared<TokenizerCache>()) {}

TokenEstimate TokenEstimator::estimate_tokens(
    const std::string& text, const std::optional<std::string>& model) const {
    const std::string model_name = model.has_value() ? model.value() : kDefaultModel;
    const auto tokenizer = cache_->get_or_create(model_name);
    const ModelPricing pricing = pricing_or_default(model_name);

    TokenEstimate estimate;
    estimate.model = model_name;
    estimate.tokens = tokenizer->count_tokens(text);
    estimate.characters = count_characters(text);
    estimate.estimated_cost = cost_for_tokens(estimate.tokens, pricing.input_per_1m);
    return estimate;
}

TokenUsageTracker TokenEstimator::create_usage_tracker(const std::string& model) const {
    auto pricing = find_model_pricing(model);
    if (!pricing.has_value()) {
        STREAMCORE_LOG_DEBUG("TokenEstimator: no pricing for model '" + model +
                             "', using default");
        return TokenUsageTracker(model, default_pricing());
    }
    return TokenUsageTracker(model, pricing.value());
}

}  // namespace streamcore::ledger
