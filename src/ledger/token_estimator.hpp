#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include "ledger/tokenizer.hpp"
#include "ledger/token_usage_tracker.hpp"

namespace streamcore::ledger {

struct TokenEstimate {
    std::size_t tokens = 0;
    std::string model;
    std::size_t characters = 0;
    double estimated_cost = 0.0;
};

class TokenEstimator {
public:
    // The cache may be shared with other estimators (one per session).
    explicit TokenEstimator(std::shared_ptr<TokenizerCache> cache =
                                std::make_shared<TokenizerCache>());

    // Cost is priced at the model's input rate.
    TokenEstimate estimate_tokens(const std::string& text,
                                  const std::optional<std::string>& model = std::nullopt) const;

    TokenUsageTracker create_usage_tracker(const std::string& model) const;

    const std::shared_ptr<TokenizerCache>& cache() const { return cache_; }

private:
    std::shared_ptr<TokenizerCache> cache_;
};

}  // namespace streamcore::ledger
