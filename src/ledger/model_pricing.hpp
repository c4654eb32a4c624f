#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace streamcore::ledger {

// All rates are USD per one million tokens and non-negative.
struct ModelPricing {
    double input_per_1m = 0.0;
    double output_per_1m = 0.0;
    std::optional<double> cache_read_per_1m;
    std::optional<double> cache_write_per_1m;
    std::uint64_t max_tokens = 0;
    std::optional<std::uint64_t> max_output_tokens;
};

inline constexpr const char* kDefaultModel = "default";

// Exact match first, then the longest known prefix, so dated names such as
// "claude-3-5-sonnet-20241022" resolve to their family entry.
std::optional<ModelPricing> find_model_pricing(const std::string& model);

// Never fails: unknown models get the default entry.
ModelPricing pricing_or_default(const std::string& model);

ModelPricing default_pricing();

double cost_for_tokens(std::uint64_t tokens, double rate_per_1m);

}  // namespace streamcore::ledger
