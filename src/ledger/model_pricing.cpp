#include "ledger/model_pricing.hpp"

#include <array>
#include <cstring>

namespace streamcore::ledger {

namespace {

struct PricingEntry {
    const char* model;
    ModelPricing pricing;
};

const std::array<PricingEntry, 10>& pricing_table() {
    static const std::array<PricingEntry, 10> table = {{
        {"gpt-4o-mini", {0.15, 0.60, 0.075, std::nullopt, 128000, 16384}},
        {"gpt-4o", {2.50, 10.00, 1.25, std::nullopt, 128000, 16384}},
        {"gpt-4-turbo", {10.00, 30.00, std::nullopt, std::nullopt, 128000, 4096}},
        {"gpt-4", {30.00, 60.00, std::nullopt, std::nullopt, 8192, 8192}},
        {"gpt-3.5-turbo", {0.50, 1.50, std::nullopt, std::nullopt, 16385, 4096}},
        {"o1", {15.00, 60.00, 7.50, std::nullopt, 200000, 100000}},
        {"claude-3-5-sonnet", {3.00, 15.00, 0.30, 3.75, 200000, 8192}},
        {"claude-3-5-haiku", {0.80, 4.00, 0.08, 1.00, 200000, 8192}},
        {"claude-3-opus", {15.00, 75.00, 1.50, 18.75, 200000, 4096}},
        {"claude-3-haiku", {0.25, 1.25, 0.03, 0.30, 200000, 4096}},
    }};
    return table;
}

}  // namespace

ModelPricing default_pricing() {
    return ModelPricing{3.00, 15.00, std::nullopt, std::nullopt, 128000, std::nullopt};
}

std::optional<ModelPricing> find_model_pricing(const std::string& model) {
    const PricingEntry* best = nullptr;
    std::size_t best_length = 0;
    for (const auto& entry : pricing_table()) {
        const std::size_t length = std::strlen(entry.model);
        if (model == entry.model) {
            return entry.pricing;
        }
        if (model.size() > length && model.compare(0, length, entry.model) == 0 &&
            length > best_length) {
            best = &entry;
            best_length = length;
        }
    }
    if (best == nullptr) {
        return std::nullopt;
    }
    return best->pricing;
}

ModelPricing pricing_or_default(const std::string& model) {
    auto pricing = find_model_pricing(model);
    return pricing.has_value() ? pricing.value() : default_pricing();
}

double cost_for_tokens(const std::uint64_t tokens, const double rate_per_1m) {
    return static_cast<double>(tokens) / 1'000'000.0 * rate_per_1m;
}

}  // namespace streamcore::ledger
