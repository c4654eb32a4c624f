#include "ledger/overflow.hpp"

#include <algorithm>

namespace streamcore::ledger {

bool is_overflow(const std::uint64_t input_tokens, const std::uint64_t cache_read_tokens,
                 const std::uint64_t output_tokens, const std::uint64_t context_limit,
                 const std::optional<std::uint64_t> model_output_limit) {
    if (context_limit == 0) {
        return false;
    }

    const std::uint64_t count = input_tokens + cache_read_tokens + output_tokens;
    const std::uint64_t output_budget =
        std::min(model_output_limit.value_or(kDefaultMaxOutputTokens), kDefaultMaxOutputTokens);
    // Usable room would be negative: any count, even zero, exceeds it.
    if (context_limit < output_budget) {
        return true;
    }
    const std::uint64_t usable = context_limit - output_budget;
    return count > usable;
}

}  // namespace streamcore::ledger
