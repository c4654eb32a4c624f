#pragma once

#include <cstdint>
#include <optional>

namespace streamcore::ledger {

// Output space reserved when deciding whether the context is full.
inline constexpr std::uint64_t kDefaultMaxOutputTokens = 32000;

// Advisory: true when input + cache_read + output exceed the context limit
// minus the reserved output budget. Reasoning and cache-write tokens are not
// counted. A context_limit of 0 means unknown and never overflows.
bool is_overflow(std::uint64_t input_tokens, std::uint64_t cache_read_tokens,
                 std::uint64_t output_tokens, std::uint64_t context_limit,
                 std::optional<std::uint64_t> model_output_limit = std::nullopt);

}  // namespace streamcore::ledger
