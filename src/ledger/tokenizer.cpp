#include "ledger/tokenizer.hpp"

#include <cmath>
#include <utility>

namespace streamcore::ledger {

ApproximateTokenizer::ApproximateTokenizer(std::string encoding_name,
                                           const double chars_per_token)
    : encoding_name_(std::move(encoding_name)),
      chars_per_token_(chars_per_token > 0.0 ? chars_per_token : 4.0) {}

std::size_t ApproximateTokenizer::count_tokens(const std::string& text) const {
    const std::size_t characters = count_characters(text);
    if (characters == 0) {
        return 0;
    }
    return static_cast<std::size_t>(
        std::ceil(static_cast<double>(characters) / chars_per_token_));
}

std::string ApproximateTokenizer::encoding_name() const {
    return encoding_name_;
}

std::size_t count_characters(const std::string& text) {
    std::size_t count = 0;
    for (const char c : text) {
        // Skip UTF-8 continuation bytes (10xxxxxx).
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::shared_ptr<const Tokenizer> make_tokenizer_for_model(const std::string& model) {
    auto starts_with = [&model](const char* prefix) {
        return model.rfind(prefix, 0) == 0;
    };

    if (starts_with("gpt-4o") || starts_with("o1") || starts_with("o3")) {
        return std::make_shared<ApproximateTokenizer>("o200k_base", 4.0);
    }
    if (starts_with("claude")) {
        return std::make_shared<ApproximateTokenizer>("claude", 3.5);
    }
    return std::make_shared<ApproximateTokenizer>("cl100k_base", 4.0);
}

TokenizerCache::TokenizerCache(Factory factory) : factory_(std::move(factory)) {}

std::shared_ptr<const Tokenizer> TokenizerCache::get_or_create(const std::string& model) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokenizers_.find(model);
    if (it != tokenizers_.end()) {
        return it->second;
    }

    auto tokenizer = factory_(model);
    if (!tokenizer) {
        tokenizer = make_tokenizer_for_model(model);
    }
    tokenizers_.emplace(model, tokenizer);
    return tokenizer;
}

std::size_t TokenizerCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokenizers_.size();
}

}  // namespace streamcore::ledger
