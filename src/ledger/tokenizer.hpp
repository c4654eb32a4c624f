#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace streamcore::ledger {

class Tokenizer {
public:
    virtual ~Tokenizer() = default;

    virtual std::size_t count_tokens(const std::string& text) const = 0;
    virtual std::string encoding_name() const = 0;
};

// Approximates a BPE encoding by its average characters per token.
// Characters are counted as UTF-8 code points.
class ApproximateTokenizer : public Tokenizer {
public:
    ApproximateTokenizer(std::string encoding_name, double chars_per_token);

    std::size_t count_tokens(const std::string& text) const override;
    std::string encoding_name() const override;

private:
    std::string encoding_name_;
    double chars_per_token_;
};

std::size_t count_characters(const std::string& text);

// Picks the encoding family for a model name; unknown models get cl100k_base.
std::shared_ptr<const Tokenizer> make_tokenizer_for_model(const std::string& model);

// Model -> tokenizer map shared between sessions. Each entry is built once on
// first use and never evicted.
class TokenizerCache {
public:
    using Factory =
        std::function<std::shared_ptr<const Tokenizer>(const std::string& model)>;

    explicit TokenizerCache(Factory factory = make_tokenizer_for_model);

    std::shared_ptr<const Tokenizer> get_or_create(const std::string& model);
    std::size_t size() const;

private:
    Factory factory_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const Tokenizer>> tokenizers_;
};

}  // namespace streamcore::ledger
