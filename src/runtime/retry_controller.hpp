#pragma once

#include <chrono>
#include <cstdint>

namespace streamcore::runtime {

// Bounded retry counter with exponential backoff: 100ms * 2^retry_count.
class RetryController {
public:
    static constexpr std::uint32_t kDefaultMaxRetries = 3;
    static constexpr std::chrono::milliseconds kBaseDelay{100};

    explicit RetryController(std::uint32_t max_retries = kDefaultMaxRetries);

    bool can_retry() const;
    void increment_retry();
    std::chrono::milliseconds backoff_delay() const;

    std::uint32_t retry_count() const { return retry_count_; }
    std::uint32_t max_retries() const { return max_retries_; }

private:
    std::uint32_t retry_count_ = 0;
    std::uint32_t max_retries_;
};

}  // namespace streamcore::runtime
