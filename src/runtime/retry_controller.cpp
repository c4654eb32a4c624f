#include "runtime/retry_controller.hpp"

#include <algorithm>

namespace streamcore::runtime {

namespace {

// 100ms * 2^20 is already ~29 hours; larger shifts would overflow.
constexpr std::uint32_t kMaxBackoffExponent = 20;

}  // namespace

RetryController::RetryController(const std::uint32_t max_retries)
    : max_retries_(max_retries) {}

bool RetryController::can_retry() const {
    return retry_count_ < max_retries_;
}

void RetryController::increment_retry() {
    ++retry_count_;
}

std::chrono::milliseconds RetryController::backoff_delay() const {
    const std::uint32_t exponent = std::min(retry_count_, kMaxBackoffExponent);
    return kBaseDelay * (std::int64_t{1} << exponent);
}

}  // namespace streamcore::runtime
