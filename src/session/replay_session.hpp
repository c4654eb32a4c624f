#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/core_config.hpp"
#include "core/errors/core_errors.hpp"
#include "ledger/token_estimator.hpp"
#include "ledger/token_usage_tracker.hpp"
#include "runtime/stream_processor.hpp"

namespace streamcore::session {

enum class SessionStatus {
    Running,
    Finished,
    Failed,
    Cancelled,
    Incomplete   // input ended before a finish event
};

std::string to_string(SessionStatus status);

struct ReplaySummary {
    SessionStatus status = SessionStatus::Running;
    std::size_t events_processed = 0;
    std::uint32_t retries = 0;
    std::optional<std::string> failure_reason;
    runtime::TokenCounts processor_tokens;
    std::uint64_t total_tokens = 0;
    std::uint64_t prompt_tokens = 0;
    std::uint64_t completion_tokens = 0;
    double estimated_cost = 0.0;
    double usage_percentage = 0.0;
    ledger::LimitStatus limit_status = ledger::LimitStatus::Normal;
    bool overflow = false;
};

nlohmann::json encode_summary(const std::string& session_id, const ReplaySummary& summary);

// Token counts carried by a `{"type":"usage"}` line. Absent fields are zero.
struct UsageReport {
    std::uint64_t prompt = 0;
    std::uint64_t completion = 0;
    std::uint64_t reasoning = 0;
    std::uint64_t cache_read = 0;
    std::uint64_t cache_write = 0;
};

core::errors::Result<UsageReport> parse_usage_report(const nlohmann::json& payload);

// Drives one StreamProcessor from a JSONL feed, the way a live session loop
// drives it from the transport: one verdict per event, retry with backoff on
// recoverable errors, stop on finish, cancellation, doom loop or exhaustion.
class ReplaySession {
public:
    ReplaySession(std::string session_id, core::config::CoreConfig config,
                  std::shared_ptr<ledger::TokenizerCache> tokenizer_cache,
                  std::shared_ptr<std::atomic_bool> cancel_token = nullptr,
                  std::optional<std::string> snapshot_id = std::nullopt);

    // Writes one JSON verdict per event line to `out`. Malformed input lines
    // are Protocol errors; stream verdicts never are.
    core::errors::Result<ReplaySummary> run(std::istream& events, std::ostream& out);

    const runtime::StreamProcessor& processor() const { return processor_; }
    const ledger::TokenUsageTracker& tracker() const { return tracker_; }

private:
    void record_usage(const UsageReport& usage);
    void estimate_delta(const protocol::StreamEvent& event);
    // Returns true when the session has reached a terminal status.
    bool apply_verdict(const protocol::ProcessResult& result, std::ostream& out,
                       ReplaySummary& summary);
    void fill_usage(ReplaySummary& summary) const;

    std::string session_id_;
    core::config::CoreConfig config_;
    ledger::TokenEstimator estimator_;
    ledger::TokenUsageTracker tracker_;
    runtime::StreamProcessor processor_;
    bool explicit_usage_ = false;
};

}  // namespace streamcore::session
