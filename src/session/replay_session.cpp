#include "session/replay_session.hpp"

#include <array>
#include <istream>
#include <ostream>
#include <utility>
#include "core/config/session_id.hpp"
#include "core/logging/logger.hpp"
#include "ledger/overflow.hpp"
#include "protocol/stream_codec.hpp"

namespace streamcore::session {

using core::errors::CoreError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::ErrorKind;
using protocol::ProcessError;

namespace {

bool is_usage_line(const json& payload) {
    if (!payload.is_object()) {
        return false;
    }
    const auto it = payload.find("type");
    return it != payload.end() && it->is_string() && it->get<std::string>() == "usage";
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

CoreError line_error(const std::size_t line_number, const CoreError& cause) {
    CoreError error = cause;
    error.message = "Line " + std::to_string(line_number) + ": " + cause.message;
    return error;
}

}  // namespace

std::string to_string(const SessionStatus status) {
    switch (status) {
        case SessionStatus::Running:
            return "running";
        case SessionStatus::Finished:
            return "finished";
        case SessionStatus::Failed:
            return "failed";
        case SessionStatus::Cancelled:
            return "cancelled";
        case SessionStatus::Incomplete:
            return "incomplete";
        default:
            return "unknown";
    }
}

json encode_summary(const std::string& session_id, const ReplaySummary& summary) {
    json payload;
    payload["type"] = "summary";
    payload["session_id"] = session_id;
    payload["status"] = to_string(summary.status);
    payload["events_processed"] = summary.events_processed;
    payload["retries"] = summary.retries;
    payload["failure_reason"] =
        summary.failure_reason.has_value() ? summary.failure_reason.value() : "";
    payload["processor_tokens"] = {{"input", summary.processor_tokens.input},
                                   {"output", summary.processor_tokens.output}};
    payload["total_tokens"] = summary.total_tokens;
    payload["prompt_tokens"] = summary.prompt_tokens;
    payload["completion_tokens"] = summary.completion_tokens;
    payload["estimated_cost"] = summary.estimated_cost;
    payload["usage_percentage"] = summary.usage_percentage;
    payload["limit_status"] = ledger::to_string(summary.limit_status);
    payload["overflow"] = summary.overflow;
    return payload;
}

core::errors::Result<UsageReport> parse_usage_report(const json& payload) {
    struct UsageField {
        const char* name;
        std::uint64_t UsageReport::*counter;
    };
    static constexpr std::array<UsageField, 5> kFields{{
        {"prompt", &UsageReport::prompt},
        {"completion", &UsageReport::completion},
        {"reasoning", &UsageReport::reasoning},
        {"cache_read", &UsageReport::cache_read},
        {"cache_write", &UsageReport::cache_write},
    }};

    UsageReport usage;
    for (const auto& field : kFields) {
        const auto it = payload.find(field.name);
        if (it == payload.end()) {
            continue;
        }
        const bool non_negative =
            it->is_number_unsigned() ||
            (it->is_number_integer() && it->get<std::int64_t>() >= 0);
        if (!non_negative) {
            return CoreError{ErrorCategory::Protocol,
                             std::string("Usage field '") + field.name +
                                 "' must be a non-negative integer.",
                             "invalid_usage"};
        }
        usage.*field.counter = it->get<std::uint64_t>();
    }
    return usage;
}

ReplaySession::ReplaySession(std::string session_id, core::config::CoreConfig config,
                             std::shared_ptr<ledger::TokenizerCache> tokenizer_cache,
                             std::shared_ptr<std::atomic_bool> cancel_token,
                             std::optional<std::string> snapshot_id)
    : session_id_(std::move(session_id)),
      config_(std::move(config)),
      estimator_(std::move(tokenizer_cache)),
      tracker_(estimator_.create_usage_tracker(config_.model)),
      processor_(session_id_, core::config::generate_message_id(), std::move(cancel_token),
                 config_.max_retries) {
    if (snapshot_id.has_value()) {
        processor_.set_snapshot(std::move(snapshot_id.value()));
    }
}

core::errors::Result<ReplaySummary> ReplaySession::run(std::istream& events,
                                                       std::ostream& out) {
    ReplaySummary summary;
    std::string line;
    std::size_t line_number = 0;

    while (std::getline(events, line)) {
        ++line_number;
        if (is_blank(line)) {
            continue;
        }

        const json payload = json::parse(line, nullptr, false);
        if (payload.is_discarded()) {
            return line_error(line_number, CoreError{ErrorCategory::Protocol,
                                                     "Event line is not valid JSON.",
                                                     "invalid_event_json"});
        }

        if (is_usage_line(payload)) {
            auto usage = parse_usage_report(payload);
            if (core::errors::is_error(usage)) {
                return line_error(line_number, core::errors::get_error(usage));
            }
            record_usage(core::errors::get_value(usage));
            continue;
        }

        auto decoded = protocol::decode_stream_event(payload);
        if (core::errors::is_error(decoded)) {
            return line_error(line_number, core::errors::get_error(decoded));
        }
        const auto& event = core::errors::get_value(decoded);

        const auto result = processor_.process_event(event);
        ++summary.events_processed;
        if (std::holds_alternative<protocol::Continue>(result)) {
            estimate_delta(event);
        }
        if (apply_verdict(result, out, summary)) {
            break;
        }
    }

    if (summary.status == SessionStatus::Running) {
        summary.status = SessionStatus::Incomplete;
        STREAMCORE_LOG_WARN("ReplaySession: input ended before a finish event");
    }
    summary.retries = processor_.retry_count();
    fill_usage(summary);
    return summary;
}

void ReplaySession::record_usage(const UsageReport& usage) {
    explicit_usage_ = true;
    tracker_.record_prompt(usage.prompt);
    tracker_.record_completion(usage.completion);
    tracker_.record_reasoning(usage.reasoning);
    tracker_.record_cache_read(usage.cache_read);
    tracker_.record_cache_write(usage.cache_write);
    processor_.record_tokens(usage.prompt, usage.completion + usage.reasoning);
}

void ReplaySession::estimate_delta(const protocol::StreamEvent& event) {
    // Reported usage supersedes estimates for the rest of the session.
    if (explicit_usage_) {
        return;
    }
    if (const auto* text = std::get_if<protocol::TextDeltaEvent>(&event)) {
        const auto estimate = estimator_.estimate_tokens(text->text, config_.model);
        tracker_.record_completion(estimate.tokens);
        processor_.record_tokens(0, estimate.tokens);
    } else if (const auto* reasoning = std::get_if<protocol::ReasoningDeltaEvent>(&event)) {
        const auto estimate = estimator_.estimate_tokens(reasoning->text, config_.model);
        tracker_.record_reasoning(estimate.tokens);
        processor_.record_tokens(0, estimate.tokens);
    }
}

bool ReplaySession::apply_verdict(const protocol::ProcessResult& result, std::ostream& out,
                                  ReplaySummary& summary) {
    out << protocol::encode_process_result(result).dump() << "\n";

    if (std::holds_alternative<protocol::Finished>(result)) {
        summary.status = SessionStatus::Finished;
        return true;
    }
    if (std::holds_alternative<protocol::Cancelled>(result)) {
        summary.status = SessionStatus::Cancelled;
        STREAMCORE_LOG_INFO("ReplaySession: cancelled");
        return true;
    }

    const auto* error = std::get_if<ProcessError>(&result);
    if (error == nullptr) {
        return false;
    }

    if (error->kind != ErrorKind::DoomLoop && processor_.can_retry()) {
        const auto delay = processor_.backoff_delay();
        processor_.increment_retry();
        processor_.reset_for_retry();
        json retry;
        retry["type"] = "retry";
        retry["attempt"] = processor_.retry_count();
        retry["backoff_ms"] = delay.count();
        out << retry.dump() << "\n";
        return false;
    }

    summary.status = SessionStatus::Failed;
    summary.failure_reason = error->message;
    STREAMCORE_LOG_ERROR("ReplaySession: " + protocol::to_string(error->kind) +
                         " error: " + error->message);
    return true;
}

void ReplaySession::fill_usage(ReplaySummary& summary) const {
    summary.processor_tokens = processor_.token_usage();
    summary.total_tokens = tracker_.total_tokens();
    summary.prompt_tokens = tracker_.prompt_tokens();
    summary.completion_tokens = tracker_.completion_tokens();
    summary.estimated_cost = tracker_.estimated_cost();
    summary.usage_percentage = tracker_.usage_percentage();
    summary.limit_status = tracker_.limit_status();

    const std::uint64_t context_limit =
        config_.context_limit != 0 ? config_.context_limit : tracker_.token_limit();
    const auto output_limit = config_.model_output_limit.has_value()
                                  ? config_.model_output_limit
                                  : tracker_.pricing().max_output_tokens;
    // Reasoning is billed as completion but does not occupy the context window.
    const std::uint64_t visible_output =
        tracker_.completion_tokens() - tracker_.reasoning_tokens();
    summary.overflow = ledger::is_overflow(tracker_.prompt_tokens(), tracker_.cache_read_tokens(),
                                           visible_output, context_limit, output_limit);
}

}  // namespace streamcore::session
