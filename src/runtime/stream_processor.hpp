#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include "policy/loop_guard.hpp"
#include "protocol/process_result.hpp"
#include "protocol/stream_event.hpp"
#include "protocol/tool_state.hpp"
#include "runtime/retry_controller.hpp"

namespace streamcore::runtime {

struct TokenCounts {
    std::uint64_t input = 0;
    std::uint64_t output = 0;
};

// Turns model stream events into verdicts for the session loop and owns the
// per-tool-call state machine. Single owner: callers must serialize access.
// The cancellation flag may be set from any thread; it is polled once at the
// top of process_event, never mid-transition.
class StreamProcessor {
public:
    StreamProcessor(std::string session_id, std::string message_id,
                    std::shared_ptr<std::atomic_bool> cancel_token = nullptr,
                    std::uint32_t max_retries = RetryController::kDefaultMaxRetries);

    protocol::ProcessResult process_event(const protocol::StreamEvent& event);

    bool is_cancelled() const;
    const std::string& session_id() const { return session_id_; }
    const std::string& message_id() const { return message_id_; }

    std::optional<protocol::ToolState> tool_state(const std::string& id) const;
    const std::unordered_map<std::string, protocol::ToolState>& tool_states() const {
        return tool_states_;
    }
    const policy::LoopGuard& loop_guard() const { return loop_guard_; }

    // Token counts arrive from the transport separately from events.
    void record_tokens(std::uint64_t input, std::uint64_t output);
    TokenCounts token_usage() const { return tokens_; }

    // Opaque handle for the rollback collaborator; not interpreted here.
    void set_snapshot(std::string snapshot_id);
    const std::optional<std::string>& snapshot_id() const { return snapshot_id_; }

    bool can_retry() const { return retry_.can_retry(); }
    void increment_retry();
    std::uint32_t retry_count() const { return retry_.retry_count(); }
    std::chrono::milliseconds backoff_delay() const { return retry_.backoff_delay(); }

    // Clears tool states and loop history. Token counts and the snapshot
    // handle survive so cost accounting and rollback stay correct.
    void reset_for_retry();

private:
    protocol::ProcessResult handle(const protocol::StartEvent& event);
    protocol::ProcessResult handle(const protocol::TextDeltaEvent& event);
    protocol::ProcessResult handle(const protocol::ReasoningStartEvent& event);
    protocol::ProcessResult handle(const protocol::ReasoningDeltaEvent& event);
    protocol::ProcessResult handle(const protocol::ReasoningEndEvent& event);
    protocol::ProcessResult handle(const protocol::ToolCallStartEvent& event);
    protocol::ProcessResult handle(const protocol::ToolCallInputEvent& event);
    protocol::ProcessResult handle(const protocol::ToolResultEvent& event);
    protocol::ProcessResult handle(const protocol::ToolErrorEvent& event);
    protocol::ProcessResult handle(const protocol::FinishEvent& event);
    protocol::ProcessResult handle(const protocol::ErrorEvent& event);

    // Shared by ToolResult and ToolError: Running -> terminal.
    protocol::ProcessResult finish_tool(const std::string& id,
                                        const std::optional<std::string>& output,
                                        const std::optional<std::string>& error);

    static protocol::ProcessResult protocol_error(const std::string& message);

    std::string session_id_;
    std::string message_id_;
    std::shared_ptr<std::atomic_bool> cancel_token_;

    std::unordered_map<std::string, protocol::ToolState> tool_states_;
    std::unordered_map<std::string, std::string> tool_names_;
    policy::LoopGuard loop_guard_;
    RetryController retry_;

    TokenCounts tokens_;
    std::optional<std::string> snapshot_id_;
};

}  // namespace streamcore::runtime
