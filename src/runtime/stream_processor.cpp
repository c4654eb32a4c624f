#include "runtime/stream_processor.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace streamcore::runtime {

using protocol::Cancelled;
using protocol::Continue;
using protocol::ErrorKind;
using protocol::Finished;
using protocol::ProcessError;
using protocol::ProcessResult;
using protocol::ToolCallRequired;
using protocol::ToolClock;
using protocol::ToolCompleted;
using protocol::ToolErrored;
using protocol::ToolPending;
using protocol::ToolRunning;
using protocol::ToolState;

namespace {

std::chrono::milliseconds elapsed_since(const ToolClock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ToolClock::now() - start);
}

}  // namespace

StreamProcessor::StreamProcessor(std::string session_id, std::string message_id,
                                 std::shared_ptr<std::atomic_bool> cancel_token,
                                 const std::uint32_t max_retries)
    : session_id_(std::move(session_id)),
      message_id_(std::move(message_id)),
      cancel_token_(std::move(cancel_token)),
      retry_(max_retries) {}

ProcessResult StreamProcessor::process_event(const protocol::StreamEvent& event) {
    if (is_cancelled()) {
        return Cancelled{};
    }
    return std::visit([this](const auto& e) { return handle(e); }, event);
}

bool StreamProcessor::is_cancelled() const {
    return cancel_token_ && cancel_token_->load();
}

ProcessResult StreamProcessor::handle(const protocol::StartEvent&) {
    return Continue{};
}

// Text and reasoning payloads are rendered by the caller and not retained.
ProcessResult StreamProcessor::handle(const protocol::TextDeltaEvent&) {
    return Continue{};
}

ProcessResult StreamProcessor::handle(const protocol::ReasoningStartEvent&) {
    return Continue{};
}

ProcessResult StreamProcessor::handle(const protocol::ReasoningDeltaEvent&) {
    return Continue{};
}

ProcessResult StreamProcessor::handle(const protocol::ReasoningEndEvent&) {
    return Continue{};
}

ProcessResult StreamProcessor::handle(const protocol::ToolCallStartEvent& event) {
    auto it = tool_states_.find(event.id);
    if (it != tool_states_.end() && !protocol::is_terminal(it->second)) {
        STREAMCORE_LOG_WARN("StreamProcessor: tool " + event.id +
                            " reused while " + protocol::state_name(it->second));
        return protocol_error("Tool call " + event.id + " is already " +
                              protocol::state_name(it->second));
    }

    tool_states_[event.id] = ToolPending{nlohmann::json()};
    tool_names_[event.id] = event.name;
    STREAMCORE_LOG_DEBUG("StreamProcessor: tool " + event.id + " (" + event.name +
                         ") -> pending");
    return Continue{};
}

ProcessResult StreamProcessor::handle(const protocol::ToolCallInputEvent& event) {
    nlohmann::json input = nlohmann::json::parse(event.input, nullptr, false);
    if (input.is_discarded()) {
        return protocol_error("Failed to parse tool input for " + event.id +
                              ": not valid JSON");
    }

    auto it = tool_states_.find(event.id);
    if (it == tool_states_.end() || !std::holds_alternative<ToolPending>(it->second)) {
        return protocol_error("Tool call " + event.id + " not initialized");
    }

    const std::string& name = tool_names_[event.id];
    it->second = ToolRunning{input, ToolClock::now()};
    STREAMCORE_LOG_DEBUG("StreamProcessor: tool " + event.id + " -> running");

    loop_guard_.record_tool_call(name, input);
    if (loop_guard_.is_doom_loop(name, input)) {
        const std::string message =
            "Doom loop detected: " + std::to_string(policy::LoopGuard::kThreshold) +
            " consecutive identical calls to " + name;
        // Never dispatched, so it must not linger as Running.
        it->second = ToolErrored{input, message, std::chrono::milliseconds{0}};
        STREAMCORE_LOG_WARN("StreamProcessor: " + message);
        return ProcessError{ErrorKind::DoomLoop, message};
    }

    return ToolCallRequired{event.id, name, std::move(input)};
}

ProcessResult StreamProcessor::handle(const protocol::ToolResultEvent& event) {
    return finish_tool(event.id, event.output, std::nullopt);
}

ProcessResult StreamProcessor::handle(const protocol::ToolErrorEvent& event) {
    return finish_tool(event.id, std::nullopt, event.error);
}

ProcessResult StreamProcessor::handle(const protocol::FinishEvent& event) {
    return Finished{event.reason};
}

ProcessResult StreamProcessor::handle(const protocol::ErrorEvent& event) {
    return ProcessError{ErrorKind::Stream, event.error};
}

ProcessResult StreamProcessor::finish_tool(const std::string& id,
                                           const std::optional<std::string>& output,
                                           const std::optional<std::string>& error) {
    auto it = tool_states_.find(id);
    if (it == tool_states_.end()) {
        return protocol_error("Tool " + id + " not in running state (unknown id)");
    }
    const auto* running = std::get_if<ToolRunning>(&it->second);
    if (running == nullptr) {
        return protocol_error("Tool " + id + " not in running state (" +
                              protocol::state_name(it->second) + ")");
    }

    const auto duration = elapsed_since(running->start_time);
    nlohmann::json input = running->input;
    if (error.has_value()) {
        it->second = ToolErrored{std::move(input), error.value(), duration};
    } else {
        it->second = ToolCompleted{std::move(input), output.value_or(""), duration};
    }
    STREAMCORE_LOG_DEBUG("StreamProcessor: tool " + id + " -> " +
                         protocol::state_name(it->second) + " after " +
                         std::to_string(duration.count()) + "ms");
    return Continue{};
}

ProcessResult StreamProcessor::protocol_error(const std::string& message) {
    STREAMCORE_LOG_WARN("StreamProcessor: " + message);
    return ProcessError{ErrorKind::Protocol, message};
}

std::optional<ToolState> StreamProcessor::tool_state(const std::string& id) const {
    auto it = tool_states_.find(id);
    if (it == tool_states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void StreamProcessor::record_tokens(const std::uint64_t input, const std::uint64_t output) {
    tokens_.input += input;
    tokens_.output += output;
}

void StreamProcessor::set_snapshot(std::string snapshot_id) {
    snapshot_id_ = std::move(snapshot_id);
}

void StreamProcessor::increment_retry() {
    retry_.increment_retry();
    STREAMCORE_LOG_INFO("StreamProcessor: retry " + std::to_string(retry_.retry_count()) +
                        "/" + std::to_string(retry_.max_retries()) + " for message " +
                        message_id_);
}

void StreamProcessor::reset_for_retry() {
    tool_states_.clear();
    tool_names_.clear();
    loop_guard_.clear();
}

}  // namespace streamcore::runtime
