#include "protocol/stream_codec.hpp"

#include <chrono>
#include <type_traits>

namespace streamcore::protocol {

using core::errors::CoreError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

template <class T>
inline constexpr bool kAlwaysFalse = false;

core::errors::Result<std::string> require_string(const json& payload,
                                                 const std::string& type,
                                                 const char* field) {
    const auto it = payload.find(field);
    if (it == payload.end() || !it->is_string()) {
        return CoreError{ErrorCategory::Protocol,
                         "Event '" + type + "' requires string field '" +
                             field + "'.",
                         "invalid_event_field"};
    }
    return it->get<std::string>();
}

}  // namespace

core::errors::Result<FinishReason> parse_finish_reason(const std::string& text) {
    if (text == "stop") {
        return FinishReason::Stop;
    }
    if (text == "length") {
        return FinishReason::Length;
    }
    if (text == "tool-call") {
        return FinishReason::ToolCall;
    }
    if (text == "content-filter") {
        return FinishReason::ContentFilter;
    }
    return CoreError{ErrorCategory::Protocol, "Unknown finish reason: " + text,
                     "invalid_finish_reason",
                     "Expected stop, length, tool-call or content-filter."};
}

core::errors::Result<StreamEvent> decode_stream_event(const json& payload) {
    if (!payload.is_object()) {
        return CoreError{ErrorCategory::Protocol, "Event must be a JSON object.",
                         "invalid_event"};
    }
    const auto type_it = payload.find("type");
    if (type_it == payload.end() || !type_it->is_string()) {
        return CoreError{ErrorCategory::Protocol,
                         "Event is missing string field 'type'.",
                         "invalid_event"};
    }
    const std::string type = type_it->get<std::string>();

    if (type == "start") {
        return StartEvent{};
    }
    if (type == "reasoning-start") {
        return ReasoningStartEvent{};
    }
    if (type == "reasoning-end") {
        return ReasoningEndEvent{};
    }
    if (type == "text-delta" || type == "reasoning-delta") {
        auto text = require_string(payload, type, "text");
        if (core::errors::is_error(text)) {
            return core::errors::get_error(text);
        }
        if (type == "text-delta") {
            return TextDeltaEvent{core::errors::get_value(text)};
        }
        return ReasoningDeltaEvent{core::errors::get_value(text)};
    }
    if (type == "error") {
        auto error = require_string(payload, type, "error");
        if (core::errors::is_error(error)) {
            return core::errors::get_error(error);
        }
        return ErrorEvent{core::errors::get_value(error)};
    }
    if (type == "finish") {
        auto reason_text = require_string(payload, type, "reason");
        if (core::errors::is_error(reason_text)) {
            return core::errors::get_error(reason_text);
        }
        auto reason = parse_finish_reason(core::errors::get_value(reason_text));
        if (core::errors::is_error(reason)) {
            return core::errors::get_error(reason);
        }
        return FinishEvent{core::errors::get_value(reason)};
    }

    // Everything below is keyed by a tool call id.
    const char* second_field = nullptr;
    if (type == "tool-call-start") {
        second_field = "name";
    } else if (type == "tool-call-input") {
        second_field = "input";
    } else if (type == "tool-result") {
        second_field = "output";
    } else if (type == "tool-error") {
        second_field = "error";
    } else {
        return CoreError{ErrorCategory::Protocol, "Unknown event type: " + type,
                         "unknown_event_type"};
    }

    auto id = require_string(payload, type, "id");
    if (core::errors::is_error(id)) {
        return core::errors::get_error(id);
    }
    auto second = require_string(payload, type, second_field);
    if (core::errors::is_error(second)) {
        return core::errors::get_error(second);
    }
    const std::string& id_value = core::errors::get_value(id);
    const std::string& second_value = core::errors::get_value(second);

    if (type == "tool-call-start") {
        return ToolCallStartEvent{id_value, second_value};
    }
    if (type == "tool-call-input") {
        return ToolCallInputEvent{id_value, second_value};
    }
    if (type == "tool-result") {
        return ToolResultEvent{id_value, second_value};
    }
    return ToolErrorEvent{id_value, second_value};
}

core::errors::Result<StreamEvent> decode_stream_event(const std::string& line) {
    const json payload = json::parse(line, nullptr, false);
    if (payload.is_discarded()) {
        return CoreError{ErrorCategory::Protocol, "Event line is not valid JSON.",
                         "invalid_event_json"};
    }
    return decode_stream_event(payload);
}

json encode_stream_event(const StreamEvent& event) {
    return std::visit(
        [](const auto& e) -> json {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, StartEvent>) {
                return {{"type", "start"}};
            } else if constexpr (std::is_same_v<T, TextDeltaEvent>) {
                return {{"type", "text-delta"}, {"text", e.text}};
            } else if constexpr (std::is_same_v<T, ReasoningStartEvent>) {
                return {{"type", "reasoning-start"}};
            } else if constexpr (std::is_same_v<T, ReasoningDeltaEvent>) {
                return {{"type", "reasoning-delta"}, {"text", e.text}};
            } else if constexpr (std::is_same_v<T, ReasoningEndEvent>) {
                return {{"type", "reasoning-end"}};
            } else if constexpr (std::is_same_v<T, ToolCallStartEvent>) {
                return {{"type", "tool-call-start"}, {"id", e.id}, {"name", e.name}};
            } else if constexpr (std::is_same_v<T, ToolCallInputEvent>) {
                return {{"type", "tool-call-input"}, {"id", e.id}, {"input", e.input}};
            } else if constexpr (std::is_same_v<T, ToolResultEvent>) {
                return {{"type", "tool-result"}, {"id", e.id}, {"output", e.output}};
            } else if constexpr (std::is_same_v<T, ToolErrorEvent>) {
                return {{"type", "tool-error"}, {"id", e.id}, {"error", e.error}};
            } else if constexpr (std::is_same_v<T, FinishEvent>) {
                return {{"type", "finish"}, {"reason", to_string(e.reason)}};
            } else if constexpr (std::is_same_v<T, ErrorEvent>) {
                return {{"type", "error"}, {"error", e.error}};
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled stream event");
            }
        },
        event);
}

json encode_process_result(const ProcessResult& result) {
    return std::visit(
        [](const auto& r) -> json {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, Continue>) {
                return {{"type", "continue"}};
            } else if constexpr (std::is_same_v<T, ToolCallRequired>) {
                return {{"type", "tool-call-required"},
                        {"id", r.id},
                        {"name", r.name},
                        {"input", r.input}};
            } else if constexpr (std::is_same_v<T, Finished>) {
                return {{"type", "finished"}, {"reason", to_string(r.reason)}};
            } else if constexpr (std::is_same_v<T, Cancelled>) {
                return {{"type", "cancelled"}};
            } else if constexpr (std::is_same_v<T, ProcessError>) {
                return {{"type", "error"},
                        {"kind", to_string(r.kind)},
                        {"error", r.message}};
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled process result");
            }
        },
        result);
}

json encode_tool_state(const ToolState& state) {
    return std::visit(
        [](const auto& s) -> json {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, ToolPending>) {
                return {{"state", "pending"}, {"input", s.input}};
            } else if constexpr (std::is_same_v<T, ToolRunning>) {
                const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    ToolClock::now() - s.start_time);
                return {{"state", "running"},
                        {"input", s.input},
                        {"elapsed_ms", elapsed.count()}};
            } else if constexpr (std::is_same_v<T, ToolCompleted>) {
                return {{"state", "completed"},
                        {"input", s.input},
                        {"output", s.output},
                        {"duration_ms", s.duration.count()}};
            } else if constexpr (std::is_same_v<T, ToolErrored>) {
                return {{"state", "error"},
                        {"input", s.input},
                        {"error", s.error},
                        {"duration_ms", s.duration.count()}};
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled tool state");
            }
        },
        state);
}

}  // namespace streamcore::protocol
