#pragma once
#include <string>
#include <variant>

namespace streamcore::protocol {

    // Why the model stopped generating
    enum class FinishReason {
        Stop,           // Normal completion
        Length,         // Context length limit reached
        ToolCall,       // Stopped to run a tool
        ContentFilter   // Output was filtered
    };

    // One atomic unit from the model stream. `id` is a transport-assigned
    // correlation key, unique only among concurrently open tool calls.
    struct StartEvent {};
    struct TextDeltaEvent { std::string text; };
    struct ReasoningStartEvent {};
    struct ReasoningDeltaEvent { std::string text; };
    struct ReasoningEndEvent {};
    struct ToolCallStartEvent { std::string id; std::string name; };
    struct ToolCallInputEvent { std::string id; std::string input; };  // raw JSON text
    struct ToolResultEvent { std::string id; std::string output; };
    struct ToolErrorEvent { std::string id; std::string error; };
    struct FinishEvent { FinishReason reason; };
    struct ErrorEvent { std::string error; };

    using StreamEvent = std::variant<
        StartEvent,
        TextDeltaEvent,
        ReasoningStartEvent,
        ReasoningDeltaEvent,
        ReasoningEndEvent,
        ToolCallStartEvent,
        ToolCallInputEvent,
        ToolResultEvent,
        ToolErrorEvent,
        FinishEvent,
        ErrorEvent
    >;

    inline std::string to_string(const FinishReason reason) {
        switch (reason) {
            case FinishReason::Stop:
                return "stop";
            case FinishReason::Length:
                return "length";
            case FinishReason::ToolCall:
                return "tool-call";
            case FinishReason::ContentFilter:
                return "content-filter";
            default:
                return "unknown";
        }
    }

} // namespace streamcore::protocol
