#pragma once

#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "protocol/stream_event.hpp"

namespace streamcore::protocol {

// Distinguishes runaway behaviour from protocol faults so callers can decide
// whether a retry makes sense.
enum class ErrorKind {
    Stream,     // top-level error reported by the transport
    Protocol,   // malformed tool input or event for a tool in the wrong state
    DoomLoop    // repeated identical tool invocations
};

struct Continue {};

struct ToolCallRequired {
    std::string id;
    std::string name;
    nlohmann::json input;
};

struct Finished {
    FinishReason reason;
};

struct Cancelled {};

struct ProcessError {
    ErrorKind kind;
    std::string message;
};

using ProcessResult =
    std::variant<Continue, ToolCallRequired, Finished, Cancelled, ProcessError>;

inline std::string to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Stream:
            return "stream";
        case ErrorKind::Protocol:
            return "protocol";
        case ErrorKind::DoomLoop:
            return "doom-loop";
        default:
            return "unknown";
    }
}

}  // namespace streamcore::protocol
