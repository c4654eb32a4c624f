#pragma once

#include <chrono>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace streamcore::protocol {

using ToolClock = std::chrono::steady_clock;

// Call announced, no structured input yet. `input` stays null.
struct ToolPending {
    nlohmann::json input;
};

struct ToolRunning {
    nlohmann::json input;
    ToolClock::time_point start_time;
};

struct ToolCompleted {
    nlohmann::json input;
    std::string output;
    std::chrono::milliseconds duration{0};
};

struct ToolErrored {
    nlohmann::json input;
    std::string error;
    std::chrono::milliseconds duration{0};
};

// Forward-only: Pending -> Running -> {Completed | Errored}
using ToolState = std::variant<ToolPending, ToolRunning, ToolCompleted, ToolErrored>;

inline bool is_terminal(const ToolState& state) {
    return std::holds_alternative<ToolCompleted>(state) ||
           std::holds_alternative<ToolErrored>(state);
}

inline std::string state_name(const ToolState& state) {
    switch (state.index()) {
        case 0:
            return "pending";
        case 1:
            return "running";
        case 2:
            return "completed";
        case 3:
            return "error";
        default:
            return "unknown";
    }
}

}  // namespace streamcore::protocol
