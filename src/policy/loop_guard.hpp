#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <string>
#include <nlohmann/json.hpp>

namespace streamcore::policy {

struct ToolCallRecord {
    std::string tool;
    nlohmann::json input;
    std::chrono::steady_clock::time_point timestamp;
};

// Flags a model that keeps issuing the same tool call. Matching uses
// structural equality of the parsed input, so a trivially perturbed input
// is a different call.
class LoopGuard {
public:
    static constexpr std::size_t kWindow = 10;
    static constexpr std::size_t kThreshold = 3;

    void record_tool_call(const std::string& tool, const nlohmann::json& input);

    // True iff the kThreshold most recent records all equal (tool, input).
    bool is_doom_loop(const std::string& tool, const nlohmann::json& input) const;

    void clear();

    const std::deque<ToolCallRecord>& history() const { return history_; }

private:
    std::deque<ToolCallRecord> history_;
};

}  // namespace streamcore::policy
