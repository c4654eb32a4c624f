#include "policy/loop_guard.hpp"

namespace streamcore::policy {

void LoopGuard::record_tool_call(const std::string& tool, const nlohmann::json& input) {
    history_.push_back(ToolCallRecord{tool, input, std::chrono::steady_clock::now()});
    while (history_.size() > kWindow) {
        history_.pop_front();
    }
}

bool LoopGuard::is_doom_loop(const std::string& tool, const nlohmann::json& input) const {
    if (history_.size() < kThreshold) {
        return false;
    }

    std::size_t checked = 0;
    for (auto it = history_.rbegin(); it != history_.rend() && checked < kThreshold;
         ++it, ++checked) {
        if (it->tool != tool || it->input != input) {
            return false;
        }
    }
    return true;
}

void LoopGuard::clear() {
    history_.clear();
}

}  // namespace streamcore::policy
