#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/core_errors.hpp"
#include "protocol/process_result.hpp"
#include "protocol/stream_event.hpp"
#include "protocol/tool_state.hpp"

namespace streamcore::protocol {

// Wire form: one JSON object per event, tagged by a kebab-case "type".
core::errors::Result<StreamEvent> decode_stream_event(const nlohmann::json& payload);
core::errors::Result<StreamEvent> decode_stream_event(const std::string& line);

core::errors::Result<FinishReason> parse_finish_reason(const std::string& text);

nlohmann::json encode_stream_event(const StreamEvent& event);
nlohmann::json encode_process_result(const ProcessResult& result);
nlohmann::json encode_tool_state(const ToolState& state);

}  // namespace streamcore::protocol
