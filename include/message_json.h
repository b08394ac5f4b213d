#pragma once

#include "core/types.h"
#include <nlohmann/json.hpp>
#include <vector>

namespace parley {

/**
 * @brief Chat-API message object ({"role", "content", "tool_calls", "tool_call_id"})
 *
 * Tool-call arguments are emitted as JSON objects when they parse, as raw
 * strings otherwise.
 */
nlohmann::json message_to_json(const Message& msg);

Message message_from_json(const nlohmann::json& j);

nlohmann::json messages_to_json(const std::vector<Message>& messages);

/// Parse the "tool_calls" array of a chat response; ids are generated when missing
std::vector<ToolCall> parse_tool_calls(const nlohmann::json& tool_calls);

} // namespace parley
