#include "core/types.h"
#include <algorithm>

namespace parley {

const char* role_name(MessageRole role) {
    switch (role) {
        case MessageRole::System: return "system";
        case MessageRole::User: return "user";
        case MessageRole::Assistant: return "assistant";
        case MessageRole::Tool: return "tool";
    }
    return "user";
}

MessageRole parse_role(const std::string& name) {
    if (name == "system") return MessageRole::System;
    if (name == "assistant") return MessageRole::Assistant;
    if (name == "tool") return MessageRole::Tool;
    return MessageRole::User;
}

Message Message::system(const std::string& content) {
    Message msg;
    msg.role = MessageRole::System;
    msg.content = content;
    msg.timestamp_ms = wall_clock_ms();
    return msg;
}

Message Message::user(const std::string& content) {
    Message msg;
    msg.role = MessageRole::User;
    msg.content = content;
    msg.timestamp_ms = wall_clock_ms();
    return msg;
}

Message Message::assistant(const std::string& content) {
    Message msg;
    msg.role = MessageRole::Assistant;
    msg.content = content;
    msg.timestamp_ms = wall_clock_ms();
    return msg;
}

Message Message::assistant_with_tools(const std::string& content,
                                      const std::vector<ToolCall>& calls) {
    Message msg = assistant(content);
    msg.tool_calls = calls;
    return msg;
}

Message Message::tool(const std::string& tool_call_id, const std::string& content) {
    Message msg;
    msg.role = MessageRole::Tool;
    msg.content = content;
    msg.tool_call_id = tool_call_id;
    msg.timestamp_ms = wall_clock_ms();
    return msg;
}

const char* tier_name(Tier tier) {
    switch (tier) {
        case Tier::User: return "user";
        case Tier::Session: return "session";
        case Tier::Context: return "context";
    }
    return "context";
}

bool MemoryRecord::has_tag(const std::string& tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

} // namespace parley
