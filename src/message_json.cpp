#include "message_json.h"
#include <atomic>

using json = nlohmann::json;

namespace parley {

namespace {

std::string next_call_id() {
    static std::atomic<uint64_t> counter{0};
    return "call_" + std::to_string(++counter);
}

} // namespace

json message_to_json(const Message& msg) {
    json j;
    j["role"] = role_name(msg.role);
    j["content"] = msg.content;

    if (!msg.tool_call_id.empty()) {
        j["tool_call_id"] = msg.tool_call_id;
    }

    if (!msg.tool_calls.empty()) {
        json calls = json::array();
        for (const auto& call : msg.tool_calls) {
            json fn;
            fn["name"] = call.name;
            json args = json::parse(call.arguments.empty() ? "{}" : call.arguments, nullptr, false);
            fn["arguments"] = args.is_discarded() ? json(call.arguments) : args;

            json c;
            c["id"] = call.id;
            c["type"] = "function";
            c["function"] = fn;
            calls.push_back(c);
        }
        j["tool_calls"] = calls;
    }
    return j;
}

Message message_from_json(const json& j) {
    Message msg;
    msg.role = parse_role(j.value("role", "user"));
    if (j.contains("content") && j["content"].is_string()) {
        msg.content = j["content"].get<std::string>();
    }
    msg.tool_call_id = j.value("tool_call_id", "");
    msg.timestamp_ms = j.value("timestamp_ms", static_cast<int64_t>(0));
    if (j.contains("tool_calls")) {
        msg.tool_calls = parse_tool_calls(j["tool_calls"]);
    }
    return msg;
}

json messages_to_json(const std::vector<Message>& messages) {
    json arr = json::array();
    for (const auto& msg : messages) {
        arr.push_back(message_to_json(msg));
    }
    return arr;
}

std::vector<ToolCall> parse_tool_calls(const json& tool_calls) {
    std::vector<ToolCall> calls;
    if (!tool_calls.is_array()) {
        return calls;
    }
    for (const auto& item : tool_calls) {
        ToolCall tc;
        if (item.contains("id") && item["id"].is_string() && !item["id"].get<std::string>().empty()) {
            tc.id = item["id"].get<std::string>();
        } else {
            tc.id = next_call_id();
        }

        const json& fn = item.contains("function") ? item["function"] : item;
        if (fn.contains("name") && fn["name"].is_string()) {
            tc.name = fn["name"].get<std::string>();
        }
        if (fn.contains("arguments")) {
            // Ollama returns an object, OpenAI-style APIs a JSON string
            if (fn["arguments"].is_string()) {
                tc.arguments = fn["arguments"].get<std::string>();
            } else {
                tc.arguments = fn["arguments"].dump();
            }
        } else {
            tc.arguments = "{}";
        }
        calls.push_back(tc);
    }
    return calls;
}

} // namespace parley
