/**
 * Config loading, chat wire format and provider error classification.
 *
 * Run from build dir: ./test_config
 */

#include "config.h"
#include "message_json.h"
#include "llm_client.h"
#include "embedding_provider.h"
#include "logger.h"
#include "test_fakes.h"
#include <fstream>
#include <iostream>
#include <string>

using namespace parley;
using json = nlohmann::json;
using parley::testing::TempDir;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    Logger::initialize(LogLevel::WARN);

    // --- defaults ---
    {
        Config config;
        ASSERT(config.orchestration.max_tool_rounds == 5);
        ASSERT(config.orchestration.busy_policy == BusyPolicy::Queue);
        ASSERT(!config.orchestration.reuse_probe_content);
        ASSERT(config.memory.persist_user_tier);
        ASSERT(config.embedding.provider == "hashing");
    }

    // --- partial file keeps defaults for missing keys ---
    {
        auto parsed = Config::from_json_string(R"({
            "llm": {"model_name": "llama3.1:8b", "probe_timeout_ms": 9000},
            "memory": {"user_id": "alice", "top_k": 3, "persist_user_tier": false},
            "orchestration": {"max_tool_rounds": 3, "busy_policy": "reject"},
            "tools": {"notes_path": "/tmp/parley-notes.jsonl"},
            "logging": {"level": "debug"}
        })");
        ASSERT(parsed.is_ok());
        if (parsed) {
            const Config& c = parsed.value();
            ASSERT(c.llm.model_name == "llama3.1:8b");
            ASSERT(c.llm.probe_timeout_ms == 9000);
            ASSERT(c.memory.user_id == "alice");
            ASSERT(c.memory.top_k == 3);
            ASSERT(!c.memory.persist_user_tier);
            ASSERT(c.orchestration.max_tool_rounds == 3);
            ASSERT(c.orchestration.busy_policy == BusyPolicy::Reject);
            ASSERT(c.context.max_tokens == Config().context.max_tokens);
            ASSERT(c.resolved_notes_path() == "/tmp/parley-notes.jsonl");
        }
    }

    // --- invalid input ---
    {
        auto broken = Config::from_json_string("{ not json");
        ASSERT(broken.is_error() && broken.error().type == ErrorType::ParseError);
        auto not_object = Config::from_json_string("[1, 2]");
        ASSERT(not_object.is_error());
        auto wrong_type = Config::from_json_string(R"({"orchestration": {"max_tool_rounds": "many"}})");
        ASSERT(wrong_type.is_error());
        auto missing = Config::load("/nonexistent/parley/config.json");
        ASSERT(missing.is_error() && missing.error().type == ErrorType::IOError);

        Config fallback = Config::load_from_file("/nonexistent/parley/config.json");
        ASSERT(fallback.orchestration.max_tool_rounds == 5);
    }

    // --- finalize clamps nonsense ---
    {
        auto parsed = Config::from_json_string(R"({
            "orchestration": {"max_tool_rounds": 0},
            "memory": {"compress_threshold": 4, "keep_recent": 10}
        })");
        ASSERT(parsed.is_ok());
        if (parsed) {
            ASSERT(parsed.value().orchestration.max_tool_rounds == 1);
            ASSERT(parsed.value().memory.keep_recent < parsed.value().memory.compress_threshold);
        }
    }

    // --- loading from disk, derived paths ---
    {
        TempDir dir;
        const std::string path = dir.path() + "/config.json";
        {
            std::ofstream out(path);
            out << R"({"memory": {"storage_dir": ")" << dir.path() << R"("}})";
        }
        auto loaded = Config::load(path);
        ASSERT(loaded.is_ok());
        if (loaded) {
            ASSERT(loaded.value().resolved_storage_dir() == dir.path());
            ASSERT(loaded.value().resolved_audit_log_path() == dir.path() + "/audit.jsonl");
            ASSERT(loaded.value().resolved_notes_path() == dir.path() + "/notes.jsonl");
        }
    }

    // --- chat message wire format ---
    {
        Message call = Message::assistant_with_tools("", {ToolCall{"call_7", "search_notes", R"({"query":"milk"})"}});
        json j = message_to_json(call);
        ASSERT(j["role"] == "assistant");
        ASSERT(j["tool_calls"].size() == 1);
        ASSERT(j["tool_calls"][0]["function"]["arguments"].is_object());
        ASSERT(j["tool_calls"][0]["function"]["arguments"]["query"] == "milk");

        Message back = message_from_json(j);
        ASSERT(back.tool_calls.size() == 1);
        ASSERT(back.tool_calls.size() == 1 && back.tool_calls[0].id == "call_7");
        ASSERT(back.tool_calls.size() == 1 && json::parse(back.tool_calls[0].arguments)["query"] == "milk");

        json result = message_to_json(Message::tool("call_7", "Found 1 note"));
        ASSERT(result["role"] == "tool");
        ASSERT(result["tool_call_id"] == "call_7");

        // OpenAI-style string arguments and missing ids
        auto calls = parse_tool_calls(json::parse(R"([
            {"function": {"name": "save_note", "arguments": "{\"content\":\"hi\"}"}},
            {"function": {"name": "search_notes", "arguments": {"query": "hi"}}}
        ])"));
        ASSERT(calls.size() == 2);
        ASSERT(calls.size() == 2 && !calls[0].id.empty() && calls[0].id != calls[1].id);
        ASSERT(calls.size() == 2 && calls[0].arguments == R"({"content":"hi"})");
        ASSERT(calls.size() == 2 && json::parse(calls[1].arguments)["query"] == "hi");
        ASSERT(parse_tool_calls(json::object()).empty());
    }

    // --- provider errors map onto the taxonomy ---
    {
        Error unsupported = OllamaProvider::classify_http_error(400, R"({"error":"llama2 does not support tools"})");
        ASSERT(unsupported.type == ErrorType::UnsupportedCapability);
        ASSERT(!unsupported.retryable);

        Error limited = OllamaProvider::classify_http_error(429, "slow down");
        ASSERT(limited.type == ErrorType::TransientProvider && limited.retryable);
        ASSERT(OllamaProvider::classify_http_error(503, "").retryable);

        Error bad = OllamaProvider::classify_http_error(400, "bad request");
        ASSERT(bad.type == ErrorType::Provider && !bad.retryable);
        ASSERT(bad.describe().find("Provider") != std::string::npos);

        // Errors reported inside a 200 stream are judged by their wording
        Error busy = OllamaProvider::classify_stream_error(
            "server busy, please try again.  maximum pending requests exceeded");
        ASSERT(busy.type == ErrorType::TransientProvider && busy.retryable);
        ASSERT(OllamaProvider::classify_stream_error("Request Timed Out").retryable);
        ASSERT(OllamaProvider::classify_stream_error("model does not support tools").type ==
               ErrorType::UnsupportedCapability);
        Error broken = OllamaProvider::classify_stream_error("invalid model name");
        ASSERT(broken.type == ErrorType::Provider && !broken.retryable);
        ASSERT(broken.message.find("mid-stream") != std::string::npos);
    }

    // --- embedding provider factory ---
    {
        EmbeddingConfig config;
        config.dimensions = 32;
        auto hashing = make_embedding_provider(config);
        ASSERT(hashing->dimensions() == 32);
        auto vec = hashing->embed("hello world");
        ASSERT(vec.is_ok() && vec.value().size() == 32);

        config.provider = "something-else";
        ASSERT(make_embedding_provider(config)->name() == hashing->name());
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed\n";
        return 1;
    }
    std::cout << "test_config: all passed\n";
    return 0;
}
