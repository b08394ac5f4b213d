/**
 * Context assembly tests: budget truncation order, preserved last turn,
 * tool subset selection, memory injection and segment caching.
 *
 * Run from build dir: ./test_context_assembler
 */

#include "context_assembler.h"
#include "logger.h"
#include "test_fakes.h"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace parley;
using parley::testing::TempDir;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static std::shared_ptr<Tool> make_tool(const std::string& name,
                                       std::vector<std::string> topics,
                                       bool always_offer = false) {
    ToolDefinition def;
    def.name = name;
    def.description = "Test tool " + name;
    def.parameters = {{"type", "object"}, {"properties", nlohmann::json::object()}};
    def.topics = std::move(topics);
    def.always_offer = always_offer;
    return std::make_shared<FunctionTool>(def, [name](const nlohmann::json&) {
        return Result<std::string>(name + " ran");
    });
}

static bool contains_message(const std::vector<Message>& messages, const std::string& content) {
    for (const auto& m : messages) {
        if (m.content == content) return true;
    }
    return false;
}

int main() {
    Logger::initialize(LogLevel::WARN);
    auto estimator = std::make_shared<TokenEstimator>();

    // --- history far over budget keeps the new message and the last turn ---
    {
        auto cache = std::make_shared<PromptCache>();
        ContextAssembler assembler(cache, nullptr, nullptr, estimator, "You are a test assistant.");

        std::vector<Message> history;
        for (int i = 0; i < 9; ++i) {
            history.push_back(Message::user("question " + std::to_string(i) + " " + std::string(800, 'q')));
            history.push_back(Message::assistant("answer " + std::to_string(i) + " " + std::string(800, 'a')));
        }
        history.push_back(Message::user("Can we meet on Tuesday?"));
        history.push_back(Message::assistant("Tuesday works for me."));

        ContextConfig config;
        config.max_tokens = 200;
        config.recent_messages = 10;

        int full = estimator->estimate(history);
        ASSERT(full > 10 * config.max_tokens);

        AssembledContext ctx = assembler.build(history, "What time on Tuesday?", config);
        ASSERT(ctx.messages.size() == 4);
        ASSERT(ctx.messages.front().role == MessageRole::System);
        ASSERT(ctx.messages.back().role == MessageRole::User);
        ASSERT(ctx.messages.back().content == "What time on Tuesday?");
        ASSERT(contains_message(ctx.messages, "Can we meet on Tuesday?"));
        ASSERT(contains_message(ctx.messages, "Tuesday works for me."));
        ASSERT(ctx.dropped_history == 8);
        ASSERT(!ctx.over_budget);
        ASSERT(ctx.estimated_tokens <= config.max_tokens);
        ASSERT(ctx.tool_schemas_json == "[]");
    }

    // --- a window never opens on an orphan tool result ---
    {
        ContextAssembler assembler(nullptr, nullptr, nullptr, estimator, "System.");
        std::vector<Message> history = {
            Message::user("find my notes"),
            Message::assistant_with_tools("", {ToolCall{"call_1", "search_notes", "{}"}}),
            Message::tool("call_1", "Found 2 notes"),
            Message::assistant("You have two notes."),
            Message::user("thanks"),
            Message::assistant("Any time.")
        };
        ContextConfig config;
        config.recent_messages = 4;   // would start on the tool message
        AssembledContext ctx = assembler.build(history, "next", config);
        ASSERT(ctx.messages.size() > 1 && ctx.messages[1].role != MessageRole::Tool);
        ASSERT(contains_message(ctx.messages, "You have two notes."));
        ASSERT(!contains_message(ctx.messages, "Found 2 notes"));
    }

    // --- impossible budget still returns the new message, flagged ---
    {
        ContextAssembler assembler(nullptr, nullptr, nullptr, estimator,
                                   "A long system prompt that alone exceeds the tiny budget.");
        ContextConfig config;
        config.max_tokens = 5;
        AssembledContext ctx = assembler.build({}, "hello there", config);
        ASSERT(ctx.over_budget);
        ASSERT(ctx.messages.size() == 2);
        ASSERT(ctx.messages.back().content == "hello there");
    }

    // --- only relevant tools are offered ---
    {
        ToolRegistry registry;
        ASSERT(registry.register_tool(make_tool("get_weather", {"weather", "forecast", "rain"})).is_ok());
        ASSERT(registry.register_tool(make_tool("take_note", {"note", "jot"})).is_ok());
        ASSERT(registry.register_tool(make_tool("current_time", {}, true)).is_ok());
        ContextAssembler assembler(std::make_shared<PromptCache>(), nullptr, &registry, estimator, "System.");

        auto picked = assembler.select_tools("Will it rain tomorrow?");
        ASSERT(picked.size() == 2);
        ASSERT(std::find(picked.begin(), picked.end(), "get_weather") != picked.end());
        ASSERT(std::find(picked.begin(), picked.end(), "current_time") != picked.end());

        picked = assembler.select_tools("Show me my notes");   // "notes" extends "note"
        ASSERT(std::find(picked.begin(), picked.end(), "take_note") != picked.end());
        ASSERT(std::find(picked.begin(), picked.end(), "get_weather") == picked.end());

        ContextConfig config;
        AssembledContext ctx = assembler.build({}, "What's the forecast for Oslo?", config);
        ASSERT(ctx.selected_tools.size() == 2);
        ASSERT(ctx.tool_schemas_json.find("get_weather") != std::string::npos);
        ASSERT(ctx.tool_schemas_json.find("take_note") == std::string::npos);

        auto schemas = nlohmann::json::parse(ctx.tool_schemas_json);
        ASSERT(schemas.is_array() && schemas.size() == 2);

        // The previous user turn counts toward relevance
        std::vector<Message> history = {Message::user("Jot this down please"), Message::assistant("Sure, what?")};
        ctx = assembler.build(history, "Buy more coffee", config);
        ASSERT(std::find(ctx.selected_tools.begin(), ctx.selected_tools.end(), "take_note") !=
               ctx.selected_tools.end());
    }

    // --- tool schemas are dropped last, after history ---
    {
        ToolRegistry registry;
        registry.register_tool(make_tool("get_weather", {"weather"}));
        ContextAssembler assembler(nullptr, nullptr, &registry, estimator, "System.");
        std::vector<Message> history = {
            Message::user(std::string(600, 'x')),
            Message::assistant(std::string(600, 'y')),
            Message::user("ok"),
            Message::assistant("fine")
        };
        ContextConfig config;
        config.max_tokens = 80;
        AssembledContext ctx = assembler.build(history, "weather today", config);
        ASSERT(ctx.dropped_history == 2);
        ASSERT(!ctx.dropped_tools);
        ASSERT(ctx.selected_tools.size() == 1);

        config.max_tokens = 25;
        ctx = assembler.build(history, "weather today", config);
        ASSERT(ctx.dropped_tools);
        ASSERT(ctx.tool_schemas_json == "[]");
        ASSERT(ctx.selected_tools.empty());
    }

    // --- memories are injected and dropped first, oldest first ---
    {
        TempDir dir;
        MemoryConfig mconfig;
        auto embedder = std::make_shared<HashingEmbeddingProvider>(256);
        auto tiers = std::make_shared<memory::TieredMemory>(mconfig, embedder, dir.path(), false);
        ASSERT(tiers->remember("I prefer green tea in the morning").is_ok());
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        ASSERT(tiers->remember("I prefer window seats on flights").is_ok());

        ContextAssembler assembler(std::make_shared<PromptCache>(), tiers, nullptr, estimator, "System.");
        std::vector<Message> history = {Message::user("hi"), Message::assistant("hello")};

        ContextConfig config;
        config.memory_min_score = -1.0f;
        AssembledContext roomy = assembler.build(history, "What do I prefer?", config);
        ASSERT(roomy.memories_included == 2);
        ASSERT(roomy.messages.size() == 5);
        ASSERT(roomy.messages.size() == 5 && roomy.messages[1].role == MessageRole::System);
        ASSERT(roomy.messages.size() == 5 &&
               roomy.messages[1].content.rfind("Relevant memories:", 0) == 0);

        config.max_tokens = roomy.estimated_tokens - 1;
        AssembledContext tight = assembler.build(history, "What do I prefer?", config);
        ASSERT(tight.dropped_memories == 1);
        ASSERT(tight.memories_included == 1);
        ASSERT(tight.dropped_history == 0);
        ASSERT(tight.messages.size() == 5 &&
               tight.messages[1].content.find("window seats") != std::string::npos);
        ASSERT(tight.messages.size() == 5 &&
               tight.messages[1].content.find("green tea") == std::string::npos);

        // A memory already present verbatim in the window is not repeated
        history.push_back(Message::user("I prefer green tea in the morning"));
        history.push_back(Message::assistant("Noted."));
        config.max_tokens = 4000;
        AssembledContext dedup = assembler.build(history, "What do I prefer?", config);
        ASSERT(dedup.memories_included == 1);
    }

    // --- identity and system prompt come from the cache after the first turn ---
    {
        TempDir dir;
        MemoryConfig mconfig;
        auto embedder = std::make_shared<HashingEmbeddingProvider>(256);
        auto tiers = std::make_shared<memory::TieredMemory>(mconfig, embedder, dir.path(), false);
        tiers->commit_exchange("My name is Dana", "Hi Dana.");

        auto cache = std::make_shared<PromptCache>();
        ContextAssembler assembler(cache, tiers, nullptr, estimator,
                                   "You are helpful.\nToday is 2025-01-01T09:00:00Z.");
        std::string segment = assembler.system_segment();
        ASSERT(segment.find("You are helpful.") != std::string::npos);
        ASSERT(segment.find("About the user:\nMy name is Dana") != std::string::npos);

        ContextConfig config;
        assembler.build({}, "hello", config);
        assembler.build({}, "hello again", config);
        CacheStats stats = cache->stats();
        ASSERT(stats.hits >= 2);
        ASSERT(stats.entries == 2);
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed\n";
        return 1;
    }
    std::cout << "test_context_assembler: all passed\n";
    return 0;
}
