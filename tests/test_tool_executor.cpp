/**
 * Tool tests: argument validation, confirmation gating, audit trail,
 * timeouts, builtin note tools and the turn state machine.
 *
 * Run from build dir: ./test_tool_executor
 */

#include "tool_executor.h"
#include "tool_schema.h"
#include "state_machine.h"
#include "tools/save_note_tool.h"
#include "tools/search_notes_tool.h"
#include "tools/search_memory_tool.h"
#include "logger.h"
#include "test_fakes.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using namespace parley;
using json = nlohmann::json;
using parley::testing::TempDir;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static std::shared_ptr<Tool> make_tool(const std::string& name, Permission permission,
                                       FunctionTool::Handler handler) {
    ToolDefinition def;
    def.name = name;
    def.description = "Test tool";
    def.permission = permission;
    def.parameters = {{"type", "object"}, {"properties", json::object()}};
    return std::make_shared<FunctionTool>(def, std::move(handler));
}

static size_t count_lines(const std::string& path) {
    std::ifstream in(path);
    size_t n = 0;
    std::string line;
    while (std::getline(in, line)) ++n;
    return n;
}

int main() {
    Logger::initialize(LogLevel::WARN);

    ToolsConfig tools_config;
    tools_config.timeout_ms = 2000;
    tools_config.max_concurrent = 2;

    // --- schema validator ---
    {
        json schema = json::parse(R"({
            "type": "object",
            "properties": {
                "query": {"type": "string", "minLength": 1},
                "limit": {"type": "integer", "minimum": 1, "maximum": 50},
                "mode": {"type": "string", "enum": ["fast", "exact"]},
                "tags": {"type": "array", "items": {"type": "string"}}
            },
            "required": ["query"],
            "additionalProperties": false
        })");

        ASSERT(validate_arguments(schema, json::parse(R"({"query":"milk"})")).is_ok());
        ASSERT(validate_arguments(schema, json::parse(R"({"query":"milk","limit":5.0})")).is_ok());

        auto missing = validate_arguments(schema, json::parse(R"({"limit":3})"));
        ASSERT(missing.is_error());
        ASSERT(missing.is_error() && missing.error().type == ErrorType::Validation);
        ASSERT(missing.is_error() && missing.error().message.find("$.query") != std::string::npos);

        auto wrong_type = validate_arguments(schema, json::parse(R"({"query":42})"));
        ASSERT(wrong_type.is_error() && wrong_type.error().message.find("type string") != std::string::npos);

        ASSERT(validate_arguments(schema, json::parse(R"({"query":""})")).is_error());
        ASSERT(validate_arguments(schema, json::parse(R"({"query":"a","limit":0})")).is_error());
        ASSERT(validate_arguments(schema, json::parse(R"({"query":"a","limit":2.5})")).is_error());
        ASSERT(validate_arguments(schema, json::parse(R"({"query":"a","limit":1e300})")).is_error());

        // Integers too large for 64 bits are rejected, not converted
        json count = {{"type", "object"}, {"properties", {{"n", {{"type", "integer"}}}}}};
        ASSERT(validate_arguments(count, json::parse(R"({"n":1e300})")).is_error());
        ASSERT(validate_arguments(count, json::parse(R"({"n":-1e19})")).is_error());
        ASSERT(validate_arguments(count, json::parse(R"({"n":4096.0})")).is_ok());
        ASSERT(validate_arguments(count, json::parse(R"({"n":9007199254740992})")).is_ok());

        ASSERT(validate_arguments(schema, json::parse(R"({"query":"a","mode":"slow"})")).is_error());
        ASSERT(validate_arguments(schema, json::parse(R"({"query":"a","extra":true})")).is_error());

        auto item = validate_arguments(schema, json::parse(R"({"query":"a","tags":["ok",3]})"));
        ASSERT(item.is_error() && item.error().message.find("$.tags[1]") != std::string::npos);

        json bad_schema = {{"type", "object"},
                           {"properties", {{"q", {{"type", "string"}, {"minLength", "three"}}}}}};
        ASSERT(validate_arguments(bad_schema, json{{"q", "x"}}).is_error());
    }

    // --- unknown tool and malformed arguments never reach a handler ---
    {
        ToolRegistry registry;
        std::atomic<int> calls{0};
        registry.register_tool(make_tool("echo", Permission::Read, [&calls](const json&) {
            calls++;
            return Result<std::string>("echoed");
        }));
        ToolExecutor executor(registry, tools_config);

        auto unknown = executor.invoke("does_not_exist", "{}", "c1");
        ASSERT(unknown.status == InvocationStatus::Error);
        ASSERT(unknown.error.type == ErrorType::Validation);
        ASSERT(unknown.call_id == "c1");

        auto garbled = executor.invoke("echo", "{not json", "c2");
        ASSERT(garbled.error.type == ErrorType::Validation);
        ASSERT(calls == 0);

        auto empty_args = executor.invoke("echo", "", "c3");
        ASSERT(empty_args.ok());
        ASSERT(empty_args.content == "echoed");
        ASSERT(empty_args.to_model_text() == "Tool echo succeeded. Result:\nechoed");
        ASSERT(calls == 1);

        ASSERT(!registry.register_tool(make_tool("echo", Permission::Read, nullptr)).is_ok());
        ASSERT(!registry.register_tool(nullptr).is_ok());
    }

    // --- handler failures surface as ToolExecution errors ---
    {
        ToolRegistry registry;
        registry.register_tool(make_tool("explode", Permission::Read, [](const json&) -> Result<std::string> {
            throw std::runtime_error("disk on fire");
        }));
        registry.register_tool(make_tool("refuse", Permission::Read, [](const json&) -> Result<std::string> {
            return make_io_error("backend unreachable");
        }));
        registry.register_tool(make_tool("sleepy", Permission::Read, [](const json&) -> Result<std::string> {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            return std::string("finally");
        }));
        ToolExecutor executor(registry, tools_config);

        auto thrown = executor.invoke("explode", "{}");
        ASSERT(thrown.status == InvocationStatus::Error);
        ASSERT(thrown.error.type == ErrorType::ToolExecution);
        ASSERT(thrown.error.message.find("disk on fire") != std::string::npos);
        ASSERT(thrown.to_model_text().rfind("Tool explode failed. Error: ", 0) == 0);

        auto refused = executor.invoke("refuse", "{}");
        ASSERT(refused.error.type == ErrorType::ToolExecution);
        ASSERT(refused.error.message == "backend unreachable");

        auto start = std::chrono::steady_clock::now();
        auto slow = executor.invoke("sleepy", "{}", "", 50);
        auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        ASSERT(slow.error.type == ErrorType::ToolExecution);
        ASSERT(slow.error.message.find("timed out") != std::string::npos);
        ASSERT(waited < 250);

        auto patient = executor.invoke("sleepy", "{}", "", 0);
        ASSERT(patient.ok() && patient.content == "finally");
    }

    // --- a WRITE call that times out while queued never runs later ---
    {
        TempDir dir;
        ToolsConfig single;
        single.timeout_ms = 100;
        single.max_concurrent = 1;
        ToolRegistry registry;
        std::atomic<int> writes{0};
        registry.register_tool(make_tool("slow_read", Permission::Read, [](const json&) -> Result<std::string> {
            std::this_thread::sleep_for(std::chrono::milliseconds(400));
            return std::string("read done");
        }));
        registry.register_tool(make_tool("write_it", Permission::Write, [&writes](const json&) -> Result<std::string> {
            writes++;
            return std::string("written");
        }));
        auto audit = std::make_shared<AuditLog>(dir.path() + "/audit.jsonl");
        auto allow = std::make_shared<CallbackConfirmation>([](const ConfirmationRequest&) {
            return ConfirmationDecision::accept("tester");
        });
        ToolExecutor executor(registry, single, allow, audit);

        auto read = executor.invoke("slow_read", "{}");
        ASSERT(read.status == InvocationStatus::Error);
        ASSERT(read.error.message.find("outcome is unknown") != std::string::npos);

        auto write = executor.invoke("write_it", "{}");
        ASSERT(write.status == InvocationStatus::Error);
        ASSERT(write.error.message.find("it was not run") != std::string::npos);
        ASSERT(writes == 0);

        std::this_thread::sleep_for(std::chrono::milliseconds(600));
        ASSERT(writes == 0);
        ASSERT(executor.is_idle());
        ASSERT(audit->stats().total == 1);
        ASSERT(audit->stats().failed == 1);
    }

    // --- rejected WRITE calls have no side effects ---
    {
        TempDir dir;
        const std::string notes = dir.path() + "/notes.jsonl";
        ToolRegistry registry;
        auto audit = std::make_shared<AuditLog>(dir.path() + "/audit.jsonl");
        std::atomic<int> asked{0};
        std::string seen_preview;
        auto deny = std::make_shared<CallbackConfirmation>([&](const ConfirmationRequest& request) {
            asked++;
            seen_preview = request.preview;
            return ConfirmationDecision::reject();
        });
        ToolExecutor executor(registry, tools_config, deny, audit);
        ASSERT(executor.register_tool(std::make_shared<SaveNoteTool>(notes)).is_ok());

        auto rejected = executor.invoke("save_note", R"({"content":"buy milk"})", "call_9");
        ASSERT(rejected.status == InvocationStatus::Cancelled);
        ASSERT(rejected.error.type == ErrorType::Cancelled);
        ASSERT(rejected.to_model_text() == "Tool save_note was cancelled by the user; no changes were made.");
        ASSERT(asked == 1);
        ASSERT(seen_preview.find("buy milk") != std::string::npos);
        ASSERT(!std::filesystem::exists(notes));
        ASSERT(audit->stats().total == 0);

        // Invalid arguments are refused before anyone is asked
        auto invalid = executor.invoke("save_note", R"({"content":""})");
        ASSERT(invalid.error.type == ErrorType::Validation);
        ASSERT(asked == 1);

        // No handler at all rejects too
        executor.set_confirmation_handler(nullptr);
        auto unattended = executor.invoke("save_note", R"({"content":"buy eggs"})");
        ASSERT(unattended.status == InvocationStatus::Cancelled);
        ASSERT(!std::filesystem::exists(notes));
    }

    // --- accepted WRITE calls run once and are audited ---
    {
        TempDir dir;
        const std::string notes = dir.path() + "/notes.jsonl";
        const std::string audit_path = dir.path() + "/audit.jsonl";
        ToolRegistry registry;
        auto audit = std::make_shared<AuditLog>(audit_path);
        auto allow = std::make_shared<CallbackConfirmation>([](const ConfirmationRequest&) {
            return ConfirmationDecision::accept("tester");
        });
        ToolExecutor executor(registry, tools_config, allow, audit);
        executor.register_tool(std::make_shared<SaveNoteTool>(notes));
        executor.register_tool(std::make_shared<SearchNotesTool>(notes));

        auto saved = executor.invoke("save_note", R"({"content":"Dentist on Friday at 3pm","tags":["health"]})");
        ASSERT(saved.ok());
        ASSERT(count_lines(notes) == 1);

        auto found = executor.invoke("search_notes", R"({"query":"dentist friday"})");
        ASSERT(found.ok());
        ASSERT(found.content.find("Dentist on Friday at 3pm") != std::string::npos);

        auto by_tag = executor.invoke("search_notes", R"({"query":"health"})");
        ASSERT(by_tag.ok() && by_tag.content.find("Found 1") != std::string::npos);

        auto none = executor.invoke("search_notes", R"({"query":"vacation"})");
        ASSERT(none.ok() && none.content.find("No notes found") != std::string::npos);

        auto limited = executor.invoke("search_notes", R"({"query":"x","limit":100})");
        ASSERT(limited.error.type == ErrorType::Validation);

        // READ calls are not audited
        AuditStats stats = audit->stats();
        ASSERT(stats.total == 1);
        ASSERT(stats.succeeded == 1);
        ASSERT(stats.by_tool["save_note"] == 1);
        ASSERT(count_lines(audit_path) == 1);

        auto recent = audit->recent(5);
        ASSERT(recent.size() == 1);
        ASSERT(!recent.empty() && recent[0].confirmed_by == "tester");
        ASSERT(!recent.empty() && recent[0].tool == "save_note");
        ASSERT(!recent.empty() && json::parse(recent[0].arguments)["tags"][0] == "health");
    }

    // --- audit log keeps records in memory without a path ---
    {
        AuditLog audit;
        AuditRecord ok_record;
        ok_record.tool = "save_note";
        ok_record.arguments = "{}";
        ok_record.success = true;
        ok_record.result_summary = std::string(2000, 'r');
        AuditRecord bad_record = ok_record;
        bad_record.success = false;
        ASSERT(audit.append(ok_record).is_ok());
        ASSERT(audit.append(bad_record).is_ok());
        AuditStats stats = audit.stats();
        ASSERT(stats.total == 2 && stats.failed == 1);
        auto recent = audit.recent(1);
        ASSERT(recent.size() == 1 && !recent[0].success);
        ASSERT(recent.size() == 1 && recent[0].result_summary.size() < 2000);
    }

    // --- search_memory reads the tiers ---
    {
        TempDir dir;
        MemoryConfig mconfig;
        auto embedder = std::make_shared<HashingEmbeddingProvider>(256);
        auto tiers = std::make_shared<memory::TieredMemory>(mconfig, embedder, dir.path(), false);
        tiers->remember("Remember my locker code is 4417");

        ToolRegistry registry;
        ToolExecutor executor(registry, tools_config);
        executor.register_tool(std::make_shared<SearchMemoryTool>(tiers, 0.1f));
        auto hit = executor.invoke("search_memory", R"({"query":"what is my locker code"})");
        ASSERT(hit.ok());
        ASSERT(hit.content.find("4417") != std::string::npos);
        ASSERT(hit.content.find("[user, score") != std::string::npos);
    }

    // --- shut down executor refuses new work ---
    {
        ToolRegistry registry;
        registry.register_tool(make_tool("echo", Permission::Read, [](const json&) {
            return Result<std::string>("echoed");
        }));
        ToolExecutor executor(registry, tools_config);
        executor.shutdown();
        auto late = executor.invoke("echo", "{}");
        ASSERT(late.status == InvocationStatus::Error);
        ASSERT(late.error.type == ErrorType::InvalidState);
    }

    // --- turn state machine ---
    {
        TurnStateMachine sm;
        ASSERT(sm.get_state() == TurnState::Idle);
        ASSERT(!sm.transition(TurnState::Streaming));
        ASSERT(sm.transition(TurnState::ProbingWithTools));
        ASSERT(sm.transition(TurnState::ExecutingTools));
        sm.count_round();
        ASSERT(!sm.transition(TurnState::Streaming));
        ASSERT(sm.transition(TurnState::ProbingWithTools));
        ASSERT(sm.rounds() == 1);

        // Downgrade fires once
        ASSERT(!sm.transition(TurnState::ProbingNoTools));
        ASSERT(sm.downgrade());
        ASSERT(sm.get_state() == TurnState::ProbingNoTools);
        ASSERT(sm.downgraded());
        ASSERT(!sm.downgrade());
        ASSERT(!sm.transition(TurnState::ExecutingTools));
        ASSERT(sm.transition(TurnState::Streaming));
        ASSERT(sm.transition(TurnState::Done));
        ASSERT(is_terminal(sm.get_state()));
        ASSERT(!sm.transition(TurnState::Failed));

        sm.reset();
        ASSERT(sm.get_state() == TurnState::Idle);
        ASSERT(!sm.downgraded());
        ASSERT(sm.rounds() == 0);
        ASSERT(sm.transition(TurnState::Cancelled));
        ASSERT(std::string(turn_state_name(TurnState::ProbingWithTools)) == "PROBING_WITH_TOOLS");
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed\n";
        return 1;
    }
    std::cout << "test_tool_executor: all passed\n";
    return 0;
}
