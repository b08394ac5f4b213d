#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

void apply_json_to_config(parley::Config& cfg, const json& j) {
    if (j.contains("llm")) {
        auto& l = j["llm"];
        if (l.contains("endpoint")) cfg.llm.endpoint = l["endpoint"];
        if (l.contains("model_name")) cfg.llm.model_name = l["model_name"];
        if (l.contains("temperature")) cfg.llm.temperature = l["temperature"];
        if (l.contains("max_tokens")) cfg.llm.max_tokens = l["max_tokens"];
        if (l.contains("probe_timeout_ms")) cfg.llm.probe_timeout_ms = l["probe_timeout_ms"];
        if (l.contains("stream_timeout_ms")) cfg.llm.stream_timeout_ms = l["stream_timeout_ms"];
        if (l.contains("summary_timeout_ms")) cfg.llm.summary_timeout_ms = l["summary_timeout_ms"];
    }

    if (j.contains("embedding")) {
        auto& e = j["embedding"];
        if (e.contains("provider")) cfg.embedding.provider = e["provider"];
        if (e.contains("endpoint")) cfg.embedding.endpoint = e["endpoint"];
        if (e.contains("model_name")) cfg.embedding.model_name = e["model_name"];
        if (e.contains("dimensions")) cfg.embedding.dimensions = e["dimensions"];
        if (e.contains("timeout_ms")) cfg.embedding.timeout_ms = e["timeout_ms"];
    }

    if (j.contains("cache")) {
        auto& c = j["cache"];
        if (c.contains("max_entries")) cfg.cache.max_entries = c["max_entries"];
        if (c.contains("default_ttl_minutes")) cfg.cache.default_ttl_minutes = c["default_ttl_minutes"];
    }

    if (j.contains("memory")) {
        auto& m = j["memory"];
        if (m.contains("storage_dir")) cfg.memory.storage_dir = m["storage_dir"];
        if (m.contains("user_id")) cfg.memory.user_id = m["user_id"];
        if (m.contains("top_k")) cfg.memory.top_k = m["top_k"];
        if (m.contains("min_score")) cfg.memory.min_score = m["min_score"];
        if (m.contains("context_capacity")) cfg.memory.context_capacity = m["context_capacity"];
        if (m.contains("compress_threshold")) cfg.memory.compress_threshold = m["compress_threshold"];
        if (m.contains("keep_recent")) cfg.memory.keep_recent = m["keep_recent"];
        if (m.contains("rebuild_tombstone_ratio"))
            cfg.memory.rebuild_tombstone_ratio = m["rebuild_tombstone_ratio"];
        if (m.contains("snapshot_every")) cfg.memory.snapshot_every = m["snapshot_every"];
        if (m.contains("persist_user_tier")) cfg.memory.persist_user_tier = m["persist_user_tier"];
    }

    if (j.contains("context")) {
        auto& c = j["context"];
        if (c.contains("max_tokens")) cfg.context.max_tokens = c["max_tokens"];
        if (c.contains("recent_messages")) cfg.context.recent_messages = c["recent_messages"];
        if (c.contains("memory_top_k")) cfg.context.memory_top_k = c["memory_top_k"];
        if (c.contains("memory_min_score")) cfg.context.memory_min_score = c["memory_min_score"];
    }

    if (j.contains("tools")) {
        auto& t = j["tools"];
        if (t.contains("timeout_ms")) cfg.tools.timeout_ms = t["timeout_ms"];
        if (t.contains("max_concurrent")) cfg.tools.max_concurrent = t["max_concurrent"];
        if (t.contains("audit_log_path")) cfg.tools.audit_log_path = t["audit_log_path"];
        if (t.contains("notes_path")) cfg.tools.notes_path = t["notes_path"];
    }

    if (j.contains("orchestration")) {
        auto& o = j["orchestration"];
        if (o.contains("max_tool_rounds")) cfg.orchestration.max_tool_rounds = o["max_tool_rounds"];
        if (o.contains("busy_policy")) {
            std::string policy = o["busy_policy"];
            if (policy == "reject") {
                cfg.orchestration.busy_policy = parley::BusyPolicy::Reject;
            } else if (policy == "queue") {
                cfg.orchestration.busy_policy = parley::BusyPolicy::Queue;
            } else {
                parley::Logger::warn("Unknown orchestration.busy_policy \"" + policy + "\"; using queue");
            }
        }
        if (o.contains("max_queued_messages"))
            cfg.orchestration.max_queued_messages = o["max_queued_messages"];
        if (o.contains("reuse_probe_content"))
            cfg.orchestration.reuse_probe_content = o["reuse_probe_content"];
    }

    if (j.contains("logging")) {
        auto& l = j["logging"];
        if (l.contains("level")) cfg.logging.level = l["level"];
        if (l.contains("file")) cfg.logging.file = l["file"];
    }

    if (j.contains("system_prompt")) cfg.system_prompt = j["system_prompt"];
    if (j.contains("identity")) cfg.identity = j["identity"];
}

} // namespace

namespace parley {

Result<Config> Config::from_json_string(const std::string& text) {
    Config cfg;
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            return make_parse_error("Config root must be a JSON object");
        }
        apply_json_to_config(cfg, j);
    } catch (const json::exception& e) {
        return make_parse_error(std::string("Invalid config: ") + e.what());
    }
    cfg.finalize();
    return cfg;
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(expand_path(path));
    if (!file.is_open()) {
        return make_io_error("Could not open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_string(buffer.str());
}

Config Config::load_from_file(const std::string& path) {
    auto result = load(path);
    if (result.is_error()) {
        Logger::warn(result.error().message + ". Using defaults.");
        Config cfg;
        cfg.finalize();
        return cfg;
    }
    Logger::info("Loaded config from " + path);
    return result.value();
}

void Config::finalize() {
    if (const char* endpoint = std::getenv("PARLEY_LLM_ENDPOINT")) {
        if (*endpoint) llm.endpoint = endpoint;
    }
    if (const char* level = std::getenv("PARLEY_LOG_LEVEL")) {
        if (*level) logging.level = level;
    }
    memory.storage_dir = expand_path(memory.storage_dir);
    tools.audit_log_path = expand_path(tools.audit_log_path);
    tools.notes_path = expand_path(tools.notes_path);
    logging.file = expand_path(logging.file);

    if (orchestration.max_tool_rounds < 1) {
        Logger::warn("orchestration.max_tool_rounds must be >= 1; using 1");
        orchestration.max_tool_rounds = 1;
    }
    if (memory.keep_recent >= memory.compress_threshold) {
        Logger::warn("memory.keep_recent must be below compress_threshold; clamping");
        memory.keep_recent = memory.compress_threshold > 1 ? memory.compress_threshold - 1 : 0;
    }
}

std::string Config::resolved_storage_dir() const {
    return memory.storage_dir.empty() ? default_data_dir() : memory.storage_dir;
}

std::string Config::resolved_audit_log_path() const {
    return tools.audit_log_path.empty() ? resolved_storage_dir() + "/audit.jsonl" : tools.audit_log_path;
}

std::string Config::resolved_notes_path() const {
    return tools.notes_path.empty() ? resolved_storage_dir() + "/notes.jsonl" : tools.notes_path;
}

} // namespace parley
