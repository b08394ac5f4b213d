#pragma once

#include "errors.h"
#include "core/constants.h"
#include <string>
#include <cstddef>

namespace parley {

struct LLMConfig {
    std::string endpoint = "http://localhost:11434/api/chat";
    std::string model_name = "qwen2.5:7b";
    float temperature = 0.7f;
    int max_tokens = constants::llm::DEFAULT_MAX_TOKENS;
    int probe_timeout_ms = constants::llm::PROBE_TIMEOUT_MS;
    int stream_timeout_ms = constants::llm::STREAM_TIMEOUT_MS;
    int summary_timeout_ms = constants::llm::SUMMARY_TIMEOUT_MS;
};

struct EmbeddingConfig {
    std::string provider = "hashing";   ///< "hashing" | "ollama"
    std::string endpoint = "http://localhost:11434/api/embeddings";
    std::string model_name = "nomic-embed-text";
    size_t dimensions = constants::memory::DEFAULT_EMBEDDING_DIMENSIONS;
    int timeout_ms = 10000;
};

struct CacheConfig {
    size_t max_entries = constants::cache::DEFAULT_MAX_ENTRIES;
    int default_ttl_minutes = constants::cache::DEFAULT_TTL_MINUTES;  ///< 0 = never expire
};

struct MemoryConfig {
    std::string storage_dir;            ///< Empty = default_data_dir()
    std::string user_id = "default";
    size_t top_k = constants::memory::DEFAULT_TOP_K;
    float min_score = constants::memory::DEFAULT_MIN_SCORE;
    size_t context_capacity = constants::memory::CONTEXT_TIER_CAPACITY;
    size_t compress_threshold = constants::memory::COMPRESS_THRESHOLD;
    size_t keep_recent = constants::memory::KEEP_RECENT;
    float rebuild_tombstone_ratio = constants::memory::REBUILD_TOMBSTONE_RATIO;
    size_t snapshot_every = constants::memory::SNAPSHOT_EVERY;
    bool persist_user_tier = true;
};

struct ContextConfig {
    int max_tokens = constants::context::DEFAULT_MAX_TOKENS;
    size_t recent_messages = constants::context::DEFAULT_RECENT_MESSAGES;
    size_t memory_top_k = constants::memory::DEFAULT_TOP_K;
    float memory_min_score = constants::memory::DEFAULT_MIN_SCORE;
};

struct ToolsConfig {
    int timeout_ms = constants::tools::DEFAULT_TIMEOUT_MS;
    size_t max_concurrent = constants::tools::DEFAULT_MAX_CONCURRENT;
    std::string audit_log_path;         ///< Empty = <storage_dir>/audit.jsonl
    std::string notes_path;             ///< Empty = <storage_dir>/notes.jsonl
};

enum class BusyPolicy {
    Queue,
    Reject
};

struct OrchestrationConfig {
    int max_tool_rounds = constants::orchestration::MAX_TOOL_ROUNDS;
    BusyPolicy busy_policy = BusyPolicy::Queue;
    size_t max_queued_messages = constants::orchestration::MAX_QUEUED_MESSAGES;
    /// Emit plain probe content directly instead of issuing a second stream call
    bool reuse_probe_content = false;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct Config {
    LLMConfig llm;
    EmbeddingConfig embedding;
    CacheConfig cache;
    MemoryConfig memory;
    ContextConfig context;
    ToolsConfig tools;
    OrchestrationConfig orchestration;
    LoggingConfig logging;

    std::string system_prompt =
        "You are Parley, a concise desktop assistant. Use tools only when they help. "
        "Answer plainly and admit when you do not know.";
    std::string identity;               ///< Optional persona text appended to the system prompt

    /**
     * @brief Parse a config file. Missing keys keep their defaults.
     * @return Error when the file cannot be read or is not valid JSON
     */
    static Result<Config> load(const std::string& path);

    /**
     * @brief Parse config from a JSON string (same rules as load())
     */
    static Result<Config> from_json_string(const std::string& text);

    /**
     * @brief Like load(), but logs the failure and falls back to defaults
     */
    static Config load_from_file(const std::string& path);

    /**
     * @brief Apply PARLEY_* environment overrides and expand ~ in paths
     */
    void finalize();

    std::string resolved_storage_dir() const;
    std::string resolved_audit_log_path() const;
    std::string resolved_notes_path() const;
};

} // namespace parley
