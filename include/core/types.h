#pragma once

/**
 * @file types.h
 * @brief Core type definitions shared across parley components
 */

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>

namespace parley {

// =============================================================================
// Timing Types
// =============================================================================

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

/// Milliseconds elapsed since a time point
inline int64_t ms_since(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start).count();
}

/// Monotonic timestamp in milliseconds (ordering, elapsed time)
inline int64_t now_ms() {
    return std::chrono::duration_cast<Duration>(
        Clock::now().time_since_epoch()).count();
}

/// Wall-clock timestamp in milliseconds since the Unix epoch (persisted records)
inline int64_t wall_clock_ms() {
    return std::chrono::duration_cast<Duration>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// =============================================================================
// Conversation Types
// =============================================================================

enum class MessageRole {
    System,
    User,
    Assistant,
    Tool
};

const char* role_name(MessageRole role);
MessageRole parse_role(const std::string& name);

/**
 * @brief Structured tool-call request from a model response
 */
struct ToolCall {
    std::string id;           // Tool call ID from the provider (generated when absent)
    std::string name;         // Tool name
    std::string arguments;    // JSON string of arguments
};

/**
 * @brief One conversation message
 */
struct Message {
    MessageRole role = MessageRole::User;
    std::string content;
    std::vector<ToolCall> tool_calls;   // Assistant messages requesting tools
    std::string tool_call_id;           // Tool messages answering a call
    int64_t timestamp_ms = 0;

    static Message system(const std::string& content);
    static Message user(const std::string& content);
    static Message assistant(const std::string& content);
    static Message assistant_with_tools(const std::string& content,
                                        const std::vector<ToolCall>& calls);
    static Message tool(const std::string& tool_call_id, const std::string& content);
};

/**
 * @brief Token counters reported by the provider for one call
 */
struct UsageCounters {
    int prompt_tokens = 0;
    int completion_tokens = 0;

    int total_tokens() const { return prompt_tokens + completion_tokens; }
    bool empty() const { return prompt_tokens == 0 && completion_tokens == 0; }
};

// =============================================================================
// Memory Types
// =============================================================================

enum class Tier {
    User,      ///< Durable, disk-backed
    Session,   ///< Process lifetime; holds compressed summaries
    Context    ///< Process lifetime; recent exchanges only
};

const char* tier_name(Tier tier);

using RecordId = uint64_t;

/**
 * @brief A stored memory. Never edited in place; deletion sets the tombstone.
 */
struct MemoryRecord {
    RecordId id = 0;
    std::string text;
    std::vector<float> embedding;
    Tier tier = Tier::Context;
    float importance = 0.5f;
    int64_t created_at_ms = 0;
    std::vector<std::string> tags;
    bool tombstoned = false;

    bool has_tag(const std::string& tag) const;
};

/**
 * @brief Search hit with cosine similarity (or keyword score in degraded mode)
 */
struct ScoredRecord {
    MemoryRecord record;
    float score = 0.0f;
};

} // namespace parley
