#pragma once

#include "config.h"
#include <string>
#include <memory>
#include <optional>
#include <functional>
#include <cstdint>

namespace parley {

/**
 * @brief Kinds of stable prompt fragments worth caching
 */
enum class SegmentKind {
    SystemInstructions,
    ToolSchemas,
    Identity
};

const char* segment_kind_name(SegmentKind kind);

/**
 * @brief Cache counters since construction (or last clear())
 */
struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
    uint64_t tokens_saved = 0;   ///< Estimated prompt tokens served from cache
    size_t entries = 0;

    double hit_rate() const {
        uint64_t total = hits + misses;
        return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
    }
};

/**
 * @brief Canonicalizes prompt content so equivalent fragments share a key
 */
class ContentNormalizer {
public:
    /**
     * @brief Strip volatile fields and canonicalize whitespace
     *
     * Timestamps, clock times, UUIDs and session/request/trace id fields are
     * replaced by fixed placeholders; CRLF becomes LF; trailing spaces are
     * trimmed, space runs collapsed, and 3+ newlines collapsed to 2.
     */
    static std::string normalize_text(const std::string& text);

    /**
     * @brief Sort a JSON array of tool schemas by function name and dump it compactly.
     * Falls back to normalize_text() when the input is not valid JSON.
     */
    static std::string normalize_tool_schemas(const std::string& schemas_json);

    static std::string normalize(SegmentKind kind, const std::string& content);

    /// "<kind>:<16 hex chars of SHA-256(normalized content)>"
    static std::string cache_key(SegmentKind kind, const std::string& content);
};

/**
 * @brief Content-addressed cache of prompt fragments
 *
 * Lookups take a shared lock and may run concurrently; inserts, eviction
 * and expiry removal take the exclusive lock. Expired entries are removed
 * when a read finds them. Once the entry count exceeds the cap, the least
 * recently used entry is evicted.
 */
class PromptCache {
public:
    /// Millisecond clock; injectable so TTL expiry can be tested
    using ClockFn = std::function<int64_t()>;

    explicit PromptCache(const CacheConfig& config = CacheConfig(), ClockFn clock = nullptr);
    ~PromptCache();

    PromptCache(const PromptCache&) = delete;
    PromptCache& operator=(const PromptCache&) = delete;

    /**
     * @brief Look up a fragment
     * @param content Raw or normalized content; normalized again internally
     * @return Cached value, or nullopt on miss, expiry or a corrupted entry
     */
    std::optional<std::string> get(SegmentKind kind, const std::string& content);

    /**
     * @brief Store a fragment
     * @param ttl_minutes Negative = config default, 0 = never expires
     */
    void put(SegmentKind kind, const std::string& content,
             const std::string& value, int ttl_minutes = -1);

    /**
     * @brief Return the cached fragment or compute, store and return it
     * @param was_hit Optional out-flag set to true on a cache hit
     */
    std::string get_or_compute(SegmentKind kind, const std::string& content,
                               const std::function<std::string()>& compute,
                               int ttl_minutes = -1, bool* was_hit = nullptr);

    /// Drop every entry of one kind; returns how many were removed
    size_t invalidate_kind(SegmentKind kind);

    void clear();

    CacheStats stats() const;
    size_t size() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley
