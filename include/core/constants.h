#pragma once

/**
 * @file constants.h
 * @brief Tuning parameters and their defaults
 *
 * Config values override these; anything not exposed in the config file
 * lives only here.
 */

#include <cstddef>

namespace parley {
namespace constants {

// =============================================================================
// Prompt Cache
// =============================================================================

namespace cache {
    /// Entry cap before LRU eviction
    constexpr size_t DEFAULT_MAX_ENTRIES = 50;

    /// Default TTL (minutes); 0 means entries never expire
    constexpr int DEFAULT_TTL_MINUTES = 60;

    /// Hex characters of the SHA-256 digest kept in a cache key
    constexpr size_t KEY_HASH_CHARS = 16;
}

// =============================================================================
// Token Estimation
// =============================================================================

namespace tokens {
    /// ASCII text averages ~4 characters per token
    constexpr double ASCII_WEIGHT = 0.25;

    /// Other multi-byte scripts (Latin extended, Cyrillic, ...) per code point
    constexpr double NARROW_WEIGHT = 0.5;

    /// CJK ideographs, kana, hangul, fullwidth forms per code point
    constexpr double WIDE_WEIGHT = 1.0;

    /// Role and framing tokens added per message
    constexpr int PER_MESSAGE_OVERHEAD = 4;

    /// Calibration smoothing factor and clamp
    constexpr double CALIBRATION_ALPHA = 0.2;
    constexpr double MIN_SCALE = 0.5;
    constexpr double MAX_SCALE = 3.0;
}

// =============================================================================
// Memory
// =============================================================================

namespace memory {
    constexpr size_t DEFAULT_TOP_K = 5;
    constexpr float DEFAULT_MIN_SCORE = 0.3f;

    /// Context tier keeps only this many recent exchanges
    constexpr size_t CONTEXT_TIER_CAPACITY = 10;

    /// Session messages retained verbatim before compression kicks in
    constexpr size_t COMPRESS_THRESHOLD = 15;

    /// Newest messages kept verbatim after compression
    constexpr size_t KEEP_RECENT = 5;

    /// Rebuild the index once tombstones reach this share of records
    constexpr float REBUILD_TOMBSTONE_RATIO = 0.25f;

    /// Persist the user-tier index every N adds
    constexpr size_t SNAPSHOT_EVERY = 10;

    constexpr size_t DEFAULT_EMBEDDING_DIMENSIONS = 256;

    /// Prefix of the condensed history message
    constexpr const char* SUMMARY_PREFIX = "[memory summary]";

    /// Local fallback summary length (characters)
    constexpr size_t FALLBACK_SUMMARY_CHARS = 600;
}

// =============================================================================
// Context Assembly
// =============================================================================

namespace context {
    constexpr int DEFAULT_MAX_TOKENS = 4000;
    constexpr size_t DEFAULT_RECENT_MESSAGES = 10;
}

// =============================================================================
// Tools
// =============================================================================

namespace tools {
    constexpr int DEFAULT_TIMEOUT_MS = 10000;
    constexpr size_t DEFAULT_MAX_CONCURRENT = 2;

    /// Max characters of a result kept in the audit record
    constexpr size_t AUDIT_SUMMARY_CHARS = 500;
}

// =============================================================================
// Orchestration
// =============================================================================

namespace orchestration {
    /// Hard limit on probe/tool rounds within a single turn
    constexpr int MAX_TOOL_ROUNDS = 5;

    constexpr size_t MAX_QUEUED_MESSAGES = 4;

    /// Characters per simulated chunk when probe content is reused
    constexpr size_t REPLAY_CHUNK_CHARS = 24;

    /// Buffered turn events per session before the oldest are dropped
    constexpr size_t EVENT_CHANNEL_CAPACITY = 1024;
}

// =============================================================================
// LLM Provider
// =============================================================================

namespace llm {
    constexpr int PROBE_TIMEOUT_MS = 30000;
    constexpr int STREAM_TIMEOUT_MS = 120000;
    constexpr int SUMMARY_TIMEOUT_MS = 60000;
    constexpr int CONNECT_TIMEOUT_MS = 2000;
    constexpr int DEFAULT_MAX_TOKENS = 1024;
}

} // namespace constants
} // namespace parley
