#pragma once

/**
 * @file vector_memory_store.h
 * @brief Per-tier nearest-neighbor memory
 *
 * Features:
 * - Exact cosine search over a flat vector index
 * - Tombstone deletes, compacted by run_maintenance()
 * - Durable user tier: binary index, JSON metadata sidecar and an
 *   append-only JSONL backup log written before add/remove return
 * - Keyword matching over the backup records when the index is unavailable
 */

#include "core/types.h"
#include "core/constants.h"
#include "embedding_provider.h"
#include "llm_provider.h"
#include "errors.h"
#include <string>
#include <vector>
#include <memory>
#include <optional>

namespace parley {
namespace memory {

struct StoreOptions {
    Tier tier = Tier::Context;

    /// Live-record cap; beyond it the oldest record is tombstoned (0 = unbounded)
    size_t capacity = 0;

    float rebuild_tombstone_ratio = constants::memory::REBUILD_TOMBSTONE_RATIO;

    /// Persist index and sidecar every N adds (durable stores only)
    size_t snapshot_every = constants::memory::SNAPSHOT_EVERY;

    /// Directory for durable files; empty keeps the store in memory
    std::string storage_dir;

    /// File name stem inside storage_dir (e.g. the user id)
    std::string file_stem = "default";
};

struct RecordMetadata {
    float importance = 0.5f;
    std::vector<std::string> tags;
};

struct StoreStats {
    size_t live_records = 0;
    size_t tombstones = 0;
    bool index_available = true;
    bool durable = false;
};

/**
 * @brief Outcome of compressing old turns into one record
 */
struct CompressionResult {
    RecordId id = 0;
    std::string summary;        ///< Stored text, prefixed with the summary marker
    bool used_fallback = false; ///< Provider failed; a local summary was stored
};

/**
 * @brief Memory for one tier
 *
 * search() runs concurrently with other searches; add, remove and
 * maintenance are serialized behind a writer lock. Embedding calls happen
 * outside the lock.
 */
class VectorMemoryStore {
public:
    VectorMemoryStore(const StoreOptions& options, std::shared_ptr<EmbeddingProvider> embedder);
    ~VectorMemoryStore();

    // Non-copyable
    VectorMemoryStore(const VectorMemoryStore&) = delete;
    VectorMemoryStore& operator=(const VectorMemoryStore&) = delete;

    /**
     * @brief Load durable state (no-op for in-memory stores)
     *
     * Recovers from a missing or inconsistent index by replaying the backup
     * log. If the records cannot be re-embedded the store stays usable in
     * keyword mode and the error is logged, not returned.
     * @return Error only when the storage directory cannot be created
     */
    VoidResult open();

    /**
     * @brief Embed text and append a record
     * @return New record id, or an error when the text could not be stored
     */
    Result<RecordId> add(const std::string& text, const RecordMetadata& metadata = {});

    /**
     * @brief Rank live records by similarity to the query
     * @param min_score Cosine floor; ignored in keyword mode, where any overlap counts
     */
    std::vector<ScoredRecord> search(const std::string& query, size_t k, float min_score) const;

    /**
     * @brief Summarize turns into one condensed record
     *
     * Blocks on the provider; call it from a background worker only.
     */
    Result<CompressionResult> compress(const std::vector<Message>& turns,
                                       LlmProvider& provider,
                                       const RequestOptions& options);

    /// Tombstone a record; false if unknown or already deleted
    bool remove(RecordId id);

    std::optional<MemoryRecord> get(RecordId id) const;

    /// Live records, oldest first
    std::vector<MemoryRecord> records() const;

    /// True once tombstones reach the configured share of stored slots
    bool needs_maintenance() const;

    /// Drop tombstoned slots and persist; returns the number reclaimed
    size_t run_maintenance();

    /// Write index and sidecar now (durable stores only)
    VoidResult snapshot();

    StoreStats stats() const;
    Tier tier() const;

    std::string index_path() const;
    std::string metadata_path() const;
    std::string backup_log_path() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace memory
} // namespace parley
