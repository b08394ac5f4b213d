#pragma once

/**
 * @file tiered_memory.h
 * @brief User, session and context stores behind one retrieval API
 */

#include "memory/vector_memory_store.h"
#include "config.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace parley {
namespace memory {

class TieredMemory {
public:
    /**
     * @param durable_user_tier When false the user tier stays in memory (tests, demos)
     */
    TieredMemory(const MemoryConfig& config,
                 std::shared_ptr<EmbeddingProvider> embedder,
                 const std::string& storage_dir,
                 bool durable_user_tier);

    // Non-copyable
    TieredMemory(const TieredMemory&) = delete;
    TieredMemory& operator=(const TieredMemory&) = delete;

    /// Load the durable user tier
    VoidResult open();

    VectorMemoryStore& store(Tier tier);
    const VectorMemoryStore& store(Tier tier) const;

    /**
     * @brief Search all tiers, user first, then session, then context
     *
     * Results keep tier order and are cut at k; duplicate texts are dropped.
     */
    std::vector<ScoredRecord> retrieve(const std::string& query, size_t k, float min_score) const;

    /**
     * @brief Store a completed exchange
     *
     * The exchange always lands in the context tier. A remember request or
     * personal statement from the user is also stored verbatim in the user
     * tier. Serialized by the session write lock.
     * @return Ids of the records written
     */
    std::vector<RecordId> commit_exchange(const std::string& user_text,
                                          const std::string& assistant_text);

    /// Explicit user-tier write (e.g. from a tool)
    Result<RecordId> remember(const std::string& text, const std::vector<std::string>& tags = {});

    /// Highest-importance user records that describe who the user is
    std::vector<MemoryRecord> user_identity(size_t max_records) const;

    /// Base 0.5, +0.1 per keyword, +0.1 for 20..200 chars, +0.2 for "important" tag; clamped to [0, 1]
    static float evaluate_importance(const std::string& text, const std::vector<std::string>& tags);

    static bool has_remember_intent(const std::string& text);

    /// Preference, identity or habit statements worth keeping long term
    static bool contains_personal_fact(const std::string& text);

private:
    MemoryConfig config_;
    std::unique_ptr<VectorMemoryStore> user_;
    std::unique_ptr<VectorMemoryStore> session_;
    std::unique_ptr<VectorMemoryStore> context_;
    std::mutex write_mutex_;
};

} // namespace memory
} // namespace parley
