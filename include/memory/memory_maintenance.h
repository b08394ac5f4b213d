#pragma once

/**
 * @file memory_maintenance.h
 * @brief Off-turn session compression and index rebuilds
 */

#include "memory/tiered_memory.h"
#include "memory/conversation_memory.h"
#include "background_worker.h"
#include "llm_provider.h"
#include "config.h"
#include <atomic>
#include <memory>

namespace parley {
namespace memory {

/**
 * @brief Schedules memory upkeep on its own worker thread
 *
 * At most one compression job is in flight per session, guarded by a
 * pending flag; the same holds for each tier's index rebuild. Scheduling
 * never blocks the caller.
 */
class MemoryMaintenance {
public:
    MemoryMaintenance(TieredMemory& tiers,
                      ConversationMemory& conversation,
                      std::shared_ptr<LlmProvider> provider,
                      const MemoryConfig& config,
                      int summary_timeout_ms);
    ~MemoryMaintenance();

    // Non-copyable
    MemoryMaintenance(const MemoryMaintenance&) = delete;
    MemoryMaintenance& operator=(const MemoryMaintenance&) = delete;

    /**
     * @brief Queue compression when verbatim history exceeds the threshold
     * @return true if a job was queued by this call
     */
    bool maybe_schedule_compression();

    /**
     * @brief Queue a rebuild for every tier past its tombstone threshold
     * @return Number of rebuild jobs queued
     */
    size_t maybe_schedule_index_maintenance();

    bool compression_pending() const { return compression_pending_.load(); }
    uint64_t compressions_completed() const { return compressions_completed_.load(); }

    bool wait_idle(int timeout_ms = 0);

    void shutdown();

private:
    void run_compression();

    TieredMemory& tiers_;
    ConversationMemory& conversation_;
    std::shared_ptr<LlmProvider> provider_;
    MemoryConfig config_;
    int summary_timeout_ms_;

    std::atomic<bool> compression_pending_{false};
    std::atomic<bool> rebuild_pending_[3]{};
    std::atomic<uint64_t> compressions_completed_{0};

    BackgroundWorker worker_;
};

} // namespace memory
} // namespace parley
