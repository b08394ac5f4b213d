#pragma once

#include "config.h"
#include "coordinator.h"
#include "confirmation.h"
#include "embedding_provider.h"
#include "llm_provider.h"
#include "prompt_cache.h"
#include "audit_log.h"
#include <memory>

namespace parley {

/**
 * @brief Snapshot of a session's counters for /stats
 */
struct SessionStats {
    CacheStats cache;
    memory::StoreStats user;
    memory::StoreStats session;
    memory::StoreStats context;
    AuditStats audit;
    uint64_t turns_completed = 0;
    uint64_t compressions = 0;
    size_t history_messages = 0;
    double token_scale = 1.0;
};

/**
 * @brief One conversation with its own cache, memory, tools and coordinator
 *
 * Nothing is shared between sessions except the providers passed in, so
 * several sessions can live in one process.
 */
class AssistantSession {
public:
    /**
     * @param provider     LLM backend
     * @param embedder     Embedding backend (shared by all tiers)
     * @param confirmation Approves WRITE tools; null rejects them all
     */
    AssistantSession(const Config& config,
                     std::shared_ptr<LlmProvider> provider,
                     std::shared_ptr<EmbeddingProvider> embedder,
                     std::shared_ptr<ConfirmationHandler> confirmation);

    ~AssistantSession();

    // Non-copyable
    AssistantSession(const AssistantSession&) = delete;
    AssistantSession& operator=(const AssistantSession&) = delete;

    /**
     * @brief Open storage, register the built-in tools and start the coordinator
     */
    VoidResult initialize();

    /// Register an extra tool (before or after initialize())
    VoidResult register_tool(std::shared_ptr<Tool> tool);

    Result<TurnTicket> send(const std::string& message);

    bool cancel();

    std::shared_ptr<EventChannel<TurnEvent>> events() const;

    SessionStats stats() const;

    PromptCache& cache();
    memory::TieredMemory& tiers();
    memory::ConversationMemory& history();
    OrchestrationCoordinator& coordinator();

    /**
     * @brief Wait for background memory work (tests, shutdown)
     */
    bool wait_for_maintenance(int timeout_ms = 0);

    /**
     * @brief Stop the coordinator and background work, snapshot durable memory
     */
    void shutdown();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace parley
