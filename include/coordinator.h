#pragma once

/**
 * @file coordinator.h
 * @brief Drives one turn at a time through probe, tools and stream
 */

#include "core/types.h"
#include "config.h"
#include "errors.h"
#include "event_channel.h"
#include "llm_provider.h"
#include "context_assembler.h"
#include "tool_executor.h"
#include "token_estimator.h"
#include "state_machine.h"
#include "memory/conversation_memory.h"
#include "memory/tiered_memory.h"
#include "memory/memory_maintenance.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace parley {

enum class TurnEventKind {
    StateChanged,
    Chunk,
    ToolStarted,
    ToolFinished,
    Usage,
    Done,
    Failed,
    Cancelled
};

const char* turn_event_kind_name(TurnEventKind kind);

/**
 * @brief Progress notification sent from the coordinator worker
 */
struct TurnEvent {
    TurnEventKind kind = TurnEventKind::StateChanged;
    uint64_t turn_id = 0;
    TurnState state = TurnState::Idle;  ///< StateChanged
    std::string text;                   ///< Chunk delta, final response on Done
    std::string tool_name;              ///< ToolStarted / ToolFinished
    bool tool_ok = false;               ///< ToolFinished
    UsageCounters usage;                ///< Usage
    Error error;                        ///< Failed / Cancelled
};

/**
 * @brief Final result of a turn
 */
struct TurnOutcome {
    uint64_t turn_id = 0;
    TurnState final_state = TurnState::Idle;
    std::string response;
    Error error;                        ///< Set unless final_state == Done

    int tool_rounds = 0;
    int probe_calls = 0;
    int stream_calls = 0;
    bool downgraded = false;
    std::vector<ToolInvocation> tool_invocations;
    UsageCounters usage;                ///< Summed over all provider calls

    bool ok() const { return final_state == TurnState::Done; }
};

/**
 * @brief Handle returned by submit()
 */
struct TurnTicket {
    uint64_t turn_id = 0;
    std::shared_future<TurnOutcome> outcome;
};

/**
 * @brief Collaborators of one session's coordinator
 *
 * memory and maintenance may be null.
 */
struct CoordinatorDeps {
    std::shared_ptr<LlmProvider> provider;
    std::shared_ptr<ContextAssembler> assembler;
    std::shared_ptr<ToolExecutor> tools;
    std::shared_ptr<memory::ConversationMemory> history;
    std::shared_ptr<TokenEstimator> estimator;
    std::shared_ptr<memory::TieredMemory> memory;
    std::shared_ptr<memory::MemoryMaintenance> maintenance;
};

/**
 * @brief Per-session turn driver
 *
 * Turns run on a dedicated worker thread, one at a time. submit() never
 * blocks on the network: it queues the message (or rejects it, per the
 * busy policy) and returns a ticket. Progress arrives on the event
 * channel. Memory is only written when a turn reaches Done.
 */
class OrchestrationCoordinator {
public:
    OrchestrationCoordinator(CoordinatorDeps deps,
                             const Config& config,
                             std::shared_ptr<EventChannel<TurnEvent>> events = nullptr);
    ~OrchestrationCoordinator();

    // Non-copyable
    OrchestrationCoordinator(const OrchestrationCoordinator&) = delete;
    OrchestrationCoordinator& operator=(const OrchestrationCoordinator&) = delete;

    /**
     * @brief Hand a user message to the worker
     * @return Busy when the policy rejects it, Validation for an empty message,
     *         InvalidState after shutdown
     */
    Result<TurnTicket> submit(const std::string& message);

    /**
     * @brief Cancel the running turn and every queued one
     * @return true if anything was cancelled
     */
    bool cancel();

    bool busy() const;
    size_t queued() const;
    TurnState current_state() const { return current_state_.load(); }
    uint64_t turns_completed() const { return turns_completed_.load(); }

    std::shared_ptr<EventChannel<TurnEvent>> events() const { return events_; }

    /**
     * @brief Cancel outstanding work and join the worker
     */
    void shutdown();

private:
    struct PendingTurn {
        uint64_t turn_id = 0;
        std::string message;
        std::shared_ptr<std::promise<TurnOutcome>> promise;
    };

    void worker_loop();
    TurnOutcome run_turn(const PendingTurn& turn);

    void set_state(TurnStateMachine& sm, TurnState next, uint64_t turn_id);
    void emit(TurnEvent event);
    void add_usage(TurnOutcome& outcome, const UsageCounters& usage, int estimated_prompt_tokens);
    TurnOutcome finish_failed(TurnStateMachine& sm, TurnOutcome outcome, Error error);
    TurnOutcome finish_cancelled(TurnStateMachine& sm, TurnOutcome outcome);
    void commit_turn(const std::string& user_message, const std::vector<Message>& turn_messages,
                     const std::string& response);

    CoordinatorDeps deps_;
    Config config_;
    std::shared_ptr<EventChannel<TurnEvent>> events_;

    std::deque<PendingTurn> queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    bool active_ = false;
    bool stopping_ = false;
    uint64_t next_turn_id_ = 1;

    std::atomic<bool> turn_cancelled_{false};
    std::atomic<TurnState> current_state_{TurnState::Idle};
    std::atomic<uint64_t> turns_completed_{0};

    std::thread worker_thread_;
};

} // namespace parley
