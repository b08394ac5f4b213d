#pragma once

#include "tool.h"
#include "tool_registry.h"
#include "confirmation.h"
#include "audit_log.h"
#include "config.h"
#include <string>
#include <functional>
#include <memory>
#include <vector>
#include <thread>
#include <atomic>
#include <mutex>
#include <deque>
#include <condition_variable>

namespace parley {

enum class InvocationStatus {
    Ok,
    Error,
    Cancelled       ///< WRITE call rejected by the user
};

const char* invocation_status_name(InvocationStatus status);

/**
 * @brief Outcome of one tool call
 */
struct ToolInvocation {
    std::string call_id;
    std::string tool_name;
    std::string arguments;          ///< JSON as received
    InvocationStatus status = InvocationStatus::Error;
    std::string content;            ///< Tool output when status == Ok
    Error error;                    ///< Set when status == Error or Cancelled
    int64_t started_at_ms = 0;
    int64_t finished_at_ms = 0;

    bool ok() const { return status == InvocationStatus::Ok; }
    int64_t duration_ms() const { return finished_at_ms - started_at_ms; }

    /// Text fed back to the model as the tool message
    std::string to_model_text() const;
};

/**
 * @brief Validates, confirms and runs tool calls
 *
 * Tools run on a small worker pool so a hung handler can be abandoned
 * after its timeout without blocking the caller. Each call runs at most
 * once; nothing is retried here.
 */
class ToolExecutor {
public:
    /**
     * @param registry     Tool table (must outlive the executor)
     * @param config       Timeout and pool size
     * @param confirmation Approves WRITE calls; without one every WRITE call is rejected
     * @param audit        Receives one record per accepted WRITE call (optional)
     */
    ToolExecutor(ToolRegistry& registry,
                 const ToolsConfig& config,
                 std::shared_ptr<ConfirmationHandler> confirmation = nullptr,
                 std::shared_ptr<AuditLog> audit = nullptr);

    ~ToolExecutor();

    // Non-copyable
    ToolExecutor(const ToolExecutor&) = delete;
    ToolExecutor& operator=(const ToolExecutor&) = delete;

    /// Convenience passthrough to the registry
    VoidResult register_tool(std::shared_ptr<Tool> tool);

    /**
     * @brief Run one tool call to completion
     *
     * Order: lookup, argument parse, schema validation, confirmation for
     * WRITE tools, execution with timeout. Never throws.
     * @param timeout_ms Per-call timeout (< 0 = configured default, 0 = none)
     */
    ToolInvocation invoke(const std::string& tool_name,
                          const std::string& arguments_json,
                          const std::string& call_id = "",
                          int timeout_ms = -1);

    void set_confirmation_handler(std::shared_ptr<ConfirmationHandler> handler);

    ToolRegistry& registry() { return registry_; }

    /// Queued plus running handlers (including abandoned ones still running)
    size_t pending_count() const;

    bool is_idle() const;

    /**
     * @brief Stop accepting work; running handlers finish before the destructor returns
     */
    void shutdown();

private:
    struct ExecutionTask {
        std::function<void()> run;
    };

    void worker_thread();
    Result<std::string> execute_with_timeout(std::shared_ptr<Tool> tool,
                                             const nlohmann::json& args,
                                             const std::string& tool_name,
                                             int timeout_ms);

    ToolRegistry& registry_;
    ToolsConfig config_;
    std::shared_ptr<ConfirmationHandler> confirmation_;
    std::shared_ptr<AuditLog> audit_;
    mutable std::mutex handler_mutex_;

    std::atomic<bool> running_;
    std::atomic<size_t> active_executions_;

    std::deque<ExecutionTask> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;

    std::vector<std::thread> worker_threads_;
};

} // namespace parley
