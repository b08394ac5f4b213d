#include "tool_executor.h"
#include "tool_schema.h"
#include "core/types.h"
#include "logger.h"
#include "utils.h"
#include <atomic>
#include <chrono>
#include <future>

using json = nlohmann::json;

namespace parley {

namespace {

constexpr int TASK_QUEUED = 0;
constexpr int TASK_STARTED = 1;
constexpr int TASK_ABANDONED = 2;

} // namespace

const char* invocation_status_name(InvocationStatus status) {
    switch (status) {
        case InvocationStatus::Ok: return "ok";
        case InvocationStatus::Error: return "error";
        case InvocationStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string ToolInvocation::to_model_text() const {
    switch (status) {
        case InvocationStatus::Ok:
            return "Tool " + tool_name + " succeeded. Result:\n" + content;
        case InvocationStatus::Cancelled:
            return "Tool " + tool_name + " was cancelled by the user; no changes were made.";
        case InvocationStatus::Error:
            break;
    }
    return "Tool " + tool_name + " failed. Error: " + error.describe();
}

ToolExecutor::ToolExecutor(ToolRegistry& registry,
                           const ToolsConfig& config,
                           std::shared_ptr<ConfirmationHandler> confirmation,
                           std::shared_ptr<AuditLog> audit)
    : registry_(registry), config_(config),
      confirmation_(std::move(confirmation)), audit_(std::move(audit)),
      running_(true), active_executions_(0) {

    size_t workers = config_.max_concurrent > 0 ? config_.max_concurrent : 1;
    for (size_t i = 0; i < workers; ++i) {
        worker_threads_.emplace_back(&ToolExecutor::worker_thread, this);
    }
}

ToolExecutor::~ToolExecutor() {
    shutdown();

    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

VoidResult ToolExecutor::register_tool(std::shared_ptr<Tool> tool) {
    return registry_.register_tool(std::move(tool));
}

void ToolExecutor::set_confirmation_handler(std::shared_ptr<ConfirmationHandler> handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    confirmation_ = std::move(handler);
}

ToolInvocation ToolExecutor::invoke(const std::string& tool_name,
                                    const std::string& arguments_json,
                                    const std::string& call_id,
                                    int timeout_ms) {
    ToolInvocation inv;
    inv.call_id = call_id;
    inv.tool_name = tool_name;
    inv.arguments = arguments_json;
    inv.started_at_ms = now_ms();

    auto fail = [&inv](InvocationStatus status, Error error) {
        inv.status = status;
        inv.error = std::move(error);
        inv.finished_at_ms = now_ms();
        return inv;
    };

    auto tool = registry_.get_tool(tool_name);
    const ToolDefinition* def = registry_.get_definition(tool_name);
    if (!tool || !def) {
        LOG_TOOLS("Unknown tool requested: " + tool_name);
        return fail(InvocationStatus::Error, make_validation_error("Unknown tool: " + tool_name));
    }

    std::string raw = arguments_json;
    if (utils::is_empty_or_whitespace(raw)) {
        raw = "{}";
    }
    json args = json::parse(raw, nullptr, false);
    if (args.is_discarded()) {
        LOG_TOOLS("Malformed arguments for " + tool_name);
        return fail(InvocationStatus::Error,
                    make_validation_error("Arguments are not valid JSON: " + arguments_json));
    }

    auto valid = validate_arguments(def->parameters, args);
    if (!valid) {
        LOG_TOOLS("Arguments rejected for " + tool_name + ": " + valid.error().message);
        return fail(InvocationStatus::Error, valid.error());
    }

    std::string confirmed_by;
    if (def->permission == Permission::Write) {
        std::shared_ptr<ConfirmationHandler> handler;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler = confirmation_;
        }

        ConfirmationRequest request;
        request.tool_name = tool_name;
        request.arguments = args.dump();
        request.preview = tool->preview(args);

        ConfirmationDecision decision = handler ? handler->confirm(request)
                                                : ConfirmationDecision::reject();
        if (!decision.accepted) {
            LOG_TOOLS("User rejected " + tool_name);
            return fail(InvocationStatus::Cancelled,
                        make_cancelled_error("User rejected " + tool_name));
        }
        confirmed_by = decision.confirmed_by.empty() ? "user" : decision.confirmed_by;
    }

    int effective_timeout = timeout_ms < 0 ? config_.timeout_ms : timeout_ms;
    LOG_TOOLS("Invoking " + tool_name + " (" + permission_name(def->permission) + ")");
    auto result = execute_with_timeout(tool, args, tool_name, effective_timeout);
    inv.finished_at_ms = now_ms();

    if (result.is_ok()) {
        inv.status = InvocationStatus::Ok;
        inv.content = result.value();
    } else {
        inv.status = InvocationStatus::Error;
        inv.error = result.error();
    }
    LOG_TOOLS(tool_name + " " + invocation_status_name(inv.status) +
              " in " + std::to_string(inv.duration_ms()) + "ms");

    if (def->permission == Permission::Write && audit_) {
        AuditRecord record;
        record.tool = tool_name;
        record.arguments = args.dump();
        record.confirmed_by = confirmed_by;
        record.timestamp_ms = wall_clock_ms();
        record.success = inv.ok();
        record.result_summary = inv.ok() ? inv.content : inv.error.describe();
        auto appended = audit_->append(record);
        if (!appended) {
            Logger::warn("[Tools] audit append failed: " + appended.error().message);
        }
    }

    return inv;
}

Result<std::string> ToolExecutor::execute_with_timeout(std::shared_ptr<Tool> tool,
                                                       const json& args,
                                                       const std::string& tool_name,
                                                       int timeout_ms) {
    if (!running_) {
        return make_error(ErrorType::InvalidState, "Tool executor is shut down");
    }

    // Shared with the worker so an abandoned call can still complete safely
    auto promise = std::make_shared<std::promise<Result<std::string>>>();
    std::future<Result<std::string>> future = promise->get_future();
    // Claimed once: by the worker (Started) or by a timed-out caller (Abandoned)
    auto claim = std::make_shared<std::atomic<int>>(TASK_QUEUED);

    ExecutionTask task;
    task.run = [tool, args, tool_name, promise, claim]() {
        int expected = TASK_QUEUED;
        if (!claim->compare_exchange_strong(expected, TASK_STARTED)) {
            LOG_TOOLS("Skipping " + tool_name + ": caller gave up before it started");
            return;
        }
        try {
            promise->set_value(tool->invoke(args));
        } catch (const std::exception& e) {
            Logger::error("[Tools] exception in " + tool_name + ": " + e.what());
            promise->set_value(make_error(ErrorType::ToolExecution,
                                          tool_name + " threw: " + e.what()));
        } catch (...) {
            Logger::error("[Tools] unknown exception in " + tool_name);
            promise->set_value(make_error(ErrorType::ToolExecution,
                                          tool_name + " threw an unknown exception"));
        }
    };

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        task_queue_.push_back(std::move(task));
    }
    queue_cv_.notify_one();

    if (timeout_ms > 0) {
        if (future.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
            int expected = TASK_QUEUED;
            if (claim->compare_exchange_strong(expected, TASK_ABANDONED)) {
                Logger::warn("[Tools] " + tool_name + " timed out after " +
                             std::to_string(timeout_ms) + "ms before starting");
                return Error(ErrorType::ToolExecution,
                             tool_name + " timed out after " + std::to_string(timeout_ms) +
                             "ms before it started; it was not run");
            }
            Logger::warn("[Tools] " + tool_name + " timed out after " + std::to_string(timeout_ms) + "ms");
            return Error(ErrorType::ToolExecution,
                         tool_name + " timed out after " + std::to_string(timeout_ms) +
                         "ms while running; its outcome is unknown");
        }
    }

    Result<std::string> result = future.get();
    if (result.is_error() && result.error().type != ErrorType::ToolExecution) {
        // Tool-reported failures are all execution failures from the turn's point of view
        return Error(ErrorType::ToolExecution, result.error().message);
    }
    return result;
}

size_t ToolExecutor::pending_count() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.size() + active_executions_;
}

bool ToolExecutor::is_idle() const {
    return pending_count() == 0;
}

void ToolExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    queue_cv_.notify_all();
}

void ToolExecutor::worker_thread() {
    while (true) {
        ExecutionTask task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return !task_queue_.empty() || !running_;
            });

            if (task_queue_.empty()) {
                break;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop_front();
            active_executions_++;
        }

        task.run();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_executions_--;
        }
    }
}

} // namespace parley
