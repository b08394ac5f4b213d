#include "coordinator.h"
#include "core/constants.h"
#include "logger.h"
#include "utils.h"
#include <exception>

namespace parley {

const char* turn_event_kind_name(TurnEventKind kind) {
    switch (kind) {
        case TurnEventKind::StateChanged: return "state_changed";
        case TurnEventKind::Chunk: return "chunk";
        case TurnEventKind::ToolStarted: return "tool_started";
        case TurnEventKind::ToolFinished: return "tool_finished";
        case TurnEventKind::Usage: return "usage";
        case TurnEventKind::Done: return "done";
        case TurnEventKind::Failed: return "failed";
        case TurnEventKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

OrchestrationCoordinator::OrchestrationCoordinator(CoordinatorDeps deps,
                                                   const Config& config,
                                                   std::shared_ptr<EventChannel<TurnEvent>> events)
    : deps_(std::move(deps)), config_(config), events_(std::move(events)) {
    if (!deps_.estimator) {
        deps_.estimator = std::make_shared<TokenEstimator>();
    }
    worker_thread_ = std::thread(&OrchestrationCoordinator::worker_loop, this);
    LOG_COORD("Coordinator started (max_tool_rounds=" +
              std::to_string(config_.orchestration.max_tool_rounds) + ")");
}

OrchestrationCoordinator::~OrchestrationCoordinator() {
    shutdown();
}

Result<TurnTicket> OrchestrationCoordinator::submit(const std::string& message) {
    if (utils::is_empty_or_whitespace(message)) {
        return make_validation_error("Message is empty");
    }

    PendingTurn turn;
    turn.message = message;
    turn.promise = std::make_shared<std::promise<TurnOutcome>>();

    TurnTicket ticket;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            return make_error(ErrorType::InvalidState, "Session is shutting down");
        }

        bool occupied = active_ || !queue_.empty();
        if (occupied && config_.orchestration.busy_policy == BusyPolicy::Reject) {
            LOG_COORD("Rejected message: a turn is already in progress");
            return Error(ErrorType::Busy, "A turn is already in progress", true);
        }
        if (queue_.size() >= config_.orchestration.max_queued_messages) {
            LOG_COORD("Rejected message: queue full");
            return Error(ErrorType::Busy, "Too many queued messages", true);
        }

        turn.turn_id = next_turn_id_++;
        ticket.turn_id = turn.turn_id;
        ticket.outcome = turn.promise->get_future().share();
        queue_.push_back(std::move(turn));
    }
    queue_cv_.notify_one();
    return ticket;
}

bool OrchestrationCoordinator::cancel() {
    std::deque<PendingTurn> dropped;
    bool cancelled_active = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        dropped.swap(queue_);
        if (active_) {
            turn_cancelled_ = true;
            cancelled_active = true;
        }
    }

    for (auto& turn : dropped) {
        TurnOutcome outcome;
        outcome.turn_id = turn.turn_id;
        outcome.final_state = TurnState::Cancelled;
        outcome.error = make_cancelled_error("Cancelled before it started");
        TurnEvent event;
        event.kind = TurnEventKind::Cancelled;
        event.turn_id = turn.turn_id;
        event.error = outcome.error;
        emit(event);
        turn.promise->set_value(outcome);
    }

    if (cancelled_active || !dropped.empty()) {
        LOG_COORD("Cancel requested (active=" + std::string(cancelled_active ? "yes" : "no") +
                  ", queued=" + std::to_string(dropped.size()) + ")");
        return true;
    }
    return false;
}

bool OrchestrationCoordinator::busy() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return active_ || !queue_.empty();
}

size_t OrchestrationCoordinator::queued() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void OrchestrationCoordinator::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_ && !worker_thread_.joinable()) {
            return;
        }
        stopping_ = true;
    }
    cancel();
    queue_cv_.notify_all();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    if (events_) {
        events_->close();
    }
}

void OrchestrationCoordinator::worker_loop() {
    while (true) {
        PendingTurn turn;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return stopping_ || !queue_.empty();
            });
            if (queue_.empty()) {
                break;
            }
            turn = std::move(queue_.front());
            queue_.pop_front();
            active_ = true;
            turn_cancelled_ = false;
        }

        TurnOutcome outcome;
        try {
            outcome = run_turn(turn);
        } catch (const std::exception& e) {
            // Components return Results; anything thrown here is a bug, not a turn outcome
            Logger::error(std::string("[Coordinator] turn ") + std::to_string(turn.turn_id) +
                          " aborted by exception: " + e.what());
            outcome.turn_id = turn.turn_id;
            outcome.final_state = TurnState::Failed;
            outcome.error = make_error(ErrorType::InvalidState, std::string("Internal error: ") + e.what());
            TurnEvent event;
            event.kind = TurnEventKind::Failed;
            event.turn_id = turn.turn_id;
            event.error = outcome.error;
            emit(event);
        }

        current_state_ = TurnState::Idle;
        turns_completed_++;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_ = false;
        }
        turn.promise->set_value(std::move(outcome));
    }
}

void OrchestrationCoordinator::emit(TurnEvent event) {
    if (events_) {
        events_->push(std::move(event));
    }
}

void OrchestrationCoordinator::set_state(TurnStateMachine& sm, TurnState next, uint64_t turn_id) {
    TurnState previous = sm.get_state();
    if (!sm.transition(next)) {
        Logger::warn(std::string("[Coordinator] refused transition ") + turn_state_name(previous) +
                     " -> " + turn_state_name(next));
        return;
    }
    current_state_ = next;
    LOG_TURN(turn_id, turn_state_name(next), std::string("from=") + turn_state_name(previous));

    TurnEvent event;
    event.kind = TurnEventKind::StateChanged;
    event.turn_id = turn_id;
    event.state = next;
    emit(event);
}

void OrchestrationCoordinator::add_usage(TurnOutcome& outcome, const UsageCounters& usage,
                                         int estimated_prompt_tokens) {
    if (usage.empty()) {
        return;
    }
    outcome.usage.prompt_tokens += usage.prompt_tokens;
    outcome.usage.completion_tokens += usage.completion_tokens;
    if (usage.prompt_tokens > 0) {
        deps_.estimator->calibrate(estimated_prompt_tokens, usage.prompt_tokens);
    }

    TurnEvent event;
    event.kind = TurnEventKind::Usage;
    event.turn_id = outcome.turn_id;
    event.usage = usage;
    emit(event);
}

TurnOutcome OrchestrationCoordinator::finish_failed(TurnStateMachine& sm, TurnOutcome outcome, Error error) {
    set_state(sm, TurnState::Failed, outcome.turn_id);
    outcome.final_state = TurnState::Failed;
    outcome.error = error;
    Logger::warn("[Coordinator] turn " + std::to_string(outcome.turn_id) + " failed: " + error.describe());

    TurnEvent event;
    event.kind = TurnEventKind::Failed;
    event.turn_id = outcome.turn_id;
    event.error = std::move(error);
    emit(event);
    return outcome;
}

TurnOutcome OrchestrationCoordinator::finish_cancelled(TurnStateMachine& sm, TurnOutcome outcome) {
    set_state(sm, TurnState::Cancelled, outcome.turn_id);
    outcome.final_state = TurnState::Cancelled;
    outcome.error = make_cancelled_error("Turn cancelled");

    TurnEvent event;
    event.kind = TurnEventKind::Cancelled;
    event.turn_id = outcome.turn_id;
    event.error = outcome.error;
    emit(event);
    return outcome;
}

void OrchestrationCoordinator::commit_turn(const std::string& user_message,
                                           const std::vector<Message>& turn_messages,
                                           const std::string& response) {
    if (deps_.history) {
        deps_.history->add_messages(turn_messages);
    }
    if (deps_.memory) {
        deps_.memory->commit_exchange(user_message, response);
    }
    if (deps_.maintenance) {
        deps_.maintenance->maybe_schedule_compression();
        deps_.maintenance->maybe_schedule_index_maintenance();
    }
}

TurnOutcome OrchestrationCoordinator::run_turn(const PendingTurn& turn) {
    TurnStateMachine sm;
    TurnOutcome outcome;
    outcome.turn_id = turn.turn_id;

    const auto& oc = config_.orchestration;
    const int max_rounds = oc.max_tool_rounds > 0 ? oc.max_tool_rounds : 1;

    std::vector<Message> history = deps_.history ? deps_.history->get_messages() : std::vector<Message>();
    AssembledContext ctx = deps_.assembler->build(history, turn.message, config_.context);

    std::vector<Message> working = ctx.messages;
    std::vector<Message> turn_messages;
    turn_messages.push_back(working.back());

    LOG_COORD("turn " + std::to_string(turn.turn_id) + ": " + std::to_string(working.size()) +
              " messages, tools offered: " + std::to_string(ctx.selected_tools.size()));

    set_state(sm, TurnState::ProbingWithTools, turn.turn_id);

    ProbeResponse last_probe;
    while (true) {
        if (turn_cancelled_) {
            return finish_cancelled(sm, outcome);
        }

        bool with_tools = sm.get_state() == TurnState::ProbingWithTools;
        std::string schemas = with_tools ? ctx.tool_schemas_json : "";

        RequestOptions options;
        options.timeout_ms = config_.llm.probe_timeout_ms;
        options.cancelled = &turn_cancelled_;

        // The provider counts tool schemas as prompt tokens
        int estimated = deps_.estimator->estimate(working);
        if (!schemas.empty() && schemas != "[]") {
            estimated += deps_.estimator->estimate(schemas);
        }
        outcome.probe_calls++;
        auto probe = deps_.provider->probe(working, schemas, options);

        if (probe.is_error()) {
            const Error& err = probe.error();
            if (err.type == ErrorType::Cancelled || turn_cancelled_) {
                return finish_cancelled(sm, outcome);
            }
            if (err.type == ErrorType::UnsupportedCapability) {
                if (sm.downgrade()) {
                    outcome.downgraded = true;
                    current_state_ = TurnState::ProbingNoTools;
                    LOG_TURN(turn.turn_id, turn_state_name(TurnState::ProbingNoTools), "reason=tools_unsupported");
                    TurnEvent event;
                    event.kind = TurnEventKind::StateChanged;
                    event.turn_id = turn.turn_id;
                    event.state = TurnState::ProbingNoTools;
                    emit(event);
                    continue;
                }
                return finish_failed(sm, outcome,
                    make_provider_error("Provider rejected a request without tools: " + err.message));
            }
            return finish_failed(sm, outcome, err);
        }

        last_probe = probe.value();
        add_usage(outcome, last_probe.usage, estimated);

        if (last_probe.has_tool_calls() && with_tools) {
            set_state(sm, TurnState::ExecutingTools, turn.turn_id);

            Message request = Message::assistant_with_tools(last_probe.content, last_probe.tool_calls);
            working.push_back(request);
            turn_messages.push_back(request);

            for (const auto& call : last_probe.tool_calls) {
                if (turn_cancelled_) {
                    return finish_cancelled(sm, outcome);
                }

                TurnEvent started;
                started.kind = TurnEventKind::ToolStarted;
                started.turn_id = turn.turn_id;
                started.tool_name = call.name;
                emit(started);

                ToolInvocation inv = deps_.tools->invoke(call.name, call.arguments, call.id);

                TurnEvent finished;
                finished.kind = TurnEventKind::ToolFinished;
                finished.turn_id = turn.turn_id;
                finished.tool_name = call.name;
                finished.tool_ok = inv.ok();
                finished.text = inv.ok() ? inv.content : inv.error.message;
                emit(finished);

                Message result = Message::tool(call.id, inv.to_model_text());
                working.push_back(result);
                turn_messages.push_back(result);
                outcome.tool_invocations.push_back(std::move(inv));
            }

            sm.count_round();
            outcome.tool_rounds = sm.rounds();
            if (sm.rounds() >= max_rounds) {
                return finish_failed(sm, outcome, make_error(ErrorType::LoopBoundExceeded,
                    "Too many tool rounds (" + std::to_string(max_rounds) +
                    ") without a final answer. Try asking in a simpler way."));
            }

            set_state(sm, TurnState::ProbingWithTools, turn.turn_id);
            continue;
        }

        if (last_probe.has_tool_calls()) {
            // Tool calls after a downgrade cannot be honoured
            Logger::warn("[Coordinator] ignoring tool calls from a tool-free probe");
        }
        break;
    }

    set_state(sm, TurnState::Streaming, turn.turn_id);

    std::string response;
    if (oc.reuse_probe_content && last_probe.has_content()) {
        const size_t chunk = constants::orchestration::REPLAY_CHUNK_CHARS;
        size_t pos = 0;
        while (pos < last_probe.content.size()) {
            if (turn_cancelled_) {
                return finish_cancelled(sm, outcome);
            }
            std::string piece = utils::truncate_utf8(last_probe.content.substr(pos), chunk);
            if (piece.empty()) {
                piece = last_probe.content.substr(pos, chunk);
            }
            pos += piece.size();
            TurnEvent event;
            event.kind = TurnEventKind::Chunk;
            event.turn_id = turn.turn_id;
            event.text = piece;
            emit(event);
        }
        response = last_probe.content;
    } else {
        RequestOptions options;
        options.timeout_ms = config_.llm.stream_timeout_ms;
        options.cancelled = &turn_cancelled_;

        int estimated = deps_.estimator->estimate(working);
        outcome.stream_calls++;
        auto stream = deps_.provider->stream(working, "", options,
            [this, &turn](const std::string& delta) {
                if (turn_cancelled_) {
                    return false;
                }
                TurnEvent event;
                event.kind = TurnEventKind::Chunk;
                event.turn_id = turn.turn_id;
                event.text = delta;
                emit(event);
                return true;
            });

        if (turn_cancelled_) {
            return finish_cancelled(sm, outcome);
        }
        if (stream.is_error()) {
            if (stream.error().type == ErrorType::Cancelled) {
                return finish_cancelled(sm, outcome);
            }
            return finish_failed(sm, outcome, stream.error());
        }

        add_usage(outcome, stream.value().usage, estimated);
        response = stream.value().content;
        if (utils::is_empty_or_whitespace(response) && last_probe.has_content()) {
            response = last_probe.content;
            TurnEvent event;
            event.kind = TurnEventKind::Chunk;
            event.turn_id = turn.turn_id;
            event.text = response;
            emit(event);
        }
    }

    if (turn_cancelled_) {
        return finish_cancelled(sm, outcome);
    }

    set_state(sm, TurnState::Done, turn.turn_id);
    outcome.final_state = TurnState::Done;
    outcome.response = response;

    turn_messages.push_back(Message::assistant(response));
    commit_turn(turn.message, turn_messages, response);

    TurnEvent done;
    done.kind = TurnEventKind::Done;
    done.turn_id = turn.turn_id;
    done.text = response;
    emit(done);

    LOG_COORD("turn " + std::to_string(turn.turn_id) + " done: probes=" + std::to_string(outcome.probe_calls) +
              " streams=" + std::to_string(outcome.stream_calls) +
              " tool_rounds=" + std::to_string(outcome.tool_rounds) +
              " tokens=" + std::to_string(outcome.usage.total_tokens()));
    return outcome;
}

} // namespace parley
