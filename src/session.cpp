#include "session.h"
#include "context_assembler.h"
#include "tool_executor.h"
#include "tool_registry.h"
#include "token_estimator.h"
#include "memory/conversation_memory.h"
#include "memory/tiered_memory.h"
#include "memory/memory_maintenance.h"
#include "tools/save_note_tool.h"
#include "tools/search_notes_tool.h"
#include "tools/search_memory_tool.h"
#include "path_utils.h"
#include "core/constants.h"
#include "logger.h"

namespace parley {

class AssistantSession::Impl {
public:
    Impl(const Config& config,
         std::shared_ptr<LlmProvider> provider,
         std::shared_ptr<EmbeddingProvider> embedder,
         std::shared_ptr<ConfirmationHandler> confirmation)
        : config_(config), provider_(std::move(provider)), embedder_(std::move(embedder)),
          confirmation_(std::move(confirmation)) {
        storage_dir_ = config_.resolved_storage_dir();
        durable_ = config_.memory.persist_user_tier;

        cache_ = std::make_shared<PromptCache>(config_.cache);
        estimator_ = std::make_shared<TokenEstimator>();
        history_ = std::make_shared<memory::ConversationMemory>();
        memory_ = std::make_shared<memory::TieredMemory>(config_.memory, embedder_, storage_dir_, durable_);
        registry_ = std::make_shared<ToolRegistry>();
        audit_ = std::make_shared<AuditLog>(durable_ ? config_.resolved_audit_log_path() : "");
        executor_ = std::make_shared<ToolExecutor>(*registry_, config_.tools, confirmation_, audit_);
        assembler_ = std::make_shared<ContextAssembler>(cache_, memory_, registry_.get(), estimator_,
                                                        config_.system_prompt, config_.identity);
    }

    ~Impl() {
        shutdown();
    }

    VoidResult initialize() {
        if (initialized_) {
            return VoidResult();
        }

        if (durable_ && !ensure_directory(storage_dir_)) {
            return make_io_error("Cannot create storage directory: " + storage_dir_);
        }

        auto opened = memory_->open();
        if (!opened) {
            // Degraded retrieval is still usable; the store logged the details
            Logger::warn("[Session] memory opened degraded: " + opened.error().message);
        }

        std::string notes_path = config_.resolved_notes_path();
        std::vector<std::shared_ptr<Tool>> builtins = {
            std::make_shared<SearchMemoryTool>(memory_, config_.memory.min_score),
            std::make_shared<SaveNoteTool>(notes_path),
            std::make_shared<SearchNotesTool>(notes_path)
        };
        for (auto& tool : builtins) {
            auto registered = registry_->register_tool(tool);
            if (!registered) {
                return registered.error();
            }
        }

        maintenance_ = std::make_shared<memory::MemoryMaintenance>(
            *memory_, *history_, provider_, config_.memory, config_.llm.summary_timeout_ms);

        events_ = std::make_shared<EventChannel<TurnEvent>>(
            constants::orchestration::EVENT_CHANNEL_CAPACITY);

        CoordinatorDeps deps;
        deps.provider = provider_;
        deps.assembler = assembler_;
        deps.tools = executor_;
        deps.history = history_;
        deps.estimator = estimator_;
        deps.memory = memory_;
        deps.maintenance = maintenance_;
        coordinator_ = std::make_unique<OrchestrationCoordinator>(deps, config_, events_);

        initialized_ = true;
        Logger::info("[Session] ready (user=" + config_.memory.user_id + ", provider=" +
                     provider_->name() + ", embedder=" + embedder_->name() + ", tools=" +
                     std::to_string(registry_->size()) + ")");
        return VoidResult();
    }

    VoidResult register_tool(std::shared_ptr<Tool> tool) {
        return registry_->register_tool(std::move(tool));
    }

    Result<TurnTicket> send(const std::string& message) {
        if (!coordinator_) {
            return make_error(ErrorType::InvalidState, "Session is not initialized");
        }
        return coordinator_->submit(message);
    }

    bool cancel() {
        return coordinator_ ? coordinator_->cancel() : false;
    }

    SessionStats stats() const {
        SessionStats s;
        s.cache = cache_->stats();
        s.user = memory_->store(Tier::User).stats();
        s.session = memory_->store(Tier::Session).stats();
        s.context = memory_->store(Tier::Context).stats();
        s.audit = audit_->stats();
        s.turns_completed = coordinator_ ? coordinator_->turns_completed() : 0;
        s.compressions = maintenance_ ? maintenance_->compressions_completed() : 0;
        s.history_messages = history_->message_count();
        s.token_scale = estimator_->scale();
        return s;
    }

    bool wait_for_maintenance(int timeout_ms) {
        return maintenance_ ? maintenance_->wait_idle(timeout_ms) : true;
    }

    void shutdown() {
        if (shut_down_) {
            return;
        }
        shut_down_ = true;

        // Coordinator first so no new maintenance gets scheduled
        if (coordinator_) {
            coordinator_->shutdown();
        }
        if (maintenance_) {
            maintenance_->shutdown();
        }
        executor_->shutdown();
        if (durable_) {
            auto saved = memory_->store(Tier::User).snapshot();
            if (!saved) {
                Logger::warn("[Session] final snapshot failed: " + saved.error().message);
            }
        }
        Logger::info("[Session] shut down");
    }

    Config config_;
    std::string storage_dir_;
    bool durable_ = true;
    bool initialized_ = false;
    bool shut_down_ = false;

    std::shared_ptr<LlmProvider> provider_;
    std::shared_ptr<EmbeddingProvider> embedder_;
    std::shared_ptr<ConfirmationHandler> confirmation_;

    std::shared_ptr<PromptCache> cache_;
    std::shared_ptr<TokenEstimator> estimator_;
    std::shared_ptr<memory::ConversationMemory> history_;
    std::shared_ptr<memory::TieredMemory> memory_;
    std::shared_ptr<ToolRegistry> registry_;
    std::shared_ptr<AuditLog> audit_;
    std::shared_ptr<ToolExecutor> executor_;
    std::shared_ptr<ContextAssembler> assembler_;
    std::shared_ptr<memory::MemoryMaintenance> maintenance_;
    std::shared_ptr<EventChannel<TurnEvent>> events_;
    std::unique_ptr<OrchestrationCoordinator> coordinator_;
};

AssistantSession::AssistantSession(const Config& config,
                                   std::shared_ptr<LlmProvider> provider,
                                   std::shared_ptr<EmbeddingProvider> embedder,
                                   std::shared_ptr<ConfirmationHandler> confirmation)
    : pimpl_(std::make_unique<Impl>(config, std::move(provider), std::move(embedder),
                                    std::move(confirmation))) {}

AssistantSession::~AssistantSession() = default;

VoidResult AssistantSession::initialize() {
    return pimpl_->initialize();
}

VoidResult AssistantSession::register_tool(std::shared_ptr<Tool> tool) {
    return pimpl_->register_tool(std::move(tool));
}

Result<TurnTicket> AssistantSession::send(const std::string& message) {
    return pimpl_->send(message);
}

bool AssistantSession::cancel() {
    return pimpl_->cancel();
}

std::shared_ptr<EventChannel<TurnEvent>> AssistantSession::events() const {
    return pimpl_->events_;
}

SessionStats AssistantSession::stats() const {
    return pimpl_->stats();
}

PromptCache& AssistantSession::cache() {
    return *pimpl_->cache_;
}

memory::TieredMemory& AssistantSession::tiers() {
    return *pimpl_->memory_;
}

memory::ConversationMemory& AssistantSession::history() {
    return *pimpl_->history_;
}

OrchestrationCoordinator& AssistantSession::coordinator() {
    return *pimpl_->coordinator_;
}

bool AssistantSession::wait_for_maintenance(int timeout_ms) {
    return pimpl_->wait_for_maintenance(timeout_ms);
}

void AssistantSession::shutdown() {
    pimpl_->shutdown();
}

} // namespace parley
