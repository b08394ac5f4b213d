#include "memory/memory_maintenance.h"
#include "logger.h"

namespace parley {
namespace memory {

MemoryMaintenance::MemoryMaintenance(TieredMemory& tiers,
                                     ConversationMemory& conversation,
                                     std::shared_ptr<LlmProvider> provider,
                                     const MemoryConfig& config,
                                     int summary_timeout_ms)
    : tiers_(tiers),
      conversation_(conversation),
      provider_(std::move(provider)),
      config_(config),
      summary_timeout_ms_(summary_timeout_ms),
      worker_("memory-maintenance") {}

MemoryMaintenance::~MemoryMaintenance() {
    shutdown();
}

bool MemoryMaintenance::maybe_schedule_compression() {
    if (conversation_.verbatim_count() <= config_.compress_threshold) {
        return false;
    }
    bool expected = false;
    if (!compression_pending_.compare_exchange_strong(expected, true)) {
        Logger::debug("[Memory] compression already pending; skipping");
        return false;
    }
    if (!worker_.post([this] { run_compression(); })) {
        compression_pending_ = false;
        return false;
    }
    LOG_MEMORY("session compression scheduled (" + std::to_string(conversation_.verbatim_count()) +
               " verbatim messages)");
    return true;
}

size_t MemoryMaintenance::maybe_schedule_index_maintenance() {
    size_t queued = 0;
    for (Tier tier : {Tier::User, Tier::Session, Tier::Context}) {
        VectorMemoryStore& store = tiers_.store(tier);
        if (!store.needs_maintenance()) continue;

        std::atomic<bool>& pending = rebuild_pending_[static_cast<int>(tier)];
        bool expected = false;
        if (!pending.compare_exchange_strong(expected, true)) continue;

        bool posted = worker_.post([&store, &pending] {
            store.run_maintenance();
            pending = false;
        });
        if (posted) {
            ++queued;
        } else {
            pending = false;
        }
    }
    return queued;
}

bool MemoryMaintenance::wait_idle(int timeout_ms) {
    return worker_.wait_idle(timeout_ms);
}

void MemoryMaintenance::shutdown() {
    worker_.shutdown();
}

void MemoryMaintenance::run_compression() {
    CompressionCandidate candidate = conversation_.compression_candidate(config_.keep_recent);
    if (candidate.empty() || !provider_) {
        compression_pending_ = false;
        return;
    }

    RequestOptions options;
    options.timeout_ms = summary_timeout_ms_;
    auto result = tiers_.store(Tier::Session).compress(candidate.messages, *provider_, options);
    if (result.is_ok()) {
        conversation_.replace_prefix(candidate.last_seq, result.value().summary);
        compressions_completed_++;
    } else {
        Logger::warn("[Memory] session compression failed: " + result.error().describe());
    }
    compression_pending_ = false;
}

} // namespace memory
} // namespace parley
