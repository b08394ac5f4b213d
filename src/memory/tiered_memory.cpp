#include "memory/tiered_memory.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <unordered_set>

namespace parley {
namespace memory {

namespace {

const std::vector<std::string>& valuable_keywords() {
    static const std::vector<std::string> keywords = {
        "prefer", "like", "love", "hate", "name", "remember", "important",
        "always", "never", "favorite", "work", "use", "project", "birthday"
    };
    return keywords;
}

const std::vector<std::string>& personal_patterns() {
    static const std::vector<std::string> patterns = {
        "i prefer", "i like", "i love", "i hate", "i dislike", "i don't like",
        "i do not like", "my name is", "call me", "i am a ", "i am an ", "i'm a ",
        "i'm an ", "i use ", "i work ", "i live ", "my favorite", "my favourite"
    };
    return patterns;
}

const std::vector<std::string>& identity_patterns() {
    static const std::vector<std::string> patterns = {
        "my name is", "call me", "i am a ", "i am an ", "i'm a ", "i'm an ", "i work ", "i live "
    };
    return patterns;
}

bool contains_any(const std::string& lower, const std::vector<std::string>& patterns) {
    for (const auto& p : patterns) {
        if (lower.find(p) != std::string::npos) return true;
    }
    return false;
}

} // namespace

TieredMemory::TieredMemory(const MemoryConfig& config,
                           std::shared_ptr<EmbeddingProvider> embedder,
                           const std::string& storage_dir,
                           bool durable_user_tier)
    : config_(config) {
    StoreOptions user_opts;
    user_opts.tier = Tier::User;
    user_opts.rebuild_tombstone_ratio = config.rebuild_tombstone_ratio;
    user_opts.snapshot_every = config.snapshot_every;
    user_opts.file_stem = config.user_id;
    if (durable_user_tier) {
        user_opts.storage_dir = storage_dir;
    }
    user_ = std::make_unique<VectorMemoryStore>(user_opts, embedder);

    StoreOptions session_opts;
    session_opts.tier = Tier::Session;
    session_opts.rebuild_tombstone_ratio = config.rebuild_tombstone_ratio;
    session_ = std::make_unique<VectorMemoryStore>(session_opts, embedder);

    StoreOptions context_opts;
    context_opts.tier = Tier::Context;
    context_opts.capacity = config.context_capacity;
    context_opts.rebuild_tombstone_ratio = config.rebuild_tombstone_ratio;
    context_ = std::make_unique<VectorMemoryStore>(context_opts, embedder);
}

VoidResult TieredMemory::open() {
    return user_->open();
}

VectorMemoryStore& TieredMemory::store(Tier tier) {
    switch (tier) {
        case Tier::User: return *user_;
        case Tier::Session: return *session_;
        case Tier::Context: return *context_;
    }
    return *context_;
}

const VectorMemoryStore& TieredMemory::store(Tier tier) const {
    switch (tier) {
        case Tier::User: return *user_;
        case Tier::Session: return *session_;
        case Tier::Context: return *context_;
    }
    return *context_;
}

std::vector<ScoredRecord> TieredMemory::retrieve(const std::string& query, size_t k,
                                                 float min_score) const {
    std::vector<ScoredRecord> merged;
    std::unordered_set<std::string> seen;
    for (const VectorMemoryStore* tier_store : {user_.get(), session_.get(), context_.get()}) {
        if (merged.size() >= k) break;
        for (auto& hit : tier_store->search(query, k, min_score)) {
            if (merged.size() >= k) break;
            if (seen.insert(hit.record.text).second) {
                merged.push_back(std::move(hit));
            }
        }
    }
    return merged;
}

std::vector<RecordId> TieredMemory::commit_exchange(const std::string& user_text,
                                                    const std::string& assistant_text) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    std::vector<RecordId> written;

    std::vector<std::string> user_tags;
    if (has_remember_intent(user_text)) {
        user_tags.push_back("remember");
    } else if (contains_personal_fact(user_text)) {
        user_tags.push_back("preference");
    }

    if (!user_tags.empty()) {
        RecordMetadata meta;
        meta.tags = user_tags;
        meta.importance = evaluate_importance(user_text, user_tags);
        auto id = user_->add(utils::trim_copy(user_text), meta);
        if (id.is_ok()) {
            written.push_back(id.value());
            LOG_MEMORY("stored user-tier memory " + std::to_string(id.value()));
        } else {
            Logger::warn("[Memory] user-tier write failed: " + id.error().describe());
        }
    }

    std::string exchange = "Q: " + utils::trim_copy(user_text) + "\nA: " + utils::trim_copy(assistant_text);
    RecordMetadata meta;
    meta.tags = {"exchange"};
    meta.importance = evaluate_importance(user_text, meta.tags);
    auto id = context_->add(exchange, meta);
    if (id.is_ok()) {
        written.push_back(id.value());
    } else {
        Logger::warn("[Memory] context-tier write failed: " + id.error().describe());
    }
    return written;
}

Result<RecordId> TieredMemory::remember(const std::string& text, const std::vector<std::string>& tags) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    RecordMetadata meta;
    meta.tags = tags;
    if (std::find(meta.tags.begin(), meta.tags.end(), "remember") == meta.tags.end()) {
        meta.tags.push_back("remember");
    }
    meta.importance = evaluate_importance(text, meta.tags);
    return user_->add(utils::trim_copy(text), meta);
}

std::vector<MemoryRecord> TieredMemory::user_identity(size_t max_records) const {
    std::vector<MemoryRecord> identity;
    for (auto& record : user_->records()) {
        if (contains_any(utils::to_lower(record.text), identity_patterns())) {
            identity.push_back(std::move(record));
        }
    }
    std::sort(identity.begin(), identity.end(), [](const MemoryRecord& a, const MemoryRecord& b) {
        if (a.importance != b.importance) return a.importance > b.importance;
        return a.created_at_ms > b.created_at_ms;
    });
    if (identity.size() > max_records) identity.resize(max_records);
    return identity;
}

float TieredMemory::evaluate_importance(const std::string& text, const std::vector<std::string>& tags) {
    float score = 0.5f;
    std::string lower = utils::to_lower(text);
    for (const auto& keyword : valuable_keywords()) {
        if (lower.find(keyword) != std::string::npos) score += 0.1f;
    }
    if (text.size() >= 20 && text.size() <= 200) score += 0.1f;
    if (std::find(tags.begin(), tags.end(), "important") != tags.end()) score += 0.2f;
    return std::clamp(score, 0.0f, 1.0f);
}

bool TieredMemory::has_remember_intent(const std::string& text) {
    std::string lower = utils::trim_copy(utils::to_lower(text));
    return utils::starts_with(lower, "remember") ||
           lower.find("remember that") != std::string::npos ||
           lower.find("don't forget") != std::string::npos ||
           lower.find("do not forget") != std::string::npos ||
           lower.find("note that") != std::string::npos ||
           lower.find("keep in mind") != std::string::npos;
}

bool TieredMemory::contains_personal_fact(const std::string& text) {
    std::string lower = " " + utils::to_lower(text);
    if (lower.find('?') != std::string::npos) {
        return false;
    }
    return contains_any(lower, personal_patterns());
}

} // namespace memory
} // namespace parley
