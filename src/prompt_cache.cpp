#include "prompt_cache.h"
#include "token_estimator.h"
#include "core/types.h"
#include "logger.h"
#include <openssl/sha.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <regex>
#include <shared_mutex>
#include <mutex>
#include <unordered_map>
#include <algorithm>
#include <sstream>
#include <iomanip>

using json = nlohmann::json;

namespace parley {

const char* segment_kind_name(SegmentKind kind) {
    switch (kind) {
        case SegmentKind::SystemInstructions: return "system_prompt";
        case SegmentKind::ToolSchemas: return "tools";
        case SegmentKind::Identity: return "identity";
    }
    return "unknown";
}

// =============================================================================
// ContentNormalizer
// =============================================================================

namespace {

std::string sha256_hex(const std::string& data, size_t hex_chars) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);

    std::ostringstream oss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    std::string hex = oss.str();
    return hex.substr(0, std::min(hex_chars, hex.size()));
}

std::string strip_volatile_fields(const std::string& text) {
    static const std::regex id_field(
        R"(\b(session[_ -]?id|request[_ -]?id|trace[_ -]?id|conversation[_ -]?id)\s*[:=]\s*["']?[A-Za-z0-9_.-]+["']?)",
        std::regex::ECMAScript | std::regex::icase);
    static const std::regex iso_timestamp(
        R"(\b\d{4}-\d{2}-\d{2}[T ]\d{2}:\d{2}(:\d{2}(\.\d+)?)?(Z|[+-]\d{2}:?\d{2})?)");
    static const std::regex uuid(
        R"(\b[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}\b)");
    static const std::regex date(R"(\b\d{4}-\d{2}-\d{2}\b)");
    static const std::regex clock_time(R"(\b\d{1,2}:\d{2}(:\d{2})?\b)");

    std::string out = std::regex_replace(text, id_field, "$1=<id>");
    out = std::regex_replace(out, iso_timestamp, "<timestamp>");
    out = std::regex_replace(out, uuid, "<uuid>");
    out = std::regex_replace(out, date, "<date>");
    out = std::regex_replace(out, clock_time, "<time>");
    return out;
}

std::string canonical_whitespace(const std::string& text) {
    std::string lines;
    lines.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') continue;
            c = '\n';
        }
        lines += c;
    }

    std::string out;
    out.reserve(lines.size());
    size_t newline_run = 0;
    bool pending_space = false;
    for (char c : lines) {
        if (c == ' ' || c == '\t') {
            pending_space = true;
            continue;
        }
        if (c == '\n') {
            pending_space = false;   // drops trailing spaces
            ++newline_run;
            if (newline_run <= 2) out += '\n';
            continue;
        }
        if (pending_space && !out.empty() && out.back() != '\n') {
            out += ' ';
        }
        pending_space = false;
        newline_run = 0;
        out += c;
    }

    size_t start = out.find_first_not_of('\n');
    if (start == std::string::npos) return "";
    size_t end = out.find_last_not_of('\n');
    return out.substr(start, end - start + 1);
}

std::string schema_sort_name(const json& tool) {
    if (tool.is_object()) {
        if (tool.contains("function") && tool["function"].is_object()) {
            return tool["function"].value("name", "");
        }
        return tool.value("name", "");
    }
    return "";
}

} // namespace

std::string ContentNormalizer::normalize_text(const std::string& text) {
    return canonical_whitespace(strip_volatile_fields(text));
}

std::string ContentNormalizer::normalize_tool_schemas(const std::string& schemas_json) {
    try {
        json tools = json::parse(schemas_json);
        if (tools.is_array()) {
            std::vector<json> items(tools.begin(), tools.end());
            std::stable_sort(items.begin(), items.end(), [](const json& a, const json& b) {
                return schema_sort_name(a) < schema_sort_name(b);
            });
            tools = json(items);
        }
        // nlohmann objects are ordered maps, so dump() emits sorted keys
        return tools.dump();
    } catch (const json::exception&) {
        return normalize_text(schemas_json);
    }
}

std::string ContentNormalizer::normalize(SegmentKind kind, const std::string& content) {
    if (kind == SegmentKind::ToolSchemas) {
        return normalize_tool_schemas(content);
    }
    return normalize_text(content);
}

std::string ContentNormalizer::cache_key(SegmentKind kind, const std::string& content) {
    return std::string(segment_kind_name(kind)) + ":" +
           sha256_hex(normalize(kind, content), constants::cache::KEY_HASH_CHARS);
}

// =============================================================================
// PromptCache Implementation
// =============================================================================

class PromptCache::Impl {
public:
    Impl(const CacheConfig& config, ClockFn clock)
        : config_(config),
          clock_(clock ? std::move(clock) : ClockFn([] { return now_ms(); })) {}

    std::optional<std::string> get(SegmentKind kind, const std::string& content) {
        const std::string key = ContentNormalizer::cache_key(kind, content);
        bool stale = false;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = entries_.find(key);
            if (it == entries_.end()) {
                misses_++;
                LOG_CACHE("miss " + key);
                return std::nullopt;
            }
            Entry& entry = *it->second;
            if (is_expired(entry)) {
                stale = true;
            } else if (std::hash<std::string>{}(entry.value) != entry.checksum) {
                Logger::warn("[Cache] corrupted entry " + key + "; recomputing");
                stale = true;
            } else {
                entry.hit_count++;
                entry.last_access = ++access_tick_;
                hits_++;
                tokens_saved_ += static_cast<uint64_t>(entry.estimated_tokens);
                LOG_CACHE("hit " + key + " (hits=" + std::to_string(entry.hit_count.load()) + ")");
                return entry.value;
            }
        }

        // Expired or corrupted: drop it under the writer lock
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            auto it = entries_.find(key);
            if (it != entries_.end() &&
                (is_expired(*it->second) ||
                 std::hash<std::string>{}(it->second->value) != it->second->checksum)) {
                entries_.erase(it);
                expirations_++;
            }
        }
        misses_++;
        LOG_CACHE(std::string(stale ? "expired " : "miss ") + key);
        return std::nullopt;
    }

    void put(SegmentKind kind, const std::string& content,
             const std::string& value, int ttl_minutes) {
        auto entry = std::make_unique<Entry>();
        entry->kind = kind;
        entry->value = value;
        entry->checksum = std::hash<std::string>{}(value);
        entry->created_at_ms = clock_();
        entry->ttl_minutes = ttl_minutes < 0 ? config_.default_ttl_minutes : ttl_minutes;
        entry->estimated_tokens = static_cast<int>(TokenEstimator::raw_estimate(value));
        entry->last_access = ++access_tick_;

        const std::string key = ContentNormalizer::cache_key(kind, content);
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_[key] = std::move(entry);
        while (config_.max_entries > 0 && entries_.size() > config_.max_entries) {
            evict_lru();
        }
    }

    size_t invalidate_kind(SegmentKind kind) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second->kind == kind) {
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        LOG_CACHE("invalidated " + std::to_string(removed) + " " + segment_kind_name(kind) + " entries");
        return removed;
    }

    void clear() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_.clear();
        hits_ = 0;
        misses_ = 0;
        evictions_ = 0;
        expirations_ = 0;
        tokens_saved_ = 0;
    }

    CacheStats stats() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        CacheStats s;
        s.hits = hits_.load();
        s.misses = misses_.load();
        s.evictions = evictions_.load();
        s.expirations = expirations_.load();
        s.tokens_saved = tokens_saved_.load();
        s.entries = entries_.size();
        return s;
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.size();
    }

private:
    struct Entry {
        SegmentKind kind = SegmentKind::SystemInstructions;
        std::string value;
        size_t checksum = 0;
        int64_t created_at_ms = 0;
        int ttl_minutes = 0;
        int estimated_tokens = 0;
        std::atomic<uint64_t> hit_count{0};
        std::atomic<uint64_t> last_access{0};
    };

    bool is_expired(const Entry& entry) const {
        if (entry.ttl_minutes <= 0) return false;
        return clock_() - entry.created_at_ms >= static_cast<int64_t>(entry.ttl_minutes) * 60 * 1000;
    }

    // Caller holds the exclusive lock
    void evict_lru() {
        auto victim = entries_.end();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (victim == entries_.end() ||
                it->second->last_access.load() < victim->second->last_access.load()) {
                victim = it;
            }
        }
        if (victim != entries_.end()) {
            LOG_CACHE("evict " + victim->first);
            entries_.erase(victim);
            evictions_++;
        }
    }

    CacheConfig config_;
    ClockFn clock_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;

    std::atomic<uint64_t> access_tick_{0};
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> expirations_{0};
    std::atomic<uint64_t> tokens_saved_{0};
};

// =============================================================================
// Public Interface
// =============================================================================

PromptCache::PromptCache(const CacheConfig& config, ClockFn clock)
    : impl_(std::make_unique<Impl>(config, std::move(clock))) {}

PromptCache::~PromptCache() = default;

std::optional<std::string> PromptCache::get(SegmentKind kind, const std::string& content) {
    return impl_->get(kind, content);
}

void PromptCache::put(SegmentKind kind, const std::string& content,
                      const std::string& value, int ttl_minutes) {
    impl_->put(kind, content, value, ttl_minutes);
}

std::string PromptCache::get_or_compute(SegmentKind kind, const std::string& content,
                                        const std::function<std::string()>& compute,
                                        int ttl_minutes, bool* was_hit) {
    if (auto cached = impl_->get(kind, content)) {
        if (was_hit) *was_hit = true;
        return *cached;
    }
    if (was_hit) *was_hit = false;
    std::string value = compute();
    impl_->put(kind, content, value, ttl_minutes);
    return value;
}

size_t PromptCache::invalidate_kind(SegmentKind kind) {
    return impl_->invalidate_kind(kind);
}

void PromptCache::clear() {
    impl_->clear();
}

CacheStats PromptCache::stats() const {
    return impl_->stats();
}

size_t PromptCache::size() const {
    return impl_->size();
}

} // namespace parley
