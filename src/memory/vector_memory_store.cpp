/**
 * @file vector_memory_store.cpp
 * @brief Flat cosine index with tombstones and durable user-tier files
 */

#include "memory/vector_memory_store.h"
#include "logger.h"
#include "path_utils.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

using json = nlohmann::json;

namespace parley {
namespace memory {

namespace {

constexpr char INDEX_MAGIC[8] = {'P', 'R', 'L', 'Y', 'I', 'D', 'X', '1'};
constexpr int SIDECAR_VERSION = 1;

std::string dump_compact(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

json record_to_json(const MemoryRecord& record) {
    json j;
    j["id"] = record.id;
    j["text"] = record.text;
    j["tier"] = tier_name(record.tier);
    j["importance"] = record.importance;
    j["created_at"] = record.created_at_ms;
    j["tags"] = record.tags;
    return j;
}

MemoryRecord record_from_json(const json& j, Tier tier) {
    MemoryRecord record;
    record.id = j.value("id", static_cast<RecordId>(0));
    record.text = j.value("text", "");
    record.tier = tier;
    record.importance = j.value("importance", 0.5f);
    record.created_at_ms = j.value("created_at", static_cast<int64_t>(0));
    if (j.contains("tags") && j["tags"].is_array()) {
        for (const auto& tag : j["tags"]) {
            if (tag.is_string()) record.tags.push_back(tag.get<std::string>());
        }
    }
    return record;
}

float dot(const std::vector<float>& a, const std::vector<float>& b) {
    float sum = 0.0f;
    for (size_t i = 0; i < a.size(); ++i) {
        sum += a[i] * b[i];
    }
    return sum;
}

bool better_hit(const ScoredRecord& a, const ScoredRecord& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.record.importance != b.record.importance) return a.record.importance > b.record.importance;
    return a.record.created_at_ms > b.record.created_at_ms;
}

std::string local_summary(const std::vector<Message>& turns) {
    std::string summary = "Earlier conversation: ";
    for (const auto& msg : turns) {
        if (msg.role != MessageRole::User && msg.role != MessageRole::Assistant) continue;
        std::string line = utils::trim_copy(msg.content);
        if (line.empty()) continue;
        summary += std::string(role_name(msg.role)) + " said \"" + utils::truncate_utf8(line, 120) + "\"; ";
        if (summary.size() >= constants::memory::FALLBACK_SUMMARY_CHARS) break;
    }
    return utils::truncate_utf8(summary, constants::memory::FALLBACK_SUMMARY_CHARS);
}

} // namespace

// =============================================================================
// VectorMemoryStore Implementation
// =============================================================================

class VectorMemoryStore::Impl {
public:
    Impl(const StoreOptions& options, std::shared_ptr<EmbeddingProvider> embedder)
        : options_(options), embedder_(std::move(embedder)) {}

    ~Impl() {
        if (durable()) {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            if (adds_since_snapshot_ > 0 || tombstones_ > 0) {
                auto result = snapshot_locked();
                if (result.is_error()) {
                    Logger::error("[Memory] final snapshot failed: " + result.error().message);
                }
            }
        }
    }

    bool durable() const { return !options_.storage_dir.empty(); }

    std::string stem() const { return options_.storage_dir + "/" + options_.file_stem; }

    VoidResult open() {
        if (!durable()) {
            return VoidResult();
        }
        if (!ensure_directory(options_.storage_dir)) {
            return make_io_error("Cannot create memory directory: " + options_.storage_dir);
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        std::vector<std::optional<json>> log = read_backup_log();
        log_lines_ = log.size();

        size_t replay_from = 0;
        if (load_snapshot_locked(log.size(), replay_from)) {
            size_t replayed = 0;
            for (size_t i = replay_from; i < log.size(); ++i) {
                if (log[i] && replay_entry_locked(*log[i])) ++replayed;
            }
            if (replayed > 0) {
                LOG_MEMORY("replayed " + std::to_string(replayed) + " backup entries newer than the snapshot");
                if (index_available_) {
                    auto snap = snapshot_locked();
                    if (snap.is_error()) Logger::warn("[Memory] snapshot after replay failed: " + snap.error().message);
                }
            }
        } else if (!log.empty()) {
            Logger::warn("[Memory] index for " + options_.file_stem +
                         " missing or inconsistent; rebuilding from backup log");
            rebuild_from_log_locked(log);
        }

        LOG_MEMORY(std::string(tier_name(options_.tier)) + " tier opened: " +
                   std::to_string(slots_.size() - tombstones_) + " records" +
                   (index_available_ ? "" : " (keyword mode)"));
        return VoidResult();
    }

    Result<RecordId> add(const std::string& text, const RecordMetadata& metadata) {
        if (utils::is_empty_or_whitespace(text)) {
            return make_validation_error("Cannot store empty memory text");
        }

        Embedding vec;
        Error embed_error;
        auto embedded = embedder_->embed(text);
        if (embedded.is_ok()) {
            if (embedded.value().size() != embedder_->dimensions()) {
                return make_validation_error("Embedding dimension mismatch: got " +
                                             std::to_string(embedded.value().size()) + ", expected " +
                                             std::to_string(embedder_->dimensions()));
            }
            vec = std::move(embedded.value());
        } else {
            embed_error = embedded.error();
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (vec.empty() && index_available_) {
            return Error(ErrorType::IndexUnavailable, "Embedding failed: " + embed_error.message,
                         embed_error.retryable);
        }

        MemoryRecord record;
        record.id = next_id_++;
        record.text = text;
        record.embedding = std::move(vec);
        record.tier = options_.tier;
        record.importance = std::clamp(metadata.importance, 0.0f, 1.0f);
        record.created_at_ms = wall_clock_ms();
        record.tags = metadata.tags;

        if (durable()) {
            json entry = record_to_json(record);
            entry["op"] = "add";
            auto appended = append_log_locked(entry);
            if (appended.is_error()) {
                return appended.error();
            }
        }

        by_id_[record.id] = slots_.size();
        RecordId id = record.id;
        slots_.push_back(std::move(record));

        enforce_capacity_locked();

        if (durable() && ++adds_since_snapshot_ >= options_.snapshot_every && index_available_) {
            auto snap = snapshot_locked();
            if (snap.is_error()) {
                Logger::warn("[Memory] periodic snapshot failed: " + snap.error().message);
            }
        }
        return id;
    }

    std::vector<ScoredRecord> search(const std::string& query, size_t k, float min_score) const {
        if (k == 0 || utils::is_empty_or_whitespace(query)) {
            return {};
        }

        bool available;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            available = index_available_;
        }

        std::string degrade_reason;
        Embedding query_vec;
        if (available) {
            auto embedded = embedder_->embed(query);
            if (embedded.is_error()) {
                degrade_reason = "query embedding failed: " + embedded.error().message;
            } else if (embedded.value().size() != embedder_->dimensions()) {
                degrade_reason = "query embedding has wrong dimension";
            } else {
                query_vec = std::move(embedded.value());
            }
        } else {
            degrade_reason = "index unavailable";
        }

        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (!degrade_reason.empty() || !index_available_) {
            Logger::warn(std::string("[Memory] ") + tier_name(options_.tier) + " tier " +
                         (degrade_reason.empty() ? "index unavailable" : degrade_reason) +
                         "; falling back to keyword search");
            return keyword_search_locked(query, k);
        }

        std::vector<ScoredRecord> hits;
        for (const auto& record : slots_) {
            if (record.tombstoned || record.embedding.size() != query_vec.size()) continue;
            float score = dot(record.embedding, query_vec);
            if (score >= min_score) {
                hits.push_back({record, score});
            }
        }
        return top_k(std::move(hits), k);
    }

    bool remove(RecordId id) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return remove_locked(id);
    }

    std::optional<MemoryRecord> get(RecordId id) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = by_id_.find(id);
        if (it == by_id_.end() || slots_[it->second].tombstoned) {
            return std::nullopt;
        }
        return slots_[it->second];
    }

    std::vector<MemoryRecord> records() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<MemoryRecord> live;
        live.reserve(slots_.size() - tombstones_);
        for (const auto& record : slots_) {
            if (!record.tombstoned) live.push_back(record);
        }
        return live;
    }

    bool needs_maintenance() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (tombstones_ == 0 || slots_.empty()) return false;
        return static_cast<float>(tombstones_) / static_cast<float>(slots_.size()) >=
               options_.rebuild_tombstone_ratio;
    }

    size_t run_maintenance() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        size_t reclaimed = tombstones_;
        if (reclaimed == 0) {
            return 0;
        }

        std::vector<MemoryRecord> compacted;
        compacted.reserve(slots_.size() - tombstones_);
        for (auto& record : slots_) {
            if (!record.tombstoned) compacted.push_back(std::move(record));
        }
        slots_ = std::move(compacted);
        by_id_.clear();
        for (size_t i = 0; i < slots_.size(); ++i) {
            by_id_[slots_[i].id] = i;
        }
        tombstones_ = 0;

        if (durable() && index_available_) {
            auto snap = snapshot_locked();
            if (snap.is_error()) {
                Logger::warn("[Memory] snapshot after rebuild failed: " + snap.error().message);
            }
        }
        LOG_MEMORY(std::string(tier_name(options_.tier)) + " tier rebuilt, reclaimed " +
                   std::to_string(reclaimed) + " tombstones");
        return reclaimed;
    }

    VoidResult snapshot() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return snapshot_locked();
    }

    StoreStats stats() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        StoreStats s;
        s.live_records = slots_.size() - tombstones_;
        s.tombstones = tombstones_;
        s.index_available = index_available_;
        s.durable = durable();
        return s;
    }

    Tier tier() const { return options_.tier; }

private:
    std::vector<ScoredRecord> top_k(std::vector<ScoredRecord> hits, size_t k) const {
        size_t n = std::min(k, hits.size());
        std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(n), hits.end(), better_hit);
        hits.resize(n);
        return hits;
    }

    std::vector<ScoredRecord> keyword_search_locked(const std::string& query, size_t k) const {
        std::vector<std::string> words = utils::tokenize_words(query);
        std::unordered_set<std::string> query_words(words.begin(), words.end());
        if (query_words.empty()) {
            return {};
        }

        std::vector<ScoredRecord> hits;
        for (const auto& record : slots_) {
            if (record.tombstoned) continue;
            std::vector<std::string> record_words = utils::tokenize_words(record.text);
            std::unordered_set<std::string> present(record_words.begin(), record_words.end());
            size_t matched = 0;
            for (const auto& word : query_words) {
                if (present.count(word)) ++matched;
            }
            if (matched == 0) continue;
            float score = static_cast<float>(matched) / static_cast<float>(query_words.size());
            hits.push_back({record, score});
        }
        return top_k(std::move(hits), k);
    }

    bool remove_locked(RecordId id) {
        auto it = by_id_.find(id);
        if (it == by_id_.end() || slots_[it->second].tombstoned) {
            return false;
        }
        if (durable()) {
            json entry;
            entry["op"] = "delete";
            entry["id"] = id;
            auto appended = append_log_locked(entry);
            if (appended.is_error()) {
                Logger::error("[Memory] delete of " + std::to_string(id) + " not logged: " +
                              appended.error().message);
                return false;
            }
        }
        slots_[it->second].tombstoned = true;
        tombstones_++;
        return true;
    }

    void enforce_capacity_locked() {
        if (options_.capacity == 0) return;
        size_t live = slots_.size() - tombstones_;
        for (size_t i = 0; i < slots_.size() && live > options_.capacity; ++i) {
            if (!slots_[i].tombstoned && remove_locked(slots_[i].id)) {
                --live;
            }
        }
    }

    VoidResult append_log_locked(const json& entry) {
        std::ofstream log(backup_log_path(), std::ios::app);
        if (!log.is_open()) {
            return make_io_error("Cannot open backup log: " + backup_log_path());
        }
        log << dump_compact(entry) << '\n';
        log.flush();
        if (!log.good()) {
            return make_io_error("Failed writing backup log: " + backup_log_path());
        }
        log_lines_++;
        return VoidResult();
    }

    std::vector<std::optional<json>> read_backup_log() const {
        std::vector<std::optional<json>> entries;
        std::ifstream log(backup_log_path());
        if (!log.is_open()) {
            return entries;
        }
        std::string line;
        size_t bad = 0;
        while (std::getline(log, line)) {
            if (utils::is_empty_or_whitespace(line)) continue;
            json entry = json::parse(line, nullptr, false);
            if (entry.is_discarded() || !entry.is_object()) {
                ++bad;
                entries.push_back(std::nullopt);
            } else {
                entries.push_back(std::move(entry));
            }
        }
        if (bad > 0) {
            Logger::warn("[Memory] skipped " + std::to_string(bad) + " unreadable backup log lines");
        }
        return entries;
    }

    bool replay_entry_locked(const json& entry) {
        std::string op = entry.value("op", "");
        if (op == "delete") {
            RecordId id = entry.value("id", static_cast<RecordId>(0));
            auto it = by_id_.find(id);
            if (it == by_id_.end() || slots_[it->second].tombstoned) return false;
            slots_[it->second].tombstoned = true;
            tombstones_++;
            return true;
        }
        if (op != "add") {
            return false;
        }

        MemoryRecord record = record_from_json(entry, options_.tier);
        if (record.id == 0 || by_id_.count(record.id)) {
            return false;
        }
        if (index_available_) {
            auto embedded = embedder_->embed(record.text);
            if (embedded.is_ok() && embedded.value().size() == embedder_->dimensions()) {
                record.embedding = std::move(embedded.value());
            } else {
                Logger::warn("[Memory] re-embedding failed during recovery; switching " +
                             std::string(tier_name(options_.tier)) + " tier to keyword search");
                index_available_ = false;
            }
        }
        next_id_ = std::max(next_id_, record.id + 1);
        by_id_[record.id] = slots_.size();
        slots_.push_back(std::move(record));
        return true;
    }

    void rebuild_from_log_locked(const std::vector<std::optional<json>>& log) {
        slots_.clear();
        by_id_.clear();
        tombstones_ = 0;
        index_available_ = true;
        for (const auto& entry : log) {
            if (entry) replay_entry_locked(*entry);
        }
        if (index_available_) {
            auto snap = snapshot_locked();
            if (snap.is_error()) {
                Logger::warn("[Memory] snapshot after recovery failed: " + snap.error().message);
            }
        }
        LOG_MEMORY("recovered " + std::to_string(slots_.size() - tombstones_) + " records from backup log");
    }

    bool load_snapshot_locked(size_t log_size, size_t& replay_from) {
        std::ifstream sidecar_file(metadata_path());
        std::ifstream index_file(index_path(), std::ios::binary);
        if (!sidecar_file.is_open() || !index_file.is_open()) {
            return false;
        }

        json sidecar = json::parse(sidecar_file, nullptr, false);
        if (sidecar.is_discarded() || !sidecar.is_object()) {
            Logger::warn("[Memory] metadata sidecar is not valid JSON");
            return false;
        }
        size_t dims = sidecar.value("dimensions", static_cast<size_t>(0));
        if (dims != embedder_->dimensions()) {
            Logger::warn("[Memory] stored dimension " + std::to_string(dims) +
                         " does not match embedder dimension " + std::to_string(embedder_->dimensions()));
            return false;
        }

        char magic[sizeof(INDEX_MAGIC)];
        uint32_t index_dims = 0;
        uint64_t count = 0;
        index_file.read(magic, sizeof(magic));
        index_file.read(reinterpret_cast<char*>(&index_dims), sizeof(index_dims));
        index_file.read(reinterpret_cast<char*>(&count), sizeof(count));
        if (!index_file || std::memcmp(magic, INDEX_MAGIC, sizeof(magic)) != 0 || index_dims != dims) {
            Logger::warn("[Memory] index header corrupted");
            return false;
        }

        std::unordered_map<RecordId, Embedding> vectors;
        for (uint64_t i = 0; i < count; ++i) {
            uint64_t id = 0;
            Embedding vec(dims);
            index_file.read(reinterpret_cast<char*>(&id), sizeof(id));
            index_file.read(reinterpret_cast<char*>(vec.data()), static_cast<std::streamsize>(dims * sizeof(float)));
            if (!index_file) {
                Logger::warn("[Memory] index truncated at entry " + std::to_string(i));
                return false;
            }
            vectors[id] = std::move(vec);
        }

        std::vector<MemoryRecord> loaded;
        if (sidecar.contains("records") && sidecar["records"].is_array()) {
            for (const auto& item : sidecar["records"]) {
                MemoryRecord record = record_from_json(item, options_.tier);
                auto vit = vectors.find(record.id);
                if (vit == vectors.end()) {
                    Logger::warn("[Memory] record " + std::to_string(record.id) + " has no vector in the index");
                    return false;
                }
                record.embedding = std::move(vit->second);
                loaded.push_back(std::move(record));
            }
        }

        slots_ = std::move(loaded);
        by_id_.clear();
        for (size_t i = 0; i < slots_.size(); ++i) {
            by_id_[slots_[i].id] = i;
        }
        tombstones_ = 0;
        next_id_ = std::max<RecordId>(1, sidecar.value("next_id", static_cast<RecordId>(1)));
        index_available_ = true;

        replay_from = sidecar.value("log_lines", static_cast<size_t>(0));
        if (replay_from > log_size) {
            Logger::warn("[Memory] backup log shorter than recorded; replaying nothing");
            replay_from = log_size;
        }
        return true;
    }

    VoidResult snapshot_locked() {
        if (!durable()) {
            return VoidResult();
        }
        if (!index_available_) {
            Logger::debug("[Memory] keyword mode; index snapshot skipped");
            return VoidResult();
        }

        const uint32_t dims = static_cast<uint32_t>(embedder_->dimensions());
        std::vector<const MemoryRecord*> live;
        for (const auto& record : slots_) {
            if (!record.tombstoned && record.embedding.size() == dims) live.push_back(&record);
        }

        const std::string index_tmp = index_path() + ".tmp";
        {
            std::ofstream out(index_tmp, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                return make_io_error("Cannot write index: " + index_tmp);
            }
            uint64_t count = live.size();
            out.write(INDEX_MAGIC, sizeof(INDEX_MAGIC));
            out.write(reinterpret_cast<const char*>(&dims), sizeof(dims));
            out.write(reinterpret_cast<const char*>(&count), sizeof(count));
            for (const MemoryRecord* record : live) {
                uint64_t id = record->id;
                out.write(reinterpret_cast<const char*>(&id), sizeof(id));
                out.write(reinterpret_cast<const char*>(record->embedding.data()),
                          static_cast<std::streamsize>(dims * sizeof(float)));
            }
            if (!out.good()) {
                return make_io_error("Failed writing index: " + index_tmp);
            }
        }

        json sidecar;
        sidecar["version"] = SIDECAR_VERSION;
        sidecar["tier"] = tier_name(options_.tier);
        sidecar["embedder"] = embedder_->name();
        sidecar["dimensions"] = dims;
        sidecar["next_id"] = next_id_;
        sidecar["log_lines"] = log_lines_;
        sidecar["records"] = json::array();
        for (const MemoryRecord* record : live) {
            sidecar["records"].push_back(record_to_json(*record));
        }

        const std::string meta_tmp = metadata_path() + ".tmp";
        {
            std::ofstream out(meta_tmp, std::ios::trunc);
            if (!out.is_open()) {
                return make_io_error("Cannot write metadata: " + meta_tmp);
            }
            out << sidecar.dump(2, ' ', false, json::error_handler_t::replace);
            if (!out.good()) {
                return make_io_error("Failed writing metadata: " + meta_tmp);
            }
        }

        if (std::rename(index_tmp.c_str(), index_path().c_str()) != 0 ||
            std::rename(meta_tmp.c_str(), metadata_path().c_str()) != 0) {
            return make_io_error("Failed to move snapshot files into place");
        }
        adds_since_snapshot_ = 0;
        Logger::debug("[Memory] snapshot written: " + std::to_string(live.size()) + " records");
        return VoidResult();
    }

public:
    std::string index_path() const { return stem() + ".index"; }
    std::string metadata_path() const { return stem() + ".meta.json"; }
    std::string backup_log_path() const { return stem() + ".backup.jsonl"; }

private:
    StoreOptions options_;
    std::shared_ptr<EmbeddingProvider> embedder_;

    mutable std::shared_mutex mutex_;
    std::vector<MemoryRecord> slots_;
    std::unordered_map<RecordId, size_t> by_id_;
    size_t tombstones_ = 0;
    RecordId next_id_ = 1;
    bool index_available_ = true;
    size_t adds_since_snapshot_ = 0;
    size_t log_lines_ = 0;
};

// =============================================================================
// Public Interface
// =============================================================================

VectorMemoryStore::VectorMemoryStore(const StoreOptions& options,
                                     std::shared_ptr<EmbeddingProvider> embedder)
    : impl_(std::make_unique<Impl>(options, std::move(embedder))) {}

VectorMemoryStore::~VectorMemoryStore() = default;

VoidResult VectorMemoryStore::open() {
    return impl_->open();
}

Result<RecordId> VectorMemoryStore::add(const std::string& text, const RecordMetadata& metadata) {
    return impl_->add(text, metadata);
}

std::vector<ScoredRecord> VectorMemoryStore::search(const std::string& query, size_t k,
                                                    float min_score) const {
    return impl_->search(query, k, min_score);
}

Result<CompressionResult> VectorMemoryStore::compress(const std::vector<Message>& turns,
                                                      LlmProvider& provider,
                                                      const RequestOptions& options) {
    std::string transcript;
    for (const auto& msg : turns) {
        if (msg.content.empty()) continue;
        transcript += std::string(role_name(msg.role)) + ": " + msg.content + "\n";
    }
    if (transcript.empty()) {
        return make_validation_error("Nothing to compress");
    }

    CompressionResult result;
    auto summarized = provider.summarize(transcript, options);
    std::string summary;
    if (summarized.is_ok()) {
        summary = summarized.value();
    } else {
        Logger::warn("[Memory] summarization failed (" + summarized.error().describe() +
                     "); storing a local summary");
        summary = local_summary(turns);
        result.used_fallback = true;
    }

    result.summary = std::string(constants::memory::SUMMARY_PREFIX) + " " + summary;
    RecordMetadata metadata;
    metadata.importance = 0.6f;
    metadata.tags = {"summary"};
    auto id = impl_->add(result.summary, metadata);
    if (id.is_error()) {
        return id.error();
    }
    result.id = id.value();
    LOG_MEMORY("compressed " + std::to_string(turns.size()) + " messages into record " +
               std::to_string(result.id));
    return result;
}

bool VectorMemoryStore::remove(RecordId id) {
    return impl_->remove(id);
}

std::optional<MemoryRecord> VectorMemoryStore::get(RecordId id) const {
    return impl_->get(id);
}

std::vector<MemoryRecord> VectorMemoryStore::records() const {
    return impl_->records();
}

bool VectorMemoryStore::needs_maintenance() const {
    return impl_->needs_maintenance();
}

size_t VectorMemoryStore::run_maintenance() {
    return impl_->run_maintenance();
}

VoidResult VectorMemoryStore::snapshot() {
    return impl_->snapshot();
}

StoreStats VectorMemoryStore::stats() const {
    return impl_->stats();
}

Tier VectorMemoryStore::tier() const {
    return impl_->tier();
}

std::string VectorMemoryStore::index_path() const {
    return impl_->index_path();
}

std::string VectorMemoryStore::metadata_path() const {
    return impl_->metadata_path();
}

std::string VectorMemoryStore::backup_log_path() const {
    return impl_->backup_log_path();
}

} // namespace memory
} // namespace parley
