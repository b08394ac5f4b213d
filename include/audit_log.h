#pragma once

#include "errors.h"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <cstdint>

namespace parley {

/**
 * @brief One WRITE-class invocation
 */
struct AuditRecord {
    std::string tool;
    std::string arguments;        ///< JSON
    std::string confirmed_by;
    int64_t timestamp_ms = 0;     ///< Wall clock
    std::string result_summary;   ///< Truncated result or error text
    bool success = false;
};

struct AuditStats {
    size_t total = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    std::map<std::string, size_t> by_tool;
};

/**
 * @brief Append-only JSONL audit trail
 *
 * With an empty path records are kept in memory only.
 */
class AuditLog {
public:
    explicit AuditLog(const std::string& path = "");

    VoidResult append(const AuditRecord& record);

    /// Newest last
    std::vector<AuditRecord> recent(size_t n) const;

    AuditStats stats() const;

    const std::string& path() const { return path_; }

private:
    std::vector<AuditRecord> read_all_locked() const;

    std::string path_;
    mutable std::mutex mutex_;
    std::vector<AuditRecord> memory_records_;
};

} // namespace parley
