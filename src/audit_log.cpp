#include "audit_log.h"
#include "core/constants.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <fstream>

using json = nlohmann::json;

namespace parley {

AuditLog::AuditLog(const std::string& path) : path_(path) {}

VoidResult AuditLog::append(const AuditRecord& record) {
    AuditRecord stored = record;
    stored.result_summary = utils::truncate_utf8(record.result_summary, constants::tools::AUDIT_SUMMARY_CHARS);

    std::lock_guard<std::mutex> lock(mutex_);
    if (path_.empty()) {
        memory_records_.push_back(stored);
        return VoidResult();
    }

    json j;
    j["tool"] = stored.tool;
    json args = json::parse(stored.arguments, nullptr, false);
    j["arguments"] = args.is_discarded() ? json(stored.arguments) : args;
    j["confirmed_by"] = stored.confirmed_by;
    j["timestamp"] = stored.timestamp_ms;
    j["result_summary"] = stored.result_summary;
    j["success"] = stored.success;

    std::ofstream out(path_, std::ios::app);
    if (!out.is_open()) {
        Logger::error("[Tools] cannot open audit log " + path_);
        return make_io_error("Cannot open audit log: " + path_);
    }
    out << j.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    out.flush();
    if (!out.good()) {
        return make_io_error("Failed writing audit log: " + path_);
    }
    return VoidResult();
}

std::vector<AuditRecord> AuditLog::read_all_locked() const {
    if (path_.empty()) {
        return memory_records_;
    }

    std::vector<AuditRecord> records;
    std::ifstream in(path_);
    std::string line;
    while (std::getline(in, line)) {
        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) continue;
        AuditRecord r;
        r.tool = j.value("tool", "");
        r.arguments = j.contains("arguments") ? j["arguments"].dump() : "{}";
        r.confirmed_by = j.value("confirmed_by", "");
        r.timestamp_ms = j.value("timestamp", static_cast<int64_t>(0));
        r.result_summary = j.value("result_summary", "");
        r.success = j.value("success", false);
        records.push_back(std::move(r));
    }
    return records;
}

std::vector<AuditRecord> AuditLog::recent(size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditRecord> all = read_all_locked();
    if (all.size() > n) {
        all.erase(all.begin(), all.end() - static_cast<std::ptrdiff_t>(n));
    }
    return all;
}

AuditStats AuditLog::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    AuditStats s;
    for (const auto& r : read_all_locked()) {
        s.total++;
        if (r.success) s.succeeded++; else s.failed++;
        s.by_tool[r.tool]++;
    }
    return s;
}

} // namespace parley
