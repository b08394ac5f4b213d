#include "tools/search_memory_tool.h"
#include "logger.h"
#include <sstream>
#include <iomanip>

using json = nlohmann::json;

namespace parley {

SearchMemoryTool::SearchMemoryTool(std::shared_ptr<memory::TieredMemory> memory, float min_score)
    : memory_(std::move(memory)), min_score_(min_score) {
}

ToolDefinition SearchMemoryTool::definition() const {
    ToolDefinition def;
    def.name = "search_memory";
    def.description = "Search what the assistant remembers about the user and earlier conversations. "
                      "Use this when the user refers to something said before.";
    def.permission = Permission::Read;
    def.topics = {"remember", "recall", "earlier", "before", "said", "told", "prefer", "favorite", "last"};

    json schema;
    schema["type"] = "object";
    schema["properties"]["query"] = json::object({
        {"type", "string"},
        {"minLength", 1},
        {"description", "What to look for"}
    });
    schema["properties"]["limit"] = json::object({
        {"type", "integer"},
        {"minimum", 1},
        {"maximum", 20},
        {"description", "Maximum number of memories to return"}
    });
    schema["required"] = json::array({"query"});
    def.parameters = schema;
    return def;
}

Result<std::string> SearchMemoryTool::invoke(const json& args) {
    if (!memory_) {
        return Error(ErrorType::IndexUnavailable, "Memory is not available");
    }

    std::string query = args.value("query", "");
    size_t limit = static_cast<size_t>(args.value("limit", 5));

    auto results = memory_->retrieve(query, limit, min_score_);
    if (results.empty()) {
        return std::string("No memories matched \"" + query + "\"");
    }

    std::ostringstream out;
    out << "Found " << results.size() << " memor" << (results.size() == 1 ? "y" : "ies") << ":\n";
    for (const auto& r : results) {
        out << "- [" << tier_name(r.record.tier) << ", score "
            << std::fixed << std::setprecision(2) << r.score << "] "
            << r.record.text << "\n";
    }
    return out.str();
}

} // namespace parley
