#include "tools/search_notes_tool.h"
#include "logger.h"
#include "utils.h"
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace parley {

SearchNotesTool::SearchNotesTool(const std::string& notes_path)
    : notes_path_(notes_path) {
}

ToolDefinition SearchNotesTool::definition() const {
    ToolDefinition def;
    def.name = "search_notes";
    def.description = "Search notes the user saved earlier. "
                      "Use this when the user asks about something they wrote down.";
    def.permission = Permission::Read;
    def.topics = {"note", "notes", "wrote", "written", "saved", "memo", "find"};

    json schema;
    schema["type"] = "object";
    schema["properties"]["query"] = json::object({
        {"type", "string"},
        {"description", "Words to look for"}
    });
    schema["properties"]["limit"] = json::object({
        {"type", "integer"},
        {"minimum", 1},
        {"maximum", 50},
        {"description", "Maximum number of results to return"}
    });
    schema["required"] = json::array({"query"});
    def.parameters = schema;
    return def;
}

Result<std::string> SearchNotesTool::invoke(const json& args) {
    std::string query = args.value("query", "");
    int limit = args.value("limit", 10);

    Logger::info("SearchNotesTool: searching for: \"" + query + "\" (limit: " + std::to_string(limit) + ")");

    std::vector<std::string> query_words = utils::tokenize_words(query);
    std::vector<std::string> matches;

    std::ifstream file(notes_path_);
    if (file.is_open()) {
        std::string line;
        while (std::getline(file, line) && matches.size() < static_cast<size_t>(limit)) {
            json note = json::parse(line, nullptr, false);
            if (note.is_discarded() || !note.is_object()) continue;

            std::string content = note.value("content", "");
            std::string haystack = utils::to_lower(content);
            if (note.contains("tags") && note["tags"].is_array()) {
                for (const auto& tag : note["tags"]) {
                    if (tag.is_string()) haystack += " " + utils::to_lower(tag.get<std::string>());
                }
            }

            // Every query word must appear; an empty query matches everything
            bool all = true;
            for (const auto& w : query_words) {
                if (haystack.find(w) == std::string::npos) {
                    all = false;
                    break;
                }
            }
            if (all) {
                matches.push_back(content);
            }
        }
    } else {
        Logger::info("SearchNotesTool: notes file not found: " + notes_path_ + " (no notes stored yet)");
    }

    std::ostringstream result;
    if (matches.empty()) {
        result << "No notes found for query: \"" << query << "\"";
    } else {
        result << "Found " << matches.size() << " note(s) for query: \"" << query << "\"\n";
        for (size_t i = 0; i < matches.size(); ++i) {
            result << (i + 1) << ". " << matches[i] << "\n";
        }
    }
    return result.str();
}

} // namespace parley
