#include "tools/save_note_tool.h"
#include "core/types.h"
#include "logger.h"
#include "utils.h"
#include <fstream>

using json = nlohmann::json;

namespace parley {

SaveNoteTool::SaveNoteTool(const std::string& notes_path)
    : notes_path_(notes_path) {
}

ToolDefinition SaveNoteTool::definition() const {
    ToolDefinition def;
    def.name = "save_note";
    def.description = "Save a note the user wants to keep for later. "
                      "Use this when the user asks to write down, note or log something.";
    def.permission = Permission::Write;
    def.topics = {"note", "notes", "write", "jot", "log", "save", "record", "memo"};

    json schema;
    schema["type"] = "object";
    schema["properties"]["content"] = json::object({
        {"type", "string"},
        {"minLength", 1},
        {"description", "The text of the note"}
    });
    schema["properties"]["tags"] = json::object({
        {"type", "array"},
        {"items", json::object({{"type", "string"}})},
        {"description", "Optional tags to categorize the note"}
    });
    schema["required"] = json::array({"content"});
    schema["additionalProperties"] = false;
    def.parameters = schema;
    return def;
}

std::string SaveNoteTool::preview(const json& args) const {
    std::string content = args.value("content", "");
    std::string text = "Save note: \"" + utils::truncate_utf8(content, 120) + "\"";
    if (args.contains("tags") && args["tags"].is_array() && !args["tags"].empty()) {
        text += " tags=" + args["tags"].dump();
    }
    return text;
}

Result<std::string> SaveNoteTool::invoke(const json& args) {
    std::string content = args.value("content", "");
    std::vector<std::string> tags;
    if (args.contains("tags") && args["tags"].is_array()) {
        for (const auto& tag : args["tags"]) {
            if (tag.is_string()) {
                tags.push_back(tag.get<std::string>());
            }
        }
    }

    json note;
    note["timestamp"] = wall_clock_ms();
    note["content"] = content;
    note["tags"] = tags;

    std::lock_guard<std::mutex> lock(file_mutex_);
    std::ofstream file(notes_path_, std::ios::app);
    if (!file.is_open()) {
        Logger::error("SaveNoteTool: failed to open notes file: " + notes_path_);
        return make_io_error("Failed to open notes file");
    }
    file << note.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    file.flush();
    if (!file.good()) {
        return make_io_error("Failed to write notes file");
    }

    std::string result_msg = "Note saved";
    if (!tags.empty()) {
        result_msg += " with tags: ";
        for (size_t i = 0; i < tags.size(); ++i) {
            if (i > 0) result_msg += ", ";
            result_msg += tags[i];
        }
    }
    Logger::info("SaveNoteTool: " + result_msg);
    return result_msg;
}

} // namespace parley
