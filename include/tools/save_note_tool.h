#pragma once

#include "tool.h"
#include <string>
#include <mutex>

namespace parley {

/**
 * @brief WRITE tool: append a note the user asked to keep
 *
 * Notes are stored one JSON object per line ({timestamp, content, tags})
 * in the notes file shared with SearchNotesTool.
 */
class SaveNoteTool : public Tool {
public:
    explicit SaveNoteTool(const std::string& notes_path);

    ToolDefinition definition() const override;

    Result<std::string> invoke(const nlohmann::json& args) override;

    std::string preview(const nlohmann::json& args) const override;

private:
    std::string notes_path_;
    std::mutex file_mutex_;
};

} // namespace parley
