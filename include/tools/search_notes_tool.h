#pragma once

#include "tool.h"
#include <string>

namespace parley {

/**
 * @brief READ tool: keyword search over saved notes
 */
class SearchNotesTool : public Tool {
public:
    explicit SearchNotesTool(const std::string& notes_path);

    ToolDefinition definition() const override;

    Result<std::string> invoke(const nlohmann::json& args) override;

private:
    std::string notes_path_;
};

} // namespace parley
