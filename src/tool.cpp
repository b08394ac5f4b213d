#include "tool.h"

using json = nlohmann::json;

namespace parley {

const char* permission_name(Permission permission) {
    return permission == Permission::Write ? "WRITE" : "READ";
}

json ToolDefinition::to_openai_schema() const {
    json function_def;
    function_def["name"] = name;
    function_def["description"] = description;
    function_def["parameters"] = parameters.is_object() ? parameters : json::object();

    json tool_def;
    tool_def["type"] = "function";
    tool_def["function"] = function_def;
    return tool_def;
}

std::string Tool::preview(const json& args) const {
    return definition().name + " with arguments " +
           args.dump(-1, ' ', false, json::error_handler_t::replace);
}

FunctionTool::FunctionTool(ToolDefinition definition, Handler handler)
    : definition_(std::move(definition)), handler_(std::move(handler)) {}

Result<std::string> FunctionTool::invoke(const json& args) {
    if (!handler_) {
        return make_error(ErrorType::ToolExecution, "Tool '" + definition_.name + "' has no handler");
    }
    return handler_(args);
}

} // namespace parley
