#include "tool_registry.h"
#include "logger.h"
#include <mutex>

using json = nlohmann::json;

namespace parley {

VoidResult ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
    if (!tool) {
        return make_validation_error("Attempted to register null tool");
    }

    ToolDefinition definition = tool->definition();
    if (definition.name.empty()) {
        return make_validation_error("Tool name must not be empty");
    }
    if (!definition.parameters.is_object()) {
        return make_validation_error("Parameter schema for '" + definition.name + "' must be a JSON object");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (tools_.find(definition.name) != tools_.end()) {
        return make_validation_error("Tool '" + definition.name + "' is already registered");
    }
    std::string name = definition.name;
    Permission permission = definition.permission;
    tools_[name] = Entry{std::move(tool), std::move(definition)};
    LOG_TOOLS("Registered tool: " + name + " (" + permission_name(permission) + ")");
    return VoidResult();
}

std::shared_ptr<Tool> ToolRegistry::get_tool(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tools_.find(name);
    return it != tools_.end() ? it->second.tool : nullptr;
}

const ToolDefinition* ToolRegistry::get_definition(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tools_.find(name);
    // std::map nodes are stable and entries are never removed
    return it != tools_.end() ? &it->second.definition : nullptr;
}

std::vector<std::string> ToolRegistry::get_tool_names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, entry] : tools_) {
        names.push_back(name);
    }
    return names;
}

std::vector<ToolDefinition> ToolRegistry::get_definitions() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ToolDefinition> result;
    result.reserve(tools_.size());
    for (const auto& [name, entry] : tools_) {
        result.push_back(entry.definition);
    }
    return result;
}

std::string ToolRegistry::get_tool_definitions_json(const std::vector<std::string>& names) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    json tools_array = json::array();

    if (names.empty()) {
        for (const auto& [name, entry] : tools_) {
            tools_array.push_back(entry.definition.to_openai_schema());
        }
    } else {
        for (const auto& name : names) {
            auto it = tools_.find(name);
            if (it == tools_.end()) {
                Logger::warn("[Tools] schema requested for unknown tool '" + name + "'");
                continue;
            }
            tools_array.push_back(it->second.definition.to_openai_schema());
        }
    }
    return tools_array.dump();
}

bool ToolRegistry::has_tool(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tools_.find(name) != tools_.end();
}

size_t ToolRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tools_.size();
}

} // namespace parley
