#pragma once

#include "tool.h"
#include <string>
#include <vector>
#include <memory>
#include <map>
#include <shared_mutex>

namespace parley {

/**
 * @brief Name-keyed table of registered tools
 *
 * Registration normally happens once at session setup, but lookups are
 * guarded so a tool can be added while a turn is running.
 */
class ToolRegistry {
public:
    /**
     * @brief Register a tool
     * @return Validation error for a null tool, empty name, non-object schema or duplicate name
     */
    VoidResult register_tool(std::shared_ptr<Tool> tool);

    std::shared_ptr<Tool> get_tool(const std::string& name) const;

    /// Definition of a registered tool, cached at registration time
    const ToolDefinition* get_definition(const std::string& name) const;

    std::vector<std::string> get_tool_names() const;

    std::vector<ToolDefinition> get_definitions() const;

    /**
     * @brief OpenAI-format JSON array for the named tools (all when names is empty)
     * Unknown names are skipped.
     */
    std::string get_tool_definitions_json(const std::vector<std::string>& names = {}) const;

    bool has_tool(const std::string& name) const;

    size_t size() const;

private:
    struct Entry {
        std::shared_ptr<Tool> tool;
        ToolDefinition definition;
    };

    mutable std::shared_mutex mutex_;
    std::map<std::string, Entry> tools_;
};

} // namespace parley
