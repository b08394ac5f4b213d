#pragma once

#include "errors.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <functional>
#include <memory>

namespace parley {

/**
 * @brief READ tools run immediately; WRITE tools need user confirmation
 */
enum class Permission {
    Read,
    Write
};

const char* permission_name(Permission permission);

/**
 * @brief Everything the model and the executor need to know about a tool
 */
struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json parameters = nlohmann::json::object();   ///< JSON schema (object)
    Permission permission = Permission::Read;

    /// Lowercase keywords that make this tool relevant to a message
    std::vector<std::string> topics;

    /// Offer this tool even when no topic matches
    bool always_offer = false;

    /// {"type": "function", "function": {name, description, parameters}}
    nlohmann::json to_openai_schema() const;
};

/**
 * @brief Abstract base class for all tools
 *
 * invoke() receives arguments already validated against the definition's
 * schema. Return an error Result for expected failures; exceptions are
 * caught by the executor but should not be the normal failure path.
 * Idempotence is the tool's own business: the executor never retries.
 */
class Tool {
public:
    virtual ~Tool() = default;

    virtual ToolDefinition definition() const = 0;

    /**
     * @brief Execute the tool
     * @return Text for the model on success
     */
    virtual Result<std::string> invoke(const nlohmann::json& args) = 0;

    /**
     * @brief Human-readable description of what a WRITE call will do
     */
    virtual std::string preview(const nlohmann::json& args) const;
};

/**
 * @brief Tool built from a definition and a callable
 */
class FunctionTool : public Tool {
public:
    using Handler = std::function<Result<std::string>(const nlohmann::json& args)>;

    FunctionTool(ToolDefinition definition, Handler handler);

    ToolDefinition definition() const override { return definition_; }
    Result<std::string> invoke(const nlohmann::json& args) override;

private:
    ToolDefinition definition_;
    Handler handler_;
};

} // namespace parley
