#pragma once

#include "tool.h"
#include "memory/tiered_memory.h"
#include <memory>

namespace parley {

/**
 * @brief READ tool: semantic search across the memory tiers
 */
class SearchMemoryTool : public Tool {
public:
    SearchMemoryTool(std::shared_ptr<memory::TieredMemory> memory, float min_score);

    ToolDefinition definition() const override;

    Result<std::string> invoke(const nlohmann::json& args) override;

private:
    std::shared_ptr<memory::TieredMemory> memory_;
    float min_score_;
};

} // namespace parley
