#pragma once

/**
 * @file context_assembler.h
 * @brief Builds the bounded message list for one turn
 */

#include "core/types.h"
#include "config.h"
#include "prompt_cache.h"
#include "token_estimator.h"
#include "tool_registry.h"
#include "memory/tiered_memory.h"
#include <memory>
#include <string>
#include <vector>

namespace parley {

/**
 * @brief Result of ContextAssembler::build()
 */
struct AssembledContext {
    std::vector<Message> messages;          ///< Ready to send, new user message last
    std::string tool_schemas_json = "[]";   ///< OpenAI-format schemas of the selected tools
    std::vector<std::string> selected_tools;
    int estimated_tokens = 0;               ///< Messages plus tool schemas

    size_t memories_included = 0;
    size_t dropped_memories = 0;
    size_t dropped_history = 0;
    bool dropped_tools = false;

    /// Still over budget after every optional part was dropped
    bool over_budget = false;
};

/**
 * @brief Assembles prompt context under a token budget
 *
 * Order in the output: system instructions (with identity), relevant
 * memories, recent history, new message. Under pressure memories go first
 * (oldest first), then the oldest history, then the tool schemas. The new
 * message and the turn right before it are never dropped.
 */
class ContextAssembler {
public:
    /**
     * @param memory   May be null (no retrieval)
     * @param registry May be null (no tools offered)
     */
    ContextAssembler(std::shared_ptr<PromptCache> cache,
                     std::shared_ptr<memory::TieredMemory> memory,
                     const ToolRegistry* registry,
                     std::shared_ptr<TokenEstimator> estimator,
                     const std::string& system_prompt,
                     const std::string& identity = "");

    AssembledContext build(const std::vector<Message>& history,
                           const std::string& new_message,
                           const ContextConfig& config) const;

    /**
     * @brief Tools whose topics match the words of text, plus always-offered ones
     *
     * A word matches a topic when it equals it or extends it ("notes" -> "note").
     */
    std::vector<std::string> select_tools(const std::string& text) const;

    /// Cached system segment (instructions plus identity)
    std::string system_segment() const;

private:
    std::string identity_segment() const;
    std::string tool_segment(const std::vector<std::string>& names) const;

    std::shared_ptr<PromptCache> cache_;
    std::shared_ptr<memory::TieredMemory> memory_;
    const ToolRegistry* registry_;
    std::shared_ptr<TokenEstimator> estimator_;
    std::string system_prompt_;
    std::string identity_;
};

} // namespace parley
