#include "context_assembler.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>

namespace parley {

namespace {

constexpr size_t IDENTITY_RECORDS = 3;

std::string render_memories(const std::vector<ScoredRecord>& memories) {
    std::string text = "Relevant memories:";
    for (const auto& m : memories) {
        text += "\n- ";
        text += m.record.text;
    }
    return text;
}

} // namespace

ContextAssembler::ContextAssembler(std::shared_ptr<PromptCache> cache,
                                   std::shared_ptr<memory::TieredMemory> memory,
                                   const ToolRegistry* registry,
                                   std::shared_ptr<TokenEstimator> estimator,
                                   const std::string& system_prompt,
                                   const std::string& identity)
    : cache_(std::move(cache)), memory_(std::move(memory)), registry_(registry),
      estimator_(estimator ? std::move(estimator) : std::make_shared<TokenEstimator>()),
      system_prompt_(system_prompt), identity_(identity) {
}

std::string ContextAssembler::identity_segment() const {
    std::string content = identity_;
    if (memory_) {
        for (const auto& record : memory_->user_identity(IDENTITY_RECORDS)) {
            content += "\n" + record.text;
        }
    }
    utils::trim(content);
    if (content.empty()) {
        return "";
    }

    auto render = [&content]() {
        return "About the user:\n" + ContentNormalizer::normalize_text(content);
    };
    return cache_ ? cache_->get_or_compute(SegmentKind::Identity, content, render) : render();
}

std::string ContextAssembler::system_segment() const {
    auto render = [this]() {
        return ContentNormalizer::normalize_text(system_prompt_);
    };
    std::string text = cache_
        ? cache_->get_or_compute(SegmentKind::SystemInstructions, system_prompt_, render)
        : render();

    std::string identity = identity_segment();
    if (!identity.empty()) {
        text += "\n\n" + identity;
    }
    return text;
}

std::vector<std::string> ContextAssembler::select_tools(const std::string& text) const {
    std::vector<std::string> selected;
    if (!registry_) {
        return selected;
    }

    std::vector<std::string> words = utils::tokenize_words(text);
    for (const auto& def : registry_->get_definitions()) {
        bool match = def.always_offer;
        for (size_t i = 0; !match && i < def.topics.size(); ++i) {
            for (const auto& w : words) {
                if (utils::starts_with(w, def.topics[i])) {
                    match = true;
                    break;
                }
            }
        }
        if (match) {
            selected.push_back(def.name);
        }
    }
    return selected;
}

std::string ContextAssembler::tool_segment(const std::vector<std::string>& names) const {
    if (!registry_ || names.empty()) {
        return "[]";
    }
    std::string schemas = registry_->get_tool_definitions_json(names);
    // Cached in canonical form so a reordered selection reuses the entry
    return cache_
        ? cache_->get_or_compute(SegmentKind::ToolSchemas, schemas,
                                 [&schemas]() { return ContentNormalizer::normalize_tool_schemas(schemas); })
        : schemas;
}

AssembledContext ContextAssembler::build(const std::vector<Message>& history,
                                         const std::string& new_message,
                                         const ContextConfig& config) const {
    AssembledContext ctx;

    // Recent window, widened so the last turn is never split
    size_t window_start = history.size() > config.recent_messages
        ? history.size() - config.recent_messages : 0;
    size_t preserve_from = history.size();
    for (size_t i = history.size(); i > 0; --i) {
        if (history[i - 1].role == MessageRole::User) {
            preserve_from = i - 1;
            break;
        }
    }
    if (preserve_from == history.size() && !history.empty()) {
        preserve_from = history.size() - 1;
    }
    window_start = std::min(window_start, preserve_from);
    while (window_start < preserve_from && history[window_start].role == MessageRole::Tool) {
        window_start++;
    }

    std::vector<ScoredRecord> memories;
    if (memory_ && config.memory_top_k > 0) {
        memories = memory_->retrieve(new_message, config.memory_top_k, config.memory_min_score);
        // Skip memories already visible verbatim in the window
        memories.erase(std::remove_if(memories.begin(), memories.end(),
            [&](const ScoredRecord& m) {
                for (size_t i = window_start; i < history.size(); ++i) {
                    if (history[i].content == m.record.text) return true;
                }
                return false;
            }), memories.end());
    }

    std::string context_text = new_message;
    if (preserve_from < history.size() && history[preserve_from].role == MessageRole::User) {
        context_text += " " + history[preserve_from].content;
    }
    ctx.selected_tools = select_tools(context_text);
    std::string tools_json = tool_segment(ctx.selected_tools);

    Message system = Message::system(system_segment());
    Message user = Message::user(new_message);

    const int budget = config.max_tokens;
    int fixed = estimator_->estimate(system) + estimator_->estimate(user);
    int tools_cost = ctx.selected_tools.empty() ? 0 : estimator_->estimate(tools_json);

    auto memory_cost = [&]() {
        return memories.empty() ? 0 : estimator_->estimate(Message::system(render_memories(memories)));
    };
    auto history_cost = [&](size_t from) {
        int total = 0;
        for (size_t i = from; i < history.size(); ++i) {
            total += estimator_->estimate(history[i]);
        }
        return total;
    };

    int hist = history_cost(window_start);
    auto total = [&]() { return fixed + tools_cost + memory_cost() + hist; };

    // 1. memories, oldest first
    if (total() > budget && !memories.empty()) {
        std::vector<size_t> order(memories.size());
        for (size_t i = 0; i < order.size(); ++i) order[i] = i;
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            return memories[a].record.created_at_ms < memories[b].record.created_at_ms;
        });

        std::vector<ScoredRecord> all = memories;
        std::vector<bool> keep(all.size(), true);
        for (size_t idx : order) {
            if (total() <= budget) break;
            keep[idx] = false;
            ctx.dropped_memories++;
            memories.clear();
            for (size_t i = 0; i < all.size(); ++i) {
                if (keep[i]) memories.push_back(all[i]);
            }
        }
    }

    // 2. oldest history, never inside the preserved turn
    while (total() > budget && window_start < preserve_from) {
        hist -= estimator_->estimate(history[window_start]);
        window_start++;
        ctx.dropped_history++;
        while (window_start < preserve_from && history[window_start].role == MessageRole::Tool) {
            hist -= estimator_->estimate(history[window_start]);
            window_start++;
            ctx.dropped_history++;
        }
    }

    // 3. tool schemas
    if (total() > budget && tools_cost > 0) {
        tools_cost = 0;
        ctx.dropped_tools = true;
        ctx.selected_tools.clear();
        tools_json = "[]";
    }

    ctx.messages.push_back(system);
    if (!memories.empty()) {
        ctx.messages.push_back(Message::system(render_memories(memories)));
    }
    for (size_t i = window_start; i < history.size(); ++i) {
        ctx.messages.push_back(history[i]);
    }
    ctx.messages.push_back(user);

    ctx.tool_schemas_json = tools_json;
    ctx.memories_included = memories.size();
    ctx.estimated_tokens = total();
    ctx.over_budget = ctx.estimated_tokens > budget;

    LOG_CONTEXT("assembled " + std::to_string(ctx.messages.size()) + " messages, ~" +
                std::to_string(ctx.estimated_tokens) + "/" + std::to_string(budget) +
                " tokens, tools=" + std::to_string(ctx.selected_tools.size()) +
                ", memories=" + std::to_string(ctx.memories_included) +
                " (dropped " + std::to_string(ctx.dropped_memories) + ")");
    if (ctx.over_budget) {
        Logger::warn("[Context] over budget after truncation: ~" +
                     std::to_string(ctx.estimated_tokens) + " > " + std::to_string(budget));
    }
    return ctx;
}

} // namespace parley
