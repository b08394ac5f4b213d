#pragma once

#include "core/types.h"
#include "errors.h"
#include <string>
#include <vector>
#include <functional>
#include <atomic>

namespace parley {

/**
 * @brief Per-call knobs: every provider call carries its own timeout
 */
struct RequestOptions {
    int timeout_ms = 0;                               ///< 0 = provider default
    const std::atomic<bool>* cancelled = nullptr;     ///< Checked while the call is in flight
};

/**
 * @brief Non-streaming response: plain content or tool-call requests
 */
struct ProbeResponse {
    std::string content;
    std::vector<ToolCall> tool_calls;
    UsageCounters usage;
    std::string stop_reason;

    bool has_tool_calls() const { return !tool_calls.empty(); }
    bool has_content() const { return !content.empty(); }
};

/**
 * @brief What a finished stream produced
 */
struct StreamSummary {
    std::string content;
    UsageCounters usage;
    std::string stop_reason;
};

/// Receives each text delta; return false to stop the stream
using StreamDeltaCallback = std::function<bool(const std::string& delta)>;

/**
 * @brief Contract the coordinator needs from an LLM vendor
 *
 * Errors are classified: TransientProvider (retryable), UnsupportedCapability
 * (tool schemas rejected), Cancelled, Provider (everything else). Providers
 * must not throw.
 */
class LlmProvider {
public:
    virtual ~LlmProvider() = default;

    /**
     * @brief Non-streaming call that reveals whether the model wants tools
     * @param tool_schemas_json OpenAI-format tool array, empty for none
     */
    virtual Result<ProbeResponse> probe(const std::vector<Message>& messages,
                                        const std::string& tool_schemas_json,
                                        const RequestOptions& options) = 0;

    /**
     * @brief Streaming call; on_delta sees text as it arrives
     */
    virtual Result<StreamSummary> stream(const std::vector<Message>& messages,
                                         const std::string& tool_schemas_json,
                                         const RequestOptions& options,
                                         const StreamDeltaCallback& on_delta) = 0;

    /**
     * @brief Condense conversation text (background compression)
     */
    virtual Result<std::string> summarize(const std::string& conversation_text,
                                          const RequestOptions& options) = 0;

    virtual std::string name() const = 0;
};

} // namespace parley
