#pragma once

#include "llm_provider.h"
#include "config.h"
#include <memory>

namespace parley {

/**
 * @brief LlmProvider backed by an Ollama server's /api/chat endpoint
 *
 * Probe and summarize use "stream": false; stream() reads the
 * newline-delimited JSON chunks as they arrive. Usage counters come from
 * prompt_eval_count / eval_count on the final chunk.
 */
class OllamaProvider : public LlmProvider {
public:
    explicit OllamaProvider(const LLMConfig& config);
    ~OllamaProvider() override;

    // Non-copyable
    OllamaProvider(const OllamaProvider&) = delete;
    OllamaProvider& operator=(const OllamaProvider&) = delete;

    Result<ProbeResponse> probe(const std::vector<Message>& messages,
                                const std::string& tool_schemas_json,
                                const RequestOptions& options) override;

    Result<StreamSummary> stream(const std::vector<Message>& messages,
                                 const std::string& tool_schemas_json,
                                 const RequestOptions& options,
                                 const StreamDeltaCallback& on_delta) override;

    Result<std::string> summarize(const std::string& conversation_text,
                                  const RequestOptions& options) override;

    std::string name() const override { return "ollama"; }

    /**
     * @brief Map an HTTP error status and body to the provider error taxonomy
     */
    static Error classify_http_error(long status, const std::string& body);

    /**
     * @brief Map an {"error": ...} line received mid-stream
     *
     * The HTTP status is already 200 by then, so the wording decides:
     * overload and timeout messages are transient.
     */
    static Error classify_stream_error(const std::string& message);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace parley
