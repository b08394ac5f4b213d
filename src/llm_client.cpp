#include "llm_client.h"
#include "http_client.h"
#include "message_json.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace parley {

namespace {

const char* SUMMARY_SYSTEM_PROMPT =
    "Summarize the conversation below in at most five short sentences. Keep names, "
    "preferences, decisions and open questions. Write plain prose without preamble.";

UsageCounters usage_from(const json& j) {
    UsageCounters usage;
    usage.prompt_tokens = j.value("prompt_eval_count", 0);
    usage.completion_tokens = j.value("eval_count", 0);
    return usage;
}

} // namespace

class OllamaProvider::Impl {
public:
    explicit Impl(const LLMConfig& config) : config_(config) {}

    Result<ProbeResponse> probe(const std::vector<Message>& messages,
                                const std::string& tool_schemas_json,
                                const RequestOptions& options) {
        json request = build_request(messages, tool_schemas_json, false);
        auto response = post(request, options, config_.probe_timeout_ms, nullptr);
        if (response.is_error()) {
            return response.error();
        }

        try {
            json body = json::parse(response.value().body);
            if (body.contains("error")) {
                return classify_http_error(400, body["error"].dump());
            }

            ProbeResponse result;
            if (body.contains("message")) {
                const json& message = body["message"];
                if (message.contains("content") && message["content"].is_string()) {
                    result.content = message["content"].get<std::string>();
                }
                if (message.contains("tool_calls")) {
                    result.tool_calls = parse_tool_calls(message["tool_calls"]);
                }
            }
            result.usage = usage_from(body);
            result.stop_reason = body.value("done_reason", "");
            LOG_LLM("probe returned " + std::to_string(result.tool_calls.size()) + " tool call(s), " +
                    std::to_string(result.content.size()) + " content bytes");
            return result;
        } catch (const json::exception& e) {
            LOG_LLM(std::string("Response buffer: ") + response.value().body);
            return make_provider_error(std::string("JSON parse error: ") + e.what());
        }
    }

    Result<StreamSummary> stream(const std::vector<Message>& messages,
                                 const std::string& tool_schemas_json,
                                 const RequestOptions& options,
                                 const StreamDeltaCallback& on_delta) {
        json request = build_request(messages, tool_schemas_json, true);

        StreamSummary summary;
        std::string line_buffer;
        std::string stream_error;
        bool consumer_stopped = false;

        auto on_data = [&](const char* data, size_t size) -> bool {
            line_buffer.append(data, size);
            size_t newline;
            while ((newline = line_buffer.find('\n')) != std::string::npos) {
                std::string line = line_buffer.substr(0, newline);
                line_buffer.erase(0, newline + 1);
                if (utils::is_empty_or_whitespace(line)) continue;
                if (!handle_stream_line(line, summary, on_delta, stream_error)) {
                    consumer_stopped = stream_error.empty();
                    return false;
                }
            }
            return true;
        };

        auto response = post(request, options, config_.stream_timeout_ms, on_data);
        if (!stream_error.empty()) {
            return classify_stream_error(stream_error);
        }
        if (response.is_error()) {
            if (consumer_stopped && response.error().type == ErrorType::Cancelled) {
                return make_cancelled_error("Stream stopped by consumer");
            }
            return response.error();
        }
        if (!utils::is_empty_or_whitespace(line_buffer) &&
            !handle_stream_line(line_buffer, summary, on_delta, stream_error)) {
            if (!stream_error.empty()) {
                return classify_stream_error(stream_error);
            }
        }
        return summary;
    }

    Result<std::string> summarize(const std::string& conversation_text,
                                  const RequestOptions& options) {
        std::vector<Message> messages = {
            Message::system(SUMMARY_SYSTEM_PROMPT),
            Message::user(conversation_text)
        };
        json request = build_request(messages, "", false);
        request["options"]["num_predict"] = 256;

        RequestOptions opts = options;
        if (opts.timeout_ms == 0) opts.timeout_ms = config_.summary_timeout_ms;
        auto response = post(request, opts, config_.summary_timeout_ms, nullptr);
        if (response.is_error()) {
            return response.error();
        }
        try {
            json body = json::parse(response.value().body);
            std::string content;
            if (body.contains("message") && body["message"].contains("content") &&
                body["message"]["content"].is_string()) {
                content = body["message"]["content"].get<std::string>();
            }
            content = utils::trim_copy(content);
            if (content.empty()) {
                return make_provider_error("Empty summary");
            }
            return content;
        } catch (const json::exception& e) {
            return make_provider_error(std::string("JSON parse error: ") + e.what());
        }
    }

private:
    json build_request(const std::vector<Message>& messages,
                       const std::string& tool_schemas_json, bool streaming) const {
        json request;
        request["model"] = config_.model_name;
        request["messages"] = messages_to_json(messages);
        request["stream"] = streaming;
        request["options"]["temperature"] = config_.temperature;
        request["options"]["num_predict"] = config_.max_tokens;

        if (!tool_schemas_json.empty()) {
            json tools = json::parse(tool_schemas_json, nullptr, false);
            if (tools.is_discarded() || !tools.is_array()) {
                Logger::warn("[LLM] ignoring malformed tool definitions");
            } else if (!tools.empty()) {
                request["tools"] = tools;
            }
        }
        return request;
    }

    Result<HttpResponse> post(const json& request, const RequestOptions& options, int default_timeout_ms,
                              std::function<bool(const char*, size_t)> on_data) const {
        HttpRequest http;
        http.url = config_.endpoint;
        http.body = request.dump();
        http.timeout_ms = options.timeout_ms > 0 ? options.timeout_ms : default_timeout_ms;
        http.connect_timeout_ms = constants::llm::CONNECT_TIMEOUT_MS;
        http.cancelled = options.cancelled;
        http.on_data = std::move(on_data);

        Logger::debug("[LLM] POST " + config_.endpoint + " (" + std::to_string(http.body.size()) + " bytes)");
        auto response = http_post(http);
        if (response.is_error()) {
            LOG_LLM("request failed: " + response.error().describe());
            return response.error();
        }
        if (response.value().status != 200) {
            return classify_http_error(response.value().status, response.value().body);
        }
        return response;
    }

    // Returns false to stop reading (done, consumer stop, or error in stream_error)
    bool handle_stream_line(const std::string& line, StreamSummary& summary,
                            const StreamDeltaCallback& on_delta, std::string& stream_error) const {
        json chunk = json::parse(line, nullptr, false);
        if (chunk.is_discarded()) {
            Logger::warn("[LLM] skipping unparseable stream line");
            return true;
        }
        if (chunk.contains("error")) {
            stream_error = chunk["error"].is_string() ? chunk["error"].get<std::string>() : chunk["error"].dump();
            return false;
        }
        if (chunk.contains("message") && chunk["message"].contains("content") &&
            chunk["message"]["content"].is_string()) {
            std::string delta = chunk["message"]["content"].get<std::string>();
            if (!delta.empty()) {
                summary.content += delta;
                if (on_delta && !on_delta(delta)) {
                    return false;
                }
            }
        }
        if (chunk.value("done", false)) {
            summary.usage = usage_from(chunk);
            summary.stop_reason = chunk.value("done_reason", "stop");
        }
        return true;
    }

    LLMConfig config_;
};

Error OllamaProvider::classify_http_error(long status, const std::string& body) {
    std::string lower = utils::to_lower(body);
    if (lower.find("does not support tools") != std::string::npos ||
        lower.find("tools are not supported") != std::string::npos ||
        lower.find("tool use is not supported") != std::string::npos) {
        return make_unsupported_error("Model does not support tools: " + utils::truncate_utf8(body, 200));
    }
    if (status == 429 || status == 408 || status >= 500) {
        return make_transient_error("Provider returned HTTP " + std::to_string(status) + ": " +
                                    utils::truncate_utf8(body, 200));
    }
    return make_provider_error("Provider returned HTTP " + std::to_string(status) + ": " +
                               utils::truncate_utf8(body, 200));
}

Error OllamaProvider::classify_stream_error(const std::string& message) {
    static const char* const transient_markers[] = {
        "busy", "try again", "overloaded", "too many requests", "rate limit",
        "timed out", "timeout", "unavailable", "connection reset"
    };
    std::string lower = utils::to_lower(message);
    for (const char* marker : transient_markers) {
        if (lower.find(marker) != std::string::npos) {
            return make_transient_error("Provider failed mid-stream: " + utils::truncate_utf8(message, 200));
        }
    }
    Error error = classify_http_error(400, message);
    if (error.type == ErrorType::Provider) {
        error.message = "Provider failed mid-stream: " + utils::truncate_utf8(message, 200);
    }
    return error;
}

OllamaProvider::OllamaProvider(const LLMConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

OllamaProvider::~OllamaProvider() = default;

Result<ProbeResponse> OllamaProvider::probe(const std::vector<Message>& messages,
                                            const std::string& tool_schemas_json,
                                            const RequestOptions& options) {
    return pimpl_->probe(messages, tool_schemas_json, options);
}

Result<StreamSummary> OllamaProvider::stream(const std::vector<Message>& messages,
                                             const std::string& tool_schemas_json,
                                             const RequestOptions& options,
                                             const StreamDeltaCallback& on_delta) {
    return pimpl_->stream(messages, tool_schemas_json, options, on_delta);
}

Result<std::string> OllamaProvider::summarize(const std::string& conversation_text,
                                              const RequestOptions& options) {
    return pimpl_->summarize(conversation_text, options);
}

} // namespace parley
