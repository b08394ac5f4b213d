#include "embedding_provider.h"
#include "http_client.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <cmath>

using json = nlohmann::json;

namespace parley {

// =============================================================================
// HashingEmbeddingProvider
// =============================================================================

namespace {

uint64_t fnv1a(const std::string& text) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

void add_feature(Embedding& vec, const std::string& feature, float weight) {
    uint64_t h = fnv1a(feature);
    size_t bucket = static_cast<size_t>(h % vec.size());
    float sign = ((h >> 63) & 1ULL) ? -1.0f : 1.0f;
    vec[bucket] += sign * weight;
}

} // namespace

HashingEmbeddingProvider::HashingEmbeddingProvider(size_t dimensions)
    : dimensions_(dimensions == 0 ? 1 : dimensions) {}

Result<Embedding> HashingEmbeddingProvider::embed(const std::string& text) {
    Embedding vec(dimensions_, 0.0f);

    for (const auto& word : utils::tokenize_words(text)) {
        add_feature(vec, "w:" + word, 1.0f);
        std::string padded = "#" + word + "#";
        for (size_t i = 0; i + 3 <= padded.size(); ++i) {
            add_feature(vec, "t:" + padded.substr(i, 3), 0.25f);
        }
    }

    double norm = 0.0;
    for (float v : vec) norm += static_cast<double>(v) * v;
    if (norm > 0.0) {
        float inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (float& v : vec) v *= inv;
    }
    return vec;
}

// =============================================================================
// OllamaEmbeddingProvider
// =============================================================================

class OllamaEmbeddingProvider::Impl {
public:
    explicit Impl(const EmbeddingConfig& config) : config_(config) {}

    Result<Embedding> embed(const std::string& text) {
        json request;
        request["model"] = config_.model_name;
        request["prompt"] = text;

        HttpRequest http;
        http.url = config_.endpoint;
        http.body = request.dump();
        http.timeout_ms = config_.timeout_ms;

        auto response = http_post(http);
        if (response.is_error()) {
            return response.error();
        }
        if (response.value().status != 200) {
            return make_provider_error("Embedding request failed with HTTP " +
                                       std::to_string(response.value().status));
        }

        try {
            json body = json::parse(response.value().body);
            if (!body.contains("embedding") || !body["embedding"].is_array()) {
                return make_provider_error("Embedding response has no \"embedding\" array");
            }
            Embedding vec = body["embedding"].get<Embedding>();
            if (vec.size() != config_.dimensions) {
                return make_error(ErrorType::Validation,
                                  "Embedding dimension " + std::to_string(vec.size()) +
                                  " does not match configured " + std::to_string(config_.dimensions));
            }
            double norm = 0.0;
            for (float v : vec) norm += static_cast<double>(v) * v;
            if (norm > 0.0) {
                float inv = static_cast<float>(1.0 / std::sqrt(norm));
                for (float& v : vec) v *= inv;
            }
            return vec;
        } catch (const json::exception& e) {
            return make_parse_error(std::string("Embedding response parse error: ") + e.what());
        }
    }

    size_t dimensions() const { return config_.dimensions; }

private:
    EmbeddingConfig config_;
};

OllamaEmbeddingProvider::OllamaEmbeddingProvider(const EmbeddingConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

OllamaEmbeddingProvider::~OllamaEmbeddingProvider() = default;

size_t OllamaEmbeddingProvider::dimensions() const {
    return impl_->dimensions();
}

Result<Embedding> OllamaEmbeddingProvider::embed(const std::string& text) {
    return impl_->embed(text);
}

std::shared_ptr<EmbeddingProvider> make_embedding_provider(const EmbeddingConfig& config) {
    if (config.provider == "ollama") {
        Logger::info("[Memory] embeddings via Ollama model " + config.model_name);
        return std::make_shared<OllamaEmbeddingProvider>(config);
    }
    if (config.provider != "hashing") {
        Logger::warn("[Memory] unknown embedding provider \"" + config.provider + "\"; using hashing");
    }
    return std::make_shared<HashingEmbeddingProvider>(config.dimensions);
}

} // namespace parley
