#pragma once

#include "config.h"
#include "errors.h"
#include <string>
#include <vector>
#include <memory>

namespace parley {

using Embedding = std::vector<float>;

/**
 * @brief Text to fixed-length vector
 *
 * Implementations must be deterministic for identical input within a
 * process lifetime and always return dimensions() floats.
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual size_t dimensions() const = 0;

    virtual Result<Embedding> embed(const std::string& text) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Offline embedder using signed feature hashing
 *
 * Word unigrams and character trigrams are hashed (FNV-1a) into a fixed
 * number of buckets and the result is L2-normalized, so identical text maps
 * to identical vectors and texts sharing words score high on cosine.
 */
class HashingEmbeddingProvider : public EmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(size_t dimensions = 256);

    size_t dimensions() const override { return dimensions_; }
    Result<Embedding> embed(const std::string& text) override;
    std::string name() const override { return "hashing"; }

private:
    size_t dimensions_;
};

/**
 * @brief Embeddings from an Ollama server (/api/embeddings)
 */
class OllamaEmbeddingProvider : public EmbeddingProvider {
public:
    explicit OllamaEmbeddingProvider(const EmbeddingConfig& config);
    ~OllamaEmbeddingProvider() override;

    OllamaEmbeddingProvider(const OllamaEmbeddingProvider&) = delete;
    OllamaEmbeddingProvider& operator=(const OllamaEmbeddingProvider&) = delete;

    size_t dimensions() const override;
    Result<Embedding> embed(const std::string& text) override;
    std::string name() const override { return "ollama"; }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Build the provider named by config.provider ("hashing" or "ollama")
 */
std::shared_ptr<EmbeddingProvider> make_embedding_provider(const EmbeddingConfig& config);

} // namespace parley
