#pragma once
#include <memory>
#include <string>
#include <vector>
#include "cache_manager.hpp"
#include "config.hpp"

namespace doc_qa {

std::string utf8_safe_substr(const std::string& str, size_t length);

// Turns text into a fixed-length vector. Must be deterministic for a given
// text and model version. Throws on backend failure.
class EmbeddingFunction {
public:
    virtual ~EmbeddingFunction() = default;
    virtual std::vector<float> embed(const std::string& text) = 0;
    virtual int dimension() const = 0;
};

// Throws ModelUnavailable when the backend cannot produce text.
class GenerationFunction {
public:
    virtual ~GenerationFunction() = default;
    virtual std::string generate(const std::string& prompt, int max_tokens) = 0;
};

// Gemini REST backend for both embedding and generation.
class GeminiClient : public EmbeddingFunction, public GenerationFunction {
public:
    explicit GeminiClient(const ServiceConfig& config);

    std::vector<float> embed(const std::string& text) override;
    int dimension() const override { return dimension_; }
    std::string generate(const std::string& prompt, int max_tokens) override;

private:
    std::string base_url_;
    std::string api_key_;
    std::string embedding_model_;
    std::string generation_model_;
    int dimension_;

    std::string get_endpoint_url(const std::string& model, const std::string& action) const;
};

class CachingEmbeddingFunction : public EmbeddingFunction {
public:
    explicit CachingEmbeddingFunction(std::shared_ptr<EmbeddingFunction> inner,
                                      size_t max_entries = 1000,
                                      std::chrono::seconds ttl = std::chrono::seconds(3600))
        : inner_(std::move(inner)), cache_(max_entries, ttl) {}

    std::vector<float> embed(const std::string& text) override;
    int dimension() const override { return inner_->dimension(); }

    const EmbeddingCache& cache() const { return cache_; }

private:
    std::shared_ptr<EmbeddingFunction> inner_;
    EmbeddingCache cache_;
};

} // namespace doc_qa
