#pragma once

#include <vellum/net/http_client.h>
#include <vellum/vector/embedding_provider.h>

#include <chrono>
#include <string>

namespace vellum::vector {

struct HttpEmbeddingOptions {
    std::string endpoint;
    std::string model;
    std::string apiKey;
    size_t dimension = 1536;
    size_t maxBatch = 64;
    std::chrono::milliseconds timeout{30000};
};

/// OpenAI-compatible `/v1/embeddings` endpoint.
class OpenAiEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit OpenAiEmbeddingProvider(HttpEmbeddingOptions options);

    Result<std::vector<Embedding>> embed(std::span<const std::string> texts) override;

    size_t maxBatchSize() const override { return options_.maxBatch; }
    size_t dimension() const override { return options_.dimension; }
    std::string name() const override { return "openai"; }

    std::string buildRequest(std::span<const std::string> texts) const;

    /// `data[].{index, embedding}`, reordered by index.
    static Result<std::vector<Embedding>> parseResponse(const std::string& body,
                                                        size_t expectedCount);

private:
    HttpEmbeddingOptions options_;
    net::HttpClient http_;
};

/// Ollama `/api/embed` endpoint.
class OllamaEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit OllamaEmbeddingProvider(HttpEmbeddingOptions options);

    Result<std::vector<Embedding>> embed(std::span<const std::string> texts) override;

    size_t maxBatchSize() const override { return options_.maxBatch; }
    size_t dimension() const override { return options_.dimension; }
    std::string name() const override { return "ollama"; }

    std::string buildRequest(std::span<const std::string> texts) const;

    /// `embeddings[][]`, in input order.
    static Result<std::vector<Embedding>> parseResponse(const std::string& body,
                                                        size_t expectedCount);

private:
    HttpEmbeddingOptions options_;
    net::HttpClient http_;
};

} // namespace vellum::vector
