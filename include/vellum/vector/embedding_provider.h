#pragma once

#include <vellum/core/types.h>

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace vellum::vector {

/**
 * Capability interface over an external embedding service. Adapters own the
 * provider specific request and response shapes.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    /**
     * Embed a batch of at most maxBatchSize() texts. On success the result is
     * index-aligned with `texts`. Errors:
     *  - Timeout, RateLimited, NetworkError: transient, worth retrying
     *  - anything else: the batch as sent cannot be embedded
     */
    virtual Result<std::vector<Embedding>> embed(std::span<const std::string> texts) = 0;

    virtual size_t maxBatchSize() const = 0;
    virtual size_t dimension() const = 0;
    virtual std::string name() const = 0;
};

/**
 * Deterministic provider for development and tests: each text is mapped to a
 * unit vector seeded from its FNV-1a hash.
 */
class MockEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit MockEmbeddingProvider(size_t dimension = 384, size_t maxBatch = 64);

    Result<std::vector<Embedding>> embed(std::span<const std::string> texts) override;

    size_t maxBatchSize() const override { return maxBatch_; }
    size_t dimension() const override { return dimension_; }
    std::string name() const override { return "mock"; }

    static Embedding embedOne(const std::string& text, size_t dimension);

private:
    size_t dimension_;
    size_t maxBatch_;
};

namespace embedding_utils {

/// L2 normalization in place; false for zero or non-finite vectors.
bool normalizeEmbedding(Embedding& embedding);

/// Count and dimension check of a provider response.
Result<void> validateBatch(const std::vector<Embedding>& embeddings, size_t expectedCount,
                           size_t expectedDimension);

double cosineSimilarity(std::span<const float> a, std::span<const float> b);

} // namespace embedding_utils

} // namespace vellum::vector
