#pragma once

#include <vellum/core/permit_pool.h>
#include <vellum/core/retry_policy.h>
#include <vellum/core/types.h>
#include <vellum/vector/embedding_provider.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace vellum::vector {

struct EmbeddingConfig {
    size_t batch_size = 64;   // Capped by the provider's own limit
    size_t embedding_dim = 0; // 0: take the provider's dimension
    std::chrono::milliseconds permit_timeout{30000};
    core::RetryPolicy retry;
};

struct EmbeddingStats {
    std::atomic<uint64_t> provider_calls{0};
    std::atomic<uint64_t> retried_calls{0};
    std::atomic<uint64_t> split_batches{0};
    std::atomic<uint64_t> failed_items{0};
};

/**
 * Batches texts through an IEmbeddingProvider under the shared embedding
 * permit lane.
 *
 * A batch is retried on transient errors with backoff. A batch that still
 * fails, or whose response is malformed, is halved recursively so that a bad
 * item only fails itself. Returned vectors are complete, of dimension D and
 * unit length.
 */
class EmbeddingGenerator {
public:
    EmbeddingGenerator(std::shared_ptr<IEmbeddingProvider> provider,
                       std::shared_ptr<core::PermitPool> permits, EmbeddingConfig config = {},
                       core::Sleeper sleeper = core::defaultSleep);

    /// One result per input, same order. Failed items carry EmbeddingFailed.
    std::vector<Result<Embedding>> generate(const std::vector<std::string>& texts);

    Result<Embedding> embedQuery(const std::string& text);

    size_t dimension() const { return dimension_; }
    size_t effectiveBatchSize() const;
    const EmbeddingStats& stats() const { return stats_; }
    const IEmbeddingProvider& provider() const { return *provider_; }

private:
    void embedRange(const std::vector<std::string>& texts, size_t begin, size_t end,
                    std::vector<Result<Embedding>>& out);
    Result<std::vector<Embedding>> callProvider(std::span<const std::string> batch);

    std::shared_ptr<IEmbeddingProvider> provider_;
    std::shared_ptr<core::PermitPool> permits_;
    EmbeddingConfig config_;
    core::Sleeper sleeper_;
    size_t dimension_;
    EmbeddingStats stats_;
};

} // namespace vellum::vector
