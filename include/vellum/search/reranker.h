#pragma once

#include <vellum/core/permit_pool.h>
#include <vellum/core/retry_policy.h>
#include <vellum/core/types.h>
#include <vellum/search/relevance_scorer.h>
#include <vellum/vector/vector_store.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vellum::search {

struct RerankConfig {
    size_t batch_size = 16;
    std::chrono::milliseconds permit_timeout{10000};
    core::RetryPolicy retry{.maxRetries = 1};
};

struct RankedChunk {
    vector::RetrievedChunk chunk;
    std::optional<float> rerankScore;
    double score = 0.0; // rerank score when present, similarity otherwise
    size_t originalRank = 0;
};

struct RerankOutcome {
    std::vector<RankedChunk> ranked;
    bool fallbackUsed = false;
    size_t scoredCount = 0;
    std::optional<Error> internalError; // logged, never surfaced to callers
};

/**
 * @brief Reorders retrieved candidates with an IRelevanceScorer.
 *
 * Scoring never fails the query: without a scorer, or when every batch fails,
 * the first M candidates come back in similarity order. When only some batches
 * fail, scored candidates lead by score and the rest follow in similarity
 * order. Equal scores keep their similarity order.
 */
class Reranker {
public:
    Reranker(std::shared_ptr<IRelevanceScorer> scorer, std::shared_ptr<core::PermitPool> permits,
             RerankConfig config = {}, core::Sleeper sleeper = core::defaultSleep);

    RerankOutcome rerank(const std::string& query,
                         const std::vector<vector::RetrievedChunk>& candidates, size_t m);

    bool hasScorer() const { return scorer_ != nullptr; }

private:
    Result<std::vector<float>> scoreBatch(const std::string& query,
                                          const std::vector<std::string>& documents);

    std::shared_ptr<IRelevanceScorer> scorer_;
    std::shared_ptr<core::PermitPool> permits_;
    RerankConfig config_;
    core::Sleeper sleeper_;
};

} // namespace vellum::search
