#include <vellum/search/reranker.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace vellum::search {

Reranker::Reranker(std::shared_ptr<IRelevanceScorer> scorer,
                   std::shared_ptr<core::PermitPool> permits, RerankConfig config,
                   core::Sleeper sleeper)
    : scorer_(std::move(scorer)), permits_(std::move(permits)), config_(std::move(config)),
      sleeper_(std::move(sleeper)) {
    config_.batch_size = std::max<size_t>(1, config_.batch_size);
    if (scorer_ && scorer_->maxBatchSize() > 0) {
        config_.batch_size = std::min(config_.batch_size, scorer_->maxBatchSize());
    }
}

Result<std::vector<float>> Reranker::scoreBatch(const std::string& query,
                                                const std::vector<std::string>& documents) {
    auto attempt = [&]() -> Result<std::vector<float>> {
        if (!permits_) {
            return scorer_->scoreDocuments(query, documents);
        }
        core::PermitPool::Permit permit(*permits_, core::PermitLane::Reranker,
                                        config_.permit_timeout);
        if (!permit) {
            return Error{ErrorCode::Timeout, "No reranker permit within " +
                                                 std::to_string(config_.permit_timeout.count()) +
                                                 "ms"};
        }
        return scorer_->scoreDocuments(query, documents);
    };

    auto scores = core::retryTransient(config_.retry, "rerank batch", attempt, sleeper_);
    if (!scores)
        return scores;
    if (scores.value().size() != documents.size()) {
        return Error{ErrorCode::InvalidData, "Scorer returned " +
                                                 std::to_string(scores.value().size()) +
                                                 " scores for " +
                                                 std::to_string(documents.size()) + " documents"};
    }
    for (float s : scores.value()) {
        if (!std::isfinite(s)) {
            return Error{ErrorCode::InvalidData, "Scorer returned a non-finite score"};
        }
    }
    return scores;
}

RerankOutcome Reranker::rerank(const std::string& query,
                               const std::vector<vector::RetrievedChunk>& candidates, size_t m) {
    RerankOutcome outcome;
    const size_t keep = std::min(m, candidates.size());
    if (keep == 0) {
        return outcome;
    }

    std::vector<RankedChunk> all;
    all.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        all.push_back(RankedChunk{candidates[i], std::nullopt, candidates[i].similarity, i});
    }

    auto fallback = [&](Error reason) {
        all.resize(keep);
        outcome.ranked = std::move(all);
        outcome.fallbackUsed = true;
        outcome.internalError = std::move(reason);
        return std::move(outcome);
    };

    if (!scorer_) {
        spdlog::debug("[Reranker] no scorer configured, keeping similarity order");
        return fallback(Error{ErrorCode::RerankerUnavailable, "No relevance scorer configured"});
    }

    std::optional<Error> lastError;
    size_t failedBatches = 0;
    for (size_t begin = 0; begin < all.size(); begin += config_.batch_size) {
        const size_t end = std::min(begin + config_.batch_size, all.size());
        std::vector<std::string> documents;
        documents.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            documents.push_back(all[i].chunk.content);
        }

        auto scores = scoreBatch(query, documents);
        if (!scores) {
            ++failedBatches;
            lastError = scores.error();
            spdlog::debug("[Reranker] batch [{}, {}) failed: {}", begin, end,
                          scores.error().message);
            continue;
        }
        for (size_t i = begin; i < end; ++i) {
            all[i].rerankScore = scores.value()[i - begin];
            all[i].score = *all[i].rerankScore;
            ++outcome.scoredCount;
        }
    }

    if (outcome.scoredCount == 0) {
        spdlog::warn("[Reranker] {} unavailable ({}), falling back to similarity order",
                     scorer_->name(), lastError ? lastError->message : "no scores");
        return fallback(Error{ErrorCode::RerankerUnavailable,
                              lastError ? lastError->message : "no scores"});
    }

    // Scored first by score; unscored keep similarity order; ties by similarity rank
    std::stable_sort(all.begin(), all.end(), [](const RankedChunk& a, const RankedChunk& b) {
        if (a.rerankScore.has_value() != b.rerankScore.has_value()) {
            return a.rerankScore.has_value();
        }
        if (a.rerankScore && *a.rerankScore != *b.rerankScore) {
            return *a.rerankScore > *b.rerankScore;
        }
        return a.originalRank < b.originalRank;
    });
    all.resize(keep);
    outcome.ranked = std::move(all);

    if (failedBatches > 0) {
        spdlog::warn("[Reranker] {} of {} batches failed; unscored candidates ranked by "
                     "similarity",
                     failedBatches, (candidates.size() + config_.batch_size - 1) /
                                        config_.batch_size);
        outcome.internalError = Error{ErrorCode::RerankerUnavailable, lastError->message};
    }
    return outcome;
}

} // namespace vellum::search
