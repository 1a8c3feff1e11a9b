#pragma once

#include <vellum/net/http_client.h>
#include <vellum/search/relevance_scorer.h>

#include <chrono>
#include <string>

namespace vellum::search {

struct HttpScorerOptions {
    std::string endpoint;
    std::string model;
    std::string apiKey;
    size_t maxBatch = 16;
    std::chrono::milliseconds timeout{10000};
};

/**
 * @brief Rerank service client: POST {"model", "query", "documents"} and read
 * `results[].{index, relevance_score}`.
 */
class HttpRelevanceScorer : public IRelevanceScorer {
public:
    explicit HttpRelevanceScorer(HttpScorerOptions options);

    Result<std::vector<float>> scoreDocuments(const std::string& query,
                                              const std::vector<std::string>& documents) override;

    size_t maxBatchSize() const override { return options_.maxBatch; }
    std::string name() const override { return "http"; }

    std::string buildRequest(const std::string& query,
                             const std::vector<std::string>& documents) const;

    /// Scores aligned with the request's documents; every index must be present once.
    static Result<std::vector<float>> parseResponse(const std::string& body, size_t expectedCount);

private:
    HttpScorerOptions options_;
    net::HttpClient http_;
};

} // namespace vellum::search
