#include <vellum/app/provider_factory.h>
#include <vellum/search/http_relevance_scorer.h>
#include <vellum/vector/http_embedding_provider.h>

#include <spdlog/spdlog.h>

namespace vellum::app {

Result<std::shared_ptr<vector::IEmbeddingProvider>>
createEmbeddingProvider(const config::EmbeddingSettings& settings) {
    if (settings.provider == "mock") {
        spdlog::warn("[Providers] using the mock embedding provider; results are not semantic");
        return std::shared_ptr<vector::IEmbeddingProvider>(
            std::make_shared<vector::MockEmbeddingProvider>(settings.dimension,
                                                            settings.batchSize));
    }

    vector::HttpEmbeddingOptions options;
    options.endpoint = settings.endpoint;
    options.model = settings.model;
    options.apiKey = settings.apiKey;
    options.dimension = settings.dimension;
    options.maxBatch = settings.batchSize;
    options.timeout = settings.timeout;

    if (settings.provider == "openai") {
        if (options.apiKey.empty() && options.endpoint.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         "embedding.api_key is required for the openai provider"};
        }
        return std::shared_ptr<vector::IEmbeddingProvider>(
            std::make_shared<vector::OpenAiEmbeddingProvider>(std::move(options)));
    }
    if (settings.provider == "ollama") {
        return std::shared_ptr<vector::IEmbeddingProvider>(
            std::make_shared<vector::OllamaEmbeddingProvider>(std::move(options)));
    }
    return Error{ErrorCode::InvalidArgument,
                 "Unknown embedding provider: " + settings.provider};
}

Result<std::shared_ptr<search::IRelevanceScorer>>
createRelevanceScorer(const config::RerankerSettings& settings) {
    if (settings.provider == "none") {
        return std::shared_ptr<search::IRelevanceScorer>();
    }
    if (settings.provider == "http") {
        if (settings.endpoint.empty()) {
            return Error{ErrorCode::InvalidArgument, "reranker.endpoint is required for http"};
        }
        search::HttpScorerOptions options;
        options.endpoint = settings.endpoint;
        options.model = settings.model;
        options.apiKey = settings.apiKey;
        options.maxBatch = settings.batchSize;
        options.timeout = settings.timeout;
        return std::shared_ptr<search::IRelevanceScorer>(
            std::make_shared<search::HttpRelevanceScorer>(std::move(options)));
    }
    return Error{ErrorCode::InvalidArgument, "Unknown reranker provider: " + settings.provider};
}

} // namespace vellum::app
