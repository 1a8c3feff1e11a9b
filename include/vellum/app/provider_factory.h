#pragma once

#include <vellum/config/vellum_config.h>
#include <vellum/core/types.h>
#include <vellum/search/relevance_scorer.h>
#include <vellum/vector/embedding_provider.h>

#include <memory>

namespace vellum::app {

/// Provider named by `embedding.provider`: mock, openai or ollama.
Result<std::shared_ptr<vector::IEmbeddingProvider>>
createEmbeddingProvider(const config::EmbeddingSettings& settings);

/// Scorer named by `reranker.provider`; "none" yields a null scorer.
Result<std::shared_ptr<search::IRelevanceScorer>>
createRelevanceScorer(const config::RerankerSettings& settings);

} // namespace vellum::app
