#include <vellum/core/utf8.h>
#include <vellum/search/search_service.h>

#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>

namespace vellum::search {

SearchService::SearchService(std::shared_ptr<vector::EmbeddingGenerator> embedder,
                             std::shared_ptr<Retriever> retriever,
                             std::shared_ptr<Reranker> reranker, size_t maxContextChars)
    : embedder_(std::move(embedder)),
      retriever_(std::move(retriever)),
      reranker_(std::move(reranker)),
      assembler_(maxContextChars) {
    if (!embedder_ || !retriever_ || !reranker_) {
        throw std::invalid_argument("SearchService requires embedder, retriever and reranker");
    }
}

Result<void> SearchService::validateRequest(const std::string& query, size_t k, size_t m) {
    if (query.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Error{ErrorCode::InvalidArgument, "Query text is empty"};
    }
    if (!core::isValidUtf8(query)) {
        return Error{ErrorCode::InvalidArgument, "Query text is not valid UTF-8"};
    }
    if (k == 0 || m == 0) {
        return Error{ErrorCode::InvalidArgument, "k and m must be positive"};
    }
    if (m > k) {
        return Error{ErrorCode::InvalidArgument,
                     "m (" + std::to_string(m) + ") must not exceed k (" + std::to_string(k) +
                         ")"};
    }
    return {};
}

Result<SearchResponse> SearchService::searchWithContext(const ProjectId& projectId,
                                                        const std::string& query, size_t k,
                                                        size_t m) {
    if (auto valid = validateRequest(query, k, m); !valid) {
        return valid.error();
    }
    auto started = std::chrono::steady_clock::now();

    auto embedding = embedder_->embedQuery(query);
    if (!embedding) {
        return embedding.error();
    }

    auto candidates = retriever_->retrieve(projectId, embedding.value(), k);
    if (!candidates) {
        return candidates.error();
    }

    auto outcome = reranker_->rerank(query, candidates.value(), m);
    if (outcome.internalError) {
        spdlog::debug("[Search] rerank degraded: {}", outcome.internalError->message);
    }

    SearchResponse response;
    response.candidateCount = candidates.value().size();
    response.rerankFallback = outcome.fallbackUsed;
    response.context = assembler_.assemble(outcome.ranked);

    // Entries follow the ranked order one to one, possibly cut short by the budget
    for (size_t i = 0; i < response.context.entries.size(); ++i) {
        const auto& entry = response.context.entries[i];
        const auto& ranked = outcome.ranked[i];
        SearchHit hit;
        hit.chunkId = entry.chunkId;
        hit.documentId = entry.documentId;
        hit.text = entry.text;
        hit.source = SourceRef{entry.filename, entry.chunkIndex, entry.startOffset,
                               entry.endOffset};
        hit.score = ranked.score;
        hit.similarity = ranked.chunk.similarity;
        hit.rerankScore = ranked.rerankScore;
        hit.retrievalRank = ranked.originalRank;
        response.hits.push_back(std::move(hit));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("[Search] project {}: {} candidates, {} hits in {}ms{}", projectId,
                 response.candidateCount, response.hits.size(), elapsed.count(),
                 response.rerankFallback ? " (similarity order)" : "");
    return response;
}

Result<std::vector<SearchHit>> SearchService::search(const ProjectId& projectId,
                                                     const std::string& query, size_t k,
                                                     size_t m) {
    auto response = searchWithContext(projectId, query, k, m);
    if (!response) {
        return response.error();
    }
    return std::move(response).value().hits;
}

} // namespace vellum::search
