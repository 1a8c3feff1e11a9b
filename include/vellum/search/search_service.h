#pragma once

#include <vellum/core/types.h>
#include <vellum/search/context_assembler.h>
#include <vellum/search/reranker.h>
#include <vellum/search/retriever.h>
#include <vellum/vector/embedding_generator.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vellum::search {

struct SourceRef {
    std::string filename;
    size_t chunkIndex = 0;
    size_t startOffset = 0;
    size_t endOffset = 0;
};

struct SearchHit {
    ChunkId chunkId;
    DocumentId documentId;
    std::string text;
    SourceRef source;
    double score = 0.0;
    double similarity = 0.0;
    std::optional<float> rerankScore;
    size_t retrievalRank = 0;
};

struct SearchResponse {
    std::vector<SearchHit> hits;
    AssembledContext context;
    size_t candidateCount = 0;
    bool rerankFallback = false;
};

/**
 * @brief Query pipeline: embed, retrieve K, rerank to M, assemble context.
 */
class SearchService {
public:
    SearchService(std::shared_ptr<vector::EmbeddingGenerator> embedder,
                  std::shared_ptr<Retriever> retriever, std::shared_ptr<Reranker> reranker,
                  size_t maxContextChars);

    Result<std::vector<SearchHit>> search(const ProjectId& projectId, const std::string& query,
                                          size_t k, size_t m);

    Result<SearchResponse> searchWithContext(const ProjectId& projectId, const std::string& query,
                                             size_t k, size_t m);

    static Result<void> validateRequest(const std::string& query, size_t k, size_t m);

private:
    std::shared_ptr<vector::EmbeddingGenerator> embedder_;
    std::shared_ptr<Retriever> retriever_;
    std::shared_ptr<Reranker> reranker_;
    ContextAssembler assembler_;
};

} // namespace vellum::search
