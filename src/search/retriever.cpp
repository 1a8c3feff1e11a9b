#include <vellum/search/retriever.h>

#include <spdlog/spdlog.h>

namespace vellum::search {

Retriever::Retriever(std::shared_ptr<vector::VectorStore> store) : store_(std::move(store)) {}

Result<std::vector<vector::RetrievedChunk>>
Retriever::retrieve(const ProjectId& projectId, const Embedding& query, size_t k) const {
    if (k == 0) {
        return Error{ErrorCode::InvalidArgument, "k must be positive"};
    }
    auto known = store_->hasProject(projectId);
    if (!known)
        return known.error();
    if (!known.value()) {
        return Error{ErrorCode::ProjectNotFound, "Project not found: " + projectId};
    }

    auto hits = store_->searchNearest(projectId, query, k);
    if (hits) {
        spdlog::debug("[Retriever] project {}: {} of k={} candidates", projectId,
                      hits.value().size(), k);
    }
    return hits;
}

} // namespace vellum::search
