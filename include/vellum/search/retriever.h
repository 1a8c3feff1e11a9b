#pragma once

#include <vellum/core/types.h>
#include <vellum/vector/vector_store.h>

#include <memory>
#include <vector>

namespace vellum::search {

/// Project-scoped nearest neighbour lookup in front of the VectorStore.
class Retriever {
public:
    explicit Retriever(std::shared_ptr<vector::VectorStore> store);

    /**
     * Up to k chunks of `projectId`, closest first. InvalidArgument when k is
     * zero, ProjectNotFound for an unregistered project.
     */
    Result<std::vector<vector::RetrievedChunk>> retrieve(const ProjectId& projectId,
                                                         const Embedding& query, size_t k) const;

private:
    std::shared_ptr<vector::VectorStore> store_;
};

} // namespace vellum::search
