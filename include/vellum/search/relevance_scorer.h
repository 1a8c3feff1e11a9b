#pragma once

#include <vellum/core/types.h>

#include <cstddef>
#include <string>
#include <vector>

namespace vellum::search {

/**
 * @brief Cross-encoder style relevance scoring of (query, document) pairs.
 *
 * Scores are index-aligned with `documents`; higher means more relevant.
 */
class IRelevanceScorer {
public:
    virtual ~IRelevanceScorer() = default;

    virtual Result<std::vector<float>> scoreDocuments(const std::string& query,
                                                      const std::vector<std::string>& documents) = 0;

    virtual size_t maxBatchSize() const = 0;
    virtual std::string name() const = 0;
};

} // namespace vellum::search
