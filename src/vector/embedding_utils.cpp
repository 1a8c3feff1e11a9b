#include <vellum/vector/embedding_provider.h>

#include <cmath>

namespace vellum::vector {

namespace embedding_utils {

bool normalizeEmbedding(Embedding& embedding) {
    double norm = 0.0;
    for (float v : embedding) {
        if (!std::isfinite(v))
            return false;
        norm += static_cast<double>(v) * static_cast<double>(v);
    }
    norm = std::sqrt(norm);
    if (norm <= 0.0 || !std::isfinite(norm))
        return false;
    for (float& v : embedding) {
        v = static_cast<float>(static_cast<double>(v) / norm);
    }
    return true;
}

Result<void> validateBatch(const std::vector<Embedding>& embeddings, size_t expectedCount,
                           size_t expectedDimension) {
    if (embeddings.size() != expectedCount) {
        return Error{ErrorCode::InvalidData, "Provider returned " +
                                                 std::to_string(embeddings.size()) +
                                                 " vectors for " + std::to_string(expectedCount) +
                                                 " inputs"};
    }
    for (size_t i = 0; i < embeddings.size(); ++i) {
        if (embeddings[i].size() != expectedDimension) {
            return Error{ErrorCode::InvalidData,
                         "Vector " + std::to_string(i) + " has dimension " +
                             std::to_string(embeddings[i].size()) + ", expected " +
                             std::to_string(expectedDimension)};
        }
    }
    return {};
}

double cosineSimilarity(std::span<const float> a, std::span<const float> b) {
    if (a.size() != b.size() || a.empty())
        return 0.0;
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na <= 0.0 || nb <= 0.0)
        return 0.0;
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

} // namespace embedding_utils

} // namespace vellum::vector
