#include <vellum/core/ids.h>
#include <vellum/vector/embedding_provider.h>

#include <spdlog/spdlog.h>
#include <random>

namespace vellum::vector {

MockEmbeddingProvider::MockEmbeddingProvider(size_t dimension, size_t maxBatch)
    : dimension_(dimension), maxBatch_(maxBatch == 0 ? 1 : maxBatch) {
    spdlog::debug("MockEmbeddingProvider created with dimension {}", dimension);
}

Embedding MockEmbeddingProvider::embedOne(const std::string& text, size_t dimension) {
    std::mt19937_64 gen(core::fnv1a64(text));
    std::normal_distribution<float> dist(0.0f, 1.0f);

    Embedding embedding(dimension);
    for (auto& v : embedding) {
        v = dist(gen);
    }
    embedding_utils::normalizeEmbedding(embedding);
    return embedding;
}

Result<std::vector<Embedding>> MockEmbeddingProvider::embed(std::span<const std::string> texts) {
    if (texts.size() > maxBatch_) {
        return Error{ErrorCode::InvalidArgument, "Batch larger than provider limit"};
    }
    std::vector<Embedding> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        out.push_back(embedOne(text, dimension_));
    }
    return out;
}

} // namespace vellum::vector
