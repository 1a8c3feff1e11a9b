#include <vellum/vector/embedding_generator.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace vellum::vector {

EmbeddingGenerator::EmbeddingGenerator(std::shared_ptr<IEmbeddingProvider> provider,
                                       std::shared_ptr<core::PermitPool> permits,
                                       EmbeddingConfig config, core::Sleeper sleeper)
    : provider_(std::move(provider)), permits_(std::move(permits)), config_(std::move(config)),
      sleeper_(std::move(sleeper)) {
    if (!provider_ || !permits_) {
        throw std::invalid_argument("EmbeddingGenerator requires a provider and a permit pool");
    }
    dimension_ = config_.embedding_dim != 0 ? config_.embedding_dim : provider_->dimension();
    if (dimension_ == 0) {
        throw std::invalid_argument("Embedding dimension must be positive");
    }
    spdlog::debug("[Embedder] provider={} dim={} batch={}", provider_->name(), dimension_,
                  effectiveBatchSize());
}

size_t EmbeddingGenerator::effectiveBatchSize() const {
    size_t batch = std::min(config_.batch_size, provider_->maxBatchSize());
    return std::max<size_t>(batch, 1);
}

std::vector<Result<Embedding>> EmbeddingGenerator::generate(const std::vector<std::string>& texts) {
    std::vector<Result<Embedding>> out(texts.size(),
                                       Result<Embedding>(Error{ErrorCode::EmbeddingFailed,
                                                               "Not attempted"}));
    const size_t batch = effectiveBatchSize();
    for (size_t begin = 0; begin < texts.size(); begin += batch) {
        embedRange(texts, begin, std::min(begin + batch, texts.size()), out);
    }
    return out;
}

Result<Embedding> EmbeddingGenerator::embedQuery(const std::string& text) {
    auto results = generate({text});
    return std::move(results.front());
}

void EmbeddingGenerator::embedRange(const std::vector<std::string>& texts, size_t begin,
                                    size_t end, std::vector<Result<Embedding>>& out) {
    std::span<const std::string> batch(texts.data() + begin, end - begin);
    auto result = callProvider(batch);
    if (result) {
        auto vectors = std::move(result).value();
        for (size_t i = 0; i < vectors.size(); ++i) {
            out[begin + i] = std::move(vectors[i]);
        }
        return;
    }

    if (end - begin == 1) {
        stats_.failed_items.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[Embedder] item {} failed: {} ({})", begin, result.error().message,
                     result.error().code);
        out[begin] = Error{ErrorCode::EmbeddingFailed, result.error().message};
        return;
    }

    stats_.split_batches.fetch_add(1, std::memory_order_relaxed);
    size_t mid = begin + (end - begin) / 2;
    spdlog::debug("[Embedder] batch [{}, {}) failed ({}), splitting", begin, end,
                  result.error().message);
    embedRange(texts, begin, mid, out);
    embedRange(texts, mid, end, out);
}

Result<std::vector<Embedding>> EmbeddingGenerator::callProvider(std::span<const std::string> batch) {
    size_t attempts = 0;
    auto attempt = [&]() -> Result<std::vector<Embedding>> {
        if (attempts++ > 0) {
            stats_.retried_calls.fetch_add(1, std::memory_order_relaxed);
        }
        core::PermitPool::Permit permit(*permits_, core::PermitLane::Embedding,
                                        config_.permit_timeout);
        if (!permit) {
            return Error{ErrorCode::Timeout, "No embedding permit within " +
                                                 std::to_string(config_.permit_timeout.count()) +
                                                 "ms"};
        }

        stats_.provider_calls.fetch_add(1, std::memory_order_relaxed);
        auto response = provider_->embed(batch);
        if (!response) {
            return response;
        }

        auto vectors = std::move(response).value();
        if (auto valid = embedding_utils::validateBatch(vectors, batch.size(), dimension_);
            !valid) {
            return valid.error();
        }
        for (size_t i = 0; i < vectors.size(); ++i) {
            if (!embedding_utils::normalizeEmbedding(vectors[i])) {
                return Error{ErrorCode::InvalidData,
                             "Vector " + std::to_string(i) + " is zero or not finite"};
            }
        }
        return vectors;
    };

    return core::retryTransient(config_.retry, "embed batch", attempt, sleeper_);
}

} // namespace vellum::vector
