#include <gtest/gtest.h>
#include <vellum/vector/embedding_generator.h>

#include "common/fakes.h"

#include <cmath>
#include <mutex>
#include <thread>

using namespace vellum;
using namespace vellum::vector;
using vellum::tests::ScriptedEmbeddingProvider;

class EmbeddingGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = std::make_shared<ScriptedEmbeddingProvider>(16, 8);
        permits_ = std::make_shared<core::PermitPool>(2, 1);
        config_.batch_size = 64;
        config_.permit_timeout = std::chrono::milliseconds(5000);
        config_.retry.maxRetries = 2;
        config_.retry.jitterFraction = 0.0;
    }

    std::unique_ptr<EmbeddingGenerator> makeGenerator() {
        return std::make_unique<EmbeddingGenerator>(
            provider_, permits_, config_, [this](std::chrono::milliseconds d) {
                std::lock_guard<std::mutex> lock(sleepMutex_);
                sleeps_.push_back(d);
            });
    }

    static std::vector<std::string> texts(size_t n) {
        std::vector<std::string> out;
        for (size_t i = 0; i < n; ++i)
            out.push_back("passage number " + std::to_string(i));
        return out;
    }

    std::shared_ptr<ScriptedEmbeddingProvider> provider_;
    std::shared_ptr<core::PermitPool> permits_;
    EmbeddingConfig config_;
    std::mutex sleepMutex_;
    std::vector<std::chrono::milliseconds> sleeps_;
};

TEST_F(EmbeddingGeneratorTest, RejectsMissingCollaborators) {
    EXPECT_THROW({ EmbeddingGenerator g(nullptr, permits_); }, std::invalid_argument);
    EXPECT_THROW({ EmbeddingGenerator g(provider_, nullptr); }, std::invalid_argument);
}

TEST_F(EmbeddingGeneratorTest, BatchesRespectProviderLimitAndKeepOrder) {
    auto generator = makeGenerator();
    EXPECT_EQ(generator->effectiveBatchSize(), 8u);
    EXPECT_EQ(generator->dimension(), 16u);

    auto input = texts(20);
    auto results = generator->generate(input);

    ASSERT_EQ(results.size(), input.size());
    EXPECT_EQ(provider_->batchSizes(), (std::vector<size_t>{8, 8, 4}));
    for (size_t i = 0; i < input.size(); ++i) {
        ASSERT_TRUE(results[i]) << "item " << i;
        auto expected = MockEmbeddingProvider::embedOne(input[i], 16);
        const auto& got = results[i].value();
        ASSERT_EQ(got.size(), 16u);
        double norm = 0.0;
        for (size_t d = 0; d < got.size(); ++d) {
            EXPECT_NEAR(got[d], expected[d], 1e-5);
            norm += static_cast<double>(got[d]) * got[d];
        }
        EXPECT_NEAR(norm, 1.0, 1e-4);
    }
}

TEST_F(EmbeddingGeneratorTest, EmptyInputMakesNoCalls) {
    auto generator = makeGenerator();
    EXPECT_TRUE(generator->generate({}).empty());
    EXPECT_EQ(provider_->calls(), 0u);
}

TEST_F(EmbeddingGeneratorTest, TransientErrorsAreRetriedWithBackoff) {
    provider_->queueError(ErrorCode::RateLimited);
    provider_->queueError(ErrorCode::Timeout);
    auto generator = makeGenerator();

    auto results = generator->generate(texts(3));
    for (const auto& r : results)
        EXPECT_TRUE(r);
    EXPECT_EQ(provider_->calls(), 3u);
    EXPECT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(generator->stats().retried_calls.load(), 2u);
}

TEST_F(EmbeddingGeneratorTest, PersistentOutageFailsEveryItem) {
    for (int i = 0; i < 100; ++i)
        provider_->queueError(ErrorCode::NetworkError, "connection refused");
    auto generator = makeGenerator();

    auto results = generator->generate(texts(2));
    ASSERT_EQ(results.size(), 2u);
    for (const auto& r : results) {
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().code, ErrorCode::EmbeddingFailed);
        EXPECT_NE(r.error().message.find("connection refused"), std::string::npos);
    }
}

TEST_F(EmbeddingGeneratorTest, BadItemIsIsolatedBySplitting) {
    auto input = texts(8);
    provider_->poison(input[5]);
    auto generator = makeGenerator();

    auto results = generator->generate(input);
    for (size_t i = 0; i < input.size(); ++i) {
        if (i == 5) {
            ASSERT_FALSE(results[i]);
            EXPECT_EQ(results[i].error().code, ErrorCode::EmbeddingFailed);
        } else {
            EXPECT_TRUE(results[i]) << "item " << i;
        }
    }
    EXPECT_GT(generator->stats().split_batches.load(), 0u);
    EXPECT_EQ(generator->stats().failed_items.load(), 1u);
    // Non-transient failures are never retried
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(EmbeddingGeneratorTest, WrongDimensionIsRejected) {
    provider_->setWrongDimension(true);
    auto generator = makeGenerator();
    auto results = generator->generate(texts(4));
    for (const auto& r : results) {
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().code, ErrorCode::EmbeddingFailed);
    }
}

TEST_F(EmbeddingGeneratorTest, QueryEmbeddingMatchesPassageEmbedding) {
    auto generator = makeGenerator();
    auto q = generator->embedQuery("what grew in EMEA?");
    ASSERT_TRUE(q);
    auto p = generator->generate({"what grew in EMEA?"});
    ASSERT_TRUE(p[0]);
    EXPECT_EQ(q.value(), p[0].value());
}

TEST_F(EmbeddingGeneratorTest, ConcurrentCallersShareThePermitLimit) {
    provider_->setDelay(std::chrono::milliseconds(15));
    auto generator = makeGenerator();

    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int t = 0; t < 6; ++t) {
        threads.emplace_back([&]() {
            for (const auto& r : generator->generate(texts(10))) {
                if (!r)
                    ++failures;
            }
        });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_LE(provider_->peakConcurrency(), 2);
    EXPECT_LE(permits_->metrics(core::PermitLane::Embedding).peakInFlight, 2u);
}
