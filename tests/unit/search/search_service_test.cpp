#include <gtest/gtest.h>
#include <vellum/core/ids.h>
#include <vellum/ingest/job_tracker.h>
#include <vellum/metadata/schema.h>
#include <vellum/search/search_service.h>

#include "common/fakes.h"
#include "common/test_helpers.h"

#include <tuple>

using namespace vellum;
using namespace vellum::search;

class SearchServiceTest : public ::testing::Test {
protected:
    static constexpr size_t kDim = 16;

    void SetUp() override {
        auto cm = metadata::ConnectionManager::open((dir_.path() / "search.db").string(),
                                                    {vector::registerVectorFunctions});
        ASSERT_TRUE(cm) << cm.error().message;
        connections_ = cm.value();
        ASSERT_TRUE(connections_->withWriter(
            [](metadata::Database& db) { return metadata::initializeSchema(db); }));
        store_ = std::make_shared<vector::VectorStore>(connections_);
        tracker_ = std::make_unique<ingest::JobTracker>(connections_);
        ASSERT_TRUE(store_->registerProject("alpha"));
        ASSERT_TRUE(store_->registerProject("beta"));
        ASSERT_TRUE(store_->registerProject("empty"));

        provider_ = std::make_shared<tests::ScriptedEmbeddingProvider>(kDim, 8);
        permits_ = std::make_shared<core::PermitPool>(2, 1);
        vector::EmbeddingConfig config;
        config.retry.maxRetries = 0;
        embedder_ = std::make_shared<vector::EmbeddingGenerator>(
            provider_, permits_, config, [](std::chrono::milliseconds) {});
    }

    // One document whose chunks are the given passages
    void addDocument(const ProjectId& project, const std::string& filename,
                     const std::vector<std::string>& passages) {
        DocumentId id = core::generateUUID();
        ASSERT_TRUE(tracker_->createJob(project, "tester", {{id, filename, "text/plain"}}));
        std::vector<vector::ChunkRecord> chunks;
        size_t offset = 0;
        for (size_t i = 0; i < passages.size(); ++i) {
            vector::ChunkRecord c;
            c.chunkIndex = i;
            c.content = passages[i];
            c.startOffset = offset;
            c.contentOffset = offset;
            c.endOffset = offset + passages[i].size();
            c.embedding = vector::MockEmbeddingProvider::embedOne(passages[i], kDim);
            offset = c.endOffset;
            chunks.push_back(std::move(c));
        }
        ASSERT_TRUE(store_->appendDocumentChunks(project, id, "text/plain", std::move(chunks)));
    }

    std::unique_ptr<SearchService> makeService(std::shared_ptr<IRelevanceScorer> scorer = nullptr,
                                               size_t maxContextChars = 4000) {
        RerankConfig rc;
        rc.retry.maxRetries = 0;
        auto reranker = std::make_shared<Reranker>(std::move(scorer), permits_, rc,
                                                   [](std::chrono::milliseconds) {});
        return std::make_unique<SearchService>(embedder_, std::make_shared<Retriever>(store_),
                                               reranker, maxContextChars);
    }

    void seedCorpus() {
        addDocument("alpha", "finance.txt",
                    {"Revenue grew five percent in EMEA.", "Costs were flat in the quarter.",
                     "Headcount increased slightly."});
        addDocument("alpha", "roadmap.md",
                    {"The roadmap targets a spring release.", "Revenue forecasts are cautious."});
        addDocument("beta", "secret.txt", {"Revenue grew five percent in EMEA."});
    }

    tests::TempDir dir_;
    std::shared_ptr<metadata::ConnectionManager> connections_;
    std::shared_ptr<vector::VectorStore> store_;
    std::unique_ptr<ingest::JobTracker> tracker_;
    std::shared_ptr<tests::ScriptedEmbeddingProvider> provider_;
    std::shared_ptr<core::PermitPool> permits_;
    std::shared_ptr<vector::EmbeddingGenerator> embedder_;
};

TEST_F(SearchServiceTest, RequestValidation) {
    auto service = makeService();
    const std::vector<std::tuple<std::string, size_t, size_t>> cases = {
        {"", 5, 3}, {"   \n\t", 5, 3}, {"revenue", 0, 0}, {"revenue", 5, 0}, {"revenue", 3, 5}};
    for (const auto& [query, k, m] : cases) {
        auto r = service->search("alpha", query, k, m);
        ASSERT_FALSE(r) << "query='" << query << "' k=" << k << " m=" << m;
        EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    }
    EXPECT_EQ(provider_->calls(), 0u);
    EXPECT_TRUE(SearchService::validateRequest("ok", 5, 5));
}

TEST_F(SearchServiceTest, MalformedUtf8QueryIsRejectedBeforeEmbedding) {
    auto service = makeService();
    const std::vector<std::string> queries = {"caf\xE9", "revenue \xC3", "\xED\xA0\x80 surrogate",
                                              "\xC0\xAF overlong"};
    for (const auto& query : queries) {
        auto r = service->searchWithContext("alpha", query, 5, 3);
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    }
    EXPECT_EQ(provider_->calls(), 0u);
    EXPECT_TRUE(SearchService::validateRequest("caf\xC3\xA9", 5, 3));
}

TEST_F(SearchServiceTest, UnknownProjectIsProjectNotFound) {
    auto r = makeService()->search("nope", "revenue", 5, 3);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ProjectNotFound);
}

TEST_F(SearchServiceTest, ProjectWithoutDocumentsReturnsNothing) {
    seedCorpus();
    auto r = makeService()->search("empty", "revenue", 5, 3);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_TRUE(r.value().empty());
}

TEST_F(SearchServiceTest, ExactPassageRanksFirstWithoutScorer) {
    seedCorpus();
    auto r = makeService()->searchWithContext("alpha", "Costs were flat in the quarter.", 5, 3);
    ASSERT_TRUE(r) << r.error().message;
    const auto& response = r.value();

    EXPECT_EQ(response.candidateCount, 5u);
    EXPECT_TRUE(response.rerankFallback);
    ASSERT_EQ(response.hits.size(), 3u);

    const auto& top = response.hits[0];
    EXPECT_EQ(top.text, "Costs were flat in the quarter.");
    EXPECT_EQ(top.source.filename, "finance.txt");
    EXPECT_EQ(top.source.chunkIndex, 1u);
    EXPECT_EQ(top.source.startOffset, 34u);
    EXPECT_NEAR(top.similarity, 1.0, 1e-5);
    EXPECT_FALSE(top.rerankScore.has_value());
    EXPECT_EQ(top.retrievalRank, 0u);

    for (size_t i = 1; i < response.hits.size(); ++i) {
        EXPECT_LE(response.hits[i].similarity, response.hits[i - 1].similarity);
    }
    EXPECT_EQ(response.context.entries.size(), 3u);
    EXPECT_NE(response.context.renderForPrompt().find("[1] finance.txt#1"), std::string::npos);
}

TEST_F(SearchServiceTest, ResultsStayInsideTheProject) {
    seedCorpus();
    auto r = makeService()->search("beta", "Revenue grew five percent in EMEA.", 10, 10);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].source.filename, "secret.txt");

    auto alpha = makeService()->search("alpha", "Revenue grew five percent in EMEA.", 10, 10);
    ASSERT_TRUE(alpha);
    EXPECT_EQ(alpha.value().size(), 5u);
    for (const auto& hit : alpha.value())
        EXPECT_NE(hit.source.filename, "secret.txt");
}

TEST_F(SearchServiceTest, ScorerReordersCandidates) {
    seedCorpus();
    auto scorer = std::make_shared<tests::ScriptedScorer>(
        [](const std::string&, const std::string& doc) {
            return doc.find("forecast") != std::string::npos ? 5.0f : 0.0f;
        });
    auto r = makeService(scorer)->searchWithContext("alpha", "Costs were flat in the quarter.",
                                                    5, 2);
    ASSERT_TRUE(r);
    EXPECT_FALSE(r.value().rerankFallback);
    ASSERT_EQ(r.value().hits.size(), 2u);
    EXPECT_EQ(r.value().hits[0].text, "Revenue forecasts are cautious.");
    ASSERT_TRUE(r.value().hits[0].rerankScore.has_value());
    EXPECT_FLOAT_EQ(*r.value().hits[0].rerankScore, 5.0f);
    EXPECT_DOUBLE_EQ(r.value().hits[0].score, 5.0);
    // The exact match keeps its place among the zero scores
    EXPECT_EQ(r.value().hits[1].text, "Costs were flat in the quarter.");
}

TEST_F(SearchServiceTest, ContextBudgetLimitsHits) {
    seedCorpus();
    auto r = makeService(nullptr, 40)->searchWithContext("alpha", "Costs were flat in the quarter.",
                                                         5, 5);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().hits.size(), 1u);
    EXPECT_TRUE(r.value().context.truncated);
    EXPECT_LE(r.value().context.totalChars, 40u);
}

TEST_F(SearchServiceTest, QueryEmbeddingFailureIsReported) {
    seedCorpus();
    provider_->queueError(ErrorCode::InvalidData, "provider rejected input");
    auto r = makeService()->search("alpha", "revenue", 5, 3);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::EmbeddingFailed);
}
