#include <gtest/gtest.h>
#include <vellum/config/vellum_config.h>

#include "common/test_helpers.h"

#include <fstream>

using namespace vellum;
using namespace vellum::config;

TEST(ConfigHelpersTest, ParsesSectionsCommentsAndQuotes) {
    auto values = parse_config_text(R"(
# top level comment
log = "debug"

[embedding]
provider = "openai"   # inline comment
model = 'text-embedding-3-small'
api_key = "sk-#notacomment"
batch_size = 32

[retrieval]
top_k = 40
not a key value line
)");

    EXPECT_EQ(values["log"], "debug");
    EXPECT_EQ(values["embedding.provider"], "openai");
    EXPECT_EQ(values["embedding.model"], "text-embedding-3-small");
    EXPECT_EQ(values["embedding.api_key"], "sk-#notacomment");
    EXPECT_EQ(values["embedding.batch_size"], "32");
    EXPECT_EQ(values["retrieval.top_k"], "40");
    EXPECT_EQ(values.count("not a key value line"), 0u);
}

TEST(ConfigHelpersTest, MissingFileIsNotFound) {
    auto r = parse_config_file("/nonexistent/vellum/config.toml");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
}

TEST(VellumConfigTest, ApplyOverridesKnownKeys) {
    VellumConfig cfg;
    auto r = cfg.apply(parse_config_text(R"(
[chunking]
chunk_size = 500
chunk_overlap = 50
[embedding]
timeout_ms = 1500
permits = 3
[reranker]
provider = "http"
endpoint = "http://localhost:8080/rerank"
[ingest]
worker_threads = 6
[unknown]
whatever = 1
)"));
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(cfg.chunking.chunkSize, 500u);
    EXPECT_EQ(cfg.chunking.chunkOverlap, 50u);
    EXPECT_EQ(cfg.embedding.timeout.count(), 1500);
    EXPECT_EQ(cfg.embedding.permits, 3u);
    EXPECT_EQ(cfg.reranker.provider, "http");
    EXPECT_EQ(cfg.reranker.endpoint, "http://localhost:8080/rerank");
    EXPECT_EQ(cfg.ingest.workerThreads, 6u);
    EXPECT_TRUE(cfg.validate());
}

TEST(VellumConfigTest, NonNumericValueIsRejected) {
    VellumConfig cfg;
    auto r = cfg.apply({{"retrieval.top_k", "lots"}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);

    r = cfg.apply({{"chunking.chunk_size", "-5"}});
    ASSERT_FALSE(r);
}

TEST(VellumConfigTest, ValidateRejectsInconsistentSettings) {
    auto expectInvalid = [](auto mutate) {
        VellumConfig cfg;
        mutate(cfg);
        auto r = cfg.validate();
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    };

    EXPECT_TRUE(VellumConfig{}.validate());
    expectInvalid([](VellumConfig& c) { c.chunking.chunkSize = 0; });
    expectInvalid([](VellumConfig& c) { c.chunking.chunkOverlap = c.chunking.chunkSize; });
    expectInvalid([](VellumConfig& c) { c.embedding.dimension = 0; });
    expectInvalid([](VellumConfig& c) { c.embedding.permits = 0; });
    expectInvalid([](VellumConfig& c) { c.reranker.batchSize = 0; });
    expectInvalid([](VellumConfig& c) { c.retrieval.topM = c.retrieval.topK + 1; });
    expectInvalid([](VellumConfig& c) { c.retrieval.topM = 0; });
    expectInvalid([](VellumConfig& c) { c.ingest.maxWorkersPerJob = 0; });
    expectInvalid([](VellumConfig& c) { c.embedding.provider = "word2vec"; });
    expectInvalid([](VellumConfig& c) { c.reranker.provider = "cohere"; });
}

TEST(VellumConfigTest, LoadReadsFileAndValidates) {
    tests::TempDir dir;
    auto path = dir.path() / "config.toml";
    {
        std::ofstream out(path);
        out << "[storage]\n"
            << "data_dir = \"" << dir.path().string() << "\"\n"
            << "[retrieval]\n"
            << "top_k = 20\n"
            << "top_m = 4\n";
    }
    auto cfg = VellumConfig::load(path);
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().storage.dataDir, dir.path());
    EXPECT_EQ(cfg.value().retrieval.topK, 20u);
    EXPECT_EQ(cfg.value().retrieval.topM, 4u);

    {
        std::ofstream out(path);
        out << "[retrieval]\ntop_k = 3\ntop_m = 4\n";
    }
    auto bad = VellumConfig::load(path);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
}
