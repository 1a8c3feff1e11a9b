#include <gtest/gtest.h>
#include <vellum/app/provider_factory.h>
#include <vellum/net/http_client.h>
#include <vellum/search/http_relevance_scorer.h>
#include <vellum/vector/http_embedding_provider.h>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace vellum;
using json = nlohmann::json;

TEST(HttpClientTest, ClassifyStatus) {
    EXPECT_TRUE(net::HttpClient::classifyStatus(200, ""));
    EXPECT_TRUE(net::HttpClient::classifyStatus(204, ""));

    struct Case {
        long status;
        ErrorCode expected;
    };
    const std::vector<Case> cases = {{429, ErrorCode::RateLimited},
                                     {408, ErrorCode::Timeout},
                                     {500, ErrorCode::NetworkError},
                                     {503, ErrorCode::NetworkError},
                                     {400, ErrorCode::InvalidArgument},
                                     {401, ErrorCode::InvalidArgument},
                                     {404, ErrorCode::InvalidArgument}};
    for (const auto& c : cases) {
        auto r = net::HttpClient::classifyStatus(c.status, "{\"error\":\"x\"}");
        ASSERT_FALSE(r) << c.status;
        EXPECT_EQ(r.error().code, c.expected) << c.status;
        EXPECT_NE(r.error().message.find(std::to_string(c.status)), std::string::npos);
    }
}

TEST(HttpClientTest, ErrorMessageKeepsShortBodySnippet) {
    std::string body(1000, 'x');
    auto r = net::HttpClient::classifyStatus(500, body);
    ASSERT_FALSE(r);
    EXPECT_LT(r.error().message.size(), 300u);
}

TEST(OpenAiEmbeddingTest, ParseReordersByIndex) {
    const std::string body = R"({"data":[
        {"index":1,"embedding":[0.0,1.0]},
        {"index":0,"embedding":[1.0,0.0]}]})";
    auto r = vector::OpenAiEmbeddingProvider::parseResponse(body, 2);
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_EQ(r.value().size(), 2u);
    EXPECT_FLOAT_EQ(r.value()[0][0], 1.0f);
    EXPECT_FLOAT_EQ(r.value()[1][1], 1.0f);
}

TEST(OpenAiEmbeddingTest, ParseRejectsMalformedResponses) {
    const std::vector<std::string> bodies = {
        "not json",
        "[]",
        R"({"object":"list"})",
        R"({"data":[{"index":0,"embedding":[1.0]}]})",
        R"({"data":[{"index":0,"embedding":[1.0]},{"index":0,"embedding":[2.0]}]})",
        R"({"data":[{"index":0,"embedding":[1.0]},{"index":5,"embedding":[2.0]}]})",
        R"({"data":[{"index":0,"embedding":[1.0]},{"index":1}]})",
        R"({"data":[{"index":0,"embedding":[1.0]},{"index":1,"embedding":["a"]}]})",
    };
    for (const auto& body : bodies) {
        auto r = vector::OpenAiEmbeddingProvider::parseResponse(body, 2);
        ASSERT_FALSE(r) << body;
        EXPECT_EQ(r.error().code, ErrorCode::InvalidData) << body;
    }
}

TEST(OpenAiEmbeddingTest, BuildRequestListsInputsInOrder) {
    vector::HttpEmbeddingOptions options;
    options.model = "text-embedding-3-small";
    options.apiKey = "key";
    vector::OpenAiEmbeddingProvider provider(options);

    const std::vector<std::string> texts = {"first", "second"};
    auto body = json::parse(provider.buildRequest(texts));
    EXPECT_EQ(body["model"], "text-embedding-3-small");
    ASSERT_EQ(body["input"].size(), 2u);
    EXPECT_EQ(body["input"][0], "first");
    EXPECT_EQ(body["input"][1], "second");
}

TEST(OpenAiEmbeddingTest, BuildRequestReplacesMalformedUtf8) {
    vector::HttpEmbeddingOptions options;
    options.model = "text-embedding-3-small";
    options.apiKey = "key";
    vector::OpenAiEmbeddingProvider provider(options);

    const std::vector<std::string> texts = {"caf\xE9", "ok"};
    std::string request;
    ASSERT_NO_THROW(request = provider.buildRequest(texts));
    auto body = json::parse(request);
    EXPECT_EQ(body["input"][0], "caf\xEF\xBF\xBD");
    EXPECT_EQ(body["input"][1], "ok");
}

TEST(OllamaEmbeddingTest, ParseKeepsInputOrder) {
    auto r = vector::OllamaEmbeddingProvider::parseResponse(
        R"({"model":"nomic","embeddings":[[0.5,0.5],[0.25,0.75]]})", 2);
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_EQ(r.value().size(), 2u);
    EXPECT_FLOAT_EQ(r.value()[1][0], 0.25f);

    auto shortResponse =
        vector::OllamaEmbeddingProvider::parseResponse(R"({"embeddings":[[0.5]]})", 2);
    ASSERT_FALSE(shortResponse);
    EXPECT_EQ(shortResponse.error().code, ErrorCode::InvalidData);

    auto missing = vector::OllamaEmbeddingProvider::parseResponse(R"({"embedding":[0.5]})", 1);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::InvalidData);
}

TEST(HttpRelevanceScorerTest, ParseAlignsScoresWithDocuments) {
    const std::string body = R"({"results":[
        {"index":2,"relevance_score":0.9},
        {"index":0,"relevance_score":0.1},
        {"index":1,"relevance_score":0.5}]})";
    auto r = search::HttpRelevanceScorer::parseResponse(body, 3);
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_EQ(r.value().size(), 3u);
    EXPECT_FLOAT_EQ(r.value()[0], 0.1f);
    EXPECT_FLOAT_EQ(r.value()[1], 0.5f);
    EXPECT_FLOAT_EQ(r.value()[2], 0.9f);
}

TEST(HttpRelevanceScorerTest, ParseRejectsIncompleteResults) {
    const std::vector<std::string> bodies = {
        "{",
        R"({"scores":[]})",
        R"({"results":[{"index":0,"relevance_score":0.1}]})",
        R"({"results":[{"index":0,"relevance_score":0.1},{"index":0,"relevance_score":0.2}]})",
        R"({"results":[{"index":0,"relevance_score":0.1},{"index":1}]})",
        R"({"results":[{"index":0,"relevance_score":0.1},{"index":-1,"relevance_score":0.2}]})",
    };
    for (const auto& body : bodies) {
        auto r = search::HttpRelevanceScorer::parseResponse(body, 2);
        ASSERT_FALSE(r) << body;
        EXPECT_EQ(r.error().code, ErrorCode::InvalidData) << body;
    }
}

TEST(HttpRelevanceScorerTest, BuildRequestReplacesMalformedUtf8) {
    search::HttpRelevanceScorer scorer(search::HttpScorerOptions{});
    std::string request;
    ASSERT_NO_THROW(request = scorer.buildRequest("na\xEFve", {"chunk \xFF", "clean"}));
    auto body = json::parse(request);
    EXPECT_EQ(body["query"], "na\xEF\xBF\xBD" "ve");
    EXPECT_EQ(body["documents"][0], "chunk \xEF\xBF\xBD");
    EXPECT_EQ(body["documents"][1], "clean");
}

TEST(HttpRelevanceScorerTest, MissingEndpointIsUnavailable) {
    search::HttpRelevanceScorer scorer(search::HttpScorerOptions{});
    auto r = scorer.scoreDocuments("q", {"a"});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::RerankerUnavailable);
}

TEST(ProviderFactoryTest, CreatesConfiguredProviders) {
    config::EmbeddingSettings embedding;
    embedding.provider = "mock";
    embedding.dimension = 24;
    auto mock = app::createEmbeddingProvider(embedding);
    ASSERT_TRUE(mock);
    EXPECT_EQ(mock.value()->name(), "mock");
    EXPECT_EQ(mock.value()->dimension(), 24u);

    embedding.provider = "ollama";
    auto ollama = app::createEmbeddingProvider(embedding);
    ASSERT_TRUE(ollama);
    EXPECT_EQ(ollama.value()->name(), "ollama");

    embedding.provider = "openai";
    embedding.apiKey.clear();
    embedding.endpoint.clear();
    auto noKey = app::createEmbeddingProvider(embedding);
    ASSERT_FALSE(noKey);
    EXPECT_EQ(noKey.error().code, ErrorCode::InvalidArgument);

    embedding.provider = "word2vec";
    EXPECT_FALSE(app::createEmbeddingProvider(embedding));

    config::RerankerSettings reranker;
    reranker.provider = "none";
    auto none = app::createRelevanceScorer(reranker);
    ASSERT_TRUE(none);
    EXPECT_EQ(none.value(), nullptr);

    reranker.provider = "http";
    reranker.endpoint.clear();
    EXPECT_FALSE(app::createRelevanceScorer(reranker));
    reranker.endpoint = "http://localhost:8080/rerank";
    auto http = app::createRelevanceScorer(reranker);
    ASSERT_TRUE(http);
    EXPECT_EQ(http.value()->name(), "http");
}
