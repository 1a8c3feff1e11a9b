#include <vellum/search/http_relevance_scorer.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace vellum::search {

using json = nlohmann::json;

HttpRelevanceScorer::HttpRelevanceScorer(HttpScorerOptions options)
    : options_(std::move(options)) {}

std::string HttpRelevanceScorer::buildRequest(const std::string& query,
                                              const std::vector<std::string>& documents) const {
    json body;
    if (!options_.model.empty()) {
        body["model"] = options_.model;
    }
    body["query"] = query;
    body["documents"] = documents;
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

Result<std::vector<float>>
HttpRelevanceScorer::scoreDocuments(const std::string& query,
                                    const std::vector<std::string>& documents) {
    if (options_.endpoint.empty()) {
        return Error{ErrorCode::RerankerUnavailable, "No reranker endpoint configured"};
    }
    if (documents.empty()) {
        return std::vector<float>{};
    }

    net::HttpRequest request;
    request.url = options_.endpoint;
    request.body = buildRequest(query, documents);
    request.timeout = options_.timeout;
    if (!options_.apiKey.empty()) {
        request.headers.emplace_back("Authorization", "Bearer " + options_.apiKey);
    }

    auto response = http_.postJson(request);
    if (!response) {
        spdlog::debug("[HttpScorer] {}", response.error().message);
        return response.error();
    }
    if (auto ok = net::HttpClient::classifyStatus(response.value().status,
                                                  response.value().body);
        !ok) {
        return ok.error();
    }
    return parseResponse(response.value().body, documents.size());
}

Result<std::vector<float>> HttpRelevanceScorer::parseResponse(const std::string& body,
                                                              size_t expectedCount) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Error{ErrorCode::InvalidData, "Rerank response is not a JSON object"};
    }
    auto results = doc.find("results");
    if (results == doc.end() || !results->is_array()) {
        return Error{ErrorCode::InvalidData, "Rerank response has no results array"};
    }
    if (results->size() != expectedCount) {
        return Error{ErrorCode::InvalidData, "Expected " + std::to_string(expectedCount) +
                                                 " scores, got " +
                                                 std::to_string(results->size())};
    }

    std::vector<float> scores(expectedCount, 0.0f);
    std::vector<bool> seen(expectedCount, false);
    for (const auto& r : *results) {
        if (!r.is_object() || !r.contains("index") || !r["index"].is_number_unsigned() ||
            !r.contains("relevance_score") || !r["relevance_score"].is_number()) {
            return Error{ErrorCode::InvalidData, "Malformed rerank result"};
        }
        auto index = r["index"].get<size_t>();
        if (index >= expectedCount || seen[index]) {
            return Error{ErrorCode::InvalidData, "Rerank index out of range or repeated"};
        }
        scores[index] = r["relevance_score"].get<float>();
        seen[index] = true;
    }
    return scores;
}

} // namespace vellum::search
