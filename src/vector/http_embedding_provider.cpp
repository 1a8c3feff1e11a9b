#include <vellum/vector/http_embedding_provider.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace vellum::vector {

using json = nlohmann::json;

namespace {

constexpr const char* kOpenAiDefaultEndpoint = "https://api.openai.com/v1/embeddings";
constexpr const char* kOllamaDefaultEndpoint = "http://localhost:11434/api/embed";

Result<Embedding> toEmbedding(const json& values) {
    if (!values.is_array()) {
        return Error{ErrorCode::InvalidData, "Embedding is not an array"};
    }
    Embedding out;
    out.reserve(values.size());
    for (const auto& v : values) {
        if (!v.is_number()) {
            return Error{ErrorCode::InvalidData, "Embedding component is not a number"};
        }
        out.push_back(v.get<float>());
    }
    return out;
}

Result<std::string> post(const net::HttpClient& http, const HttpEmbeddingOptions& options,
                         const std::string& defaultEndpoint, std::string body) {
    net::HttpRequest request;
    request.url = options.endpoint.empty() ? defaultEndpoint : options.endpoint;
    request.body = std::move(body);
    request.timeout = options.timeout;
    if (!options.apiKey.empty()) {
        request.headers.emplace_back("Authorization", "Bearer " + options.apiKey);
    }

    auto response = http.postJson(request);
    if (!response) {
        return response.error();
    }
    if (auto ok = net::HttpClient::classifyStatus(response.value().status,
                                                  response.value().body);
        !ok) {
        return ok.error();
    }
    return std::move(response).value().body;
}

} // namespace

OpenAiEmbeddingProvider::OpenAiEmbeddingProvider(HttpEmbeddingOptions options)
    : options_(std::move(options)) {}

std::string OpenAiEmbeddingProvider::buildRequest(std::span<const std::string> texts) const {
    json body;
    body["model"] = options_.model;
    body["input"] = json::array();
    for (const auto& t : texts) {
        body["input"].push_back(t);
    }
    body["encoding_format"] = "float";
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

Result<std::vector<Embedding>> OpenAiEmbeddingProvider::embed(std::span<const std::string> texts) {
    if (texts.size() > options_.maxBatch) {
        return Error{ErrorCode::InvalidArgument, "Batch exceeds provider limit"};
    }
    spdlog::debug("[OpenAI] embedding {} texts with {}", texts.size(), options_.model);
    auto body = post(http_, options_, kOpenAiDefaultEndpoint, buildRequest(texts));
    if (!body) {
        return body.error();
    }
    return parseResponse(body.value(), texts.size());
}

Result<std::vector<Embedding>> OpenAiEmbeddingProvider::parseResponse(const std::string& body,
                                                                      size_t expectedCount) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Error{ErrorCode::InvalidData, "Embedding response is not a JSON object"};
    }
    auto data = doc.find("data");
    if (data == doc.end() || !data->is_array()) {
        return Error{ErrorCode::InvalidData, "Embedding response has no data array"};
    }
    if (data->size() != expectedCount) {
        return Error{ErrorCode::InvalidData, "Expected " + std::to_string(expectedCount) +
                                                 " embeddings, got " +
                                                 std::to_string(data->size())};
    }

    std::vector<Embedding> out(expectedCount);
    std::vector<bool> seen(expectedCount, false);
    for (size_t i = 0; i < data->size(); ++i) {
        const auto& item = (*data)[i];
        size_t index = i;
        if (item.contains("index") && item["index"].is_number_unsigned()) {
            index = item["index"].get<size_t>();
        }
        if (index >= expectedCount || seen[index]) {
            return Error{ErrorCode::InvalidData, "Embedding index out of range or repeated"};
        }
        if (!item.contains("embedding")) {
            return Error{ErrorCode::InvalidData, "Embedding item has no vector"};
        }
        auto vec = toEmbedding(item["embedding"]);
        if (!vec) {
            return vec.error();
        }
        out[index] = std::move(vec).value();
        seen[index] = true;
    }
    return out;
}

OllamaEmbeddingProvider::OllamaEmbeddingProvider(HttpEmbeddingOptions options)
    : options_(std::move(options)) {}

std::string OllamaEmbeddingProvider::buildRequest(std::span<const std::string> texts) const {
    json body;
    body["model"] = options_.model;
    body["input"] = json::array();
    for (const auto& t : texts) {
        body["input"].push_back(t);
    }
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

Result<std::vector<Embedding>> OllamaEmbeddingProvider::embed(std::span<const std::string> texts) {
    if (texts.size() > options_.maxBatch) {
        return Error{ErrorCode::InvalidArgument, "Batch exceeds provider limit"};
    }
    spdlog::debug("[Ollama] embedding {} texts with {}", texts.size(), options_.model);
    auto body = post(http_, options_, kOllamaDefaultEndpoint, buildRequest(texts));
    if (!body) {
        return body.error();
    }
    return parseResponse(body.value(), texts.size());
}

Result<std::vector<Embedding>> OllamaEmbeddingProvider::parseResponse(const std::string& body,
                                                                      size_t expectedCount) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Error{ErrorCode::InvalidData, "Embedding response is not a JSON object"};
    }
    auto embeddings = doc.find("embeddings");
    if (embeddings == doc.end() || !embeddings->is_array()) {
        return Error{ErrorCode::InvalidData, "Embedding response has no embeddings array"};
    }
    if (embeddings->size() != expectedCount) {
        return Error{ErrorCode::InvalidData, "Expected " + std::to_string(expectedCount) +
                                                 " embeddings, got " +
                                                 std::to_string(embeddings->size())};
    }

    std::vector<Embedding> out;
    out.reserve(expectedCount);
    for (const auto& e : *embeddings) {
        auto vec = toEmbedding(e);
        if (!vec) {
            return vec.error();
        }
        out.push_back(std::move(vec).value());
    }
    return out;
}

} // namespace vellum::vector
