#include <vellum/config/vellum_config.h>

#include <spdlog/spdlog.h>
#include <charconv>
#include <cstdlib>
#include <functional>
#include <unordered_map>

namespace vellum::config {

namespace {

Result<std::uint64_t> parseUnsigned(const std::string& key, const std::string& raw) {
    std::uint64_t v = 0;
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc{} || ptr != last) {
        return Error{ErrorCode::InvalidArgument,
                     "Config key '" + key + "' expects a non-negative integer, got '" + raw + "'"};
    }
    return v;
}

const char* envValue(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

} // namespace

Result<VellumConfig> VellumConfig::load(const std::filesystem::path& path) {
    VellumConfig cfg;
    cfg.storage.dataDir = get_data_dir();

    if (!path.empty() && std::filesystem::exists(path)) {
        auto values = parse_config_file(path);
        if (!values) {
            return values.error();
        }
        if (auto r = cfg.apply(values.value()); !r) {
            return r.error();
        }
        spdlog::debug("[Config] loaded {}", path.string());
    } else if (!path.empty()) {
        spdlog::debug("[Config] {} not found, using defaults", path.string());
    }

    cfg.applyEnvironment();
    if (auto r = cfg.validate(); !r) {
        return r.error();
    }
    return cfg;
}

Result<void> VellumConfig::apply(const ConfigMap& values) {
    using Setter = std::function<Result<void>(const std::string&, const std::string&)>;

    auto str = [](std::string& field) -> Setter {
        return [&field](const std::string&, const std::string& v) -> Result<void> {
            field = v;
            return {};
        };
    };
    auto size = [](std::size_t& field) -> Setter {
        return [&field](const std::string& k, const std::string& v) -> Result<void> {
            auto parsed = parseUnsigned(k, v);
            if (!parsed)
                return parsed.error();
            field = static_cast<std::size_t>(parsed.value());
            return {};
        };
    };
    auto u32 = [](std::uint32_t& field) -> Setter {
        return [&field](const std::string& k, const std::string& v) -> Result<void> {
            auto parsed = parseUnsigned(k, v);
            if (!parsed)
                return parsed.error();
            field = static_cast<std::uint32_t>(parsed.value());
            return {};
        };
    };
    auto millis = [](std::chrono::milliseconds& field) -> Setter {
        return [&field](const std::string& k, const std::string& v) -> Result<void> {
            auto parsed = parseUnsigned(k, v);
            if (!parsed)
                return parsed.error();
            field = std::chrono::milliseconds(static_cast<long long>(parsed.value()));
            return {};
        };
    };
    auto path = [](std::filesystem::path& field) -> Setter {
        return [&field](const std::string&, const std::string& v) -> Result<void> {
            field = expand_tilde(v);
            return {};
        };
    };

    const std::unordered_map<std::string, Setter> setters = {
        {"storage.data_dir", path(storage.dataDir)},
        {"storage.database", str(storage.database)},
        {"chunking.chunk_size", size(chunking.chunkSize)},
        {"chunking.chunk_overlap", size(chunking.chunkOverlap)},
        {"embedding.provider", str(embedding.provider)},
        {"embedding.endpoint", str(embedding.endpoint)},
        {"embedding.model", str(embedding.model)},
        {"embedding.api_key", str(embedding.apiKey)},
        {"embedding.dimension", size(embedding.dimension)},
        {"embedding.batch_size", size(embedding.batchSize)},
        {"embedding.timeout_ms", millis(embedding.timeout)},
        {"embedding.max_retries", size(embedding.maxRetries)},
        {"embedding.initial_backoff_ms", millis(embedding.initialBackoff)},
        {"embedding.max_backoff_ms", millis(embedding.maxBackoff)},
        {"embedding.permits", u32(embedding.permits)},
        {"reranker.provider", str(reranker.provider)},
        {"reranker.endpoint", str(reranker.endpoint)},
        {"reranker.model", str(reranker.model)},
        {"reranker.api_key", str(reranker.apiKey)},
        {"reranker.batch_size", size(reranker.batchSize)},
        {"reranker.timeout_ms", millis(reranker.timeout)},
        {"reranker.permits", u32(reranker.permits)},
        {"retrieval.top_k", size(retrieval.topK)},
        {"retrieval.top_m", size(retrieval.topM)},
        {"retrieval.max_context_chars", size(retrieval.maxContextChars)},
        {"ingest.worker_threads", size(ingest.workerThreads)},
        {"ingest.max_workers_per_job", size(ingest.maxWorkersPerJob)},
        {"ingest.max_file_size", size(ingest.maxFileSize)},
        {"logging.level", str(logging.level)},
        {"logging.file", path(logging.file)},
    };

    for (const auto& [key, value] : values) {
        auto it = setters.find(key);
        if (it == setters.end()) {
            spdlog::debug("[Config] ignoring unknown key '{}'", key);
            continue;
        }
        if (auto r = it->second(key, value); !r) {
            return r;
        }
    }
    return {};
}

void VellumConfig::applyEnvironment() {
    if (const char* v = envValue("VELLUM_DATA_DIR"))
        storage.dataDir = expand_tilde(v);
    if (const char* v = envValue("VELLUM_EMBEDDING_PROVIDER"))
        embedding.provider = v;
    if (const char* v = envValue("VELLUM_EMBEDDING_ENDPOINT"))
        embedding.endpoint = v;
    if (const char* v = envValue("VELLUM_EMBEDDING_API_KEY"))
        embedding.apiKey = v;
    if (const char* v = envValue("VELLUM_RERANKER_ENDPOINT")) {
        reranker.endpoint = v;
        if (reranker.provider == "none")
            reranker.provider = "http";
    }
    if (const char* v = envValue("VELLUM_RERANKER_API_KEY"))
        reranker.apiKey = v;
    if (const char* v = envValue("VELLUM_LOG_LEVEL"))
        logging.level = v;
}

Result<void> VellumConfig::validate() const {
    if (chunking.chunkSize == 0) {
        return Error{ErrorCode::InvalidArgument, "chunking.chunk_size must be positive"};
    }
    if (chunking.chunkOverlap >= chunking.chunkSize) {
        return Error{ErrorCode::InvalidArgument,
                     "chunking.chunk_overlap must be smaller than chunking.chunk_size"};
    }
    if (embedding.dimension == 0 || embedding.batchSize == 0 || embedding.permits == 0) {
        return Error{ErrorCode::InvalidArgument,
                     "embedding.dimension, batch_size and permits must be positive"};
    }
    if (reranker.batchSize == 0 || reranker.permits == 0) {
        return Error{ErrorCode::InvalidArgument, "reranker.batch_size and permits must be positive"};
    }
    if (retrieval.topK == 0 || retrieval.topM == 0 || retrieval.topM > retrieval.topK) {
        return Error{ErrorCode::InvalidArgument, "retrieval requires 0 < top_m <= top_k"};
    }
    if (ingest.workerThreads == 0 || ingest.maxWorkersPerJob == 0) {
        return Error{ErrorCode::InvalidArgument, "ingest worker counts must be positive"};
    }
    if (embedding.provider != "mock" && embedding.provider != "openai" &&
        embedding.provider != "ollama") {
        return Error{ErrorCode::InvalidArgument,
                     "embedding.provider must be one of mock, openai, ollama"};
    }
    if (reranker.provider != "none" && reranker.provider != "http") {
        return Error{ErrorCode::InvalidArgument, "reranker.provider must be none or http"};
    }
    return {};
}

} // namespace vellum::config
