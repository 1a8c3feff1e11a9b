#pragma once

#include <vellum/config/config_helpers.h>
#include <vellum/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace vellum::config {

struct StorageSettings {
    std::filesystem::path dataDir;
    std::string database = "vellum.db";

    std::filesystem::path databasePath() const { return dataDir / database; }
};

struct ChunkingSettings {
    std::size_t chunkSize = 1000;
    std::size_t chunkOverlap = 200;
};

struct EmbeddingSettings {
    std::string provider = "mock"; // mock | openai | ollama
    std::string endpoint;
    std::string model = "text-embedding-3-small";
    std::string apiKey;
    std::size_t dimension = 1536;
    std::size_t batchSize = 64;
    std::chrono::milliseconds timeout{30000};
    std::size_t maxRetries = 4;
    std::chrono::milliseconds initialBackoff{200};
    std::chrono::milliseconds maxBackoff{10000};
    std::uint32_t permits = 4;
};

struct RerankerSettings {
    std::string provider = "none"; // none | http
    std::string endpoint;
    std::string model;
    std::string apiKey;
    std::size_t batchSize = 16;
    std::chrono::milliseconds timeout{10000};
    std::uint32_t permits = 2;
};

struct RetrievalSettings {
    std::size_t topK = 50;
    std::size_t topM = 10;
    std::size_t maxContextChars = 12000;
};

struct IngestSettings {
    std::size_t workerThreads = 4;
    std::size_t maxWorkersPerJob = 2;
    std::size_t maxFileSize = 64 * 1024 * 1024;
};

struct LoggingSettings {
    std::string level = "info";
    std::filesystem::path file;
};

struct VellumConfig {
    StorageSettings storage;
    ChunkingSettings chunking;
    EmbeddingSettings embedding;
    RerankerSettings reranker;
    RetrievalSettings retrieval;
    IngestSettings ingest;
    LoggingSettings logging;

    /// Defaults, then the file at `path` (when it exists), then VELLUM_* environment overrides.
    static Result<VellumConfig> load(const std::filesystem::path& path);

    /// Applies recognised keys from a flattened map. Unknown keys are ignored with a debug log.
    Result<void> apply(const ConfigMap& values);

    void applyEnvironment();

    Result<void> validate() const;
};

} // namespace vellum::config
