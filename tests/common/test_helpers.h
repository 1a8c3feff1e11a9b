#pragma once

#include <vellum/config/vellum_config.h>

#include <unistd.h>
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace vellum::tests {

inline std::filesystem::path make_temp_dir(const std::string& prefix = "vellum_test_") {
    static std::atomic<int> counter{0};
    auto base = std::filesystem::temp_directory_path();
    for (int i = 0; i < 1000; ++i) {
        auto p = base / (prefix + std::to_string(::getpid()) + "_" +
                         std::to_string(counter.fetch_add(1)));
        if (std::filesystem::create_directories(p))
            return p;
    }
    return base;
}

/// Temporary directory removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "vellum_test_") : path_(make_temp_dir(prefix)) {}
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline std::vector<std::byte> to_bytes(const std::string& s) {
    std::vector<std::byte> out(s.size());
    for (size_t i = 0; i < s.size(); ++i)
        out[i] = static_cast<std::byte>(s[i]);
    return out;
}

/// Small, fast configuration rooted at `dataDir`.
inline config::VellumConfig make_test_config(const std::filesystem::path& dataDir) {
    config::VellumConfig cfg;
    cfg.storage.dataDir = dataDir;
    cfg.storage.database = "test.db";
    cfg.chunking.chunkSize = 200;
    cfg.chunking.chunkOverlap = 40;
    cfg.embedding.provider = "mock";
    cfg.embedding.dimension = 32;
    cfg.embedding.batchSize = 8;
    cfg.embedding.timeout = std::chrono::milliseconds(2000);
    cfg.embedding.maxRetries = 2;
    cfg.embedding.initialBackoff = std::chrono::milliseconds(1);
    cfg.embedding.maxBackoff = std::chrono::milliseconds(2);
    cfg.reranker.timeout = std::chrono::milliseconds(2000);
    cfg.retrieval.topK = 10;
    cfg.retrieval.topM = 5;
    cfg.retrieval.maxContextChars = 4000;
    cfg.ingest.workerThreads = 2;
    cfg.ingest.maxWorkersPerJob = 2;
    cfg.logging.level = "warn";
    return cfg;
}

} // namespace vellum::tests
