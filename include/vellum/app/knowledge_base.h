#pragma once

#include <vellum/config/vellum_config.h>
#include <vellum/core/permit_pool.h>
#include <vellum/core/retry_policy.h>
#include <vellum/core/types.h>
#include <vellum/extraction/text_extractor.h>
#include <vellum/ingest/ingestion_orchestrator.h>
#include <vellum/ingest/job_tracker.h>
#include <vellum/metadata/database.h>
#include <vellum/search/relevance_scorer.h>
#include <vellum/search/search_service.h>
#include <vellum/vector/embedding_generator.h>
#include <vellum/vector/embedding_provider.h>
#include <vellum/vector/vector_store.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace vellum::app {

struct UploadedFile {
    std::string filename;
    std::vector<std::byte> bytes;
    std::string declaredType; // may be empty
};

/**
 * @brief Entry point of the library: wires storage, ingestion and search for
 * one database.
 *
 * Uploads are registered synchronously and processed in the background;
 * queries run on the caller's thread.
 */
class KnowledgeBase {
    // Restricts construction to open()
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    /**
     * Opens (or creates) the database under `config.storage`, fails jobs left
     * unfinished by a previous process and starts the worker pool. A null
     * `scorer` disables reranking.
     */
    static Result<std::unique_ptr<KnowledgeBase>>
    open(const config::VellumConfig& config, std::shared_ptr<vector::IEmbeddingProvider> provider,
         std::shared_ptr<search::IRelevanceScorer> scorer = nullptr,
         core::Sleeper sleeper = core::defaultSleep);

    explicit KnowledgeBase(ConstructionKey) {}
    ~KnowledgeBase();

    KnowledgeBase(const KnowledgeBase&) = delete;
    KnowledgeBase& operator=(const KnowledgeBase&) = delete;

    Result<void> registerProject(const ProjectId& projectId, const std::string& name = "");

    Result<JobId> createIngestionJob(const ProjectId& projectId, const std::string& userId,
                                     std::vector<UploadedFile> files);

    Result<ingest::JobStatus> getJobStatus(const JobId& jobId) const;

    Result<std::vector<search::SearchHit>> search(const ProjectId& projectId,
                                                  const std::string& query, size_t k, size_t m);

    /// Uses retrieval.top_k and retrieval.top_m from the configuration.
    Result<std::vector<search::SearchHit>> search(const ProjectId& projectId,
                                                  const std::string& query);

    Result<search::SearchResponse> searchWithContext(const ProjectId& projectId,
                                                     const std::string& query, size_t k, size_t m);

    Result<std::vector<vector::DocumentRecord>> listDocuments(const ProjectId& projectId) const;
    Result<void> deleteDocument(const ProjectId& projectId, const DocumentId& documentId);

    Result<void> cancelJob(const JobId& jobId);
    Result<std::vector<ingest::JobStatus>> listJobs(const ProjectId& projectId,
                                                    size_t limit = 50) const;
    Result<std::vector<ingest::JobStatus>> listJobsForUser(const std::string& userId,
                                                           size_t limit = 50) const;

    /// True when the job reached a terminal state within `timeout`.
    bool waitForJob(const JobId& jobId, std::chrono::milliseconds timeout);

    /// Deletes finished jobs older than `age`.
    Result<size_t> purgeOldJobs(std::chrono::seconds age);

    void setProgressListener(ingest::ProgressListener listener);

    /// Cancels running jobs and stops the worker pool.
    void shutdown();

    const config::VellumConfig& config() const { return config_; }
    const vector::EmbeddingGenerator& embedder() const { return *embedder_; }

private:
    config::VellumConfig config_;
    std::shared_ptr<metadata::ConnectionManager> connections_;
    std::shared_ptr<core::PermitPool> permits_;
    std::shared_ptr<vector::VectorStore> store_;
    std::shared_ptr<vector::EmbeddingGenerator> embedder_;
    std::shared_ptr<ingest::JobTracker> tracker_;
    std::shared_ptr<extraction::TextExtractorFactory> extractors_;
    std::unique_ptr<ingest::IngestionOrchestrator> orchestrator_;
    std::unique_ptr<search::SearchService> search_;
};

} // namespace vellum::app
