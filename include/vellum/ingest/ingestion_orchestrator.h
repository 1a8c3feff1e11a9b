#pragma once

#include <vellum/chunking/text_chunker.h>
#include <vellum/core/types.h>
#include <vellum/extraction/text_extractor.h>
#include <vellum/ingest/job_tracker.h>
#include <vellum/vector/embedding_generator.h>
#include <vellum/vector/vector_store.h>

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vellum::ingest {

struct IngestFile {
    DocumentId documentId;
    std::string filename;
    std::string declaredType;
    std::vector<std::byte> bytes;
};

struct IngestJobRequest {
    JobId jobId;
    ProjectId projectId;
    std::vector<IngestFile> files;
};

struct OrchestratorConfig {
    size_t workerThreads = 4;
    size_t maxWorkersPerJob = 2;
    chunking::ChunkingConfig chunking;
    extraction::ExtractionConfig extraction;
};

/// Pushed after every file outcome and once more when the job is finalized.
struct ProgressEvent {
    JobId jobId;
    std::string filename;                 // empty on the final event
    std::optional<std::string> errorKind; // set when the file failed
    bool jobFinished = false;
};

using ProgressListener = std::function<void(const ProgressEvent&)>;

/**
 * @brief Runs ingestion jobs on a shared thread pool.
 *
 * Each job is worked by at most `maxWorkersPerJob` lanes; a lane claims the
 * next unstarted file, takes it through extract, chunk, embed and store, and
 * records the outcome with the JobTracker. One file's failure never stops the
 * others. A DatabaseError stops the job: unstarted files are left alone and
 * the job is failed once in-flight files have settled.
 */
class IngestionOrchestrator {
public:
    IngestionOrchestrator(std::shared_ptr<JobTracker> tracker,
                          std::shared_ptr<vector::VectorStore> store,
                          std::shared_ptr<vector::EmbeddingGenerator> embedder,
                          std::shared_ptr<extraction::TextExtractorFactory> extractors,
                          OrchestratorConfig config = {});
    ~IngestionOrchestrator();

    IngestionOrchestrator(const IngestionOrchestrator&) = delete;
    IngestionOrchestrator& operator=(const IngestionOrchestrator&) = delete;

    /// Schedules a job already registered with the tracker. Returns immediately.
    Result<void> submit(IngestJobRequest request);

    /// Stops claiming new files; unstarted files are recorded as Cancelled.
    Result<void> cancel(const JobId& jobId);

    /// True once the job is no longer running here.
    bool waitForJob(const JobId& jobId, std::chrono::milliseconds timeout);

    /// Cancels all jobs and joins the pool. Idempotent.
    void shutdown();

    void setProgressListener(ProgressListener listener);

    size_t activeJobs() const;

private:
    struct JobRun {
        explicit JobRun(IngestJobRequest r) : request(std::move(r)) {}

        IngestJobRequest request;
        std::atomic<size_t> next{0};
        std::atomic<size_t> lanesLeft{0};
        std::atomic<bool> cancelled{false};
        std::atomic<bool> aborted{false};
        std::mutex abortMutex;
        std::string abortReason;
    };

    void startJob(const std::shared_ptr<JobRun>& run);
    void runLane(const std::shared_ptr<JobRun>& run);
    void processFile(JobRun& run, size_t index);
    Result<void> ingestFile(const JobRun& run, const IngestFile& file);
    void abortJob(JobRun& run, const Error& error);
    void finishJob(const std::shared_ptr<JobRun>& run);
    void notify(const ProgressEvent& event);

    std::shared_ptr<JobTracker> tracker_;
    std::shared_ptr<vector::VectorStore> store_;
    std::shared_ptr<vector::EmbeddingGenerator> embedder_;
    std::shared_ptr<extraction::TextExtractorFactory> extractors_;
    OrchestratorConfig config_;
    chunking::TextChunker chunker_;

    std::unique_ptr<boost::asio::thread_pool> pool_;
    std::atomic<bool> stopping_{false};

    mutable std::mutex mutex_;
    std::condition_variable jobDone_;
    std::unordered_map<JobId, std::shared_ptr<JobRun>> active_;

    std::mutex listenerMutex_;
    ProgressListener listener_;
};

} // namespace vellum::ingest
