#include <vellum/ingest/ingestion_orchestrator.h>

#include <spdlog/spdlog.h>
#include <boost/asio/post.hpp>

#include <algorithm>
#include <stdexcept>

namespace vellum::ingest {

namespace {

chunking::TextChunker makeChunker(const chunking::ChunkingConfig& config) {
    if (auto valid = chunking::TextChunker::validate(config); !valid) {
        throw std::invalid_argument(valid.error().message);
    }
    return chunking::TextChunker(config);
}

} // namespace

IngestionOrchestrator::IngestionOrchestrator(
    std::shared_ptr<JobTracker> tracker, std::shared_ptr<vector::VectorStore> store,
    std::shared_ptr<vector::EmbeddingGenerator> embedder,
    std::shared_ptr<extraction::TextExtractorFactory> extractors, OrchestratorConfig config)
    : tracker_(std::move(tracker)),
      store_(std::move(store)),
      embedder_(std::move(embedder)),
      extractors_(std::move(extractors)),
      config_(std::move(config)),
      chunker_(makeChunker(config_.chunking)) {
    if (!tracker_ || !store_ || !embedder_ || !extractors_) {
        throw std::invalid_argument("IngestionOrchestrator requires all pipeline components");
    }
    config_.workerThreads = std::max<size_t>(1, config_.workerThreads);
    config_.maxWorkersPerJob = std::max<size_t>(1, config_.maxWorkersPerJob);
    pool_ = std::make_unique<boost::asio::thread_pool>(config_.workerThreads);
    spdlog::debug("[Ingest] orchestrator started with {} threads, {} lanes per job",
                  config_.workerThreads, config_.maxWorkersPerJob);
}

IngestionOrchestrator::~IngestionOrchestrator() {
    shutdown();
}

Result<void> IngestionOrchestrator::submit(IngestJobRequest request) {
    if (stopping_.load()) {
        return Error{ErrorCode::InvalidState, "Orchestrator is shutting down"};
    }
    if (request.jobId.empty() || request.files.empty()) {
        return Error{ErrorCode::InvalidArgument, "Job request needs an id and at least one file"};
    }

    auto run = std::make_shared<JobRun>(std::move(request));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_.emplace(run->request.jobId, run).second) {
            return Error{ErrorCode::InvalidState,
                         "Job " + run->request.jobId + " is already running"};
        }
    }
    boost::asio::post(*pool_, [this, run]() { startJob(run); });
    return {};
}

Result<void> IngestionOrchestrator::cancel(const JobId& jobId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(jobId);
    if (it == active_.end()) {
        return Error{ErrorCode::JobNotFound, "Job " + jobId + " is not running"};
    }
    it->second->cancelled.store(true);
    spdlog::info("[Ingest] cancellation requested for job {}", jobId);
    return {};
}

bool IngestionOrchestrator::waitForJob(const JobId& jobId, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return jobDone_.wait_for(lock, timeout, [&]() { return active_.count(jobId) == 0; });
}

void IngestionOrchestrator::shutdown() {
    if (stopping_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, run] : active_) {
            run->cancelled.store(true);
        }
    }
    // Queued start tasks still run and finalize their jobs before join returns
    pool_->join();
    spdlog::debug("[Ingest] orchestrator stopped");
}

void IngestionOrchestrator::setProgressListener(ProgressListener listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listener_ = std::move(listener);
}

size_t IngestionOrchestrator::activeJobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

void IngestionOrchestrator::startJob(const std::shared_ptr<JobRun>& run) {
    const auto& jobId = run->request.jobId;
    if (auto started = tracker_->markProcessing(jobId); !started) {
        spdlog::error("[Ingest] job {} could not start: {}", jobId, started.error().message);
        abortJob(*run, started.error());
        run->lanesLeft.store(1);
        runLane(run);
        return;
    }

    const size_t lanes = std::min(config_.maxWorkersPerJob, run->request.files.size());
    run->lanesLeft.store(lanes);
    spdlog::info("[Ingest] job {} processing {} files on {} lanes", jobId,
                 run->request.files.size(), lanes);

    for (size_t i = 1; i < lanes; ++i) {
        boost::asio::post(*pool_, [this, run]() { runLane(run); });
    }
    runLane(run);
}

void IngestionOrchestrator::runLane(const std::shared_ptr<JobRun>& run) {
    const size_t total = run->request.files.size();
    while (!run->cancelled.load() && !run->aborted.load() && !stopping_.load()) {
        size_t index = run->next.fetch_add(1);
        if (index >= total) {
            break;
        }
        processFile(*run, index);
    }

    if (run->lanesLeft.fetch_sub(1) == 1) {
        finishJob(run);
    }
}

void IngestionOrchestrator::processFile(JobRun& run, size_t index) {
    auto& file = run.request.files[index];
    const auto& jobId = run.request.jobId;

    auto outcome = ingestFile(run, file);
    file.bytes.clear();
    file.bytes.shrink_to_fit();

    if (!outcome && outcome.error().code == ErrorCode::DatabaseError) {
        // The current file stays pending and is counted by fail()
        abortJob(run, outcome.error());
        return;
    }

    ProgressEvent event{jobId, file.filename, std::nullopt, false};
    Result<void> recorded;
    if (outcome) {
        recorded = tracker_->recordFileSuccess(jobId);
        spdlog::debug("[Ingest] job {}: '{}' stored", jobId, file.filename);
    } else {
        const char* kind = errorKindName(outcome.error().code);
        event.errorKind = kind;
        spdlog::warn("[Ingest] job {}: '{}' failed ({}): {}", jobId, file.filename, kind,
                     outcome.error().message);
        recorded = tracker_->recordFileFailure(jobId, file.documentId, file.filename, kind,
                                               outcome.error().message);
    }

    if (!recorded) {
        if (recorded.error().code == ErrorCode::DatabaseError) {
            abortJob(run, recorded.error());
        } else {
            spdlog::debug("[Ingest] job {}: outcome of '{}' not recorded: {}", jobId,
                          file.filename, recorded.error().message);
        }
        return;
    }
    notify(event);
}

Result<void> IngestionOrchestrator::ingestFile(const JobRun& run, const IngestFile& file) {
    auto extracted = extractors_->extract(std::span<const std::byte>(file.bytes), file.filename,
                                          file.declaredType, config_.extraction);
    if (!extracted) {
        return extracted.error();
    }
    const auto& text = extracted.value().text;

    auto chunks = chunker_.chunk(text);
    if (!chunks) {
        return Error{ErrorCode::InternalError, chunks.error().message};
    }
    if (chunks.value().empty()) {
        spdlog::warn("[Ingest] '{}' produced no text", file.filename);
    }

    std::vector<std::string> texts;
    texts.reserve(chunks.value().size());
    for (const auto& c : chunks.value()) {
        texts.push_back(c.content);
    }

    auto embeddings = embedder_->generate(texts);
    size_t failed = 0;
    const Error* firstError = nullptr;
    for (const auto& e : embeddings) {
        if (!e) {
            if (!firstError)
                firstError = &e.error();
            ++failed;
        }
    }
    if (failed > 0) {
        return Error{ErrorCode::EmbeddingFailed, std::to_string(failed) + " of " +
                                                     std::to_string(embeddings.size()) +
                                                     " chunks could not be embedded: " +
                                                     firstError->message};
    }

    const auto& contentType = extracted.value().contentType;
    std::vector<vector::ChunkRecord> records;
    records.reserve(chunks.value().size());
    for (size_t i = 0; i < chunks.value().size(); ++i) {
        auto& c = chunks.value()[i];
        vector::ChunkRecord record;
        record.chunkIndex = c.chunk_index;
        record.content = std::move(c.content);
        record.startOffset = c.start_offset;
        record.contentOffset = c.content_offset;
        record.endOffset = c.end_offset;
        record.embedding = std::move(embeddings[i]).value();
        record.metadata = {{"filename", file.filename},
                           {"content_type", contentType},
                           {"job_id", run.request.jobId},
                           {"chunk_size", std::to_string(config_.chunking.chunk_size)},
                           {"chunk_overlap", std::to_string(config_.chunking.chunk_overlap)}};
        records.push_back(std::move(record));
    }

    auto stored = store_->appendDocumentChunks(run.request.projectId, file.documentId,
                                               contentType, std::move(records));
    if (!stored) {
        if (stored.error().code == ErrorCode::DatabaseError) {
            return stored.error();
        }
        return Error{ErrorCode::TransactionFailed, stored.error().message};
    }
    return {};
}

void IngestionOrchestrator::abortJob(JobRun& run, const Error& error) {
    std::lock_guard<std::mutex> lock(run.abortMutex);
    if (!run.aborted.exchange(true)) {
        run.abortReason = error.message;
        spdlog::error("[Ingest] job {} aborted: {}", run.request.jobId, error.message);
    }
}

void IngestionOrchestrator::finishJob(const std::shared_ptr<JobRun>& run) {
    const auto& jobId = run->request.jobId;
    const auto& files = run->request.files;

    if (run->aborted.load()) {
        std::string reason;
        {
            std::lock_guard<std::mutex> lock(run->abortMutex);
            reason = run->abortReason;
        }
        if (auto failed = tracker_->fail(jobId, reason); !failed) {
            spdlog::error("[Ingest] job {} could not be marked failed: {}", jobId,
                          failed.error().message);
        }
    } else {
        const std::string message =
            stopping_.load() ? "shutdown before the file was started" : "job cancelled";
        for (size_t i = std::min(run->next.load(), files.size()); i < files.size(); ++i) {
            auto r = tracker_->recordFileFailure(jobId, files[i].documentId, files[i].filename,
                                                 errorKindName(ErrorCode::OperationCancelled),
                                                 message);
            if (!r) {
                spdlog::error("[Ingest] job {}: cancelling '{}' failed: {}", jobId,
                              files[i].filename, r.error().message);
            }
        }
        if (auto done = tracker_->complete(jobId); !done) {
            spdlog::error("[Ingest] job {} could not complete: {}", jobId, done.error().message);
            if (done.error().code == ErrorCode::DatabaseError) {
                if (auto failed = tracker_->fail(jobId, done.error().message); !failed) {
                    spdlog::error("[Ingest] job {} could not be marked failed: {}", jobId,
                                  failed.error().message);
                }
            }
        }
    }

    notify(ProgressEvent{jobId, "", std::nullopt, true});
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.erase(jobId);
    }
    jobDone_.notify_all();
}

void IngestionOrchestrator::notify(const ProgressEvent& event) {
    ProgressListener listener;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listener = listener_;
    }
    if (listener) {
        listener(event);
    }
}

} // namespace vellum::ingest
