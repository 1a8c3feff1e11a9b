#include <vellum/app/knowledge_base.h>
#include <vellum/core/ids.h>
#include <vellum/extraction/content_type.h>
#include <vellum/metadata/schema.h>

#include <spdlog/spdlog.h>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace vellum::app {

Result<std::unique_ptr<KnowledgeBase>>
KnowledgeBase::open(const config::VellumConfig& config,
                    std::shared_ptr<vector::IEmbeddingProvider> provider,
                    std::shared_ptr<search::IRelevanceScorer> scorer, core::Sleeper sleeper) {
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    if (!provider) {
        return Error{ErrorCode::InvalidArgument, "An embedding provider is required"};
    }

    std::error_code ec;
    std::filesystem::create_directories(config.storage.dataDir, ec);
    if (ec) {
        return Error{ErrorCode::DatabaseError, "Cannot create data directory " +
                                                   config.storage.dataDir.string() + ": " +
                                                   ec.message()};
    }

    const auto dbPath = config.storage.databasePath().string();
    auto connections = metadata::ConnectionManager::open(
        dbPath, {[](metadata::Database& db) { return vector::registerVectorFunctions(db); }});
    if (!connections) {
        return connections.error();
    }
    if (auto schema = connections.value()->withWriter(
            [](metadata::Database& db) { return metadata::initializeSchema(db); });
        !schema) {
        return schema.error();
    }

    auto kb = std::make_unique<KnowledgeBase>(ConstructionKey{});
    kb->config_ = config;
    kb->connections_ = connections.value();
    kb->store_ = std::make_shared<vector::VectorStore>(kb->connections_);
    kb->tracker_ = std::make_shared<ingest::JobTracker>(kb->connections_);

    auto recovered = kb->tracker_->recoverInterruptedJobs();
    if (!recovered) {
        return recovered.error();
    }

    try {
        kb->permits_ = std::make_shared<core::PermitPool>(config.embedding.permits,
                                                          config.reranker.permits);

        vector::EmbeddingConfig embedConfig;
        embedConfig.batch_size = config.embedding.batchSize;
        embedConfig.permit_timeout = config.embedding.timeout;
        embedConfig.retry.maxRetries = config.embedding.maxRetries;
        embedConfig.retry.initialBackoff = config.embedding.initialBackoff;
        embedConfig.retry.maxBackoff = config.embedding.maxBackoff;
        kb->embedder_ = std::make_shared<vector::EmbeddingGenerator>(
            std::move(provider), kb->permits_, embedConfig, sleeper);

        kb->extractors_ = std::make_shared<extraction::TextExtractorFactory>();

        ingest::OrchestratorConfig ingestConfig;
        ingestConfig.workerThreads = config.ingest.workerThreads;
        ingestConfig.maxWorkersPerJob = config.ingest.maxWorkersPerJob;
        ingestConfig.chunking.chunk_size = config.chunking.chunkSize;
        ingestConfig.chunking.chunk_overlap = config.chunking.chunkOverlap;
        ingestConfig.extraction.maxFileSize = config.ingest.maxFileSize;
        kb->orchestrator_ = std::make_unique<ingest::IngestionOrchestrator>(
            kb->tracker_, kb->store_, kb->embedder_, kb->extractors_, ingestConfig);

        search::RerankConfig rerankConfig;
        rerankConfig.batch_size = config.reranker.batchSize;
        rerankConfig.permit_timeout = config.reranker.timeout;
        auto reranker = std::make_shared<search::Reranker>(std::move(scorer), kb->permits_,
                                                           rerankConfig, sleeper);
        kb->search_ = std::make_unique<search::SearchService>(
            kb->embedder_, std::make_shared<search::Retriever>(kb->store_), std::move(reranker),
            config.retrieval.maxContextChars);
    } catch (const std::invalid_argument& e) {
        return Error{ErrorCode::InvalidArgument, e.what()};
    }

    spdlog::info("[KnowledgeBase] opened {} (embedding={}, dim={}, reranker={})", dbPath,
                 kb->embedder_->provider().name(), kb->embedder_->dimension(),
                 config.reranker.provider);
    if (recovered.value() > 0) {
        spdlog::warn("[KnowledgeBase] {} unfinished jobs were marked failed", recovered.value());
    }
    return kb;
}

KnowledgeBase::~KnowledgeBase() {
    shutdown();
}

void KnowledgeBase::shutdown() {
    if (orchestrator_) {
        orchestrator_->shutdown();
    }
}

Result<void> KnowledgeBase::registerProject(const ProjectId& projectId, const std::string& name) {
    return store_->registerProject(projectId, name);
}

Result<JobId> KnowledgeBase::createIngestionJob(const ProjectId& projectId,
                                                const std::string& userId,
                                                std::vector<UploadedFile> files) {
    if (projectId.empty()) {
        return Error{ErrorCode::InvalidArgument, "Project id must not be empty"};
    }
    if (files.empty()) {
        return Error{ErrorCode::InvalidArgument, "No files to ingest"};
    }
    for (const auto& f : files) {
        if (f.filename.empty()) {
            return Error{ErrorCode::InvalidArgument, "Every file needs a filename"};
        }
    }

    std::vector<ingest::JobFile> jobFiles;
    ingest::IngestJobRequest request;
    request.projectId = projectId;
    jobFiles.reserve(files.size());
    request.files.reserve(files.size());
    for (auto& f : files) {
        ingest::IngestFile file;
        file.documentId = core::generateUUID();
        file.filename = f.filename;
        file.declaredType = f.declaredType;
        file.bytes = std::move(f.bytes);
        jobFiles.push_back(ingest::JobFile{
            file.documentId, file.filename,
            extraction::detectContentType(file.bytes, file.filename, file.declaredType)});
        request.files.push_back(std::move(file));
    }

    auto jobId = tracker_->createJob(projectId, userId, jobFiles);
    if (!jobId) {
        return jobId.error();
    }
    request.jobId = jobId.value();

    if (auto submitted = orchestrator_->submit(std::move(request)); !submitted) {
        if (auto failed = tracker_->fail(jobId.value(), submitted.error().message); !failed) {
            spdlog::error("[KnowledgeBase] job {} left pending: {}", jobId.value(),
                          failed.error().message);
        }
        return submitted.error();
    }
    return jobId;
}

Result<ingest::JobStatus> KnowledgeBase::getJobStatus(const JobId& jobId) const {
    return tracker_->getStatus(jobId);
}

Result<std::vector<search::SearchHit>>
KnowledgeBase::search(const ProjectId& projectId, const std::string& query, size_t k, size_t m) {
    return search_->search(projectId, query, k, m);
}

Result<std::vector<search::SearchHit>> KnowledgeBase::search(const ProjectId& projectId,
                                                             const std::string& query) {
    return search_->search(projectId, query, config_.retrieval.topK, config_.retrieval.topM);
}

Result<search::SearchResponse> KnowledgeBase::searchWithContext(const ProjectId& projectId,
                                                                const std::string& query,
                                                                size_t k, size_t m) {
    return search_->searchWithContext(projectId, query, k, m);
}

Result<std::vector<vector::DocumentRecord>>
KnowledgeBase::listDocuments(const ProjectId& projectId) const {
    auto known = store_->hasProject(projectId);
    if (!known)
        return known.error();
    if (!known.value()) {
        return Error{ErrorCode::ProjectNotFound, "Project not found: " + projectId};
    }
    return store_->listDocuments(projectId);
}

Result<void> KnowledgeBase::deleteDocument(const ProjectId& projectId,
                                           const DocumentId& documentId) {
    return store_->deleteDocument(projectId, documentId);
}

Result<void> KnowledgeBase::cancelJob(const JobId& jobId) {
    return orchestrator_->cancel(jobId);
}

Result<std::vector<ingest::JobStatus>> KnowledgeBase::listJobs(const ProjectId& projectId,
                                                               size_t limit) const {
    return tracker_->listJobsByProject(projectId, limit);
}

Result<std::vector<ingest::JobStatus>> KnowledgeBase::listJobsForUser(const std::string& userId,
                                                                      size_t limit) const {
    return tracker_->listJobsByUser(userId, limit);
}

bool KnowledgeBase::waitForJob(const JobId& jobId, std::chrono::milliseconds timeout) {
    if (!orchestrator_->waitForJob(jobId, timeout)) {
        return false;
    }
    auto status = tracker_->getStatus(jobId);
    return status && status.value().isTerminal();
}

Result<size_t> KnowledgeBase::purgeOldJobs(std::chrono::seconds age) {
    return tracker_->deleteJobsOlderThan(age);
}

void KnowledgeBase::setProgressListener(ingest::ProgressListener listener) {
    orchestrator_->setProgressListener(std::move(listener));
}

} // namespace vellum::app
