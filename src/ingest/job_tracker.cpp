#include <vellum/core/ids.h>
#include <vellum/ingest/job_tracker.h>

#include <spdlog/spdlog.h>

namespace vellum::ingest {

namespace {

constexpr const char* kJobColumns =
    "id, project_id, user_id, status, total_files, processed_files, failed_files, "
    "error_message, created_at, updated_at";

int64_t nowSeconds() {
    return core::toUnixSeconds(std::chrono::system_clock::now());
}

JobStatus readJob(const metadata::Statement& stmt) {
    JobStatus job;
    job.id = stmt.getString(0);
    job.projectId = stmt.getString(1);
    job.userId = stmt.getString(2);
    job.state = parseJobState(stmt.getString(3)).value_or(JobState::Failed);
    job.totalFiles = static_cast<size_t>(stmt.getInt64(4));
    job.processedFiles = static_cast<size_t>(stmt.getInt64(5));
    job.failedFiles = static_cast<size_t>(stmt.getInt64(6));
    job.errorMessage = stmt.getString(7);
    job.createdAt = core::fromUnixSeconds(stmt.getInt64(8));
    job.updatedAt = core::fromUnixSeconds(stmt.getInt64(9));
    return job;
}

// Distinguishes "no such job" from "job in the wrong state" after a guarded UPDATE touched nothing
Error stateError(metadata::Database& db, const JobId& jobId, const char* operation) {
    auto stmt = db.prepare("SELECT status, processed_files, failed_files, total_files "
                           "FROM ingestion_jobs WHERE id = ?");
    if (!stmt)
        return stmt.error();
    if (auto b = stmt.value().bind(1, jobId); !b)
        return b.error();
    auto row = stmt.value().step();
    if (!row)
        return row.error();
    if (!row.value()) {
        return Error{ErrorCode::JobNotFound, "Job not found: " + jobId};
    }
    return Error{ErrorCode::InvalidState,
                 std::string(operation) + " rejected for job " + jobId + " (status " +
                     stmt.value().getString(0) + ", " +
                     std::to_string(stmt.value().getInt64(1)) + "+" +
                     std::to_string(stmt.value().getInt64(2)) + "/" +
                     std::to_string(stmt.value().getInt64(3)) + ")"};
}

} // namespace

const char* jobStateToString(JobState state) {
    switch (state) {
        case JobState::Pending: return "pending";
        case JobState::Processing: return "processing";
        case JobState::Completed: return "completed";
        case JobState::Failed: return "failed";
    }
    return "failed";
}

std::optional<JobState> parseJobState(const std::string& s) {
    if (s == "pending")
        return JobState::Pending;
    if (s == "processing")
        return JobState::Processing;
    if (s == "completed")
        return JobState::Completed;
    if (s == "failed")
        return JobState::Failed;
    return std::nullopt;
}

JobTracker::JobTracker(std::shared_ptr<metadata::ConnectionManager> connections)
    : connections_(std::move(connections)) {}

Result<JobId> JobTracker::createJob(const ProjectId& projectId, const std::string& userId,
                                    const std::vector<JobFile>& files) {
    if (files.empty()) {
        return Error{ErrorCode::InvalidArgument, "A job needs at least one file"};
    }

    JobId jobId = core::generateUUID();
    auto result = connections_->withWriter([&](metadata::Database& db) -> Result<void> {
        return db.transaction([&]() -> Result<void> {
            auto project = db.prepare("SELECT 1 FROM projects WHERE id = ?");
            if (!project)
                return project.error();
            if (auto b = project.value().bind(1, projectId); !b)
                return b;
            auto found = project.value().step();
            if (!found)
                return found.error();
            if (!found.value()) {
                return Error{ErrorCode::ProjectNotFound, "Project not found: " + projectId};
            }

            const int64_t now = nowSeconds();
            auto job = db.prepare("INSERT INTO ingestion_jobs(id, project_id, user_id, status, "
                                  "total_files, created_at, updated_at) "
                                  "VALUES (?, ?, ?, 'pending', ?, ?, ?)");
            if (!job)
                return job.error();
            if (auto b = job.value().bindAll(jobId, projectId, userId, files.size(), now, now); !b)
                return b;
            if (auto e = job.value().execute(); !e)
                return e;

            auto doc = db.prepare("INSERT INTO documents(id, project_id, job_id, filename, "
                                  "content_type, status, created_at, updated_at) "
                                  "VALUES (?, ?, ?, ?, ?, 'pending', ?, ?)");
            if (!doc)
                return doc.error();
            for (const auto& f : files) {
                if (auto r = doc.value().reset(); !r)
                    return r;
                if (auto b = doc.value().bindAll(f.documentId, projectId, jobId, f.filename,
                                                 f.contentType, now, now);
                    !b)
                    return b;
                if (auto e = doc.value().execute(); !e)
                    return e;
            }
            return {};
        });
    });
    if (!result)
        return result.error();

    spdlog::info("[JobTracker] created job {} for project {} ({} files)", jobId, projectId,
                 files.size());
    return jobId;
}

Result<void> JobTracker::markProcessing(const JobId& jobId) {
    return connections_->withWriter([&](metadata::Database& db) -> Result<void> {
        auto stmt = db.prepare("UPDATE ingestion_jobs SET status = 'processing', updated_at = ? "
                               "WHERE id = ? AND status = 'pending'");
        if (!stmt)
            return stmt.error();
        if (auto b = stmt.value().bindAll(nowSeconds(), jobId); !b)
            return b;
        if (auto e = stmt.value().execute(); !e)
            return e;
        if (db.changes() == 0)
            return stateError(db, jobId, "markProcessing");
        return {};
    });
}

Result<void> JobTracker::recordFileSuccess(const JobId& jobId) {
    return connections_->withWriter([&](metadata::Database& db) -> Result<void> {
        auto stmt = db.prepare(
            "UPDATE ingestion_jobs SET processed_files = processed_files + 1, updated_at = ? "
            "WHERE id = ? AND status = 'processing' "
            "AND processed_files + failed_files < total_files");
        if (!stmt)
            return stmt.error();
        if (auto b = stmt.value().bindAll(nowSeconds(), jobId); !b)
            return b;
        if (auto e = stmt.value().execute(); !e)
            return e;
        if (db.changes() == 0)
            return stateError(db, jobId, "recordFileSuccess");
        return {};
    });
}

Result<void> JobTracker::recordFileFailure(const JobId& jobId, const DocumentId& documentId,
                                           const std::string& filename,
                                           const std::string& errorKind,
                                           const std::string& message) {
    return connections_->withWriter([&](metadata::Database& db) -> Result<void> {
        return db.transaction([&]() -> Result<void> {
            const int64_t now = nowSeconds();
            auto counter = db.prepare(
                "UPDATE ingestion_jobs SET failed_files = failed_files + 1, updated_at = ? "
                "WHERE id = ? AND status = 'processing' "
                "AND processed_files + failed_files < total_files");
            if (!counter)
                return counter.error();
            if (auto b = counter.value().bindAll(now, jobId); !b)
                return b;
            if (auto e = counter.value().execute(); !e)
                return e;
            if (db.changes() == 0)
                return stateError(db, jobId, "recordFileFailure");

            auto error = db.prepare("INSERT INTO job_file_errors(job_id, filename, error_kind, "
                                    "message, occurred_at) VALUES (?, ?, ?, ?, ?)");
            if (!error)
                return error.error();
            if (auto b = error.value().bindAll(jobId, filename, errorKind, message, now); !b)
                return b;
            if (auto e = error.value().execute(); !e)
                return e;

            auto doc = db.prepare("UPDATE documents SET status = 'failed', error = ?, "
                                  "updated_at = ? WHERE id = ? AND job_id = ?");
            if (!doc)
                return doc.error();
            if (auto b = doc.value().bindAll(errorKind + ": " + message, now, documentId, jobId);
                !b)
                return b;
            return doc.value().execute();
        });
    });
}

Result<void> JobTracker::complete(const JobId& jobId) {
    auto result = connections_->withWriter([&](metadata::Database& db) -> Result<void> {
        auto stmt = db.prepare("UPDATE ingestion_jobs SET status = 'completed', updated_at = ? "
                               "WHERE id = ? AND status = 'processing' "
                               "AND processed_files + failed_files = total_files");
        if (!stmt)
            return stmt.error();
        if (auto b = stmt.value().bindAll(nowSeconds(), jobId); !b)
            return b;
        if (auto e = stmt.value().execute(); !e)
            return e;
        if (db.changes() == 0)
            return stateError(db, jobId, "complete");
        return {};
    });
    if (result) {
        spdlog::info("[JobTracker] job {} completed", jobId);
    }
    return result;
}

Result<void> JobTracker::fail(const JobId& jobId, const std::string& message) {
    return connections_->withWriter(
        [&](metadata::Database& db) -> Result<void> { return failLocked(db, jobId, message); });
}

Result<void> JobTracker::failLocked(metadata::Database& db, const JobId& jobId,
                                    const std::string& message) {
    auto result = db.transaction([&]() -> Result<void> {
        auto job = db.prepare("SELECT status FROM ingestion_jobs WHERE id = ?");
        if (!job)
            return job.error();
        if (auto b = job.value().bind(1, jobId); !b)
            return b;
        auto row = job.value().step();
        if (!row)
            return row.error();
        if (!row.value()) {
            return Error{ErrorCode::JobNotFound, "Job not found: " + jobId};
        }
        auto state = parseJobState(job.value().getString(0));
        if (state == JobState::Completed || state == JobState::Failed) {
            return Error{ErrorCode::InvalidState, "Job " + jobId + " is already terminal"};
        }

        const int64_t now = nowSeconds();

        // Files still pending were never attempted; they are recorded as aborted
        auto pending = db.prepare(
            "INSERT INTO job_file_errors(job_id, filename, error_kind, message, occurred_at) "
            "SELECT job_id, filename, ?, ?, ? FROM documents "
            "WHERE job_id = ? AND status = 'pending'");
        if (!pending)
            return pending.error();
        if (auto b = pending.value().bindAll(kJobAbortedKind, message, now, jobId); !b)
            return b;
        if (auto e = pending.value().execute(); !e)
            return e;

        auto docs = db.prepare("UPDATE documents SET status = 'failed', error = ?, "
                               "updated_at = ? WHERE job_id = ? AND status = 'pending'");
        if (!docs)
            return docs.error();
        if (auto b = docs.value().bindAll(std::string(kJobAbortedKind) + ": " + message, now,
                                          jobId);
            !b)
            return b;
        if (auto e = docs.value().execute(); !e)
            return e;

        // A document that reached 'ready' is stored and searchable even when its
        // success was never counted, so it is reconciled as processed
        auto update = db.prepare(
            "UPDATE ingestion_jobs SET status = 'failed', "
            "processed_files = MAX(processed_files, (SELECT COUNT(*) FROM documents "
            "  WHERE job_id = ?1 AND status = 'ready')), "
            "failed_files = total_files - MAX(processed_files, (SELECT COUNT(*) FROM documents "
            "  WHERE job_id = ?1 AND status = 'ready')), "
            "error_message = ?2, updated_at = ?3 WHERE id = ?1");
        if (!update)
            return update.error();
        if (auto b = update.value().bindAll(jobId, message, now); !b)
            return b;
        return update.value().execute();
    });
    if (result) {
        spdlog::warn("[JobTracker] job {} failed: {}", jobId, message);
    }
    return result;
}

Result<JobStatus> JobTracker::getStatus(const JobId& jobId) const {
    auto reader = connections_->openReader();
    if (!reader)
        return reader.error();
    auto& db = reader.value();

    // Job row and error list come from the same read snapshot
    if (auto r = db.beginTransaction(false); !r)
        return r.error();

    auto read = [&]() -> Result<JobStatus> {
        auto stmt = db.prepare(std::string("SELECT ") + kJobColumns +
                               " FROM ingestion_jobs WHERE id = ?");
        if (!stmt)
            return stmt.error();
        if (auto b = stmt.value().bind(1, jobId); !b)
            return b.error();
        auto row = stmt.value().step();
        if (!row)
            return row.error();
        if (!row.value()) {
            return Error{ErrorCode::JobNotFound, "Job not found: " + jobId};
        }
        JobStatus job = readJob(stmt.value());

        auto errors = db.prepare("SELECT filename, error_kind, message, occurred_at "
                                 "FROM job_file_errors WHERE job_id = ? ORDER BY id");
        if (!errors)
            return errors.error();
        if (auto b = errors.value().bind(1, jobId); !b)
            return b.error();
        while (true) {
            auto erow = errors.value().step();
            if (!erow)
                return erow.error();
            if (!erow.value())
                break;
            FileError fe;
            fe.filename = errors.value().getString(0);
            fe.errorKind = errors.value().getString(1);
            fe.message = errors.value().getString(2);
            fe.occurredAt = core::fromUnixSeconds(errors.value().getInt64(3));
            job.errors.push_back(std::move(fe));
        }
        return job;
    };

    auto result = read();
    if (auto c = db.commit(); !c) {
        (void)db.rollback();
        if (result)
            return c.error();
    }
    return result;
}

Result<std::vector<JobStatus>> JobTracker::listJobs(const std::string& column,
                                                    const std::string& value,
                                                    size_t limit) const {
    auto reader = connections_->openReader();
    if (!reader)
        return reader.error();
    auto stmt = reader.value().prepare(std::string("SELECT ") + kJobColumns +
                                       " FROM ingestion_jobs WHERE " + column +
                                       " = ? ORDER BY created_at DESC, rowid DESC LIMIT ?");
    if (!stmt)
        return stmt.error();
    if (auto b = stmt.value().bindAll(value, limit); !b)
        return b.error();

    std::vector<JobStatus> jobs;
    while (true) {
        auto row = stmt.value().step();
        if (!row)
            return row.error();
        if (!row.value())
            break;
        jobs.push_back(readJob(stmt.value()));
    }
    return jobs;
}

Result<std::vector<JobStatus>> JobTracker::listJobsByProject(const ProjectId& projectId,
                                                             size_t limit) const {
    return listJobs("project_id", projectId, limit);
}

Result<std::vector<JobStatus>> JobTracker::listJobsByUser(const std::string& userId,
                                                          size_t limit) const {
    return listJobs("user_id", userId, limit);
}

Result<size_t> JobTracker::deleteJobsOlderThan(std::chrono::seconds age) {
    const int64_t cutoff = nowSeconds() - static_cast<int64_t>(age.count());
    auto deleted = connections_->withWriter([&](metadata::Database& db) -> Result<size_t> {
        auto stmt = db.prepare("DELETE FROM ingestion_jobs "
                               "WHERE status IN ('completed', 'failed') AND updated_at <= ?");
        if (!stmt)
            return stmt.error();
        if (auto b = stmt.value().bind(1, cutoff); !b)
            return b.error();
        if (auto e = stmt.value().execute(); !e)
            return e.error();
        return static_cast<size_t>(db.changes());
    });
    if (deleted && deleted.value() > 0) {
        spdlog::info("[JobTracker] purged {} jobs older than {}s", deleted.value(), age.count());
    }
    return deleted;
}

Result<size_t> JobTracker::recoverInterruptedJobs() {
    return connections_->withWriter([&](metadata::Database& db) -> Result<size_t> {
        std::vector<JobId> interrupted;
        {
            auto stmt = db.prepare(
                "SELECT id FROM ingestion_jobs WHERE status IN ('pending', 'processing')");
            if (!stmt)
                return stmt.error();
            while (true) {
                auto row = stmt.value().step();
                if (!row)
                    return row.error();
                if (!row.value())
                    break;
                interrupted.push_back(stmt.value().getString(0));
            }
        }

        for (const auto& id : interrupted) {
            if (auto r = failLocked(db, id, "interrupted by restart"); !r)
                return r.error();
        }
        if (!interrupted.empty()) {
            spdlog::warn("[JobTracker] recovered {} interrupted jobs", interrupted.size());
        }
        return interrupted.size();
    });
}

} // namespace vellum::ingest
