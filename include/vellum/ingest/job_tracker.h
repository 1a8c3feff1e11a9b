#pragma once

#include <vellum/core/types.h>
#include <vellum/metadata/database.h>

#include <chrono>
#include <cmath>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vellum::ingest {

enum class JobState { Pending, Processing, Completed, Failed };

const char* jobStateToString(JobState state);
std::optional<JobState> parseJobState(const std::string& s);

struct FileError {
    std::string filename;
    std::string errorKind;
    std::string message;
    TimePoint occurredAt;
};

/**
 * @brief Snapshot of one ingestion job.
 *
 * processedFiles + failedFiles <= totalFiles at all times, with equality once
 * the job is terminal.
 */
struct JobStatus {
    JobId id;
    ProjectId projectId;
    std::string userId;
    JobState state = JobState::Pending;
    size_t totalFiles = 0;
    size_t processedFiles = 0;
    size_t failedFiles = 0;
    std::vector<FileError> errors;
    std::string errorMessage;
    TimePoint createdAt;
    TimePoint updatedAt;

    bool isTerminal() const { return state == JobState::Completed || state == JobState::Failed; }

    /// Percent of files with an outcome, one decimal.
    double progressPercentage() const {
        if (totalFiles == 0)
            return 0.0;
        return round1(100.0 * static_cast<double>(processedFiles + failedFiles) /
                      static_cast<double>(totalFiles));
    }

    /// Percent of attempted files that succeeded, one decimal.
    double successRate() const {
        size_t attempted = processedFiles + failedFiles;
        if (attempted == 0)
            return 0.0;
        return round1(100.0 * static_cast<double>(processedFiles) /
                      static_cast<double>(attempted));
    }

private:
    static double round1(double v) { return std::round(v * 10.0) / 10.0; }
};

/// A file registered with a job; one `documents` row is created per entry.
struct JobFile {
    DocumentId documentId;
    std::string filename;
    std::string contentType;
};

/// Error kind recorded for files a failed job never attempted.
inline constexpr const char* kJobAbortedKind = "JobAborted";

/**
 * @brief Persistent job records and their progress counters.
 *
 * Every mutation is a committed statement (or a single transaction), so the
 * counters seen by getStatus() survive a restart and concurrent workers never
 * lose an increment.
 */
class JobTracker {
public:
    explicit JobTracker(std::shared_ptr<metadata::ConnectionManager> connections);

    Result<JobId> createJob(const ProjectId& projectId, const std::string& userId,
                            const std::vector<JobFile>& files);

    Result<void> markProcessing(const JobId& jobId);
    Result<void> recordFileSuccess(const JobId& jobId);
    Result<void> recordFileFailure(const JobId& jobId, const DocumentId& documentId,
                                   const std::string& filename, const std::string& errorKind,
                                   const std::string& message);
    Result<void> complete(const JobId& jobId);

    /// Terminal failure; files never attempted are counted as failed.
    Result<void> fail(const JobId& jobId, const std::string& message);

    Result<JobStatus> getStatus(const JobId& jobId) const;

    Result<std::vector<JobStatus>> listJobsByProject(const ProjectId& projectId,
                                                     size_t limit = 50) const;
    Result<std::vector<JobStatus>> listJobsByUser(const std::string& userId,
                                                  size_t limit = 50) const;

    /// Removes terminal jobs last updated at least `age` ago. Returns the count.
    Result<size_t> deleteJobsOlderThan(std::chrono::seconds age);

    /// Fails jobs a previous process left pending or processing.
    Result<size_t> recoverInterruptedJobs();

private:
    Result<std::vector<JobStatus>> listJobs(const std::string& column, const std::string& value,
                                            size_t limit) const;
    Result<void> failLocked(metadata::Database& db, const JobId& jobId,
                            const std::string& message);

    std::shared_ptr<metadata::ConnectionManager> connections_;
};

} // namespace vellum::ingest
