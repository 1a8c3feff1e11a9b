#include <vellum/app/knowledge_base.h>
#include <vellum/app/provider_factory.h>
#include <vellum/config/vellum_config.h>
#include <vellum/core/ids.h>
#include <vellum/core/logging.h>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace vellum::cli {

using json = nlohmann::json;

namespace {

Result<std::vector<std::byte>> readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, "Cannot open " + path.string()};
    }
    std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::vector<std::byte> bytes(raw.size());
    std::transform(raw.begin(), raw.end(), bytes.begin(),
                   [](char c) { return static_cast<std::byte>(c); });
    return bytes;
}

json jobToJson(const ingest::JobStatus& job) {
    json j;
    j["id"] = job.id;
    j["project"] = job.projectId;
    j["user"] = job.userId;
    j["status"] = ingest::jobStateToString(job.state);
    j["total_files"] = job.totalFiles;
    j["processed_files"] = job.processedFiles;
    j["failed_files"] = job.failedFiles;
    j["progress"] = job.progressPercentage();
    j["created_at"] = core::formatTimestamp(job.createdAt);
    j["updated_at"] = core::formatTimestamp(job.updatedAt);
    if (!job.errorMessage.empty()) {
        j["error"] = job.errorMessage;
    }
    j["errors"] = json::array();
    for (const auto& e : job.errors) {
        j["errors"].push_back({{"filename", e.filename},
                               {"kind", e.errorKind},
                               {"message", e.message},
                               {"at", core::formatTimestamp(e.occurredAt)}});
    }
    return j;
}

void printJob(const ingest::JobStatus& job) {
    std::cout << job.id << "  " << ingest::jobStateToString(job.state) << "  "
              << job.processedFiles << " ok, " << job.failedFiles << " failed of "
              << job.totalFiles << "  (" << core::formatTimestamp(job.createdAt) << ")\n";
    for (const auto& e : job.errors) {
        std::cout << "    " << e.filename << ": " << e.errorKind << ": " << e.message << "\n";
    }
    if (!job.errorMessage.empty()) {
        std::cout << "    job error: " << job.errorMessage << "\n";
    }
}

int report(const Error& error) {
    std::cerr << "Error: " << error.message << " (" << errorToString(error.code) << ")\n";
    return 1;
}

} // namespace

class VellumCli {
public:
    VellumCli() : app_("vellum-cli", "Per-project document knowledge base") {
        app_.require_subcommand(1);
        app_.add_option("-c,--config", configPath_, "Configuration file");
        app_.add_option("--log-level", logLevel_,
                        "trace, debug, info, warn, error, critical or off");
        setupProject();
        setupIngest();
        setupStatus();
        setupJobs();
        setupSearch();
        setupDocuments();
        setupRemove();
        setupPurge();
    }

    int run(int argc, char** argv) {
        try {
            app_.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return app_.exit(e);
        }
        if (!command_) {
            std::cout << app_.help() << std::endl;
            return 0;
        }

        auto loaded = config::VellumConfig::load(config::get_config_path(configPath_));
        if (!loaded) {
            return report(loaded.error());
        }
        config_ = std::move(loaded).value();
        if (!logLevel_.empty()) {
            config_.logging.level = logLevel_;
        }
        LoggingOptions logging;
        logging.level = config_.logging.level;
        logging.file = config_.logging.file;
        if (auto r = initLogging(logging); !r) {
            return report(r.error());
        }

        auto provider = app::createEmbeddingProvider(config_.embedding);
        if (!provider) {
            return report(provider.error());
        }
        auto scorer = app::createRelevanceScorer(config_.reranker);
        if (!scorer) {
            return report(scorer.error());
        }
        auto kb = app::KnowledgeBase::open(config_, provider.value(), scorer.value());
        if (!kb) {
            return report(kb.error());
        }
        kb_ = std::move(kb).value();

        int rc = command_();
        kb_->shutdown();
        return rc;
    }

private:
    void setupProject() {
        auto* project = app_.add_subcommand("project", "Manage projects");
        auto* add = project->add_subcommand("add", "Register a project");
        add->add_option("id", projectId_, "Project id")->required();
        add->add_option("--name", projectName_, "Display name");
        add->callback([this]() {
            command_ = [this]() {
                if (auto r = kb_->registerProject(projectId_, projectName_); !r)
                    return report(r.error());
                std::cout << "Project " << projectId_ << " registered\n";
                return 0;
            };
        });
        project->require_subcommand(1);
    }

    void setupIngest() {
        auto* ingest = app_.add_subcommand("ingest", "Upload files into a project");
        ingest->add_option("-p,--project", projectId_, "Project id")->required();
        ingest->add_option("-u,--user", userId_, "Submitting user");
        ingest->add_option("-t,--type", declaredType_, "Declared content type for all files");
        ingest->add_flag("-w,--wait", wait_, "Wait for the job to finish");
        ingest->add_option("--timeout", timeoutSeconds_, "Wait limit in seconds")
            ->default_val(600);
        ingest->add_option("files", files_, "Files to ingest")->required()->check(
            CLI::ExistingFile);
        ingest->callback([this]() { command_ = [this]() { return doIngest(); }; });
    }

    void setupStatus() {
        auto* status = app_.add_subcommand("status", "Show an ingestion job");
        status->add_option("job", jobId_, "Job id")->required();
        status->add_flag("--json", json_, "JSON output");
        status->callback([this]() {
            command_ = [this]() {
                auto job = kb_->getJobStatus(jobId_);
                if (!job)
                    return report(job.error());
                if (json_)
                    std::cout << jobToJson(job.value()).dump(2) << "\n";
                else
                    printJob(job.value());
                return 0;
            };
        });
    }

    void setupJobs() {
        auto* jobs = app_.add_subcommand("jobs", "List recent jobs");
        auto* byProject = jobs->add_option("-p,--project", projectId_, "Project id");
        jobs->add_option("-u,--user", userId_, "User id")->excludes(byProject);
        jobs->add_option("-n,--limit", limit_, "Maximum jobs")->default_val(20);
        jobs->add_flag("--json", json_, "JSON output");
        jobs->callback([this]() {
            command_ = [this]() {
                auto jobs = projectId_.empty() ? kb_->listJobsForUser(userId_, limit_)
                                               : kb_->listJobs(projectId_, limit_);
                if (!jobs)
                    return report(jobs.error());
                if (json_) {
                    json arr = json::array();
                    for (const auto& j : jobs.value())
                        arr.push_back(jobToJson(j));
                    std::cout << arr.dump(2) << "\n";
                } else {
                    for (const auto& j : jobs.value())
                        printJob(j);
                }
                return 0;
            };
        });
    }

    void setupSearch() {
        auto* search = app_.add_subcommand("search", "Query a project");
        search->add_option("-p,--project", projectId_, "Project id")->required();
        search->add_option("-k", k_, "Candidates retrieved (default retrieval.top_k)");
        search->add_option("-m", m_, "Results returned (default retrieval.top_m)");
        search->add_flag("--context", showContext_, "Print the assembled prompt context");
        search->add_flag("--json", json_, "JSON output");
        search->add_option("query", query_, "Query text")->required();
        search->callback([this]() { command_ = [this]() { return doSearch(); }; });
    }

    void setupDocuments() {
        auto* docs = app_.add_subcommand("documents", "List a project's documents");
        docs->add_option("-p,--project", projectId_, "Project id")->required();
        docs->callback([this]() {
            command_ = [this]() {
                auto docs = kb_->listDocuments(projectId_);
                if (!docs)
                    return report(docs.error());
                for (const auto& d : docs.value()) {
                    std::cout << d.id << "  " << vector::documentStatusToString(d.status) << "  "
                              << d.chunkCount << " chunks  " << d.filename << "  ("
                              << d.contentType << ")\n";
                    if (!d.error.empty())
                        std::cout << "    " << d.error << "\n";
                }
                return 0;
            };
        });
    }

    void setupRemove() {
        auto* rm = app_.add_subcommand("rm", "Delete a document and its chunks");
        rm->add_option("-p,--project", projectId_, "Project id")->required();
        rm->add_option("document", documentId_, "Document id")->required();
        rm->callback([this]() {
            command_ = [this]() {
                if (auto r = kb_->deleteDocument(projectId_, documentId_); !r)
                    return report(r.error());
                std::cout << "Deleted " << documentId_ << "\n";
                return 0;
            };
        });
    }

    void setupPurge() {
        auto* purge = app_.add_subcommand("purge-jobs", "Delete finished jobs");
        purge->add_option("--days", days_, "Minimum age in days")->default_val(30);
        purge->callback([this]() {
            command_ = [this]() {
                auto n = kb_->purgeOldJobs(std::chrono::hours(24) * days_);
                if (!n)
                    return report(n.error());
                std::cout << "Purged " << n.value() << " jobs\n";
                return 0;
            };
        });
    }

    int doIngest() {
        std::vector<app::UploadedFile> uploads;
        for (const auto& f : files_) {
            auto bytes = readFile(f);
            if (!bytes)
                return report(bytes.error());
            uploads.push_back(app::UploadedFile{std::filesystem::path(f).filename().string(),
                                                std::move(bytes).value(), declaredType_});
        }

        auto jobId = kb_->createIngestionJob(projectId_, userId_, std::move(uploads));
        if (!jobId)
            return report(jobId.error());
        std::cout << "Job " << jobId.value() << " submitted (" << files_.size() << " files)\n";
        if (!wait_)
            return 0;

        if (!kb_->waitForJob(jobId.value(), std::chrono::seconds(timeoutSeconds_))) {
            std::cerr << "Timed out waiting for job " << jobId.value() << "\n";
            return 2;
        }
        auto status = kb_->getJobStatus(jobId.value());
        if (!status)
            return report(status.error());
        printJob(status.value());
        return status.value().state == ingest::JobState::Completed ? 0 : 1;
    }

    int doSearch() {
        const size_t k = k_ ? k_ : config_.retrieval.topK;
        const size_t m = m_ ? m_ : std::min(config_.retrieval.topM, k);
        auto response = kb_->searchWithContext(projectId_, query_, k, m);
        if (!response)
            return report(response.error());
        const auto& r = response.value();

        if (json_) {
            json out;
            out["hits"] = json::array();
            for (const auto& h : r.hits) {
                json hit{{"chunk_id", h.chunkId},
                         {"document_id", h.documentId},
                         {"filename", h.source.filename},
                         {"chunk_index", h.source.chunkIndex},
                         {"start_offset", h.source.startOffset},
                         {"end_offset", h.source.endOffset},
                         {"score", h.score},
                         {"similarity", h.similarity},
                         {"text", h.text}};
                if (h.rerankScore)
                    hit["rerank_score"] = *h.rerankScore;
                out["hits"].push_back(std::move(hit));
            }
            out["reranked"] = !r.rerankFallback;
            if (showContext_)
                out["context"] = r.context.renderForPrompt();
            std::cout << out.dump(2) << "\n";
            return 0;
        }

        for (size_t i = 0; i < r.hits.size(); ++i) {
            const auto& h = r.hits[i];
            std::cout << i + 1 << ". " << h.source.filename << "#" << h.source.chunkIndex
                      << "  score=" << h.score << "\n   " << h.text.substr(0, 160) << "\n";
        }
        if (r.hits.empty())
            std::cout << "No results\n";
        if (showContext_)
            std::cout << "\n" << r.context.renderForPrompt() << "\n";
        return 0;
    }

    CLI::App app_;
    std::function<int()> command_;
    config::VellumConfig config_;
    std::unique_ptr<app::KnowledgeBase> kb_;

    std::string configPath_;
    std::string logLevel_;
    std::string projectId_;
    std::string projectName_;
    std::string userId_;
    std::string declaredType_;
    std::string jobId_;
    std::string documentId_;
    std::string query_;
    std::vector<std::string> files_;
    bool wait_ = false;
    bool json_ = false;
    bool showContext_ = false;
    int timeoutSeconds_ = 600;
    int days_ = 30;
    size_t limit_ = 20;
    size_t k_ = 0;
    size_t m_ = 0;
};

} // namespace vellum::cli

int main(int argc, char** argv) {
    std::signal(SIGPIPE, SIG_IGN);
    vellum::cli::VellumCli cli;
    return cli.run(argc, argv);
}
