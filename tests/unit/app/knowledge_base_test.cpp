#include <gtest/gtest.h>
#include <vellum/app/knowledge_base.h>
#include <vellum/extraction/content_type.h>
#include <vellum/metadata/schema.h>

#include "common/test_helpers.h"

#include <type_traits>

using namespace vellum;
using namespace std::chrono_literals;

namespace {

app::UploadedFile textFile(const std::string& name, const std::string& text,
                           const std::string& type = "text/plain") {
    return app::UploadedFile{name, tests::to_bytes(text), type};
}

} // namespace

class KnowledgeBaseTest : public ::testing::Test {
protected:
    void SetUp() override { config_ = tests::make_test_config(dir_.path()); }

    std::unique_ptr<app::KnowledgeBase> openKb() {
        auto kb = app::KnowledgeBase::open(
            config_, std::make_shared<vector::MockEmbeddingProvider>(32, 8));
        EXPECT_TRUE(kb) << kb.error().message;
        return kb ? std::move(kb).value() : nullptr;
    }

    tests::TempDir dir_;
    config::VellumConfig config_;
};

TEST_F(KnowledgeBaseTest, OnlyOpenConstructs) {
    static_assert(!std::is_default_constructible_v<app::KnowledgeBase>);
    static_assert(!std::is_copy_constructible_v<app::KnowledgeBase>);

    auto kb = openKb();
    ASSERT_TRUE(kb);
    EXPECT_EQ(kb->config().storage.dataDir, config_.storage.dataDir);
}

TEST_F(KnowledgeBaseTest, OpenRejectsMissingProvider) {
    auto kb = app::KnowledgeBase::open(config_, nullptr);
    ASSERT_FALSE(kb);
    EXPECT_EQ(kb.error().code, ErrorCode::InvalidArgument);
}

TEST_F(KnowledgeBaseTest, OpenRejectsInvalidConfig) {
    config_.chunking.chunkOverlap = config_.chunking.chunkSize;
    auto kb = app::KnowledgeBase::open(config_,
                                       std::make_shared<vector::MockEmbeddingProvider>(32, 8));
    ASSERT_FALSE(kb);
    EXPECT_EQ(kb.error().code, ErrorCode::InvalidArgument);
}

TEST_F(KnowledgeBaseTest, IngestThenSearch) {
    auto kb = openKb();
    ASSERT_TRUE(kb);
    ASSERT_TRUE(kb->registerProject("acme", "Acme Corp"));

    const std::string revenue = "Quarterly revenue grew by twelve percent in the northern region.";
    const std::string hiring = "The hiring plan adds four engineers to the platform team.";
    std::vector<app::UploadedFile> files;
    files.push_back(textFile("revenue.txt", revenue));
    files.push_back(textFile("hiring.md", hiring, "text/markdown"));
    files.push_back(textFile("report.docx", std::string("PK\x03\x04", 4) + "word/document.xml",
                             std::string(extraction::kDocx)));

    auto jobId = kb->createIngestionJob("acme", "user-1", std::move(files));
    ASSERT_TRUE(jobId) << jobId.error().message;
    ASSERT_TRUE(kb->waitForJob(jobId.value(), 10s));

    auto status = kb->getJobStatus(jobId.value());
    ASSERT_TRUE(status);
    EXPECT_EQ(status.value().state, ingest::JobState::Completed);
    EXPECT_EQ(status.value().projectId, "acme");
    EXPECT_EQ(status.value().userId, "user-1");
    EXPECT_EQ(status.value().totalFiles, 3u);
    EXPECT_EQ(status.value().processedFiles, 2u);
    EXPECT_EQ(status.value().failedFiles, 1u);
    ASSERT_EQ(status.value().errors.size(), 1u);
    EXPECT_EQ(status.value().errors[0].filename, "report.docx");
    EXPECT_EQ(status.value().errors[0].errorKind, "UnsupportedFormatError");
    EXPECT_DOUBLE_EQ(status.value().progressPercentage(), 100.0);

    auto hits = kb->search("acme", revenue, 5, 2);
    ASSERT_TRUE(hits) << hits.error().message;
    ASSERT_FALSE(hits.value().empty());
    EXPECT_LE(hits.value().size(), 2u);
    EXPECT_EQ(hits.value()[0].source.filename, "revenue.txt");
    EXPECT_EQ(hits.value()[0].text, revenue);

    auto response = kb->searchWithContext("acme", hiring, 5, 2);
    ASSERT_TRUE(response);
    ASSERT_FALSE(response.value().hits.empty());
    EXPECT_EQ(response.value().hits[0].source.filename, "hiring.md");
    EXPECT_TRUE(response.value().rerankFallback);
    EXPECT_NE(response.value().context.renderForPrompt().find(hiring), std::string::npos);

    auto defaults = kb->search("acme", "engineers");
    ASSERT_TRUE(defaults);
    EXPECT_LE(defaults.value().size(), config_.retrieval.topM);
}

TEST_F(KnowledgeBaseTest, CreateIngestionJobValidation) {
    auto kb = openKb();
    ASSERT_TRUE(kb);
    ASSERT_TRUE(kb->registerProject("acme"));

    std::vector<app::UploadedFile> one;
    one.push_back(textFile("a.txt", "text"));
    auto noProject = kb->createIngestionJob("", "u", one);
    ASSERT_FALSE(noProject);
    EXPECT_EQ(noProject.error().code, ErrorCode::InvalidArgument);

    auto noFiles = kb->createIngestionJob("acme", "u", {});
    ASSERT_FALSE(noFiles);
    EXPECT_EQ(noFiles.error().code, ErrorCode::InvalidArgument);

    std::vector<app::UploadedFile> unnamed;
    unnamed.push_back(textFile("", "text"));
    auto noName = kb->createIngestionJob("acme", "u", std::move(unnamed));
    ASSERT_FALSE(noName);
    EXPECT_EQ(noName.error().code, ErrorCode::InvalidArgument);

    auto unknown = kb->createIngestionJob("ghost", "u", one);
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::ProjectNotFound);

    auto jobs = kb->listJobs("acme");
    ASSERT_TRUE(jobs);
    EXPECT_TRUE(jobs.value().empty());
}

TEST_F(KnowledgeBaseTest, UnknownJobAndProject) {
    auto kb = openKb();
    ASSERT_TRUE(kb);

    auto status = kb->getJobStatus("no-such-job");
    ASSERT_FALSE(status);
    EXPECT_EQ(status.error().code, ErrorCode::JobNotFound);

    auto docs = kb->listDocuments("ghost");
    ASSERT_FALSE(docs);
    EXPECT_EQ(docs.error().code, ErrorCode::ProjectNotFound);

    auto hits = kb->search("ghost", "anything", 5, 3);
    ASSERT_FALSE(hits);
    EXPECT_EQ(hits.error().code, ErrorCode::ProjectNotFound);
}

TEST_F(KnowledgeBaseTest, DeletedDocumentsLeaveResults) {
    auto kb = openKb();
    ASSERT_TRUE(kb);
    ASSERT_TRUE(kb->registerProject("acme"));

    const std::string text = "Warehouse inventory is counted every Friday afternoon.";
    std::vector<app::UploadedFile> files;
    files.push_back(textFile("inventory.txt", text));
    auto jobId = kb->createIngestionJob("acme", "u", std::move(files));
    ASSERT_TRUE(jobId);
    ASSERT_TRUE(kb->waitForJob(jobId.value(), 10s));

    auto docs = kb->listDocuments("acme");
    ASSERT_TRUE(docs);
    ASSERT_EQ(docs.value().size(), 1u);
    EXPECT_EQ(docs.value()[0].status, vector::DocumentStatus::Ready);
    EXPECT_EQ(docs.value()[0].jobId, jobId.value());
    EXPECT_GE(docs.value()[0].chunkCount, 1u);

    ASSERT_TRUE(kb->deleteDocument("acme", docs.value()[0].id));

    auto after = kb->listDocuments("acme");
    ASSERT_TRUE(after);
    EXPECT_TRUE(after.value().empty());

    auto hits = kb->search("acme", text, 5, 3);
    ASSERT_TRUE(hits);
    EXPECT_TRUE(hits.value().empty());
}

TEST_F(KnowledgeBaseTest, ListAndPurgeJobs) {
    auto kb = openKb();
    ASSERT_TRUE(kb);
    ASSERT_TRUE(kb->registerProject("acme"));

    std::vector<JobId> ids;
    for (int i = 0; i < 2; ++i) {
        std::vector<app::UploadedFile> files;
        files.push_back(textFile("f" + std::to_string(i) + ".txt", "content " + std::to_string(i)));
        auto jobId = kb->createIngestionJob("acme", "owner", std::move(files));
        ASSERT_TRUE(jobId);
        ASSERT_TRUE(kb->waitForJob(jobId.value(), 10s));
        ids.push_back(jobId.value());
    }

    auto byProject = kb->listJobs("acme");
    ASSERT_TRUE(byProject);
    EXPECT_EQ(byProject.value().size(), 2u);
    auto byUser = kb->listJobsForUser("owner");
    ASSERT_TRUE(byUser);
    EXPECT_EQ(byUser.value().size(), 2u);

    auto purged = kb->purgeOldJobs(0s);
    ASSERT_TRUE(purged);
    EXPECT_EQ(purged.value(), 2u);

    auto gone = kb->getJobStatus(ids[0]);
    ASSERT_FALSE(gone);
    EXPECT_EQ(gone.error().code, ErrorCode::JobNotFound);
}

TEST_F(KnowledgeBaseTest, UnfinishedJobsFailOnReopen) {
    JobId stranded;
    {
        auto dbPath = config_.storage.databasePath();
        std::filesystem::create_directories(dbPath.parent_path());
        auto cm = metadata::ConnectionManager::open(dbPath.string(),
                                                    {vector::registerVectorFunctions});
        ASSERT_TRUE(cm) << cm.error().message;
        ASSERT_TRUE(cm.value()->withWriter(
            [](metadata::Database& db) { return metadata::initializeSchema(db); }));
        vector::VectorStore store(cm.value());
        ASSERT_TRUE(store.registerProject("acme"));
        ingest::JobTracker tracker(cm.value());
        auto jobId = tracker.createJob("acme", "u", {ingest::JobFile{"doc-1", "a.txt", "text/plain"}});
        ASSERT_TRUE(jobId);
        stranded = jobId.value();
    }

    auto kb = openKb();
    ASSERT_TRUE(kb);
    auto status = kb->getJobStatus(stranded);
    ASSERT_TRUE(status);
    EXPECT_EQ(status.value().state, ingest::JobState::Failed);
    EXPECT_EQ(status.value().errorMessage, "interrupted by restart");
    EXPECT_EQ(status.value().failedFiles, 1u);
}

TEST_F(KnowledgeBaseTest, ShutdownRejectsNewJobs) {
    auto kb = openKb();
    ASSERT_TRUE(kb);
    ASSERT_TRUE(kb->registerProject("acme"));
    kb->shutdown();

    std::vector<app::UploadedFile> files;
    files.push_back(textFile("late.txt", "too late"));
    auto jobId = kb->createIngestionJob("acme", "u", std::move(files));
    ASSERT_FALSE(jobId);
    EXPECT_EQ(jobId.error().code, ErrorCode::InvalidState);
}
