#include <vellum/metadata/schema.h>

#include <spdlog/spdlog.h>

namespace vellum::metadata {

namespace {

constexpr const char* kSchemaSql = R"SQL(
CREATE TABLE IF NOT EXISTS schema_info (
    version INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS projects (
    id TEXT PRIMARY KEY,
    name TEXT NOT NULL DEFAULT '',
    created_at INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS documents (
    id TEXT PRIMARY KEY,
    project_id TEXT NOT NULL REFERENCES projects(id),
    job_id TEXT,
    filename TEXT NOT NULL,
    content_type TEXT NOT NULL DEFAULT '',
    status TEXT NOT NULL DEFAULT 'pending'
        CHECK (status IN ('pending', 'ready', 'failed')),
    chunk_count INTEGER NOT NULL DEFAULT 0,
    error TEXT,
    deleted INTEGER NOT NULL DEFAULT 0,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_documents_project ON documents(project_id);
CREATE INDEX IF NOT EXISTS idx_documents_job ON documents(job_id);

-- seq is the insertion order used to break distance ties
CREATE TABLE IF NOT EXISTS chunks (
    seq INTEGER PRIMARY KEY AUTOINCREMENT,
    id TEXT NOT NULL UNIQUE,
    document_id TEXT NOT NULL REFERENCES documents(id) ON DELETE CASCADE,
    project_id TEXT NOT NULL,
    chunk_index INTEGER NOT NULL,
    content TEXT NOT NULL,
    start_offset INTEGER NOT NULL,
    content_offset INTEGER NOT NULL,
    end_offset INTEGER NOT NULL,
    embedding BLOB NOT NULL,
    UNIQUE (document_id, chunk_index)
);
CREATE INDEX IF NOT EXISTS idx_chunks_project ON chunks(project_id, seq);

CREATE TABLE IF NOT EXISTS chunk_metadata (
    chunk_seq INTEGER NOT NULL REFERENCES chunks(seq) ON DELETE CASCADE,
    key TEXT NOT NULL,
    value TEXT NOT NULL,
    PRIMARY KEY (chunk_seq, key)
);

CREATE TABLE IF NOT EXISTS store_meta (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS ingestion_jobs (
    id TEXT PRIMARY KEY,
    project_id TEXT NOT NULL REFERENCES projects(id),
    user_id TEXT NOT NULL DEFAULT '',
    status TEXT NOT NULL
        CHECK (status IN ('pending', 'processing', 'completed', 'failed')),
    total_files INTEGER NOT NULL CHECK (total_files >= 0),
    processed_files INTEGER NOT NULL DEFAULT 0,
    failed_files INTEGER NOT NULL DEFAULT 0,
    error_message TEXT,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL,
    CHECK (processed_files + failed_files <= total_files)
);
CREATE INDEX IF NOT EXISTS idx_jobs_project ON ingestion_jobs(project_id, created_at);
CREATE INDEX IF NOT EXISTS idx_jobs_user ON ingestion_jobs(user_id, created_at);

CREATE TABLE IF NOT EXISTS job_file_errors (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    job_id TEXT NOT NULL REFERENCES ingestion_jobs(id) ON DELETE CASCADE,
    filename TEXT NOT NULL,
    error_kind TEXT NOT NULL,
    message TEXT NOT NULL,
    occurred_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_job_errors_job ON job_file_errors(job_id);
)SQL";

} // namespace

Result<void> initializeSchema(Database& db) {
    return db.transaction([&]() -> Result<void> {
        if (auto r = db.execute(kSchemaSql); !r) {
            return r;
        }

        auto stmt = db.prepare("SELECT version FROM schema_info LIMIT 1");
        if (!stmt)
            return stmt.error();
        auto row = stmt.value().step();
        if (!row)
            return row.error();
        if (!row.value()) {
            auto insert = db.prepare("INSERT INTO schema_info(version) VALUES (?)");
            if (!insert)
                return insert.error();
            if (auto b = insert.value().bind(1, kSchemaVersion); !b)
                return b;
            if (auto e = insert.value().execute(); !e)
                return e;
            spdlog::info("[Schema] initialized version {}", kSchemaVersion);
            return {};
        }

        int version = stmt.value().getInt(0);
        if (version > kSchemaVersion) {
            return Error{ErrorCode::InvalidState,
                         "Database schema version " + std::to_string(version) +
                             " is newer than supported version " +
                             std::to_string(kSchemaVersion)};
        }
        return {};
    });
}

} // namespace vellum::metadata
