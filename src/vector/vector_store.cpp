#include <vellum/core/ids.h>
#include <vellum/vector/embedding_provider.h>
#include <vellum/vector/vector_store.h>

#include <spdlog/spdlog.h>
#include <cmath>
#include <cstring>

namespace vellum::vector {

namespace {

constexpr const char* kDocumentColumns =
    "id, project_id, job_id, filename, content_type, status, chunk_count, error, deleted, "
    "created_at, updated_at";

int64_t nowSeconds() {
    return core::toUnixSeconds(std::chrono::system_clock::now());
}

std::span<const std::byte> asBytes(const Embedding& e) {
    return {reinterpret_cast<const std::byte*>(e.data()), e.size() * sizeof(float)};
}

void cosineDistance(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    if (argc != 2 || sqlite3_value_type(argv[0]) != SQLITE_BLOB ||
        sqlite3_value_type(argv[1]) != SQLITE_BLOB) {
        sqlite3_result_error(ctx, "vellum_cosine_distance expects two blobs", -1);
        return;
    }
    const auto* a = static_cast<const unsigned char*>(sqlite3_value_blob(argv[0]));
    int na = sqlite3_value_bytes(argv[0]);
    const auto* b = static_cast<const unsigned char*>(sqlite3_value_blob(argv[1]));
    int nb = sqlite3_value_bytes(argv[1]);
    if (na != nb || na <= 0 || na % static_cast<int>(sizeof(float)) != 0) {
        sqlite3_result_error(ctx, "vellum_cosine_distance: dimension mismatch", -1);
        return;
    }

    double dot = 0.0, normA = 0.0, normB = 0.0;
    const size_t n = static_cast<size_t>(na) / sizeof(float);
    for (size_t i = 0; i < n; ++i) {
        float x, y;
        std::memcpy(&x, a + i * sizeof(float), sizeof(float));
        std::memcpy(&y, b + i * sizeof(float), sizeof(float));
        dot += static_cast<double>(x) * y;
        normA += static_cast<double>(x) * x;
        normB += static_cast<double>(y) * y;
    }
    if (normA <= 0.0 || normB <= 0.0) {
        sqlite3_result_double(ctx, 1.0);
        return;
    }
    sqlite3_result_double(ctx, 1.0 - dot / (std::sqrt(normA) * std::sqrt(normB)));
}

DocumentRecord readDocument(const metadata::Statement& stmt) {
    DocumentRecord doc;
    doc.id = stmt.getString(0);
    doc.projectId = stmt.getString(1);
    doc.jobId = stmt.getString(2);
    doc.filename = stmt.getString(3);
    doc.contentType = stmt.getString(4);
    doc.status = parseDocumentStatus(stmt.getString(5)).value_or(DocumentStatus::Pending);
    doc.chunkCount = static_cast<size_t>(stmt.getInt64(6));
    doc.error = stmt.getString(7);
    doc.deleted = stmt.getInt(8) != 0;
    doc.createdAt = core::fromUnixSeconds(stmt.getInt64(9));
    doc.updatedAt = core::fromUnixSeconds(stmt.getInt64(10));
    return doc;
}

} // namespace

const char* documentStatusToString(DocumentStatus status) {
    switch (status) {
        case DocumentStatus::Pending: return "pending";
        case DocumentStatus::Ready: return "ready";
        case DocumentStatus::Failed: return "failed";
    }
    return "pending";
}

std::optional<DocumentStatus> parseDocumentStatus(const std::string& s) {
    if (s == "pending")
        return DocumentStatus::Pending;
    if (s == "ready")
        return DocumentStatus::Ready;
    if (s == "failed")
        return DocumentStatus::Failed;
    return std::nullopt;
}

Result<void> registerVectorFunctions(metadata::Database& db) {
    return db.registerScalarFunction(kCosineDistanceFunction, 2, &cosineDistance);
}

VectorStore::VectorStore(std::shared_ptr<metadata::ConnectionManager> connections)
    : connections_(std::move(connections)) {}

Result<void> VectorStore::registerProject(const ProjectId& projectId, const std::string& name) {
    if (projectId.empty()) {
        return Error{ErrorCode::InvalidArgument, "Project id must not be empty"};
    }
    return connections_->withWriter([&](metadata::Database& db) -> Result<void> {
        auto stmt = db.prepare("INSERT INTO projects(id, name, created_at) VALUES (?, ?, ?) "
                               "ON CONFLICT(id) DO UPDATE SET name = excluded.name "
                               "WHERE excluded.name <> ''");
        if (!stmt)
            return stmt.error();
        if (auto b = stmt.value().bindAll(projectId, name, nowSeconds()); !b)
            return b;
        return stmt.value().execute();
    });
}

Result<bool> VectorStore::hasProject(const ProjectId& projectId) const {
    auto db = connections_->openReader();
    if (!db)
        return db.error();
    auto stmt = db.value().prepare("SELECT 1 FROM projects WHERE id = ?");
    if (!stmt)
        return stmt.error();
    if (auto b = stmt.value().bind(1, projectId); !b)
        return b.error();
    return stmt.value().step();
}

Result<void> VectorStore::checkDimension(metadata::Database& db, size_t dimension) {
    auto select = db.prepare("SELECT value FROM store_meta WHERE key = 'embedding_dim'");
    if (!select)
        return select.error();
    auto row = select.value().step();
    if (!row)
        return row.error();

    if (!row.value()) {
        auto insert =
            db.prepare("INSERT INTO store_meta(key, value) VALUES ('embedding_dim', ?)");
        if (!insert)
            return insert.error();
        if (auto b = insert.value().bind(1, std::to_string(dimension)); !b)
            return b;
        spdlog::info("[VectorStore] embedding dimension fixed at {}", dimension);
        return insert.value().execute();
    }

    auto stored = select.value().getString(0);
    if (stored != std::to_string(dimension)) {
        return Error{ErrorCode::InvalidArgument, "Embedding dimension " +
                                                     std::to_string(dimension) +
                                                     " does not match stored dimension " + stored};
    }
    return {};
}

Result<void> VectorStore::appendDocumentChunks(const ProjectId& projectId,
                                               const DocumentId& documentId,
                                               const std::string& contentType,
                                               std::vector<ChunkRecord> chunks) {
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].chunkIndex != i) {
            return Error{ErrorCode::InvalidArgument, "Chunk indices must be contiguous from 0"};
        }
        if (chunks[i].embedding.empty() ||
            chunks[i].embedding.size() != chunks.front().embedding.size()) {
            return Error{ErrorCode::InvalidArgument, "Chunk embeddings must share one dimension"};
        }
        if (chunks[i].id.empty()) {
            chunks[i].id = core::generateUUID();
        }
    }

    return connections_->withWriter([&](metadata::Database& db) -> Result<void> {
        return db.transaction([&]() -> Result<void> {
            auto doc = db.prepare("SELECT project_id, deleted, "
                                  "(SELECT COUNT(*) FROM chunks WHERE document_id = ?1) "
                                  "FROM documents WHERE id = ?1");
            if (!doc)
                return doc.error();
            if (auto b = doc.value().bind(1, documentId); !b)
                return b;
            auto found = doc.value().step();
            if (!found)
                return found.error();
            if (!found.value() || doc.value().getString(0) != projectId) {
                return Error{ErrorCode::InvalidState,
                             "Document " + documentId + " is not registered in project " +
                                 projectId};
            }
            if (doc.value().getInt(1) != 0) {
                return Error{ErrorCode::InvalidState, "Document " + documentId + " was deleted"};
            }
            if (doc.value().getInt64(2) != 0) {
                return Error{ErrorCode::InvalidState,
                             "Document " + documentId + " already has chunks"};
            }

            if (!chunks.empty()) {
                if (auto r = checkDimension(db, chunks.front().embedding.size()); !r)
                    return r;
            }

            auto insertChunk = db.prepare(
                "INSERT INTO chunks(id, document_id, project_id, chunk_index, content, "
                "start_offset, content_offset, end_offset, embedding) "
                "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
            if (!insertChunk)
                return insertChunk.error();
            auto insertMeta =
                db.prepare("INSERT INTO chunk_metadata(chunk_seq, key, value) VALUES (?, ?, ?)");
            if (!insertMeta)
                return insertMeta.error();

            auto& chunkStmt = insertChunk.value();
            auto& metaStmt = insertMeta.value();
            for (const auto& c : chunks) {
                if (auto r = chunkStmt.reset(); !r)
                    return r;
                if (auto b = chunkStmt.bindAll(c.id, documentId, projectId, c.chunkIndex,
                                               c.content, c.startOffset, c.contentOffset,
                                               c.endOffset, asBytes(c.embedding));
                    !b)
                    return b;
                if (auto e = chunkStmt.execute(); !e)
                    return e;

                const int64_t seq = db.lastInsertRowId();
                for (const auto& [key, value] : c.metadata) {
                    if (auto r = metaStmt.reset(); !r)
                        return r;
                    if (auto b = metaStmt.bindAll(seq, key, value); !b)
                        return b;
                    if (auto e = metaStmt.execute(); !e)
                        return e;
                }
            }

            auto update = db.prepare("UPDATE documents SET status = 'ready', chunk_count = ?, "
                                     "content_type = ?, error = NULL, updated_at = ? "
                                     "WHERE id = ?");
            if (!update)
                return update.error();
            if (auto b =
                    update.value().bindAll(chunks.size(), contentType, nowSeconds(), documentId);
                !b)
                return b;
            return update.value().execute();
        });
    });
}

Result<std::vector<RetrievedChunk>> VectorStore::searchNearest(const ProjectId& projectId,
                                                               const Embedding& query,
                                                               size_t k) const {
    if (k == 0) {
        return Error{ErrorCode::InvalidArgument, "k must be positive"};
    }
    if (query.empty()) {
        return Error{ErrorCode::InvalidArgument, "Query embedding is empty"};
    }

    auto dim = embeddingDimension();
    if (!dim)
        return dim.error();
    if (!dim.value()) {
        return std::vector<RetrievedChunk>{}; // nothing stored yet
    }
    if (*dim.value() != query.size()) {
        return Error{ErrorCode::InvalidArgument, "Query dimension " + std::to_string(query.size()) +
                                                     " does not match stored dimension " +
                                                     std::to_string(*dim.value())};
    }

    Embedding normalized = query;
    if (!embedding_utils::normalizeEmbedding(normalized)) {
        return Error{ErrorCode::InvalidArgument, "Query embedding is zero or not finite"};
    }

    auto db = connections_->openReader();
    if (!db)
        return db.error();

    // The project predicate is part of the scan; ties resolve by insertion order
    auto stmt = db.value().prepare(
        std::string("SELECT c.id, c.document_id, d.project_id, d.filename, c.chunk_index, "
                    "c.content, c.start_offset, c.content_offset, c.end_offset, c.seq, ") +
        kCosineDistanceFunction +
        "(c.embedding, ?1) AS distance "
        "FROM chunks c JOIN documents d ON d.id = c.document_id "
        "WHERE c.project_id = ?2 AND d.project_id = ?2 AND d.deleted = 0 "
        "ORDER BY distance ASC, c.seq ASC LIMIT ?3");
    if (!stmt)
        return stmt.error();
    auto& s = stmt.value();
    if (auto b = s.bind(1, asBytes(normalized)); !b)
        return b.error();
    if (auto b = s.bind(2, projectId); !b)
        return b.error();
    if (auto b = s.bind(3, k); !b)
        return b.error();

    std::vector<RetrievedChunk> out;
    while (true) {
        auto row = s.step();
        if (!row)
            return row.error();
        if (!row.value())
            break;

        RetrievedChunk c;
        c.rank = out.size();
        c.chunkId = s.getString(0);
        c.documentId = s.getString(1);
        c.projectId = s.getString(2);
        c.filename = s.getString(3);
        c.chunkIndex = static_cast<size_t>(s.getInt64(4));
        c.content = s.getString(5);
        c.startOffset = static_cast<size_t>(s.getInt64(6));
        c.contentOffset = static_cast<size_t>(s.getInt64(7));
        c.endOffset = static_cast<size_t>(s.getInt64(8));
        c.sequence = s.getInt64(9);
        c.distance = s.getDouble(10);
        c.similarity = 1.0 - c.distance;

        if (c.projectId != projectId) {
            spdlog::critical("[VectorStore] search for project '{}' produced chunk {} of project "
                             "'{}'",
                             projectId, c.chunkId, c.projectId);
            return Error{ErrorCode::TenantIsolationViolation,
                         "Search result crossed project boundary"};
        }
        out.push_back(std::move(c));
    }
    return out;
}

Result<DocumentRecord> VectorStore::getDocument(const ProjectId& projectId,
                                                const DocumentId& documentId) const {
    auto db = connections_->openReader();
    if (!db)
        return db.error();
    auto stmt = db.value().prepare(std::string("SELECT ") + kDocumentColumns +
                                   " FROM documents WHERE id = ? AND project_id = ?");
    if (!stmt)
        return stmt.error();
    if (auto b = stmt.value().bindAll(documentId, projectId); !b)
        return b.error();
    auto row = stmt.value().step();
    if (!row)
        return row.error();
    if (!row.value()) {
        return Error{ErrorCode::NotFound, "Document " + documentId + " not found"};
    }
    return readDocument(stmt.value());
}

Result<std::vector<DocumentRecord>> VectorStore::listDocuments(const ProjectId& projectId,
                                                               bool includeDeleted) const {
    auto db = connections_->openReader();
    if (!db)
        return db.error();
    std::string sql = std::string("SELECT ") + kDocumentColumns +
                      " FROM documents WHERE project_id = ?" +
                      (includeDeleted ? "" : " AND deleted = 0") + " ORDER BY created_at, rowid";
    auto stmt = db.value().prepare(sql);
    if (!stmt)
        return stmt.error();
    if (auto b = stmt.value().bind(1, projectId); !b)
        return b.error();

    std::vector<DocumentRecord> docs;
    while (true) {
        auto row = stmt.value().step();
        if (!row)
            return row.error();
        if (!row.value())
            break;
        docs.push_back(readDocument(stmt.value()));
    }
    return docs;
}

Result<std::vector<StoredChunk>> VectorStore::getDocumentChunks(const ProjectId& projectId,
                                                                const DocumentId& documentId) const {
    auto db = connections_->openReader();
    if (!db)
        return db.error();
    auto stmt = db.value().prepare(
        "SELECT c.id, c.document_id, c.project_id, c.chunk_index, c.content, c.start_offset, "
        "c.content_offset, c.end_offset, c.seq FROM chunks c "
        "WHERE c.document_id = ? AND c.project_id = ? ORDER BY c.chunk_index");
    if (!stmt)
        return stmt.error();
    if (auto b = stmt.value().bindAll(documentId, projectId); !b)
        return b.error();

    auto meta = db.value().prepare("SELECT key, value FROM chunk_metadata WHERE chunk_seq = ?");
    if (!meta)
        return meta.error();

    std::vector<StoredChunk> chunks;
    auto& s = stmt.value();
    while (true) {
        auto row = s.step();
        if (!row)
            return row.error();
        if (!row.value())
            break;
        StoredChunk c;
        c.id = s.getString(0);
        c.documentId = s.getString(1);
        c.projectId = s.getString(2);
        c.chunkIndex = static_cast<size_t>(s.getInt64(3));
        c.content = s.getString(4);
        c.startOffset = static_cast<size_t>(s.getInt64(5));
        c.contentOffset = static_cast<size_t>(s.getInt64(6));
        c.endOffset = static_cast<size_t>(s.getInt64(7));
        c.sequence = s.getInt64(8);

        auto& m = meta.value();
        if (auto r = m.reset(); !r)
            return r.error();
        if (auto b = m.bind(1, c.sequence); !b)
            return b.error();
        while (true) {
            auto mrow = m.step();
            if (!mrow)
                return mrow.error();
            if (!mrow.value())
                break;
            c.metadata[m.getString(0)] = m.getString(1);
        }
        chunks.push_back(std::move(c));
    }
    return chunks;
}

Result<void> VectorStore::deleteDocument(const ProjectId& projectId,
                                         const DocumentId& documentId) {
    return connections_->withWriter([&](metadata::Database& db) -> Result<void> {
        return db.transaction([&]() -> Result<void> {
            auto mark = db.prepare("UPDATE documents SET deleted = 1, updated_at = ? "
                                   "WHERE id = ? AND project_id = ? AND deleted = 0");
            if (!mark)
                return mark.error();
            if (auto b = mark.value().bindAll(nowSeconds(), documentId, projectId); !b)
                return b;
            if (auto e = mark.value().execute(); !e)
                return e;
            if (db.changes() == 0) {
                return Error{ErrorCode::NotFound, "Document " + documentId + " not found"};
            }

            auto purge = db.prepare("DELETE FROM chunks WHERE document_id = ?");
            if (!purge)
                return purge.error();
            if (auto b = purge.value().bind(1, documentId); !b)
                return b;
            if (auto e = purge.value().execute(); !e)
                return e;
            spdlog::info("[VectorStore] deleted document {} ({} chunks)", documentId,
                         db.changes());
            return {};
        });
    });
}

Result<size_t> VectorStore::chunkCount(const ProjectId& projectId) const {
    auto db = connections_->openReader();
    if (!db)
        return db.error();
    auto stmt = db.value().prepare("SELECT COUNT(*) FROM chunks WHERE project_id = ?");
    if (!stmt)
        return stmt.error();
    if (auto b = stmt.value().bind(1, projectId); !b)
        return b.error();
    auto row = stmt.value().step();
    if (!row)
        return row.error();
    return static_cast<size_t>(stmt.value().getInt64(0));
}

Result<std::optional<size_t>> VectorStore::embeddingDimension() const {
    auto db = connections_->openReader();
    if (!db)
        return db.error();
    auto stmt = db.value().prepare("SELECT value FROM store_meta WHERE key = 'embedding_dim'");
    if (!stmt)
        return stmt.error();
    auto row = stmt.value().step();
    if (!row)
        return row.error();
    if (!row.value())
        return std::optional<size_t>{};
    return std::optional<size_t>{static_cast<size_t>(std::stoull(stmt.value().getString(0)))};
}

} // namespace vellum::vector
