#pragma once

#include <vellum/core/types.h>
#include <vellum/metadata/database.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vellum::vector {

enum class DocumentStatus { Pending, Ready, Failed };

const char* documentStatusToString(DocumentStatus status);
std::optional<DocumentStatus> parseDocumentStatus(const std::string& s);

struct DocumentRecord {
    DocumentId id;
    ProjectId projectId;
    JobId jobId;
    std::string filename;
    std::string contentType;
    DocumentStatus status = DocumentStatus::Pending;
    size_t chunkCount = 0;
    std::string error;
    bool deleted = false;
    TimePoint createdAt;
    TimePoint updatedAt;
};

/// A chunk ready to be written. `id` is generated when empty.
struct ChunkRecord {
    ChunkId id;
    size_t chunkIndex = 0;
    std::string content;
    size_t startOffset = 0;
    size_t contentOffset = 0;
    size_t endOffset = 0;
    Embedding embedding;
    std::map<std::string, std::string> metadata;
};

struct StoredChunk {
    ChunkId id;
    DocumentId documentId;
    ProjectId projectId;
    size_t chunkIndex = 0;
    std::string content;
    size_t startOffset = 0;
    size_t contentOffset = 0;
    size_t endOffset = 0;
    int64_t sequence = 0;
    std::map<std::string, std::string> metadata;
};

struct RetrievedChunk {
    size_t rank = 0; // 0-based position in distance order
    ChunkId chunkId;
    DocumentId documentId;
    ProjectId projectId;
    std::string filename;
    size_t chunkIndex = 0;
    std::string content;
    size_t startOffset = 0;
    size_t contentOffset = 0;
    size_t endOffset = 0;
    int64_t sequence = 0;
    double distance = 0.0;   // cosine distance, 1 - cos(a, b)
    double similarity = 0.0; // 1 - distance
};

/// SQL name of the registered distance function.
inline constexpr const char* kCosineDistanceFunction = "vellum_cosine_distance";

/// Registers the distance function on a connection; used as a ConnectionInitializer.
Result<void> registerVectorFunctions(metadata::Database& db);

/**
 * Chunk storage and project-scoped nearest-neighbour search over SQLite.
 *
 * Every query carries the project predicate. Embeddings are stored as raw
 * float32 blobs of one store-wide dimension, fixed by the first write.
 */
class VectorStore {
public:
    explicit VectorStore(std::shared_ptr<metadata::ConnectionManager> connections);

    Result<void> registerProject(const ProjectId& projectId, const std::string& name = "");
    Result<bool> hasProject(const ProjectId& projectId) const;

    /**
     * Writes all chunks of a document and marks it ready, in one transaction.
     * Fails with InvalidState when the document is unknown, owned by another
     * project, deleted, or already has chunks; InvalidArgument on a dimension
     * mismatch. Nothing is written on failure.
     */
    Result<void> appendDocumentChunks(const ProjectId& projectId, const DocumentId& documentId,
                                      const std::string& contentType,
                                      std::vector<ChunkRecord> chunks);

    /**
     * The k nearest chunks of `projectId`, ordered by distance then insertion.
     */
    Result<std::vector<RetrievedChunk>> searchNearest(const ProjectId& projectId,
                                                      const Embedding& query, size_t k) const;

    Result<DocumentRecord> getDocument(const ProjectId& projectId,
                                       const DocumentId& documentId) const;
    Result<std::vector<DocumentRecord>> listDocuments(const ProjectId& projectId,
                                                      bool includeDeleted = false) const;
    Result<std::vector<StoredChunk>> getDocumentChunks(const ProjectId& projectId,
                                                       const DocumentId& documentId) const;

    /// Flags the document deleted and removes its chunks.
    Result<void> deleteDocument(const ProjectId& projectId, const DocumentId& documentId);

    Result<size_t> chunkCount(const ProjectId& projectId) const;

    /// Dimension recorded by the first write, if any.
    Result<std::optional<size_t>> embeddingDimension() const;

private:
    Result<void> checkDimension(metadata::Database& db, size_t dimension);

    std::shared_ptr<metadata::ConnectionManager> connections_;
};

} // namespace vellum::vector
