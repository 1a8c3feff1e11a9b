#pragma once

#include <vellum/core/types.h>
#include <vellum/search/reranker.h>

#include <string>
#include <string_view>
#include <vector>

namespace vellum::search {

struct ContextEntry {
    size_t rank = 0; // 1-based position in the assembled context
    ChunkId chunkId;
    DocumentId documentId;
    std::string filename;
    size_t chunkIndex = 0;
    size_t startOffset = 0;
    size_t endOffset = 0;
    std::string text;
    double score = 0.0;
    bool truncated = false;
};

struct AssembledContext {
    std::vector<ContextEntry> entries;
    size_t totalChars = 0;
    bool truncated = false; // an entry was cut or later chunks were dropped

    /// "[n] filename#index" headers followed by the text, entries separated by a blank line.
    std::string renderForPrompt() const;
};

/// Packs ranked chunks into a budget of `maxChars` bytes of chunk text.
class ContextAssembler {
public:
    explicit ContextAssembler(size_t maxChars);

    AssembledContext assemble(const std::vector<RankedChunk>& ranked) const;

    size_t maxChars() const { return maxChars_; }

    /// Longest prefix of `text` within `limit` bytes, preferring a whitespace cut.
    static size_t truncationPoint(std::string_view text, size_t limit);

private:
    size_t maxChars_;
};

} // namespace vellum::search
