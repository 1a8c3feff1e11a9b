#pragma once

#include <vellum/core/types.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace vellum::chunking {

/**
 * Configuration for recursive chunking. Lengths are UTF-8 bytes.
 */
struct ChunkingConfig {
    size_t chunk_size = 1000; // L: upper bound of every chunk, overlap included
    size_t chunk_overlap = 200; // O: bytes of source text repeated from the previous chunk

    // Coarsest first. The empty separator means "any code point boundary" and is
    // always tried last, even when omitted here.
    std::vector<std::string> separators = {"\n\n", "\n", ". ", "? ", "! ", " ", ""};
};

/**
 * One passage. The source span is [start_offset, end_offset); the part before
 * content_offset repeats the tail of the previous chunk.
 */
struct TextChunk {
    size_t chunk_index = 0;
    std::string content;
    size_t start_offset = 0;
    size_t content_offset = 0;
    size_t end_offset = 0;

    size_t overlapLength() const { return content_offset - start_offset; }
};

/**
 * Recursive separator splitter.
 *
 * The text is first cut into contiguous, non-overlapping segments. Pieces
 * produced by the coarsest separator are packed greedily into the current
 * segment; a piece that cannot fit even alone is split again with the next
 * separator, down to code point boundaries. The first segment may hold L
 * bytes, later ones L - O so that the overlap prefix keeps chunks within L.
 * Output is a pure function of (text, config).
 */
class TextChunker {
public:
    explicit TextChunker(ChunkingConfig config = {});

    /// InvalidArgument when chunk_size is 0 or chunk_overlap >= chunk_size.
    Result<std::vector<TextChunk>> chunk(std::string_view text) const;

    const ChunkingConfig& config() const { return config_; }

    static Result<void> validate(const ChunkingConfig& config);

private:
    struct Span {
        size_t begin;
        size_t end;
        size_t size() const { return end - begin; }
    };

    class SegmentBuilder;

    ChunkingConfig config_;
};

} // namespace vellum::chunking
