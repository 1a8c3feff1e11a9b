#include <vellum/chunking/text_chunker.h>
#include <vellum/core/utf8.h>

#include <spdlog/spdlog.h>
#include <algorithm>

namespace vellum::chunking {

class TextChunker::SegmentBuilder {
public:
    SegmentBuilder(std::string_view text, const ChunkingConfig& config)
        : text_(text), config_(config) {}

    std::vector<Span> build() {
        addRange(0, text_.size(), 0);
        flush();
        return std::move(segments_);
    }

private:
    size_t budget() const {
        return segments_.empty() ? config_.chunk_size : config_.chunk_size - config_.chunk_overlap;
    }

    size_t currentSize() const { return cur_.end - cur_.begin; }

    void flush() {
        if (currentSize() > 0) {
            segments_.push_back(cur_);
        }
        cur_ = {cur_.end, cur_.end};
    }

    // Pieces arrive in source order, so the current segment always grows at its end
    void extendTo(size_t end) { cur_.end = end; }

    void addRange(size_t begin, size_t end, size_t level) {
        const auto& seps = config_.separators;
        if (level >= seps.size() || seps[level].empty()) {
            addCodepoints(begin, end);
            return;
        }

        const std::string& sep = seps[level];
        size_t pieceStart = begin;
        while (pieceStart < end) {
            size_t found = text_.find(sep, pieceStart);
            size_t pieceEnd = (found == std::string_view::npos || found + sep.size() > end)
                                  ? end
                                  : found + sep.size();
            addPiece(pieceStart, pieceEnd, level);
            pieceStart = pieceEnd;
        }
    }

    void addPiece(size_t begin, size_t end, size_t level) {
        size_t len = end - begin;
        if (currentSize() + len <= budget()) {
            extendTo(end);
            return;
        }
        if (len <= budget()) {
            flush();
            // The budget shrinks after the first segment; re-check
            if (len <= budget()) {
                extendTo(end);
                return;
            }
        }
        addRange(begin, end, level + 1);
    }

    void addCodepoints(size_t begin, size_t end) {
        size_t pos = begin;
        while (pos < end) {
            size_t room = budget() > currentSize() ? budget() - currentSize() : 0;
            if (room == 0) {
                flush();
                continue;
            }
            size_t cut = pos + room >= end ? end : core::utf8FloorBoundary(text_, pos + room);
            if (cut <= pos) {
                if (currentSize() > 0) {
                    flush();
                    continue;
                }
                // A single code point wider than the budget is emitted whole
                cut = core::utf8NextBoundary(text_, pos);
            }
            extendTo(cut);
            pos = cut;
        }
    }

    std::string_view text_;
    const ChunkingConfig& config_;
    std::vector<Span> segments_;
    Span cur_{0, 0};
};

TextChunker::TextChunker(ChunkingConfig config) : config_(std::move(config)) {
    auto& seps = config_.separators;
    seps.erase(std::remove(seps.begin(), seps.end(), std::string{}), seps.end());
    seps.emplace_back();
}

Result<void> TextChunker::validate(const ChunkingConfig& config) {
    if (config.chunk_size == 0) {
        return Error{ErrorCode::InvalidArgument, "chunk_size must be positive"};
    }
    if (config.chunk_overlap >= config.chunk_size) {
        return Error{ErrorCode::InvalidArgument,
                     "chunk_overlap (" + std::to_string(config.chunk_overlap) +
                         ") must be smaller than chunk_size (" +
                         std::to_string(config.chunk_size) + ")"};
    }
    return {};
}

Result<std::vector<TextChunk>> TextChunker::chunk(std::string_view text) const {
    if (auto valid = validate(config_); !valid) {
        return valid.error();
    }

    std::vector<TextChunk> chunks;
    if (text.empty()) {
        return chunks;
    }

    auto segments = SegmentBuilder(text, config_).build();
    chunks.reserve(segments.size());

    for (size_t i = 0; i < segments.size(); ++i) {
        TextChunk c;
        c.chunk_index = i;
        c.content_offset = segments[i].begin;
        c.end_offset = segments[i].end;
        c.start_offset = segments[i].begin;
        if (i > 0 && config_.chunk_overlap > 0) {
            size_t prevStart = chunks.back().start_offset;
            size_t want = segments[i].begin > config_.chunk_overlap
                              ? segments[i].begin - config_.chunk_overlap
                              : 0;
            // A segment holding one wide code point leaves less room for overlap
            size_t limit = segments[i].end > config_.chunk_size
                               ? std::min(segments[i].end - config_.chunk_size, segments[i].begin)
                               : 0;
            size_t start = std::max({prevStart, want, limit});
            // Never start inside a code point
            while (start < segments[i].begin &&
                   core::isUtf8Continuation(static_cast<unsigned char>(text[start]))) {
                ++start;
            }
            c.start_offset = start;
        }
        c.content.assign(text.substr(c.start_offset, c.end_offset - c.start_offset));
        chunks.push_back(std::move(c));
    }

    spdlog::trace("[TextChunker] {} bytes -> {} chunks (L={}, O={})", text.size(), chunks.size(),
                  config_.chunk_size, config_.chunk_overlap);
    return chunks;
}

} // namespace vellum::chunking
