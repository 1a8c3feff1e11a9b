#include <vellum/core/utf8.h>
#include <vellum/search/context_assembler.h>

#include <stdexcept>

namespace vellum::search {

namespace {

bool isSpace(char c) {
    return c == ' ' || c == '\n' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

std::string AssembledContext::renderForPrompt() const {
    std::string out;
    for (const auto& e : entries) {
        if (!out.empty()) {
            out += "\n\n";
        }
        out += "[" + std::to_string(e.rank) + "] " + e.filename + "#" +
               std::to_string(e.chunkIndex) + "\n";
        out += e.text;
    }
    return out;
}

ContextAssembler::ContextAssembler(size_t maxChars) : maxChars_(maxChars) {
    if (maxChars_ == 0) {
        throw std::invalid_argument("Context size must be positive");
    }
}

size_t ContextAssembler::truncationPoint(std::string_view text, size_t limit) {
    if (text.size() <= limit) {
        return text.size();
    }
    for (size_t p = limit; p >= limit / 2 && p > 0; --p) {
        if (isSpace(text[p])) {
            return p;
        }
    }
    return core::utf8FloorBoundary(text, limit);
}

AssembledContext ContextAssembler::assemble(const std::vector<RankedChunk>& ranked) const {
    AssembledContext ctx;
    for (const auto& rc : ranked) {
        const auto& c = rc.chunk;
        ContextEntry entry{ctx.entries.size() + 1, c.chunkId,    c.documentId, c.filename,
                           c.chunkIndex,           c.startOffset, c.endOffset,  c.content,
                           rc.score,               false};

        if (ctx.totalChars + c.content.size() <= maxChars_) {
            ctx.totalChars += c.content.size();
            ctx.entries.push_back(std::move(entry));
            continue;
        }

        if (ctx.entries.empty()) {
            size_t cut = truncationPoint(c.content, maxChars_);
            entry.text.resize(cut);
            entry.endOffset = c.startOffset + cut;
            entry.truncated = true;
            ctx.totalChars = cut;
            ctx.entries.push_back(std::move(entry));
        }
        ctx.truncated = true;
        break;
    }
    return ctx;
}

} // namespace vellum::search
