#include <gtest/gtest.h>
#include <vellum/core/utf8.h>
#include <vellum/search/context_assembler.h>

using namespace vellum;
using namespace vellum::search;

namespace {

RankedChunk ranked(const std::string& filename, size_t index, const std::string& text,
                   size_t startOffset = 0) {
    RankedChunk r;
    r.chunk.chunkId = filename + "-" + std::to_string(index);
    r.chunk.documentId = "doc-" + filename;
    r.chunk.filename = filename;
    r.chunk.chunkIndex = index;
    r.chunk.content = text;
    r.chunk.startOffset = startOffset;
    r.chunk.endOffset = startOffset + text.size();
    r.score = 0.5;
    return r;
}

} // namespace

TEST(ContextAssemblerTest, RejectsZeroBudget) {
    EXPECT_THROW(ContextAssembler(0), std::invalid_argument);
}

TEST(ContextAssemblerTest, IncludesChunksInRankOrderWithinBudget) {
    ContextAssembler assembler(25);
    auto ctx = assembler.assemble({ranked("a.txt", 0, std::string(10, 'a')),
                                   ranked("b.txt", 1, std::string(10, 'b')),
                                   ranked("c.txt", 2, std::string(10, 'c'))});

    ASSERT_EQ(ctx.entries.size(), 2u);
    EXPECT_EQ(ctx.totalChars, 20u);
    EXPECT_TRUE(ctx.truncated);
    EXPECT_EQ(ctx.entries[0].rank, 1u);
    EXPECT_EQ(ctx.entries[1].rank, 2u);
    EXPECT_EQ(ctx.entries[1].filename, "b.txt");
    EXPECT_FALSE(ctx.entries[1].truncated);
}

TEST(ContextAssemblerTest, StopsAtFirstChunkThatDoesNotFit) {
    ContextAssembler assembler(25);
    auto ctx = assembler.assemble({ranked("a.txt", 0, std::string(10, 'a')),
                                   ranked("b.txt", 0, std::string(20, 'b')),
                                   ranked("c.txt", 0, std::string(5, 'c'))});
    ASSERT_EQ(ctx.entries.size(), 1u);
    EXPECT_EQ(ctx.entries[0].filename, "a.txt");
    EXPECT_TRUE(ctx.truncated);
}

TEST(ContextAssemblerTest, ExactFitIsNotTruncated) {
    ContextAssembler assembler(20);
    auto ctx = assembler.assemble(
        {ranked("a.txt", 0, std::string(10, 'a')), ranked("b.txt", 0, std::string(10, 'b'))});
    EXPECT_EQ(ctx.entries.size(), 2u);
    EXPECT_EQ(ctx.totalChars, 20u);
    EXPECT_FALSE(ctx.truncated);
    EXPECT_TRUE(assembler.assemble({}).entries.empty());
}

TEST(ContextAssemblerTest, OversizedFirstChunkIsCutAtWhitespace) {
    ContextAssembler assembler(12);
    auto ctx = assembler.assemble({ranked("a.txt", 4, "alpha beta gamma delta", 100),
                                   ranked("b.txt", 0, "short")});

    ASSERT_EQ(ctx.entries.size(), 1u);
    const auto& e = ctx.entries[0];
    EXPECT_EQ(e.text, "alpha beta");
    EXPECT_TRUE(e.truncated);
    EXPECT_EQ(e.startOffset, 100u);
    EXPECT_EQ(e.endOffset, 110u);
    EXPECT_EQ(ctx.totalChars, 10u);
    EXPECT_TRUE(ctx.truncated);
}

TEST(ContextAssemblerTest, TruncationNeverSplitsCodepoints) {
    std::string text;
    for (int i = 0; i < 10; ++i)
        text += "\xC3\xA9";
    EXPECT_EQ(ContextAssembler::truncationPoint(text, 5), 4u);
    EXPECT_EQ(ContextAssembler::truncationPoint(text, 100), text.size());

    ContextAssembler assembler(7);
    auto ctx = assembler.assemble({ranked("e.txt", 0, text)});
    ASSERT_EQ(ctx.entries.size(), 1u);
    EXPECT_EQ(ctx.entries[0].text.size(), 6u);
    EXPECT_TRUE(core::isValidUtf8(ctx.entries[0].text));
}

TEST(ContextAssemblerTest, WhitespaceInTheFirstHalfIsIgnored) {
    // The only space is too early; cut at the byte limit instead
    EXPECT_EQ(ContextAssembler::truncationPoint("ab cdefghijklmnop", 10), 10u);
}

TEST(ContextAssemblerTest, RenderForPrompt) {
    ContextAssembler assembler(100);
    auto ctx = assembler.assemble({ranked("a.txt", 0, "hello"), ranked("b.md", 3, "world")});
    EXPECT_EQ(ctx.renderForPrompt(), "[1] a.txt#0\nhello\n\n[2] b.md#3\nworld");
    EXPECT_EQ(AssembledContext{}.renderForPrompt(), "");
}
