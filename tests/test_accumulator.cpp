#include <gtest/gtest.h>
#include "extraction/block_accumulator.hpp"

using namespace vibescore;

namespace {

FinishedBlocks feedCode(BlockAccumulator& acc, int n, const std::string& prefix = "line") {
    FinishedBlocks out;
    for (int i = 0; i < n; i++) {
        out.append(acc.observe(prefix + std::to_string(i), LineCategory::Code));
    }
    return out;
}

} // namespace

// ─── Block Accumulator Tests ───────────────────────────────────

TEST(AccumulatorTest, ShortBlockIsDropped) {
    BlockAccumulator acc;
    EXPECT_TRUE(feedCode(acc, 3).empty());
    auto out = acc.finish();
    EXPECT_TRUE(out.code.empty());
    EXPECT_EQ(acc.pendingCodeLines(), 0);
}

TEST(AccumulatorTest, MinimumBlockIsEmitted) {
    BlockAccumulator acc;
    feedCode(acc, 4);
    auto out = acc.finish();
    ASSERT_EQ(out.code.size(), 1);
    EXPECT_EQ(out.code[0].lines.size(), 4);
    EXPECT_EQ(out.code[0].lines[0], "line0");
}

TEST(AccumulatorTest, BoundaryClosesBlock) {
    BlockAccumulator acc;
    feedCode(acc, 5, "a");
    auto closed = acc.boundary();
    ASSERT_EQ(closed.code.size(), 1);
    EXPECT_EQ(closed.code[0].lines.size(), 5);

    feedCode(acc, 4, "b");
    auto rest = acc.finish();
    ASSERT_EQ(rest.code.size(), 1);
    EXPECT_EQ(rest.code[0].lines[0], "b0");
}

TEST(AccumulatorTest, BoundaryDiscardsShortBuffer) {
    BlockAccumulator acc;
    feedCode(acc, 2, "a");
    EXPECT_TRUE(acc.boundary().empty());
    feedCode(acc, 2, "b");
    EXPECT_TRUE(acc.finish().code.empty());
}

TEST(AccumulatorTest, NoiseClosesBlock) {
    BlockAccumulator acc;
    feedCode(acc, 4);
    auto out = acc.observe("}", LineCategory::Noise);
    ASSERT_EQ(out.code.size(), 1);
    EXPECT_EQ(acc.pendingCodeLines(), 0);
}

TEST(AccumulatorTest, NoiseDropsShortBlock) {
    BlockAccumulator acc;
    feedCode(acc, 3, "a");
    auto closed = acc.observe("}", LineCategory::Noise);
    EXPECT_TRUE(closed.code.empty());
    EXPECT_EQ(acc.pendingCodeLines(), 0);

    // the three dropped lines do not carry into the next block
    feedCode(acc, 1, "b");
    EXPECT_TRUE(acc.finish().code.empty());
}

TEST(AccumulatorTest, BoilerplateIsTransparent) {
    BlockAccumulator acc;
    feedCode(acc, 2, "a");
    EXPECT_TRUE(acc.observe("import os", LineCategory::Boilerplate).empty());
    feedCode(acc, 2, "b");
    auto out = acc.finish();
    ASSERT_EQ(out.code.size(), 1);
    EXPECT_EQ(out.code[0].lines.size(), 4);
}

TEST(AccumulatorTest, CommentTakesTwoLinesOfContext) {
    BlockAccumulator acc;
    feedCode(acc, 3, "ctx");
    acc.observe("// explains the next statement in detail", LineCategory::Comment);
    EXPECT_EQ(acc.pendingCommentLines(), 1);

    auto out = acc.observe("next_statement();", LineCategory::Code);
    ASSERT_EQ(out.comments.size(), 1);
    EXPECT_EQ(out.comments[0].comment_lines.size(), 1);
    ASSERT_EQ(out.comments[0].context_lines.size(), 2);
    EXPECT_EQ(out.comments[0].context_lines[0], "ctx1");
    EXPECT_EQ(out.comments[0].context_lines[1], "ctx2");
}

TEST(AccumulatorTest, CommentWithoutPrecedingCode) {
    BlockAccumulator acc;
    acc.observe("# first comment line of the file", LineCategory::Comment);
    acc.observe("# second comment line of the file", LineCategory::Comment);
    auto out = acc.finish();
    ASSERT_EQ(out.comments.size(), 1);
    EXPECT_EQ(out.comments[0].comment_lines.size(), 2);
    EXPECT_TRUE(out.comments[0].context_lines.empty());
}

TEST(AccumulatorTest, NoiseFlushesComment) {
    BlockAccumulator acc;
    acc.observe("// a comment before a blank stretch", LineCategory::Comment);
    auto out = acc.observe("", LineCategory::Noise);
    EXPECT_EQ(out.comments.size(), 1);
    EXPECT_EQ(acc.pendingCommentLines(), 0);
}

TEST(AccumulatorTest, CommentDoesNotBreakCodeBlock) {
    BlockAccumulator acc;
    feedCode(acc, 2, "a");
    acc.observe("// an inline remark inside the block", LineCategory::Comment);
    auto mid = feedCode(acc, 2, "b");
    EXPECT_EQ(mid.comments.size(), 1);

    auto out = acc.finish();
    ASSERT_EQ(out.code.size(), 1);
    EXPECT_EQ(out.code[0].lines.size(), 4);
}

TEST(AccumulatorTest, ContextRingIsBounded) {
    BlockAccumulator acc;
    feedCode(acc, 9);
    ASSERT_EQ(acc.contextRing().size(), 5);
    EXPECT_EQ(acc.contextRing().front(), "line4");
    EXPECT_EQ(acc.contextRing().back(), "line8");
}
