#include <gtest/gtest.h>
#include "fake_history_source.hpp"
#include "model/errors.hpp"
#include "pipeline/analysis_pipeline.hpp"
#include "sample_diffs.hpp"
#include <stdexcept>

using namespace vibescore;

namespace {

const std::string kAliceKey = "alice|alice@example.com";

// 2024-03-04 12:00:00 UTC
constexpr int64_t kMonday = 1709553600;

void addFourChanges(FakeHistorySource& source) {
    source.addChange("a1", "alice", "alice@example.com", kMonday, samples::kPythonDiff);
    source.addChange("b2", "bob", "bob@example.com", kMonday, samples::kJavaScriptDiff);
    source.addChange("c3", "alice", "alice@example.com", kMonday, samples::kGoDiff);
    source.addChange("d4", "bob", "bob@example.com", kMonday, samples::kRustDiff);
}

size_t countSelf(const std::vector<CodeFragment>& qs) {
    size_t n = 0;
    for (const auto& q : qs) {
        if (q.is_self_authored) n++;
    }
    return n;
}

} // namespace

// ─── Identity Discovery Tests ──────────────────────────────────

TEST(PipelineTest, DiscoverIdentities) {
    FakeHistorySource source;
    addFourChanges(source);
    source.addChange("e5", "alice", "alice@example.com", kMonday, "");
    RandomSource rng(1);
    AnalysisPipeline pipeline(source, PipelineConfig{}, rng);

    auto ids = pipeline.discoverIdentities();
    ASSERT_EQ(ids.size(), 2);
    EXPECT_EQ(ids[0].key(), kAliceKey);
    EXPECT_EQ(ids[0].commit_count, 3);
    EXPECT_EQ(ids[1].commit_count, 2);
}

TEST(PipelineTest, NotARepository) {
    FakeHistorySource source;
    source.repository = false;
    RandomSource rng(1);
    AnalysisPipeline pipeline(source, PipelineConfig{}, rng);

    EXPECT_THROW(pipeline.discoverIdentities(), RepositoryUnavailable);
    EXPECT_THROW(pipeline.run({kAliceKey}), RepositoryUnavailable);
}

TEST(PipelineTest, EmptyHistory) {
    FakeHistorySource source;
    RandomSource rng(1);
    AnalysisPipeline pipeline(source, PipelineConfig{}, rng);

    EXPECT_THROW(pipeline.discoverIdentities(), NoHistory);
    EXPECT_THROW(pipeline.run({kAliceKey}), NoHistory);
}

TEST(PipelineTest, ListingFailureIsNoHistory) {
    FakeHistorySource source;
    addFourChanges(source);
    source.fail_listing = true;
    RandomSource rng(1);
    AnalysisPipeline pipeline(source, PipelineConfig{}, rng);

    EXPECT_THROW(pipeline.discoverIdentities(), NoHistory);
}

TEST(PipelineTest, InvalidConfigIsRejected) {
    FakeHistorySource source;
    RandomSource rng(1);
    PipelineConfig config;
    config.extraction.min_snippet_lines = 20;  // above max_snippet_lines
    EXPECT_THROW({ AnalysisPipeline pipeline(source, config, rng); }, std::invalid_argument);
}

// ─── Analysis Run Tests ────────────────────────────────────────

TEST(PipelineTest, FullRun) {
    FakeHistorySource source;
    addFourChanges(source);
    RandomSource rng(42);
    AnalysisPipeline pipeline(source, PipelineConfig{}, rng);

    AnalysisResult r = pipeline.run({kAliceKey});
    EXPECT_EQ(r.changes_scanned, 4);
    EXPECT_EQ(r.changes_skipped, 0);
    EXPECT_EQ(r.code_pool.size(), 4);
    EXPECT_EQ(r.comment_pool.size(), 4);

    ASSERT_EQ(r.code_questions.size(), 4);
    EXPECT_EQ(countSelf(r.code_questions), 2);
    EXPECT_EQ(r.comment_questions.size(), 4);
    EXPECT_TRUE(r.velocity.empty());

    for (const auto& q : r.code_questions) {
        bool alice = q.author.key() == kAliceKey;
        EXPECT_EQ(q.is_self_authored, alice);
        EXPECT_GE(q.lines.size(), 4);
        EXPECT_LE(q.lines.size(), 12);
    }
}

TEST(PipelineTest, FailingChangeIsSkipped) {
    FakeHistorySource source;
    addFourChanges(source);
    source.addChange("f6", "alice", "alice@example.com", kMonday, samples::kPythonDiff);
    source.failing_ids.insert("f6");
    RandomSource rng(42);
    AnalysisPipeline pipeline(source, PipelineConfig{}, rng);

    AnalysisResult r = pipeline.run({kAliceKey});
    EXPECT_EQ(r.changes_scanned, 4);
    EXPECT_EQ(r.changes_skipped, 1);
    EXPECT_EQ(r.code_pool.size(), 4);
}

TEST(PipelineTest, DuplicateChangesAreMerged) {
    FakeHistorySource source;
    addFourChanges(source);
    // a cherry-pick of the Rust change by someone else
    source.addChange("e5", "carol", "carol@example.com", kMonday, samples::kRustDiff);
    RandomSource rng(9);
    AnalysisPipeline pipeline(source, PipelineConfig{}, rng);

    AnalysisResult r = pipeline.run({kAliceKey});
    EXPECT_EQ(r.changes_scanned, 5);
    EXPECT_EQ(r.comment_pool.size(), 4);
}

TEST(PipelineTest, TooLittleMaterial) {
    FakeHistorySource source;
    source.addChange("a1", "alice", "alice@example.com", kMonday, samples::kPythonDiff);
    source.addChange("b2", "bob", "bob@example.com", kMonday, samples::kJavaScriptDiff);
    RandomSource rng(1);
    AnalysisPipeline pipeline(source, PipelineConfig{}, rng);

    try {
        pipeline.run({kAliceKey});
        FAIL() << "expected InsufficientMaterial";
    } catch (const InsufficientMaterial& e) {
        EXPECT_EQ(e.track(), "code");
        EXPECT_EQ(e.available(), 2);
        EXPECT_EQ(e.required(), 3);
    }
}

TEST(PipelineTest, VelocityCountsSelectedAuthorsOnly) {
    FakeHistorySource source;
    addFourChanges(source);
    source.addChange("v1", "alice", "alice@example.com", kMonday, samples::bulkTextDiff(600));
    source.addChange("v2", "bob", "bob@example.com", kMonday + 86400, samples::bulkTextDiff(900));
    RandomSource rng(3);
    AnalysisPipeline pipeline(source, PipelineConfig{}, rng);

    AnalysisResult r = pipeline.run({kAliceKey});
    ASSERT_EQ(r.velocity.size(), 1);
    EXPECT_EQ(r.velocity[0].date, "2024-03-04");
    EXPECT_GT(r.velocity[0].lines_added, 600);
    EXPECT_EQ(r.velocity[0].commit_count, 3);  // a1, c3, v1
}

TEST(PipelineTest, SameSeedSameQuiz) {
    FakeHistorySource source;
    addFourChanges(source);

    RandomSource rng_a(77), rng_b(77);
    AnalysisResult a = AnalysisPipeline(source, PipelineConfig{}, rng_a).run({kAliceKey});
    AnalysisResult b = AnalysisPipeline(source, PipelineConfig{}, rng_b).run({kAliceKey});

    ASSERT_EQ(a.code_questions.size(), b.code_questions.size());
    for (size_t i = 0; i < a.code_questions.size(); i++) {
        EXPECT_EQ(a.code_questions[i].lines, b.code_questions[i].lines);
    }
}
