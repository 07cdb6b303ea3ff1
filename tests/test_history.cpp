#include <gtest/gtest.h>
#include "history/git_history_source.hpp"
#include "history/history_source.hpp"
#include "history/process_runner.hpp"
#include "model/errors.hpp"

using namespace vibescore;

// ─── Change Record Tests ───────────────────────────────────────

TEST(HistoryTest, ParseChangeRecord) {
    ChangeInfo info = parseChangeRecord("Ada Lovelace|ada@example.com|1700000000|Add parser\n",
                                        "abc123");
    EXPECT_EQ(info.change_id, "abc123");
    EXPECT_EQ(info.author.name, "Ada Lovelace");
    EXPECT_EQ(info.author.email, "ada@example.com");
    EXPECT_EQ(info.timestamp, 1700000000);
    EXPECT_EQ(info.message, "Add parser");
}

TEST(HistoryTest, MessageMayContainSeparator) {
    ChangeInfo info = parseChangeRecord("dev|dev@x.io|1|fix a | b | c", "1");
    EXPECT_EQ(info.message, "fix a | b | c");
}

TEST(HistoryTest, BadTimestampBecomesZero) {
    EXPECT_EQ(parseChangeRecord("dev|dev@x.io|yesterday|msg", "1").timestamp, 0);
    EXPECT_EQ(parseChangeRecord("dev|dev@x.io", "1").timestamp, 0);
    EXPECT_EQ(parseChangeRecord("dev|dev@x.io", "1").message, "");
}

// ─── Identity Aggregation Tests ────────────────────────────────

TEST(HistoryTest, AggregateIdentities) {
    auto ids = aggregateIdentities({
        "alice|alice@work.com",
        "bob|bob@home.net",
        "alice|alice@work.com",
        "",
        "alice|alice@personal.org",
        "alice|alice@work.com",
    });

    ASSERT_EQ(ids.size(), 3);
    EXPECT_EQ(ids[0].key(), "alice|alice@work.com");
    EXPECT_EQ(ids[0].commit_count, 3);
    // ties keep first-seen order
    EXPECT_EQ(ids[1].key(), "bob|bob@home.net");
    EXPECT_EQ(ids[2].key(), "alice|alice@personal.org");
}

TEST(HistoryTest, IdentityEqualityIgnoresCount) {
    EXPECT_EQ(Identity("a", "a@x", 1), Identity("a", "a@x", 9));
    EXPECT_FALSE(Identity("a", "a@x") == Identity("a", "b@x"));
}

// ─── Git Source Tests ──────────────────────────────────────────

TEST(HistoryTest, ValidChangeIds) {
    EXPECT_TRUE(GitHistorySource::isValidChangeId("3b18e512dba79e4c8300dd08aeb37f8e728b8dad"));
    EXPECT_TRUE(GitHistorySource::isValidChangeId("ABCDEF0"));
    EXPECT_FALSE(GitHistorySource::isValidChangeId(""));
    EXPECT_FALSE(GitHistorySource::isValidChangeId("HEAD"));
    EXPECT_FALSE(GitHistorySource::isValidChangeId("--output=/tmp/x"));
}

TEST(HistoryTest, InvalidIdIsRejectedBeforeRunningGit) {
    GitHistorySource source("/nonexistent", "/nonexistent/git");
    EXPECT_THROW(source.changeDiff("abc; rm -rf /"), RetrievalFailure);
    EXPECT_THROW(source.changeInfo("HEAD~1"), RetrievalFailure);
}

TEST(HistoryTest, MissingExecutableIsNotARepository) {
    GitHistorySource source(".", "/nonexistent/git-binary");
    EXPECT_FALSE(source.isRepository());
    EXPECT_THROW(source.changeIds(10), RetrievalFailure);
}

TEST(ProcessRunnerTest, MissingExecutable) {
    CommandResult r = runProcess({"/nonexistent/binary"}, ".");
    EXPECT_FALSE(r.ok());
}

TEST(ProcessRunnerTest, EmptyArgv) {
    CommandResult r = runProcess({}, ".");
    EXPECT_FALSE(r.ok());
}
