#include <gtest/gtest.h>
#include <string>
#include "core/Status.hpp"

using namespace gitquery;

namespace {

StatusEntry entry(const std::string& path, IndexStatus index, WorktreeStatus worktree) {
    StatusEntry e;
    e.path = path;
    e.indexStatus = index;
    e.worktreeStatus = worktree;
    return e;
}

}

class StatusModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        report = StatusReport({
            entry("staged.txt", IndexStatus::Added, WorktreeStatus::Clean),
            entry("both.txt", IndexStatus::Modified, WorktreeStatus::Modified),
            entry("dirty.txt", IndexStatus::Clean, WorktreeStatus::Modified),
            entry("new.txt", IndexStatus::Clean, WorktreeStatus::Untracked),
            entry("build/", IndexStatus::Clean, WorktreeStatus::Ignored),
        });
    }

    StatusReport report;
};

// Test: Every recognized index code maps to a status and back
TEST_F(StatusModelTest, IndexCodesRoundTrip) {
    for (char c : std::string("MADRC")) {
        EXPECT_EQ(toChar(indexStatusFromChar(c)), c) << c;
    }
    EXPECT_EQ(indexStatusFromChar(' '), IndexStatus::Clean);
    EXPECT_EQ(indexStatusFromChar('?'), IndexStatus::Clean);
    EXPECT_EQ(indexStatusFromChar('X'), IndexStatus::Clean);
}

// Test: Every recognized worktree code maps to a status and back
TEST_F(StatusModelTest, WorktreeCodesRoundTrip) {
    for (char c : std::string("MD?!")) {
        EXPECT_EQ(toChar(worktreeStatusFromChar(c)), c) << c;
    }
    EXPECT_EQ(worktreeStatusFromChar('A'), WorktreeStatus::Clean);
    EXPECT_EQ(worktreeStatusFromChar('U'), WorktreeStatus::Clean);
}

// Test: Entry predicates follow the two axes
TEST_F(StatusModelTest, EntryPredicates) {
    const StatusEntry* both = report.find("both.txt");
    ASSERT_NE(both, nullptr);
    EXPECT_TRUE(both->isStaged());
    EXPECT_TRUE(both->isUnstaged());
    EXPECT_EQ(both->code(), "MM");

    const StatusEntry* untracked = report.find("new.txt");
    ASSERT_NE(untracked, nullptr);
    EXPECT_TRUE(untracked->isUntracked());
    EXPECT_FALSE(untracked->isStaged());
    EXPECT_EQ(untracked->code(), "??");
}

// Test: Report-level subsets
TEST_F(StatusModelTest, ReportSubsets) {
    EXPECT_FALSE(isClean(report));
    EXPECT_TRUE(hasChanges(report));
    EXPECT_EQ(stagedFiles(report).size(), 2u);
    EXPECT_EQ(unstagedFiles(report).size(), 4u);
    EXPECT_EQ(untrackedFiles(report).size(), 1u);
    EXPECT_EQ(ignoredFiles(report).size(), 1u);
    EXPECT_EQ(filesWithIndexStatus(report, IndexStatus::Added).size(), 1u);
    EXPECT_EQ(filesWithWorktreeStatus(report, WorktreeStatus::Modified).size(), 2u);
}

// Test: An empty report is clean
TEST_F(StatusModelTest, EmptyReportIsClean) {
    StatusReport empty;
    EXPECT_TRUE(isClean(empty));
    EXPECT_FALSE(hasChanges(empty));
    EXPECT_TRUE(stagedFiles(empty).empty());
}
