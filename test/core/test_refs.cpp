#include <gtest/gtest.h>
#include <string>
#include "core/Branch.hpp"
#include "core/Remote.hpp"
#include "core/Stash.hpp"
#include "core/Tag.hpp"

using namespace gitquery;

namespace {

Branch branch(const std::string& name, BranchType type, bool current = false) {
    Branch b;
    b.name = name;
    b.type = type;
    b.isCurrent = current;
    b.commitHash = Hash("abc123def456");
    return b;
}

Tag tag(const std::string& name, const std::string& hash, TagType type) {
    Tag t;
    t.name = name;
    t.hash = Hash(hash);
    t.type = type;
    return t;
}

Stash stash(size_t index, const std::string& message, const std::string& branchName) {
    Stash s;
    s.index = index;
    s.message = message;
    s.hash = Hash("def456abc123");
    s.branch = branchName;
    return s;
}

}

// Test: Branch list is ordered by name and queries split by type
TEST(BranchModelTest, SortedListAndQueries) {
    BranchList branches({
        branch("origin/main", BranchType::RemoteTracking),
        branch("main", BranchType::Local, true),
        branch("develop", BranchType::Local),
    });

    ASSERT_EQ(branches.size(), 3u);
    EXPECT_EQ(branches.first()->name, "develop");
    EXPECT_EQ(branches.last()->name, "origin/main");
    EXPECT_EQ(localCount(branches), 2u);
    EXPECT_EQ(remoteCount(branches), 1u);
    EXPECT_EQ(localBranches(branches).size(), 2u);
    EXPECT_EQ(remoteBranches(branches).first()->name, "origin/main");

    const Branch* current = currentBranch(branches);
    ASSERT_NE(current, nullptr);
    EXPECT_EQ(current->name, "main");
    EXPECT_EQ(current->toString(), "* main");
    EXPECT_EQ(branches.find("develop")->toString(), "  develop");
}

// Test: Short name strips only the remote segment, and only for remote branches
TEST(BranchModelTest, ShortName) {
    EXPECT_EQ(branch("origin/feature/x", BranchType::RemoteTracking).shortName(), "feature/x");
    EXPECT_EQ(branch("feature/x", BranchType::Local).shortName(), "feature/x");
    EXPECT_EQ(branch("origin", BranchType::RemoteTracking).shortName(), "origin");

    BranchList branches({branch("origin/feature/x", BranchType::RemoteTracking)});
    ASSERT_NE(findByShortName(branches, "feature/x"), nullptr);
    EXPECT_EQ(findByShortName(branches, "x"), nullptr);
}

// Test: No current branch on a detached or empty list
TEST(BranchModelTest, NoCurrentBranch) {
    BranchList empty;
    EXPECT_EQ(currentBranch(empty), nullptr);
    EXPECT_EQ(localCount(empty), 0u);
}

// Test: Tag queries by type and target commit
TEST(TagModelTest, Queries) {
    TagList tags({
        tag("v2.0.0", "bbbbbbbbbbbb", TagType::Annotated),
        tag("v1.0.0", "aaaaaaaaaaaa", TagType::Lightweight),
        tag("release-1", "aaaaaaaaaaaa", TagType::Annotated),
    });

    EXPECT_EQ(tags.first()->name, "release-1");
    EXPECT_EQ(lightweightCount(tags), 1u);
    EXPECT_EQ(annotatedCount(tags), 2u);
    EXPECT_EQ(lightweightTags(tags).first()->name, "v1.0.0");
    EXPECT_EQ(annotatedTags(tags).size(), 2u);
    EXPECT_EQ(tagsForCommit(tags, Hash("aaaaaaaaaaaa")).size(), 2u);
    EXPECT_TRUE(tagsForCommit(tags, Hash("cccccccccccc")).empty());
    EXPECT_TRUE(tags.find("v2.0.0")->isAnnotated());
    EXPECT_STREQ(toString(TagType::Lightweight), "lightweight");
}

// Test: Stash naming and lookups keep the enumeration order
TEST(StashModelTest, NamingAndLookup) {
    StashList stashes({
        stash(0, "WIP parser", "main"),
        stash(1, "experiment", "feature"),
        stash(2, "old work", "main"),
    });

    EXPECT_EQ(stashes.at(1)->refName(), "stash@{1}");
    EXPECT_EQ(stashes.at(0)->toString(), "stash@{0}: WIP parser");
    EXPECT_EQ(latestStash(stashes)->message, "WIP parser");
    ASSERT_NE(stashAt(stashes, 2), nullptr);
    EXPECT_EQ(stashAt(stashes, 2)->message, "old work");
    EXPECT_EQ(stashAt(stashes, 3), nullptr);
    EXPECT_EQ(stashesForBranch(stashes, "main").size(), 2u);
    EXPECT_TRUE(stashesForBranch(stashes, "other").empty());
    EXPECT_EQ(latestStash(StashList()), nullptr);
}

// Test: Push URL falls back to the fetch URL
TEST(RemoteModelTest, PushUrlFallback) {
    Remote same{"origin", "git@example.com:repo.git", std::nullopt};
    EXPECT_EQ(same.pushUrl(), "git@example.com:repo.git");

    Remote split{"mirror", "https://example.com/repo.git", std::string("ssh://push.example.com/repo.git")};
    EXPECT_EQ(split.pushUrl(), "ssh://push.example.com/repo.git");
}
