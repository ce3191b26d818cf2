#include <gtest/gtest.h>
#include "decode/BranchDecoder.hpp"
#include "test_utils.hpp"

using namespace gitquery;
using gitquery::test::utils::lines;

// Test: Verbose listing decodes local and remote-tracking branches
TEST(BranchDecoderTest, DecodesVerboseListing) {
    auto result = BranchDecoder::decode(lines({
        "* main                abc1234 [origin/main: ahead 1] Latest work",
        "  develop             def5678 Develop branch",
        "  remotes/origin/HEAD -> origin/main",
        "  remotes/origin/main abc1234 Latest work",
        "  remotes/origin/feature/x 9876543 Feature",
    }));
    ASSERT_TRUE(result.has_value());
    const BranchList& branches = result.value();

    ASSERT_EQ(branches.size(), 4u);
    EXPECT_EQ(branches.at(0)->name, "develop");
    EXPECT_EQ(branches.at(1)->name, "main");
    EXPECT_EQ(branches.at(2)->name, "origin/feature/x");
    EXPECT_EQ(branches.at(3)->name, "origin/main");

    const Branch* main = currentBranch(branches);
    ASSERT_NE(main, nullptr);
    EXPECT_EQ(main->name, "main");
    EXPECT_EQ(main->commitHash.str(), "abc1234");
    ASSERT_TRUE(main->upstream.has_value());
    EXPECT_EQ(*main->upstream, "origin/main");

    EXPECT_FALSE(branches.find("develop")->upstream.has_value());
    EXPECT_EQ(localCount(branches), 2u);
    EXPECT_EQ(remoteCount(branches), 2u);
    EXPECT_EQ(branches.find("origin/feature/x")->shortName(), "feature/x");
}

// Test: Symbolic refs and blank lines are skipped
TEST(BranchDecoderTest, SkipsSymbolicRefs) {
    auto line = BranchDecoder::decodeLine("  remotes/origin/HEAD -> origin/main");
    ASSERT_TRUE(line.has_value());
    EXPECT_FALSE(line.value().has_value());
    EXPECT_FALSE(BranchDecoder::decodeLine("   ").value().has_value());
}

// Test: Plain listing without hashes uses the zero hash
TEST(BranchDecoderTest, NameOnlyListing) {
    auto line = BranchDecoder::decodeLine("* main");
    ASSERT_TRUE(line.value().has_value());
    EXPECT_TRUE(line.value()->isCurrent);
    EXPECT_EQ(line.value()->commitHash, Hash::zero());
    EXPECT_TRUE(line.value()->isLocal());
}

// Test: Upstream without tracking counts
TEST(BranchDecoderTest, UpstreamWithoutCounts) {
    auto line = BranchDecoder::decodeLine("  topic 1111111 [origin/topic] Work");
    ASSERT_TRUE(line.value().has_value());
    EXPECT_EQ(*line.value()->upstream, "origin/topic");
}
