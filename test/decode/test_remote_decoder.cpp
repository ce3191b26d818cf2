#include <gtest/gtest.h>
#include "decode/RemoteDecoder.hpp"
#include "test_utils.hpp"

using namespace gitquery;
using gitquery::test::utils::lines;

// Test: Fetch and push lines fold into one remote each
TEST(RemoteDecoderTest, FoldsFetchAndPush) {
    auto remotes = RemoteDecoder::decode(lines({
        "origin\tgit@example.com:repo.git (fetch)",
        "origin\tgit@example.com:repo.git (push)",
        "mirror\thttps://example.com/repo.git (fetch)",
        "mirror\tssh://push.example.com/repo.git (push)",
    }));
    ASSERT_TRUE(remotes.has_value());
    ASSERT_EQ(remotes.value().size(), 2u);

    const Remote* origin = remotes.value().find("origin");
    ASSERT_NE(origin, nullptr);
    EXPECT_FALSE(origin->pushUrlOverride.has_value());
    EXPECT_EQ(origin->pushUrl(), "git@example.com:repo.git");

    const Remote* mirror = remotes.value().at(1);
    EXPECT_EQ(mirror->name, "mirror");
    EXPECT_EQ(mirror->fetchUrl, "https://example.com/repo.git");
    EXPECT_EQ(mirror->pushUrl(), "ssh://push.example.com/repo.git");
}

// Test: Malformed lines are skipped and push-only remotes use the push URL
TEST(RemoteDecoderTest, SkipsMalformedLines) {
    auto remotes = RemoteDecoder::decode(lines({
        "origin",
        "upstream\thttps://example.com/up.git (push)",
        "weird\turl (other)",
    }));
    ASSERT_TRUE(remotes.has_value());
    ASSERT_EQ(remotes.value().size(), 1u);
    EXPECT_EQ(remotes.value().first()->fetchUrl, "https://example.com/up.git");
}
