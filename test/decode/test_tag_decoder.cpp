#include <gtest/gtest.h>
#include "decode/TagDecoder.hpp"
#include "test_utils.hpp"

using namespace gitquery;
using gitquery::test::utils::lines;

// Test: Lightweight tag uses the object column
TEST(TagDecoderTest, LightweightRef) {
    auto tag = TagDecoder::decodeRefLine("v1.0.0|commit|abc123def456||||||");
    ASSERT_TRUE(tag.has_value());
    EXPECT_EQ(tag.value().name, "v1.0.0");
    EXPECT_EQ(tag.value().type, TagType::Lightweight);
    EXPECT_EQ(tag.value().hash.str(), "abc123def456");
    EXPECT_FALSE(tag.value().tagger.has_value());
    EXPECT_FALSE(tag.value().message.has_value());
}

// Test: Annotated tag uses the dereferenced commit and tagger fields
TEST(TagDecoderTest, AnnotatedRef) {
    auto tag = TagDecoder::decodeRefLine(
        "v2.0.0|tag|0a0a0a0a0a0a|def456abc123|Jane Roe|<jane@example.com>|1640995200|Release 2.0|Notes here");
    ASSERT_TRUE(tag.has_value());
    const Tag& t = tag.value();
    EXPECT_TRUE(t.isAnnotated());
    EXPECT_EQ(t.hash.str(), "def456abc123");
    ASSERT_TRUE(t.tagger.has_value());
    EXPECT_EQ(t.tagger->name, "Jane Roe");
    EXPECT_EQ(TimeUtils::toEpochSeconds(*t.timestamp), 1640995200);
    ASSERT_TRUE(t.message.has_value());
    EXPECT_EQ(*t.message, "Release 2.0\n\nNotes here");
}

// Test: Bad tagger date falls back to the epoch
TEST(TagDecoderTest, BadTaggerDate) {
    auto tag = TagDecoder::decodeRefLine("v3|tag|0a0a|beef|Jane|<j@x>|soon|Subject|");
    ASSERT_TRUE(tag.has_value());
    ASSERT_TRUE(tag.value().tagger.has_value());
    EXPECT_EQ(TimeUtils::toEpochSeconds(tag.value().tagger->timestamp), 0);
    EXPECT_EQ(*tag.value().message, "Subject");
}

// Test: Far-future tagger date is kept, not replaced by the epoch
TEST(TagDecoderTest, FarFutureTaggerDate) {
    auto tags = TagDecoder::decode("v1|tag|t1|c1|T|<t@x>|10000000000|msg|\n");
    ASSERT_TRUE(tags.has_value());
    ASSERT_EQ(tags.value().size(), 1u);
    const Tag* tag = tags.value().first();
    ASSERT_TRUE(tag->tagger.has_value());
    EXPECT_EQ(TimeUtils::toEpochSeconds(tag->tagger->timestamp), 10000000000LL);
    EXPECT_EQ(TimeUtils::toEpochSeconds(*tag->timestamp), 10000000000LL);
}

// Test: Too few columns is a malformed record
TEST(TagDecoderTest, ShortLineIsError) {
    auto tag = TagDecoder::decodeRefLine("v1.0.0|commit|abc");
    ASSERT_FALSE(tag.has_value());
    EXPECT_EQ(tag.error().code, ErrorCode::MalformedRecord);
    EXPECT_EQ(tag.error().message, "Invalid for-each-ref format: expected 9 parts, got 3");
}

// Test: Enumeration skips bad lines and sorts by name
TEST(TagDecoderTest, DecodeSkipsAndSorts) {
    auto tags = TagDecoder::decode(lines({
        "v2.0.0|commit|bbbb||||||",
        "garbage",
        "",
        "v1.0.0|commit|aaaa||||||",
    }));
    ASSERT_TRUE(tags.has_value());
    ASSERT_EQ(tags.value().size(), 2u);
    EXPECT_EQ(tags.value().first()->name, "v1.0.0");
    EXPECT_EQ(tags.value().last()->name, "v2.0.0");
}

// Test: Show output of an annotated tag
TEST(TagDecoderTest, ShowAnnotated) {
    auto tag = TagDecoder::decodeShow("v1.0.0", lines({
        "tag v1.0.0",
        "Tagger: Jane Roe <jane@example.com>",
        "Date:   Sat Jan 1 00:00:00 2022 +0000",
        "",
        "First release",
        "  with notes",
        "",
        "commit abc123def4567890",
        "Author: John Doe <john@example.com>",
        "",
        "    Initial commit",
    }));
    ASSERT_TRUE(tag.has_value());
    const Tag& t = tag.value();
    EXPECT_EQ(t.name, "v1.0.0");
    EXPECT_TRUE(t.isAnnotated());
    EXPECT_EQ(t.hash.str(), "abc123def4567890");
    ASSERT_TRUE(t.tagger.has_value());
    EXPECT_EQ(t.tagger->name, "Jane Roe");
    EXPECT_EQ(t.tagger->email, "jane@example.com");
    ASSERT_TRUE(t.message.has_value());
    EXPECT_EQ(*t.message, "First release\nwith notes");
}

// Test: Show output of a lightweight tag is just the commit
TEST(TagDecoderTest, ShowLightweight) {
    auto tag = TagDecoder::decodeShow("v0.1", lines({
        "commit 1234567890abcdef",
        "Author: John Doe <john@example.com>",
        "",
        "    Initial commit",
    }));
    ASSERT_TRUE(tag.has_value());
    EXPECT_EQ(tag.value().type, TagType::Lightweight);
    EXPECT_EQ(tag.value().hash.str(), "1234567890abcdef");
    EXPECT_FALSE(tag.value().message.has_value());
}

// Test: Show without a commit line cannot resolve the hash
TEST(TagDecoderTest, ShowWithoutCommit) {
    auto tag = TagDecoder::decodeShow("v9", "error: nothing here\n");
    ASSERT_FALSE(tag.has_value());
    EXPECT_EQ(tag.error().code, ErrorCode::UnresolvedHash);
}
