#include <gtest/gtest.h>

#include "acerelay/model/ContentId.hpp"

using acerelay::model::ContentId;

namespace {
constexpr const char* kId = "0123456789abcdef0123456789abcdef01234567";
}

// A 40 character hex string is accepted as-is.
TEST(ContentIdTest, AcceptsLowercaseHex) {
    auto id = ContentId::parse(kId);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->str(), kId);
}

// Uppercase input is normalized so both spellings name the same stream.
TEST(ContentIdTest, NormalizesUppercase) {
    auto upper = ContentId::parse("0123456789ABCDEF0123456789ABCDEF01234567");
    auto lower = ContentId::parse(kId);
    ASSERT_TRUE(upper.has_value());
    ASSERT_TRUE(lower.has_value());
    EXPECT_EQ(*upper, *lower);
    EXPECT_EQ(upper->str(), kId);
}

TEST(ContentIdTest, RejectsWrongLengthOrCharacters) {
    EXPECT_FALSE(ContentId::parse("").has_value());
    EXPECT_FALSE(ContentId::parse("0123456789abcdef").has_value());
    EXPECT_FALSE(ContentId::parse("0123456789abcdef0123456789abcdef012345678").has_value());
    EXPECT_FALSE(ContentId::parse("0123456789abcdef0123456789abcdef0123456g").has_value());
    EXPECT_FALSE(ContentId::parse("0123456789abcdef0123456789abcdef0123456 ").has_value());
    EXPECT_FALSE(ContentId::isValid("not-a-content-id"));
}

// Log lines carry only the first eight characters.
TEST(ContentIdTest, ShortFormTruncates) {
    auto id = ContentId::parse(kId);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->shortForm(), "01234567...");
    EXPECT_EQ(acerelay::model::shortId("abc"), "abc...");
}
