#include <gtest/gtest.h>
#include "utils/Text.hpp"

using namespace configdesk;

TEST(TextTest, DecodesValidUtf8) {
    auto decoded = text::decodeUtf8("Listening on port 3333 \xE2\x9C\x93");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, "Listening on port 3333 \xE2\x9C\x93");
}

TEST(TextTest, DecodesEmptyInput) {
    auto decoded = text::decodeUtf8("");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->empty());
}

TEST(TextTest, RejectsInvalidUtf8) {
    EXPECT_FALSE(text::decodeUtf8("bad \xFF\xFE bytes").has_value());
    // Truncated multi-byte sequence
    EXPECT_FALSE(text::decodeUtf8("\xE2\x9C").has_value());
}

TEST(TextTest, TruncatesByCharacterNotByte) {
    const std::string accented = "\xC3\xA9\xC3\xA9\xC3\xA9"; // three e-acute
    EXPECT_EQ(text::truncateChars(accented, 2), "\xC3\xA9\xC3\xA9");
    EXPECT_EQ(text::truncateChars(accented, 3), accented);
    EXPECT_EQ(text::truncateChars(accented, 10), accented);
    EXPECT_EQ(text::truncateChars("abc", 0), "");
}

TEST(TextTest, TruncatesOutsideTheBasicPlaneWithoutSplittingPairs) {
    const std::string faces = "\xF0\x9F\x98\x80\xF0\x9F\x98\x81x"; // two emoji, then x
    EXPECT_EQ(text::truncateChars(faces, 1), "\xF0\x9F\x98\x80");
    EXPECT_EQ(text::truncateChars(faces, 2), "\xF0\x9F\x98\x80\xF0\x9F\x98\x81");
    EXPECT_EQ(text::truncateChars(faces, 3), faces);
}

TEST(TextTest, StripsLineEndings) {
    EXPECT_EQ(text::stripLineEnding("line\n"), "line");
    EXPECT_EQ(text::stripLineEnding("line\r\n"), "line");
    EXPECT_EQ(text::stripLineEnding("line"), "line");
    EXPECT_EQ(text::stripLineEnding("\n"), "");
    EXPECT_EQ(text::stripLineEnding("a\rb\n"), "a\rb");
}
