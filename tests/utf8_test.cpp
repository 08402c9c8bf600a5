// utf8_test.cpp
#include "utf8.h"

#include <gtest/gtest.h>

namespace mdtodo {
namespace test {

TEST(Utf8Text, CountsAndSlicesByCodepoint) {
    const std::string text = "na\xc3\xafve \xe2\x9c\x93";
    EXPECT_EQ(codepointCount(text), 7u);
    EXPECT_EQ(codepointCount(text, 4), 3u);
    EXPECT_EQ(byteOffsetOf(text, 3), 4u);
    EXPECT_EQ(utf8Substr(text, 1, 2), "a\xc3\xaf");
    EXPECT_EQ(utf8Substr(text, 6), "\xe2\x9c\x93");
    EXPECT_EQ(utf8Substr(text, 0, 100), text);
}

TEST(WrapLines, BreaksAtLastBlank) {
    auto lines = wrapLines("write the quarterly report", 10);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "write the");
    EXPECT_EQ(lines[1], "quarterly");
    EXPECT_EQ(lines[2], "report");
}

TEST(WrapLines, HardBreaksLongWords) {
    auto lines = wrapLines("abcdefgh", 3);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "abc");
    EXPECT_EQ(lines[2], "gh");
}

TEST(WrapLines, NeverSplitsMultibyteCharacters) {
    // Five two-byte characters, width counted in characters.
    const std::string e = "\xc3\xa9";
    auto lines = wrapLines(e + e + e + e + e, 2);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], e + e);
    EXPECT_EQ(lines[1], e + e);
    EXPECT_EQ(lines[2], e);
    for (const std::string& line : wrapLines("caf\xc3\xa9 cr\xc3\xa8me br\xc3\xbbl\xc3\xa9e", 6)) {
        EXPECT_NE(line.back() & 0xC0, 0xC0) << line;
    }
}

TEST(WrapLines, EmptyTextTakesOneLine) {
    EXPECT_EQ(wrapLines("", 10).size(), 1u);
    EXPECT_EQ(wrapLines("abc", 0).size(), 1u);
}

} // namespace test
} // namespace mdtodo
