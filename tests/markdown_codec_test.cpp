// markdown_codec_test.cpp
#include "markdown_codec.h"

#include <gtest/gtest.h>

using namespace mdtodo;

TEST(ParseMarkdown, ReadsOpenAndDoneItems) {
    auto items = parseMarkdown("- [ ] write report\n- [x] send mail\n- [X] pay rent\n");
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].text, "write report");
    EXPECT_FALSE(items[0].done);
    EXPECT_EQ(items[1].text, "send mail");
    EXPECT_TRUE(items[1].done);
    EXPECT_TRUE(items[2].done);
    for (const auto& item : items) {
        EXPECT_EQ(item.category, "uncategorized");
    }
}

TEST(ParseMarkdown, TrailingTagSetsCategory) {
    auto items = parseMarkdown("- [ ] buy milk #home\n- [ ] fix #bug in parser\n");
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].text, "buy milk");
    EXPECT_EQ(items[0].category, "home");
    // Only a trailing tag counts.
    EXPECT_EQ(items[1].text, "fix #bug in parser");
    EXPECT_EQ(items[1].category, "uncategorized");
}

TEST(ParseMarkdown, MissingTagUsesDefaultCategory) {
    auto items = parseMarkdown("- [ ] write report\n- [ ] call bob #phone\n", "work");
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].category, "work");
    EXPECT_EQ(items[1].category, "phone");
}

TEST(ParseMarkdown, IgnoresNonTodoLines) {
    const std::string doc =
        "# Work Tasks\n"
        "\n"
        "## Active\n"
        "Some prose about the project.\n"
        "* [ ] star bullet\n"
        "-[ ] no space\n"
        "- [y] bad mark\n"
        "  - [ ] indented\n"
        "- [ ]    \n"
        "- [ ] real one\n";
    auto items = parseMarkdown(doc);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].text, "real one");
}

TEST(ParseMarkdown, HandlesCrlfAndTrailingSpaces) {
    auto items = parseMarkdown("- [x] done thing   \r\n- [ ] tagged #work \r\n");
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].text, "done thing");
    EXPECT_TRUE(items[0].done);
    EXPECT_EQ(items[1].text, "tagged");
    EXPECT_EQ(items[1].category, "work");
}

TEST(ParseMarkdown, EmptyInputYieldsNothing) {
    EXPECT_TRUE(parseMarkdown("").empty());
    EXPECT_TRUE(parseMarkdown("\n\n# Title\n").empty());
}

TEST(SerializeMarkdown, WritesActiveThenCompleted) {
    std::vector<TodoItem> items(3);
    items[0].text = "a";
    items[1].text = "b";
    items[1].done = true;
    items[2].text = "c";
    items[2].category = "work";

    EXPECT_EQ(serializeMarkdown(items, "work"),
              "# Work Tasks\n"
              "\n"
              "## Active\n"
              "\n"
              "- [ ] a\n"
              "- [ ] c\n"
              "\n"
              "## Completed\n"
              "\n"
              "- [x] b\n");
}

TEST(SerializeMarkdown, OmitsEmptySections) {
    std::vector<TodoItem> done(1);
    done[0].text = "finished";
    done[0].done = true;
    EXPECT_EQ(serializeMarkdown(done, "home"), "# Home Tasks\n\n## Completed\n\n- [x] finished\n");

    std::vector<TodoItem> open(1);
    open[0].text = "pending";
    EXPECT_EQ(serializeMarkdown(open, "home"), "# Home Tasks\n\n## Active\n\n- [ ] pending\n\n");

    EXPECT_EQ(serializeMarkdown({}, "misc"), "# Misc Tasks\n\n");
}

TEST(SerializeMarkdown, NeverWritesTags) {
    std::vector<TodoItem> items(1);
    items[0].text = "call mom";
    items[0].category = "home";
    std::string doc = serializeMarkdown(items, "home");
    EXPECT_EQ(doc.find('#', doc.find("call mom")), std::string::npos);
}

TEST(SerializeMarkdown, ParseRecoversTextAndStatus) {
    std::vector<TodoItem> items(4);
    items[0].text = "first";
    items[1].text = "second";
    items[1].done = true;
    items[2].text = "first";
    items[3].text = "with [brackets] and - dashes";
    items[3].category = "misc";

    auto parsed = parseMarkdown(serializeMarkdown(items, "anything"));
    ASSERT_EQ(parsed.size(), 4u);
    // Active items come first, completed after.
    EXPECT_EQ(parsed[0].text, "first");
    EXPECT_EQ(parsed[1].text, "first");
    EXPECT_EQ(parsed[2].text, "with [brackets] and - dashes");
    EXPECT_EQ(parsed[3].text, "second");
    EXPECT_TRUE(parsed[3].done);
    for (const auto& item : parsed) {
        EXPECT_EQ(item.category, "uncategorized");
    }
}

TEST(SerializeMarkdown, EscapesTextEndingInHashWord) {
    std::vector<TodoItem> items(2);
    items[0].text = "fix issue #42";
    items[1].text = "literal \\#b";

    std::string doc = serializeMarkdown(items, "work");
    EXPECT_NE(doc.find("- [ ] fix issue \\#42\n"), std::string::npos);
    EXPECT_NE(doc.find("- [ ] literal \\\\#b\n"), std::string::npos);

    auto parsed = parseMarkdown(doc, "work");
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[0].text, "fix issue #42");
    EXPECT_EQ(parsed[0].category, "work");
    EXPECT_EQ(parsed[1].text, "literal \\#b");
    EXPECT_EQ(parsed[1].category, "work");
}

TEST(CategoryTitle, CapitalizesFirstLetterOnly) {
    EXPECT_EQ(categoryTitle("work"), "Work");
    EXPECT_EQ(categoryTitle("HOME"), "Home");
    EXPECT_EQ(categoryTitle("side_project"), "Side_project");
    EXPECT_EQ(categoryTitle(""), "");
}

TEST(Trim, StripsSurroundingWhitespace) {
    EXPECT_EQ(trim("  a b \t\n"), "a b");
    EXPECT_EQ(trim("   "), "");
}

TEST(Utf8, DetectsInvalidSequences) {
    EXPECT_TRUE(isValidUtf8("plain ascii"));
    EXPECT_TRUE(isValidUtf8("caf\xc3\xa9 \xe2\x9c\x93"));
    EXPECT_FALSE(isValidUtf8("bad \xff byte"));
    EXPECT_FALSE(isValidUtf8("truncated \xe2\x9c"));
    EXPECT_FALSE(isValidUtf8("\xc0\xaf"));
}
