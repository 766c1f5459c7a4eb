#include <gtest/gtest.h>
#include <langlint/util/text.hpp>
#include <langlint/util/utf8.hpp>

using namespace langlint;

TEST(TextTest, SplitJoinIsLossless) {
    for (std::string s : {"", "a", "a\n", "a\nb", "a\r\nb\r\n", "\n\n", "x\n\ny\n"}) {
        EXPECT_EQ(text::join_lines(text::split_lines(s)), s);
    }
    auto lines = text::split_lines("a\nb\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[2], "");
}

TEST(TextTest, CountLines) {
    EXPECT_EQ(text::count_lines(""), 0u);
    EXPECT_EQ(text::count_lines("a"), 1u);
    EXPECT_EQ(text::count_lines("a\nb\n"), 2u);
    EXPECT_EQ(text::count_lines("a\nb"), 2u);
}

TEST(TextTest, Extensions) {
    EXPECT_EQ(text::extension_of("src/main.PY"), ".py");
    EXPECT_EQ(text::raw_extension_of("analysis.R"), ".R");
    EXPECT_EQ(text::extension_of("Makefile"), "");
    EXPECT_EQ(text::extension_of(".bashrc"), "");
    EXPECT_EQ(text::extension_of("dir.d/file"), "");
}

TEST(TextTest, ReplaceTrailingTextKeepsGapAndTrailingSpace) {
    std::string line = "int x = 1;   //   old text  ";
    size_t marker = line.find("//") + 2;
    EXPECT_EQ(text::replace_trailing_text(line, marker, "new"), "int x = 1;   //   new  ");
    // Unchanged text leaves the line as is
    EXPECT_EQ(text::replace_trailing_text(line, marker, "old text"), line);
    // No gap gets a single space
    EXPECT_EQ(text::replace_trailing_text("//old", 2, "new"), "// new");
    // Carriage return survives
    EXPECT_EQ(text::replace_trailing_text("# old\r", 1, "new"), "# new\r");
}

TEST(TextTest, ReplaceEnclosedText) {
    std::string line = "x = 1; /* old */ y = 2;";
    size_t begin = line.find("/*") + 2;
    size_t end = line.find("*/");
    EXPECT_EQ(text::replace_enclosed_text(line, begin, end, "new"), "x = 1; /* new */ y = 2;");
    EXPECT_EQ(text::replace_enclosed_text(line, begin, end, "old"), line);
}

TEST(TextTest, FlattenNewlines) {
    EXPECT_EQ(text::flatten_newlines("a\nb\r\nc\rd"), "a b c d");
    EXPECT_EQ(text::flatten_newlines("plain"), "plain");
}

TEST(Utf8Test, DecodeAndClassify) {
    EXPECT_EQ(utf8::length("héllo"), 5u);
    EXPECT_EQ(utf8::length("中文"), 2u);

    auto cps = utf8::decode("a中");
    ASSERT_EQ(cps.size(), 2u);
    EXPECT_EQ(cps[0], 'a');
    EXPECT_EQ(cps[1], 0x4E2Du);

    EXPECT_TRUE(utf8::is_han(0x4E2Du));
    EXPECT_TRUE(utf8::is_kana(0x3042u));
    EXPECT_TRUE(utf8::is_hangul(0xD55Cu));
    EXPECT_TRUE(utf8::is_letter(0xE9u));
    EXPECT_TRUE(utf8::is_letter(0x4E2Du));
    EXPECT_FALSE(utf8::is_letter('7'));
}

TEST(Utf8Test, InvalidBytesBecomeReplacementCharacter) {
    std::string bad = "a\xFF" "b";
    auto cps = utf8::decode(bad);
    ASSERT_EQ(cps.size(), 3u);
    EXPECT_EQ(cps[1], utf8::REPLACEMENT_CHARACTER);
}
