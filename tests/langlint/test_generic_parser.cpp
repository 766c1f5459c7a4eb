#include <gtest/gtest.h>
#include <langlint/parsers/generic_parser.hpp>

using namespace langlint;

class GenericParserTest : public ::testing::Test {
protected:
    std::vector<TranslatableUnit> extract(const std::string& content,
                                          const std::string& path = "main.js") {
        auto result = parser.extract_units(content, path);
        EXPECT_TRUE(result.ok());
        return result.ok() ? result.value().units : std::vector<TranslatableUnit>{};
    }

    std::string rebuild(const std::string& original, const std::vector<TranslatableUnit>& units,
                        const std::string& path = "main.js") {
        auto result = parser.reconstruct(original, units, path);
        EXPECT_TRUE(result.ok());
        return result.ok() ? result.value() : std::string();
    }

    GenericCodeParser parser;
};

// ============================================================================
// CommentScanner
// ============================================================================

TEST(CommentScannerTest, BlockBeforeLineMarkerWins) {
    CommentScanner scanner(CommentStyle::c_style());
    scanner.feed("x = 1; /* block text */ // line text", 1);

    ASSERT_EQ(scanner.comments().size(), 1u);
    EXPECT_EQ(scanner.comments()[0].kind, CommentKind::BLOCK);
    EXPECT_EQ(scanner.comments()[0].text, "block text");
    EXPECT_EQ(scanner.comments()[0].column, 8u);
    EXPECT_FALSE(scanner.in_block());
}

TEST(CommentScannerTest, LineMarkerBeforeBlockWins) {
    CommentScanner scanner(CommentStyle::c_style());
    scanner.feed("// line /* not a block", 1);
    scanner.feed("code();", 2);

    ASSERT_EQ(scanner.comments().size(), 1u);
    EXPECT_EQ(scanner.comments()[0].kind, CommentKind::LINE);
    EXPECT_EQ(scanner.comments()[0].text, "line /* not a block");
    EXPECT_FALSE(scanner.in_block());
}

TEST(CommentScannerTest, MultiLineBlockTransitions) {
    CommentScanner scanner(CommentStyle::c_style());
    scanner.feed("/*", 3);
    EXPECT_TRUE(scanner.in_block());
    scanner.feed("  first part", 4);
    EXPECT_TRUE(scanner.in_block());
    scanner.feed("  second part */ int y;", 5);
    EXPECT_FALSE(scanner.in_block());

    ASSERT_EQ(scanner.comments().size(), 1u);
    const auto& comment = scanner.comments()[0];
    EXPECT_EQ(comment.text, "first part second part");
    EXPECT_EQ(comment.line, 3u);
    EXPECT_EQ(comment.end_line, 5u);
}

TEST(CommentScannerTest, UnterminatedBlockIsDropped) {
    CommentScanner scanner(CommentStyle::c_style());
    scanner.feed("/* never closed", 1);
    scanner.feed("more text", 2);
    EXPECT_TRUE(scanner.in_block());
    EXPECT_TRUE(scanner.comments().empty());
}

TEST(CommentScannerTest, FilterRejectsComment) {
    CommentScanner scanner(CommentStyle::c_style(),
                           [](std::string_view text) { return text != "skip me"; });
    scanner.feed("// skip me", 1);
    scanner.feed("// keep me", 2);
    ASSERT_EQ(scanner.comments().size(), 1u);
    EXPECT_EQ(scanner.comments()[0].text, "keep me");
}

// ============================================================================
// Extraction
// ============================================================================

TEST_F(GenericParserTest, ShortTechnicalMarkerYieldsNothing) {
    EXPECT_TRUE(extract("// TODO\ncode();\n").empty());
}

TEST_F(GenericParserTest, ExtractsLineAndBlockComments) {
    std::string content =
        "// Initialize the connection pool\n"
        "int x = 1; // trailing note here\n"
        "/* short block text */\n"
        "/*\n"
        "  Multi line\n"
        "  block here\n"
        "*/\n";

    auto units = extract(content, "pool.c");
    ASSERT_EQ(units.size(), 4u);

    EXPECT_EQ(units[0].content, "Initialize the connection pool");
    EXPECT_EQ(units[0].position.line, 1u);
    EXPECT_EQ(units[0].position.column, 1u);
    EXPECT_EQ(units[0].unit_type, UnitType::COMMENT);
    EXPECT_EQ(units[0].context, std::string("Single-line comment at line 1"));

    EXPECT_EQ(units[1].content, "trailing note here");
    EXPECT_EQ(units[1].position.line, 2u);
    EXPECT_EQ(units[1].position.column, 12u);

    EXPECT_EQ(units[2].content, "short block text");
    EXPECT_EQ(units[2].span(), 1u);
    EXPECT_EQ(units[2].context, std::string("Block comment at line 3"));

    EXPECT_EQ(units[3].content, "Multi line block here");
    EXPECT_EQ(units[3].position.line, 4u);
    EXPECT_EQ(units[3].span(), 4u);
    EXPECT_EQ(units[3].end_line(), 7u);
    EXPECT_EQ(units[3].context, std::string("Multi-line comment at lines 4-7"));
}

TEST_F(GenericParserTest, ResultMetadata) {
    auto result = parser.extract_units("// Hello world\n", "src/app.ts");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().file_type, "generic_code");
    EXPECT_EQ(result.value().line_count, 1u);
    EXPECT_EQ(result.value().metadata["parser"], "GenericCodeParser");
    EXPECT_EQ(result.value().metadata["extension"], ".ts");
}

TEST_F(GenericParserTest, FilterBoundaries) {
    auto units = extract("// ab\n// abc\n");
    ASSERT_EQ(units.size(), 1u);
    EXPECT_EQ(units[0].content, "abc");
    EXPECT_EQ(units[0].position.line, 2u);

    EXPECT_TRUE(extract("// see https://example.com\n").empty());
    EXPECT_TRUE(extract("// ====== ------ 123\n").empty());
    // Long enough to be prose even with a marker
    EXPECT_EQ(extract("// TODO: refactor this whole module later\n").size(), 1u);
}

TEST_F(GenericParserTest, HashAndDashStyles) {
    auto shell = extract("# Install the dependencies\necho hi # print greeting text\n", "setup.sh");
    ASSERT_EQ(shell.size(), 2u);
    EXPECT_EQ(shell[0].content, "Install the dependencies");
    EXPECT_EQ(shell[1].content, "print greeting text");

    auto lua = extract("-- Compute the total\nlocal x = 1\n", "calc.lua");
    ASSERT_EQ(lua.size(), 1u);
    EXPECT_EQ(lua[0].content, "Compute the total");

    // "//" means nothing in a shell script
    EXPECT_TRUE(extract("// not a comment here\n", "run.sh").empty());
}

TEST_F(GenericParserTest, ExtractionIsIdempotent) {
    std::string content = "// 初始化连接池\nint x = 1; /* 注释文本 */\n";
    auto first = parser.extract_units(content, "a.cpp");
    auto second = parser.extract_units(content, "a.cpp");
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(first.value(), second.value());
}

TEST_F(GenericParserTest, CanParseByExtension) {
    EXPECT_TRUE(parser.can_parse("main.js"));
    EXPECT_TRUE(parser.can_parse("Main.JAVA"));
    EXPECT_TRUE(parser.can_parse("lib.rs"));
    EXPECT_FALSE(parser.can_parse("script.py"));
    EXPECT_FALSE(parser.can_parse("README"));
}

// ============================================================================
// Reconstruction
// ============================================================================

TEST_F(GenericParserTest, ReplacesCommentTextInPlace) {
    std::string original =
        "// Hello world\n"
        "int x = 1;  // old comment  \n"
        "/* short block */\n";

    auto units = extract(original);
    ASSERT_EQ(units.size(), 3u);
    units[0].content = "Bonjour le monde";
    units[1].content = "nouveau";
    units[2].content = "bloc court";

    EXPECT_EQ(rebuild(original, units),
              "// Bonjour le monde\n"
              "int x = 1;  // nouveau  \n"
              "/* bloc court */\n");
}

TEST_F(GenericParserTest, UnchangedUnitsRoundTrip) {
    std::string original =
        "/**\r\n"
        " Module header text\r\n"
        " */\r\n"
        "#include <stdio.h>\r\n"
        "\r\n"
        "int main() { // entry point here\r\n"
        "    return 0; /* exit code */\r\n"
        "}\r\n";

    auto units = extract(original, "main.c");
    ASSERT_FALSE(units.empty());
    EXPECT_EQ(rebuild(original, units, "main.c"), original);
}

TEST_F(GenericParserTest, RepeatedLineTextOnlyChangesTargetLine) {
    std::string original =
        "// same text here\n"
        "a();\n"
        "// same text here\n";

    auto units = extract(original);
    ASSERT_EQ(units.size(), 2u);
    units[1].content = "different text";

    EXPECT_EQ(rebuild(original, {units[1]}),
              "// same text here\n"
              "a();\n"
              "// different text\n");
}

TEST_F(GenericParserTest, MultiLineBlockKeepsOriginalText) {
    std::string original = "/*\n  Long block text\n  spanning lines\n*/\nint y;\n";
    auto units = extract(original);
    ASSERT_EQ(units.size(), 1u);
    units[0].content = "translated";
    EXPECT_EQ(rebuild(original, units), original);
}

TEST_F(GenericParserTest, TranslatedNewlinesAreFlattened) {
    std::string original = "// Hello world\ncode();\n";
    auto units = extract(original);
    ASSERT_EQ(units.size(), 1u);
    units[0].content = "first line\nsecond line";
    EXPECT_EQ(rebuild(original, units), "// first line second line\ncode();\n");
}
