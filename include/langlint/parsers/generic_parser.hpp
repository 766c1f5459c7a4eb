#pragma once

#include "parser.hpp"

#include <functional>
#include <variant>

namespace langlint {

/**
 * Comment conventions of one language family.
 */
struct CommentStyle {
    std::vector<std::string> line_markers;   // e.g. "//", "#", "--"
    std::string block_start;                 // empty when the family has no block comments
    std::string block_end;

    bool has_block() const { return !block_start.empty() && !block_end.empty(); }

    static CommentStyle c_style();       // "//", "/* */"
    static CommentStyle hash_style();    // "#"
    static CommentStyle dash_style();    // "--", "/* */"

    // Style for a lowercase extension; unknown extensions get C style
    static CommentStyle for_extension(const std::string& extension);
};

enum class CommentKind { LINE, BLOCK };

struct ScannedComment {
    std::string text;        // trimmed, delimiters removed
    uint32_t line = 0;       // start line (1-based)
    uint32_t end_line = 0;
    uint32_t column = 0;     // 1-based byte column of the opening marker
    CommentKind kind = CommentKind::LINE;
};

/**
 * Line-by-line comment state machine.
 *
 * States are Normal and InBlock{start line, accumulated text}. Within a
 * line, whichever marker appears first wins: a line marker consumes the
 * rest of the line, a block marker switches to InBlock until its closing
 * marker. At most one comment is reported per physical line range; a
 * comment starting on a line already covered by a reported one is ignored.
 * A block left open at end of input is dropped.
 */
class CommentScanner {
public:
    using Filter = std::function<bool(std::string_view)>;

    explicit CommentScanner(CommentStyle style, Filter accept = nullptr);

    void feed(std::string_view line, uint32_t line_number);

    bool in_block() const { return std::holds_alternative<InBlock>(state_); }

    // Comments reported so far, in order of their closing line
    const std::vector<ScannedComment>& comments() const { return comments_; }

private:
    struct Normal {};
    struct InBlock {
        uint32_t start_line = 0;
        uint32_t start_column = 0;
        std::vector<std::string> pieces;
    };

    CommentStyle style_;
    Filter accept_;
    std::variant<Normal, InBlock> state_;
    std::vector<ScannedComment> comments_;
    uint32_t last_covered_line_ = 0;

    void close_block(const InBlock& block, uint32_t end_line);
    void report(ScannedComment comment);
    std::pair<size_t, size_t> find_line_marker(std::string_view line, size_t from) const;
};

/**
 * Comment extractor for C-like and script-like languages
 * (JavaScript/TypeScript, Go, Rust, Java, C/C++, C#, PHP, Ruby, shell,
 * SQL, R, Objective-C, Scala, Kotlin, Swift, Dart, Lua, Vim script).
 */
class GenericCodeParser : public Parser {
public:
    std::string name() const override { return "GenericCodeParser"; }
    std::set<std::string> supported_extensions() const override;
    bool can_parse(const std::string& path,
                   std::optional<std::string_view> content = std::nullopt) const override;
    Result<ParseResult> extract_units(const std::string& content,
                                      const std::string& path) const override;
    Result<std::string> reconstruct(const std::string& original,
                                    const std::vector<TranslatableUnit>& units,
                                    const std::string& path) const override;

    /**
     * At least 3 non-whitespace characters, no URL, at least a third
     * letters, and no short (< 20 chars) text holding a TODO-style marker.
     */
    static bool is_translatable(std::string_view text);
};

}  // namespace langlint
