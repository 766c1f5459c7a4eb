#pragma once

#include "parser.hpp"

namespace langlint {

/**
 * Extracts `#` comments and docstrings from Python sources.
 *
 * Works on trimmed lines, not on a syntax tree. Docstrings are lines that
 * open with a triple quote; a single-line docstring closes on the same
 * line, a multi-line one accumulates trimmed lines until the closing quote
 * and records its span. Other triple-quoted string literals are skipped
 * over so their contents are never mistaken for comments.
 */
class PythonParser : public Parser {
public:
    std::string name() const override { return "PythonParser"; }
    std::set<std::string> supported_extensions() const override;

    /**
     * Extension match, or for extension-less files a content sniff of the
     * first 500 bytes for "def ", "class " or "import ".
     */
    bool can_parse(const std::string& path,
                   std::optional<std::string_view> content = std::nullopt) const override;

    Result<ParseResult> extract_units(const std::string& content,
                                      const std::string& path) const override;

    /**
     * Comments keep everything up to and including '#'. A changed
     * multi-line docstring collapses to `{indent}{quote}{text}{quote}` on
     * its first line and the remaining lines of its span are removed.
     */
    Result<std::string> reconstruct(const std::string& original,
                                    const std::vector<TranslatableUnit>& units,
                                    const std::string& path) const override;

    static bool is_translatable(std::string_view text);

    static constexpr size_t SNIFF_BYTES = 500;
};

}  // namespace langlint
