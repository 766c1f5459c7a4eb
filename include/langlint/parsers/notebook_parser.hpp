#pragma once

#include "parser.hpp"

namespace langlint {

/**
 * Extracts markdown cells and code-cell comments from Jupyter notebooks.
 *
 * Markdown cells become TEXT_NODE units anchored at the cell index.
 * Code-cell comment lines become COMMENT units anchored at
 * `cell_index * CELL_LINE_STRIDE + line_offset`; both carry
 * `metadata.cell_index` (and `metadata.line_offset` for comments) which
 * reconstruction uses to locate them. Only comments that already hold
 * non-ASCII text are extracted.
 */
class NotebookParser : public Parser {
public:
    std::string name() const override { return "NotebookParser"; }
    std::set<std::string> supported_extensions() const override;
    bool can_parse(const std::string& path,
                   std::optional<std::string_view> content = std::nullopt) const override;

    // Malformed JSON or a missing cell list is a PARSE_ERROR
    Result<ParseResult> extract_units(const std::string& content,
                                      const std::string& path) const override;

    /**
     * Rewrites changed markdown cells wholesale and changed comment lines in
     * place, keeping the cell source in its original form (string or list
     * of lines). Returns the original text untouched when nothing changed.
     */
    Result<std::string> reconstruct(const std::string& original,
                                    const std::vector<TranslatableUnit>& units,
                                    const std::string& path) const override;

    static bool is_translatable(std::string_view text);

    static constexpr uint32_t CELL_LINE_STRIDE = 1000;
    // Indentation used when writing the document back, as Jupyter does
    static constexpr int JSON_INDENT = 1;
};

}  // namespace langlint
