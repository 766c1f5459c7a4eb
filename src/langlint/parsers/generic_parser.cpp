#include <langlint/parsers/generic_parser.hpp>
#include <langlint/parsers/filters.hpp>
#include <langlint/util/text.hpp>

#include <algorithm>

namespace langlint {

// ============================================================================
// CommentStyle
// ============================================================================

CommentStyle CommentStyle::c_style() {
    return CommentStyle{{"//"}, "/*", "*/"};
}

CommentStyle CommentStyle::hash_style() {
    return CommentStyle{{"#"}, "", ""};
}

CommentStyle CommentStyle::dash_style() {
    return CommentStyle{{"--"}, "/*", "*/"};
}

CommentStyle CommentStyle::for_extension(const std::string& extension) {
    if (extension == ".sh" || extension == ".bash" || extension == ".r" || extension == ".rb") {
        return hash_style();
    }
    if (extension == ".lua" || extension == ".sql") {
        return dash_style();
    }
    return c_style();
}

// ============================================================================
// CommentScanner
// ============================================================================

CommentScanner::CommentScanner(CommentStyle style, Filter accept)
    : style_(std::move(style)), accept_(std::move(accept)), state_(Normal{}) {}

std::pair<size_t, size_t> CommentScanner::find_line_marker(std::string_view line,
                                                           size_t from) const {
    size_t best = std::string_view::npos;
    size_t best_len = 0;
    for (const auto& marker : style_.line_markers) {
        size_t pos = line.find(marker, from);
        if (pos < best) {
            best = pos;
            best_len = marker.size();
        }
    }
    return {best, best_len};
}

void CommentScanner::feed(std::string_view line, uint32_t line_number) {
    size_t cursor = 0;
    while (cursor <= line.size()) {
        if (auto* block = std::get_if<InBlock>(&state_)) {
            size_t close = line.find(style_.block_end, cursor);
            if (close == std::string_view::npos) {
                std::string_view piece = text::trim(line.substr(cursor));
                if (!piece.empty()) block->pieces.emplace_back(piece);
                return;
            }
            std::string_view piece = text::trim(line.substr(cursor, close - cursor));
            if (!piece.empty()) block->pieces.emplace_back(piece);
            InBlock finished = std::move(*block);
            state_ = Normal{};
            close_block(finished, line_number);
            cursor = close + style_.block_end.size();
            continue;
        }

        auto [marker, marker_len] = find_line_marker(line, cursor);
        size_t open = style_.has_block() ? line.find(style_.block_start, cursor)
                                         : std::string_view::npos;
        if (marker == std::string_view::npos && open == std::string_view::npos) {
            return;
        }

        if (marker < open) {
            ScannedComment comment;
            comment.text = std::string(text::trim(line.substr(marker + marker_len)));
            comment.line = line_number;
            comment.end_line = line_number;
            comment.column = static_cast<uint32_t>(marker + 1);
            comment.kind = CommentKind::LINE;
            report(std::move(comment));
            return;
        }

        state_ = InBlock{line_number, static_cast<uint32_t>(open + 1), {}};
        cursor = open + style_.block_start.size();
    }
}

void CommentScanner::close_block(const InBlock& block, uint32_t end_line) {
    std::string joined;
    for (const auto& piece : block.pieces) {
        if (!joined.empty()) joined += ' ';
        joined += piece;
    }

    ScannedComment comment;
    comment.text = std::move(joined);
    comment.line = block.start_line;
    comment.end_line = end_line;
    comment.column = block.start_column;
    comment.kind = CommentKind::BLOCK;
    report(std::move(comment));
}

void CommentScanner::report(ScannedComment comment) {
    if (comment.line <= last_covered_line_) {
        return;
    }
    if (comment.text.empty()) {
        return;
    }
    if (accept_ && !accept_(comment.text)) {
        return;
    }
    last_covered_line_ = comment.end_line;
    comments_.push_back(std::move(comment));
}

// ============================================================================
// GenericCodeParser
// ============================================================================

std::set<std::string> GenericCodeParser::supported_extensions() const {
    return {
        ".js", ".ts", ".jsx", ".tsx", ".go", ".rs", ".java", ".c", ".cpp", ".h", ".hpp",
        ".cs", ".php", ".rb", ".sh", ".bash", ".sql", ".r", ".m", ".scala", ".kt",
        ".swift", ".dart", ".lua", ".vim"
    };
}

bool GenericCodeParser::can_parse(const std::string& path,
                                  std::optional<std::string_view> /*content*/) const {
    return has_supported_extension(path);
}

bool GenericCodeParser::is_translatable(std::string_view text) {
    auto counts = filters::count_chars(text);
    if (counts.non_space < 3) {
        return false;
    }
    if (filters::contains_url(text)) {
        return false;
    }
    if (counts.letters * 3 < counts.total) {
        return false;
    }
    if (counts.total < filters::MARKER_LENGTH_LIMIT && filters::contains_technical_marker(text)) {
        return false;
    }
    return true;
}

Result<ParseResult> GenericCodeParser::extract_units(const std::string& content,
                                                     const std::string& path) const {
    std::string extension = text::extension_of(path);
    CommentScanner scanner(CommentStyle::for_extension(extension), &GenericCodeParser::is_translatable);

    auto lines = text::split_lines(content);
    for (size_t i = 0; i < lines.size(); ++i) {
        scanner.feed(lines[i], static_cast<uint32_t>(i + 1));
    }

    ParseResult result;
    result.file_type = "generic_code";
    result.line_count = static_cast<uint32_t>(text::count_lines(content));
    result.metadata = {
        {"parser", name()},
        {"file_path", path},
        {"extension", extension}
    };

    for (const auto& comment : scanner.comments()) {
        TranslatableUnit unit(comment.text, UnitType::COMMENT, comment.line, comment.column);
        unit.priority = Priority::MEDIUM;
        if (comment.kind == CommentKind::LINE) {
            unit.context = "Single-line comment at line " + std::to_string(comment.line);
            unit.metadata = {{"style", "line"}};
        } else {
            uint32_t span = comment.end_line - comment.line + 1;
            unit.context = span == 1
                ? "Block comment at line " + std::to_string(comment.line)
                : "Multi-line comment at lines " + std::to_string(comment.line) + "-" +
                  std::to_string(comment.end_line);
            unit.metadata = {{"style", "block"}, {"span", span}, {"end_line", comment.end_line}};
        }
        unit.detect_language();
        result.units.push_back(std::move(unit));
    }

    return result;
}

namespace {

bool is_block_unit(const TranslatableUnit& unit) {
    return unit.metadata.is_object() && unit.metadata.value("style", "") == "block";
}

// Marker position: at the recorded column when it matches there, else the first one
std::pair<size_t, size_t> locate_marker(const std::string& line,
                                        const std::vector<std::string>& markers,
                                        uint32_t column) {
    if (column > 0 && column - 1 < line.size()) {
        size_t at = column - 1;
        for (const auto& marker : markers) {
            if (line.compare(at, marker.size(), marker) == 0) {
                return {at, marker.size()};
            }
        }
    }
    size_t best = std::string::npos;
    size_t best_len = 0;
    for (const auto& marker : markers) {
        size_t pos = line.find(marker);
        if (pos < best) {
            best = pos;
            best_len = marker.size();
        }
    }
    return {best, best_len};
}

}  // namespace

Result<std::string> GenericCodeParser::reconstruct(const std::string& original,
                                                   const std::vector<TranslatableUnit>& units,
                                                   const std::string& path) const {
    CommentStyle style = CommentStyle::for_extension(text::extension_of(path));
    auto lines = text::split_lines(original);

    std::vector<const TranslatableUnit*> ordered;
    for (const auto& unit : units) {
        if (unit.unit_type == UnitType::COMMENT) ordered.push_back(&unit);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const TranslatableUnit* a, const TranslatableUnit* b) {
                         return a->position.line > b->position.line;
                     });

    for (const TranslatableUnit* unit : ordered) {
        uint32_t line_number = unit->position.line;
        if (line_number == 0 || line_number > lines.size()) {
            continue;
        }
        std::string& line = lines[line_number - 1];
        std::string replacement = text::flatten_newlines(unit->content);

        if (is_block_unit(*unit)) {
            // Multi-line blocks keep their original text
            if (unit->span() > 1 || !style.has_block()) {
                continue;
            }
            size_t open = std::string::npos;
            if (unit->position.column > 0 && unit->position.column - 1 < line.size() &&
                line.compare(unit->position.column - 1, style.block_start.size(), style.block_start) == 0) {
                open = unit->position.column - 1;
            } else {
                open = line.find(style.block_start);
            }
            if (open == std::string::npos) continue;
            size_t begin = open + style.block_start.size();
            size_t close = line.find(style.block_end, begin);
            if (close == std::string::npos) continue;
            line = text::replace_enclosed_text(line, begin, close, replacement);
            continue;
        }

        auto [marker, marker_len] = locate_marker(line, style.line_markers, unit->position.column);
        if (marker == std::string::npos) {
            continue;
        }
        line = text::replace_trailing_text(line, marker + marker_len, replacement);
    }

    return text::join_lines(lines);
}

}  // namespace langlint
