#include <langlint/parsers/python_parser.hpp>
#include <langlint/parsers/filters.hpp>
#include <langlint/util/text.hpp>

#include <algorithm>

namespace langlint {

namespace {

constexpr std::string_view DOUBLE_QUOTES = "\"\"\"";
constexpr std::string_view SINGLE_QUOTES = "'''";

constexpr std::string_view KEYWORDS[] = {
    "self", "cls", "args", "kwargs", "return", "def", "class", "import",
    "TODO", "FIXME", "NOTE", "HACK", "XXX"
};

std::string_view opening_quote(std::string_view trimmed) {
    if (text::starts_with(trimmed, DOUBLE_QUOTES)) return DOUBLE_QUOTES;
    if (text::starts_with(trimmed, SINGLE_QUOTES)) return SINGLE_QUOTES;
    return {};
}

struct Docstring {
    std::string text;
    size_t end_index = 0;     // line index holding the closing quote
};

/**
 * Read the docstring opening on lines[start].
 * Returns nullopt when the line does not open one or it is never closed.
 */
std::optional<Docstring> read_docstring(const std::vector<std::string>& lines, size_t start) {
    std::string_view trimmed = text::trim(lines[start]);
    std::string_view quote = opening_quote(trimmed);
    if (quote.empty()) {
        return std::nullopt;
    }

    std::string_view after = trimmed.substr(quote.size());
    size_t close = after.find(quote);
    if (close != std::string_view::npos) {
        return Docstring{std::string(text::trim(after.substr(0, close))), start};
    }

    std::string joined;
    auto append = [&joined](std::string_view piece) {
        piece = text::trim(piece);
        if (piece.empty()) return;
        if (!joined.empty()) joined += ' ';
        joined += piece;
    };

    append(after);
    for (size_t j = start + 1; j < lines.size(); ++j) {
        std::string_view line = lines[j];
        size_t pos = line.find(quote);
        if (pos != std::string_view::npos) {
            append(line.substr(0, pos));
            return Docstring{joined, j};
        }
        append(line);
    }
    return std::nullopt;
}

// Triple quote left open on a code line (e.g. `x = """...`), or empty.
// Quotes inside ordinary string literals or after a `#` do not count.
std::string_view unclosed_literal(std::string_view line) {
    size_t pos = 0;
    while (pos < line.size()) {
        char c = line[pos];
        if (c == '#') {
            return {};
        }
        if (c != '"' && c != '\'') {
            ++pos;
            continue;
        }

        std::string_view triple = c == '"' ? DOUBLE_QUOTES : SINGLE_QUOTES;
        if (line.substr(pos, triple.size()) == triple) {
            size_t close = line.find(triple, pos + triple.size());
            if (close == std::string_view::npos) {
                return triple;
            }
            pos = close + triple.size();
            continue;
        }

        // Ordinary literal: skip to the matching unescaped quote
        ++pos;
        while (pos < line.size() && line[pos] != c) {
            pos += line[pos] == '\\' ? 2 : 1;
        }
        ++pos;
    }
    return {};
}

}  // namespace

std::set<std::string> PythonParser::supported_extensions() const {
    return {".py", ".pyi", ".pyw"};
}

bool PythonParser::can_parse(const std::string& path,
                             std::optional<std::string_view> content) const {
    if (has_supported_extension(path)) {
        return true;
    }
    if (!content) {
        return false;
    }
    std::string_view head = content->substr(0, SNIFF_BYTES);
    return text::contains(head, "def ") || text::contains(head, "class ") ||
           text::contains(head, "import ");
}

bool PythonParser::is_translatable(std::string_view raw) {
    std::string_view trimmed = text::trim(raw);
    auto counts = filters::count_chars(trimmed);
    if (counts.non_space < 3) {
        return false;
    }
    if (filters::contains_url(trimmed)) {
        return false;
    }
    if (text::contains(trimmed, "@") && text::contains(trimmed, ".")) {
        return false;
    }
    // is_letter already covers Han, kana and Hangul
    if (counts.letters * 3 < counts.total) {
        return false;
    }
    for (std::string_view keyword : KEYWORDS) {
        if (trimmed == keyword) {
            return false;
        }
    }
    if (counts.total < filters::MARKER_LENGTH_LIMIT && filters::contains_technical_marker(trimmed)) {
        return false;
    }
    return true;
}

Result<ParseResult> PythonParser::extract_units(const std::string& content,
                                                const std::string& path) const {
    ParseResult result;
    result.file_type = "python";
    result.line_count = static_cast<uint32_t>(text::count_lines(content));
    result.metadata = {{"parser", name()}, {"file_path", path}};

    auto lines = text::split_lines(content);
    size_t i = 0;
    while (i < lines.size()) {
        const std::string& line = lines[i];
        std::string_view trimmed = text::trim(line);
        uint32_t line_number = static_cast<uint32_t>(i + 1);

        if (text::starts_with(trimmed, "#")) {
            std::string_view body = text::trim(trimmed.substr(1));
            if (!body.empty() && is_translatable(body)) {
                TranslatableUnit unit(std::string(body), UnitType::COMMENT, line_number,
                                      static_cast<uint32_t>(line.find('#') + 1));
                unit.priority = Priority::MEDIUM;
                unit.context = "Line " + std::to_string(line_number) + ": " + std::string(trimmed);
                unit.detect_language();
                result.units.push_back(std::move(unit));
            }
            ++i;
            continue;
        }

        if (!opening_quote(trimmed).empty()) {
            auto docstring = read_docstring(lines, i);
            if (!docstring) {
                // Unterminated: the rest of the file is inside the string
                break;
            }
            if (!docstring->text.empty() && is_translatable(docstring->text)) {
                uint32_t column = static_cast<uint32_t>(text::indentation(line).size() + 1);
                TranslatableUnit unit(docstring->text, UnitType::DOCSTRING, line_number, column);
                unit.priority = Priority::HIGH;
                if (docstring->end_index == i) {
                    unit.context = "Docstring at line " + std::to_string(line_number);
                } else {
                    uint32_t end_line = static_cast<uint32_t>(docstring->end_index + 1);
                    unit.context = "Multi-line docstring at lines " + std::to_string(line_number) +
                                   "-" + std::to_string(end_line);
                    unit.metadata = {{"span", end_line - line_number + 1}, {"end_line", end_line}};
                }
                unit.detect_language();
                result.units.push_back(std::move(unit));
            }
            i = docstring->end_index + 1;
            continue;
        }

        std::string_view literal = unclosed_literal(line);
        if (!literal.empty()) {
            size_t j = i + 1;
            while (j < lines.size() && lines[j].find(literal) == std::string::npos) {
                ++j;
            }
            i = j + 1;
            continue;
        }
        ++i;
    }

    return result;
}

Result<std::string> PythonParser::reconstruct(const std::string& original,
                                              const std::vector<TranslatableUnit>& units,
                                              const std::string& /*path*/) const {
    auto lines = text::split_lines(original);
    std::vector<bool> removed(lines.size(), false);

    for (const auto& unit : units) {
        uint32_t line_number = unit.position.line;
        if (line_number == 0 || line_number > lines.size()) {
            continue;
        }
        size_t index = line_number - 1;
        if (removed[index]) {
            continue;
        }
        std::string& line = lines[index];
        std::string replacement = text::flatten_newlines(unit.content);

        if (unit.unit_type == UnitType::COMMENT) {
            size_t hash = line.find('#');
            if (hash == std::string::npos) continue;
            line = text::replace_trailing_text(line, hash + 1, replacement);
            continue;
        }
        if (unit.unit_type != UnitType::DOCSTRING) {
            continue;
        }

        std::string_view quote = text::contains(line, DOUBLE_QUOTES) ? DOUBLE_QUOTES : SINGLE_QUOTES;
        uint32_t span = unit.span();

        if (span <= 1) {
            size_t open = line.find(quote);
            if (open == std::string::npos) continue;
            size_t begin = open + quote.size();
            size_t close = line.find(quote, begin);
            if (close == std::string::npos) continue;
            line = text::replace_enclosed_text(line, begin, close, replacement);
            continue;
        }

        auto existing = read_docstring(lines, index);
        if (existing && existing->text == replacement) {
            continue;
        }

        bool carriage_return = text::ends_with(line, "\r");
        std::string collapsed(text::indentation(line));
        collapsed += quote;
        collapsed += replacement;
        collapsed += quote;
        if (carriage_return) collapsed += '\r';
        line = std::move(collapsed);

        for (size_t k = index + 1; k < index + span && k < lines.size(); ++k) {
            removed[k] = true;
        }
    }

    std::vector<std::string> kept;
    kept.reserve(lines.size());
    for (size_t k = 0; k < lines.size(); ++k) {
        if (!removed[k]) kept.push_back(std::move(lines[k]));
    }
    return text::join_lines(kept);
}

}  // namespace langlint
