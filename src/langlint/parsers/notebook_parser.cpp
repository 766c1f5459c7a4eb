#include <langlint/parsers/notebook_parser.hpp>
#include <langlint/parsers/filters.hpp>
#include <langlint/util/text.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <optional>

namespace langlint {

using ordered_json = nlohmann::ordered_json;

namespace {

constexpr std::string_view CODE_INDICATORS[] = {
    "import ", "def ", "class ", "return ", "=", "{", "}"
};

// Cell source is either one string or a list of lines
std::string source_text(const ordered_json& source) {
    if (source.is_string()) {
        return source.get<std::string>();
    }
    std::string out;
    if (source.is_array()) {
        for (const auto& piece : source) {
            if (piece.is_string()) out += piece.get<std::string>();
        }
    }
    return out;
}

// Inverse of source_text: "a\nb" -> ["a\n", "b"]
ordered_json to_source(const std::string& text, bool as_list) {
    if (!as_list) {
        return text;
    }
    ordered_json lines = ordered_json::array();
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl + 1 - start));
        start = nl + 1;
    }
    return lines;
}

Result<ordered_json> parse_notebook(const std::string& content, const std::string& path) {
    ordered_json doc;
    try {
        doc = ordered_json::parse(content);
    } catch (const ordered_json::exception& e) {
        return Error(ErrorCode::PARSE_ERROR, "Invalid notebook JSON: " + std::string(e.what()),
                     "NotebookParser", path);
    }
    if (!doc.is_object()) {
        return Error(ErrorCode::PARSE_ERROR, "Notebook root must be an object", "NotebookParser", path);
    }
    return doc;
}

// Missing or non-array "cells" reads as an empty notebook
ordered_json* cell_list(ordered_json& doc) {
    auto it = doc.find("cells");
    return it != doc.end() && it->is_array() ? &*it : nullptr;
}

std::optional<size_t> index_field(const nlohmann::json& meta, const char* key) {
    if (!meta.is_object()) return std::nullopt;
    auto it = meta.find(key);
    if (it == meta.end() || !it->is_number_unsigned()) return std::nullopt;
    return it->get<size_t>();
}

std::string cell_type(const ordered_json& cell) {
    if (!cell.is_object()) return "";
    auto it = cell.find("cell_type");
    if (it == cell.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

const ordered_json* cell_source(const ordered_json& cell) {
    if (!cell.is_object()) return nullptr;
    auto it = cell.find("source");
    return it == cell.end() ? nullptr : &*it;
}

struct CommentKey {
    size_t cell = 0;
    size_t offset = 0;
    bool operator<(const CommentKey& other) const {
        return cell != other.cell ? cell < other.cell : offset < other.offset;
    }
};

}  // namespace

std::set<std::string> NotebookParser::supported_extensions() const {
    return {".ipynb"};
}

bool NotebookParser::can_parse(const std::string& path,
                               std::optional<std::string_view> /*content*/) const {
    return has_supported_extension(path);
}

bool NotebookParser::is_translatable(std::string_view text) {
    auto counts = filters::count_chars(text);
    if (counts.total < 3) {
        return false;
    }
    for (std::string_view indicator : CODE_INDICATORS) {
        if (text::contains(text, indicator)) {
            return false;
        }
    }
    if (filters::contains_url(text)) {
        return false;
    }
    if (counts.letters * 2 < counts.total) {
        return false;
    }
    return counts.non_ascii > 0;
}

Result<ParseResult> NotebookParser::extract_units(const std::string& content,
                                                  const std::string& path) const {
    auto parsed = parse_notebook(content, path);
    if (!parsed) {
        return parsed.error();
    }
    static const ordered_json no_cells = ordered_json::array();
    const ordered_json* list = cell_list(parsed.value());
    const ordered_json& cells = list ? *list : no_cells;

    ParseResult result;
    result.file_type = "jupyter_notebook";
    result.line_count = static_cast<uint32_t>(text::count_lines(content));
    result.metadata = {{"parser", name()}, {"file_path", path}, {"cell_count", cells.size()}};

    for (size_t index = 0; index < cells.size(); ++index) {
        const ordered_json& cell = cells[index];
        const ordered_json* source = cell_source(cell);
        if (!source) continue;
        std::string type = cell_type(cell);
        std::string body = source_text(*source);
        auto cell_line = static_cast<uint32_t>(index);

        if (type == "markdown") {
            std::string_view trimmed = text::trim(body);
            if (trimmed.empty() || text::starts_with(trimmed, "```")) {
                continue;
            }
            TranslatableUnit unit(std::string(trimmed), UnitType::TEXT_NODE, cell_line, 0);
            unit.priority = text::starts_with(trimmed, "#") ? Priority::HIGH : Priority::MEDIUM;
            unit.context = "Markdown cell " + std::to_string(index);
            unit.metadata = {{"cell_index", index}};
            unit.detect_language();
            result.units.push_back(std::move(unit));
        } else if (type == "code") {
            auto lines = text::split_lines(body);
            for (size_t offset = 0; offset < lines.size() && offset < CELL_LINE_STRIDE; ++offset) {
                std::string_view trimmed = text::trim(lines[offset]);
                if (!text::starts_with(trimmed, "#")) continue;
                std::string_view comment = text::trim(trimmed.substr(1));
                if (comment.empty() || !is_translatable(comment)) continue;

                TranslatableUnit unit(std::string(comment), UnitType::COMMENT,
                                      cell_line * CELL_LINE_STRIDE + static_cast<uint32_t>(offset), 0);
                unit.priority = Priority::MEDIUM;
                unit.context = "Code cell " + std::to_string(index) + ", line " +
                               std::to_string(offset + 1);
                unit.metadata = {{"cell_index", index}, {"line_offset", offset}};
                unit.detect_language();
                result.units.push_back(std::move(unit));
            }
        }
    }

    return result;
}

Result<std::string> NotebookParser::reconstruct(const std::string& original,
                                                const std::vector<TranslatableUnit>& units,
                                                const std::string& path) const {
    auto parsed = parse_notebook(original, path);
    if (!parsed) {
        return parsed.error();
    }
    ordered_json doc = std::move(parsed.value());
    ordered_json* list = cell_list(doc);
    if (!list) {
        return original;
    }
    ordered_json& cells = *list;

    std::map<size_t, std::string> markdown_edits;
    std::map<CommentKey, std::string> comment_edits;
    for (const auto& unit : units) {
        const auto& meta = unit.metadata;
        if (unit.unit_type == UnitType::TEXT_NODE) {
            markdown_edits[index_field(meta, "cell_index").value_or(unit.position.line)] = unit.content;
        } else if (unit.unit_type == UnitType::COMMENT) {
            CommentKey key;
            auto cell = index_field(meta, "cell_index");
            auto offset = index_field(meta, "line_offset");
            if (cell && offset) {
                key.cell = *cell;
                key.offset = *offset;
            } else {
                key.cell = unit.position.line / CELL_LINE_STRIDE;
                key.offset = unit.position.line % CELL_LINE_STRIDE;
            }
            comment_edits[key] = text::flatten_newlines(unit.content);
        }
    }

    bool changed = false;
    for (size_t index = 0; index < cells.size(); ++index) {
        ordered_json& cell = cells[index];
        const ordered_json* source = cell_source(cell);
        if (!source) continue;
        std::string type = cell_type(cell);
        std::string body = source_text(*source);
        bool as_list = source->is_array();
        std::string updated = body;

        if (type == "markdown") {
            auto it = markdown_edits.find(index);
            if (it == markdown_edits.end() || text::trim(body) == it->second) continue;
            updated = it->second;
        } else if (type == "code") {
            auto lines = text::split_lines(body);
            for (auto it = comment_edits.lower_bound(CommentKey{index, 0});
                 it != comment_edits.end() && it->first.cell == index; ++it) {
                size_t offset = it->first.offset;
                if (offset >= lines.size()) continue;
                size_t hash = lines[offset].find('#');
                if (hash == std::string::npos) continue;
                lines[offset] = text::replace_trailing_text(lines[offset], hash + 1, it->second);
            }
            updated = text::join_lines(lines);
        }

        if (updated != body) {
            cell["source"] = to_source(updated, as_list);
            changed = true;
        }
    }

    if (!changed) {
        return original;
    }

    std::string output;
    try {
        output = doc.dump(JSON_INDENT, ' ', false);
    } catch (const ordered_json::exception& e) {
        return Error(ErrorCode::RECONSTRUCTION_FAILED,
                     "Failed to serialize notebook: " + std::string(e.what()), "NotebookParser", path);
    }
    if (!original.empty() && original.back() == '\n') {
        output += '\n';
    }
    return output;
}

}  // namespace langlint
