#include <langlint/parsers/parser_registry.hpp>
#include <langlint/parsers/generic_parser.hpp>
#include <langlint/parsers/notebook_parser.hpp>
#include <langlint/parsers/python_parser.hpp>

namespace langlint {

ParserRegistry ParserRegistry::with_defaults() {
    ParserRegistry registry;
    registry.add(std::make_unique<PythonParser>());
    registry.add(std::make_unique<NotebookParser>());
    registry.add(std::make_unique<GenericCodeParser>());
    return registry;
}

void ParserRegistry::add(ParserPtr parser) {
    if (parser) {
        parsers_.push_back(std::move(parser));
    }
}

const Parser* ParserRegistry::find(const std::string& path,
                                   std::optional<std::string_view> content) const {
    for (const auto& parser : parsers_) {
        if (parser->can_parse(path)) {
            return parser.get();
        }
    }
    if (content) {
        for (const auto& parser : parsers_) {
            if (parser->can_parse(path, content)) {
                return parser.get();
            }
        }
    }
    return nullptr;
}

Result<const Parser*> ParserRegistry::require(const std::string& path,
                                              std::optional<std::string_view> content) const {
    const Parser* parser = find(path, content);
    if (!parser) {
        return Error(ErrorCode::UNSUPPORTED_FORMAT, "No parser for file", "ParserRegistry", path);
    }
    return parser;
}

Result<ParseResult> ParserRegistry::extract(const std::string& content,
                                            const std::string& path) const {
    auto parser = require(path, content);
    if (!parser) {
        return parser.error();
    }
    return parser.value()->extract_units(content, path);
}

Result<std::string> ParserRegistry::reconstruct(const std::string& original,
                                                const std::vector<TranslatableUnit>& units,
                                                const std::string& path) const {
    auto parser = require(path, original);
    if (!parser) {
        return parser.error();
    }
    return parser.value()->reconstruct(original, units, path);
}

const Parser* ParserRegistry::by_name(const std::string& name) const {
    for (const auto& parser : parsers_) {
        if (parser->name() == name) {
            return parser.get();
        }
    }
    return nullptr;
}

std::set<std::string> ParserRegistry::supported_extensions() const {
    std::set<std::string> all;
    for (const auto& parser : parsers_) {
        auto exts = parser->supported_extensions();
        all.insert(exts.begin(), exts.end());
    }
    return all;
}

}  // namespace langlint
