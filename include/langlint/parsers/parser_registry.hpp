#pragma once

#include "parser.hpp"

namespace langlint {

/**
 * Ordered set of parsers; the first one that accepts a file wins.
 *
 * Lookup runs in two passes: extension matches across all parsers first,
 * then content sniffing. A ".js" file mentioning "import " therefore stays
 * with the generic parser, while an extension-less script can still be
 * claimed by the Python parser.
 */
class ParserRegistry {
public:
    ParserRegistry() = default;

    ParserRegistry(const ParserRegistry&) = delete;
    ParserRegistry& operator=(const ParserRegistry&) = delete;
    ParserRegistry(ParserRegistry&&) = default;
    ParserRegistry& operator=(ParserRegistry&&) = default;

    // Python, Notebook, then Generic
    static ParserRegistry with_defaults();

    void add(ParserPtr parser);

    const Parser* find(const std::string& path,
                       std::optional<std::string_view> content = std::nullopt) const;

    // Like find(), but UNSUPPORTED_FORMAT instead of nullptr
    Result<const Parser*> require(const std::string& path,
                                  std::optional<std::string_view> content = std::nullopt) const;

    // Dispatch to the matching parser; UNSUPPORTED_FORMAT when none matches
    Result<ParseResult> extract(const std::string& content, const std::string& path) const;
    Result<std::string> reconstruct(const std::string& original,
                                    const std::vector<TranslatableUnit>& units,
                                    const std::string& path) const;

    const Parser* by_name(const std::string& name) const;

    std::set<std::string> supported_extensions() const;

    size_t size() const { return parsers_.size(); }

private:
    std::vector<ParserPtr> parsers_;
};

}  // namespace langlint
