#pragma once

#include <langlint/result.hpp>
#include <langlint/types.hpp>

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace langlint {

// ============================================================================
// Abstract Parser Interface
// ============================================================================

/**
 * Extracts translatable units from one file format and writes translated
 * units back.
 *
 * Implementations are stateless: extract_units() is a pure function of its
 * inputs and both operations may be called concurrently on disjoint data.
 * The path is only used for extension sniffing and metadata; no file I/O
 * happens here.
 */
class Parser {
public:
    virtual ~Parser() = default;

    virtual std::string name() const = 0;

    // Lowercase extensions including the dot (".py")
    virtual std::set<std::string> supported_extensions() const = 0;

    /**
     * Check whether this parser handles the file.
     *
     * @param path File path (extension match)
     * @param content Optional content for content-based detection
     */
    virtual bool can_parse(const std::string& path,
                           std::optional<std::string_view> content = std::nullopt) const = 0;

    /**
     * Extract units from file content.
     * Returns PARSE_ERROR when the document itself is malformed.
     */
    virtual Result<ParseResult> extract_units(const std::string& content,
                                              const std::string& path) const = 0;

    /**
     * Produce new file content from the original and a set of units whose
     * content holds translated text.
     *
     * A unit whose content still equals the text it was extracted from
     * leaves the original bytes untouched.
     */
    virtual Result<std::string> reconstruct(const std::string& original,
                                            const std::vector<TranslatableUnit>& units,
                                            const std::string& path) const = 0;

protected:
    bool has_supported_extension(const std::string& path) const;
};

using ParserPtr = std::unique_ptr<Parser>;

}  // namespace langlint
