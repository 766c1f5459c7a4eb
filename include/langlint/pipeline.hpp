#pragma once

#include <langlint/cache.hpp>
#include <langlint/parsers/parser_registry.hpp>
#include <langlint/translate/translator.hpp>
#include <langlint/util/logger.hpp>

#include <set>

namespace langlint {

/**
 * Selects which extracted units get translated.
 * Empty sets accept everything. A unit without a detected language only
 * passes an empty language set.
 */
struct UnitFilter {
    Priority min_priority = Priority::IGNORE;
    std::set<UnitType> unit_types;
    std::set<std::string> languages;   // "zh" also matches "zh-CN"

    bool accepts(const TranslatableUnit& unit) const;
};

struct PipelineResult {
    std::string content;                  // Reconstructed file content
    ParseResult parse;                    // Units with translated content
    size_t units_total = 0;
    size_t units_translated = 0;          // Content actually changed
    size_t units_failed = 0;
    size_t units_skipped = 0;             // Rejected by the filter or untranslatable

    bool changed() const { return units_translated > 0; }
};

/**
 * Extract -> filter -> translate_batch -> reconstruct for one file.
 *
 * File I/O stays with the caller. The registry, translator and cache must
 * outlive the pipeline.
 */
class Pipeline {
public:
    Pipeline(const ParserRegistry& registry, Translator* translator,
             Cache* cache = nullptr, LoggerPtr logger = nullptr);

    // Extraction only, through the cache when one is set
    Result<ParseResult> scan(const std::string& content, const std::string& path) const;

    /**
     * Translate the selected units of one file.
     *
     * With source "auto" and a backend that cannot detect languages, units
     * are grouped by their detected language; undetected units are skipped.
     */
    Result<PipelineResult> translate(const std::string& content, const std::string& path,
                                     const std::string& source, const std::string& target,
                                     const UnitFilter& filter = {});

private:
    const ParserRegistry& registry_;
    Translator* translator_;
    Cache* cache_;
    LoggerPtr logger_;
};

}  // namespace langlint
