#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace langlint {

/**
 * Kind of extracted fragment. Governs how a reconstructor writes it back.
 */
enum class UnitType {
    COMMENT,
    DOCSTRING,
    STRING_LITERAL,
    TEXT_NODE,
    METADATA
};

/**
 * Translation priority, ordered HIGH > MEDIUM > LOW > IGNORE.
 * The enumerator values grow as priority drops.
 */
enum class Priority {
    HIGH = 0,
    MEDIUM = 1,
    LOW = 2,
    IGNORE = 3
};

const char* to_string(UnitType type);
const char* to_string(Priority priority);
std::optional<UnitType> parse_unit_type(const std::string& name);
std::optional<Priority> parse_priority(const std::string& name);

// True if `priority` ranks at or above `threshold`
inline bool at_least(Priority priority, Priority threshold) {
    return static_cast<int>(priority) <= static_cast<int>(threshold);
}

// 1-based anchor into the original file
struct Position {
    uint32_t line = 0;
    uint32_t column = 0;

    bool operator==(const Position& other) const {
        return line == other.line && column == other.column;
    }
};

/**
 * One extracted natural-language fragment.
 *
 * For multi-line constructs `position.line` is the start line and
 * `metadata["span"]` the number of physical lines the construct occupied.
 * Units of one ParseResult never cover overlapping line ranges.
 */
struct TranslatableUnit {
    std::string content;
    UnitType unit_type = UnitType::COMMENT;
    Position position;
    Priority priority = Priority::MEDIUM;
    std::optional<std::string> context;
    nlohmann::json metadata;                       // null when absent
    std::optional<std::string> detected_language;

    TranslatableUnit() = default;
    TranslatableUnit(std::string text, UnitType type, uint32_t line, uint32_t column)
        : content(std::move(text)), unit_type(type), position{line, column} {}

    // Number of physical lines covered (metadata span, else 1)
    uint32_t span() const;
    uint32_t end_line() const { return position.line + span() - 1; }

    // Runs the language detector over `content`
    void detect_language();

    bool operator==(const TranslatableUnit& other) const;
};

/**
 * Output of one extraction pass.
 * Units are in first-seen order.
 */
struct ParseResult {
    std::vector<TranslatableUnit> units;
    std::string file_type;
    std::string encoding = "utf-8";
    uint32_t line_count = 0;
    nlohmann::json metadata;                       // null when absent

    bool empty() const { return units.empty(); }
    size_t size() const { return units.size(); }

    bool operator==(const ParseResult& other) const;
};

// JSON representation used by `langlint scan --format json`
nlohmann::json to_json(const TranslatableUnit& unit);
nlohmann::json to_json(const ParseResult& result);

}  // namespace langlint
