#include <langlint/types.hpp>
#include <langlint/language_detector.hpp>

namespace langlint {

const char* to_string(UnitType type) {
    switch (type) {
        case UnitType::COMMENT: return "comment";
        case UnitType::DOCSTRING: return "docstring";
        case UnitType::STRING_LITERAL: return "string_literal";
        case UnitType::TEXT_NODE: return "text_node";
        case UnitType::METADATA: return "metadata";
    }
    return "unknown";
}

const char* to_string(Priority priority) {
    switch (priority) {
        case Priority::HIGH: return "high";
        case Priority::MEDIUM: return "medium";
        case Priority::LOW: return "low";
        case Priority::IGNORE: return "ignore";
    }
    return "unknown";
}

std::optional<UnitType> parse_unit_type(const std::string& name) {
    if (name == "comment") return UnitType::COMMENT;
    if (name == "docstring") return UnitType::DOCSTRING;
    if (name == "string_literal") return UnitType::STRING_LITERAL;
    if (name == "text_node") return UnitType::TEXT_NODE;
    if (name == "metadata") return UnitType::METADATA;
    return std::nullopt;
}

std::optional<Priority> parse_priority(const std::string& name) {
    if (name == "high") return Priority::HIGH;
    if (name == "medium") return Priority::MEDIUM;
    if (name == "low") return Priority::LOW;
    if (name == "ignore") return Priority::IGNORE;
    return std::nullopt;
}

uint32_t TranslatableUnit::span() const {
    if (metadata.is_object()) {
        auto it = metadata.find("span");
        if (it != metadata.end() && it->is_number_integer()) {
            auto span = it->get<int64_t>();
            return span < 1 ? 1 : static_cast<uint32_t>(span);
        }
    }
    return 1;
}

void TranslatableUnit::detect_language() {
    detected_language = LanguageDetector::detect(content);
}

bool TranslatableUnit::operator==(const TranslatableUnit& other) const {
    return content == other.content &&
           unit_type == other.unit_type &&
           position == other.position &&
           priority == other.priority &&
           context == other.context &&
           metadata == other.metadata &&
           detected_language == other.detected_language;
}

bool ParseResult::operator==(const ParseResult& other) const {
    return units == other.units &&
           file_type == other.file_type &&
           encoding == other.encoding &&
           line_count == other.line_count &&
           metadata == other.metadata;
}

nlohmann::json to_json(const TranslatableUnit& unit) {
    nlohmann::json j;
    j["content"] = unit.content;
    j["unit_type"] = to_string(unit.unit_type);
    j["line_number"] = unit.position.line;
    j["column_number"] = unit.position.column;
    j["priority"] = to_string(unit.priority);
    if (unit.context) {
        j["context"] = *unit.context;
    }
    if (!unit.metadata.is_null()) {
        j["metadata"] = unit.metadata;
    }
    if (unit.detected_language) {
        j["detected_language"] = *unit.detected_language;
    }
    return j;
}

nlohmann::json to_json(const ParseResult& result) {
    nlohmann::json units = nlohmann::json::array();
    for (const auto& unit : result.units) {
        units.push_back(to_json(unit));
    }

    nlohmann::json j;
    j["file_type"] = result.file_type;
    j["encoding"] = result.encoding;
    j["line_count"] = result.line_count;
    j["units"] = std::move(units);
    if (!result.metadata.is_null()) {
        j["metadata"] = result.metadata;
    }
    return j;
}

}  // namespace langlint
