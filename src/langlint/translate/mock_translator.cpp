#include <langlint/translate/mock_translator.hpp>
#include <langlint/util/text.hpp>

namespace langlint {

namespace {

const std::vector<std::pair<std::string, std::string>>& language_table() {
    static const std::vector<std::pair<std::string, std::string>> table = {
        {"en", "EN"},
        {"zh", "中文"},
        {"ja", "日本語"},
        {"ko", "한국어"},
        {"fr", "Français"},
        {"de", "Deutsch"},
        {"es", "Español"},
        {"it", "Italiano"},
        {"pt", "Português"},
        {"ru", "Русский"},
        {"ar", "العربية"},
        {"hi", "हिन्दी"},
        {"th", "ไทย"},
        {"vi", "Tiếng Việt"},
        {"id", "Bahasa Indonesia"},
    };
    return table;
}

}  // namespace

MockTranslator::MockTranslator(MockConfig config, LoggerPtr logger)
    : Translator(config.pacing, std::move(logger)), config_(std::move(config)) {}

std::vector<std::string> MockTranslator::supported_languages() const {
    std::vector<std::string> codes;
    for (const auto& [code, label] : language_table()) {
        codes.push_back(code);
    }
    return codes;
}

std::string MockTranslator::normalize_language_code(const std::string& code) const {
    std::string normalized = text::to_lower(text::trim(code));
    size_t separator = normalized.find_first_of("-_");
    if (separator != std::string::npos) {
        normalized.resize(separator);
    }
    return normalized;
}

std::string MockTranslator::language_label(const std::string& code) {
    for (const auto& [known, label] : language_table()) {
        if (known == code) {
            return label;
        }
    }
    return code;
}

std::map<std::string, std::string> MockTranslator::get_usage_info() const {
    auto info = Translator::get_usage_info();
    info["cost_per_character"] = "0.0";
    info["max_batch_size"] = "1000";
    info["rate_limit"] = "None (mock)";
    info["delay_range"] = std::to_string(pacing().delay_min_ms) + "-" +
                          std::to_string(pacing().delay_max_ms) + "ms";
    info["error_rate"] = std::to_string(config_.error_rate);
    return info;
}

Result<std::string> MockTranslator::request(const std::string& text, const std::string& source,
                                            const std::string& target) {
    if (config_.forced_failures.count(text) > 0 ||
        (config_.error_rate > 0.0 && random_unit() < config_.error_rate)) {
        return Error(ErrorCode::TRANSLATION_FAILED, "Mock translation failed (simulated error)",
                     name(), "MOCK_ERROR");
    }
    if (source == target) {
        return text;
    }
    return "[" + language_label(target) + "] " + text;
}

double MockTranslator::next_confidence() {
    return random_between(config_.confidence_min, config_.confidence_max);
}

void MockTranslator::annotate(TranslationResult& result) const {
    result.with_metadata("mock", "true");
}

}  // namespace langlint
