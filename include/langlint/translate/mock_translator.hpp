#pragma once

#include "translator.hpp"

#include <set>

namespace langlint {

struct MockConfig {
    double confidence_min = 0.8;
    double confidence_max = 1.0;
    double error_rate = 0.0;                 // Probability that a request fails
    std::set<std::string> forced_failures;   // Texts whose requests always fail
    PacingConfig pacing = default_pacing();

    static PacingConfig default_pacing() {
        PacingConfig pacing;
        pacing.delay_min_ms = 100;
        pacing.delay_max_ms = 500;
        pacing.retry_count = 1;
        return pacing;
    }
};

/**
 * Offline backend producing "[<language label>] <text>".
 * Translating into the source language returns the text unchanged.
 */
class MockTranslator : public Translator {
public:
    explicit MockTranslator(MockConfig config = {}, LoggerPtr logger = nullptr);

    std::string name() const override { return "Mock"; }
    std::vector<std::string> supported_languages() const override;

    // Lowercase; any "zh-*" becomes "zh", other regional variants their base code
    std::string normalize_language_code(const std::string& code) const override;

    std::map<std::string, std::string> get_usage_info() const override;

    // Label used in the output prefix ("Français" for "fr")
    static std::string language_label(const std::string& code);

protected:
    Result<std::string> request(const std::string& text, const std::string& source,
                                const std::string& target) override;
    double next_confidence() override;
    void annotate(TranslationResult& result) const override;

private:
    MockConfig config_;
};

}  // namespace langlint
