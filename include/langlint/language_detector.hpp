#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace langlint {

/**
 * Heuristic natural-language identification for extracted text.
 *
 * Detection works in two stages:
 * 1. Script classification over the decoded code points (Han, Kana,
 *    Hangul, Cyrillic, Greek, Hebrew, Arabic, Devanagari, Thai, Latin)
 * 2. For Latin and Arabic script, a function-word and diacritic
 *    frequency score picks among the languages sharing that script
 *
 * Only codes in the fixed set (en, zh-CN, ja, ko, fr, de, es, pt, ru, it,
 * nl, pl, sv, th, vi, hi, id, ar, he, tr, el, fa) are ever returned.
 * The result is advisory metadata and never gates extraction.
 */
class LanguageDetector {
public:
    struct Detection {
        std::string code;
        double confidence = 0.0;
    };

    // Classifications at or below this confidence are discarded
    static constexpr double MIN_CONFIDENCE = 0.70;

    /**
     * Detect the language of `text`.
     *
     * @return Language code, or nullopt when the trimmed text is shorter
     *         than 3 characters or the classification is not confident
     */
    static std::optional<std::string> detect(std::string_view text);

    // Raw classification without the confidence cut-off
    static std::optional<Detection> classify(std::string_view text);

private:
    static std::optional<Detection> classify_latin(std::string_view text);
    static Detection classify_arabic_script(std::string_view text, double script_ratio);
};

}  // namespace langlint
