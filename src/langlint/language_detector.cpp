#include <langlint/language_detector.hpp>
#include <langlint/util/text.hpp>
#include <langlint/util/utf8.hpp>

#include <algorithm>
#include <array>
#include <unordered_set>
#include <vector>

namespace langlint {

namespace {

// Ideographic and syllabic characters carry roughly a word's worth of
// signal each, so they are weighted against alphabetic letters.
constexpr double CJK_WEIGHT = 3.0;

// Below this many weighted points a Latin-script score is scaled down
constexpr double LATIN_EVIDENCE_FLOOR = 4.0;

struct LatinProfile {
    const char* code;
    std::unordered_set<std::string> function_words;
    std::unordered_set<uint32_t> letters;   // characteristic non-ASCII letters
};

const std::vector<LatinProfile>& latin_profiles() {
    static const std::vector<LatinProfile> profiles = {
        {"en",
         {"the", "and", "is", "are", "of", "to", "in", "this", "that", "for",
          "with", "it", "be", "on", "a", "an", "if", "not", "we", "you",
          "returns", "return", "from", "by", "or", "as", "was", "will", "should",
          "can", "which", "when", "all", "each", "used"},
         {}},
        {"fr",
         {"le", "la", "les", "des", "est", "une", "un", "et", "pour", "dans",
          "ce", "ceci", "cette", "que", "qui", "sur", "avec", "pas", "du", "au",
          "aux", "sont", "nous", "vous", "par", "ne", "fonction"},
         {0xE9u, 0xE8u, 0xEAu, 0xE0u, 0xE7u, 0x153u, 0xF9u, 0xFBu, 0xEEu, 0xEFu,
          0xEBu, 0xE2u}},
        {"de",
         {"der", "die", "das", "und", "ist", "ein", "eine", "nicht", "mit", "für",
          "dies", "diese", "dieser", "den", "dem", "zu", "von", "auf", "wird",
          "sind", "auch", "wenn", "oder", "werden", "gibt", "zur", "zum"},
         {0xE4u, 0xF6u, 0xFCu, 0xDFu}},
        {"es",
         {"el", "la", "los", "las", "es", "una", "un", "y", "para", "con",
          "esta", "este", "esto", "que", "del", "por", "en", "se", "no", "como",
          "su", "al", "son", "pero", "función"},
         {0xF1u, 0xBFu, 0xA1u, 0xE1u, 0xEDu, 0xF3u, 0xFAu}},
        {"pt",
         {"o", "os", "as", "um", "uma", "e", "para", "com", "não", "que",
          "do", "da", "dos", "das", "em", "no", "na", "este", "esta", "isto",
          "por", "se", "são", "função", "mais"},
         {0xE3u, 0xF5u, 0xE7u, 0xE1u, 0xEAu, 0xF4u}},
        {"it",
         {"il", "lo", "la", "gli", "le", "di", "che", "è", "un", "una",
          "per", "con", "non", "questo", "questa", "del", "della", "sono", "da",
          "nel", "alla", "funzione", "anche"},
         {0xE0u, 0xE8u, 0xECu, 0xF2u, 0xF9u}},
        {"nl",
         {"de", "het", "een", "en", "is", "van", "dit", "deze", "niet", "met",
          "voor", "op", "te", "die", "zijn", "wordt", "ook", "naar", "aan", "bij",
          "functie"},
         {}},
        {"pl",
         {"jest", "to", "nie", "się", "na", "i", "w", "z", "do", "że",
          "dla", "ten", "ta", "jak", "tak", "od", "po", "funkcja", "przez"},
         {0x105u, 0x107u, 0x119u, 0x142u, 0x144u, 0x15Bu, 0x17Au, 0x17Cu}},
        {"sv",
         {"och", "är", "att", "en", "ett", "det", "som", "för", "med", "på",
          "inte", "den", "detta", "till", "av", "har", "funktion"},
         {0xE5u, 0xE4u, 0xF6u}},
        {"vi",
         {"là", "của", "và", "có", "không", "này", "cho", "một", "các", "được",
          "với", "trong", "hàm", "những"},
         {0x1A1u, 0x1B0u, 0x111u, 0x103u}},
        {"id",
         {"ini", "itu", "dan", "yang", "untuk", "dengan", "adalah", "tidak", "dari",
          "akan", "pada", "fungsi", "ke", "di", "juga"},
         {}},
        {"tr",
         {"bu", "ve", "bir", "için", "ile", "değil", "da", "de", "fonksiyon",
          "olan", "çok", "ne", "gibi"},
         {0x11Fu, 0x15Fu, 0x131u, 0x130u}},
    };
    return profiles;
}

// Persian letters absent from standard Arabic
bool is_persian_letter(uint32_t cp) {
    return cp == 0x67Eu || cp == 0x686u || cp == 0x698u ||
           cp == 0x6AFu || cp == 0x6A9u || cp == 0x6CCu;
}

bool is_vietnamese_tone_letter(uint32_t cp) {
    return cp >= 0x1EA0u && cp <= 0x1EF9u;
}

enum Script {
    LATIN = 0,
    CYRILLIC,
    GREEK,
    HEBREW,
    ARABIC,
    DEVANAGARI,
    THAI,
    HANGUL,
    KANA,
    HAN,
    SCRIPT_COUNT
};

Script script_of(uint32_t cp) {
    if (utf8::is_han(cp)) return HAN;
    if (utf8::is_kana(cp) || cp == 0x30FCu) return KANA;
    if (utf8::is_hangul(cp)) return HANGUL;
    if (cp >= 0x370u && cp <= 0x3FFu) return GREEK;
    if (cp >= 0x400u && cp <= 0x52Fu) return CYRILLIC;
    if (cp >= 0x590u && cp <= 0x5FFu) return HEBREW;
    if (cp >= 0x600u && cp <= 0x6FFu) return ARABIC;
    if (cp >= 0x900u && cp <= 0x97Fu) return DEVANAGARI;
    if (cp >= 0xE00u && cp <= 0xE7Fu) return THAI;
    return LATIN;
}

// Lowercased words: runs of ASCII letters, apostrophes and non-ASCII bytes
std::vector<std::string> split_words(std::string_view text) {
    std::vector<std::string> words;
    std::string current;
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        bool word_byte = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c >= 0x80u;
        if (word_byte) {
            current += static_cast<char>((c >= 'A' && c <= 'Z') ? c + 32 : c);
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

}  // namespace

std::optional<std::string> LanguageDetector::detect(std::string_view text) {
    auto detection = classify(text);
    if (!detection || detection->confidence <= MIN_CONFIDENCE) {
        return std::nullopt;
    }
    return detection->code;
}

std::optional<LanguageDetector::Detection> LanguageDetector::classify(std::string_view text) {
    std::string_view trimmed = text::trim(text);
    if (utf8::length(trimmed) < 3) {
        return std::nullopt;
    }

    std::array<double, SCRIPT_COUNT> weights{};
    double total = 0.0;

    size_t index = 0;
    while (index < trimmed.size()) {
        uint32_t cp = utf8::decode_next(trimmed, index);
        if (!utf8::is_letter(cp)) {
            continue;
        }
        Script script = script_of(cp);
        double weight = (script == HAN || script == KANA || script == HANGUL) ? CJK_WEIGHT : 1.0;
        weights[script] += weight;
        total += weight;
    }

    if (total <= 0.0) {
        return std::nullopt;
    }

    // Japanese mixes kana with Han; any kana decides between ja and zh
    double japanese = weights[KANA] > 0.0 ? weights[KANA] + weights[HAN] : 0.0;
    double chinese = weights[KANA] > 0.0 ? 0.0 : weights[HAN];

    struct Candidate {
        Script script;
        double weight;
    };
    std::array<Candidate, 9> candidates = {{
        {LATIN, weights[LATIN]},
        {CYRILLIC, weights[CYRILLIC]},
        {GREEK, weights[GREEK]},
        {HEBREW, weights[HEBREW]},
        {ARABIC, weights[ARABIC]},
        {DEVANAGARI, weights[DEVANAGARI]},
        {THAI, weights[THAI]},
        {HANGUL, weights[HANGUL]},
        {KANA, japanese},
    }};
    Candidate best{HAN, chinese};
    for (const auto& c : candidates) {
        if (c.weight > best.weight) {
            best = c;
        }
    }

    double ratio = best.weight / total;

    switch (best.script) {
        case HAN:        return Detection{"zh-CN", ratio};
        case KANA:       return Detection{"ja", ratio};
        case HANGUL:     return Detection{"ko", ratio};
        case CYRILLIC:   return Detection{"ru", ratio};
        case GREEK:      return Detection{"el", ratio};
        case HEBREW:     return Detection{"he", ratio};
        case DEVANAGARI: return Detection{"hi", ratio};
        case THAI:       return Detection{"th", ratio};
        case ARABIC:     return classify_arabic_script(trimmed, ratio);
        case LATIN: {
            auto latin = classify_latin(trimmed);
            if (!latin) {
                return std::nullopt;
            }
            latin->confidence *= ratio;
            return latin;
        }
        default:
            return std::nullopt;
    }
}

std::optional<LanguageDetector::Detection> LanguageDetector::classify_latin(std::string_view text) {
    const auto& profiles = latin_profiles();
    std::vector<double> scores(profiles.size(), 0.0);

    for (const auto& word : split_words(text)) {
        for (size_t i = 0; i < profiles.size(); ++i) {
            if (profiles[i].function_words.count(word) > 0) {
                scores[i] += 2.0;
            }
        }
    }

    size_t index = 0;
    while (index < text.size()) {
        uint32_t cp = utf8::decode_next(text, index);
        if (utf8::is_ascii(cp)) {
            continue;
        }
        // Lowercase Latin-1 capitals so "Ü" scores like "ü"
        if (cp >= 0xC0u && cp <= 0xDEu && cp != 0xD7u) {
            cp += 0x20u;
        }
        for (size_t i = 0; i < profiles.size(); ++i) {
            if (profiles[i].letters.count(cp) > 0) {
                scores[i] += 1.0;
            }
        }
        if (is_vietnamese_tone_letter(cp)) {
            for (size_t i = 0; i < profiles.size(); ++i) {
                if (std::string_view(profiles[i].code) == "vi") {
                    scores[i] += 2.0;
                }
            }
        }
    }

    size_t best = 0;
    for (size_t i = 1; i < scores.size(); ++i) {
        if (scores[i] > scores[best]) {
            best = i;
        }
    }
    if (scores[best] <= 0.0) {
        return std::nullopt;
    }

    double second = 0.0;
    for (size_t i = 0; i < scores.size(); ++i) {
        if (i != best) {
            second = std::max(second, scores[i]);
        }
    }

    double margin = (scores[best] - second) / scores[best];
    double confidence = 0.5 + 0.5 * margin;
    if (scores[best] < LATIN_EVIDENCE_FLOOR) {
        confidence *= scores[best] / LATIN_EVIDENCE_FLOOR;
    }

    return Detection{profiles[best].code, confidence};
}

LanguageDetector::Detection LanguageDetector::classify_arabic_script(std::string_view text,
                                                                     double script_ratio) {
    size_t index = 0;
    while (index < text.size()) {
        if (is_persian_letter(utf8::decode_next(text, index))) {
            return Detection{"fa", script_ratio};
        }
    }
    // Without a Persian-only letter, Arabic is likely but not certain
    return Detection{"ar", script_ratio * 0.9};
}

}  // namespace langlint
