#include <langlint/util/utf8.hpp>

namespace langlint::utf8 {

namespace {

bool is_continuation(unsigned char c) {
    return (c & 0xC0u) == 0x80u;
}

}  // namespace

uint32_t decode_next(std::string_view text, size_t& index) {
    const auto lead = static_cast<unsigned char>(text[index]);

    if (lead < 0x80u) {
        ++index;
        return lead;
    }

    const size_t remaining = text.size() - index;

    if (lead < 0xC2u) {
        ++index;
        return REPLACEMENT_CHARACTER;
    }

    if (lead < 0xE0u) {
        if (remaining < 2 || !is_continuation(static_cast<unsigned char>(text[index + 1]))) {
            ++index;
            return REPLACEMENT_CHARACTER;
        }
        uint32_t cp = ((lead & 0x1Fu) << 6) |
                      (static_cast<unsigned char>(text[index + 1]) & 0x3Fu);
        index += 2;
        return cp;
    }

    if (lead < 0xF0u) {
        if (remaining < 3) {
            ++index;
            return REPLACEMENT_CHARACTER;
        }
        const auto c1 = static_cast<unsigned char>(text[index + 1]);
        const auto c2 = static_cast<unsigned char>(text[index + 2]);
        if (!is_continuation(c1) || !is_continuation(c2) ||
            (lead == 0xE0u && c1 < 0xA0u) ||    // overlong
            (lead == 0xEDu && c1 >= 0xA0u)) {   // surrogate
            ++index;
            return REPLACEMENT_CHARACTER;
        }
        uint32_t cp = ((lead & 0x0Fu) << 12) | ((c1 & 0x3Fu) << 6) | (c2 & 0x3Fu);
        index += 3;
        return cp;
    }

    if (lead < 0xF5u) {
        if (remaining < 4) {
            ++index;
            return REPLACEMENT_CHARACTER;
        }
        const auto c1 = static_cast<unsigned char>(text[index + 1]);
        const auto c2 = static_cast<unsigned char>(text[index + 2]);
        const auto c3 = static_cast<unsigned char>(text[index + 3]);
        if (!is_continuation(c1) || !is_continuation(c2) || !is_continuation(c3) ||
            (lead == 0xF0u && c1 < 0x90u) ||
            (lead == 0xF4u && c1 >= 0x90u)) {
            ++index;
            return REPLACEMENT_CHARACTER;
        }
        uint32_t cp = ((lead & 0x07u) << 18) | ((c1 & 0x3Fu) << 12) |
                      ((c2 & 0x3Fu) << 6) | (c3 & 0x3Fu);
        index += 4;
        return cp;
    }

    ++index;
    return REPLACEMENT_CHARACTER;
}

std::vector<uint32_t> decode(std::string_view text) {
    std::vector<uint32_t> out;
    out.reserve(text.size());
    size_t index = 0;
    while (index < text.size()) {
        out.push_back(decode_next(text, index));
    }
    return out;
}

size_t length(std::string_view text) {
    size_t count = 0;
    size_t index = 0;
    while (index < text.size()) {
        decode_next(text, index);
        ++count;
    }
    return count;
}

bool is_ascii(uint32_t cp) {
    return cp < 0x80u;
}

bool is_whitespace(uint32_t cp) {
    switch (cp) {
        case 0x09u: case 0x0Au: case 0x0Bu: case 0x0Cu: case 0x0Du: case 0x20u:
        case 0x85u: case 0xA0u: case 0x1680u:
        case 0x2028u: case 0x2029u: case 0x202Fu: case 0x205Fu: case 0x3000u:
            return true;
        default:
            return cp >= 0x2000u && cp <= 0x200Au;
    }
}

bool is_han(uint32_t cp) {
    return (cp >= 0x4E00u && cp <= 0x9FFFu) ||    // CJK Unified Ideographs
           (cp >= 0x3400u && cp <= 0x4DBFu) ||    // Extension A
           (cp >= 0xF900u && cp <= 0xFAFFu) ||    // Compatibility Ideographs
           (cp >= 0x20000u && cp <= 0x2A6DFu);    // Extension B
}

bool is_kana(uint32_t cp) {
    return (cp >= 0x3040u && cp <= 0x30FFu) ||    // Hiragana + Katakana
           (cp >= 0x31F0u && cp <= 0x31FFu) ||
           (cp >= 0xFF66u && cp <= 0xFF9Fu);      // Halfwidth Katakana
}

bool is_hangul(uint32_t cp) {
    return (cp >= 0xAC00u && cp <= 0xD7AFu) ||
           (cp >= 0x1100u && cp <= 0x11FFu) ||
           (cp >= 0x3130u && cp <= 0x318Fu);
}

bool is_cjk(uint32_t cp) {
    return is_han(cp) || is_kana(cp) || is_hangul(cp);
}

bool is_letter(uint32_t cp) {
    if (cp < 0x80u) {
        return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z');
    }
    if (cp == 0xAAu || cp == 0xB5u || cp == 0xBAu) return true;
    if (cp >= 0xC0u && cp <= 0x24Fu) {
        return cp != 0xD7u && cp != 0xF7u;        // multiplication/division signs
    }
    if (cp >= 0x1E00u && cp <= 0x1EFFu) return true;   // Latin Extended Additional
    if (cp >= 0x370u && cp <= 0x3FFu) {               // Greek
        return cp >= 0x386u && cp != 0x387u;
    }
    if (cp >= 0x400u && cp <= 0x52Fu) {               // Cyrillic
        return cp < 0x482u || cp > 0x489u;
    }
    if (cp >= 0x531u && cp <= 0x587u) return true;    // Armenian
    if (cp >= 0x5D0u && cp <= 0x5EAu) return true;    // Hebrew
    if (cp >= 0x620u && cp <= 0x64Au) return true;    // Arabic
    if (cp >= 0x671u && cp <= 0x6D3u) return true;
    if (cp >= 0x6FAu && cp <= 0x6FCu) return true;
    if (cp >= 0x904u && cp <= 0x939u) return true;    // Devanagari letters
    if (cp >= 0x93Eu && cp <= 0x94Cu) return true;    // Devanagari vowel signs
    if (cp >= 0x958u && cp <= 0x961u) return true;
    if (cp >= 0xE01u && cp <= 0xE30u) return true;    // Thai consonants/vowels
    if (cp >= 0xE32u && cp <= 0xE33u) return true;
    if (cp >= 0xE40u && cp <= 0xE45u) return true;
    if (cp == 0x30FCu || cp == 0x3005u) return true;  // prolonged sound mark, iteration mark
    return is_cjk(cp);
}

}  // namespace langlint::utf8
