#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace langlint::utf8 {

constexpr uint32_t REPLACEMENT_CHARACTER = 0xFFFDu;

/**
 * Decode the code point starting at text[index] and advance index.
 * Invalid sequences yield REPLACEMENT_CHARACTER and skip one byte.
 */
uint32_t decode_next(std::string_view text, size_t& index);

// Decode the whole string
std::vector<uint32_t> decode(std::string_view text);

// Number of code points (invalid bytes count as one each)
size_t length(std::string_view text);

bool is_ascii(uint32_t cp);
bool is_whitespace(uint32_t cp);

// Han ideographs, kana and Hangul syllables
bool is_cjk(uint32_t cp);
bool is_han(uint32_t cp);
bool is_kana(uint32_t cp);
bool is_hangul(uint32_t cp);

/**
 * Letter test covering the scripts the language detector knows about:
 * Latin (incl. Latin-1 and Extended), Greek, Cyrillic, Armenian, Hebrew,
 * Arabic, Devanagari, Thai and CJK.
 */
bool is_letter(uint32_t cp);

}  // namespace langlint::utf8
