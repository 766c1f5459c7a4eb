#pragma once

#include <cstddef>
#include <string_view>

namespace langlint::filters {

struct CharCounts {
    size_t total = 0;          // code points
    size_t non_space = 0;
    size_t letters = 0;        // utf8::is_letter
    size_t non_ascii = 0;
};

CharCounts count_chars(std::string_view text);

bool contains_url(std::string_view text);

// Case-insensitive TODO/FIXME/NOTE/HACK/XXX/BUG/DEPRECATED/WARNING/ERROR
bool contains_technical_marker(std::string_view text);

// Texts shorter than this (in code points) are rejected when they hold a marker
constexpr size_t MARKER_LENGTH_LIMIT = 20;

}  // namespace langlint::filters
