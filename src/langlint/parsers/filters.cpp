#include <langlint/parsers/filters.hpp>
#include <langlint/util/text.hpp>
#include <langlint/util/utf8.hpp>

namespace langlint::filters {

namespace {

constexpr std::string_view TECHNICAL_MARKERS[] = {
    "TODO", "FIXME", "NOTE", "HACK", "XXX", "BUG", "DEPRECATED", "WARNING", "ERROR"
};

}  // namespace

CharCounts count_chars(std::string_view text) {
    CharCounts counts;
    size_t i = 0;
    while (i < text.size()) {
        uint32_t cp = utf8::decode_next(text, i);
        ++counts.total;
        if (!utf8::is_whitespace(cp)) ++counts.non_space;
        if (utf8::is_letter(cp)) ++counts.letters;
        if (!utf8::is_ascii(cp)) ++counts.non_ascii;
    }
    return counts;
}

bool contains_url(std::string_view text) {
    return text::contains(text, "://");
}

bool contains_technical_marker(std::string_view text) {
    std::string upper = text::to_upper(text);
    for (std::string_view marker : TECHNICAL_MARKERS) {
        if (text::contains(upper, marker)) {
            return true;
        }
    }
    return false;
}

}  // namespace langlint::filters
