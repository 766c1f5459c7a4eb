#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace langlint::text {

// ASCII whitespace trimming
std::string_view trim(std::string_view s);
std::string_view trim_left(std::string_view s);
std::string_view trim_right(std::string_view s);

std::string to_lower(std::string_view s);
std::string to_upper(std::string_view s);

bool starts_with(std::string_view s, std::string_view prefix);
bool ends_with(std::string_view s, std::string_view suffix);
bool contains(std::string_view s, std::string_view needle);

// Leading run of spaces/tabs
std::string_view indentation(std::string_view line);

/**
 * Split on '\n' keeping every piece, so join_lines(split_lines(s)) == s.
 * A trailing newline produces a final empty piece; "\r" stays in the piece.
 */
std::vector<std::string> split_lines(std::string_view content);
std::string join_lines(const std::vector<std::string>& lines);

// Replace every line break ("\r\n", "\n", "\r") with a single space
std::string flatten_newlines(std::string_view s);

// Number of logical lines ("a\nb\n" has two)
size_t count_lines(std::string_view content);

// Lowercased extension including the dot (".py"), or "" if none
std::string extension_of(std::string_view path);

// Case-sensitive extension including the dot (".R" stays ".R")
std::string raw_extension_of(std::string_view path);

/**
 * Rewrite the comment text that follows a marker on `line`.
 *
 * `text_begin` is the byte offset just past the marker. The whitespace gap
 * after the marker and any trailing whitespace (including '\r') are kept.
 * If the trimmed existing text already equals `replacement` the line is
 * returned unchanged. An empty gap becomes a single space.
 */
std::string replace_trailing_text(const std::string& line, size_t text_begin,
                                  const std::string& replacement);

/**
 * Rewrite the text enclosed in line[begin, end) keeping its surrounding
 * whitespace; unchanged when the trimmed text already equals `replacement`.
 */
std::string replace_enclosed_text(const std::string& line, size_t begin, size_t end,
                                  const std::string& replacement);

}  // namespace langlint::text
