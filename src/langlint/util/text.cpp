#include <langlint/util/text.hpp>

#include <algorithm>
#include <cctype>

namespace langlint::text {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

}  // namespace

std::string_view trim_left(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && is_space(s[start])) {
        ++start;
    }
    return s.substr(start);
}

std::string_view trim_right(std::string_view s) {
    size_t end = s.size();
    while (end > 0 && is_space(s[end - 1])) {
        --end;
    }
    return s.substr(0, end);
}

std::string_view trim(std::string_view s) {
    return trim_right(trim_left(s));
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string to_upper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool contains(std::string_view s, std::string_view needle) {
    return s.find(needle) != std::string_view::npos;
}

std::string_view indentation(std::string_view line) {
    size_t end = 0;
    while (end < line.size() && (line[end] == ' ' || line[end] == '\t')) {
        ++end;
    }
    return line.substr(0, end);
}

std::vector<std::string> split_lines(std::string_view content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t pos = content.find('\n', start);
        if (pos == std::string_view::npos) {
            lines.emplace_back(content.substr(start));
            break;
        }
        lines.emplace_back(content.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

std::string flatten_newlines(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\r') {
            if (i + 1 < s.size() && s[i + 1] == '\n') ++i;
            out += ' ';
        } else if (s[i] == '\n') {
            out += ' ';
        } else {
            out += s[i];
        }
    }
    return out;
}

size_t count_lines(std::string_view content) {
    if (content.empty()) return 0;
    size_t count = static_cast<size_t>(std::count(content.begin(), content.end(), '\n'));
    if (content.back() != '\n') {
        ++count;
    }
    return count;
}

std::string raw_extension_of(std::string_view path) {
    size_t slash = path.find_last_of("/\\");
    std::string_view name = slash == std::string_view::npos ? path : path.substr(slash + 1);
    size_t dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot == name.size() - 1) {
        return "";
    }
    return std::string(name.substr(dot));
}

std::string extension_of(std::string_view path) {
    return to_lower(raw_extension_of(path));
}

std::string replace_trailing_text(const std::string& line, size_t text_begin,
                                  const std::string& replacement) {
    if (text_begin > line.size()) {
        return line;
    }
    std::string_view rest = std::string_view(line).substr(text_begin);
    if (trim(rest) == replacement) {
        return line;
    }

    std::string_view gap = rest.substr(0, rest.size() - trim_left(rest).size());
    std::string_view body = trim(rest);
    std::string_view trailing;
    if (!body.empty()) {
        trailing = rest.substr(gap.size() + body.size());
    } else {
        gap = std::string_view();
        trailing = rest;
    }

    std::string out = line.substr(0, text_begin);
    out += gap.empty() ? std::string(" ") : std::string(gap);
    out += replacement;
    out += trailing;
    return out;
}

std::string replace_enclosed_text(const std::string& line, size_t begin, size_t end,
                                  const std::string& replacement) {
    if (begin > end || end > line.size()) {
        return line;
    }
    std::string_view inner = std::string_view(line).substr(begin, end - begin);
    std::string_view body = trim(inner);
    if (body == replacement) {
        return line;
    }

    std::string_view lead;
    std::string_view tail;
    if (!body.empty()) {
        lead = inner.substr(0, inner.size() - trim_left(inner).size());
        tail = inner.substr(lead.size() + body.size());
    }

    std::string out = line.substr(0, begin);
    out += lead;
    out += replacement;
    out += tail;
    out += line.substr(end);
    return out;
}

}  // namespace langlint::text
