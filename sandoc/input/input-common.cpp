#include "input-common.hpp"
#include "input.hpp"

#include <ctype.h>

namespace sandoc {

#define TAB_STOP 8

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    std::string current;
    size_t column = 0;
    for (size_t i = 0; i < text.size(); i++) {
        char c = text[i];
        if (c == '\r' || c == '\n') {
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') i++;
            lines.push_back(current);
            current.clear();
            column = 0;
            continue;
        }
        if (c == '\t') {
            size_t spaces = TAB_STOP - (column % TAB_STOP);
            current.append(spaces, ' ');
            column += spaces;
            continue;
        }
        current.push_back(c);
        // continuation bytes do not advance the column
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) column++;
    }
    if (!current.empty()) lines.push_back(current);
    return lines;
}

bool is_blank_line(std::string_view line) {
    for (char c : line) {
        if (!isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

int line_indent(std::string_view line) {
    int n = 0;
    while (static_cast<size_t>(n) < line.size() && line[n] == ' ') n++;
    return n;
}

std::string ltrim_string(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && isspace(static_cast<unsigned char>(s[start]))) start++;
    return std::string(s.substr(start));
}

std::string rtrim_string(std::string_view s) {
    size_t end = s.size();
    while (end > 0 && isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return std::string(s.substr(0, end));
}

std::string trim_string(std::string_view s) {
    return ltrim_string(rtrim_string(s));
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string join_lines(const Lines& lines, const char* separator) {
    std::string out;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i > 0) out += separator;
        out += lines[i];
    }
    return out;
}

Lines deindent_lines(const Lines& lines, size_t n) {
    Lines out;
    out.reserve(lines.size());
    for (const std::string& line : lines) {
        if (is_blank_line(line)) {
            out.emplace_back();
            continue;
        }
        size_t strip = static_cast<size_t>(line_indent(line));
        if (strip > n) strip = n;
        out.push_back(line.substr(strip));
    }
    return out;
}

Lines strip_blank_lines(const Lines& lines) {
    size_t begin = 0;
    size_t end = lines.size();
    while (begin < end && is_blank_line(lines[begin])) begin++;
    while (end > begin && is_blank_line(lines[end - 1])) end--;
    return Lines(lines.begin() + begin, lines.begin() + end);
}

} // namespace sandoc
