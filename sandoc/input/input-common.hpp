// input-common.hpp - Line utilities shared by the dialect parsers

#ifndef SANDOC_INPUT_COMMON_HPP
#define SANDOC_INPUT_COMMON_HPP

#include <string>
#include <string_view>
#include <vector>

namespace sandoc {

typedef std::vector<std::string> Lines;

bool is_blank_line(std::string_view line);
int line_indent(std::string_view line);

std::string trim_string(std::string_view s);
std::string ltrim_string(std::string_view s);
std::string rtrim_string(std::string_view s);
bool starts_with(std::string_view s, std::string_view prefix);
bool ends_with(std::string_view s, std::string_view suffix);

std::string join_lines(const Lines& lines, const char* separator);
// removes up to n leading spaces from every line; blank lines become empty
Lines deindent_lines(const Lines& lines, size_t n);
// drops leading and trailing blank lines
Lines strip_blank_lines(const Lines& lines);

} // namespace sandoc

#endif // SANDOC_INPUT_COMMON_HPP
