// input.hpp - Dialect front ends producing raw documents for the rewrite pass

#ifndef SANDOC_INPUT_HPP
#define SANDOC_INPUT_HPP

#include "../element.hpp"
#include "../inline_parser.hpp"
#include "../rewrite.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sandoc {

// reStructuredText
RawDocument parse_rst(std::string_view text);
ElementList parse_rst_blocks(std::string_view text);
ElementList parse_rst_spans(std::string_view text);
const SpanParserMap& rst_span_parsers();
RuleFactory rst_rewrite_rules();

// Markdown
RawDocument parse_markdown(std::string_view text);
ElementList parse_markdown_spans(std::string_view text);
const SpanParserMap& markdown_span_parsers();

// splits on \n, \r\n or \r and expands tabs to 8-column stops
std::vector<std::string> split_lines(std::string_view text);

} // namespace sandoc

#endif // SANDOC_INPUT_HPP
