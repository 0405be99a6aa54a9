// inline_parser.hpp - Start-character driven span parsing shared by all dialects

#ifndef SANDOC_INLINE_PARSER_HPP
#define SANDOC_INLINE_PARSER_HPP

#include "element.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace sandoc {

// position handed to a span parser: pos is the first character after the trigger
struct SpanCursor {
    std::string_view src;
    size_t pos;
    size_t run_start;   // start of the plain-text run pending before the trigger

    char trigger() const { return src[pos - 1]; }
    // character before the trigger, '\0' at start of text
    char before() const { return pos >= 2 ? src[pos - 2] : '\0'; }
    bool atEnd(size_t i) const { return i >= src.size(); }
};

struct SpanResult {
    ElementPtr span;
    size_t next;          // position where scanning resumes
    size_t retract = 0;   // characters of the pending text run the span swallows
};

typedef std::function<std::optional<SpanResult>(const SpanCursor&)> SpanParser;
typedef std::map<char, SpanParser> SpanParserMap;

// returns the length of a closing delimiter at pos, or 0
typedef std::function<size_t(std::string_view, size_t)> EndMatcher;

struct NestedSpans {
    ElementList spans;
    size_t end;     // position of the closing delimiter
    size_t next;    // position after it
};

/**
 * Accumulates spans, merging adjacent plain text into a single Text node.
 */
class SpanBuilder {
public:
    void addText(std::string_view text) { pending_.append(text.data(), text.size()); }
    void addChar(char c) { pending_.push_back(c); }
    void addSpan(ElementPtr span);
    // drops up to n trailing characters of the pending text run
    bool retract(size_t n);
    size_t pendingLength() const { return pending_.size(); }
    ElementList finish();

private:
    void flush();

    std::string pending_;
    ElementList spans_;
};

/**
 * Parses src[begin, end) into spans. Characters found in parsers trigger the
 * mapped nested parser; when it fails the trigger becomes literal text and
 * scanning continues with the next character. Never fails.
 */
ElementList parse_spans(std::string_view src, const SpanParserMap& parsers,
                        size_t begin = 0, size_t end = std::string_view::npos);

/**
 * Parses nested spans from pos until end_matcher reports a closing delimiter.
 * Returns nullopt when the text ends before a delimiter is found.
 */
std::optional<NestedSpans> parse_nested_spans(std::string_view src, size_t pos,
                                              const EndMatcher& end_matcher,
                                              const SpanParserMap& parsers);

// backslash escape: the next character is literal text; escaped whitespace
// is dropped when drop_whitespace is set
SpanParser escape_parser(bool drop_whitespace);

} // namespace sandoc

#endif // SANDOC_INLINE_PARSER_HPP
