#include "rst_parser.hpp"
#include "../names.hpp"

#include <ctype.h>
#include <stdlib.h>
#include <string.h>

namespace sandoc {

static bool is_space(char c) {
    return isspace(static_cast<unsigned char>(c)) != 0;
}

// alphanumeric, or part of a multi-byte UTF-8 sequence
static bool is_name_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return u >= 0x80 || isalnum(u);
}

static bool is_name_punct(char c) {
    return c == '-' || c == '_' || c == '.' || c == ':' || c == '+';
}

// inline markup may start at the beginning of text, after whitespace or after opening punctuation
static bool is_start_context(char c) {
    return c == '\0' || is_space(c) || strchr("-:/'\"<([{", c) != nullptr;
}

static bool is_end_context(char c) {
    return c == '\0' || is_space(c) || strchr("-.,:;!?\\/'\")]}>", c) != nullptr;
}

static bool is_quote_pair(char open, char close) {
    switch (open) {
        case '\'': return close == '\'';
        case '"': return close == '"';
        case '(': return close == ')';
        case '[': return close == ']';
        case '{': return close == '}';
        case '<': return close == '>';
        default: return false;
    }
}

static char char_at(std::string_view src, size_t i) {
    return i < src.size() ? src[i] : '\0';
}

// start-string rules for markup whose content begins at content_start
static bool start_allowed(const SpanCursor& cur, size_t content_start) {
    char before = cur.before();
    char first = char_at(cur.src, content_start);
    if (!is_start_context(before)) return false;
    if (first == '\0' || is_space(first)) return false;
    return !is_quote_pair(before, first);
}

static EndMatcher end_string(std::string delim, size_t content_start) {
    return [delim, content_start](std::string_view src, size_t i) -> size_t {
        if (i <= content_start || src.compare(i, delim.size(), delim) != 0) return 0;
        if (is_space(src[i - 1])) return 0;
        if (!is_end_context(char_at(src, i + delim.size()))) return 0;
        return delim.size();
    };
}

static const SpanParserMap& escape_only_parsers() {
    static const SpanParserMap parsers = {
        {'\\', escape_parser(true)},
    };
    return parsers;
}

bool is_simple_reference_name(std::string_view name) {
    if (name.empty() || !is_name_char(name.front()) || !is_name_char(name.back())) return false;
    for (size_t i = 1; i < name.size(); i++) {
        char c = name[i];
        if (is_name_char(c)) continue;
        if (!is_name_punct(c) || !is_name_char(name[i - 1])) return false;
    }
    return true;
}

bool classify_footnote_label(const std::string& label, FootnoteLabel* out) {
    FootnoteLabel result;
    if (label == "#") {
        result.kind = FootnoteLabelKind::Autonumber;
    } else if (label == "*") {
        result.kind = FootnoteLabelKind::Autosymbol;
    } else if (label.size() > 1 && label[0] == '#' && is_simple_reference_name(label.substr(1))) {
        result.kind = FootnoteLabelKind::AutonumberNamed;
        result.name = normalize_reference_name(label.substr(1));
    } else if (!label.empty() && label.size() <= 9 &&
               label.find_first_not_of("0123456789") == std::string::npos) {
        result.kind = FootnoteLabelKind::Numeric;
        result.number = atoi(label.c_str());
    } else {
        return false;
    }
    if (out) *out = result;
    return true;
}

// ---------------------------------------------------------------------------
// span parsers
// ---------------------------------------------------------------------------

static std::optional<SpanResult> parse_emphasis(const SpanCursor& cur) {
    bool strong = char_at(cur.src, cur.pos) == '*';
    size_t start = strong ? cur.pos + 1 : cur.pos;
    if (!start_allowed(cur, start)) return std::nullopt;
    std::optional<NestedSpans> nested =
        parse_nested_spans(cur.src, start, end_string(strong ? "**" : "*", start), escape_only_parsers());
    if (!nested) return std::nullopt;
    ElementPtr span = strong ? make_strong(nested->spans) : make_emphasized(nested->spans);
    return SpanResult{span, nested->next};
}

static std::optional<SpanResult> parse_inline_literal(const SpanCursor& cur) {
    size_t start = cur.pos + 1;
    if (!start_allowed(cur, start)) return std::nullopt;
    EndMatcher end = end_string("``", start);
    for (size_t i = start; i < cur.src.size(); i++) {
        size_t len = end(cur.src, i);
        if (len) return SpanResult{make_literal(std::string(cur.src.substr(start, i - start))), i + len};
    }
    return std::nullopt;
}

// role name at pos, returns the position after it or pos when there is none
static size_t scan_role_name(std::string_view src, size_t pos) {
    size_t i = pos;
    while (i < src.size()) {
        char c = src[i];
        if (is_name_char(c)) {
            i++;
        } else if (is_name_punct(c) && c != ':' && i > pos && i + 1 < src.size() && is_name_char(src[i + 1])) {
            i++;
        } else {
            break;
        }
    }
    return i;
}

// `text <url>`_ creates the link directly, everything else is resolved later
static ElementPtr phrase_reference(const std::string& text, bool anonymous, const std::string& source) {
    if (text.size() > 2 && text.back() == '>') {
        size_t open = text.rfind('<');
        if (open != std::string::npos && (open == 0 || is_space(text[open - 1]))) {
            std::string label = trim_string(text.substr(0, open));
            std::string url;
            for (char c : text.substr(open + 1, text.size() - open - 2)) {
                if (!is_space(c)) url.push_back(c);
            }
            if (url.size() > 1 && url.back() == '_') {
                std::string id = normalize_reference_name(url.substr(0, url.size() - 1));
                return make_link_reference({make_text(label.empty() ? id : label)}, id, source);
            }
            if (!url.empty()) return make_external_link({make_text(label.empty() ? url : label)}, url);
        }
    }
    return make_link_reference({make_text(text)}, anonymous ? std::string() : normalize_reference_name(text),
                               source);
}

/**
 * Interpreted text and phrase references: `text`, `text`_, `text`__ and
 * `text`:role:. A role given as prefix disables the suffix forms.
 */
static std::optional<SpanResult> parse_interpreted(std::string_view src, size_t start, size_t source_start,
                                                   const std::string& prefix_role) {
    for (size_t i = start + 1; i < src.size(); i++) {
        if (src[i] == '\\') {
            i++;
            continue;
        }
        if (src[i] != '`' || is_space(src[i - 1])) continue;

        std::string text(src.substr(start, i - start));
        size_t after = i + 1;
        std::string role = prefix_role;
        int link = 0;
        if (prefix_role.empty()) {
            if (src.compare(after, 2, "__") == 0) {
                link = 2;
            } else if (char_at(src, after) == '_') {
                link = 1;
            } else if (char_at(src, after) == ':') {
                size_t role_end = scan_role_name(src, after + 1);
                if (role_end > after + 1 && char_at(src, role_end) == ':') {
                    role = std::string(src.substr(after + 1, role_end - after - 1));
                    after = role_end + 1;
                }
            }
        }
        after += link;
        if (!is_end_context(char_at(src, after))) continue;

        std::string source(src.substr(source_start, after - source_start));
        ElementPtr span;
        if (link) {
            span = phrase_reference(text, link == 2, source);
        } else {
            span = make_interpreted_text(normalize_reference_name(role.empty() ? "title-reference" : role), text,
                                         source);
        }
        return SpanResult{span, after};
    }
    return std::nullopt;
}

static std::optional<SpanResult> parse_backtick(const SpanCursor& cur) {
    if (char_at(cur.src, cur.pos) == '`') return parse_inline_literal(cur);
    if (!start_allowed(cur, cur.pos)) return std::nullopt;
    return parse_interpreted(cur.src, cur.pos, cur.pos - 1, std::string());
}

// :role:`text`
static std::optional<SpanResult> parse_role_prefix(const SpanCursor& cur) {
    if (!is_start_context(cur.before())) return std::nullopt;
    size_t role_end = scan_role_name(cur.src, cur.pos);
    if (role_end == cur.pos || char_at(cur.src, role_end) != ':' || char_at(cur.src, role_end + 1) != '`') {
        return std::nullopt;
    }
    size_t start = role_end + 2;
    char first = char_at(cur.src, start);
    if (first == '\0' || is_space(first)) return std::nullopt;
    std::string role(cur.src.substr(cur.pos, role_end - cur.pos));
    return parse_interpreted(cur.src, start, cur.pos - 1, role);
}

// |name|, |name|_ and |name|__
static std::optional<SpanResult> parse_substitution(const SpanCursor& cur) {
    if (!start_allowed(cur, cur.pos)) return std::nullopt;
    for (size_t i = cur.pos + 1; i < cur.src.size(); i++) {
        if (cur.src[i] == '\n' && char_at(cur.src, i + 1) == '\n') break;
        if (cur.src[i] != '|' || is_space(cur.src[i - 1])) continue;
        size_t after = i + 1;
        int link = 0;
        if (cur.src.compare(after, 2, "__") == 0) link = 2;
        else if (char_at(cur.src, after) == '_') link = 1;
        if (!is_end_context(char_at(cur.src, after + link))) continue;

        std::string name(cur.src.substr(cur.pos, i - cur.pos));
        std::string sub_source(cur.src.substr(cur.pos - 1, after - cur.pos + 1));
        ElementPtr span = make_substitution_reference(name, sub_source);
        if (link) {
            std::string source(cur.src.substr(cur.pos - 1, after + link - cur.pos + 1));
            span = make_link_reference({span}, link == 2 ? std::string() : normalize_reference_name(name), source);
        }
        return SpanResult{span, after + link};
    }
    return std::nullopt;
}

// [1]_, [#]_, [#name]_, [*]_ and [citation]_
static std::optional<SpanResult> parse_bracket_reference(const SpanCursor& cur) {
    if (!is_start_context(cur.before())) return std::nullopt;
    size_t close = cur.src.find(']', cur.pos);
    if (close == std::string_view::npos || close == cur.pos) return std::nullopt;
    if (char_at(cur.src, close + 1) != '_' || !is_end_context(char_at(cur.src, close + 2))) return std::nullopt;

    std::string label(cur.src.substr(cur.pos, close - cur.pos));
    std::string source(cur.src.substr(cur.pos - 1, close + 3 - cur.pos));
    FootnoteLabel footnote;
    if (classify_footnote_label(label, &footnote)) {
        return SpanResult{make_footnote_reference(footnote, source), close + 2};
    }
    if (is_simple_reference_name(label)) {
        return SpanResult{make_citation_reference(normalize_reference_name(label), source), close + 2};
    }
    return std::nullopt;
}

// name_ and name__: the name is taken back from the pending text run
static std::optional<SpanResult> parse_trailing_reference(const SpanCursor& cur) {
    size_t trigger = cur.pos - 1;
    size_t start = trigger;
    while (start > cur.run_start) {
        char c = cur.src[start - 1];
        if (is_name_char(c) || (is_name_punct(c) && start < trigger && is_name_char(cur.src[start]))) {
            start--;
        } else {
            break;
        }
    }
    while (start < trigger && is_name_punct(cur.src[start])) start++;
    if (start == trigger || !is_name_char(cur.src[trigger - 1])) return std::nullopt;
    if (!is_start_context(start > 0 ? cur.src[start - 1] : '\0')) return std::nullopt;

    bool anonymous = char_at(cur.src, cur.pos) == '_';
    size_t next = anonymous ? cur.pos + 1 : cur.pos;
    if (!is_end_context(char_at(cur.src, next))) return std::nullopt;

    std::string name(cur.src.substr(start, trigger - start));
    std::string source(cur.src.substr(start, next - start));
    ElementPtr span =
        make_link_reference({make_text(name)}, anonymous ? std::string() : normalize_reference_name(name), source);
    return SpanResult{span, next, trigger - start};
}

const SpanParserMap& rst_span_parsers() {
    static const SpanParserMap parsers = {
        {'*', parse_emphasis},
        {'`', parse_backtick},
        {':', parse_role_prefix},
        {'|', parse_substitution},
        {'[', parse_bracket_reference},
        {'_', parse_trailing_reference},
        {'\\', escape_parser(true)},
    };
    return parsers;
}

ElementList parse_rst_spans(std::string_view text) {
    return parse_spans(text, rst_span_parsers());
}

} // namespace sandoc
