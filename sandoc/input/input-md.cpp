#include "input.hpp"
#include "input-common.hpp"
#include "../names.hpp"
#include "../../lib/log.h"

#include <ctype.h>
#include <stdlib.h>
#include <string.h>
#include <re2/re2.h>
#include <set>
#include <tuple>

namespace sandoc {

static log_category_t* md_log() {
    return log_category_or_default("markdown");
}

// maximum nesting of quotes and lists
#define MD_MAX_NESTING_DEPTH 32

static ElementList parse_markdown_content(const Lines& lines, int depth);
static ElementPtr parse_block_element(const Lines& lines, size_t* current_line, int depth);

// Block recognition, one line at a time

static size_t leading_spaces(const std::string& line, size_t max) {
    size_t n = 0;
    while (n < max && n < line.size() && line[n] == ' ') n++;
    return n;
}

static bool is_atx_heading(const std::string& line, int* level) {
    size_t pos = leading_spaces(line, 3);
    size_t hashes = 0;
    while (pos + hashes < line.size() && line[pos + hashes] == '#') hashes++;
    if (hashes < 1 || hashes > 6) return false;
    size_t after = pos + hashes;
    if (after < line.size() && line[after] != ' ') return false;
    if (level) *level = static_cast<int>(hashes);
    return true;
}

// three or more of the same '-', '*' or '_', optionally separated by spaces
static bool is_thematic_break(const std::string& line) {
    size_t pos = leading_spaces(line, 3);
    if (pos >= line.size() || (line[pos] != '-' && line[pos] != '*' && line[pos] != '_')) return false;
    char ch = line[pos];
    int count = 0;
    for (; pos < line.size(); pos++) {
        if (line[pos] == ch) count++;
        else if (line[pos] != ' ') return false;
    }
    return count >= 3;
}

static bool is_fenced_code_block_start(const std::string& line, char* fence_char, size_t* fence_length) {
    size_t pos = leading_spaces(line, 3);
    if (pos >= line.size() || (line[pos] != '`' && line[pos] != '~')) return false;
    char ch = line[pos];
    size_t len = 0;
    while (pos + len < line.size() && line[pos + len] == ch) len++;
    if (len < 3) return false;
    // backtick fences may not have backticks in the info string
    if (ch == '`' && line.find('`', pos + len) != std::string::npos) return false;
    if (fence_char) *fence_char = ch;
    if (fence_length) *fence_length = len;
    return true;
}

static bool is_blockquote(const std::string& line) {
    size_t pos = leading_spaces(line, 3);
    return pos < line.size() && line[pos] == '>';
}

static bool is_setext_underline(const std::string& line, int* level) {
    std::string text = trim_string(line);
    if (text.empty() || leading_spaces(line, 4) > 3) return false;
    if (text.find_first_not_of('=') == std::string::npos) {
        if (level) *level = 1;
        return true;
    }
    if (text.find_first_not_of('-') == std::string::npos) {
        if (level) *level = 2;
        return true;
    }
    return false;
}

struct ListMarker {
    bool ordered = false;
    char delimiter = '\0';   // bullet character, or '.' / ')' after a number
    int number = 0;
    size_t content_col = 0;
};

static bool is_list_marker(const std::string& line, ListMarker* marker) {
    size_t pos = leading_spaces(line, 3);
    ListMarker result;
    if (pos < line.size() && (line[pos] == '-' || line[pos] == '*' || line[pos] == '+')) {
        result.delimiter = line[pos];
        pos++;
    } else {
        size_t digits = 0;
        while (pos + digits < line.size() && isdigit(static_cast<unsigned char>(line[pos + digits]))) digits++;
        if (digits == 0 || digits > 9 || pos + digits >= line.size()) return false;
        char delim = line[pos + digits];
        if (delim != '.' && delim != ')') return false;
        result.ordered = true;
        result.delimiter = delim;
        result.number = atoi(line.substr(pos, digits).c_str());
        pos += digits + 1;
    }
    if (pos < line.size() && line[pos] != ' ') return false;

    size_t spaces = 0;
    while (pos + spaces < line.size() && line[pos + spaces] == ' ') spaces++;
    if (pos + spaces >= line.size()) {
        result.content_col = pos + 1;     // empty item
    } else if (spaces > 4) {
        result.content_col = pos + 1;     // indented code inside the item
    } else {
        result.content_col = pos + spaces;
    }
    if (marker) *marker = result;
    return true;
}

// lines that end a paragraph without a blank line in between
static bool interrupts_paragraph(const std::string& line) {
    ListMarker marker;
    return is_atx_heading(line, nullptr) || is_thematic_break(line) ||
        is_fenced_code_block_start(line, nullptr, nullptr) || is_blockquote(line) ||
        (is_list_marker(line, &marker) && (!marker.ordered || marker.number == 1) &&
         marker.content_col < line.size());
}

static ElementList parse_nested(const Lines& lines, int depth) {
    if (depth + 1 > MD_MAX_NESTING_DEPTH) {
        clog_warn(md_log(), "markdown: block nesting deeper than %d, keeping content literal", MD_MAX_NESTING_DEPTH);
        return {make_literal_block(join_lines(strip_blank_lines(lines), "\n"))};
    }
    return parse_markdown_content(lines, depth + 1);
}

// Block parsers

static ElementPtr parse_header(const std::string& line, int level) {
    std::string text = trim_string(line);
    text = ltrim_string(text.substr(static_cast<size_t>(level)));
    // closing sequence of '#' preceded by a space
    size_t end = text.size();
    while (end > 0 && text[end - 1] == '#') end--;
    if (end == 0) text.clear();
    else if (end < text.size() && text[end - 1] == ' ') text = rtrim_string(text.substr(0, end));

    ElementList spans = parse_markdown_spans(text);
    std::string id = slugify(flatten_text(spans));
    return make_header(level, spans, id.empty() ? Options() : Id(id));
}

static ElementPtr parse_code_block(const Lines& lines, size_t* current_line) {
    const std::string& first = lines[*current_line];
    char fence_char = '`';
    size_t fence_length = 0;
    is_fenced_code_block_start(first, &fence_char, &fence_length);
    size_t indent = leading_spaces(first, 3);
    std::string info = trim_string(first.substr(indent + fence_length));
    (*current_line)++;

    Lines code;
    while (*current_line < lines.size()) {
        const std::string& line = lines[*current_line];
        char close_char;
        size_t close_length;
        if (is_fenced_code_block_start(line, &close_char, &close_length) && close_char == fence_char &&
            close_length >= fence_length && trim_string(line).find_first_not_of(fence_char) == std::string::npos) {
            (*current_line)++;
            break;
        }
        size_t strip = leading_spaces(line, indent);
        code.push_back(line.substr(strip));
        (*current_line)++;
    }

    Options opt;
    if (!info.empty()) {
        std::string language = info.substr(0, info.find(' '));
        opt = Styles({language});
    }
    return make_literal_block(join_lines(code, "\n"), opt);
}

static ElementPtr parse_indented_code(const Lines& lines, size_t* current_line) {
    Lines code;
    size_t end = *current_line;
    for (size_t i = *current_line; i < lines.size(); i++) {
        if (is_blank_line(lines[i])) continue;
        if (line_indent(lines[i]) < 4) break;
        end = i + 1;
    }
    for (size_t i = *current_line; i < end; i++) {
        code.push_back(is_blank_line(lines[i]) ? std::string() : lines[i].substr(4));
    }
    *current_line = end;
    return make_literal_block(join_lines(code, "\n"));
}

static ElementPtr parse_blockquote(const Lines& lines, size_t* current_line, int depth) {
    Lines content;
    bool lazy_allowed = false;
    while (*current_line < lines.size()) {
        const std::string& line = lines[*current_line];
        if (is_blockquote(line)) {
            size_t pos = leading_spaces(line, 3) + 1;
            if (pos < line.size() && line[pos] == ' ') pos++;
            std::string stripped = line.substr(pos);
            lazy_allowed = !is_blank_line(stripped) && !is_fenced_code_block_start(stripped, nullptr, nullptr);
            content.push_back(stripped);
        } else if (lazy_allowed && !is_blank_line(line) && !interrupts_paragraph(line)) {
            // lazy continuation of a quoted paragraph
            content.push_back(line);
        } else {
            break;
        }
        (*current_line)++;
    }
    return make_quoted_block(parse_nested(content, depth), {});
}

static bool same_list_type(const ListMarker& a, const ListMarker& b) {
    return a.ordered == b.ordered && a.delimiter == b.delimiter;
}

static ElementPtr parse_list(const Lines& lines, size_t* current_line, int depth) {
    ListMarker first;
    is_list_marker(lines[*current_line], &first);
    ElementList items;
    ListMarker marker = first;

    while (true) {
        const std::string& line = lines[*current_line];
        Lines item;
        item.push_back(marker.content_col < line.size() ? line.substr(marker.content_col) : std::string());
        (*current_line)++;
        bool previous_blank = is_blank_line(item.back());
        while (*current_line < lines.size()) {
            const std::string& next = lines[*current_line];
            if (is_blank_line(next)) {
                item.emplace_back();
                previous_blank = true;
            } else if (static_cast<size_t>(line_indent(next)) >= marker.content_col) {
                item.push_back(next.substr(marker.content_col));
                previous_blank = false;
            } else if (!previous_blank && !interrupts_paragraph(next) && !is_list_marker(next, nullptr)) {
                item.push_back(trim_string(next));
            } else {
                break;
            }
            (*current_line)++;
        }
        // trailing blank lines belong between items, not to the item
        while (item.size() > 1 && is_blank_line(item.back())) {
            item.pop_back();
            (*current_line)--;
        }

        ElementList blocks = parse_nested(item, depth);
        if (first.ordered) {
            EnumFormat format{EnumType::Arabic, "", std::string(1, first.delimiter)};
            items.push_back(make_enum_list_item(blocks, format, first.number + static_cast<int>(items.size())));
        } else {
            items.push_back(make_bullet_list_item(blocks, std::string(1, first.delimiter)));
        }

        size_t save = *current_line;
        while (*current_line < lines.size() && is_blank_line(lines[*current_line])) (*current_line)++;
        if (*current_line >= lines.size() || is_thematic_break(lines[*current_line]) ||
            !is_list_marker(lines[*current_line], &marker) || !same_list_type(marker, first)) {
            *current_line = save;
            break;
        }
    }

    if (first.ordered) {
        EnumFormat format{EnumType::Arabic, "", std::string(1, first.delimiter)};
        return make_enum_list(items, format, first.number);
    }
    return make_bullet_list(items, std::string(1, first.delimiter));
}

static ElementPtr parse_link_definition(const std::string& line) {
    static const re2::RE2 definition_re(
        "^ {0,3}\\[([^\\]]+)\\]:\\s*(<[^>]*>|\\S+)(?:\\s+(\"[^\"]*\"|'[^']*'|\\([^)]*\\)))?\\s*$");
    std::string label, url, title;
    if (!re2::RE2::FullMatch(line, definition_re, &label, &url, &title)) return nullptr;
    if (url.size() >= 2 && url.front() == '<') url = url.substr(1, url.size() - 2);
    std::optional<std::string> link_title;
    if (title.size() >= 2) link_title = title.substr(1, title.size() - 2);
    return make_external_link_definition(normalize_reference_name(label), url, link_title);
}

static ElementPtr parse_paragraph(const Lines& lines, size_t* current_line) {
    Lines text;
    while (*current_line < lines.size()) {
        const std::string& line = lines[*current_line];
        if (is_blank_line(line)) break;
        int level = 0;
        if (!text.empty() && is_setext_underline(line, &level)) {
            (*current_line)++;
            ElementList spans = parse_markdown_spans(trim_string(join_lines(text, "\n")));
            std::string id = slugify(flatten_text(spans));
            return make_header(level, spans, id.empty() ? Options() : Id(id));
        }
        if (!text.empty() && interrupts_paragraph(line)) break;
        text.push_back(ltrim_string(line));
        (*current_line)++;
    }
    if (text.empty()) return nullptr;
    return make_paragraph(parse_markdown_spans(trim_string(join_lines(text, "\n"))));
}

static ElementPtr parse_block_element(const Lines& lines, size_t* current_line, int depth) {
    const std::string& line = lines[*current_line];

    if (is_blank_line(line)) {
        (*current_line)++;
        return nullptr;
    }
    if (line_indent(line) >= 4) {
        return parse_indented_code(lines, current_line);
    }
    int level = 0;
    if (is_atx_heading(line, &level)) {
        (*current_line)++;
        return parse_header(line, level);
    }
    if (is_thematic_break(line)) {
        (*current_line)++;
        return make_rule();
    }
    if (is_fenced_code_block_start(line, nullptr, nullptr)) {
        return parse_code_block(lines, current_line);
    }
    if (is_blockquote(line)) {
        return parse_blockquote(lines, current_line, depth);
    }
    if (is_list_marker(line, nullptr)) {
        return parse_list(lines, current_line, depth);
    }
    ElementPtr definition = parse_link_definition(line);
    if (definition) {
        (*current_line)++;
        return definition;
    }
    return parse_paragraph(lines, current_line);
}

static ElementList parse_markdown_content(const Lines& lines, int depth) {
    ElementList blocks;
    size_t current_line = 0;
    while (current_line < lines.size()) {
        size_t start = current_line;
        ElementPtr block = parse_block_element(lines, &current_line, depth);
        if (block) blocks.push_back(block);
        if (current_line == start) current_line++;
    }
    return blocks;
}

// ---------------------------------------------------------------------------
// inline content
// ---------------------------------------------------------------------------

static char char_at(std::string_view src, size_t i) {
    return i < src.size() ? src[i] : '\0';
}

static bool is_ascii_punct(char c) {
    return c != '\0' && strchr("!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~", c) != nullptr;
}

static bool is_word_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return u >= 0x80 || isalnum(u);
}

static std::optional<SpanResult> parse_escape(const SpanCursor& cur) {
    char c = char_at(cur.src, cur.pos);
    if (c == '\n') return SpanResult{make_line_break(), cur.pos + 1};
    if (!is_ascii_punct(c)) return std::nullopt;
    return SpanResult{make_text(std::string(1, c)), cur.pos + 1};
}

static EndMatcher emphasis_end(char marker, size_t count, size_t content_start) {
    return [marker, count, content_start](std::string_view src, size_t i) -> size_t {
        if (i <= content_start || isspace(static_cast<unsigned char>(src[i - 1]))) return 0;
        for (size_t k = 0; k < count; k++) {
            if (char_at(src, i + k) != marker) return 0;
        }
        // underscores do not close inside a word
        if (marker == '_' && is_word_char(char_at(src, i + count))) return 0;
        return count;
    };
}

// openers with no closer in the text being parsed: (text, text length, marker, count, content start)
typedef std::set<std::tuple<const char*, size_t, char, size_t, size_t>> UnclosedEmphasis;
static thread_local UnclosedEmphasis* unclosed_emphasis = nullptr;

class UnclosedEmphasisScope {
public:
    explicit UnclosedEmphasisScope(bool fresh) : previous_(unclosed_emphasis) {
        if (fresh || !unclosed_emphasis) unclosed_emphasis = &openers_;
    }
    ~UnclosedEmphasisScope() { unclosed_emphasis = previous_; }

private:
    UnclosedEmphasis* previous_;
    UnclosedEmphasis openers_;
};

static std::optional<SpanResult> parse_emphasis(const SpanCursor& cur) {
    char marker = cur.trigger();
    if (marker == '_' && is_word_char(cur.before())) return std::nullopt;
    size_t run = 1;
    while (char_at(cur.src, cur.pos - 1 + run) == marker) run++;

    UnclosedEmphasisScope scope(false);
    for (size_t count = run >= 2 ? 2 : 1; count >= 1; count--) {
        size_t start = cur.pos - 1 + count;
        char first = char_at(cur.src, start);
        if (first == '\0' || isspace(static_cast<unsigned char>(first))) continue;
        // a failed closer search does not depend on what encloses the opener
        auto key = std::make_tuple(cur.src.data(), cur.src.size(), marker, count, start);
        if (unclosed_emphasis->count(key)) continue;
        std::optional<NestedSpans> nested =
            parse_nested_spans(cur.src, start, emphasis_end(marker, count, start), markdown_span_parsers());
        if (!nested) {
            unclosed_emphasis->insert(key);
            continue;
        }
        ElementPtr span = count == 2 ? make_strong(nested->spans) : make_emphasized(nested->spans);
        return SpanResult{span, nested->next};
    }
    return std::nullopt;
}

static std::optional<SpanResult> parse_code_span(const SpanCursor& cur) {
    size_t open = cur.pos - 1;
    size_t run = 1;
    while (char_at(cur.src, open + run) == '`') run++;

    size_t i = open + run;
    while (i < cur.src.size()) {
        if (cur.src[i] != '`') {
            i++;
            continue;
        }
        size_t close = 1;
        while (char_at(cur.src, i + close) == '`') close++;
        if (close == run) {
            std::string code(cur.src.substr(open + run, i - open - run));
            for (char& c : code) {
                if (c == '\n') c = ' ';
            }
            if (code.size() >= 2 && code.front() == ' ' && code.back() == ' ' &&
                code.find_first_not_of(' ') != std::string::npos) {
                code = code.substr(1, code.size() - 2);
            }
            return SpanResult{make_literal(code), i + close};
        }
        i += close;
    }
    // an unmatched backtick string is literal text as a whole
    return SpanResult{make_text(std::string(run, '`')), open + run};
}

// position of the ']' matching the '[' before pos, npos when unbalanced
static size_t find_link_text_end(std::string_view src, size_t pos) {
    int depth = 1;
    for (size_t i = pos; i < src.size(); i++) {
        char c = src[i];
        if (c == '\\') {
            i++;
        } else if (c == '[') {
            depth++;
        } else if (c == ']') {
            if (--depth == 0) return i;
        }
    }
    return std::string_view::npos;
}

struct InlineDestination {
    std::string url;
    std::optional<std::string> title;
    size_t next = 0;
};

// (url "title") starting at the '('
static bool parse_destination(std::string_view src, size_t pos, InlineDestination* out) {
    if (char_at(src, pos) != '(') return false;
    size_t i = pos + 1;
    while (i < src.size() && isspace(static_cast<unsigned char>(src[i]))) i++;

    InlineDestination dest;
    if (char_at(src, i) == '<') {
        size_t close = src.find('>', i + 1);
        if (close == std::string_view::npos) return false;
        dest.url = std::string(src.substr(i + 1, close - i - 1));
        i = close + 1;
    } else {
        int parens = 0;
        size_t start = i;
        while (i < src.size() && !isspace(static_cast<unsigned char>(src[i]))) {
            if (src[i] == '(') parens++;
            else if (src[i] == ')' && parens-- == 0) break;
            i++;
        }
        dest.url = std::string(src.substr(start, i - start));
    }
    while (i < src.size() && isspace(static_cast<unsigned char>(src[i]))) i++;

    char quote = char_at(src, i);
    if (quote == '"' || quote == '\'' || quote == '(') {
        char close_quote = quote == '(' ? ')' : quote;
        size_t close = src.find(close_quote, i + 1);
        if (close == std::string_view::npos) return false;
        dest.title = std::string(src.substr(i + 1, close - i - 1));
        i = close + 1;
        while (i < src.size() && isspace(static_cast<unsigned char>(src[i]))) i++;
    }
    if (char_at(src, i) != ')') return false;
    dest.next = i + 1;
    *out = dest;
    return true;
}

struct ReferenceSuffix {
    std::string id;
    size_t next = 0;
};

// [id], [] or nothing after the link text
static ReferenceSuffix parse_reference_suffix(std::string_view src, size_t pos, const std::string& text) {
    ReferenceSuffix suffix;
    if (char_at(src, pos) == '[') {
        size_t close = src.find(']', pos + 1);
        if (close != std::string_view::npos) {
            std::string label(src.substr(pos + 1, close - pos - 1));
            suffix.id = normalize_reference_name(label.empty() ? text : label);
            suffix.next = close + 1;
            return suffix;
        }
    }
    suffix.id = normalize_reference_name(text);
    suffix.next = pos;
    return suffix;
}

static std::optional<SpanResult> parse_link_or_image(std::string_view src, size_t bracket, bool image) {
    size_t text_start = bracket + 1;
    size_t text_end = find_link_text_end(src, text_start);
    if (text_end == std::string_view::npos) return std::nullopt;
    std::string text(src.substr(text_start, text_end - text_start));
    size_t source_start = image ? bracket - 1 : bracket;

    InlineDestination dest;
    if (parse_destination(src, text_end + 1, &dest)) {
        if (image) {
            return SpanResult{make_image(flatten_text(parse_markdown_spans(text)), dest.url, dest.title), dest.next};
        }
        ElementList spans = parse_spans(src, markdown_span_parsers(), text_start, text_end);
        return SpanResult{make_external_link(spans, dest.url, dest.title), dest.next};
    }
    if (trim_string(text).empty()) return std::nullopt;

    ReferenceSuffix suffix = parse_reference_suffix(src, text_end + 1, text);
    std::string source(src.substr(source_start, suffix.next - source_start));
    if (image) {
        return SpanResult{make_image_reference(flatten_text(parse_markdown_spans(text)), suffix.id, source),
                          suffix.next};
    }
    ElementList spans = parse_spans(src, markdown_span_parsers(), text_start, text_end);
    return SpanResult{make_link_reference(spans, suffix.id, source), suffix.next};
}

static std::optional<SpanResult> parse_link(const SpanCursor& cur) {
    return parse_link_or_image(cur.src, cur.pos - 1, false);
}

static std::optional<SpanResult> parse_image(const SpanCursor& cur) {
    if (char_at(cur.src, cur.pos) != '[') return std::nullopt;
    return parse_link_or_image(cur.src, cur.pos, true);
}

// <http://example.com> and <user@example.com>
static std::optional<SpanResult> parse_autolink(const SpanCursor& cur) {
    static const re2::RE2 uri_re("[a-zA-Z][a-zA-Z0-9+.-]{1,31}:[^\\s<>]*");
    static const re2::RE2 email_re("[a-zA-Z0-9.!#$%&'*+/=?^_`{|}~-]+@[a-zA-Z0-9](?:[a-zA-Z0-9-]*[a-zA-Z0-9])?"
                                   "(?:\\.[a-zA-Z0-9](?:[a-zA-Z0-9-]*[a-zA-Z0-9])?)*");
    size_t close = cur.src.find('>', cur.pos);
    if (close == std::string_view::npos) return std::nullopt;
    std::string target(cur.src.substr(cur.pos, close - cur.pos));
    if (re2::RE2::FullMatch(target, uri_re)) {
        return SpanResult{make_external_link({make_text(target)}, target), close + 1};
    }
    if (re2::RE2::FullMatch(target, email_re)) {
        return SpanResult{make_external_link({make_text(target)}, "mailto:" + target), close + 1};
    }
    return std::nullopt;
}

// two or more spaces before a line end: the spaces are taken back from the text run
static std::optional<SpanResult> parse_hard_break(const SpanCursor& cur) {
    size_t newline = cur.pos - 1;
    size_t spaces = 0;
    while (newline - spaces > cur.run_start && cur.src[newline - spaces - 1] == ' ') spaces++;
    if (spaces < 2) return std::nullopt;
    return SpanResult{make_line_break(), cur.pos, spaces};
}

const SpanParserMap& markdown_span_parsers() {
    static const SpanParserMap parsers = {
        {'\\', parse_escape},
        {'*', parse_emphasis},
        {'_', parse_emphasis},
        {'`', parse_code_span},
        {'[', parse_link},
        {'!', parse_image},
        {'<', parse_autolink},
        {'\n', parse_hard_break},
    };
    return parsers;
}

ElementList parse_markdown_spans(std::string_view text) {
    UnclosedEmphasisScope scope(true);
    return parse_spans(text, markdown_span_parsers());
}

RawDocument parse_markdown(std::string_view text) {
    ElementList blocks = parse_markdown_content(split_lines(text), 0);
    clog_debug(md_log(), "markdown: parsed %zu top-level blocks", blocks.size());
    RawDocument raw;
    raw.document = make_document(blocks);
    return raw;
}

} // namespace sandoc
