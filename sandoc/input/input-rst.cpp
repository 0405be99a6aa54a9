#include "rst_parser.hpp"
#include "../names.hpp"
#include "../../lib/log.h"
#include "../../lib/utf.h"

#include <limits.h>
#include <stdlib.h>
#include <string.h>
#include <re2/re2.h>

namespace sandoc {

static log_category_t* rst_log() {
    return log_category_or_default("rst");
}

static const std::string empty_line;

static bool is_punctuation(char c) {
    return c != '\0' && strchr("!\"#$%&'()[]{}*+,-.:;/<>=?@\\^_`|~", c) != nullptr;
}

// a line made of one repeated punctuation character
static bool is_adornment(const std::string& line, char* ch) {
    if (line.empty() || !is_punctuation(line[0])) return false;
    for (char c : line) {
        if (c != line[0]) return false;
    }
    if (ch) *ch = line[0];
    return true;
}

// "---", "--" or an em dash introduce a quote attribution
static size_t attribution_marker_len(const std::string& text) {
    if (starts_with(text, "---")) return text.size() > 3 && text[3] == '-' ? 0 : 3;
    if (starts_with(text, "--")) return text.size() > 2 && text[2] == '-' ? 0 : 2;
    if (starts_with(text, "\xE2\x80\x94")) return 3;
    return 0;
}

static bool is_explicit_start(const std::string& line) {
    return starts_with(line, "..") && (line.size() == 2 || line[2] == ' ');
}

static std::string strip_whitespace(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (!isspace(static_cast<unsigned char>(c))) out.push_back(c);
    }
    return out;
}

RstBlockParser::RstBlockParser(Lines lines, int depth)
    : lines_(std::move(lines)), current_line_(0), depth_(depth) {}

const std::string& RstBlockParser::line(size_t offset) const {
    size_t index = current_line_ + offset;
    return index < lines_.size() ? lines_[index] : empty_line;
}

void RstBlockParser::skipBlankLines() {
    while (!atEnd() && is_blank_line(line())) current_line_++;
}

ElementList RstBlockParser::parseNested(const Lines& lines) {
    if (depth_ + 1 > RST_MAX_NESTING_DEPTH) {
        clog_warn(rst_log(), "rst: block nesting deeper than %d, keeping content literal", RST_MAX_NESTING_DEPTH);
        return {make_literal_block(join_lines(strip_blank_lines(lines), "\n"))};
    }
    RstBlockParser nested(lines, depth_ + 1);
    return nested.parseBlocks();
}

IndentedBlock RstBlockParser::readIndentedBlock(int min_indent, bool stop_at_attribution) {
    IndentedBlock block;
    int smallest = INT_MAX;
    size_t end = current_line_;
    for (size_t i = current_line_; i < lines_.size(); i++) {
        const std::string& l = lines_[i];
        if (is_blank_line(l)) continue;
        int indent = line_indent(l);
        if (indent < min_indent) break;
        if (stop_at_attribution && attribution_marker_len(l.substr(indent))) break;
        if (indent < smallest) smallest = indent;
        end = i + 1;
    }
    if (end == current_line_) return block;
    block.min_indent = smallest;
    block.lines = deindent_lines(Lines(lines_.begin() + current_line_, lines_.begin() + end), smallest);
    current_line_ = end;
    return block;
}

// ---------------------------------------------------------------------------
// block list
// ---------------------------------------------------------------------------

static bool is_literal_marker_only(const ElementPtr& par) {
    return par->content.size() == 1 && par->content[0]->type == ElementType::Text &&
        trim_string(par->content[0]->text) == "::";
}

// "Example::" becomes "Example"; nullptr when the paragraph has no marker
static ElementPtr strip_literal_marker(const ElementPtr& par) {
    if (par->content.empty()) return nullptr;
    const ElementPtr& last = par->content.back();
    if (last->type != ElementType::Text) return nullptr;
    std::string text = rtrim_string(last->text);
    if (!ends_with(text, "::")) return nullptr;
    text = rtrim_string(text.substr(0, text.size() - 2));

    ElementList spans(par->content.begin(), par->content.end() - 1);
    if (!text.empty()) spans.push_back(make_text(text, last->options));
    return make_paragraph(spans, par->options);
}

ElementList RstBlockParser::parseBlocks() {
    ElementList blocks;
    bool literal_next = false;
    skipBlankLines();
    while (!atEnd()) {
        size_t start = current_line_;
        ElementPtr block;
        if (literal_next) {
            literal_next = false;
            block = parseLiteralBlock();
        }
        if (!block) block = parseBlock();
        if (current_line_ == start) current_line_++;
        skipBlankLines();
        if (!block) continue;

        if (block->type == ElementType::Paragraph) {
            if (is_literal_marker_only(block)) {
                literal_next = true;
                continue;
            }
            ElementPtr stripped = strip_literal_marker(block);
            if (stripped) {
                block = stripped;
                literal_next = true;
            }
        }
        blocks.push_back(block);
    }
    return processBlockList(blocks);
}

// folds link targets and assigns header ids, looking at each block and its successor
ElementList RstBlockParser::processBlockList(const ElementList& blocks) {
    ElementList result;
    for (size_t i = 0; i < blocks.size(); i++) {
        const ElementPtr& block = blocks[i];
        const ElementPtr next = i + 1 < blocks.size() ? blocks[i + 1] : nullptr;

        if (block->type == ElementType::InternalLinkTarget && block->options.id && next &&
            next->type == ElementType::InternalLinkTarget && next->options.id) {
            result.push_back(make_link_alias(*block->options.id, *next->options.id));
        } else if (block->type == ElementType::InternalLinkTarget && block->options.id && next &&
                   next->type == ElementType::ExternalLinkDefinition) {
            result.push_back(make_external_link_definition(*block->options.id, next->url, next->title,
                                                           next->options));
        } else if (block->type == ElementType::DecoratedHeader) {
            std::string id = slugify(flatten_text(block->content));
            result.push_back(id.empty() ? block : block->withOptions(Id(id)));
        } else {
            result.push_back(block);
        }
    }
    return result;
}

ElementPtr RstBlockParser::parseBlock() {
    ElementPtr block;
    if ((block = parseBulletList())) return block;
    if ((block = parseEnumList())) return block;
    if ((block = parseLineBlock())) return block;
    if ((block = parseExplicitBlock())) return block;
    if ((block = parseSimpleTable())) return block;
    if ((block = parseDoctest())) return block;
    if ((block = parseBlockQuote())) return block;
    if ((block = parseOverlineHeader())) return block;
    if ((block = parseTransition())) return block;
    if ((block = parseUnderlineHeader())) return block;
    if ((block = parseDefinitionList())) return block;
    return parseParagraph();
}

// ---------------------------------------------------------------------------
// simple blocks
// ---------------------------------------------------------------------------

ElementPtr RstBlockParser::parseParagraph() {
    Lines text;
    while (!atEnd() && !is_blank_line(line())) {
        text.push_back(line());
        current_line_++;
    }
    if (text.empty()) return nullptr;
    return make_paragraph(parse_rst_spans(join_lines(text, "\n")));
}

ElementPtr RstBlockParser::parseLiteralBlock() {
    if (atEnd()) return nullptr;
    if (line_indent(line()) > 0) {
        IndentedBlock block = readIndentedBlock(1, false);
        if (block.lines.empty()) return nullptr;
        return make_literal_block(join_lines(block.lines, "\n"));
    }
    // quoted literal block: every line starts with a punctuation character
    Lines text;
    while (!atEnd() && !is_blank_line(line()) && is_punctuation(line()[0])) {
        text.push_back(line());
        current_line_++;
    }
    if (text.empty()) return nullptr;
    return make_literal_block(join_lines(text, "\n"));
}

ElementPtr RstBlockParser::parseTransition() {
    std::string text = rtrim_string(line());
    if (!is_adornment(text, nullptr) || text.size() < 4) return nullptr;
    if (current_line_ + 1 < lines_.size() && !is_blank_line(line(1))) return nullptr;
    current_line_++;
    return make_rule();
}

ElementPtr RstBlockParser::parseOverlineHeader() {
    std::string over = rtrim_string(line());
    char ch;
    if (!is_adornment(over, &ch)) return nullptr;
    if (current_line_ + 2 >= lines_.size()) return nullptr;
    std::string title_line = rtrim_string(line(1));
    std::string title = trim_string(title_line);
    if (title.empty() || utf8_char_count(title_line.data(), title_line.size()) > over.size()) return nullptr;
    if (rtrim_string(line(2)) != over) return nullptr;
    current_line_ += 3;
    return make_decorated_header(HeaderDecoration{ch, true}, parse_rst_spans(title));
}

ElementPtr RstBlockParser::parseUnderlineHeader() {
    const std::string& first = line();
    if (first.empty() || first[0] == ' ') return nullptr;
    if (current_line_ + 1 >= lines_.size()) return nullptr;
    std::string under = rtrim_string(line(1));
    char ch;
    if (!is_adornment(under, &ch)) return nullptr;
    std::string title = trim_string(first);
    if (utf8_char_count(under.data(), under.size()) < utf8_char_count(title.data(), title.size())) return nullptr;
    current_line_ += 2;
    return make_decorated_header(HeaderDecoration{ch, false}, parse_rst_spans(title));
}

ElementPtr RstBlockParser::parseDoctest() {
    if (!starts_with(line(), ">>> ") && rtrim_string(line()) != ">>>") return nullptr;
    Lines text;
    while (!atEnd() && !is_blank_line(line())) {
        text.push_back(line());
        current_line_++;
    }
    return make_doctest_block(join_lines(text, "\n"));
}

ElementPtr RstBlockParser::parseBlockQuote() {
    if (is_blank_line(line()) || line_indent(line()) < 1) return nullptr;
    IndentedBlock block = readIndentedBlock(1, true);
    if (block.lines.empty()) block = readIndentedBlock(1, false);
    if (block.lines.empty()) return nullptr;

    size_t after_quote = current_line_;
    skipBlankLines();
    ElementList attribution;
    if (!atEnd() && line_indent(line()) == block.min_indent) {
        std::string text = line().substr(block.min_indent);
        size_t marker = attribution_marker_len(text);
        if (marker) {
            Lines attr;
            attr.push_back(trim_string(text.substr(marker)));
            current_line_++;
            while (!atEnd() && !is_blank_line(line()) && line_indent(line()) >= block.min_indent) {
                attr.push_back(trim_string(line()));
                current_line_++;
            }
            attribution = parse_rst_spans(trim_string(join_lines(attr, "\n")));
        }
    }
    if (attribution.empty()) current_line_ = after_quote;
    return make_quoted_block(parseNested(block.lines), attribution);
}

// ---------------------------------------------------------------------------
// lists
// ---------------------------------------------------------------------------

Lines RstBlockParser::readListItem(size_t col) {
    Lines item;
    const std::string& first = line();
    item.push_back(first.size() > col ? first.substr(col) : std::string());
    current_line_++;
    size_t end = current_line_;
    for (size_t i = current_line_; i < lines_.size(); i++) {
        const std::string& l = lines_[i];
        if (is_blank_line(l)) continue;
        if (static_cast<size_t>(line_indent(l)) < col) break;
        end = i + 1;
    }
    for (size_t i = current_line_; i < end; i++) {
        const std::string& l = lines_[i];
        item.push_back(is_blank_line(l) ? std::string() : l.substr(col));
    }
    current_line_ = end;
    return item;
}

static bool bullet_marker(const std::string& line, std::string* bullet, size_t* col) {
    size_t len = 0;
    if (!line.empty() && (line[0] == '*' || line[0] == '-' || line[0] == '+')) len = 1;
    else if (starts_with(line, "\xE2\x80\xA2")) len = 3;
    else return false;

    if (line.size() == len) {
        *col = len + 1;
    } else if (line[len] == ' ') {
        size_t j = len;
        while (j < line.size() && line[j] == ' ') j++;
        *col = j == line.size() ? len + 1 : j;
    } else {
        return false;
    }
    *bullet = line.substr(0, len);
    return true;
}

ElementPtr RstBlockParser::parseBulletList() {
    std::string bullet;
    std::string next_bullet;
    size_t col = 0;
    if (!bullet_marker(line(), &bullet, &col)) return nullptr;

    ElementList items;
    while (!atEnd() && bullet_marker(line(), &next_bullet, &col) && next_bullet == bullet) {
        Lines item = readListItem(col);
        items.push_back(make_bullet_list_item(parseNested(item), bullet));
        size_t save = current_line_;
        skipBlankLines();
        if (atEnd() || !bullet_marker(line(), &next_bullet, &col) || next_bullet != bullet) {
            current_line_ = save;
            break;
        }
    }
    return make_bullet_list(items, bullet);
}

static int roman_to_int(const std::string& numeral) {
    int total = 0;
    int prev = 0;
    for (size_t i = numeral.size(); i-- > 0;) {
        int value = 0;
        switch (tolower(static_cast<unsigned char>(numeral[i]))) {
            case 'i': value = 1; break;
            case 'v': value = 5; break;
            case 'x': value = 10; break;
            case 'l': value = 50; break;
            case 'c': value = 100; break;
            case 'd': value = 500; break;
            case 'm': value = 1000; break;
            default: return 0;
        }
        if (value < prev) total -= value;
        else total += value;
        prev = value;
    }
    return total > 0 && total < 4000 ? total : 0;
}

static bool is_roman_char(char c) {
    return strchr("ivxlcdm", tolower(static_cast<unsigned char>(c))) != nullptr;
}

struct EnumMarker {
    EnumFormat format;
    int value = 0;
    size_t col = 0;
};

// expected is the numbering type of the list being continued, if any
static bool enum_marker(const std::string& line, const EnumType* expected, EnumMarker* out) {
    static const re2::RE2 marker_re("^(\\(?)([0-9]+|[a-zA-Z]|[ivxlcdm]+|[IVXLCDM]+|#)([.)])( +|$)");
    std::string prefix, numeral, suffix, spaces;
    if (!re2::RE2::PartialMatch(line, marker_re, &prefix, &numeral, &suffix, &spaces)) return false;
    if (prefix == "(" && suffix != ")") return false;

    EnumMarker marker;
    marker.format.prefix = prefix;
    marker.format.suffix = suffix;
    marker.col = prefix.size() + numeral.size() + suffix.size() + spaces.size();
    if (spaces.empty() || marker.col == line.size()) marker.col = prefix.size() + numeral.size() + suffix.size() + 1;

    char first = numeral[0];
    bool upper = isupper(static_cast<unsigned char>(first)) != 0;
    if (numeral == "#") {
        marker.format.type = expected ? *expected : EnumType::Arabic;
        marker.value = 0;
    } else if (isdigit(static_cast<unsigned char>(first))) {
        if (numeral.size() > 9) return false;
        marker.format.type = EnumType::Arabic;
        marker.value = atoi(numeral.c_str());
    } else {
        EnumType alpha = upper ? EnumType::UpperAlpha : EnumType::LowerAlpha;
        EnumType roman = upper ? EnumType::UpperRoman : EnumType::LowerRoman;
        bool single = numeral.size() == 1;
        if (single && expected && *expected == alpha) {
            marker.format.type = alpha;
        } else if (expected && *expected == roman && is_roman_char(first)) {
            marker.format.type = roman;
        } else if (!expected) {
            marker.format.type = single && tolower(static_cast<unsigned char>(first)) != 'i' ? alpha : roman;
        } else {
            return false;
        }
        if (marker.format.type == alpha) {
            if (!single) return false;
            marker.value = tolower(static_cast<unsigned char>(first)) - 'a' + 1;
        } else {
            marker.value = roman_to_int(numeral);
            if (marker.value == 0) return false;
        }
    }
    if (expected && marker.format.type != *expected) return false;
    *out = marker;
    return true;
}

ElementPtr RstBlockParser::parseEnumList() {
    EnumMarker first;
    if (!enum_marker(line(), nullptr, &first)) return nullptr;

    // a marker line followed by unindented text is an ordinary paragraph
    if (current_line_ + 1 < lines_.size() && !is_blank_line(line(1)) &&
        static_cast<size_t>(line_indent(line(1))) < first.col) {
        EnumMarker second;
        if (!enum_marker(line(1), &first.format.type, &second)) return nullptr;
    }

    EnumType type = first.format.type;
    int start = first.value > 0 ? first.value : 1;
    ElementList items;
    EnumMarker marker = first;
    while (true) {
        Lines item = readListItem(marker.col);
        items.push_back(make_enum_list_item(parseNested(item), first.format,
                                            start + static_cast<int>(items.size())));
        size_t save = current_line_;
        skipBlankLines();
        if (atEnd() || !enum_marker(line(), &type, &marker) ||
            marker.format.prefix != first.format.prefix || marker.format.suffix != first.format.suffix) {
            current_line_ = save;
            break;
        }
    }
    return make_enum_list(items, first.format, start);
}

ElementPtr RstBlockParser::parseDefinitionList() {
    auto starts_item = [this]() {
        return !atEnd() && !is_blank_line(line()) && line_indent(line()) == 0 &&
            !is_explicit_start(line()) && current_line_ + 1 < lines_.size() &&
            !is_blank_line(line(1)) && line_indent(line(1)) > 0;
    };
    if (!starts_item()) return nullptr;

    ElementList items;
    while (true) {
        std::string term = trim_string(line());
        current_line_++;
        IndentedBlock definition = readIndentedBlock(1, false);
        items.push_back(make_definition_list_item(parse_rst_spans(term), parseNested(definition.lines)));
        size_t save = current_line_;
        skipBlankLines();
        if (!starts_item()) {
            current_line_ = save;
            break;
        }
    }
    return make_definition_list(items);
}

// ---------------------------------------------------------------------------
// line blocks
// ---------------------------------------------------------------------------

struct LineEntry {
    int indent;
    std::string text;
};

static bool is_line_block_line(const std::string& line) {
    return !line.empty() && line[0] == '|' && (line.size() == 1 || line[1] == ' ');
}

static ElementPtr build_line_block(const std::vector<LineEntry>& entries, size_t begin, size_t end) {
    int base = INT_MAX;
    for (size_t i = begin; i < end; i++) {
        if (entries[i].indent < base) base = entries[i].indent;
    }
    ElementList content;
    size_t i = begin;
    while (i < end) {
        if (entries[i].indent == base) {
            content.push_back(make_line(entries[i].text.empty() ? ElementList() : parse_rst_spans(entries[i].text)));
            i++;
            continue;
        }
        size_t nested_end = i;
        while (nested_end < end && entries[nested_end].indent > base) nested_end++;
        content.push_back(build_line_block(entries, i, nested_end));
        i = nested_end;
    }
    return make_line_block(content);
}

ElementPtr RstBlockParser::parseLineBlock() {
    if (!is_line_block_line(line())) return nullptr;
    std::vector<LineEntry> entries;
    while (!atEnd() && !is_blank_line(line())) {
        const std::string& l = line();
        if (is_line_block_line(l)) {
            std::string rest = l.size() > 2 ? l.substr(2) : std::string();
            entries.push_back({line_indent(rest), trim_string(rest)});
        } else if (line_indent(l) > 0 && !entries.empty()) {
            // continuation of the previous line
            std::string& text = entries.back().text;
            text += text.empty() ? trim_string(l) : " " + trim_string(l);
        } else {
            break;
        }
        current_line_++;
    }
    return build_line_block(entries, 0, entries.size());
}

// ---------------------------------------------------------------------------
// simple tables
// ---------------------------------------------------------------------------

typedef std::vector<std::pair<size_t, size_t>> ColumnRanges;

static bool table_border(const std::string& line, ColumnRanges* columns) {
    std::string text = rtrim_string(line);
    if (text.empty() || text[0] != '=') return false;
    ColumnRanges ranges;
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == ' ') {
            i++;
            continue;
        }
        if (text[i] != '=') return false;
        size_t start = i;
        while (i < text.size() && text[i] == '=') i++;
        ranges.emplace_back(start, i);
    }
    if (ranges.size() < 2) return false;
    if (columns) *columns = ranges;
    return true;
}

// column span underlines ("-----  -----") only separate rows here
static bool is_span_underline(const std::string& line) {
    std::string text = rtrim_string(line);
    if (text.empty() || text[0] != '-') return false;
    for (char c : text) {
        if (c != '-' && c != ' ') return false;
    }
    return true;
}

typedef std::vector<Lines> TableRow;

static TableRow split_row(const std::string& line, const ColumnRanges& columns) {
    TableRow row(columns.size());
    for (size_t k = 0; k < columns.size(); k++) {
        size_t start = columns[k].first;
        if (start >= line.size()) {
            row[k].emplace_back();
            continue;
        }
        size_t len = k + 1 < columns.size() ? columns[k + 1].first - start : std::string::npos;
        row[k].push_back(trim_string(line.substr(start, len)));
    }
    return row;
}

ElementPtr RstBlockParser::parseSimpleTable() {
    ColumnRanges columns;
    if (!table_border(line(), &columns)) return nullptr;
    size_t start = current_line_;

    std::vector<TableRow> head;
    std::vector<TableRow> body;
    bool seen_separator = false;
    bool closed = false;
    size_t i = current_line_ + 1;
    while (i < lines_.size()) {
        const std::string& l = lines_[i];
        if (table_border(l, nullptr)) {
            if (i + 1 >= lines_.size() || is_blank_line(lines_[i + 1])) {
                closed = true;
                i++;
                break;
            }
            if (seen_separator) return nullptr;
            head.swap(body);
            seen_separator = true;
            i++;
            continue;
        }
        if (is_blank_line(l) || is_span_underline(l)) {
            i++;
            continue;
        }
        TableRow row = split_row(l, columns);
        if (row[0][0].empty() && !body.empty()) {
            for (size_t k = 0; k < row.size(); k++) body.back()[k].push_back(row[k][0]);
        } else {
            body.push_back(row);
        }
        i++;
    }
    if (!closed || (body.empty() && head.empty())) {
        current_line_ = start;
        return nullptr;
    }
    current_line_ = i;

    auto build_rows = [this](const std::vector<TableRow>& rows, CellType type) {
        ElementList result;
        for (const TableRow& row : rows) {
            ElementList cells;
            for (const Lines& cell : row) {
                cells.push_back(make_cell(type, parseNested(strip_blank_lines(cell))));
            }
            result.push_back(make_row(cells));
        }
        return result;
    };
    return make_table(make_table_head(build_rows(head, CellType::Head)),
                      make_table_body(build_rows(body, CellType::Body)));
}

// ---------------------------------------------------------------------------
// explicit markup
// ---------------------------------------------------------------------------

ElementPtr RstBlockParser::parseExplicitBlock() {
    const std::string& first = line();
    bool anonymous_short = starts_with(first, "__ ");
    if (!anonymous_short && !is_explicit_start(first)) return nullptr;

    size_t start = current_line_;
    std::string rest = ltrim_string(first.substr(anonymous_short ? 3 : std::min<size_t>(first.size(), 3)));
    current_line_++;
    IndentedBlock body = readIndentedBlock(1, false);
    std::string source = join_lines(Lines(lines_.begin() + start, lines_.begin() + current_line_), "\n");

    if (anonymous_short) {
        std::string url = strip_whitespace(rest + join_lines(body.lines, ""));
        return make_external_link_definition("", url);
    }

    static const re2::RE2 directive_re("([a-zA-Z0-9](?:[-_.+:]?[a-zA-Z0-9])*)::(?: +(.*))?");
    ElementPtr block;
    std::string name, args;
    if (starts_with(rest, "[")) {
        block = parseFootnoteOrCitation(rest, body.lines, source);
    } else if (starts_with(rest, "_")) {
        block = parseLinkTarget(rest, body.lines);
    } else if (starts_with(rest, "|")) {
        block = parseSubstitutionDefinition(rest, body.lines, source);
    } else if (re2::RE2::FullMatch(rest, directive_re, &name, &args)) {
        block = parseDirective(name, trim_string(args), body.lines, source);
    }
    if (block) return block;

    Lines comment;
    if (!rest.empty()) comment.push_back(rest);
    comment.insert(comment.end(), body.lines.begin(), body.lines.end());
    return make_comment(trim_string(join_lines(comment, "\n")));
}

ElementPtr RstBlockParser::parseFootnoteOrCitation(const std::string& rest, const Lines& body,
                                                   const std::string& source) {
    size_t close = rest.find(']');
    if (close == std::string::npos || close < 2) return nullptr;
    std::string label = rest.substr(1, close - 1);
    std::string after = rest.substr(close + 1);
    if (!after.empty() && after[0] != ' ') return nullptr;

    Lines content;
    std::string first = trim_string(after);
    if (!first.empty()) content.push_back(first);
    content.insert(content.end(), body.begin(), body.end());

    FootnoteLabel footnote;
    if (classify_footnote_label(label, &footnote)) {
        return make_footnote_definition(footnote, parseNested(content));
    }
    if (is_simple_reference_name(label)) {
        std::string name = normalize_reference_name(label);
        return make_citation(name, parseNested(content), Id(name));
    }
    clog_debug(rst_log(), "rst: explicit block '%s' kept as comment", source.c_str());
    return nullptr;
}

ElementPtr RstBlockParser::parseLinkTarget(const std::string& rest, const Lines& body) {
    std::string name;
    size_t pos = 0;
    bool anonymous = false;
    if (starts_with(rest, "__:")) {
        anonymous = true;
        pos = 3;
    } else if (starts_with(rest, "_`")) {
        size_t close = rest.find('`', 2);
        if (close == std::string::npos || close + 1 >= rest.size() || rest[close + 1] != ':') return nullptr;
        name = rest.substr(2, close - 2);
        pos = close + 2;
    } else {
        for (size_t i = 1; i < rest.size(); i++) {
            if (rest[i] == '\\') {
                i++;
                continue;
            }
            if (rest[i] == ':' && (i + 1 == rest.size() || rest[i + 1] == ' ')) {
                name = rest.substr(1, i - 1);
                pos = i + 1;
                break;
            }
        }
        if (pos == 0) return nullptr;
        std::string unescaped;
        for (size_t i = 0; i < name.size(); i++) {
            if (name[i] == '\\' && i + 1 < name.size()) i++;
            unescaped.push_back(name[i]);
        }
        name = unescaped;
    }
    if (!anonymous && trim_string(name).empty()) return nullptr;

    std::string target = trim_string(rest.substr(pos) + " " + join_lines(body, " "));
    std::string id = anonymous ? std::string() : normalize_reference_name(name);
    if (target.empty()) {
        if (anonymous) return nullptr;
        std::string slug = slugify(id);
        return make_internal_link_target(Id(slug.empty() ? id : slug));
    }
    if (target.size() > 1 && target.back() == '_' && target.find("://") == std::string::npos) {
        // indirect target pointing at another reference name
        std::string ref = target.substr(0, target.size() - 1);
        if (ref.size() > 1 && ref.front() == '`' && ref.back() == '`') ref = ref.substr(1, ref.size() - 2);
        return make_link_alias(id, normalize_reference_name(ref));
    }
    return make_external_link_definition(id, strip_whitespace(target));
}

// leading ":name: value" lines of a directive body
static std::vector<std::pair<std::string, std::string>> directive_options(const Lines& body, Lines* content) {
    static const re2::RE2 option_re(":([^:]+):\\s*(.*)");
    std::vector<std::pair<std::string, std::string>> options;
    size_t i = 0;
    for (; i < body.size(); i++) {
        std::string key, value;
        if (!re2::RE2::FullMatch(body[i], option_re, &key, &value)) break;
        options.emplace_back(trim_string(key), trim_string(value));
    }
    if (content) content->assign(body.begin() + i, body.end());
    return options;
}

static std::string option_value(const std::vector<std::pair<std::string, std::string>>& options,
                                const std::string& key) {
    for (const auto& option : options) {
        if (option.first == key) return option.second;
    }
    return std::string();
}

ElementPtr RstBlockParser::parseSubstitutionDefinition(const std::string& rest, const Lines& body,
                                                       const std::string& source) {
    size_t close = rest.find('|', 1);
    if (close == std::string::npos || close == 1) return nullptr;
    std::string name = rest.substr(1, close - 1);
    std::string directive = trim_string(rest.substr(close + 1));

    static const re2::RE2 directive_re("([a-zA-Z0-9][-_.+:a-zA-Z0-9]*)::(?: +(.*))?");
    std::string kind, args;
    if (!re2::RE2::FullMatch(directive, directive_re, &kind, &args)) return nullptr;

    if (kind == "replace") {
        Lines text;
        if (!trim_string(args).empty()) text.push_back(trim_string(args));
        text.insert(text.end(), body.begin(), body.end());
        return make_substitution_definition(name, parse_rst_spans(trim_string(join_lines(text, "\n"))));
    }
    if (kind == "image") {
        Lines content;
        auto options = directive_options(body, &content);
        std::string url = strip_whitespace(args + join_lines(content, ""));
        std::string alt = option_value(options, "alt");
        return make_substitution_definition(name, {make_image(alt.empty() ? name : alt, url)});
    }
    clog_info(rst_log(), "rst: unknown substitution directive '%s'", kind.c_str());
    return make_invalid_block(make_system_message(MessageLevel::Error, "unknown substitution directive: " + kind),
                              make_literal_block(source));
}

ElementPtr RstBlockParser::parseDirective(const std::string& name, const std::string& args, const Lines& body,
                                          const std::string& source) {
    std::string directive = normalize_reference_name(name);
    Lines content;
    auto options = directive_options(body, &content);

    if (directive == "role") {
        static const re2::RE2 role_re("([a-zA-Z0-9][-_.+:a-zA-Z0-9]*)(?:\\(([^)]*)\\))?");
        std::string role, base;
        if (re2::RE2::FullMatch(args, role_re, &role, &base)) {
            std::string style = option_value(options, "class");
            role = normalize_reference_name(role);
            return make_customized_text_role(role, normalize_reference_name(base),
                                             Styles({style.empty() ? role : style}));
        }
    } else if (directive == "image") {
        std::string url = strip_whitespace(args + join_lines(content, ""));
        if (!url.empty()) {
            std::string style = option_value(options, "class");
            Options opt = style.empty() ? Options() : Styles({style});
            return make_paragraph({make_image(option_value(options, "alt"), url, std::nullopt, opt)});
        }
    }
    clog_info(rst_log(), "rst: unsupported directive '%s'", directive.c_str());
    return make_invalid_block(make_system_message(MessageLevel::Error, "unknown directive: " + directive),
                              make_literal_block(source));
}

// ---------------------------------------------------------------------------
// entry points
// ---------------------------------------------------------------------------

ElementList parse_rst_blocks(std::string_view text) {
    RstBlockParser parser(split_lines(text), 0);
    return parser.parseBlocks();
}

RawDocument parse_rst(std::string_view text) {
    ElementList blocks = parse_rst_blocks(text);
    clog_debug(rst_log(), "rst: parsed %zu top-level blocks", blocks.size());
    RawDocument raw;
    raw.document = make_document(blocks);
    raw.rules.push_back(rst_rewrite_rules());
    return raw;
}

} // namespace sandoc
