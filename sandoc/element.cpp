#include "element.hpp"

#include <string.h>
#include <strings.h>
#include <algorithm>

namespace sandoc {

// ---------------------------------------------------------------------------
// type table
// ---------------------------------------------------------------------------

struct ElementTypeInfo {
    ElementType type;
    const char* name;
    uint16_t caps;
    ContentKind kind;
};

#define B   CAP_BLOCK
#define S   CAP_SPAN
#define LI  CAP_LIST_ITEM
#define TE  CAP_TABLE_ELEM
#define TMP CAP_TEMPORARY
#define REF (CAP_REFERENCE | CAP_TEMPORARY)
#define DEF (CAP_DEFINITION | CAP_TEMPORARY)
#define LT  CAP_LINK_TARGET
#define INV CAP_INVALID
#define C   CAP_CUSTOMIZABLE

// indexed by ElementType, order must match the enum
static const ElementTypeInfo type_table[] = {
    {ElementType::Document,               "Document",               B,               ContentKind::Blocks},
    {ElementType::Section,                "Section",                B | C,           ContentKind::Blocks},
    {ElementType::BlockSequence,          "BlockSequence",          B | C,           ContentKind::Blocks},
    {ElementType::QuotedBlock,            "QuotedBlock",            B | C,           ContentKind::Blocks},
    {ElementType::BulletListItem,         "BulletListItem",         B | LI | C,      ContentKind::Blocks},
    {ElementType::EnumListItem,           "EnumListItem",           B | LI | C,      ContentKind::Blocks},
    {ElementType::DefinitionListItem,     "DefinitionListItem",     B | LI | C,      ContentKind::Blocks},
    {ElementType::LineBlock,              "LineBlock",              B | C,           ContentKind::Blocks},
    {ElementType::FootnoteDefinition,     "FootnoteDefinition",     B | DEF | C,     ContentKind::Blocks},
    {ElementType::Citation,               "Citation",               B | LT | C,      ContentKind::Blocks},
    {ElementType::Footnote,               "Footnote",               B | LT | C,      ContentKind::Blocks},
    {ElementType::Header,                 "Header",                 B | C,           ContentKind::Spans},
    {ElementType::DecoratedHeader,        "DecoratedHeader",        B | TMP | C,     ContentKind::Spans},
    {ElementType::SpanSequence,           "SpanSequence",           S | C,           ContentKind::Spans},
    {ElementType::Paragraph,              "Paragraph",              B | C,           ContentKind::Spans},
    {ElementType::Line,                   "Line",                   B | C,           ContentKind::Spans},
    {ElementType::Emphasized,             "Emphasized",             S | C,           ContentKind::Spans},
    {ElementType::Strong,                 "Strong",                 S | C,           ContentKind::Spans},
    {ElementType::ExternalLink,           "ExternalLink",           S | C,           ContentKind::Spans},
    {ElementType::InternalLink,           "InternalLink",           S | C,           ContentKind::Spans},
    {ElementType::LinkReference,          "LinkReference",          S | REF | C,     ContentKind::Spans},
    {ElementType::SubstitutionDefinition, "SubstitutionDefinition", B | DEF | C,     ContentKind::Spans},
    {ElementType::BulletList,             "BulletList",             B | C,           ContentKind::ListItems},
    {ElementType::EnumList,               "EnumList",               B | C,           ContentKind::ListItems},
    {ElementType::DefinitionList,         "DefinitionList",         B | C,           ContentKind::ListItems},
    {ElementType::Table,                  "Table",                  B | C,           ContentKind::TableElements},
    {ElementType::TableHead,              "TableHead",              TE | C,          ContentKind::TableElements},
    {ElementType::TableBody,              "TableBody",              TE | C,          ContentKind::TableElements},
    {ElementType::Columns,                "Columns",                TE | C,          ContentKind::TableElements},
    {ElementType::Column,                 "Column",                 TE | C,          ContentKind::None},
    {ElementType::Row,                    "Row",                    TE | C,          ContentKind::TableElements},
    {ElementType::Cell,                   "Cell",                   TE | C,          ContentKind::Blocks},
    {ElementType::Text,                   "Text",                   S | C,           ContentKind::Text},
    {ElementType::Literal,                "Literal",                S | C,           ContentKind::Text},
    {ElementType::LiteralBlock,           "LiteralBlock",           B | C,           ContentKind::Text},
    {ElementType::DoctestBlock,           "DoctestBlock",           B | C,           ContentKind::Text},
    {ElementType::Comment,                "Comment",                B | S | C,       ContentKind::Text},
    {ElementType::SystemMessage,          "SystemMessage",          B | S | C,       ContentKind::Text},
    {ElementType::Rule,                   "Rule",                   B | C,           ContentKind::None},
    {ElementType::InternalLinkTarget,     "InternalLinkTarget",     B | S | LT | C,  ContentKind::None},
    {ElementType::ExternalLinkDefinition, "ExternalLinkDefinition", B | DEF | LT | C, ContentKind::None},
    {ElementType::LinkAlias,              "LinkAlias",              B | DEF | C,     ContentKind::None},
    {ElementType::CustomizedTextRole,     "CustomizedTextRole",     B | DEF | C,     ContentKind::None},
    {ElementType::LineBreak,              "LineBreak",              S | C,           ContentKind::None},
    {ElementType::FootnoteLink,           "FootnoteLink",           S | C,           ContentKind::None},
    {ElementType::CitationLink,           "CitationLink",           S | C,           ContentKind::None},
    {ElementType::Image,                  "Image",                  S | C,           ContentKind::None},
    {ElementType::ImageReference,         "ImageReference",         S | REF | C,     ContentKind::None},
    {ElementType::FootnoteReference,      "FootnoteReference",      S | REF | C,     ContentKind::None},
    {ElementType::CitationReference,      "CitationReference",      S | REF | C,     ContentKind::None},
    {ElementType::SubstitutionReference,  "SubstitutionReference",  S | REF | C,     ContentKind::None},
    {ElementType::InterpretedText,        "InterpretedText",        S | REF | C,     ContentKind::None},
    {ElementType::InvalidSpan,            "InvalidSpan",            S | INV | C,     ContentKind::None},
    {ElementType::InvalidBlock,           "InvalidBlock",           B | INV | C,     ContentKind::None},
    {ElementType::Extension,              "Extension",              0,               ContentKind::None},
};

#undef B
#undef S
#undef LI
#undef TE
#undef TMP
#undef REF
#undef DEF
#undef LT
#undef INV
#undef C

static const ElementTypeInfo& type_info(ElementType type) {
    return type_table[static_cast<size_t>(type)];
}

const char* element_type_name(ElementType type) { return type_info(type).name; }
uint16_t element_type_caps(ElementType type) { return type_info(type).caps; }
ContentKind element_type_content_kind(ElementType type) { return type_info(type).kind; }

// ---------------------------------------------------------------------------
// enums
// ---------------------------------------------------------------------------

static const char* level_names[] = {"debug", "info", "warning", "error", "fatal"};

const char* message_level_name(MessageLevel level) {
    return level_names[static_cast<size_t>(level)];
}

bool message_level_from_name(std::string_view name, MessageLevel* out) {
    for (size_t i = 0; i < sizeof(level_names) / sizeof(level_names[0]); i++) {
        if (name.size() == strlen(level_names[i]) &&
            strncasecmp(name.data(), level_names[i], name.size()) == 0) {
            if (out) *out = static_cast<MessageLevel>(i);
            return true;
        }
    }
    return false;
}

const char* enum_type_name(EnumType type) {
    switch (type) {
        case EnumType::Arabic:     return "arabic";
        case EnumType::LowerAlpha: return "loweralpha";
        case EnumType::UpperAlpha: return "upperalpha";
        case EnumType::LowerRoman: return "lowerroman";
        case EnumType::UpperRoman: return "upperroman";
    }
    return "arabic";
}

std::string footnote_label_source(const FootnoteLabel& label) {
    switch (label.kind) {
        case FootnoteLabelKind::Autonumber:      return "#";
        case FootnoteLabelKind::Autosymbol:      return "*";
        case FootnoteLabelKind::Numeric:         return std::to_string(label.number);
        case FootnoteLabelKind::AutonumberNamed: return "#" + label.name;
    }
    return "#";
}

// ---------------------------------------------------------------------------
// Options
// ---------------------------------------------------------------------------

bool Options::hasStyle(std::string_view style) const {
    for (const std::string& s : styles) {
        if (s == style) return true;
    }
    return false;
}

static void add_style(std::vector<std::string>& styles, const std::string& style) {
    if (std::find(styles.begin(), styles.end(), style) == styles.end()) {
        styles.push_back(style);
    }
}

Options Options::operator+(const Options& other) const {
    if (other.empty()) return *this;
    if (empty()) return other;
    Options result;
    result.id = other.id ? other.id : id;
    result.fallback = other.fallback ? other.fallback : fallback;
    for (const std::string& s : styles) add_style(result.styles, s);
    for (const std::string& s : other.styles) add_style(result.styles, s);
    return result;
}

bool Options::operator==(const Options& other) const {
    return id == other.id && styles == other.styles && elements_equal(fallback, other.fallback);
}

const Options& Options::none() {
    static const Options empty_options;
    return empty_options;
}

Options Id(const std::string& id) {
    Options opt;
    opt.id = id;
    return opt;
}

Options Styles(std::initializer_list<std::string> styles) {
    Options opt;
    for (const std::string& s : styles) add_style(opt.styles, s);
    return opt;
}

Options Fallback(ElementPtr fallback) {
    Options opt;
    opt.fallback = std::move(fallback);
    return opt;
}

// ---------------------------------------------------------------------------
// Element
// ---------------------------------------------------------------------------

Element::Element(ElementType t) : type(t), caps(element_type_caps(t)) {}

ContentKind Element::contentKind() const {
    if (type == ElementType::Extension) {
        // extensions keep their declared kind in the level field
        return static_cast<ContentKind>(level);
    }
    return element_type_content_kind(type);
}

const char* Element::typeName() const {
    if (type == ElementType::Extension) return name.c_str();
    return element_type_name(type);
}

ElementPtr Element::withOptions(const Options& extra_options) const {
    auto copy = std::make_shared<Element>(*this);
    copy->options = options + extra_options;
    return copy;
}

ElementPtr Element::replaceOptions(const Options& new_options) const {
    auto copy = std::make_shared<Element>(*this);
    copy->options = new_options;
    return copy;
}

ElementPtr Element::withContent(ElementList new_content) const {
    auto copy = std::make_shared<Element>(*this);
    copy->content = std::move(new_content);
    return copy;
}

bool elements_equal(const ElementPtr& a, const ElementPtr& b) {
    if (a == b) return true;
    if (!a || !b) return false;
    return *a == *b;
}

bool element_lists_equal(const ElementList& a, const ElementList& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (!elements_equal(a[i], b[i])) return false;
    }
    return true;
}

bool operator==(const Element& a, const Element& b) {
    return a.type == b.type && a.caps == b.caps && a.options == b.options &&
        a.text == b.text && a.name == b.name && a.target == b.target && a.url == b.url &&
        a.title == b.title && a.source == b.source && a.level == b.level &&
        a.colspan == b.colspan && a.rowspan == b.rowspan && a.cell_type == b.cell_type &&
        a.message_level == b.message_level && a.decoration == b.decoration &&
        a.enum_format == b.enum_format && a.label == b.label &&
        element_lists_equal(a.content, b.content) && element_lists_equal(a.extra, b.extra);
}

// ---------------------------------------------------------------------------
// factories
// ---------------------------------------------------------------------------

static std::shared_ptr<Element> new_element(ElementType type, const Options& opt) {
    auto elem = std::make_shared<Element>(type);
    elem->options = opt;
    return elem;
}

static ElementPtr container(ElementType type, ElementList content, const Options& opt) {
    auto elem = new_element(type, opt);
    elem->content = std::move(content);
    return elem;
}

static ElementPtr text_container(ElementType type, const std::string& text, const Options& opt) {
    auto elem = new_element(type, opt);
    elem->text = text;
    return elem;
}

ElementPtr make_document(ElementList blocks) {
    return container(ElementType::Document, std::move(blocks), Options::none());
}

ElementPtr make_section(ElementPtr header, ElementList blocks, const Options& opt) {
    auto elem = new_element(ElementType::Section, opt);
    elem->extra.push_back(std::move(header));
    elem->content = std::move(blocks);
    return elem;
}

ElementPtr make_header(int level, ElementList spans, const Options& opt) {
    auto elem = new_element(ElementType::Header, opt);
    elem->level = level;
    elem->content = std::move(spans);
    return elem;
}

ElementPtr make_decorated_header(HeaderDecoration decoration, ElementList spans, const Options& opt) {
    auto elem = new_element(ElementType::DecoratedHeader, opt);
    elem->decoration = decoration;
    elem->content = std::move(spans);
    return elem;
}

ElementPtr make_block_sequence(ElementList blocks, const Options& opt) {
    return container(ElementType::BlockSequence, std::move(blocks), opt);
}

ElementPtr make_span_sequence(ElementList spans, const Options& opt) {
    return container(ElementType::SpanSequence, std::move(spans), opt);
}

ElementPtr make_paragraph(ElementList spans, const Options& opt) {
    return container(ElementType::Paragraph, std::move(spans), opt);
}

ElementPtr make_literal_block(const std::string& text, const Options& opt) {
    return text_container(ElementType::LiteralBlock, text, opt);
}

ElementPtr make_doctest_block(const std::string& text, const Options& opt) {
    return text_container(ElementType::DoctestBlock, text, opt);
}

ElementPtr make_quoted_block(ElementList blocks, ElementList attribution, const Options& opt) {
    auto elem = new_element(ElementType::QuotedBlock, opt);
    elem->content = std::move(blocks);
    elem->extra = std::move(attribution);
    return elem;
}

ElementPtr make_bullet_list(ElementList items, const std::string& bullet, const Options& opt) {
    auto elem = new_element(ElementType::BulletList, opt);
    elem->content = std::move(items);
    elem->text = bullet;
    return elem;
}

ElementPtr make_bullet_list_item(ElementList blocks, const std::string& bullet, const Options& opt) {
    auto elem = new_element(ElementType::BulletListItem, opt);
    elem->content = std::move(blocks);
    elem->text = bullet;
    return elem;
}

ElementPtr make_enum_list(ElementList items, const EnumFormat& format, int start, const Options& opt) {
    auto elem = new_element(ElementType::EnumList, opt);
    elem->content = std::move(items);
    elem->enum_format = format;
    elem->level = start;
    return elem;
}

ElementPtr make_enum_list_item(ElementList blocks, const EnumFormat& format, int position,
                               const Options& opt) {
    auto elem = new_element(ElementType::EnumListItem, opt);
    elem->content = std::move(blocks);
    elem->enum_format = format;
    elem->level = position;
    return elem;
}

ElementPtr make_definition_list(ElementList items, const Options& opt) {
    return container(ElementType::DefinitionList, std::move(items), opt);
}

ElementPtr make_definition_list_item(ElementList term, ElementList blocks, const Options& opt) {
    auto elem = new_element(ElementType::DefinitionListItem, opt);
    elem->extra = std::move(term);
    elem->content = std::move(blocks);
    return elem;
}

ElementPtr make_line_block(ElementList items, const Options& opt) {
    return container(ElementType::LineBlock, std::move(items), opt);
}

ElementPtr make_line(ElementList spans, const Options& opt) {
    return container(ElementType::Line, std::move(spans), opt);
}

ElementPtr make_table(ElementPtr head, ElementPtr body, ElementPtr columns, const Options& opt) {
    auto elem = new_element(ElementType::Table, opt);
    if (columns) elem->content.push_back(std::move(columns));
    elem->content.push_back(head ? std::move(head) : make_table_head({}));
    elem->content.push_back(body ? std::move(body) : make_table_body({}));
    return elem;
}

ElementPtr make_table_head(ElementList rows, const Options& opt) {
    return container(ElementType::TableHead, std::move(rows), opt);
}

ElementPtr make_table_body(ElementList rows, const Options& opt) {
    return container(ElementType::TableBody, std::move(rows), opt);
}

ElementPtr make_columns(ElementList columns, const Options& opt) {
    return container(ElementType::Columns, std::move(columns), opt);
}

ElementPtr make_column(const Options& opt) {
    return new_element(ElementType::Column, opt);
}

ElementPtr make_row(ElementList cells, const Options& opt) {
    return container(ElementType::Row, std::move(cells), opt);
}

ElementPtr make_cell(CellType type, ElementList blocks, int colspan, int rowspan, const Options& opt) {
    auto elem = new_element(ElementType::Cell, opt);
    elem->cell_type = type;
    elem->content = std::move(blocks);
    elem->colspan = colspan < 1 ? 1 : colspan;
    elem->rowspan = rowspan < 1 ? 1 : rowspan;
    return elem;
}

ElementPtr make_rule(const Options& opt) {
    return new_element(ElementType::Rule, opt);
}

ElementPtr make_external_link_definition(const std::string& id, const std::string& url,
                                         std::optional<std::string> title, const Options& opt) {
    auto elem = new_element(ElementType::ExternalLinkDefinition, opt);
    elem->name = id;
    elem->url = url;
    elem->title = std::move(title);
    return elem;
}

ElementPtr make_link_alias(const std::string& id, const std::string& target, const Options& opt) {
    auto elem = new_element(ElementType::LinkAlias, opt);
    elem->name = id;
    elem->target = target;
    return elem;
}

ElementPtr make_footnote_definition(const FootnoteLabel& label, ElementList blocks, const Options& opt) {
    auto elem = new_element(ElementType::FootnoteDefinition, opt);
    elem->label = label;
    elem->content = std::move(blocks);
    return elem;
}

ElementPtr make_internal_link_target(const Options& opt) {
    return new_element(ElementType::InternalLinkTarget, opt);
}

ElementPtr make_citation(const std::string& label, ElementList blocks, const Options& opt) {
    auto elem = new_element(ElementType::Citation, opt);
    elem->name = label;
    elem->content = std::move(blocks);
    return elem;
}

ElementPtr make_footnote(const std::string& label, ElementList blocks, const Options& opt) {
    auto elem = new_element(ElementType::Footnote, opt);
    elem->name = label;
    elem->content = std::move(blocks);
    return elem;
}

ElementPtr make_text(const std::string& text, const Options& opt) {
    return text_container(ElementType::Text, text, opt);
}

ElementPtr make_emphasized(ElementList spans, const Options& opt) {
    return container(ElementType::Emphasized, std::move(spans), opt);
}

ElementPtr make_strong(ElementList spans, const Options& opt) {
    return container(ElementType::Strong, std::move(spans), opt);
}

ElementPtr make_literal(const std::string& text, const Options& opt) {
    return text_container(ElementType::Literal, text, opt);
}

ElementPtr make_line_break(const Options& opt) {
    return new_element(ElementType::LineBreak, opt);
}

ElementPtr make_comment(const std::string& text, const Options& opt) {
    return text_container(ElementType::Comment, text, opt);
}

ElementPtr make_external_link(ElementList spans, const std::string& url,
                              std::optional<std::string> title, const Options& opt) {
    auto elem = new_element(ElementType::ExternalLink, opt);
    elem->content = std::move(spans);
    elem->url = url;
    elem->title = std::move(title);
    return elem;
}

ElementPtr make_internal_link(ElementList spans, const std::string& url,
                              std::optional<std::string> title, const Options& opt) {
    auto elem = new_element(ElementType::InternalLink, opt);
    elem->content = std::move(spans);
    elem->url = url;
    elem->title = std::move(title);
    return elem;
}

ElementPtr make_footnote_link(const std::string& id, const std::string& label, const Options& opt) {
    auto elem = new_element(ElementType::FootnoteLink, opt);
    elem->name = id;
    elem->target = label;
    return elem;
}

ElementPtr make_citation_link(const std::string& label, const Options& opt) {
    auto elem = new_element(ElementType::CitationLink, opt);
    elem->name = label;
    return elem;
}

ElementPtr make_image(const std::string& text, const std::string& url,
                      std::optional<std::string> title, const Options& opt) {
    auto elem = new_element(ElementType::Image, opt);
    elem->text = text;
    elem->url = url;
    elem->title = std::move(title);
    return elem;
}

ElementPtr make_link_reference(ElementList spans, const std::string& id, const std::string& source,
                               const Options& opt) {
    auto elem = new_element(ElementType::LinkReference, opt);
    elem->content = std::move(spans);
    elem->name = id;
    elem->source = source;
    return elem;
}

ElementPtr make_image_reference(const std::string& text, const std::string& id,
                                const std::string& source, const Options& opt) {
    auto elem = new_element(ElementType::ImageReference, opt);
    elem->text = text;
    elem->name = id;
    elem->source = source;
    return elem;
}

ElementPtr make_footnote_reference(const FootnoteLabel& label, const std::string& source,
                                   const Options& opt) {
    auto elem = new_element(ElementType::FootnoteReference, opt);
    elem->label = label;
    elem->source = source;
    return elem;
}

ElementPtr make_citation_reference(const std::string& label, const std::string& source,
                                   const Options& opt) {
    auto elem = new_element(ElementType::CitationReference, opt);
    elem->name = label;
    elem->source = source;
    return elem;
}

ElementPtr make_substitution_definition(const std::string& name, ElementList spans, const Options& opt) {
    auto elem = new_element(ElementType::SubstitutionDefinition, opt);
    elem->name = name;
    elem->content = std::move(spans);
    return elem;
}

ElementPtr make_substitution_reference(const std::string& name, const std::string& source,
                                       const Options& opt) {
    auto elem = new_element(ElementType::SubstitutionReference, opt);
    elem->name = name;
    elem->source = source;
    return elem;
}

ElementPtr make_interpreted_text(const std::string& role, const std::string& text,
                                 const std::string& source, const Options& opt) {
    auto elem = new_element(ElementType::InterpretedText, opt);
    elem->name = role;
    elem->text = text;
    elem->source = source;
    return elem;
}

ElementPtr make_customized_text_role(const std::string& name, const std::string& base_role,
                                     const Options& opt) {
    auto elem = new_element(ElementType::CustomizedTextRole, opt);
    elem->name = name;
    elem->target = base_role;
    return elem;
}

ElementPtr make_system_message(MessageLevel level, const std::string& text, const Options& opt) {
    auto elem = new_element(ElementType::SystemMessage, opt);
    elem->message_level = level;
    elem->text = text;
    return elem;
}

ElementPtr make_invalid_span(ElementPtr message, ElementPtr fallback, const Options& opt) {
    auto elem = new_element(ElementType::InvalidSpan, opt);
    elem->extra.push_back(std::move(message));
    elem->extra.push_back(std::move(fallback));
    return elem;
}

ElementPtr make_invalid_block(ElementPtr message, ElementPtr fallback, const Options& opt) {
    auto elem = new_element(ElementType::InvalidBlock, opt);
    elem->extra.push_back(std::move(message));
    elem->extra.push_back(std::move(fallback));
    return elem;
}

ElementPtr make_invalid_span(MessageLevel level, const std::string& message,
                             const std::string& fallback_text) {
    return make_invalid_span(make_system_message(level, message), make_text(fallback_text));
}

ElementPtr make_extension(const std::string& type_name, uint16_t caps, ContentKind kind,
                          ElementList content, const Options& opt) {
    auto elem = new_element(ElementType::Extension, opt);
    elem->caps = caps;
    elem->name = type_name;
    elem->level = static_cast<int>(kind);
    elem->content = std::move(content);
    return elem;
}

// ---------------------------------------------------------------------------
// traversal
// ---------------------------------------------------------------------------

void walk(const ElementPtr& root, const ElementVisitor& visit) {
    if (!root) return;
    visit(root);
    for (const ElementPtr& child : root->content) walk(child, visit);
    for (const ElementPtr& child : root->extra) walk(child, visit);
}

ElementList select(const ElementPtr& root, const ElementPredicate& pred) {
    ElementList found;
    walk(root, [&](const ElementPtr& elem) {
        if (pred(elem)) found.push_back(elem);
    });
    return found;
}

bool contains(const ElementPtr& root, const ElementPredicate& pred) {
    if (!root) return false;
    if (pred(root)) return true;
    for (const ElementPtr& child : root->content) {
        if (contains(child, pred)) return true;
    }
    for (const ElementPtr& child : root->extra) {
        if (contains(child, pred)) return true;
    }
    return false;
}

static void flatten_into(const ElementPtr& elem, std::string& out) {
    if (!elem) return;
    switch (elem->type) {
    case ElementType::Text:
    case ElementType::Literal:
        out += elem->text;
        return;
    case ElementType::InvalidSpan:
        flatten_into(elem->invalidFallback(), out);
        return;
    default:
        break;
    }
    if (elem->contentKind() == ContentKind::Spans) {
        for (const ElementPtr& child : elem->content) flatten_into(child, out);
    }
}

std::string flatten_text(const ElementList& spans) {
    std::string out;
    for (const ElementPtr& span : spans) flatten_into(span, out);
    return out;
}

RewriteRule cascade(std::vector<RewriteRule> rules) {
    return [rules = std::move(rules)](const ElementPtr& elem) {
        for (const RewriteRule& rule : rules) {
            RewriteAction action = rule(elem);
            if (action.kind != RewriteAction::Keep) return action;
        }
        return RewriteAction::keep();
    };
}

// secondary sequences with fixed slots cannot shrink
static bool has_fixed_slots(ElementType type) {
    return type == ElementType::Section || type == ElementType::InvalidSpan ||
        type == ElementType::InvalidBlock;
}

static ElementPtr rewrite_node(const ElementPtr& elem, const RewriteRule& rule, bool* removed);

ElementList rewrite_list(const ElementList& list, const RewriteRule& rule) {
    ElementList result;
    result.reserve(list.size());
    for (const ElementPtr& child : list) {
        bool removed = false;
        ElementPtr rewritten = rewrite_node(child, rule, &removed);
        if (!removed) result.push_back(std::move(rewritten));
    }
    return result;
}

static bool same_nodes(const ElementList& a, const ElementList& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (a[i] != b[i]) return false;
    }
    return true;
}

static ElementPtr rewrite_node(const ElementPtr& elem, const RewriteRule& rule, bool* removed) {
    *removed = false;
    if (!elem) return elem;

    ElementList content = rewrite_list(elem->content, rule);
    ElementList extra;
    if (has_fixed_slots(elem->type)) {
        extra.reserve(elem->extra.size());
        for (const ElementPtr& slot : elem->extra) {
            bool slot_removed = false;
            ElementPtr rewritten = rewrite_node(slot, rule, &slot_removed);
            extra.push_back(slot_removed ? slot : rewritten);
        }
    } else {
        extra = rewrite_list(elem->extra, rule);
    }

    ElementPtr current = elem;
    if (!same_nodes(content, elem->content) || !same_nodes(extra, elem->extra)) {
        auto copy = std::make_shared<Element>(*elem);
        copy->content = std::move(content);
        copy->extra = std::move(extra);
        current = copy;
    }

    RewriteAction action = rule(current);
    switch (action.kind) {
    case RewriteAction::Replace:
        return action.replacement;
    case RewriteAction::Remove:
        *removed = true;
        return nullptr;
    case RewriteAction::Keep:
        break;
    }
    return current;
}

ElementPtr rewrite_tree(const ElementPtr& root, const RewriteRule& rule) {
    bool removed = false;
    ElementPtr result = rewrite_node(root, rule, &removed);
    return removed ? nullptr : result;
}

static ElementPtr prune_node(const ElementPtr& elem, const ElementPredicate& pred);

static ElementList prune_list(const ElementList& list, const ElementPredicate& pred) {
    ElementList result;
    result.reserve(list.size());
    for (const ElementPtr& child : list) {
        if (child && pred(child)) continue;
        result.push_back(prune_node(child, pred));
    }
    return result;
}

static ElementPtr prune_node(const ElementPtr& elem, const ElementPredicate& pred) {
    if (!elem) return elem;
    ElementList content = prune_list(elem->content, pred);
    ElementList extra;
    if (has_fixed_slots(elem->type)) {
        extra.reserve(elem->extra.size());
        for (const ElementPtr& slot : elem->extra) {
            extra.push_back(slot && pred(slot) ? slot : prune_node(slot, pred));
        }
    } else {
        extra = prune_list(elem->extra, pred);
    }
    if (same_nodes(content, elem->content) && same_nodes(extra, elem->extra)) return elem;
    auto copy = std::make_shared<Element>(*elem);
    copy->content = std::move(content);
    copy->extra = std::move(extra);
    return copy;
}

ElementPtr prune_tree(const ElementPtr& root, const ElementPredicate& pred) {
    if (!root || pred(root)) return nullptr;
    return prune_node(root, pred);
}

} // namespace sandoc
