// element.hpp - Generic document tree shared by all markup dialects and renderers
//
// The tree is a closed tagged union over the known catalogue (ElementType) plus an
// Extension type for everything else. Every node carries a capability set taken
// from a per-type table, so generic code (traversal, rewrite, renderer fallbacks)
// only ever looks at capabilities and child sequences, never at concrete types.

#ifndef SANDOC_ELEMENT_HPP
#define SANDOC_ELEMENT_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandoc {

struct Element;
typedef std::shared_ptr<const Element> ElementPtr;
typedef std::vector<ElementPtr> ElementList;

enum class ElementType : uint8_t {
    // block containers
    Document,
    Section,
    BlockSequence,
    QuotedBlock,
    BulletListItem,
    EnumListItem,
    DefinitionListItem,
    LineBlock,
    FootnoteDefinition,
    Citation,
    Footnote,
    // span containers
    Header,
    DecoratedHeader,
    SpanSequence,
    Paragraph,
    Line,
    Emphasized,
    Strong,
    ExternalLink,
    InternalLink,
    LinkReference,
    SubstitutionDefinition,
    // list containers
    BulletList,
    EnumList,
    DefinitionList,
    // tables
    Table,
    TableHead,
    TableBody,
    Columns,
    Column,
    Row,
    Cell,
    // text containers
    Text,
    Literal,
    LiteralBlock,
    DoctestBlock,
    Comment,
    SystemMessage,
    // simple blocks and spans
    Rule,
    InternalLinkTarget,
    ExternalLinkDefinition,
    LinkAlias,
    CustomizedTextRole,
    LineBreak,
    FootnoteLink,
    CitationLink,
    Image,
    ImageReference,
    FootnoteReference,
    CitationReference,
    SubstitutionReference,
    InterpretedText,
    // invalid wrappers
    InvalidSpan,
    InvalidBlock,
    // anything a dialect or directive adds on top of the known catalogue
    Extension,
};

// capability bits
enum : uint16_t {
    CAP_BLOCK        = 1 << 0,
    CAP_SPAN         = 1 << 1,
    CAP_LIST_ITEM    = 1 << 2,
    CAP_TABLE_ELEM   = 1 << 3,
    CAP_TEMPORARY    = 1 << 4,
    CAP_REFERENCE    = 1 << 5,
    CAP_DEFINITION   = 1 << 6,
    CAP_LINK_TARGET  = 1 << 7,
    CAP_INVALID      = 1 << 8,
    CAP_CUSTOMIZABLE = 1 << 9,
};

// kind of the primary child sequence
enum class ContentKind : uint8_t {
    None,
    Blocks,
    Spans,
    ListItems,
    TableElements,
    Text,
};

enum class MessageLevel : uint8_t {
    Debug,
    Info,
    Warning,
    Error,
    Fatal,
};

const char* message_level_name(MessageLevel level);
bool message_level_from_name(std::string_view name, MessageLevel* out);

/**
 * Id, styles and fallback attached to customizable elements.
 *
 * Options form a monoid under operator+: the empty value is the identity, the
 * right operand's id and fallback win when present, and styles are unioned in
 * first-seen order.
 */
struct Options {
    std::optional<std::string> id;
    std::vector<std::string> styles;
    ElementPtr fallback;

    bool empty() const { return !id && styles.empty() && !fallback; }
    bool hasStyle(std::string_view style) const;

    Options operator+(const Options& other) const;
    bool operator==(const Options& other) const;
    bool operator!=(const Options& other) const { return !(*this == other); }

    static const Options& none();
};

Options Id(const std::string& id);
Options Styles(std::initializer_list<std::string> styles);
Options Fallback(ElementPtr fallback);

enum class EnumType : uint8_t {
    Arabic,
    LowerAlpha,
    UpperAlpha,
    LowerRoman,
    UpperRoman,
};

struct EnumFormat {
    EnumType type = EnumType::Arabic;
    std::string prefix;
    std::string suffix = ".";

    bool operator==(const EnumFormat& other) const {
        return type == other.type && prefix == other.prefix && suffix == other.suffix;
    }
};

const char* enum_type_name(EnumType type);

// header decoration as written in the source; compared to assign levels
struct HeaderDecoration {
    char ch = '\0';
    bool overline = false;

    bool operator==(const HeaderDecoration& other) const {
        return ch == other.ch && overline == other.overline;
    }
    bool operator!=(const HeaderDecoration& other) const { return !(*this == other); }
};

enum class FootnoteLabelKind : uint8_t {
    Autonumber,
    Autosymbol,
    Numeric,
    AutonumberNamed,
};

struct FootnoteLabel {
    FootnoteLabelKind kind = FootnoteLabelKind::Autonumber;
    int number = 0;       // Numeric
    std::string name;     // AutonumberNamed

    bool operator==(const FootnoteLabel& other) const {
        return kind == other.kind && number == other.number && name == other.name;
    }
};

std::string footnote_label_source(const FootnoteLabel& label);

enum class CellType : uint8_t {
    Head,
    Body,
};

/**
 * A single immutable tree node.
 *
 * Field usage depends on the type:
 *   content   primary children (see contentKind())
 *   extra     secondary children: QuotedBlock attribution, DefinitionListItem term,
 *             Section {header}, Invalid* {message, fallback}
 *   text      payload of text containers, Image/ImageReference alt text
 *   name      ids, labels and role names (LinkReference id, Citation label, ...)
 *   target    LinkAlias target, FootnoteLink label, CustomizedTextRole base role
 *   url/title link destinations
 *   source    original markup of references, used as diagnostic fallback
 */
struct Element {
    ElementType type;
    uint16_t caps;
    Options options;
    ElementList content;
    ElementList extra;
    std::string text;
    std::string name;
    std::string target;
    std::string url;
    std::optional<std::string> title;
    std::string source;
    int level = 0;          // Header level, EnumList start, EnumListItem position
    int colspan = 1;
    int rowspan = 1;
    CellType cell_type = CellType::Body;
    MessageLevel message_level = MessageLevel::Info;
    HeaderDecoration decoration;
    EnumFormat enum_format;
    FootnoteLabel label;

    explicit Element(ElementType t);

    bool is(uint16_t cap) const { return (caps & cap) != 0; }
    bool isBlock() const { return is(CAP_BLOCK); }
    bool isSpan() const { return is(CAP_SPAN); }
    bool isListItem() const { return is(CAP_LIST_ITEM); }
    bool isTableElement() const { return is(CAP_TABLE_ELEM); }
    bool isTemporary() const { return is(CAP_TEMPORARY); }
    bool isReference() const { return is(CAP_REFERENCE); }
    bool isDefinition() const { return is(CAP_DEFINITION); }
    bool isLinkTarget() const { return is(CAP_LINK_TARGET); }
    bool isInvalid() const { return is(CAP_INVALID); }
    bool isCustomizable() const { return is(CAP_CUSTOMIZABLE); }

    ContentKind contentKind() const;
    bool isContainer() const {
        ContentKind kind = contentKind();
        return kind != ContentKind::None && kind != ContentKind::Text;
    }
    bool isTextContainer() const { return contentKind() == ContentKind::Text; }

    // type name as shown by diagnostics and the PrettyPrint renderer
    const char* typeName() const;

    // accessors for the secondary child sequence
    const ElementPtr& sectionHeader() const { return extra[0]; }
    const ElementPtr& invalidMessage() const { return extra[0]; }
    const ElementPtr& invalidFallback() const { return extra[1]; }
    const ElementList& attribution() const { return extra; }
    const ElementList& term() const { return extra; }

    // shallow copy with different options merged on top (options + extra)
    ElementPtr withOptions(const Options& extra_options) const;
    // shallow copy with options replaced entirely
    ElementPtr replaceOptions(const Options& new_options) const;
    ElementPtr withContent(ElementList new_content) const;
};

bool operator==(const Element& a, const Element& b);
inline bool operator!=(const Element& a, const Element& b) { return !(a == b); }
bool elements_equal(const ElementPtr& a, const ElementPtr& b);
bool element_lists_equal(const ElementList& a, const ElementList& b);

const char* element_type_name(ElementType type);
uint16_t element_type_caps(ElementType type);
ContentKind element_type_content_kind(ElementType type);

// ---------------------------------------------------------------------------
// factories
// ---------------------------------------------------------------------------

ElementPtr make_document(ElementList blocks);
ElementPtr make_section(ElementPtr header, ElementList blocks, const Options& opt = Options::none());
ElementPtr make_header(int level, ElementList spans, const Options& opt = Options::none());
ElementPtr make_decorated_header(HeaderDecoration decoration, ElementList spans,
                                 const Options& opt = Options::none());
ElementPtr make_block_sequence(ElementList blocks, const Options& opt = Options::none());
ElementPtr make_span_sequence(ElementList spans, const Options& opt = Options::none());
ElementPtr make_paragraph(ElementList spans, const Options& opt = Options::none());
ElementPtr make_literal_block(const std::string& text, const Options& opt = Options::none());
ElementPtr make_doctest_block(const std::string& text, const Options& opt = Options::none());
ElementPtr make_quoted_block(ElementList blocks, ElementList attribution,
                             const Options& opt = Options::none());
ElementPtr make_bullet_list(ElementList items, const std::string& bullet,
                            const Options& opt = Options::none());
ElementPtr make_bullet_list_item(ElementList blocks, const std::string& bullet,
                                 const Options& opt = Options::none());
ElementPtr make_enum_list(ElementList items, const EnumFormat& format, int start,
                          const Options& opt = Options::none());
ElementPtr make_enum_list_item(ElementList blocks, const EnumFormat& format, int position,
                               const Options& opt = Options::none());
ElementPtr make_definition_list(ElementList items, const Options& opt = Options::none());
ElementPtr make_definition_list_item(ElementList term, ElementList blocks,
                                     const Options& opt = Options::none());
ElementPtr make_line_block(ElementList items, const Options& opt = Options::none());
ElementPtr make_line(ElementList spans, const Options& opt = Options::none());
ElementPtr make_table(ElementPtr head, ElementPtr body, ElementPtr columns = nullptr,
                      const Options& opt = Options::none());
ElementPtr make_table_head(ElementList rows, const Options& opt = Options::none());
ElementPtr make_table_body(ElementList rows, const Options& opt = Options::none());
ElementPtr make_columns(ElementList columns, const Options& opt = Options::none());
ElementPtr make_column(const Options& opt = Options::none());
ElementPtr make_row(ElementList cells, const Options& opt = Options::none());
ElementPtr make_cell(CellType type, ElementList blocks, int colspan = 1, int rowspan = 1,
                     const Options& opt = Options::none());
ElementPtr make_rule(const Options& opt = Options::none());

ElementPtr make_external_link_definition(const std::string& id, const std::string& url,
                                         std::optional<std::string> title = std::nullopt,
                                         const Options& opt = Options::none());
ElementPtr make_link_alias(const std::string& id, const std::string& target,
                           const Options& opt = Options::none());
ElementPtr make_footnote_definition(const FootnoteLabel& label, ElementList blocks,
                                    const Options& opt = Options::none());
ElementPtr make_internal_link_target(const Options& opt);
ElementPtr make_citation(const std::string& label, ElementList blocks,
                         const Options& opt = Options::none());
ElementPtr make_footnote(const std::string& label, ElementList blocks,
                         const Options& opt = Options::none());

ElementPtr make_text(const std::string& text, const Options& opt = Options::none());
ElementPtr make_emphasized(ElementList spans, const Options& opt = Options::none());
ElementPtr make_strong(ElementList spans, const Options& opt = Options::none());
ElementPtr make_literal(const std::string& text, const Options& opt = Options::none());
ElementPtr make_line_break(const Options& opt = Options::none());
ElementPtr make_comment(const std::string& text, const Options& opt = Options::none());
ElementPtr make_external_link(ElementList spans, const std::string& url,
                              std::optional<std::string> title = std::nullopt,
                              const Options& opt = Options::none());
ElementPtr make_internal_link(ElementList spans, const std::string& url,
                              std::optional<std::string> title = std::nullopt,
                              const Options& opt = Options::none());
ElementPtr make_footnote_link(const std::string& id, const std::string& label,
                              const Options& opt = Options::none());
ElementPtr make_citation_link(const std::string& label, const Options& opt = Options::none());
ElementPtr make_image(const std::string& text, const std::string& url,
                      std::optional<std::string> title = std::nullopt,
                      const Options& opt = Options::none());

ElementPtr make_link_reference(ElementList spans, const std::string& id, const std::string& source,
                               const Options& opt = Options::none());
ElementPtr make_image_reference(const std::string& text, const std::string& id,
                                const std::string& source, const Options& opt = Options::none());
ElementPtr make_footnote_reference(const FootnoteLabel& label, const std::string& source,
                                   const Options& opt = Options::none());
ElementPtr make_citation_reference(const std::string& label, const std::string& source,
                                   const Options& opt = Options::none());

ElementPtr make_substitution_definition(const std::string& name, ElementList spans,
                                        const Options& opt = Options::none());
ElementPtr make_substitution_reference(const std::string& name, const std::string& source,
                                       const Options& opt = Options::none());
ElementPtr make_interpreted_text(const std::string& role, const std::string& text,
                                 const std::string& source, const Options& opt = Options::none());
ElementPtr make_customized_text_role(const std::string& name, const std::string& base_role,
                                     const Options& opt = Options::none());

ElementPtr make_system_message(MessageLevel level, const std::string& text,
                               const Options& opt = Options::none());
ElementPtr make_invalid_span(ElementPtr message, ElementPtr fallback,
                             const Options& opt = Options::none());
ElementPtr make_invalid_block(ElementPtr message, ElementPtr fallback,
                              const Options& opt = Options::none());
// convenience: error-level message with a Text fallback
ElementPtr make_invalid_span(MessageLevel level, const std::string& message,
                             const std::string& fallback_text);

// open catalogue: caller declares the capabilities and the content kind
ElementPtr make_extension(const std::string& type_name, uint16_t caps, ContentKind kind,
                          ElementList content, const Options& opt = Options::none());

// ---------------------------------------------------------------------------
// traversal, implemented once against the child sequences
// ---------------------------------------------------------------------------

typedef std::function<void(const ElementPtr&)> ElementVisitor;
typedef std::function<bool(const ElementPtr&)> ElementPredicate;

// pre-order visit of the node and every descendant (content, then extra)
void walk(const ElementPtr& root, const ElementVisitor& visit);
ElementList select(const ElementPtr& root, const ElementPredicate& pred);
bool contains(const ElementPtr& root, const ElementPredicate& pred);

// concatenated Text/Literal content of a span sequence
std::string flatten_text(const ElementList& spans);

/**
 * Result of applying a rewrite rule to one node.
 * Keep leaves the node alone and lets the next rule try; Replace substitutes
 * the node; Remove deletes it from its parent sequence.
 */
struct RewriteAction {
    enum Kind : uint8_t { Keep, Replace, Remove };
    Kind kind = Keep;
    ElementPtr replacement;

    static RewriteAction keep() { return RewriteAction(); }
    static RewriteAction replace(ElementPtr elem) { return RewriteAction{Replace, std::move(elem)}; }
    static RewriteAction remove() { return RewriteAction{Remove, nullptr}; }
};

typedef std::function<RewriteAction(const ElementPtr&)> RewriteRule;

// first rule that does not Keep wins
RewriteRule cascade(std::vector<RewriteRule> rules);

/**
 * Bottom-up structural substitution. Children are rewritten before their parent
 * is offered to the rule; untouched subtrees are shared with the input tree.
 * Removing the root yields nullptr.
 */
ElementPtr rewrite_tree(const ElementPtr& root, const RewriteRule& rule);
ElementList rewrite_list(const ElementList& list, const RewriteRule& rule);

// drops every node matching pred along with its subtree, top-down;
// pruning the root yields nullptr
ElementPtr prune_tree(const ElementPtr& root, const ElementPredicate& pred);

} // namespace sandoc

#endif // SANDOC_ELEMENT_HPP
