// format-pretty.cpp - Structural dump of a document tree, primarily for debugging

#include "format.hpp"
#include "../../lib/utf.h"

#include <ctype.h>

namespace sandoc {

// texts longer than this show only their beginning and end
#define PRETTY_MAX_TEXT_WIDTH 50

static const char* enum_type_label(EnumType type) {
    switch (type) {
        case EnumType::Arabic:     return "Arabic";
        case EnumType::LowerAlpha: return "LowerAlpha";
        case EnumType::UpperAlpha: return "UpperAlpha";
        case EnumType::LowerRoman: return "LowerRoman";
        case EnumType::UpperRoman: return "UpperRoman";
    }
    return "Arabic";
}

static std::string enum_format_desc(const EnumFormat& format) {
    return std::string("EnumFormat(") + enum_type_label(format.type) + "," + format.prefix + "," + format.suffix + ")";
}

static std::string options_desc(const Options& opt) {
    std::vector<std::string> parts;
    if (opt.id) parts.push_back("Id(" + *opt.id + ")");
    if (!opt.styles.empty()) {
        std::string styles = "Styles(";
        for (size_t i = 0; i < opt.styles.size(); i++) {
            if (i > 0) styles += ",";
            styles += opt.styles[i];
        }
        parts.push_back(styles + ")");
    }
    if (opt.fallback) parts.push_back(std::string("Fallback(") + opt.fallback->typeName() + ")");

    std::string desc;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) desc += " + ";
        desc += parts[i];
    }
    return desc;
}

static std::vector<std::string> element_attributes(const Element& elem) {
    std::vector<std::string> attrs;
    switch (elem.type) {
    case ElementType::Header:
        attrs.push_back(std::to_string(elem.level));
        break;
    case ElementType::DecoratedHeader:
        attrs.push_back(std::string(elem.decoration.overline ? "OverlineAndUnderline(" : "Underline(") +
                        elem.decoration.ch + ")");
        break;
    case ElementType::EnumList:
    case ElementType::EnumListItem:
        attrs.push_back(enum_format_desc(elem.enum_format));
        attrs.push_back(std::to_string(elem.level));
        break;
    case ElementType::BulletList:
    case ElementType::BulletListItem:
        attrs.push_back("StringBullet(" + elem.text + ")");
        break;
    case ElementType::Cell:
        attrs.push_back(elem.cell_type == CellType::Head ? "HeadCell" : "BodyCell");
        attrs.push_back(std::to_string(elem.colspan));
        attrs.push_back(std::to_string(elem.rowspan));
        break;
    case ElementType::ExternalLink:
    case ElementType::InternalLink:
        attrs.push_back(elem.url);
        if (elem.title) attrs.push_back(*elem.title);
        break;
    case ElementType::Image:
        attrs.push_back(elem.text);
        attrs.push_back(elem.url);
        break;
    case ElementType::ImageReference:
        attrs.push_back(elem.text);
        attrs.push_back(elem.name);
        break;
    case ElementType::LinkReference:
        attrs.push_back(elem.name);
        attrs.push_back(elem.source);
        break;
    case ElementType::ExternalLinkDefinition:
        attrs.push_back(elem.name);
        attrs.push_back(elem.url);
        break;
    case ElementType::LinkAlias:
    case ElementType::CustomizedTextRole:
        attrs.push_back(elem.name);
        attrs.push_back(elem.target);
        break;
    case ElementType::FootnoteLink:
        attrs.push_back(elem.name);
        attrs.push_back(elem.target);
        break;
    case ElementType::FootnoteDefinition:
    case ElementType::FootnoteReference:
        attrs.push_back(footnote_label_source(elem.label));
        break;
    case ElementType::Footnote:
    case ElementType::Citation:
    case ElementType::CitationLink:
    case ElementType::CitationReference:
    case ElementType::SubstitutionDefinition:
    case ElementType::SubstitutionReference:
        attrs.push_back(elem.name);
        break;
    case ElementType::InterpretedText:
        attrs.push_back(elem.name);
        attrs.push_back(elem.text);
        break;
    case ElementType::SystemMessage: {
        std::string level = message_level_name(elem.message_level);
        level[0] = static_cast<char>(toupper(static_cast<unsigned char>(level[0])));
        attrs.push_back(level);
        break;
    }
    default:
        break;
    }
    if (!elem.options.empty()) attrs.push_back(options_desc(elem.options));
    return attrs;
}

static std::string element_desc(const Element& elem) {
    std::string desc = elem.typeName();
    std::vector<std::string> attrs = element_attributes(elem);
    if (attrs.empty()) return desc;
    desc += "(";
    for (size_t i = 0; i < attrs.size(); i++) {
        if (i > 0) desc += ",";
        desc += attrs[i];
    }
    return desc + ")";
}

// byte offset after the first n code points of text
static size_t utf8_offset(const std::string& text, size_t n) {
    return utf8_char_to_byte_offset(text.data(), text.size(), n);
}

static std::string abbreviate_text(const std::string& content) {
    std::string text = content;
    for (char& c : text) {
        if (c == '\n') c = '|';
    }
    size_t len = utf8_char_count(text.data(), text.size());
    if (len <= PRETTY_MAX_TEXT_WIDTH) return text;
    size_t half = PRETTY_MAX_TEXT_WIDTH / 2;
    return text.substr(0, utf8_offset(text, half)) + " [...] " + text.substr(utf8_offset(text, len - half));
}

static const char* content_label(ContentKind kind) {
    switch (kind) {
        case ContentKind::Blocks: return "Blocks";
        case ContentKind::Spans:  return "Spans";
        default:                  return "Elements";
    }
}

class PrettyRenderer {
public:
    explicit PrettyRenderer(MarkupWriter& out) : out_(out) {}

    void render(const Element& elem);

private:
    // labelled child list, like "Content - Blocks: 2"
    void renderContent(const std::string& label, const ElementList& elems);
    void renderNamedLists(const std::string& desc, const std::string& first_label, const ElementList& first,
                          const std::string& second_label, const ElementList& second);

    MarkupWriter& out_;
};

void PrettyRenderer::renderContent(const std::string& label, const ElementList& elems) {
    out_.writeRaw(label + std::to_string(elems.size()));
    out_.renderChildren(elems);
}

void PrettyRenderer::renderNamedLists(const std::string& desc, const std::string& first_label,
                                      const ElementList& first, const std::string& second_label,
                                      const ElementList& second) {
    out_.writeRaw(desc);
    out_.indent();
    out_.newline();
    renderContent(first_label, first);
    out_.newline();
    renderContent(second_label, second);
    out_.unindent();
}

void PrettyRenderer::render(const Element& elem) {
    std::string desc = element_desc(elem);
    switch (elem.type) {
    case ElementType::QuotedBlock:
        renderNamedLists(desc, "Content - Blocks: ", elem.content, "Attribution - Spans: ", elem.attribution());
        return;
    case ElementType::DefinitionListItem: {
        std::string item = "Item";
        if (!elem.options.empty()) item += "(" + options_desc(elem.options) + ")";
        renderNamedLists(item, "Term - Spans: ", elem.term(), "Definition - Blocks: ", elem.content);
        return;
    }
    default:
        break;
    }

    ContentKind kind = elem.contentKind();
    if (kind == ContentKind::Text) {
        out_.writeRaw(desc + " - '" + abbreviate_text(elem.text) + "'");
        return;
    }
    if (elem.type == ElementType::Table) {
        out_.writeRaw(desc);
        out_.renderChildren(elem.content);
        return;
    }
    if (!elem.extra.empty()) {
        // element fields first, then the primary content if the type has one
        out_.writeRaw(desc);
        out_.indent();
        for (const ElementPtr& child : elem.extra) {
            out_.newline();
            out_.render(child);
        }
        if (elem.isContainer()) {
            out_.newline();
            renderContent(std::string("Content - ") + content_label(kind) + ": ", elem.content);
        }
        out_.unindent();
        return;
    }
    if (elem.isContainer()) {
        out_.writeRaw(desc + " - " + content_label(kind) + ": " + std::to_string(elem.content.size()));
        out_.renderChildren(elem.content);
        return;
    }
    out_.writeRaw(desc);
}

void format_pretty(StrBuf* sb, const ElementPtr& root, const RenderOverride& override_fn) {
    MarkupWriter out(sb, ". ");
    PrettyRenderer renderer(out);
    out.setRenderer([&](const ElementPtr& elem) {
        if (override_fn && override_fn(elem, out)) return;
        renderer.render(*elem);
    });
    out.render(root);
    strbuf_append_char(sb, '\n');
}

} // namespace sandoc
