// format-docbook.cpp - DocBook 4.5 renderer

#include "format.hpp"
#include "../../lib/log.h"

namespace sandoc {

static const char* DOCBOOK_DOCTYPE =
    "<!DOCTYPE article PUBLIC \"-//OASIS//DTD DocBook XML V4.5//EN\" "
    "\"http://www.oasis-open.org/docbook/xml/4.5/docbookx.dtd\">";

class DocBookRenderer : public ElementRenderer {
public:
    DocBookRenderer(MarkupWriter& out, const DocBookOptions& options)
        : ElementRenderer(out), options_(options) {}

protected:
    void renderSystemMessage(const Element& elem) override;
    void renderTable(const Element& elem) override;
    void renderTableElement(const Element& elem) override;
    void renderUnresolvedReference(const Element& elem) override;
    void renderInvalid(const Element& elem) override;
    void renderBlockContainer(const Element& elem) override;
    void renderSpanContainer(const Element& elem) override;
    void renderListContainer(const Element& elem) override;
    void renderTextContainer(const Element& elem) override;
    void renderSimpleBlock(const Element& elem) override;
    void renderSimpleSpan(const Element& elem) override;
    void renderUnknown(const Element& elem) override;

private:
    bool include(const Element& message) const;
    // a single paragraph collapses into <para>, anything else is indented
    void renderBlocks(const ElementList& blocks, const char* close);
    void renderGenericBlock(const Element& elem);

    const DocBookOptions& options_;
};

bool DocBookRenderer::include(const Element& message) const {
    return options_.message_level && *options_.message_level <= message.message_level;
}

void DocBookRenderer::renderBlocks(const ElementList& blocks, const char* close) {
    if (blocks.empty()) {
        out_.writeRaw(close);
    } else if (blocks.size() == 1 && blocks[0]->type == ElementType::SpanSequence) {
        out_.writeRaw("<para>");
        out_.render(blocks[0]);
        out_.writeRaw("</para>");
        out_.writeRaw(close);
    } else if (blocks.size() == 1 && blocks[0]->type == ElementType::Paragraph) {
        out_.openTag("para", blocks[0]->options);
        out_.render(blocks[0]->content);
        out_.closeTag("para");
        out_.writeRaw(close);
    } else {
        out_.renderChildren(blocks);
        out_.writeLine(close);
    }
}

void DocBookRenderer::renderGenericBlock(const Element& elem) {
    out_.writeRaw("<div>");
    out_.renderChildren(elem.content);
    out_.writeLine("</div>");
}

// -----------------------------------------------------------------------------
// diagnostics
// -----------------------------------------------------------------------------

void DocBookRenderer::renderSystemMessage(const Element& elem) {
    if (!include(elem)) return;
    out_.writeRaw("<warning><para>");
    out_.writeText(elem.text);
    out_.writeRaw("</para></warning>");
}

void DocBookRenderer::renderUnresolvedReference(const Element& elem) {
    out_.render(make_invalid_span(MessageLevel::Error, "unresolved reference: " + elem.source, elem.source));
}

void DocBookRenderer::renderInvalid(const Element& elem) {
    const ElementPtr& message = elem.invalidMessage();
    bool show = message && include(*message);
    if (elem.type == ElementType::InvalidBlock) {
        if (show) {
            out_.render(message);
            out_.newline();
        }
        out_.render(elem.invalidFallback());
    } else {
        if (show) {
            out_.render(message);
            out_.writeRaw(" ");
        }
        out_.render(elem.invalidFallback());
    }
}

// -----------------------------------------------------------------------------
// tables
// -----------------------------------------------------------------------------

// cell count of the first body row, the head when the body is empty
static size_t table_column_count(const Element& table) {
    const Element* head = nullptr;
    const Element* body = nullptr;
    for (const ElementPtr& part : table.content) {
        if (part->type == ElementType::TableHead) head = part.get();
        else if (part->type == ElementType::TableBody) body = part.get();
    }
    if (body && !body->content.empty()) return body->content[0]->content.size();
    if (head && !head->content.empty()) return head->content[0]->content.size();
    return 1;
}

void DocBookRenderer::renderTable(const Element& elem) {
    ElementList parts;
    for (const ElementPtr& part : elem.content) {
        if (!part->content.empty()) parts.push_back(part);
    }
    out_.openTag("informaltable", elem.options);
    out_.indent();
    out_.newline();
    out_.openTag("tgroup", Options::none(), {{"cols", std::to_string(table_column_count(elem))}});
    out_.renderChildren(parts);
    out_.writeLine("</tgroup>");
    out_.unindent();
    out_.writeLine("</informaltable>");
}

void DocBookRenderer::renderTableElement(const Element& elem) {
    switch (elem.type) {
    case ElementType::TableHead:
        out_.writeRaw("<thead>");
        out_.renderChildren(elem.content);
        out_.writeLine("</thead>");
        break;
    case ElementType::TableBody:
        out_.writeRaw("<tbody>");
        out_.renderChildren(elem.content);
        out_.writeLine("</tbody>");
        break;
    case ElementType::Columns:
        for (size_t i = 0; i < elem.content.size(); i++) {
            if (i > 0) out_.newline();
            out_.emptyTag("colspec", Options::none(), {{"colname", "c" + std::to_string(i + 1)}});
        }
        break;
    case ElementType::Column:
        out_.emptyTag("colspec");
        break;
    case ElementType::Row:
        out_.writeRaw("<row>");
        out_.renderChildren(elem.content);
        out_.writeLine("</row>");
        break;
    case ElementType::Cell: {
        TagAttributes attrs;
        if (elem.rowspan > 1) attrs.emplace_back("morerows", std::to_string(elem.rowspan - 1));
        out_.openTag("entry", Options::none(), attrs);
        renderBlocks(elem.content, "</entry>");
        break;
    }
    default:
        renderUnknown(elem);
        break;
    }
}

// -----------------------------------------------------------------------------
// containers
// -----------------------------------------------------------------------------

void DocBookRenderer::renderBlockContainer(const Element& elem) {
    switch (elem.type) {
    case ElementType::Document:
        out_.writeRaw(DOCBOOK_DOCTYPE);
        out_.writeLine("<article>");
        out_.indent();
        out_.newline();
        out_.writeRaw("<artheader><title>");
        out_.writeText(options_.title);
        out_.writeRaw("</title></artheader>");
        out_.unindent();
        out_.renderChildren(elem.content);
        out_.writeLine("</article>");
        break;
    case ElementType::Section: {
        ElementList children;
        children.push_back(elem.sectionHeader());
        children.insert(children.end(), elem.content.begin(), elem.content.end());
        out_.openTag("section", elem.options);
        out_.renderChildren(children);
        out_.writeLine("</section>");
        break;
    }
    case ElementType::QuotedBlock: {
        ElementList blocks = elem.content;
        if (!elem.attribution().empty()) {
            blocks.push_back(make_paragraph(elem.attribution(), Styles({"attribution"})));
        }
        out_.openTag("blockquote", elem.options);
        renderBlocks(blocks, "</blockquote>");
        break;
    }
    case ElementType::BulletListItem:
    case ElementType::EnumListItem:
        out_.openTag("listitem", elem.options);
        renderBlocks(elem.content, "</listitem>");
        break;
    case ElementType::DefinitionListItem:
        out_.openTag("glossentry", elem.options);
        out_.writeRaw("<glossterm>");
        out_.render(elem.term());
        out_.writeRaw("</glossterm>");
        out_.writeLine("<glossdef>");
        renderBlocks(elem.content, "</glossdef></glossentry>");
        break;
    case ElementType::LineBlock:
        out_.openTag("literallayout", elem.options);
        out_.renderChildren(elem.content);
        out_.writeLine("</literallayout>");
        break;
    case ElementType::Footnote:
        out_.openTag("footnote", elem.options);
        out_.renderChildren(elem.content);
        out_.writeLine("</footnote>");
        break;
    case ElementType::Citation:
        out_.openTag("footnote", elem.options + Styles({"citation"}));
        out_.renderChildren(elem.content);
        out_.writeLine("</footnote>");
        break;
    default:
        if (elem.type == ElementType::BlockSequence && elem.options.empty()) {
            for (size_t i = 0; i < elem.content.size(); i++) {
                if (i > 0) out_.newline();
                out_.render(elem.content[i]);
            }
        } else if (elem.options.fallback) {
            out_.render(elem.options.fallback);
        } else {
            renderGenericBlock(elem);
        }
        break;
    }
}

void DocBookRenderer::renderSpanContainer(const Element& elem) {
    switch (elem.type) {
    case ElementType::Paragraph:
        out_.openTag("para", elem.options);
        out_.render(elem.content);
        out_.closeTag("para");
        break;
    case ElementType::Emphasized:
        out_.openTag("emphasis", elem.options);
        out_.render(elem.content);
        out_.closeTag("emphasis");
        break;
    case ElementType::Strong:
        out_.openTag("emphasis", Styles({"strong"}) + elem.options);
        out_.render(elem.content);
        out_.closeTag("emphasis");
        break;
    case ElementType::Line:
        out_.render(elem.content);
        break;
    case ElementType::Header:
        out_.openTag("title", elem.options);
        out_.render(elem.content);
        out_.closeTag("title");
        break;
    case ElementType::ExternalLink:
        out_.openTag("ulink", elem.options, {{"url", elem.url}});
        out_.render(elem.content);
        out_.closeTag("ulink");
        break;
    case ElementType::InternalLink:
        if (!elem.url.empty() && elem.url[0] == '#') {
            out_.openTag("link", elem.options, {{"linkend", elem.url.substr(1)}});
            out_.render(elem.content);
            out_.closeTag("link");
        } else {
            out_.openTag("ulink", elem.options, {{"url", elem.url}});
            out_.render(elem.content);
            out_.closeTag("ulink");
        }
        break;
    default:
        if (elem.options.fallback) {
            out_.render(elem.options.fallback);
        } else if (elem.type == ElementType::SpanSequence && !elem.options.empty()) {
            out_.openTag("phrase", elem.options);
            out_.render(elem.content);
            out_.closeTag("phrase");
        } else {
            out_.render(elem.content);
        }
        break;
    }
}

void DocBookRenderer::renderListContainer(const Element& elem) {
    switch (elem.type) {
    case ElementType::EnumList:
        out_.openTag("orderedlist", elem.options, {{"numeration", enum_type_name(elem.enum_format.type)}});
        out_.renderChildren(elem.content);
        out_.writeLine("</orderedlist>");
        break;
    case ElementType::BulletList:
        out_.openTag("itemizedlist", elem.options);
        out_.renderChildren(elem.content);
        out_.writeLine("</itemizedlist>");
        break;
    case ElementType::DefinitionList:
        out_.openTag("glosslist", elem.options);
        out_.renderChildren(elem.content);
        out_.writeLine("</glosslist>");
        break;
    default:
        if (elem.options.fallback) {
            out_.render(elem.options.fallback);
        } else {
            out_.openTag("para", elem.options);
            out_.renderChildren(elem.content);
            out_.writeLine("</para>");
        }
        break;
    }
}

static std::string comment_text(const std::string& text) {
    // "--" is not allowed inside an XML comment
    std::string out;
    for (char c : text) {
        if (c == '-' && !out.empty() && out.back() == '-') out.push_back(' ');
        out.push_back(c);
    }
    return out;
}

void DocBookRenderer::renderTextContainer(const Element& elem) {
    switch (elem.type) {
    case ElementType::Text:
        if (elem.options.hasStyle("subscript") || elem.options.hasStyle("superscript")) {
            const char* tag = elem.options.hasStyle("subscript") ? "subscript" : "superscript";
            out_.openTag(tag);
            out_.writeText(elem.text);
            out_.closeTag(tag);
        } else if (!elem.options.styles.empty()) {
            out_.openTag("phrase", elem.options);
            out_.writeText(elem.text);
            out_.closeTag("phrase");
        } else {
            out_.writeText(elem.text);
        }
        break;
    case ElementType::Literal:
        out_.openTag("literal", elem.options);
        out_.writePreformatted(elem.text);
        out_.closeTag("literal");
        break;
    case ElementType::LiteralBlock:
        out_.openTag("programlisting", elem.options);
        out_.writePreformatted(elem.text);
        out_.closeTag("programlisting");
        break;
    case ElementType::DoctestBlock:
        out_.openTag("programlisting", Styles({"doctest"}) + elem.options);
        out_.writePreformatted(elem.text);
        out_.closeTag("programlisting");
        break;
    case ElementType::Comment:
        out_.writeRaw("<!-- ");
        out_.writeRaw(comment_text(elem.text));
        out_.writeRaw(" -->");
        break;
    default:
        if (elem.options.fallback) out_.render(elem.options.fallback);
        else out_.writeText(elem.text);
        break;
    }
}

// -----------------------------------------------------------------------------
// simple elements
// -----------------------------------------------------------------------------

void DocBookRenderer::renderSimpleBlock(const Element& elem) {
    switch (elem.type) {
    case ElementType::Rule:
        out_.emptyTag("para", Styles({"rule"}) + elem.options);
        break;
    case ElementType::InternalLinkTarget:
        out_.emptyTag("anchor", elem.options);
        break;
    default:
        if (elem.options.fallback) out_.render(elem.options.fallback);
        break;
    }
}

void DocBookRenderer::renderSimpleSpan(const Element& elem) {
    switch (elem.type) {
    case ElementType::CitationLink:
        out_.openTag("link", elem.options + Styles({"citation"}), {{"linkend", elem.name}});
        out_.writeText("[" + elem.name + "]");
        out_.closeTag("link");
        break;
    case ElementType::FootnoteLink:
        out_.openTag("link", elem.options + Styles({"footnote"}), {{"linkend", elem.name}});
        out_.writeText("[" + elem.target + "]");
        out_.closeTag("link");
        break;
    case ElementType::Image:
        out_.writeRaw("<mediaobject><alt>");
        out_.writeText(elem.text);
        out_.writeRaw("</alt><imageobject>");
        out_.openTag("imagedata", elem.options, {{"fileref", elem.url}, {"width", "100%"}});
        out_.writeRaw("</imagedata></imageobject></mediaobject>");
        break;
    case ElementType::LineBreak:
        // no line break element in DocBook
        break;
    default:
        if (elem.options.fallback) out_.render(elem.options.fallback);
        break;
    }
}

void DocBookRenderer::renderUnknown(const Element& elem) {
    if (elem.options.fallback) {
        out_.render(elem.options.fallback);
    } else if (!elem.content.empty()) {
        renderGenericBlock(elem);
    }
}

void format_docbook(StrBuf* sb, const ElementPtr& document, const DocBookOptions& options,
                    const RenderOverride& override_fn) {
    MarkupWriter out(sb, "  ");
    DocBookRenderer renderer(out, options);
    if (override_fn) renderer.setOverride(override_fn);
    renderer.render(document);
    strbuf_append_char(sb, '\n');
    log_debug("docbook: rendered %zu bytes", sb->length);
}

} // namespace sandoc
