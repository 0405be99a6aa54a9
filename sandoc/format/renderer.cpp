// renderer.cpp - MarkupWriter and the shared renderer dispatch

#include "renderer.hpp"
#include "xml_encoder.hpp"
#include "../../lib/log.h"

namespace sandoc {

// =============================================================================
// MarkupWriter
// =============================================================================

MarkupWriter::MarkupWriter(StrBuf* buf, const char* indent_unit)
    : buf_(buf), indent_unit_(indent_unit ? indent_unit : ""), indent_level_(0) {
}

void MarkupWriter::writeRaw(std::string_view text) {
    strbuf_append_str_n(buf_, text.data(), text.size());
}

void MarkupWriter::writeText(std::string_view text) {
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        std::string_view line = text.substr(start, end == std::string_view::npos ? end : end - start);
        std::string escaped = XmlEncoder::escape(line);
        strbuf_append_str_n(buf_, escaped.data(), escaped.size());
        if (end == std::string_view::npos) break;
        newline();
        start = end + 1;
    }
}

void MarkupWriter::writePreformatted(std::string_view text) {
    std::string escaped = XmlEncoder::escape(text);
    strbuf_append_str_n(buf_, escaped.data(), escaped.size());
}

void MarkupWriter::writeAttributes(const Options& opt, const TagAttributes& attrs) {
    if (opt.id) {
        strbuf_append_str(buf_, " id=\"");
        writeRaw(XmlEncoder::escape_attribute(*opt.id));
        strbuf_append_char(buf_, '"');
    }
    if (!opt.styles.empty()) {
        strbuf_append_str(buf_, " role=\"");
        for (size_t i = 0; i < opt.styles.size(); i++) {
            if (i > 0) strbuf_append_char(buf_, ' ');
            writeRaw(XmlEncoder::escape_attribute(opt.styles[i]));
        }
        strbuf_append_char(buf_, '"');
    }
    for (const auto& attr : attrs) {
        strbuf_append_char(buf_, ' ');
        writeRaw(attr.first);
        strbuf_append_str(buf_, "=\"");
        writeRaw(XmlEncoder::escape_attribute(attr.second));
        strbuf_append_char(buf_, '"');
    }
}

void MarkupWriter::openTag(const char* tag, const Options& opt, const TagAttributes& attrs) {
    strbuf_append_char(buf_, '<');
    strbuf_append_str(buf_, tag);
    writeAttributes(opt, attrs);
    strbuf_append_char(buf_, '>');
}

void MarkupWriter::emptyTag(const char* tag, const Options& opt, const TagAttributes& attrs) {
    strbuf_append_char(buf_, '<');
    strbuf_append_str(buf_, tag);
    writeAttributes(opt, attrs);
    strbuf_append_str(buf_, "/>");
}

void MarkupWriter::closeTag(const char* tag) {
    strbuf_append_str(buf_, "</");
    strbuf_append_str(buf_, tag);
    strbuf_append_char(buf_, '>');
}

void MarkupWriter::render(const ElementPtr& elem) {
    if (elem && render_) render_(elem);
}

void MarkupWriter::render(const ElementList& elems) {
    for (const ElementPtr& elem : elems) render(elem);
}

void MarkupWriter::renderChildren(const ElementList& elems) {
    indent();
    for (const ElementPtr& elem : elems) {
        newline();
        render(elem);
    }
    unindent();
}

void MarkupWriter::newline() {
    strbuf_append_char(buf_, '\n');
    for (int i = 0; i < indent_level_; i++) {
        strbuf_append_str_n(buf_, indent_unit_.data(), indent_unit_.size());
    }
}

void MarkupWriter::writeLine(std::string_view text) {
    newline();
    writeRaw(text);
}

// =============================================================================
// ElementRenderer
// =============================================================================

ElementRenderer::ElementRenderer(MarkupWriter& out) : out_(out) {
    out_.setRenderer([this](const ElementPtr& elem) { render(elem); });
}

void ElementRenderer::render(const ElementPtr& elem) {
    if (!elem) return;
    if (override_ && override_(elem, out_)) return;
    dispatch(elem);
}

ElementPtr temporary_element_fallback(const Element& elem) {
    ElementPtr message =
        make_system_message(MessageLevel::Error, std::string("unexpected temporary element: ") + elem.typeName());
    if (elem.isBlock()) {
        ElementPtr fallback = elem.contentKind() == ContentKind::Spans ? make_paragraph(elem.content)
                                                                       : make_block_sequence({});
        return make_invalid_block(message, fallback);
    }
    ElementPtr fallback = elem.contentKind() == ContentKind::Spans ? make_span_sequence(elem.content)
                                                                   : make_text(elem.source);
    return make_invalid_span(message, fallback);
}

void ElementRenderer::dispatch(const ElementPtr& elem) {
    const Element& e = *elem;
    if (e.type == ElementType::SystemMessage) {
        renderSystemMessage(e);
    } else if (e.type == ElementType::Table) {
        renderTable(e);
    } else if (e.isTableElement()) {
        renderTableElement(e);
    } else if (e.isReference()) {
        log_error("render: unresolved reference '%s' reached the renderer", e.source.c_str());
        renderUnresolvedReference(e);
    } else if (e.isTemporary()) {
        log_error("render: temporary element %s reached the renderer", e.typeName());
        render(temporary_element_fallback(e));
    } else if (e.isInvalid()) {
        renderInvalid(e);
    } else if (e.contentKind() == ContentKind::Blocks) {
        renderBlockContainer(e);
    } else if (e.contentKind() == ContentKind::Spans) {
        renderSpanContainer(e);
    } else if (e.contentKind() == ContentKind::ListItems) {
        renderListContainer(e);
    } else if (e.contentKind() == ContentKind::Text) {
        renderTextContainer(e);
    } else if (e.isContainer()) {
        log_debug("render: no rule for container %s", e.typeName());
        renderUnknown(e);
    } else if (e.isBlock()) {
        renderSimpleBlock(e);
    } else if (e.isSpan()) {
        renderSimpleSpan(e);
    } else {
        log_debug("render: no rule for element %s", e.typeName());
        renderUnknown(e);
    }
}

} // namespace sandoc
