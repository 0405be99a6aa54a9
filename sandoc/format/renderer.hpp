// renderer.hpp - Writer abstraction and capability-ordered dispatch shared by all renderers

#ifndef SANDOC_RENDERER_HPP
#define SANDOC_RENDERER_HPP

#include "../../lib/strbuf.h"
#include "../element.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sandoc {

class MarkupWriter;

// consulted before the renderer's own rules; returns true when it rendered the element
typedef std::function<bool(const ElementPtr& elem, MarkupWriter& out)> RenderOverride;

typedef std::vector<std::pair<std::string, std::string>> TagAttributes;

/**
 * Indentation-aware text writer over a StrBuf.
 *
 * Child elements are rendered through the callback installed with
 * setRenderer(), so a renderer only ever handles a single element and
 * delegates its children back to the composite render function.
 */
class MarkupWriter {
public:
    typedef std::function<void(const ElementPtr&)> RenderFunction;

    MarkupWriter(StrBuf* buf, const char* indent_unit);

    void setRenderer(RenderFunction render) { render_ = std::move(render); }

    // text output
    void writeRaw(std::string_view text);
    // escaped, continuation lines are indented
    void writeText(std::string_view text);
    // escaped, line structure kept as is
    void writePreformatted(std::string_view text);

    // tag output: id becomes the id attribute, styles the role attribute
    void openTag(const char* tag, const Options& opt = Options::none(), const TagAttributes& attrs = {});
    void emptyTag(const char* tag, const Options& opt = Options::none(), const TagAttributes& attrs = {});
    void closeTag(const char* tag);

    // element output
    void render(const ElementPtr& elem);
    // renders the elements one after another on the current line
    void render(const ElementList& elems);
    // renders each element on a new line, one level deeper
    void renderChildren(const ElementList& elems);

    // indentation control
    void indent() { indent_level_++; }
    void unindent() { if (indent_level_ > 0) indent_level_--; }
    void newline();
    // newline at the current indentation followed by raw text
    void writeLine(std::string_view text);

    int indentLevel() const { return indent_level_; }
    StrBuf* buffer() const { return buf_; }

private:
    void writeAttributes(const Options& opt, const TagAttributes& attrs);

    StrBuf* buf_;
    std::string indent_unit_;
    int indent_level_;
    RenderFunction render_;
};

/**
 * Base of all renderers: dispatches an element to the handler of its most
 * specific capability, in this order:
 *
 *   SystemMessage, Table, TableElement, unresolved Reference, Invalid,
 *   BlockContainer, SpanContainer, ListContainer, TextContainer,
 *   plain Block, plain Span, unknown.
 *
 * Handlers only see capabilities and child sequences, so extension types
 * reach a generic fallback without being special-cased.
 */
class ElementRenderer {
public:
    explicit ElementRenderer(MarkupWriter& out);
    virtual ~ElementRenderer() = default;

    void setOverride(RenderOverride override_fn) { override_ = std::move(override_fn); }

    // renders a single element, consulting the override first
    void render(const ElementPtr& elem);

protected:
    virtual void renderSystemMessage(const Element& elem) = 0;
    virtual void renderTable(const Element& elem) = 0;
    virtual void renderTableElement(const Element& elem) = 0;
    virtual void renderUnresolvedReference(const Element& elem) = 0;
    virtual void renderInvalid(const Element& elem) = 0;
    virtual void renderBlockContainer(const Element& elem) = 0;
    virtual void renderSpanContainer(const Element& elem) = 0;
    virtual void renderListContainer(const Element& elem) = 0;
    virtual void renderTextContainer(const Element& elem) = 0;
    virtual void renderSimpleBlock(const Element& elem) = 0;
    virtual void renderSimpleSpan(const Element& elem) = 0;
    virtual void renderUnknown(const Element& elem) { (void)elem; }

    void dispatch(const ElementPtr& elem);

    MarkupWriter& out_;

private:
    RenderOverride override_;
};

// Invalid replacement for a Temporary node that survived the rewrite pass
ElementPtr temporary_element_fallback(const Element& elem);

} // namespace sandoc

#endif // SANDOC_RENDERER_HPP
