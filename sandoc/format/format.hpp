// format.hpp - Output renderers for resolved document trees

#ifndef SANDOC_FORMAT_HPP
#define SANDOC_FORMAT_HPP

#include "../../lib/strbuf.h"
#include "../element.hpp"
#include "renderer.hpp"

#include <optional>
#include <string>

namespace sandoc {

struct DocBookOptions {
    std::string title;
    // minimum severity of messages included in the output; none suppresses all
    std::optional<MessageLevel> message_level;
};

// DocBook 4.5 article for a resolved document
void format_docbook(StrBuf* sb, const ElementPtr& document, const DocBookOptions& options,
                    const RenderOverride& override_fn = nullptr);

// indented structural dump, one element per line
void format_pretty(StrBuf* sb, const ElementPtr& root, const RenderOverride& override_fn = nullptr);

} // namespace sandoc

#endif // SANDOC_FORMAT_HPP
