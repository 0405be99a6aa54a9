#include "inline_parser.hpp"
#include "../lib/utf.h"

#include <ctype.h>

namespace sandoc {

void SpanBuilder::flush() {
    if (pending_.empty()) return;
    spans_.push_back(make_text(pending_));
    pending_.clear();
}

void SpanBuilder::addSpan(ElementPtr span) {
    if (!span) return;
    // plain text without options joins the pending run
    if (span->type == ElementType::Text && span->options.empty()) {
        pending_ += span->text;
        return;
    }
    flush();
    spans_.push_back(std::move(span));
}

bool SpanBuilder::retract(size_t n) {
    if (n > pending_.size()) return false;
    pending_.resize(pending_.size() - n);
    return true;
}

ElementList SpanBuilder::finish() {
    flush();
    ElementList result;
    result.swap(spans_);
    return result;
}

// one dispatch attempt; on success the result is added to the builder
static bool try_span(std::string_view src, size_t i, size_t run_start, const SpanParserMap& parsers,
                     SpanBuilder& builder, size_t limit, size_t* next) {
    auto it = parsers.find(src[i]);
    if (it == parsers.end()) return false;
    SpanCursor cursor{src.substr(0, limit), i + 1, run_start};
    std::optional<SpanResult> result = it->second(cursor);
    if (!result || result->next <= i || result->next > limit) return false;
    if (result->retract > builder.pendingLength()) return false;
    builder.retract(result->retract);
    builder.addSpan(result->span);
    *next = result->next;
    return true;
}

ElementList parse_spans(std::string_view src, const SpanParserMap& parsers, size_t begin, size_t end) {
    if (end > src.size()) end = src.size();
    SpanBuilder builder;
    size_t run_start = begin;
    size_t i = begin;
    while (i < end) {
        size_t next = i;
        if (try_span(src, i, run_start, parsers, builder, end, &next)) {
            i = next;
            run_start = i;
            continue;
        }
        builder.addChar(src[i]);
        i++;
    }
    return builder.finish();
}

std::optional<NestedSpans> parse_nested_spans(std::string_view src, size_t pos,
                                              const EndMatcher& end_matcher,
                                              const SpanParserMap& parsers) {
    SpanBuilder builder;
    size_t run_start = pos;
    size_t i = pos;
    while (i < src.size()) {
        size_t delim = end_matcher(src, i);
        if (delim > 0) {
            return NestedSpans{builder.finish(), i, i + delim};
        }
        size_t next = i;
        if (try_span(src, i, run_start, parsers, builder, src.size(), &next)) {
            i = next;
            run_start = i;
            continue;
        }
        builder.addChar(src[i]);
        i++;
    }
    return std::nullopt;
}

SpanParser escape_parser(bool drop_whitespace) {
    return [drop_whitespace](const SpanCursor& cur) -> std::optional<SpanResult> {
        if (cur.atEnd(cur.pos)) return std::nullopt;
        unsigned char c = static_cast<unsigned char>(cur.src[cur.pos]);
        if (drop_whitespace && isspace(c)) {
            return SpanResult{make_text(""), cur.pos + 1};
        }
        size_t len = static_cast<size_t>(utf8_sequence_length(c));
        if (cur.pos + len > cur.src.size()) len = cur.src.size() - cur.pos;
        return SpanResult{make_text(std::string(cur.src.substr(cur.pos, len))), cur.pos + len};
    };
}

} // namespace sandoc
