// rewrite.hpp - Second pass over a parsed document resolving forward references

#ifndef SANDOC_REWRITE_HPP
#define SANDOC_REWRITE_HPP

#include "element.hpp"

#include <functional>
#include <vector>

// nesting limit for substitutions whose replacement contains substitutions
#define SANDOC_MAX_SUBSTITUTION_DEPTH 8

namespace sandoc {

// rewrites a subtree with the complete rule set; nullptr when nested too deep
typedef std::function<ElementPtr(const ElementPtr&)> NestedRewriter;

// builds a rule from the whole raw document, scanned once
typedef std::function<RewriteRule(const ElementPtr& document, const NestedRewriter& nested)> RuleFactory;

/**
 * Output of a dialect parser: the raw tree, which may still hold Temporary
 * nodes, plus the dialect's rewrite rules. Dialect rules take precedence over
 * the generic ones.
 */
struct RawDocument {
    ElementPtr document;
    std::vector<RuleFactory> rules;
};

/**
 * Runs the complete rewrite: target id deduplication, dialect rules followed
 * by the generic link/footnote/citation/cleanup rules as one cascade, then
 * section building. The result holds no Temporary nodes.
 */
ElementPtr rewrite_document(const RawDocument& raw);

// individual passes
ElementPtr dedupe_target_ids(const ElementPtr& document);
RewriteRule link_resolution_rule(const ElementPtr& document);
RewriteRule footnote_rule(const ElementPtr& document);
RewriteRule citation_rule(const ElementPtr& document);
RewriteRule cleanup_rule();
ElementPtr build_sections(const ElementPtr& document);

// Temporary nodes left in a tree, in document order
ElementList find_temporaries(const ElementPtr& root);

// symbol used for the n-th (0-based) auto-symbol footnote: * † ‡ ... then doubled
std::string footnote_symbol(size_t index);

} // namespace sandoc

#endif // SANDOC_REWRITE_HPP
