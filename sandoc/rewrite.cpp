#include "rewrite.hpp"
#include "names.hpp"
#include "../lib/log.h"

#include <map>
#include <memory>
#include <set>
#include <string>

namespace sandoc {

static log_category_t* rewrite_log() {
    return log_category_or_default("rewrite");
}

// ---------------------------------------------------------------------------
// target id deduplication
// ---------------------------------------------------------------------------

static bool has_derived_id(const ElementPtr& elem) {
    return elem->type == ElementType::Header || elem->type == ElementType::DecoratedHeader;
}

// id a node claims in the shared target namespace, empty when none
static std::string target_key(const ElementPtr& elem) {
    if (elem->type == ElementType::ExternalLinkDefinition || elem->type == ElementType::LinkAlias) {
        return elem->name;
    }
    return elem->options.id ? *elem->options.id : std::string();
}

static Options without_id(const Options& opt) {
    Options result = opt;
    result.id.reset();
    return result;
}

ElementPtr dedupe_target_ids(const ElementPtr& document) {
    std::set<std::string> explicit_ids;
    walk(document, [&](const ElementPtr& elem) {
        if (!has_derived_id(elem)) {
            std::string key = target_key(elem);
            if (!key.empty()) explicit_ids.insert(key);
        }
    });

    std::set<std::string> seen;
    return rewrite_tree(document, [&](const ElementPtr& elem) -> RewriteAction {
        std::string key = target_key(elem);
        if (key.empty()) return RewriteAction::keep();

        if (has_derived_id(elem)) {
            if (!seen.count(key) && !explicit_ids.count(key)) {
                seen.insert(key);
                return RewriteAction::keep();
            }
            std::string candidate;
            for (int n = 1; ; n++) {
                candidate = key + "-" + std::to_string(n);
                if (!seen.count(candidate) && !explicit_ids.count(candidate)) break;
            }
            seen.insert(candidate);
            Options opt = elem->options;
            opt.id = candidate;
            return RewriteAction::replace(elem->replaceOptions(opt));
        }

        if (!seen.count(key)) {
            seen.insert(key);
            return RewriteAction::keep();
        }
        clog_info(rewrite_log(), "rewrite: duplicate target id '%s'", key.c_str());
        ElementPtr message = make_system_message(MessageLevel::Warning, "duplicate target id: " + key);
        if (elem->isBlock()) {
            ElementPtr fallback = elem->isDefinition() ? make_block_sequence({})
                                                       : elem->replaceOptions(without_id(elem->options));
            return RewriteAction::replace(make_invalid_block(message, fallback));
        }
        return RewriteAction::replace(make_invalid_span(message, elem->replaceOptions(without_id(elem->options))));
    });
}

// ---------------------------------------------------------------------------
// links
// ---------------------------------------------------------------------------

namespace {

struct LinkDefinition {
    std::string url;
    std::optional<std::string> title;
};

struct LinkTable {
    std::map<std::string, LinkDefinition> external;
    std::map<std::string, std::string> aliases;
    std::set<std::string> internal;
    std::vector<LinkDefinition> anonymous;
    size_t next_anonymous = 0;
};

enum class LinkKind { None, External, Internal };

struct ResolvedLink {
    LinkKind kind = LinkKind::None;
    LinkDefinition definition;
    std::string id;
};

} // namespace

static ResolvedLink resolve_link(const LinkTable& table, const std::string& name) {
    ResolvedLink result;
    std::set<std::string> visited;
    std::string key = name;
    while (!key.empty() && visited.insert(key).second) {
        // each name may match literally or through its slug
        std::string candidates[2] = {key, slugify(key)};
        std::string next;
        for (const std::string& candidate : candidates) {
            if (candidate.empty()) continue;
            auto ext = table.external.find(candidate);
            if (ext != table.external.end()) {
                result.kind = LinkKind::External;
                result.definition = ext->second;
                return result;
            }
            auto alias = table.aliases.find(candidate);
            if (alias != table.aliases.end()) {
                next = alias->second;
                break;
            }
            if (table.internal.count(candidate)) {
                result.kind = LinkKind::Internal;
                result.id = candidate;
                return result;
            }
        }
        key = next;
    }
    return result;
}

RewriteRule link_resolution_rule(const ElementPtr& document) {
    auto table = std::make_shared<LinkTable>();
    walk(document, [&](const ElementPtr& elem) {
        switch (elem->type) {
        case ElementType::ExternalLinkDefinition:
            if (elem->name.empty()) {
                table->anonymous.push_back(LinkDefinition{elem->url, elem->title});
            } else {
                table->external.emplace(elem->name, LinkDefinition{elem->url, elem->title});
            }
            break;
        case ElementType::LinkAlias:
            table->aliases.emplace(elem->name, elem->target);
            break;
        default:
            if (!elem->isDefinition() && elem->options.id) table->internal.insert(*elem->options.id);
            break;
        }
    });

    return [table](const ElementPtr& elem) -> RewriteAction {
        if (elem->type != ElementType::LinkReference && elem->type != ElementType::ImageReference) {
            return RewriteAction::keep();
        }
        ResolvedLink link;
        if (elem->name.empty()) {
            // anonymous references consume anonymous definitions in order
            if (table->next_anonymous < table->anonymous.size()) {
                link.kind = LinkKind::External;
                link.definition = table->anonymous[table->next_anonymous++];
            }
        } else {
            link = resolve_link(*table, elem->name);
        }

        if (elem->type == ElementType::ImageReference && link.kind == LinkKind::External) {
            return RewriteAction::replace(
                make_image(elem->text, link.definition.url, link.definition.title, elem->options));
        }
        if (elem->type == ElementType::LinkReference) {
            if (link.kind == LinkKind::External) {
                return RewriteAction::replace(make_external_link(
                    elem->content, link.definition.url, link.definition.title, elem->options));
            }
            if (link.kind == LinkKind::Internal) {
                return RewriteAction::replace(
                    make_internal_link(elem->content, "#" + link.id, std::nullopt, elem->options));
            }
        }
        clog_info(rewrite_log(), "rewrite: unresolved link reference '%s'", elem->name.c_str());
        return RewriteAction::replace(make_invalid_span(
            MessageLevel::Error, "unresolved link reference: " + elem->name, elem->source));
    };
}

// ---------------------------------------------------------------------------
// footnotes and citations
// ---------------------------------------------------------------------------

static const char* footnote_symbols[] = {
    "*", "\xE2\x80\xA0", "\xE2\x80\xA1", "\xC2\xA7", "\xC2\xB6", "#",
    "\xE2\x99\xA0", "\xE2\x99\xA5", "\xE2\x99\xA6", "\xE2\x99\xA3",
};
static const size_t footnote_symbol_count = sizeof(footnote_symbols) / sizeof(footnote_symbols[0]);

std::string footnote_symbol(size_t index) {
    std::string symbol;
    size_t repeat = index / footnote_symbol_count + 1;
    for (size_t i = 0; i < repeat; i++) symbol += footnote_symbols[index % footnote_symbol_count];
    return symbol;
}

// children before parents, the order rewrite_tree offers nodes to a rule
static void walk_post(const ElementPtr& root, const ElementVisitor& visit) {
    if (!root) return;
    for (const ElementPtr& child : root->content) walk_post(child, visit);
    for (const ElementPtr& child : root->extra) walk_post(child, visit);
    visit(root);
}

namespace {

struct ResolvedFootnote {
    std::string id;
    std::string label;
};

struct FootnoteTable {
    std::vector<ResolvedFootnote> definitions;   // in rewrite order
    std::map<int, size_t> numeric;
    std::map<std::string, size_t> named;
    std::vector<size_t> autonumber;
    std::vector<size_t> autosymbol;
    size_t next_definition = 0;
    size_t next_autonumber = 0;
    size_t next_autosymbol = 0;
};

} // namespace

RewriteRule footnote_rule(const ElementPtr& document) {
    auto table = std::make_shared<FootnoteTable>();
    ElementList definitions;
    std::set<int> claimed;
    std::set<std::string> used_ids;
    walk_post(document, [&](const ElementPtr& elem) {
        if (elem->type != ElementType::FootnoteDefinition) {
            std::string key = target_key(elem);
            if (!key.empty()) used_ids.insert(key);
            return;
        }
        definitions.push_back(elem);
        if (elem->label.kind == FootnoteLabelKind::Numeric) claimed.insert(elem->label.number);
    });

    // footnote ids share the namespace of headers and targets
    auto claim_id = [&](const std::string& base) {
        std::string id = base;
        for (int n = 1; used_ids.count(id); n++) id = base + "-" + std::to_string(n);
        used_ids.insert(id);
        return id;
    };

    int next_number = 1;
    auto take_number = [&]() {
        while (claimed.count(next_number)) next_number++;
        claimed.insert(next_number);
        return next_number++;
    };
    size_t symbols = 0;
    for (const ElementPtr& def : definitions) {
        size_t index = table->definitions.size();
        const FootnoteLabel& label = def->label;
        switch (label.kind) {
        case FootnoteLabelKind::Numeric: {
            std::string n = std::to_string(label.number);
            table->definitions.push_back({claim_id("footnote-" + n), n});
            table->numeric.emplace(label.number, index);
            break;
        }
        case FootnoteLabelKind::Autonumber: {
            std::string n = std::to_string(take_number());
            table->definitions.push_back({claim_id("footnote-" + n), n});
            table->autonumber.push_back(index);
            break;
        }
        case FootnoteLabelKind::AutonumberNamed: {
            std::string n = std::to_string(take_number());
            std::string id = slugify(label.name);
            table->definitions.push_back({claim_id(id.empty() ? "footnote-" + n : id), n});
            table->named.emplace(label.name, index);
            break;
        }
        case FootnoteLabelKind::Autosymbol: {
            size_t k = symbols++;
            table->definitions.push_back({claim_id("footnote-symbol-" + std::to_string(k + 1)), footnote_symbol(k)});
            table->autosymbol.push_back(index);
            break;
        }
        }
    }

    return [table](const ElementPtr& elem) -> RewriteAction {
        if (elem->type == ElementType::FootnoteDefinition) {
            if (table->next_definition >= table->definitions.size()) return RewriteAction::keep();
            const ResolvedFootnote& fn = table->definitions[table->next_definition++];
            return RewriteAction::replace(make_footnote(fn.label, elem->content, elem->options + Id(fn.id)));
        }
        if (elem->type != ElementType::FootnoteReference) return RewriteAction::keep();

        const FootnoteLabel& label = elem->label;
        std::optional<size_t> found;
        switch (label.kind) {
        case FootnoteLabelKind::Numeric: {
            auto it = table->numeric.find(label.number);
            if (it != table->numeric.end()) found = it->second;
            break;
        }
        case FootnoteLabelKind::AutonumberNamed: {
            auto it = table->named.find(label.name);
            if (it != table->named.end()) found = it->second;
            break;
        }
        case FootnoteLabelKind::Autonumber:
            if (table->next_autonumber < table->autonumber.size()) {
                found = table->autonumber[table->next_autonumber++];
            }
            break;
        case FootnoteLabelKind::Autosymbol:
            if (table->next_autosymbol < table->autosymbol.size()) {
                found = table->autosymbol[table->next_autosymbol++];
            }
            break;
        }
        if (!found) {
            clog_info(rewrite_log(), "rewrite: unresolved footnote reference '%s'", elem->source.c_str());
            return RewriteAction::replace(make_invalid_span(
                MessageLevel::Error, "unresolved footnote reference: " + footnote_label_source(label),
                elem->source));
        }
        const ResolvedFootnote& fn = table->definitions[*found];
        return RewriteAction::replace(make_footnote_link(fn.id, fn.label, elem->options));
    };
}

RewriteRule citation_rule(const ElementPtr& document) {
    auto labels = std::make_shared<std::set<std::string>>();
    walk(document, [&](const ElementPtr& elem) {
        if (elem->type == ElementType::Citation) labels->insert(elem->name);
    });
    return [labels](const ElementPtr& elem) -> RewriteAction {
        if (elem->type != ElementType::CitationReference) return RewriteAction::keep();
        if (labels->count(elem->name)) {
            return RewriteAction::replace(make_citation_link(elem->name, elem->options));
        }
        clog_info(rewrite_log(), "rewrite: unresolved citation reference '%s'", elem->name.c_str());
        return RewriteAction::replace(make_invalid_span(
            MessageLevel::Error, "unresolved citation reference: " + elem->name, elem->source));
    };
}

RewriteRule cleanup_rule() {
    return [](const ElementPtr& elem) -> RewriteAction {
        if (elem->isDefinition()) return RewriteAction::remove();
        if (elem->isReference()) {
            return RewriteAction::replace(make_invalid_span(
                MessageLevel::Error, "unresolved reference: " + elem->source, elem->source));
        }
        if (elem->type == ElementType::DecoratedHeader) {
            return RewriteAction::replace(make_header(1, elem->content, elem->options));
        }
        return RewriteAction::keep();
    };
}

// ---------------------------------------------------------------------------
// sections
// ---------------------------------------------------------------------------

namespace {

struct SectionFrame {
    ElementPtr header;
    Options options;
    ElementList blocks;
    int level;
};

} // namespace

ElementPtr build_sections(const ElementPtr& document) {
    if (!document) return document;
    bool has_headers = false;
    for (const ElementPtr& block : document->content) {
        if (block->type == ElementType::Header) has_headers = true;
    }
    if (!has_headers) return document;

    ElementList root;
    std::vector<SectionFrame> stack;
    auto append = [&](ElementPtr block) {
        if (stack.empty()) root.push_back(std::move(block));
        else stack.back().blocks.push_back(std::move(block));
    };
    auto close = [&]() {
        SectionFrame frame = std::move(stack.back());
        stack.pop_back();
        append(make_section(frame.header, std::move(frame.blocks), frame.options));
    };

    for (const ElementPtr& block : document->content) {
        if (block->type != ElementType::Header) {
            append(block);
            continue;
        }
        while (!stack.empty() && stack.back().level >= block->level) close();
        SectionFrame frame;
        frame.level = block->level;
        if (block->options.id) {
            frame.options = Id(*block->options.id);
            frame.header = block->replaceOptions(without_id(block->options));
        } else {
            frame.header = block;
        }
        stack.push_back(std::move(frame));
    }
    while (!stack.empty()) close();
    return document->withContent(std::move(root));
}

// ---------------------------------------------------------------------------
// driver
// ---------------------------------------------------------------------------

// later holders of an id already taken lose it; substituted copies can repeat a target
static ElementPtr drop_repeated_ids(const ElementPtr& document) {
    std::set<std::string> seen;
    return rewrite_tree(document, [&](const ElementPtr& elem) -> RewriteAction {
        if (!elem->options.id) return RewriteAction::keep();
        if (seen.insert(*elem->options.id).second) return RewriteAction::keep();
        clog_warn(rewrite_log(), "rewrite: dropped repeated id '%s' from %s",
                  elem->options.id->c_str(), elem->typeName());
        return RewriteAction::replace(elem->replaceOptions(without_id(elem->options)));
    });
}

// definitions other than footnotes are only read through the rule tables
static bool is_pruned_definition(const ElementPtr& elem) {
    return elem->isDefinition() && elem->type != ElementType::FootnoteDefinition;
}

ElementList find_temporaries(const ElementPtr& root) {
    return select(root, [](const ElementPtr& elem) { return elem->isTemporary(); });
}

ElementPtr rewrite_document(const RawDocument& raw) {
    ElementPtr document = dedupe_target_ids(raw.document ? raw.document : make_document({}));

    RewriteRule combined;
    int depth = 0;
    NestedRewriter nested = [&combined, &depth](const ElementPtr& elem) -> ElementPtr {
        if (depth >= SANDOC_MAX_SUBSTITUTION_DEPTH) return nullptr;
        depth++;
        ElementPtr result = rewrite_tree(elem, combined);
        depth--;
        return result;
    };

    std::vector<RewriteRule> rules;
    for (const RuleFactory& factory : raw.rules) rules.push_back(factory(document, nested));
    rules.push_back(link_resolution_rule(document));
    rules.push_back(footnote_rule(document));
    rules.push_back(citation_rule(document));
    rules.push_back(cleanup_rule());
    combined = cascade(std::move(rules));

    // substitution definitions would otherwise consume anonymous links and
    // auto-numbered footnotes that belong to the substituted copies
    ElementPtr body = prune_tree(document, is_pruned_definition);
    ElementPtr result = body ? rewrite_tree(body, combined) : nullptr;
    if (!result) result = make_document({});
    result = build_sections(drop_repeated_ids(result));

    for (const ElementPtr& elem : find_temporaries(result)) {
        clog_error(rewrite_log(), "rewrite: temporary element %s survived the rewrite pass", elem->typeName());
    }
    clog_debug(rewrite_log(), "rewrite: %zu top-level blocks after rewrite", result->content.size());
    return result;
}

} // namespace sandoc
