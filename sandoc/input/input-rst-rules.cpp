#include "input.hpp"
#include "../../lib/log.h"

#include <ctype.h>
#include <map>
#include <memory>
#include <set>
#include <string>

namespace sandoc {

static log_category_t* rst_log() {
    return log_category_or_default("rst");
}

namespace {

struct CustomRole {
    std::string base;
    Options options;
};

struct RstDefinitions {
    std::map<std::string, ElementList> substitutions;
    std::map<std::string, CustomRole> roles;
    std::vector<HeaderDecoration> decorations;   // in order of first appearance
};

} // namespace

static std::string lower_string(const std::string& s) {
    std::string out = s;
    for (char& c : out) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    return out;
}

static ElementPtr apply_builtin_role(const std::string& role, const std::string& text, const Options& opt) {
    if (role == "emphasis") return make_emphasized({make_text(text)}, opt);
    if (role == "strong") return make_strong({make_text(text)}, opt);
    if (role == "literal") return make_literal(text, opt);
    if (role == "title-reference") return make_emphasized({make_text(text)}, Styles({"title-reference"}) + opt);
    if (role == "subscript" || role == "sub") return make_text(text, Styles({"subscript"}) + opt);
    if (role == "superscript" || role == "sup") return make_text(text, Styles({"superscript"}) + opt);
    return nullptr;
}

// custom roles may build on other custom roles; cycles end in nullptr
static ElementPtr apply_role(const RstDefinitions& defs, const std::string& role, const std::string& text,
                             const Options& opt, std::set<std::string>& visiting) {
    ElementPtr span = apply_builtin_role(role, text, opt);
    if (span) return span;
    auto it = defs.roles.find(role);
    if (it == defs.roles.end() || !visiting.insert(role).second) return nullptr;
    const CustomRole& custom = it->second;
    if (custom.base.empty()) return make_text(text, custom.options + opt);
    return apply_role(defs, custom.base, text, custom.options + opt, visiting);
}

static RewriteRule make_rst_rule(std::shared_ptr<const RstDefinitions> defs, NestedRewriter nested) {
    return [defs, nested](const ElementPtr& elem) -> RewriteAction {
        switch (elem->type) {
        case ElementType::SubstitutionDefinition:
        case ElementType::CustomizedTextRole:
            return RewriteAction::remove();

        case ElementType::SubstitutionReference: {
            auto it = defs->substitutions.find(elem->name);
            if (it == defs->substitutions.end()) it = defs->substitutions.find(lower_string(elem->name));
            if (it == defs->substitutions.end()) {
                clog_info(rst_log(), "rst: unknown substitution '%s'", elem->name.c_str());
                return RewriteAction::replace(make_invalid_span(
                    MessageLevel::Error, "unknown substitution id: " + elem->name, elem->source));
            }
            const ElementList& spans = it->second;
            ElementPtr replacement = spans.size() == 1 ? spans[0] : make_span_sequence(spans);
            ElementPtr rewritten = nested(replacement);
            if (!rewritten) {
                clog_warn(rst_log(), "rst: substitution '%s' nested too deep", elem->name.c_str());
                return RewriteAction::replace(make_invalid_span(
                    MessageLevel::Error, "substitution nested too deep: " + elem->name, elem->source));
            }
            if (!elem->options.empty()) rewritten = rewritten->withOptions(elem->options);
            return RewriteAction::replace(rewritten);
        }

        case ElementType::InterpretedText: {
            std::set<std::string> visiting;
            ElementPtr span = apply_role(*defs, elem->name, elem->text, elem->options, visiting);
            if (!span) {
                clog_info(rst_log(), "rst: unknown text role '%s'", elem->name.c_str());
                return RewriteAction::replace(make_invalid_span(
                    MessageLevel::Error, "unknown text role: " + elem->name, "`" + elem->text + "`"));
            }
            return RewriteAction::replace(span);
        }

        case ElementType::DecoratedHeader: {
            for (size_t i = 0; i < defs->decorations.size(); i++) {
                if (defs->decorations[i] == elem->decoration) {
                    return RewriteAction::replace(
                        make_header(static_cast<int>(i) + 1, elem->content, elem->options));
                }
            }
            return RewriteAction::keep();
        }

        default:
            return RewriteAction::keep();
        }
    };
}

RuleFactory rst_rewrite_rules() {
    return [](const ElementPtr& document, const NestedRewriter& nested) -> RewriteRule {
        auto defs = std::make_shared<RstDefinitions>();
        walk(document, [&](const ElementPtr& elem) {
            switch (elem->type) {
            case ElementType::SubstitutionDefinition:
                defs->substitutions.emplace(elem->name, elem->content);
                defs->substitutions.emplace(lower_string(elem->name), elem->content);
                break;
            case ElementType::CustomizedTextRole:
                defs->roles.emplace(elem->name, CustomRole{elem->target, elem->options});
                break;
            case ElementType::DecoratedHeader: {
                bool known = false;
                for (const HeaderDecoration& deco : defs->decorations) {
                    if (deco == elem->decoration) known = true;
                }
                if (!known) defs->decorations.push_back(elem->decoration);
                break;
            }
            default:
                break;
            }
        });
        clog_debug(rst_log(), "rst: %zu substitutions, %zu custom roles, %zu header levels",
                   defs->substitutions.size(), defs->roles.size(), defs->decorations.size());
        return make_rst_rule(defs, nested);
    };
}

} // namespace sandoc
