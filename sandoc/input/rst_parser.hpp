// rst_parser.hpp - reStructuredText block parser internals

#ifndef SANDOC_RST_PARSER_HPP
#define SANDOC_RST_PARSER_HPP

#include "input.hpp"
#include "input-common.hpp"

#include <string>
#include <vector>

// maximum nesting of quotes, lists and other block containers
#define RST_MAX_NESTING_DEPTH 32

namespace sandoc {

// lines of an indented block with the common indentation removed
struct IndentedBlock {
    Lines lines;
    int min_indent = 0;
};

// footnote labels: "#", "*", digits or "#name"
bool classify_footnote_label(const std::string& label, FootnoteLabel* out);
// alphanumerics joined by isolated '-', '_', '.', ':' or '+'
bool is_simple_reference_name(std::string_view name);

/**
 * Line-based block parser over one (possibly nested) run of lines.
 *
 * parseBlocks() parses the whole run as a block list: each block parser is
 * tried in turn at the current line and either consumes lines or leaves the
 * position untouched. Paragraphs are the default. Cross-block behavior (literal
 * block promotion, link target folding, header ids) is applied by the list.
 */
class RstBlockParser {
public:
    RstBlockParser(Lines lines, int depth);

    ElementList parseBlocks();

private:
    ElementPtr parseBlock();
    ElementPtr parseLiteralBlock();
    ElementPtr parseParagraph();
    ElementPtr parseBulletList();
    ElementPtr parseEnumList();
    ElementPtr parseDefinitionList();
    ElementPtr parseLineBlock();
    ElementPtr parseExplicitBlock();
    ElementPtr parseSimpleTable();
    ElementPtr parseDoctest();
    ElementPtr parseBlockQuote();
    ElementPtr parseOverlineHeader();
    ElementPtr parseTransition();
    ElementPtr parseUnderlineHeader();

    // explicit markup constructs, body is the de-indented block after the first line
    ElementPtr parseFootnoteOrCitation(const std::string& rest, const Lines& body, const std::string& source);
    ElementPtr parseLinkTarget(const std::string& rest, const Lines& body);
    ElementPtr parseSubstitutionDefinition(const std::string& rest, const Lines& body, const std::string& source);
    ElementPtr parseDirective(const std::string& name, const std::string& args, const Lines& body,
                              const std::string& source);

    Lines readListItem(size_t col);
    IndentedBlock readIndentedBlock(int min_indent, bool stop_at_attribution);
    ElementList parseNested(const Lines& lines);
    ElementList processBlockList(const ElementList& blocks);
    void skipBlankLines();
    bool atEnd() const { return current_line_ >= lines_.size(); }
    const std::string& line(size_t offset = 0) const;

    Lines lines_;
    size_t current_line_;
    int depth_;
};

} // namespace sandoc

#endif // SANDOC_RST_PARSER_HPP
