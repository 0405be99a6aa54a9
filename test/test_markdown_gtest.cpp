#include <gtest/gtest.h>
#include "../sandoc/input/input.hpp"
#include "../sandoc/rewrite.hpp"
#include "../lib/log.h"

#include <chrono>
#include <string>

using namespace sandoc;

class MarkdownParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_init(NULL);
    }

    ElementList parseBlocks(const std::string& text) {
        return parse_markdown(text).document->content;
    }

    ElementPtr parseAndRewrite(const std::string& text) {
        return rewrite_document(parse_markdown(text));
    }

    ElementList ofType(const ElementPtr& root, ElementType type) {
        return select(root, [type](const ElementPtr& e) { return e->type == type; });
    }
};

// ---------------------------------------------------------------------------
// blocks
// ---------------------------------------------------------------------------

TEST_F(MarkdownParserTest, AtxHeaders) {
    ElementList blocks = parseBlocks("# Title\n\n## Sub section ##\n");
    ASSERT_EQ(blocks.size(), 2u);
    ASSERT_EQ(blocks[0]->type, ElementType::Header);
    EXPECT_EQ(blocks[0]->level, 1);
    EXPECT_EQ(*blocks[0]->options.id, "title");
    EXPECT_EQ(blocks[1]->level, 2);
    EXPECT_EQ(flatten_text(blocks[1]->content), "Sub section");
    EXPECT_EQ(*blocks[1]->options.id, "sub-section");
}

TEST_F(MarkdownParserTest, HashWithoutSpaceIsText) {
    ElementList blocks = parseBlocks("#hashtag\n");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0]->type, ElementType::Paragraph);
}

TEST_F(MarkdownParserTest, SetextHeaders) {
    ElementList blocks = parseBlocks("Title\n=====\n\nSub\n---\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0]->type, ElementType::Header);
    EXPECT_EQ(blocks[0]->level, 1);
    EXPECT_EQ(blocks[1]->level, 2);
    EXPECT_EQ(flatten_text(blocks[1]->content), "Sub");
}

TEST_F(MarkdownParserTest, FencedCodeKeepsLanguage) {
    ElementList blocks = parseBlocks("```cpp\nint x;\n  y();\n```\n");
    ASSERT_EQ(blocks.size(), 1u);
    ASSERT_EQ(blocks[0]->type, ElementType::LiteralBlock);
    EXPECT_EQ(blocks[0]->text, "int x;\n  y();");
    EXPECT_TRUE(blocks[0]->options.hasStyle("cpp"));
}

TEST_F(MarkdownParserTest, TildeFenceWithoutLanguage) {
    ElementList blocks = parseBlocks("~~~\n*not emphasis*\n~~~\n");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0]->text, "*not emphasis*");
    EXPECT_TRUE(blocks[0]->options.empty());
}

TEST_F(MarkdownParserTest, IndentedCode) {
    ElementList blocks = parseBlocks("    code\n\n    more\n\nafter\n");
    ASSERT_EQ(blocks.size(), 2u);
    ASSERT_EQ(blocks[0]->type, ElementType::LiteralBlock);
    EXPECT_EQ(blocks[0]->text, "code\n\nmore");
    EXPECT_EQ(blocks[1]->type, ElementType::Paragraph);
}

TEST_F(MarkdownParserTest, BlockquoteWithLazyContinuation) {
    ElementList blocks = parseBlocks("> quoted\nlazy line\n");
    ASSERT_EQ(blocks.size(), 1u);
    ASSERT_EQ(blocks[0]->type, ElementType::QuotedBlock);
    ASSERT_EQ(blocks[0]->content.size(), 1u);
    EXPECT_EQ(flatten_text(blocks[0]->content[0]->content), "quoted\nlazy line");
    EXPECT_TRUE(blocks[0]->attribution().empty());
}

TEST_F(MarkdownParserTest, NestedBlockquote) {
    ElementList blocks = parseBlocks("> outer\n>\n> > inner\n");
    ASSERT_EQ(blocks.size(), 1u);
    ASSERT_EQ(blocks[0]->content.size(), 2u);
    EXPECT_EQ(blocks[0]->content[1]->type, ElementType::QuotedBlock);
}

TEST_F(MarkdownParserTest, ThematicBreaks) {
    ElementList blocks = parseBlocks("***\n\n- - -\n\n___\n");
    ASSERT_EQ(blocks.size(), 3u);
    for (const ElementPtr& block : blocks) EXPECT_EQ(block->type, ElementType::Rule);
}

TEST_F(MarkdownParserTest, BulletList) {
    ElementList blocks = parseBlocks("- a\n- b\n  - nested\n");
    ASSERT_EQ(blocks.size(), 1u);
    const ElementPtr& list = blocks[0];
    ASSERT_EQ(list->type, ElementType::BulletList);
    ASSERT_EQ(list->content.size(), 2u);
    const ElementPtr& second = list->content[1];
    ASSERT_EQ(second->content.size(), 2u);
    EXPECT_EQ(second->content[1]->type, ElementType::BulletList);
}

TEST_F(MarkdownParserTest, OrderedListStartAndDelimiter) {
    ElementList blocks = parseBlocks("3) x\n4) y\n");
    ASSERT_EQ(blocks.size(), 1u);
    const ElementPtr& list = blocks[0];
    ASSERT_EQ(list->type, ElementType::EnumList);
    EXPECT_EQ(list->level, 3);
    EXPECT_EQ(list->enum_format.type, EnumType::Arabic);
    EXPECT_EQ(list->enum_format.suffix, ")");
    ASSERT_EQ(list->content.size(), 2u);
    EXPECT_EQ(list->content[1]->level, 4);
}

TEST_F(MarkdownParserTest, ChangingBulletStartsNewList) {
    ElementList blocks = parseBlocks("- a\n+ b\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0]->content.size(), 1u);
    EXPECT_EQ(blocks[1]->content.size(), 1u);
}

TEST_F(MarkdownParserTest, ListInterruptsParagraph) {
    ElementList blocks = parseBlocks("text\n- item\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0]->type, ElementType::Paragraph);
    EXPECT_EQ(blocks[1]->type, ElementType::BulletList);
}

TEST_F(MarkdownParserTest, LinkDefinitionWithTitle) {
    ElementList blocks = parseBlocks("[Id]: http://x.org \"Title\"\n");
    ASSERT_EQ(blocks.size(), 1u);
    ASSERT_EQ(blocks[0]->type, ElementType::ExternalLinkDefinition);
    EXPECT_EQ(blocks[0]->name, "id");
    EXPECT_EQ(blocks[0]->url, "http://x.org");
    ASSERT_TRUE(blocks[0]->title.has_value());
    EXPECT_EQ(*blocks[0]->title, "Title");
}

TEST_F(MarkdownParserTest, DeepQuotesFallBackToLiteral) {
    std::string text;
    for (int i = 0; i < 40; i++) text += "> ";
    text += "x\n";
    ElementPtr doc = parse_markdown(text).document;
    EXPECT_TRUE(contains(doc, [](const ElementPtr& e) { return e->type == ElementType::LiteralBlock; }));
}

// ---------------------------------------------------------------------------
// inline content
// ---------------------------------------------------------------------------

TEST_F(MarkdownParserTest, EmphasisAndStrong) {
    ElementList spans = parse_markdown_spans("Some *emph* and **strong** and _u_ and __uu__");
    ElementList emph, strong;
    for (const ElementPtr& span : spans) {
        if (span->type == ElementType::Emphasized) emph.push_back(span);
        if (span->type == ElementType::Strong) strong.push_back(span);
    }
    ASSERT_EQ(emph.size(), 2u);
    ASSERT_EQ(strong.size(), 2u);
    EXPECT_EQ(flatten_text(emph[0]->content), "emph");
    EXPECT_EQ(flatten_text(strong[1]->content), "uu");
}

TEST_F(MarkdownParserTest, IntrawordUnderscoreIsText) {
    ElementList spans = parse_markdown_spans("snake_case_name");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0]->text, "snake_case_name");
}

TEST_F(MarkdownParserTest, CodeSpan) {
    ElementList spans = parse_markdown_spans("use `a*b` here and ``x ` y``");
    ASSERT_EQ(spans.size(), 4u);
    ASSERT_EQ(spans[1]->type, ElementType::Literal);
    EXPECT_EQ(spans[1]->text, "a*b");
    EXPECT_EQ(spans[3]->text, "x ` y");
}

TEST_F(MarkdownParserTest, EscapesAndHardBreaks) {
    ElementList spans = parse_markdown_spans("\\*not\\*");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0]->text, "*not*");

    spans = parse_markdown_spans("line one  \nline two");
    ASSERT_EQ(spans.size(), 3u);
    EXPECT_EQ(spans[0]->text, "line one");
    EXPECT_EQ(spans[1]->type, ElementType::LineBreak);
    EXPECT_EQ(spans[2]->text, "line two");

    spans = parse_markdown_spans("a\\\nb");
    ASSERT_EQ(spans.size(), 3u);
    EXPECT_EQ(spans[1]->type, ElementType::LineBreak);
}

TEST_F(MarkdownParserTest, InlineLinkAndImage) {
    ElementList spans = parse_markdown_spans("[text](http://x.org \"T\") ![alt](img.png)");
    ASSERT_EQ(spans.size(), 3u);
    ASSERT_EQ(spans[0]->type, ElementType::ExternalLink);
    EXPECT_EQ(spans[0]->url, "http://x.org");
    EXPECT_EQ(*spans[0]->title, "T");
    EXPECT_EQ(flatten_text(spans[0]->content), "text");
    ASSERT_EQ(spans[2]->type, ElementType::Image);
    EXPECT_EQ(spans[2]->text, "alt");
    EXPECT_EQ(spans[2]->url, "img.png");
}

TEST_F(MarkdownParserTest, Autolinks) {
    ElementList spans = parse_markdown_spans("<http://a.org> and <me@x.org> and <not a link>");
    ASSERT_GE(spans.size(), 3u);
    ASSERT_EQ(spans[0]->type, ElementType::ExternalLink);
    EXPECT_EQ(spans[0]->url, "http://a.org");
    ASSERT_EQ(spans[2]->type, ElementType::ExternalLink);
    EXPECT_EQ(spans[2]->url, "mailto:me@x.org");
    EXPECT_EQ(spans.back()->text, " and <not a link>");
}

TEST_F(MarkdownParserTest, UnclosedEmphasisStaysText) {
    ElementList spans = parse_markdown_spans("*a *b **c");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0]->text, "*a *b **c");

    spans = parse_markdown_spans("*a *b* c");
    ASSERT_EQ(spans.size(), 3u);
    EXPECT_EQ(spans[0]->text, "*a ");
    ASSERT_EQ(spans[1]->type, ElementType::Emphasized);
    EXPECT_EQ(flatten_text(spans[1]->content), "b");
    EXPECT_EQ(spans[2]->text, " c");
}

TEST_F(MarkdownParserTest, ManyUnclosedMarkersParseQuickly) {
    std::string text;
    for (int i = 0; i < 1000; i++) text += (i % 2) ? "_a " : "*a ";
    text += "**b";

    auto started = std::chrono::steady_clock::now();
    ElementList spans = parse_markdown_spans(text);
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0]->text, text);
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 2000);
}

// ---------------------------------------------------------------------------
// references resolved by the rewrite pass
// ---------------------------------------------------------------------------

TEST_F(MarkdownParserTest, FullReferenceLink) {
    ElementPtr doc = parseAndRewrite("[text][id]\n\n[id]: http://x.org\n");
    ASSERT_EQ(doc->content.size(), 1u);
    ElementList links = ofType(doc, ElementType::ExternalLink);
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0]->url, "http://x.org");
    EXPECT_EQ(flatten_text(links[0]->content), "text");
}

TEST_F(MarkdownParserTest, ShortcutAndCollapsedReferences) {
    ElementPtr doc = parseAndRewrite("[Foo] and [Foo][]\n\n[foo]: /url\n");
    ElementList links = ofType(doc, ElementType::ExternalLink);
    ASSERT_EQ(links.size(), 2u);
    EXPECT_EQ(links[0]->url, "/url");
    EXPECT_EQ(links[1]->url, "/url");
}

TEST_F(MarkdownParserTest, ImageReference) {
    ElementPtr doc = parseAndRewrite("![logo][img]\n\n[img]: logo.png\n");
    ElementList images = ofType(doc, ElementType::Image);
    ASSERT_EQ(images.size(), 1u);
    EXPECT_EQ(images[0]->url, "logo.png");
    EXPECT_EQ(images[0]->text, "logo");
}

TEST_F(MarkdownParserTest, UnresolvedReferenceKeepsSource) {
    ElementPtr doc = parseAndRewrite("[nothing][missing]\n");
    ElementList invalid = ofType(doc, ElementType::InvalidSpan);
    ASSERT_EQ(invalid.size(), 1u);
    EXPECT_EQ(invalid[0]->invalidMessage()->text, "unresolved link reference: missing");
    EXPECT_EQ(invalid[0]->invalidFallback()->text, "[nothing][missing]");
}

TEST_F(MarkdownParserTest, HeadersBecomeSections) {
    ElementPtr doc = parseAndRewrite("# One\n\ntext\n\n## Two\n\nmore\n\n# Three\n");
    ASSERT_EQ(doc->content.size(), 2u);
    EXPECT_EQ(doc->content[0]->type, ElementType::Section);
    EXPECT_EQ(*doc->content[0]->options.id, "one");
    ElementList inner = ofType(doc->content[0], ElementType::Section);
    EXPECT_EQ(inner.size(), 2u);
    EXPECT_EQ(*doc->content[1]->options.id, "three");
    EXPECT_TRUE(find_temporaries(doc).empty());
}

TEST_F(MarkdownParserTest, LinkToHeaderSlug) {
    ElementPtr doc = parseAndRewrite("# Getting Started\n\nSee [Getting Started].\n");
    ElementList links = ofType(doc, ElementType::InternalLink);
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0]->url, "#getting-started");
}
