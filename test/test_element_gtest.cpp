#include <gtest/gtest.h>
#include "../sandoc/element.hpp"
#include "../lib/log.h"

#include <string>

using namespace sandoc;

class ElementTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_init(NULL);
    }
};

// ---------------------------------------------------------------------------
// Options monoid
// ---------------------------------------------------------------------------

TEST_F(ElementTest, OptionsEmptyIsIdentity) {
    Options a = Id("intro") + Styles({"note", "wide"});
    EXPECT_EQ(a + Options::none(), a);
    EXPECT_EQ(Options::none() + a, a);
    EXPECT_TRUE((Options::none() + Options::none()).empty());
}

TEST_F(ElementTest, OptionsSelfMergeIsIdempotent) {
    Options a = Id("x") + Styles({"a", "b"}) + Fallback(make_text("fb"));
    Options twice = a + a;
    EXPECT_EQ(twice.id, a.id);
    EXPECT_EQ(twice.styles, a.styles);
    EXPECT_TRUE(elements_equal(twice.fallback, a.fallback));
}

TEST_F(ElementTest, OptionsRightIdWins) {
    Options merged = Id("left") + Id("right");
    ASSERT_TRUE(merged.id.has_value());
    EXPECT_EQ(*merged.id, "right");

    Options kept = Id("left") + Styles({"s"});
    EXPECT_EQ(*kept.id, "left");
}

TEST_F(ElementTest, OptionsStylesUnionInFirstSeenOrder) {
    Options merged = Styles({"b", "a"}) + Styles({"a", "c", "b"});
    std::vector<std::string> expected = {"b", "a", "c"};
    EXPECT_EQ(merged.styles, expected);
    EXPECT_TRUE(merged.hasStyle("c"));
    EXPECT_FALSE(merged.hasStyle("d"));
}

TEST_F(ElementTest, OptionsRightFallbackWins) {
    Options merged = Fallback(make_text("one")) + Fallback(make_text("two"));
    ASSERT_TRUE(merged.fallback);
    EXPECT_EQ(merged.fallback->text, "two");
}

// ---------------------------------------------------------------------------
// capabilities
// ---------------------------------------------------------------------------

TEST_F(ElementTest, CapabilityTable) {
    ElementPtr para = make_paragraph({make_text("x")});
    EXPECT_TRUE(para->isBlock());
    EXPECT_FALSE(para->isSpan());
    EXPECT_EQ(para->contentKind(), ContentKind::Spans);
    EXPECT_TRUE(para->isContainer());

    ElementPtr ref = make_link_reference({make_text("a")}, "a", "`a`_");
    EXPECT_TRUE(ref->isSpan());
    EXPECT_TRUE(ref->isReference());
    EXPECT_TRUE(ref->isTemporary());

    ElementPtr def = make_external_link_definition("a", "http://a.org");
    EXPECT_TRUE(def->isDefinition());
    EXPECT_TRUE(def->isTemporary());
    EXPECT_TRUE(def->isLinkTarget());

    ElementPtr header = make_decorated_header(HeaderDecoration{'=', false}, {make_text("T")});
    EXPECT_TRUE(header->isTemporary());
    EXPECT_FALSE(make_header(1, {make_text("T")})->isTemporary());

    ElementPtr comment = make_comment("c");
    EXPECT_TRUE(comment->isBlock());
    EXPECT_TRUE(comment->isSpan());
    EXPECT_TRUE(comment->isTextContainer());
    EXPECT_FALSE(comment->isContainer());

    ElementPtr cell = make_cell(CellType::Body, {make_paragraph({make_text("c")})});
    EXPECT_TRUE(cell->isTableElement());
    EXPECT_EQ(cell->contentKind(), ContentKind::Blocks);

    EXPECT_TRUE(make_invalid_span(MessageLevel::Error, "m", "f")->isInvalid());
}

TEST_F(ElementTest, TypeNames) {
    EXPECT_STREQ(make_rule()->typeName(), "Rule");
    EXPECT_STREQ(make_literal_block("x")->typeName(), "LiteralBlock");
    EXPECT_STREQ(element_type_name(ElementType::EnumListItem), "EnumListItem");
}

TEST_F(ElementTest, ExtensionDeclaresItsOwnCapabilities) {
    ElementPtr ext = make_extension("Admonition", CAP_BLOCK | CAP_CUSTOMIZABLE, ContentKind::Blocks,
                                    {make_paragraph({make_text("careful")})});
    EXPECT_EQ(ext->type, ElementType::Extension);
    EXPECT_STREQ(ext->typeName(), "Admonition");
    EXPECT_TRUE(ext->isBlock());
    EXPECT_FALSE(ext->isSpan());
    EXPECT_EQ(ext->contentKind(), ContentKind::Blocks);
    EXPECT_TRUE(ext->isContainer());
}

TEST_F(ElementTest, MessageLevelOrderingAndNames) {
    EXPECT_LT(MessageLevel::Debug, MessageLevel::Info);
    EXPECT_LT(MessageLevel::Info, MessageLevel::Warning);
    EXPECT_LT(MessageLevel::Warning, MessageLevel::Error);
    EXPECT_LT(MessageLevel::Error, MessageLevel::Fatal);

    MessageLevel level = MessageLevel::Debug;
    EXPECT_TRUE(message_level_from_name("WARNING", &level));
    EXPECT_EQ(level, MessageLevel::Warning);
    EXPECT_FALSE(message_level_from_name("loud", &level));
    EXPECT_STREQ(message_level_name(MessageLevel::Error), "error");
}

TEST_F(ElementTest, FootnoteLabelSource) {
    FootnoteLabel numeric{FootnoteLabelKind::Numeric, 3, ""};
    FootnoteLabel named{FootnoteLabelKind::AutonumberNamed, 0, "note"};
    FootnoteLabel symbol{FootnoteLabelKind::Autosymbol, 0, ""};
    EXPECT_EQ(footnote_label_source(numeric), "3");
    EXPECT_EQ(footnote_label_source(named), "#note");
    EXPECT_EQ(footnote_label_source(symbol), "*");
}

// ---------------------------------------------------------------------------
// equality and copies
// ---------------------------------------------------------------------------

TEST_F(ElementTest, StructuralEquality) {
    ElementPtr a = make_paragraph({make_text("hello"), make_emphasized({make_text("x")})});
    ElementPtr b = make_paragraph({make_text("hello"), make_emphasized({make_text("x")})});
    ElementPtr c = make_paragraph({make_text("hello"), make_strong({make_text("x")})});
    EXPECT_TRUE(elements_equal(a, b));
    EXPECT_FALSE(elements_equal(a, c));
    EXPECT_FALSE(elements_equal(a, nullptr));
}

TEST_F(ElementTest, WithOptionsMergesAndLeavesOriginal) {
    ElementPtr text = make_text("x", Styles({"a"}));
    ElementPtr styled = text->withOptions(Id("t") + Styles({"b"}));
    EXPECT_EQ(text->options.styles.size(), 1u);
    EXPECT_EQ(*styled->options.id, "t");
    EXPECT_EQ(styled->options.styles.size(), 2u);

    ElementPtr replaced = styled->replaceOptions(Options::none());
    EXPECT_TRUE(replaced->options.empty());
}

// ---------------------------------------------------------------------------
// traversal
// ---------------------------------------------------------------------------

TEST_F(ElementTest, WalkVisitsSecondarySequences) {
    ElementPtr quote = make_quoted_block({make_paragraph({make_text("body")})},
                                         {make_text("author")});
    ElementPtr doc = make_document({quote});
    ElementList texts = select(doc, [](const ElementPtr& e) { return e->type == ElementType::Text; });
    ASSERT_EQ(texts.size(), 2u);
    EXPECT_EQ(texts[0]->text, "body");
    EXPECT_EQ(texts[1]->text, "author");
}

TEST_F(ElementTest, ContainsFindsNestedNode) {
    ElementPtr doc = make_document({make_bullet_list(
        {make_bullet_list_item({make_paragraph({make_literal("code")})}, "*")}, "*")});
    EXPECT_TRUE(contains(doc, [](const ElementPtr& e) { return e->type == ElementType::Literal; }));
    EXPECT_FALSE(contains(doc, [](const ElementPtr& e) { return e->type == ElementType::Image; }));
}

TEST_F(ElementTest, FlattenText) {
    ElementList spans = {make_text("a "), make_emphasized({make_text("b")}), make_literal(" c"),
                         make_invalid_span(MessageLevel::Error, "oops", " d")};
    EXPECT_EQ(flatten_text(spans), "a b c d");
}

TEST_F(ElementTest, RewriteReplacesBottomUp) {
    ElementPtr doc = make_document({make_paragraph({make_emphasized({make_text("x")})})});
    ElementPtr result = rewrite_tree(doc, [](const ElementPtr& e) {
        if (e->type == ElementType::Emphasized) return RewriteAction::replace(make_strong(e->content));
        return RewriteAction::keep();
    });
    ElementPtr para = result->content[0];
    ASSERT_EQ(para->content.size(), 1u);
    EXPECT_EQ(para->content[0]->type, ElementType::Strong);
    // the input tree is untouched
    EXPECT_EQ(doc->content[0]->content[0]->type, ElementType::Emphasized);
}

TEST_F(ElementTest, RewriteRemovesFromParent) {
    ElementPtr doc = make_document({make_paragraph({make_text("keep")}), make_comment("drop"),
                                    make_rule()});
    ElementPtr result = rewrite_tree(doc, [](const ElementPtr& e) {
        if (e->type == ElementType::Comment) return RewriteAction::remove();
        return RewriteAction::keep();
    });
    ASSERT_EQ(result->content.size(), 2u);
    EXPECT_EQ(result->content[0]->type, ElementType::Paragraph);
    EXPECT_EQ(result->content[1]->type, ElementType::Rule);
}

TEST_F(ElementTest, RewriteSharesUntouchedSubtrees) {
    ElementPtr untouched = make_paragraph({make_text("same")});
    ElementPtr doc = make_document({untouched, make_comment("c")});
    ElementPtr result = rewrite_tree(doc, [](const ElementPtr& e) {
        if (e->type == ElementType::Comment) return RewriteAction::replace(make_rule());
        return RewriteAction::keep();
    });
    EXPECT_NE(result, doc);
    EXPECT_EQ(result->content[0], untouched);

    ElementPtr same = rewrite_tree(doc, [](const ElementPtr&) { return RewriteAction::keep(); });
    EXPECT_EQ(same, doc);
}

TEST_F(ElementTest, CascadeFirstNonKeepWins) {
    int second_calls = 0;
    RewriteRule rule = cascade({
        [](const ElementPtr& e) {
            if (e->type == ElementType::Text) return RewriteAction::replace(make_literal(e->text));
            return RewriteAction::keep();
        },
        [&second_calls](const ElementPtr& e) {
            second_calls++;
            if (e->type == ElementType::Text) return RewriteAction::remove();
            return RewriteAction::keep();
        },
    });
    ElementPtr result = rewrite_tree(make_paragraph({make_text("t")}), rule);
    ASSERT_EQ(result->content.size(), 1u);
    EXPECT_EQ(result->content[0]->type, ElementType::Literal);
    // only the paragraph itself reached the second rule
    EXPECT_EQ(second_calls, 1);
}

TEST_F(ElementTest, RewriteKeepsFixedSlotsWhenRemoved) {
    ElementPtr invalid = make_invalid_block(make_system_message(MessageLevel::Error, "m"),
                                            make_literal_block("fb"));
    ElementPtr result = rewrite_tree(invalid, [](const ElementPtr& e) {
        if (e->type == ElementType::SystemMessage) return RewriteAction::remove();
        return RewriteAction::keep();
    });
    ASSERT_EQ(result->extra.size(), 2u);
    EXPECT_EQ(result->invalidMessage()->type, ElementType::SystemMessage);
}

TEST_F(ElementTest, PruneDropsWholeSubtrees) {
    ElementPtr kept = make_paragraph({make_text("keep")});
    ElementPtr doc = make_document({
        kept,
        make_quoted_block({make_substitution_definition("s", {make_text("inner")}),
                           make_paragraph({make_text("quoted")})}, {}),
        make_substitution_definition("t", {make_substitution_reference("s", "|s|")}),
    });
    int visited_inside = 0;
    ElementPtr result = prune_tree(doc, [&visited_inside](const ElementPtr& e) {
        if (e->type == ElementType::SubstitutionReference) visited_inside++;
        return e->type == ElementType::SubstitutionDefinition;
    });
    ASSERT_EQ(result->content.size(), 2u);
    // untouched subtrees are shared
    EXPECT_EQ(result->content[0], kept);
    ASSERT_EQ(result->content[1]->content.size(), 1u);
    EXPECT_EQ(flatten_text(result->content[1]->content[0]->content), "quoted");
    EXPECT_EQ(visited_inside, 0);
    // the input is left alone
    EXPECT_EQ(doc->content.size(), 3u);

    EXPECT_EQ(prune_tree(doc, [](const ElementPtr& e) { return e->type == ElementType::Document; }), nullptr);
    EXPECT_EQ(prune_tree(doc, [](const ElementPtr&) { return false; }), doc);
}
