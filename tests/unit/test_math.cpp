#include <gtest/gtest.h>
#include "../../src/engine/stages/math_normalizer.hpp"

using namespace Ar5iv::Engine;
using namespace Ar5iv::Dom;

namespace {

std::string body_text(Document& doc) {
    auto bodies = doc.find_all([](const Node& n) { return n.is_element("body"); });
    return bodies.empty() ? "" : bodies[0]->text_content();
}

std::string math(const std::string& attrs, const std::string& tex) {
    return "<math " + attrs + "><semantics><mi>x</mi>"
           + "<annotation encoding=\"application/x-tex\">" + tex + "</annotation>"
           + "</semantics></math>";
}

}  // namespace

TEST(MathTest, InlineFromAnnotation) {
    auto doc = Document::parse("<p>Let " + math("", " a^2 + b^2 ") + " hold.</p>");
    EXPECT_EQ(MathNormalizer::normalize(doc), 1);
    EXPECT_EQ(body_text(doc), "Let $a^2 + b^2$ hold.");
}

TEST(MathTest, DisplayAttributeForcesBlock) {
    auto doc = Document::parse("<p>" + math("display=\"block\"", "E=mc^2") + "</p>");
    MathNormalizer::normalize(doc);
    EXPECT_EQ(body_text(doc), "\n$$\nE=mc^2\n$$\n");
}

TEST(MathTest, DisplayAttributeWinsOverInlineParent) {
    auto doc = Document::parse("<span class='inline'>" + math("display='BLOCK'", "x") + "</span>");
    MathNormalizer::normalize(doc);
    EXPECT_EQ(body_text(doc), "\n$$\nx\n$$\n");
}

TEST(MathTest, EquationParentImpliesBlock) {
    auto doc = Document::parse(
        "<table class='ltx_equation'><tr><td class='ltx_eqn_cell'>" + math("", "y = mx + b")
        + "</td></tr></table>");
    MathNormalizer::normalize(doc);
    EXPECT_NE(body_text(doc).find("\n$$\ny = mx + b\n$$\n"), std::string::npos);
}

TEST(MathTest, ExplicitInlineIgnoresParentContext) {
    auto doc = Document::parse("<div class='ltx_displaymath'>" + math("display='inline'", "z")
                               + "</div>");
    MathNormalizer::normalize(doc);
    EXPECT_EQ(body_text(doc), "$z$");
}

TEST(MathTest, MultilineSourceRendersAsBlock) {
    auto doc = Document::parse("<p>" + math("", "a &amp;= b \\\\\nc &amp;= d") + "</p>");
    MathNormalizer::normalize(doc);
    EXPECT_EQ(body_text(doc), "\n$$\na &= b \\\\\nc &= d\n$$\n");
}

TEST(MathTest, FallsBackToAltTextThenRawTex) {
    auto doc = Document::parse(
        "<p><math alttext=' \\alpha '><mi>a</mi></math>"
        "<math data-tex='\\beta'><mi>b</mi></math></p>");
    EXPECT_EQ(MathNormalizer::normalize(doc), 2);
    EXPECT_EQ(body_text(doc), "$\\alpha$$\\beta$");
}

TEST(MathTest, EmptyAnnotationFallsThrough) {
    auto doc = Document::parse(
        "<p><math alttext='\\gamma'><semantics><mi>g</mi>"
        "<annotation encoding='application/x-tex'>   </annotation></semantics></math></p>");
    MathNormalizer::normalize(doc);
    EXPECT_EQ(body_text(doc), "$\\gamma$");
}

TEST(MathTest, NonTexAnnotationIsIgnored) {
    auto doc = Document::parse(
        "<p><math><semantics><mi>g</mi>"
        "<annotation encoding='text/plain'>plain</annotation>"
        "<annotation encoding='application/x-LaTeX'>\\delta</annotation>"
        "</semantics></math></p>");
    MathNormalizer::normalize(doc);
    EXPECT_EQ(body_text(doc), "$\\delta$");
}

TEST(MathTest, MissingSourceLeavesNode) {
    auto doc = Document::parse("<p><math><mi>q</mi></math></p>");
    EXPECT_EQ(MathNormalizer::normalize(doc), 0);
    EXPECT_EQ(doc.find_all([](const Node& n) { return n.is_element("math"); }).size(), 1);
}

TEST(MathTest, RenderFormats) {
    EXPECT_EQ(MathNormalizer::render({"  x_1 ", false}), "$x_1$");
    EXPECT_EQ(MathNormalizer::render({"x_1", true}), "\n$$\nx_1\n$$\n");
    EXPECT_EQ(MathNormalizer::render({"a\nb", false}), "\n$$\na\nb\n$$\n");
}

TEST(MathTest, ExtractTexOrder) {
    auto doc = Document::parse(
        "<p>" + math("alttext='alt' data-tex='raw'", "annotated") + "</p>");
    auto nodes = doc.find_all([](const Node& n) { return n.is_element("math"); });
    ASSERT_EQ(nodes.size(), 1);
    auto tex = MathNormalizer::extract_tex(*nodes[0]);
    ASSERT_TRUE(tex.has_value());
    EXPECT_EQ(*tex, "annotated");
}

TEST(MathTest, NestedMathInsideUnconvertedMathIsReplaced) {
    Document doc;
    Node*    p     = doc.root().append_child(Node::make_element("p"));
    Node*    outer = p->append_child(Node::make_element("math"));
    outer->append_child(Node::make_element("mi"))->append_child(Node::make_text("q"));
    Node* inner = outer->append_child(Node::make_element("math"));
    inner->set_attribute("alttext", "y");

    EXPECT_EQ(MathNormalizer::normalize(doc), 1);
    EXPECT_EQ(doc.root().text_content(), "q$y$");
    EXPECT_EQ(doc.find_all([](const Node& n) { return n.is_element("math"); }).size(), 1);
}

TEST(MathTest, ConvertedMathTakesNestedMathWithIt) {
    Document doc;
    Node*    p     = doc.root().append_child(Node::make_element("p"));
    Node*    outer = p->append_child(Node::make_element("math"));
    outer->set_attribute("alttext", "x");
    Node* inner = outer->append_child(Node::make_element("math"));
    inner->set_attribute("alttext", "y");

    EXPECT_EQ(MathNormalizer::normalize(doc), 1);
    EXPECT_EQ(doc.root().text_content(), "$x$");
}
