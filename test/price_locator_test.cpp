// repricer.cpp/test/price_locator_test.cpp
#include <gtest/gtest.h>

#include "dom_adapter.h"
#include "price_locator.h"

#include <libxml/tree.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

using namespace repricer_cpp;

namespace {

dom::NodeView firstChild(dom::NodeView parent, std::string const& tag) {
    for (dom::NodeView child : parent.child_elements()) {
        if (child.tag_name() == tag) return child;
    }
    return {};
}

std::string idOf(dom::NodeView node) {
    xmlChar* id = xmlGetProp(node.get(), reinterpret_cast<xmlChar const*>("id"));
    if (!id) return {};
    std::string value(reinterpret_cast<char const*>(id));
    xmlFree(id);
    return value;
}

std::vector<std::string> candidateIds(std::vector<PriceCandidate> const& candidates) {
    std::vector<std::string> ids;
    for (auto const& candidate : candidates) {
        ids.push_back(idOf(candidate.node));
    }
    return ids;
}

std::vector<std::string> locateIds(std::string const& html, std::optional<std::size_t> limit = std::nullopt) {
    dom::Document document = dom::Document::parse(html);
    return candidateIds(locatePrices(document.root(), limit));
}

} // namespace

TEST(PriceLocatorTest, MoreSpecificChildReplacesParent) {
    auto ids = locateIds("<div id=\"parent\">Total: <span id=\"child\">$5.00</span></div>");
    EXPECT_EQ(ids, (std::vector<std::string>{"child"}));
}

TEST(PriceLocatorTest, EqualCountsDescendToTheLeaf) {
    auto ids = locateIds("<div id=\"outer\"><div id=\"inner\"><span id=\"leaf\">$9.99</span></div></div>");
    EXPECT_EQ(ids, (std::vector<std::string>{"leaf"}));
}

TEST(PriceLocatorTest, ParentWithMoreAmountsIsAuthoritative) {
    auto ids = locateIds("<div id=\"parent\">$5.00 and <span id=\"child\">$3.00</span></div>");
    EXPECT_EQ(ids, (std::vector<std::string>{"parent"}));
}

TEST(PriceLocatorTest, AuthoritativeParentSkipsWholeSubtree) {
    auto ids = locateIds(
        "<div id=\"parent\">$5.00 and <p id=\"child\">only <b id=\"grand\">$3.00</b></p></div>"
        "<p id=\"after\">$1.00</p>");
    EXPECT_EQ(ids, (std::vector<std::string>{"parent", "after"}));
}

TEST(PriceLocatorTest, ListOfPricesSelectsTheList) {
    auto ids = locateIds("<ul id=\"list\"><li id=\"a\">$1.00</li><li id=\"b\">$2.00</li></ul>");
    EXPECT_EQ(ids, (std::vector<std::string>{"list"}));
}

TEST(PriceLocatorTest, SiblingsInDocumentOrder) {
    auto ids = locateIds("<p id=\"a\">$1.00</p><p id=\"b\">Free</p><p id=\"c\">$3.00</p>");
    EXPECT_EQ(ids, (std::vector<std::string>{"a", "c"}));
}

TEST(PriceLocatorTest, LimitKeepsTheFirstCandidates) {
    std::string html = "<p id=\"a\">$1.00</p><p id=\"b\">$2.00</p><p id=\"c\">$3.00</p>";
    EXPECT_EQ(locateIds(html, 2), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(locateIds(html, 0), (std::vector<std::string>{}));
    EXPECT_EQ(locateIds(html, 10), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(PriceLocatorTest, IgnoresTextWithoutAmounts) {
    EXPECT_TRUE(locateIds("<p id=\"a\">Free</p><p id=\"b\">US$ only</p>").empty());
    EXPECT_TRUE(locateIds("<p id=\"a\"><span title=\"$5.00\">no price</span></p>").empty());
}

TEST(PriceLocatorTest, FractionOnlyAmountIsFound) {
    EXPECT_EQ(locateIds("<p id=\"a\">only $.99</p>"), (std::vector<std::string>{"a"}));
}

TEST(PriceLocatorTest, ReportsAmountCounts) {
    dom::Document document = dom::Document::parse("<p id=\"a\">$1.00, $2.00</p><p id=\"b\">$3.00</p>");
    auto candidates = locatePrices(document.root());
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].amounts, 2u);
    EXPECT_EQ(candidates[1].amounts, 1u);
}

TEST(PriceLocatorTest, RootItselfIsNeverACandidate) {
    dom::Document document = dom::Document::parse("<p id=\"a\">Total <b id=\"b\">$1.00</b></p>");
    dom::NodeView paragraph = firstChild(document.root(), "p");
    ASSERT_TRUE(paragraph);

    auto nodes = findPriceNodes(paragraph);
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(idOf(nodes[0]), "b");

    dom::Document bare = dom::Document::parse("<p id=\"a\">$1.00</p>");
    dom::NodeView bareParagraph = firstChild(bare.root(), "p");
    ASSERT_TRUE(bareParagraph);
    EXPECT_TRUE(findPriceNodes(bareParagraph).empty());
}

TEST(PriceLocatorTest, NullRoot) {
    EXPECT_TRUE(locatePrices(dom::NodeView{}).empty());
}
