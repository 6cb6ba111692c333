#include <gtest/gtest.h>
#include <graphtransliterator/types.h>
#include <graphtransliterator/graph.h>
#include <cmath>

using namespace graphtransliterator;

TEST(TypesTest, CostDecreasesWithConstraints) {
    EXPECT_NEAR(0.5849625007211562, costOf(1), 1e-12);
    EXPECT_NEAR(0.41503749927884376, costOf(2), 1e-12);
    
    for (size_t count = 1; count < 10; ++count) {
        EXPECT_LT(costOf(count + 1), costOf(count));
    }
}

TEST(TypesTest, RuleCountsAndCost) {
    TransliterationRule rule("A", {"a"});
    EXPECT_NEAR(costOf(1), rule.cost, 1e-12);
    EXPECT_FALSE(rule.hasConstraints());
    
    rule.prevClasses = {"class_c"};
    rule.prevTokens = {"b"};
    rule.nextTokens = {"c"};
    rule.nextClasses = {"class_b", "class_b"};
    rule.updateCost();
    
    EXPECT_TRUE(rule.hasConstraints());
    EXPECT_EQ(2u, rule.prevCount());
    EXPECT_EQ(4u, rule.currentAndNextCount());
    EXPECT_EQ(6u, rule.constraintCount());
    EXPECT_DOUBLE_EQ(costOf(6), rule.cost);
}

TEST(TypesTest, RuleEquality) {
    TransliterationRule a("A", {"a"});
    TransliterationRule b("A", {"a"});
    EXPECT_TRUE(a == b);
    
    b.nextClasses = {"wb"};
    EXPECT_FALSE(a == b);
}

TEST(TypesTest, OnMatchAndWhitespace) {
    OnMatchRule rule({"class1"}, {"class2"}, ",");
    EXPECT_EQ(",", rule.production);
    EXPECT_EQ(std::vector<std::string>{"class1"}, rule.prevClasses);
    
    WhitespaceSettings whitespace(" ", "wb", false);
    EXPECT_EQ(" ", whitespace.defaultToken);
    EXPECT_EQ("wb", whitespace.tokenClass);
    EXPECT_FALSE(whitespace.consolidate);
    
    WhitespaceSettings defaults;
    EXPECT_TRUE(defaults.consolidate);
}

TEST(TypesTest, BuildOptionsDefaults) {
    BuildOptions options;
    EXPECT_FALSE(options.ignoreErrors);
    EXPECT_TRUE(options.checkAmbiguity);
    EXPECT_TRUE(options.checkSettings);
    EXPECT_TRUE(options.version.empty());
    
    BuildOptions custom(true, false);
    EXPECT_TRUE(custom.ignoreErrors);
    EXPECT_FALSE(custom.checkAmbiguity);
}

TEST(TypesTest, ResultStrings) {
    EXPECT_EQ("Success", resultToString(Result::Success));
    EXPECT_EQ("Ambiguous transliteration rules", resultToString(Result::ErrorAmbiguousRules));
    EXPECT_EQ("No matching transliteration rule", resultToString(Result::ErrorNoMatchingRule));
}

TEST(TypesTest, GraphNodeKinds) {
    MatchingGraph graph;
    EXPECT_TRUE(graph.empty());
    
    size_t start = graph.addNode(GraphNode(StartNode{}));
    size_t token = graph.addNode(GraphNode(TokenNode{"a"}));
    RuleNode payload;
    payload.ruleKey = 3;
    size_t rule = graph.addNode(GraphNode(payload, 3));
    
    EXPECT_EQ(NodeType::Start, graph.node(start).type());
    EXPECT_EQ(NodeType::Token, graph.node(token).type());
    EXPECT_EQ(NodeType::Rule, graph.node(rule).type());
    EXPECT_TRUE(graph.node(rule).isAccepting());
    EXPECT_FALSE(graph.node(token).isAccepting());
    ASSERT_NE(nullptr, graph.node(token).asToken());
    EXPECT_EQ("a", graph.node(token).asToken()->token);
    EXPECT_EQ(nullptr, graph.node(token).asRule());
    EXPECT_EQ(3u, graph.node(rule).asRule()->ruleKey);
    EXPECT_EQ("Start", nodeTypeToString(NodeType::Start));
}
