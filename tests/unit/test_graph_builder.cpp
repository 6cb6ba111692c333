#include <gtest/gtest.h>
#include "graph/graph_builder.h"
#include "graph/onmatch_index.h"

using namespace graphtransliterator;

namespace {

size_t tokenChild(const MatchingGraph& graph, size_t node, const std::string& token) {
    const auto& children = graph.node(node).orderedChildren;
    auto it = children.find(token);
    if (it == children.end() || it->second.empty()) {
        return 0;
    }
    return it->second.front();
}

} // namespace

TEST(GraphBuilderTest, SharesPrefixes) {
    std::vector<TransliterationRule> rules = {
        TransliterationRule("AB", {"a", "b"}),
        TransliterationRule("A", {"a"}),
    };
    
    MatchingGraph graph = GraphBuilder::build(rules);
    
    // Start, a, b, rule(AB), rule(A)
    ASSERT_EQ(5u, graph.size());
    EXPECT_EQ(NodeType::Start, graph.node(0).type());
    
    size_t a = tokenChild(graph, 0, "a");
    ASSERT_NE(0u, a);
    EXPECT_EQ(1u, graph.node(0).orderedChildren.size());
    EXPECT_EQ(0u, graph.node(a).minRuleKey);
    
    size_t b = tokenChild(graph, a, "b");
    ASSERT_NE(0u, b);
    
    ASSERT_EQ(1u, graph.node(b).ruleChildren.size());
    EXPECT_EQ(0u, graph.node(graph.node(b).ruleChildren[0]).asRule()->ruleKey);
    
    ASSERT_EQ(1u, graph.node(a).ruleChildren.size());
    EXPECT_EQ(1u, graph.node(graph.node(a).ruleChildren[0]).asRule()->ruleKey);
}

TEST(GraphBuilderTest, RuleSiblingsCheapestFirst) {
    TransliterationRule constrained("A1", {"a"});
    constrained.nextClasses = {"wb"};
    constrained.updateCost();
    
    std::vector<TransliterationRule> rules = {constrained, TransliterationRule("A", {"a"})};
    MatchingGraph graph = GraphBuilder::build(rules);
    
    size_t a = tokenChild(graph, 0, "a");
    const auto& siblings = graph.node(a).ruleChildren;
    ASSERT_EQ(2u, siblings.size());
    
    const RuleNode* first = graph.node(siblings[0]).asRule();
    const RuleNode* second = graph.node(siblings[1]).asRule();
    ASSERT_NE(nullptr, first);
    ASSERT_NE(nullptr, second);
    EXPECT_EQ(0u, first->ruleKey);
    EXPECT_EQ(std::vector<std::string>{"wb"}, first->constraints.nextClasses);
    EXPECT_EQ(1u, second->ruleKey);
    EXPECT_TRUE(second->constraints.empty());
}

TEST(GraphBuilderTest, MinRuleKeyTracksCheapestDescendant) {
    std::vector<TransliterationRule> rules = {
        TransliterationRule("XY", {"x", "y"}),
        TransliterationRule("A", {"a"}),
        TransliterationRule("X", {"x"}),
    };
    MatchingGraph graph = GraphBuilder::build(rules);
    
    EXPECT_EQ(0u, graph.node(tokenChild(graph, 0, "x")).minRuleKey);
    EXPECT_EQ(1u, graph.node(tokenChild(graph, 0, "a")).minRuleKey);
}

TEST(GraphBuilderTest, EmptyRulesGiveStartOnly) {
    MatchingGraph graph = GraphBuilder::build({});
    ASSERT_EQ(1u, graph.size());
    EXPECT_EQ(NodeType::Start, graph.node(0).type());
}

TEST(OnMatchIndexTest, FilesUnderBoundaryTokens) {
    TokensByClass tokensByClass = {
        {"class1", {"a"}},
        {"class2", {"b"}},
        {"token", {"a", "b", "u"}},
    };
    std::vector<OnMatchRule> rules = {
        OnMatchRule({"class1"}, {"class2"}, ","),
        OnMatchRule({"class1"}, {"token"}, "+"),
    };
    
    OnMatchIndex index = OnMatchIndexBuilder::build(rules, tokensByClass);
    
    const auto* ab = OnMatchIndexBuilder::lookup(index, "b", "a");
    ASSERT_NE(nullptr, ab);
    EXPECT_EQ((std::vector<size_t>{0, 1}), *ab);
    
    const auto* aa = OnMatchIndexBuilder::lookup(index, "a", "a");
    ASSERT_NE(nullptr, aa);
    EXPECT_EQ(std::vector<size_t>{1}, *aa);
    
    EXPECT_EQ(nullptr, OnMatchIndexBuilder::lookup(index, "a", "b"));
    EXPECT_EQ(nullptr, OnMatchIndexBuilder::lookup(index, "x", "a"));
}

TEST(OnMatchIndexTest, UsesLastPrevAndFirstNextClass) {
    TokensByClass tokensByClass = {
        {"class_a", {"a"}},
        {"class_b", {"b"}},
    };
    std::vector<OnMatchRule> rules = {
        OnMatchRule({"class_a", "class_b"}, {"class_a", "class_b"}, "!"),
    };
    
    OnMatchIndex index = OnMatchIndexBuilder::build(rules, tokensByClass);
    EXPECT_NE(nullptr, OnMatchIndexBuilder::lookup(index, "a", "b"));
    EXPECT_EQ(nullptr, OnMatchIndexBuilder::lookup(index, "b", "a"));
}
