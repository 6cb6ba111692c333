#include <gtest/gtest.h>
#include "graph/graph_builder.h"
#include "matching/matcher.h"
#include <memory>

using namespace graphtransliterator;

namespace {

using Tokens = std::vector<std::string>;

TransliterationRule makeRule(const std::string& production, const Tokens& tokens,
                             const Tokens& prevClasses = {}, const Tokens& prevTokens = {},
                             const Tokens& nextTokens = {}, const Tokens& nextClasses = {}) {
    TransliterationRule rule(production, tokens);
    rule.prevClasses = prevClasses;
    rule.prevTokens = prevTokens;
    rule.nextTokens = nextTokens;
    rule.nextClasses = nextClasses;
    rule.updateCost();
    return rule;
}

class MatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        classes["a"] = {"class_a", "vowel"};
        classes["b"] = {"class_b"};
        classes["c"] = {"class_c"};
        classes[" "] = {"wb"};
    }

    // Rules must already be in cost order
    void load(const std::vector<TransliterationRule>& sortedRules) {
        rules = sortedRules;
        graph = GraphBuilder::build(rules);
        matcher = std::make_unique<Matcher>(graph, classes);
    }

    TokenClassMap classes;
    std::vector<TransliterationRule> rules;
    MatchingGraph graph;
    std::unique_ptr<Matcher> matcher;
};

} // namespace

TEST_F(MatcherTest, PrefersLongerRule) {
    load({makeRule("AA", {"a", "a"}), makeRule("A", {"a"})});
    Tokens tokens = {" ", "a", "a", " "};

    auto best = matcher->matchAt(1, tokens);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(0u, *best);
    EXPECT_EQ((std::vector<size_t>{0, 1}), matcher->matchAllAt(1, tokens));

    // Only one "a" left at index 2
    best = matcher->matchAt(2, tokens);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(1u, *best);
    EXPECT_EQ(std::vector<size_t>{1}, matcher->matchAllAt(2, tokens));
}

TEST_F(MatcherTest, NoMatch) {
    load({makeRule("A", {"a"})});
    Tokens tokens = {" ", "b", " "};
    EXPECT_FALSE(matcher->matchAt(1, tokens).has_value());
    EXPECT_TRUE(matcher->matchAllAt(1, tokens).empty());
    EXPECT_FALSE(matcher->matchAt(5, tokens).has_value());
}

TEST_F(MatcherTest, FallsBackWhenLongerPathFails) {
    // "a b c" is cheapest but the input stops after "a b"
    load({makeRule("ABC", {"a", "b", "c"}), makeRule("A", {"a"})});
    Tokens tokens = {" ", "a", "b", " "};
    auto best = matcher->matchAt(1, tokens);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(1u, *best);
}

TEST_F(MatcherTest, FallsBackWhenLongerNextTokenFails) {
    // "a a (x)" reaches its rule node but "y" follows
    load({makeRule("AAX", {"a", "a"}, {}, {}, {"x"}), makeRule("A", {"a"})});
    Tokens tokens = {" ", "a", "a", "y", " "};
    auto best = matcher->matchAt(1, tokens);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(1u, *best);
    EXPECT_EQ(std::vector<size_t>{1}, matcher->matchAllAt(1, tokens));

    tokens = {" ", "a", "a", "x", " "};
    EXPECT_EQ(0u, matcher->matchAt(1, tokens).value());
}

TEST_F(MatcherTest, RuleAtEndOfInput) {
    load({makeRule("A", {"a"})});
    Tokens tokens = {"a"};
    auto best = matcher->matchAt(0, tokens);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(0u, *best);
}

TEST_F(MatcherTest, ChecksPreviousClasses) {
    load({makeRule("A!", {"a"}, {"class_c"}), makeRule("A", {"a"})});

    Tokens afterC = {" ", "c", "a", " "};
    EXPECT_EQ(0u, matcher->matchAt(2, afterC).value());

    Tokens afterB = {" ", "b", "a", " "};
    EXPECT_EQ(1u, matcher->matchAt(2, afterB).value());
}

TEST_F(MatcherTest, PreviousClassesPrecedePreviousTokens) {
    // (<class_c> b) a
    load({makeRule("A", {"a"}, {"class_c"}, {"b"}), makeRule("a", {"a"})});

    Tokens tokens = {" ", "c", "b", "a", " "};
    EXPECT_EQ(0u, matcher->matchAt(3, tokens).value());

    Tokens swapped = {" ", "b", "c", "a", " "};
    EXPECT_EQ(1u, matcher->matchAt(3, swapped).value());
}

TEST_F(MatcherTest, NextClassesFollowNextTokens) {
    // a (b <class_c>)
    load({makeRule("A", {"a"}, {}, {}, {"b"}, {"class_c"}), makeRule("a", {"a"})});

    Tokens tokens = {" ", "a", "b", "c", " "};
    EXPECT_EQ(0u, matcher->matchAt(1, tokens).value());

    Tokens missing = {" ", "a", "b", " "};
    EXPECT_EQ(1u, matcher->matchAt(1, missing).value());
}

TEST_F(MatcherTest, ConstraintsMayReachSentinels) {
    load({makeRule("A", {"a"}, {"wb"}, {}, {}, {"wb"}), makeRule("a", {"a"})});
    Tokens tokens = {" ", "a", " "};
    EXPECT_EQ(0u, matcher->matchAt(1, tokens).value());
    EXPECT_EQ((std::vector<size_t>{0, 1}), matcher->matchAllAt(1, tokens));
}

TEST_F(MatcherTest, ConstraintsOutsideInputFail) {
    load({makeRule("A", {"a"}, {"wb", "wb"}), makeRule("a", {"a"})});
    Tokens tokens = {" ", "a", " "};
    EXPECT_EQ(1u, matcher->matchAt(1, tokens).value());
}

TEST_F(MatcherTest, MatchTokensBounds) {
    load({});
    Tokens tokens = {" ", "a", "b", " "};

    EXPECT_TRUE(matcher->matchTokens(1, {"a", "b"}, tokens, false, false, false));
    EXPECT_TRUE(matcher->matchTokens(1, {"vowel", "class_b"}, tokens, false, false, true));
    EXPECT_FALSE(matcher->matchTokens(1, {"b"}, tokens, false, false, false));

    EXPECT_FALSE(matcher->matchTokens(-1, {" ", " "}, tokens, true, false, false));
    EXPECT_FALSE(matcher->matchTokens(3, {" ", " "}, tokens, false, true, false));
    EXPECT_FALSE(matcher->matchTokens(-1, {"wb"}, tokens, false, false, true));
    EXPECT_TRUE(matcher->matchTokens(3, {" "}, tokens, false, true, false));
}

TEST_F(MatcherTest, MatchConstraintsWindows) {
    load({});
    Tokens tokens = {" ", "c", "b", "a", "b", "c", " "};

    Constraints constraints;
    constraints.prevClasses = {"class_c"};
    constraints.prevTokens = {"b"};
    constraints.nextTokens = {"b"};
    constraints.nextClasses = {"class_c", "wb"};
    EXPECT_TRUE(matcher->matchConstraints(constraints, 3, 4, tokens));

    constraints.nextClasses = {"class_c", "wb", "wb"};
    EXPECT_FALSE(matcher->matchConstraints(constraints, 3, 4, tokens));

    EXPECT_TRUE(matcher->matchConstraints(Constraints(), 3, 4, tokens));
}

TEST_F(MatcherTest, MatchAllAtSortsByKey) {
    load({
        makeRule("AB", {"a", "b"}),
        makeRule("A_B", {"a"}, {}, {}, {"b"}),
        makeRule("A_", {"a"}, {}, {}, {}, {"class_b"}),
        makeRule("A", {"a"}),
    });
    Tokens tokens = {" ", "a", "b", " "};
    EXPECT_EQ((std::vector<size_t>{0, 1, 2, 3}), matcher->matchAllAt(1, tokens));
    EXPECT_EQ(0u, matcher->matchAt(1, tokens).value());
}
