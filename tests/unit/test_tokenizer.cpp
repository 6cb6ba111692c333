#include <gtest/gtest.h>
#include "tokenizer/tokenizer.h"
#include "utils/debug.h"

using namespace graphtransliterator;

namespace {

using Tokens = std::vector<std::string>;

class TokenizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        definitions = {
            TokenDefinition("a", {"class1"}),
            TokenDefinition("b", {"class2"}),
            TokenDefinition("aa", {"class1"}),
            TokenDefinition(" ", {"wb"}),
            TokenDefinition("\t", {"wb"}),
        };
        for (const auto& def : definitions) {
            classes[def.token].insert(def.classes.begin(), def.classes.end());
        }
        whitespace = WhitespaceSettings(" ", "wb", true);
        warnings = utils::warningsEnabled();
        utils::setWarningsEnabled(false);
    }

    void TearDown() override {
        utils::setWarningsEnabled(warnings);
    }

    Tokens run(const std::string& input, bool ignoreErrors = false,
               Result expected = Result::Success) {
        Tokenizer tokenizer(classes, whitespace);
        EXPECT_EQ(Result::Success, tokenizer.compile(Tokenizer::buildPattern(definitions)));
        Tokens tokens;
        EXPECT_EQ(expected, tokenizer.tokenize(input, ignoreErrors, tokens));
        return tokens;
    }

    std::vector<TokenDefinition> definitions;
    TokenClassMap classes;
    WhitespaceSettings whitespace;
    bool warnings = true;
};

} // namespace

TEST_F(TokenizerTest, PatternPutsLongestTokensFirst) {
    std::string pattern = Tokenizer::buildPattern(definitions);
    EXPECT_EQ("(aa|a|b| |\t)", pattern);
}

TEST_F(TokenizerTest, EscapesMetacharacters) {
    EXPECT_EQ("\\.", Tokenizer::escape("."));
    EXPECT_EQ("a\\+b", Tokenizer::escape("a+b"));
    EXPECT_EQ("\\(\\)\\[\\]\\{\\}", Tokenizer::escape("()[]{}"));
    EXPECT_EQ("\\^\\$\\|\\?\\*\\\\", Tokenizer::escape("^$|?*\\"));
    EXPECT_EQ("abc", Tokenizer::escape("abc"));
}

TEST_F(TokenizerTest, MetacharacterTokensMatchLiterally) {
    definitions.push_back(TokenDefinition(".", {"punct"}));
    definitions.push_back(TokenDefinition("(", {"punct"}));
    classes["."].insert("punct");
    classes["("].insert("punct");

    EXPECT_EQ((Tokens{" ", "a", ".", "(", "b", " "}), run("a.(b"));
    run("c", false, Result::ErrorUnrecognizableInputToken);
}

TEST_F(TokenizerTest, AddsWhitespaceSentinels) {
    EXPECT_EQ((Tokens{" ", "a", " "}), run("a"));
    EXPECT_EQ((Tokens{" ", " "}), run(""));
}

TEST_F(TokenizerTest, PrefersLongestToken) {
    EXPECT_EQ((Tokens{" ", "aa", "a", " "}), run("aaa"));
    EXPECT_EQ((Tokens{" ", "aa", "b", " "}), run("aab"));
}

TEST_F(TokenizerTest, ConsolidatesWhitespaceRuns) {
    EXPECT_EQ(run("a a"), run("a  a"));
    EXPECT_EQ(run("a a"), run("a \t a"));
    EXPECT_EQ((Tokens{" ", "a", " ", "a", " "}), run("a  a"));
}

TEST_F(TokenizerTest, TrimsLeadingAndTrailingWhitespace) {
    EXPECT_EQ(run("a"), run(" a "));
    EXPECT_EQ(run("a"), run("\t\ta  "));
    EXPECT_EQ((Tokens{" ", " "}), run("   "));
}

TEST_F(TokenizerTest, KeepsWhitespaceWithoutConsolidation) {
    whitespace.consolidate = false;
    EXPECT_EQ((Tokens{" ", "a", " ", " ", "b", " "}), run("a  b"));
    EXPECT_EQ((Tokens{" ", " ", "a", " ", " "}), run(" a "));
}

TEST_F(TokenizerTest, RejectsUnrecognizableInput) {
    Tokens tokens = run("a!b", false, Result::ErrorUnrecognizableInputToken);
    EXPECT_TRUE(tokens.empty());
}

TEST_F(TokenizerTest, SkipsUnrecognizableInputWhenIgnoringErrors) {
    EXPECT_EQ((Tokens{" ", "a", "b", " "}), run("a!b", true));
    // One code point skipped at a time, multibyte included
    EXPECT_EQ((Tokens{" ", "a", "b", " "}), run("a\xE0\xA4\x95\xE2\x82\xAC" "b", true));
    EXPECT_EQ((Tokens{" ", " "}), run("!!", true));
}

TEST_F(TokenizerTest, SkippedInputDoesNotSeparateWhitespace) {
    EXPECT_EQ((Tokens{" ", "a", " ", "b", " "}), run("a !  b", true));
}

TEST_F(TokenizerTest, IdentifiesWhitespaceByClass) {
    Tokenizer tokenizer(classes, whitespace);
    EXPECT_TRUE(tokenizer.isWhitespace(" "));
    EXPECT_TRUE(tokenizer.isWhitespace("\t"));
    EXPECT_FALSE(tokenizer.isWhitespace("a"));
    EXPECT_FALSE(tokenizer.isWhitespace("x"));
}

TEST_F(TokenizerTest, RequiresCompiledPattern) {
    Tokenizer tokenizer(classes, whitespace);
    EXPECT_FALSE(tokenizer.isCompiled());
    Tokens tokens;
    EXPECT_EQ(Result::ErrorInvalidHandle, tokenizer.tokenize("a", false, tokens));

    EXPECT_EQ(Result::ErrorInvalidFormat, tokenizer.compile("(a"));
    EXPECT_FALSE(tokenizer.isCompiled());
}
