#include "test_utils.h"
#include "../../src/settings/rule_parser.h"
#include "../../src/utils/debug.h"
#include <atomic>
#include <stdexcept>
#include <system_error>

namespace graphtransliterator_test {

using namespace graphtransliterator;

Settings makeSettings(const TokenList& tokens,
                      const RuleList& rules,
                      const RuleList& onmatchRules,
                      const std::string& whitespaceToken,
                      const std::string& whitespaceClass,
                      bool consolidate) {
    Settings settings;
    
    for (const auto& token : tokens) {
        settings.tokens.emplace_back(token.first, token.second);
    }
    
    std::string error;
    if (!RuleParser::parseRules(rules, settings.rules, error)) {
        throw std::runtime_error(error);
    }
    
    for (const auto& entry : onmatchRules) {
        OnMatchRule rule;
        if (!RuleParser::parseOnMatchRule(entry.first, entry.second, rule, error)) {
            throw std::runtime_error(error);
        }
        settings.onmatchRules.push_back(rule);
    }
    
    settings.whitespace = WhitespaceSettings(whitespaceToken, whitespaceClass, consolidate);
    return settings;
}

std::unique_ptr<GraphTransliterator> build(const Settings& settings,
                                           const BuildOptions& options,
                                           Result* result) {
    std::unique_ptr<GraphTransliterator> gt;
    Result status = GraphTransliterator::build(settings, options, gt);
    if (result) {
        *result = status;
    }
    return status == Result::Success ? std::move(gt) : nullptr;
}

std::string transliterate(GraphTransliterator& gt, const std::string& input) {
    std::string output;
    Result result = gt.transliterate(input, output);
    if (result != Result::Success) {
        return "<error: " + resultToString(result) + ">";
    }
    return output;
}

Settings contextRuleSettings() {
    return makeSettings(
        {
            {"a", {"class_a"}},
            {"b", {"class_b"}},
            {"c", {"class_c"}},
            {" ", {"wb"}},
            {"Aa", {"contrained_rule"}},
        },
        {
            {"a", "A"},
            {"b", "B"},
            {"<class_c> a", "A(AFTER_CLASS_C)"},
            {"(<class_c> b) a", "A(AFTER_B_AND_CLASS_C)"},
            {"(<class_c> b b) a", "A(AFTER_BB_AND_CLASS_C)"},
            {"a <class_c>", "A(BEFORE_CLASS_C)"},
            {"a (c <class_b>)", "A(BEFORE_C_AND_CLASS_B)"},
            {"c", "C"},
            {"c c", "C*2"},
            {"a (b b)", "A(BEFORE_B_B)"},
            {"(b b) a", "A(AFTER_B_B)"},
            {"<wb> Aa", "A(ONLY_A_CONSTRAINED_RULE)"},
        },
        {
            {"<class_a> <class_b> + <class_a> <class_b>", "!"},
            {"<class_a> + <class_b>", ","},
        });
}

Settings onMatchSettings() {
    return makeSettings(
        {
            {"a", {"token", "class1"}},
            {"b", {"token", "class2"}},
            {"u", {"token"}},
            {" ", {"wb"}},
        },
        {
            {"a", "A"},
            {"b", "B"},
            {"<wb> u", "\xE0\xA4\x89"},     // DEVANAGARI LETTER U
        },
        {
            {"<class1> + <class2>", ","},
            {"<class1> + <token>", "\xE0\xA5\x8D"},     // DEVANAGARI SIGN VIRAMA
        });
}

ScopedQuietWarnings::ScopedQuietWarnings() : previous_(utils::warningsEnabled()) {
    utils::setWarningsEnabled(false);
}

ScopedQuietWarnings::~ScopedQuietWarnings() {
    utils::setWarningsEnabled(previous_);
}

TempFile::TempFile(const std::string& name) {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("graphtransliterator_" + std::to_string(counter++) + "_" + name);
}

TempFile::~TempFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

} // namespace graphtransliterator_test
