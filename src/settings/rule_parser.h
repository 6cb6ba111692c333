#ifndef GRAPHTRANSLITERATOR_RULE_PARSER_H
#define GRAPHTRANSLITERATOR_RULE_PARSER_H

#include <graphtransliterator/types.h>
#include <string>
#include <utility>
#include <vector>

namespace graphtransliterator {

// Reads and writes the compact rule notation:
//
//   [<c>... | (<c>... t...)] t... [(t... <c>...) | <c>...]
//
// e.g. "(<class_c> b) a <class_d>". On-match rules are written "<c>... + <c>...".
// Tokens are separated by whitespace. A pattern of whitespace only is that
// whitespace token.
class RuleParser {
public:
    static bool parseRule(const std::string& pattern, const std::string& production,
                          TransliterationRule& rule, std::string& error);

    static bool parseOnMatchRule(const std::string& pattern, const std::string& production,
                                 OnMatchRule& rule, std::string& error);

    // Parses (pattern, production) pairs in order; stops at the first error
    static bool parseRules(const std::vector<std::pair<std::string, std::string>>& entries,
                           std::vector<TransliterationRule>& rules, std::string& error);

    static std::string toEasyReading(const TransliterationRule& rule);
    static std::string toEasyReading(const OnMatchRule& rule);

private:
    enum class LexemeType {
        Token,
        Class,
        Plus
    };

    struct Lexeme {
        LexemeType type;
        std::string text;
        int group;          // 0 outside parentheses, otherwise the group number
    };

    static bool lex(const std::string& pattern, std::vector<Lexeme>& lexemes, std::string& error);
};

} // namespace graphtransliterator

#endif // GRAPHTRANSLITERATOR_RULE_PARSER_H
