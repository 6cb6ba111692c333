#include "rule_parser.h"
#include "../utils/utf8.h"
#include <sstream>

namespace graphtransliterator {

namespace {

std::string joinTokens(const std::vector<std::string>& tokens) {
    std::string out;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) out += " ";
        out += tokens[i];
    }
    return out;
}

std::string joinClasses(const std::vector<std::string>& classes) {
    std::string out;
    for (size_t i = 0; i < classes.size(); ++i) {
        if (i > 0) out += " ";
        out += "<" + classes[i] + ">";
    }
    return out;
}

bool isWhitespaceOnly(const std::string& text) {
    if (text.empty()) return false;
    for (char ch : text) {
        if (!utils::isAsciiWhitespace(ch)) return false;
    }
    return true;
}

} // namespace

bool RuleParser::lex(const std::string& pattern, std::vector<Lexeme>& lexemes, std::string& error) {
    lexemes.clear();

    std::istringstream words(pattern);
    std::string word;
    int groupCount = 0;
    int currentGroup = 0;

    while (words >> word) {
        // Opening parentheses belong to the front of a word
        while (!word.empty() && word.front() == '(') {
            if (currentGroup != 0) {
                error = "Nested parentheses in \"" + pattern + "\"";
                return false;
            }
            currentGroup = ++groupCount;
            word.erase(0, 1);
        }

        int closing = 0;
        while (!word.empty() && word.back() == ')') {
            ++closing;
            word.pop_back();
        }

        if (!word.empty()) {
            if (word == "+") {
                lexemes.push_back({LexemeType::Plus, word, currentGroup});
            } else if (word.size() > 2 && word.front() == '<' && word.back() == '>') {
                lexemes.push_back({LexemeType::Class, word.substr(1, word.size() - 2), currentGroup});
            } else {
                lexemes.push_back({LexemeType::Token, word, currentGroup});
            }
        }

        if (closing > 0) {
            if (closing > 1 || currentGroup == 0) {
                error = "Unbalanced parentheses in \"" + pattern + "\"";
                return false;
            }
            currentGroup = 0;
        }
    }

    if (currentGroup != 0) {
        error = "Unclosed parenthesis in \"" + pattern + "\"";
        return false;
    }
    return true;
}

bool RuleParser::parseRule(const std::string& pattern, const std::string& production,
                           TransliterationRule& rule, std::string& error) {
    rule = TransliterationRule();
    rule.production = production;

    if (isWhitespaceOnly(pattern)) {
        rule.tokens.push_back(pattern);
        rule.updateCost();
        return true;
    }

    std::vector<Lexeme> lexemes;
    if (!lex(pattern, lexemes, error)) {
        return false;
    }

    enum class Phase { Prev, Tokens, Next };
    Phase phase = Phase::Prev;
    bool nextFromGroup = false;
    size_t i = 0;

    while (i < lexemes.size()) {
        const Lexeme& lexeme = lexemes[i];

        if (lexeme.type == LexemeType::Plus) {
            error = "Unexpected '+' in rule \"" + pattern + "\"";
            return false;
        }

        if (lexeme.group != 0) {
            // Collect the whole group
            int group = lexeme.group;
            std::vector<Lexeme> members;
            while (i < lexemes.size() && lexemes[i].group == group) {
                members.push_back(lexemes[i]);
                ++i;
            }

            if (phase == Phase::Prev) {
                if (!rule.prevClasses.empty()) {
                    error = "Classes outside and inside the preceding group in \"" + pattern + "\"";
                    return false;
                }
                bool seenToken = false;
                for (const auto& m : members) {
                    if (m.type == LexemeType::Class) {
                        if (seenToken) {
                            error = "Preceding classes must come before preceding tokens in \"" +
                                    pattern + "\"";
                            return false;
                        }
                        rule.prevClasses.push_back(m.text);
                    } else {
                        seenToken = true;
                        rule.prevTokens.push_back(m.text);
                    }
                }
                phase = Phase::Tokens;
            } else if (phase == Phase::Tokens && !rule.tokens.empty()) {
                bool seenClass = false;
                for (const auto& m : members) {
                    if (m.type == LexemeType::Token) {
                        if (seenClass) {
                            error = "Following tokens must come before following classes in \"" +
                                    pattern + "\"";
                            return false;
                        }
                        rule.nextTokens.push_back(m.text);
                    } else {
                        seenClass = true;
                        rule.nextClasses.push_back(m.text);
                    }
                }
                phase = Phase::Next;
                nextFromGroup = true;
            } else {
                error = "Misplaced group in \"" + pattern + "\"";
                return false;
            }
            continue;
        }

        switch (phase) {
            case Phase::Prev:
                if (lexeme.type == LexemeType::Class) {
                    rule.prevClasses.push_back(lexeme.text);
                } else {
                    rule.tokens.push_back(lexeme.text);
                    phase = Phase::Tokens;
                }
                break;

            case Phase::Tokens:
                if (lexeme.type == LexemeType::Token) {
                    rule.tokens.push_back(lexeme.text);
                } else if (rule.tokens.empty()) {
                    error = "Class before the matched tokens after a group in \"" + pattern + "\"";
                    return false;
                } else {
                    rule.nextClasses.push_back(lexeme.text);
                    phase = Phase::Next;
                }
                break;

            case Phase::Next:
                if (nextFromGroup || lexeme.type != LexemeType::Class) {
                    error = "Unexpected \"" + lexeme.text + "\" after the following context in \"" +
                            pattern + "\"";
                    return false;
                }
                rule.nextClasses.push_back(lexeme.text);
                break;
        }
        ++i;
    }

    if (rule.tokens.empty()) {
        error = "No tokens to match in rule \"" + pattern + "\"";
        return false;
    }

    rule.updateCost();
    return true;
}

bool RuleParser::parseOnMatchRule(const std::string& pattern, const std::string& production,
                                  OnMatchRule& rule, std::string& error) {
    rule = OnMatchRule();
    rule.production = production;

    std::vector<Lexeme> lexemes;
    if (!lex(pattern, lexemes, error)) {
        return false;
    }

    bool afterPlus = false;
    for (const auto& lexeme : lexemes) {
        if (lexeme.type == LexemeType::Plus) {
            if (afterPlus) {
                error = "More than one '+' in on-match rule \"" + pattern + "\"";
                return false;
            }
            afterPlus = true;
            continue;
        }
        if (lexeme.type != LexemeType::Class || lexeme.group != 0) {
            error = "On-match rules take classes only: \"" + pattern + "\"";
            return false;
        }
        (afterPlus ? rule.nextClasses : rule.prevClasses).push_back(lexeme.text);
    }

    if (!afterPlus || rule.prevClasses.empty() || rule.nextClasses.empty()) {
        error = "On-match rule needs classes on both sides of '+': \"" + pattern + "\"";
        return false;
    }
    return true;
}

bool RuleParser::parseRules(const std::vector<std::pair<std::string, std::string>>& entries,
                            std::vector<TransliterationRule>& rules, std::string& error) {
    rules.clear();
    rules.reserve(entries.size());
    for (const auto& entry : entries) {
        TransliterationRule rule;
        if (!parseRule(entry.first, entry.second, rule, error)) {
            return false;
        }
        rules.push_back(std::move(rule));
    }
    return true;
}

std::string RuleParser::toEasyReading(const TransliterationRule& rule) {
    std::string out;
    if (!rule.prevClasses.empty() && !rule.prevTokens.empty()) {
        out = "(" + joinClasses(rule.prevClasses) + " " + joinTokens(rule.prevTokens) + ") ";
    } else if (!rule.prevClasses.empty()) {
        out = joinClasses(rule.prevClasses) + " ";
    } else if (!rule.prevTokens.empty()) {
        out = "(" + joinTokens(rule.prevTokens) + ") ";
    }

    out += joinTokens(rule.tokens);

    if (!rule.nextTokens.empty() && !rule.nextClasses.empty()) {
        out += " (" + joinTokens(rule.nextTokens) + " " + joinClasses(rule.nextClasses) + ")";
    } else if (!rule.nextTokens.empty()) {
        out += " (" + joinTokens(rule.nextTokens) + ")";
    } else if (!rule.nextClasses.empty()) {
        out += " " + joinClasses(rule.nextClasses);
    }
    return out;
}

std::string RuleParser::toEasyReading(const OnMatchRule& rule) {
    return joinClasses(rule.prevClasses) + " + " + joinClasses(rule.nextClasses);
}

} // namespace graphtransliterator
