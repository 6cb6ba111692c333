#ifndef GRAPHTRANSLITERATOR_AMBIGUITY_CHECKER_H
#define GRAPHTRANSLITERATOR_AMBIGUITY_CHECKER_H

#include <graphtransliterator/types.h>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace graphtransliterator {

// A pair of equal-cost rules that can match the same tokens with no
// cheaper rule matching them first
struct Ambiguity {
    size_t firstRule;
    size_t secondRule;
    std::vector<std::vector<std::string>> pattern;  // Tokens possible per position
};

// Finds equal-cost rules that could match overlapping token sequences.
//
// Each rule becomes a row of possible-token sets, aligned so the first matched
// token of every rule sits in the same column. Rules with the same number of
// tokens and constraints are compared pairwise; an overlap is harmless when
// another rule of the same or lower cost covers it in every column.
class AmbiguityChecker {
public:
    AmbiguityChecker(const std::vector<TokenDefinition>& tokens, const TokensByClass& tokensByClass);
    ~AmbiguityChecker();

    // True when no ambiguity exists. Each ambiguity is logged as a warning
    // and, when `found` is given, appended to it.
    bool check(const std::vector<TransliterationRule>& rules,
               std::vector<Ambiguity>* found = nullptr) const;

private:
    using TokenSet = std::vector<uint32_t>;    // Sorted token ids
    using Row = std::vector<TokenSet>;

    TokenSet classSet(const std::string& tokenClass) const;
    TokenSet tokenSet(const std::string& token) const;

    Row possibleTokens(const TransliterationRule& rule, size_t maxPrev, size_t width) const;

    static bool intersect(const Row& a, const Row& b, Row& out);
    static bool covers(const Row& row, const Row& pattern);

    std::string describe(const Row& pattern) const;
    std::vector<std::vector<std::string>> toTokens(const Row& pattern) const;

    std::vector<std::string> tokens_;
    std::unordered_map<std::string, uint32_t> tokenIds_;
    const TokensByClass& tokensByClass_;
    TokenSet allTokens_;
};

} // namespace graphtransliterator

#endif // GRAPHTRANSLITERATOR_AMBIGUITY_CHECKER_H
