#include "ambiguity_checker.h"
#include "../settings/rule_parser.h"
#include "../utils/debug.h"
#include <algorithm>
#include <iterator>

namespace graphtransliterator {

AmbiguityChecker::AmbiguityChecker(const std::vector<TokenDefinition>& tokens,
                                   const TokensByClass& tokensByClass)
    : tokensByClass_(tokensByClass) {
    for (const auto& def : tokens) {
        if (tokenIds_.count(def.token)) {
            continue;
        }
        uint32_t id = static_cast<uint32_t>(tokens_.size());
        tokenIds_[def.token] = id;
        tokens_.push_back(def.token);
        allTokens_.push_back(id);
    }
}

AmbiguityChecker::~AmbiguityChecker() = default;

AmbiguityChecker::TokenSet AmbiguityChecker::classSet(const std::string& tokenClass) const {
    TokenSet set;
    auto it = tokensByClass_.find(tokenClass);
    if (it == tokensByClass_.end()) {
        return set;
    }
    for (const auto& token : it->second) {
        auto id = tokenIds_.find(token);
        if (id != tokenIds_.end()) {
            set.push_back(id->second);
        }
    }
    std::sort(set.begin(), set.end());
    return set;
}

AmbiguityChecker::TokenSet AmbiguityChecker::tokenSet(const std::string& token) const {
    auto id = tokenIds_.find(token);
    if (id == tokenIds_.end()) {
        return TokenSet();
    }
    return TokenSet{id->second};
}

AmbiguityChecker::Row AmbiguityChecker::possibleTokens(const TransliterationRule& rule,
                                                       size_t maxPrev, size_t width) const {
    Row row(maxPrev - rule.prevCount(), allTokens_);

    for (const auto& c : rule.prevClasses) row.push_back(classSet(c));
    for (const auto& t : rule.prevTokens) row.push_back(tokenSet(t));
    for (const auto& t : rule.tokens) row.push_back(tokenSet(t));
    for (const auto& t : rule.nextTokens) row.push_back(tokenSet(t));
    for (const auto& c : rule.nextClasses) row.push_back(classSet(c));

    while (row.size() < width) {
        row.push_back(allTokens_);
    }
    return row;
}

bool AmbiguityChecker::intersect(const Row& a, const Row& b, Row& out) {
    out.clear();
    out.reserve(a.size());
    for (size_t k = 0; k < a.size(); ++k) {
        TokenSet common;
        std::set_intersection(a[k].begin(), a[k].end(), b[k].begin(), b[k].end(),
                              std::back_inserter(common));
        if (common.empty()) {
            return false;
        }
        out.push_back(std::move(common));
    }
    return true;
}

bool AmbiguityChecker::covers(const Row& row, const Row& pattern) {
    for (size_t k = 0; k < pattern.size(); ++k) {
        if (!std::includes(row[k].begin(), row[k].end(), pattern[k].begin(), pattern[k].end())) {
            return false;
        }
    }
    return true;
}

std::vector<std::vector<std::string>> AmbiguityChecker::toTokens(const Row& pattern) const {
    std::vector<std::vector<std::string>> out;
    out.reserve(pattern.size());
    for (const auto& set : pattern) {
        std::vector<std::string> column;
        for (uint32_t id : set) {
            column.push_back(tokens_[id]);
        }
        out.push_back(std::move(column));
    }
    return out;
}

std::string AmbiguityChecker::describe(const Row& pattern) const {
    std::string out = "[";
    for (size_t k = 0; k < pattern.size(); ++k) {
        if (k > 0) out += ", ";
        out += "{";
        for (size_t i = 0; i < pattern[k].size(); ++i) {
            if (i > 0) out += ", ";
            out += "'" + tokens_[pattern[k][i]] + "'";
        }
        out += "}";
    }
    out += "]";
    return out;
}

bool AmbiguityChecker::check(const std::vector<TransliterationRule>& rules,
                             std::vector<Ambiguity>* found) const {
    if (rules.empty()) {
        return true;
    }

    size_t maxPrev = 0;
    size_t maxCurrNext = 0;
    for (const auto& rule : rules) {
        maxPrev = std::max(maxPrev, rule.prevCount());
        maxCurrNext = std::max(maxCurrNext, rule.currentAndNextCount());
    }
    const size_t width = maxPrev + maxCurrNext;

    std::vector<Row> matrix;
    matrix.reserve(rules.size());
    for (const auto& rule : rules) {
        matrix.push_back(possibleTokens(rule, maxPrev, width));
    }

    bool unambiguous = true;
    Row common;

    // Rules are sorted by cost, so equal counts are contiguous
    size_t groupStart = 0;
    while (groupStart < rules.size()) {
        const size_t count = rules[groupStart].constraintCount();
        size_t groupEnd = groupStart + 1;
        while (groupEnd < rules.size() && rules[groupEnd].constraintCount() == count) {
            ++groupEnd;
        }

        for (size_t i = groupStart; i + 1 < groupEnd; ++i) {
            for (size_t j = i + 1; j < groupEnd; ++j) {
                if (!intersect(matrix[i], matrix[j], common)) {
                    continue;
                }

                bool covered = false;
                for (size_t r = 0; r < rules.size() && !covered; ++r) {
                    if (r == i || r == j || rules[r].constraintCount() < count) {
                        continue;
                    }
                    covered = covers(matrix[r], common);
                }
                if (covered) {
                    continue;
                }

                unambiguous = false;
                utils::warningLog("The pattern " + describe(common) + " can be matched by both:\n  " +
                                  RuleParser::toEasyReading(rules[i]) + "\n  " +
                                  RuleParser::toEasyReading(rules[j]));
                if (found) {
                    found->push_back({i, j, toTokens(common)});
                }
            }
        }

        groupStart = groupEnd;
    }

    return unambiguous;
}

} // namespace graphtransliterator
