#ifndef GRAPHTRANSLITERATOR_TYPES_H
#define GRAPHTRANSLITERATOR_TYPES_H

#include <cmath>
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace graphtransliterator {

// Error codes returned across the library
enum class Result {
    Success = 0,
    ErrorInvalidHandle = -1,
    ErrorInvalidParameter = -2,
    ErrorInvalidSettings = -3,
    ErrorAmbiguousRules = -4,
    ErrorUnrecognizableInputToken = -5,
    ErrorNoMatchingRule = -6,
    ErrorFileNotFound = -7,
    ErrorInvalidFormat = -8
};

// Token -> classes, used for class constraint lookups
using TokenClassMap = std::unordered_map<std::string, std::set<std::string>>;

// Class -> tokens carrying it
using TokensByClass = std::map<std::string, std::set<std::string>>;

// Boundary token -> preceding token -> on-match rule indices (declared order)
using OnMatchIndex = std::map<std::string, std::map<std::string, std::vector<size_t>>>;

// A declared input token and its classes
struct TokenDefinition {
    std::string token;
    std::vector<std::string> classes;

    TokenDefinition() = default;
    TokenDefinition(const std::string& t, const std::vector<std::string>& c)
        : token(t), classes(c) {}
};

// Whitespace handling
struct WhitespaceSettings {
    std::string defaultToken;   // Added at start and end of every input
    std::string tokenClass;     // Class shared by whitespace tokens
    bool consolidate = true;    // Collapse runs, trim leading/trailing whitespace

    WhitespaceSettings() = default;
    WhitespaceSettings(const std::string& def, const std::string& cls, bool cons)
        : defaultToken(def), tokenClass(cls), consolidate(cons) {}
};

// Cost of a rule with the given number of tokens and constraints.
// More tokens and context means a lower cost and a higher priority.
inline double costOf(size_t constraintCount) {
    return std::log2(1.0 + 1.0 / (1.0 + static_cast<double>(constraintCount)));
}

// Transliteration rule. Empty constraint lists mean "no constraint".
struct TransliterationRule {
    std::string production;
    std::vector<std::string> prevClasses;
    std::vector<std::string> prevTokens;
    std::vector<std::string> tokens;
    std::vector<std::string> nextTokens;
    std::vector<std::string> nextClasses;
    double cost = 0.0;

    TransliterationRule() = default;
    TransliterationRule(const std::string& prod, const std::vector<std::string>& toks)
        : production(prod), tokens(toks), cost(costOf(toks.size())) {}

    // Number of preceding positions constrained
    size_t prevCount() const { return prevClasses.size() + prevTokens.size(); }

    // Number of matched plus following positions constrained
    size_t currentAndNextCount() const {
        return tokens.size() + nextTokens.size() + nextClasses.size();
    }

    size_t constraintCount() const { return prevCount() + currentAndNextCount(); }

    bool hasConstraints() const {
        return !prevClasses.empty() || !prevTokens.empty() ||
               !nextTokens.empty() || !nextClasses.empty();
    }

    void updateCost() { cost = costOf(constraintCount()); }

    bool operator==(const TransliterationRule& other) const {
        return production == other.production &&
               prevClasses == other.prevClasses &&
               prevTokens == other.prevTokens &&
               tokens == other.tokens &&
               nextTokens == other.nextTokens &&
               nextClasses == other.nextClasses &&
               cost == other.cost;
    }
};

// Output inserted between two matches when the classes around the boundary fit
struct OnMatchRule {
    std::vector<std::string> prevClasses;
    std::vector<std::string> nextClasses;
    std::string production;

    OnMatchRule() = default;
    OnMatchRule(const std::vector<std::string>& prev, const std::vector<std::string>& next,
                const std::string& prod)
        : prevClasses(prev), nextClasses(next), production(prod) {}

    bool operator==(const OnMatchRule& other) const {
        return prevClasses == other.prevClasses &&
               nextClasses == other.nextClasses &&
               production == other.production;
    }
};

// Everything needed to build a transliterator
struct Settings {
    std::vector<TokenDefinition> tokens;
    std::vector<TransliterationRule> rules;
    WhitespaceSettings whitespace;
    std::vector<OnMatchRule> onmatchRules;
    std::map<std::string, std::string> metadata;
};

// Build-time switches
struct BuildOptions {
    bool ignoreErrors = false;      // Skip unrecognizable input and unmatched tokens
    bool checkAmbiguity = true;     // Reject rule sets with ambiguous same-cost rules
    bool checkSettings = true;      // Validate settings before building
    std::string version;            // Version stamp; empty means library version

    BuildOptions() = default;
    BuildOptions(bool ignore, bool ambiguity)
        : ignoreErrors(ignore), checkAmbiguity(ambiguity) {}
};

// Output of a single transliteration call
struct TransliterationResult {
    std::string output;
    std::vector<std::string> inputTokens;   // Includes the whitespace sentinels
    std::vector<size_t> ruleKeys;           // Rules applied, in order

    void clear() {
        output.clear();
        inputTokens.clear();
        ruleKeys.clear();
    }
};

// Helper functions
inline std::string resultToString(Result result) {
    switch (result) {
        case Result::Success: return "Success";
        case Result::ErrorInvalidHandle: return "Invalid handle";
        case Result::ErrorInvalidParameter: return "Invalid parameter";
        case Result::ErrorInvalidSettings: return "Invalid settings";
        case Result::ErrorAmbiguousRules: return "Ambiguous transliteration rules";
        case Result::ErrorUnrecognizableInputToken: return "Unrecognizable input token";
        case Result::ErrorNoMatchingRule: return "No matching transliteration rule";
        case Result::ErrorFileNotFound: return "File not found";
        case Result::ErrorInvalidFormat: return "Invalid format";
        default: return "Unknown error";
    }
}

} // namespace graphtransliterator

#endif // GRAPHTRANSLITERATOR_TYPES_H
