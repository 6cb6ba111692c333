#ifndef GRAPHTRANSLITERATOR_MATCHER_H
#define GRAPHTRANSLITERATOR_MATCHER_H

#include <graphtransliterator/graph.h>
#include <graphtransliterator/types.h>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace graphtransliterator {

// Finds the rules whose token path and constraints fit a token position.
// Holds references only; the graph and class map must outlive the matcher.
class Matcher {
public:
    Matcher(const MatchingGraph& graph, const TokenClassMap& tokenClasses);
    ~Matcher();

    // Cheapest matching rule key at `tokenIndex`
    std::optional<size_t> matchAt(size_t tokenIndex, const std::vector<std::string>& tokens) const;

    // Every matching rule key at `tokenIndex`, ascending
    std::vector<size_t> matchAllAt(size_t tokenIndex, const std::vector<std::string>& tokens) const;

    // Checks a rule node's constraints for a match spanning [matchStart, matchEnd)
    bool matchConstraints(const Constraints& constraints, size_t matchStart, size_t matchEnd,
                          const std::vector<std::string>& tokens) const;

    // Compares `values` with the window of `tokens` starting at `start`.
    // A window reaching before index 0 (checkPrev) or past the end (checkNext) fails.
    bool matchTokens(std::ptrdiff_t start, const std::vector<std::string>& values,
                     const std::vector<std::string>& tokens,
                     bool checkPrev, bool checkNext, bool byClass) const;

private:
    struct StackEntry {
        size_t node;
        size_t tokenIndex;   // Next token to consume
    };

    void search(size_t tokenIndex, const std::vector<std::string>& tokens,
                bool matchAll, std::vector<size_t>& matches) const;

    void pushChildren(size_t node, size_t tokenIndex, const std::vector<std::string>& tokens,
                      std::vector<StackEntry>& stack) const;

    bool hasClass(const std::string& token, const std::string& tokenClass) const;

    const MatchingGraph& graph_;
    const TokenClassMap& tokenClasses_;
};

} // namespace graphtransliterator

#endif // GRAPHTRANSLITERATOR_MATCHER_H
