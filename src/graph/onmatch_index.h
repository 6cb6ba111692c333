#ifndef GRAPHTRANSLITERATOR_ONMATCH_INDEX_H
#define GRAPHTRANSLITERATOR_ONMATCH_INDEX_H

#include <graphtransliterator/types.h>
#include <vector>

namespace graphtransliterator {

// Index of on-match rules by the tokens on either side of a match boundary.
// An on-match rule is filed under every token of its first next class
// (the token at the boundary) crossed with every token of its last previous
// class (the token before it).
class OnMatchIndexBuilder {
public:
    static OnMatchIndex build(const std::vector<OnMatchRule>& rules,
                              const TokensByClass& tokensByClass);

    // Candidates for a boundary, or nullptr when none
    static const std::vector<size_t>* lookup(const OnMatchIndex& index,
                                             const std::string& currToken,
                                             const std::string& prevToken);
};

} // namespace graphtransliterator

#endif // GRAPHTRANSLITERATOR_ONMATCH_INDEX_H
