#ifndef GRAPHTRANSLITERATOR_GTB_VALIDATOR_H
#define GRAPHTRANSLITERATOR_GTB_VALIDATOR_H

#include <graphtransliterator/gtb_format.h>

namespace graphtransliterator {

// Structural checks on a decoded transliterator file
class GtbValidator {
public:
    static bool validate(const TransliteratorFile& file);
    static bool validateGraph(const MatchingGraph& graph, size_t ruleCount);
    static bool validateLookup(const OnMatchIndex& lookup, size_t onmatchCount);
};

} // namespace graphtransliterator

#endif // GRAPHTRANSLITERATOR_GTB_VALIDATOR_H
