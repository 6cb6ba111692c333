#ifndef GRAPHTRANSLITERATOR_GRAPH_BUILDER_H
#define GRAPHTRANSLITERATOR_GRAPH_BUILDER_H

#include <graphtransliterator/graph.h>
#include <graphtransliterator/types.h>
#include <vector>

namespace graphtransliterator {

// Builds the matching graph from cost-sorted rules. Rule keys are the
// positions in `rules`.
class GraphBuilder {
public:
    static MatchingGraph build(const std::vector<TransliterationRule>& rules);

private:
    static size_t findOrAddTokenChild(MatchingGraph& graph, size_t parent,
                                      const std::string& token, size_t ruleKey);
};

} // namespace graphtransliterator

#endif // GRAPHTRANSLITERATOR_GRAPH_BUILDER_H
