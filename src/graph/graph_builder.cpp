#include "graph_builder.h"
#include "../utils/debug.h"
#include <algorithm>
#include <string>

namespace graphtransliterator {

MatchingGraph GraphBuilder::build(const std::vector<TransliterationRule>& rules) {
    MatchingGraph graph;
    graph.addNode(GraphNode(StartNode{}, 0));

    for (size_t ruleKey = 0; ruleKey < rules.size(); ++ruleKey) {
        const auto& rule = rules[ruleKey];

        size_t current = 0;
        for (const auto& token : rule.tokens) {
            current = findOrAddTokenChild(graph, current, token, ruleKey);
        }

        RuleNode payload;
        payload.ruleKey = ruleKey;
        payload.constraints = Constraints(rule);
        size_t ruleNode = graph.addNode(GraphNode(payload, ruleKey));
        // Keys increase, so rule children stay cheapest first
        graph.node(current).ruleChildren.push_back(ruleNode);
    }

    utils::debugLog("Built matching graph with " + std::to_string(graph.size()) +
                    " nodes for " + std::to_string(rules.size()) + " rules");
    return graph;
}

size_t GraphBuilder::findOrAddTokenChild(MatchingGraph& graph, size_t parent,
                                         const std::string& token, size_t ruleKey) {
    auto it = graph.node(parent).orderedChildren.find(token);
    if (it != graph.node(parent).orderedChildren.end() && !it->second.empty()) {
        size_t child = it->second.front();
        auto& childNode = graph.node(child);
        childNode.minRuleKey = std::min(childNode.minRuleKey, ruleKey);
        return child;
    }

    // addNode may reallocate, so look the parent up again afterwards
    size_t child = graph.addNode(GraphNode(TokenNode{token}, ruleKey));
    graph.node(parent).orderedChildren[token].push_back(child);
    return child;
}

} // namespace graphtransliterator
