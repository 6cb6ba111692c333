#include "validator.h"
#include "../utils/debug.h"
#include <set>

namespace graphtransliterator {

bool GtbValidator::validate(const TransliteratorFile& file) {
    // Validate header
    if (!file.isValid()) {
        utils::debugLog("GTB header invalid or incompatible");
        return false;
    }

    const auto& settings = file.settings;
    std::set<std::string> tokens;
    for (const auto& def : settings.tokens) {
        tokens.insert(def.token);
    }
    if (tokens.size() != settings.tokens.size() || !tokens.count(settings.whitespace.defaultToken)) {
        utils::debugLog("GTB token section invalid");
        return false;
    }

    for (const auto& rule : settings.rules) {
        if (rule.tokens.empty()) {
            utils::debugLog("GTB rule without tokens");
            return false;
        }
    }

    return validateGraph(file.graph, settings.rules.size()) &&
           validateLookup(file.onmatchLookup, settings.onmatchRules.size());
}

bool GtbValidator::validateGraph(const MatchingGraph& graph, size_t ruleCount) {
    if (graph.empty() || graph.node(0).type() != NodeType::Start) {
        utils::debugLog("GTB graph has no start node");
        return false;
    }

    for (size_t i = 0; i < graph.size(); ++i) {
        const GraphNode& node = graph.node(i);

        if (i > 0 && node.type() == NodeType::Start) {
            return false;
        }
        if (const RuleNode* rule = node.asRule()) {
            if (rule->ruleKey >= ruleCount || !node.orderedChildren.empty() ||
                !node.ruleChildren.empty()) {
                return false;
            }
        }

        for (const auto& entry : node.orderedChildren) {
            for (size_t child : entry.second) {
                // Children always come after their parent
                if (child <= i || child >= graph.size()) {
                    return false;
                }
                const TokenNode* token = graph.node(child).asToken();
                if (!token || token->token != entry.first) {
                    return false;
                }
            }
        }
        for (size_t child : node.ruleChildren) {
            if (child <= i || child >= graph.size() || !graph.node(child).isAccepting()) {
                return false;
            }
        }
    }

    return true;
}

bool GtbValidator::validateLookup(const OnMatchIndex& lookup, size_t onmatchCount) {
    for (const auto& curr : lookup) {
        for (const auto& prev : curr.second) {
            for (size_t index : prev.second) {
                if (index >= onmatchCount) {
                    return false;
                }
            }
        }
    }
    return true;
}

} // namespace graphtransliterator
