#include "matcher.h"
#include <algorithm>
#include <limits>

namespace graphtransliterator {

Matcher::Matcher(const MatchingGraph& graph, const TokenClassMap& tokenClasses)
    : graph_(graph)
    , tokenClasses_(tokenClasses) {
}

Matcher::~Matcher() = default;

std::optional<size_t> Matcher::matchAt(size_t tokenIndex,
                                       const std::vector<std::string>& tokens) const {
    std::vector<size_t> matches;
    search(tokenIndex, tokens, false, matches);
    if (matches.empty()) {
        return std::nullopt;
    }
    return matches.front();
}

std::vector<size_t> Matcher::matchAllAt(size_t tokenIndex,
                                        const std::vector<std::string>& tokens) const {
    std::vector<size_t> matches;
    search(tokenIndex, tokens, true, matches);
    std::sort(matches.begin(), matches.end());
    return matches;
}

void Matcher::search(size_t tokenIndex, const std::vector<std::string>& tokens,
                     bool matchAll, std::vector<size_t>& matches) const {
    if (graph_.empty() || tokenIndex >= tokens.size()) {
        return;
    }

    // Best rule key found so far in single-match mode
    size_t best = std::numeric_limits<size_t>::max();

    std::vector<StackEntry> stack;
    pushChildren(0, tokenIndex, tokens, stack);

    while (!stack.empty()) {
        StackEntry entry = stack.back();
        stack.pop_back();

        const GraphNode& node = graph_.node(entry.node);

        // Nothing under this node can beat the current best
        if (!matchAll && node.minRuleKey >= best) {
            continue;
        }

        if (const RuleNode* rule = node.asRule()) {
            if (matchConstraints(rule->constraints, tokenIndex, entry.tokenIndex, tokens)) {
                if (matchAll) {
                    matches.push_back(rule->ruleKey);
                } else {
                    best = rule->ruleKey;
                }
            }
            continue;
        }

        // Token node: its token sits at entry.tokenIndex
        pushChildren(entry.node, std::min(entry.tokenIndex + 1, tokens.size()), tokens, stack);
    }

    if (!matchAll && best != std::numeric_limits<size_t>::max()) {
        matches.push_back(best);
    }
}

void Matcher::pushChildren(size_t node, size_t tokenIndex, const std::vector<std::string>& tokens,
                           std::vector<StackEntry>& stack) const {
    const GraphNode& parent = graph_.node(node);

    std::vector<size_t> children;
    if (tokenIndex < tokens.size()) {
        auto it = parent.orderedChildren.find(tokens[tokenIndex]);
        if (it != parent.orderedChildren.end()) {
            children.insert(children.end(), it->second.begin(), it->second.end());
        }
    }
    children.insert(children.end(), parent.ruleChildren.begin(), parent.ruleChildren.end());

    std::stable_sort(children.begin(), children.end(), [this](size_t a, size_t b) {
        return graph_.node(a).minRuleKey < graph_.node(b).minRuleKey;
    });

    // Reversed so the cheapest child is popped first
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        stack.push_back({*it, tokenIndex});
    }
}

bool Matcher::matchConstraints(const Constraints& constraints, size_t matchStart, size_t matchEnd,
                               const std::vector<std::string>& tokens) const {
    if (constraints.empty()) {
        return true;
    }

    const auto start = static_cast<std::ptrdiff_t>(matchStart);
    const auto end = static_cast<std::ptrdiff_t>(matchEnd);
    const auto prevTokenCount = static_cast<std::ptrdiff_t>(constraints.prevTokens.size());
    const auto prevClassCount = static_cast<std::ptrdiff_t>(constraints.prevClasses.size());
    const auto nextTokenCount = static_cast<std::ptrdiff_t>(constraints.nextTokens.size());

    // ' ', <prev_classes>, <prev_tokens>, <tokens>, <next_tokens>, <next_classes>, ' '
    if (!constraints.prevTokens.empty() &&
        !matchTokens(start - prevTokenCount, constraints.prevTokens, tokens,
                     true, false, false)) {
        return false;
    }
    if (!constraints.prevClasses.empty() &&
        !matchTokens(start - prevTokenCount - prevClassCount, constraints.prevClasses, tokens,
                     true, false, true)) {
        return false;
    }
    if (!constraints.nextTokens.empty() &&
        !matchTokens(end, constraints.nextTokens, tokens, false, true, false)) {
        return false;
    }
    if (!constraints.nextClasses.empty() &&
        !matchTokens(end + nextTokenCount, constraints.nextClasses, tokens,
                     false, true, true)) {
        return false;
    }
    return true;
}

bool Matcher::matchTokens(std::ptrdiff_t start, const std::vector<std::string>& values,
                          const std::vector<std::string>& tokens,
                          bool checkPrev, bool checkNext, bool byClass) const {
    const auto count = static_cast<std::ptrdiff_t>(values.size());
    const auto size = static_cast<std::ptrdiff_t>(tokens.size());

    if (checkPrev && start < 0) {
        return false;
    }
    if (checkNext && start + count > size) {
        return false;
    }
    // Unchecked sides still have to stay inside the token list
    if (start < 0 || start + count > size) {
        return false;
    }

    for (std::ptrdiff_t i = 0; i < count; ++i) {
        const std::string& token = tokens[static_cast<size_t>(start + i)];
        const std::string& value = values[static_cast<size_t>(i)];
        if (byClass) {
            if (!hasClass(token, value)) {
                return false;
            }
        } else if (token != value) {
            return false;
        }
    }
    return true;
}

bool Matcher::hasClass(const std::string& token, const std::string& tokenClass) const {
    auto it = tokenClasses_.find(token);
    return it != tokenClasses_.end() && it->second.count(tokenClass) > 0;
}

} // namespace graphtransliterator
