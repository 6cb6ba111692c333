#ifndef GRAPHTRANSLITERATOR_GRAPH_H
#define GRAPHTRANSLITERATOR_GRAPH_H

#include "types.h"
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace graphtransliterator {

// Node kinds of the matching graph
enum class NodeType : uint8_t {
    Start = 0,
    Token = 1,
    Rule = 2
};

// Context a rule node requires around its match. All present lists must hold.
struct Constraints {
    std::vector<std::string> prevTokens;
    std::vector<std::string> prevClasses;
    std::vector<std::string> nextTokens;
    std::vector<std::string> nextClasses;

    Constraints() = default;
    explicit Constraints(const TransliterationRule& rule)
        : prevTokens(rule.prevTokens)
        , prevClasses(rule.prevClasses)
        , nextTokens(rule.nextTokens)
        , nextClasses(rule.nextClasses) {}

    bool empty() const {
        return prevTokens.empty() && prevClasses.empty() &&
               nextTokens.empty() && nextClasses.empty();
    }

    bool operator==(const Constraints& other) const {
        return prevTokens == other.prevTokens && prevClasses == other.prevClasses &&
               nextTokens == other.nextTokens && nextClasses == other.nextClasses;
    }
};

struct StartNode {
    bool operator==(const StartNode&) const { return true; }
};

// Reached by consuming one token
struct TokenNode {
    std::string token;

    bool operator==(const TokenNode& other) const { return token == other.token; }
};

// Accepting node for one rule
struct RuleNode {
    size_t ruleKey = 0;
    Constraints constraints;

    bool operator==(const RuleNode& other) const {
        return ruleKey == other.ruleKey && constraints == other.constraints;
    }
};

using NodeData = std::variant<StartNode, TokenNode, RuleNode>;

struct GraphNode {
    NodeData data;

    // Next token to consume -> child token nodes, cheapest first
    std::map<std::string, std::vector<size_t>> orderedChildren;

    // Accepting rule nodes ending here, cheapest first
    std::vector<size_t> ruleChildren;

    // Smallest rule key reachable through this node
    size_t minRuleKey = 0;

    GraphNode() = default;
    explicit GraphNode(const NodeData& d, size_t minKey = 0) : data(d), minRuleKey(minKey) {}

    NodeType type() const { return static_cast<NodeType>(data.index()); }
    bool isAccepting() const { return type() == NodeType::Rule; }

    const TokenNode* asToken() const { return std::get_if<TokenNode>(&data); }
    const RuleNode* asRule() const { return std::get_if<RuleNode>(&data); }

    bool operator==(const GraphNode& other) const {
        return data == other.data && orderedChildren == other.orderedChildren &&
               ruleChildren == other.ruleChildren && minRuleKey == other.minRuleKey;
    }
};

// Rooted tree of token paths. Node 0 is the start node; edges are child indices.
class MatchingGraph {
public:
    MatchingGraph() = default;

    size_t addNode(const GraphNode& node) {
        nodes_.push_back(node);
        return nodes_.size() - 1;
    }

    const GraphNode& node(size_t index) const { return nodes_[index]; }
    GraphNode& node(size_t index) { return nodes_[index]; }

    const std::vector<GraphNode>& nodes() const { return nodes_; }
    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }
    void clear() { nodes_.clear(); }

    bool operator==(const MatchingGraph& other) const { return nodes_ == other.nodes_; }

private:
    std::vector<GraphNode> nodes_;
};

inline std::string nodeTypeToString(NodeType type) {
    switch (type) {
        case NodeType::Start: return "Start";
        case NodeType::Token: return "token";
        case NodeType::Rule: return "rule";
        default: return "unknown";
    }
}

} // namespace graphtransliterator

#endif // GRAPHTRANSLITERATOR_GRAPH_H
