#include "onmatch_index.h"
#include "../utils/debug.h"

namespace graphtransliterator {

OnMatchIndex OnMatchIndexBuilder::build(const std::vector<OnMatchRule>& rules,
                                        const TokensByClass& tokensByClass) {
    OnMatchIndex index;

    for (size_t i = 0; i < rules.size(); ++i) {
        const auto& rule = rules[i];
        if (rule.prevClasses.empty() || rule.nextClasses.empty()) {
            utils::debugLog("Skipping on-match rule " + std::to_string(i) +
                            " with empty class list");
            continue;
        }

        auto currIt = tokensByClass.find(rule.nextClasses.front());
        auto prevIt = tokensByClass.find(rule.prevClasses.back());
        if (currIt == tokensByClass.end() || prevIt == tokensByClass.end()) {
            continue;
        }

        for (const auto& currToken : currIt->second) {
            auto& byPrev = index[currToken];
            for (const auto& prevToken : prevIt->second) {
                byPrev[prevToken].push_back(i);
            }
        }
    }

    return index;
}

const std::vector<size_t>* OnMatchIndexBuilder::lookup(const OnMatchIndex& index,
                                                       const std::string& currToken,
                                                       const std::string& prevToken) {
    auto currIt = index.find(currToken);
    if (currIt == index.end()) {
        return nullptr;
    }
    auto prevIt = currIt->second.find(prevToken);
    if (prevIt == currIt->second.end()) {
        return nullptr;
    }
    return &prevIt->second;
}

} // namespace graphtransliterator
