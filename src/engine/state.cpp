#include <graphtransliterator/engine.h>

namespace graphtransliterator {

EngineState::EngineState() {
}

EngineState::~EngineState() {
}

const std::vector<std::string>& EngineState::getInputTokens() const {
    return inputTokens_;
}

void EngineState::setInputTokens(const std::vector<std::string>& tokens) {
    inputTokens_ = tokens;
}

const std::vector<size_t>& EngineState::getRuleKeys() const {
    return ruleKeys_;
}

void EngineState::setRuleKeys(const std::vector<size_t>& ruleKeys) {
    ruleKeys_ = ruleKeys;
}

void EngineState::reset() {
    inputTokens_.clear();
    ruleKeys_.clear();
}

} // namespace graphtransliterator
