#ifndef GRAPHTRANSLITERATOR_ENGINE_H
#define GRAPHTRANSLITERATOR_ENGINE_H

#include "types.h"
#include "graph.h"
#include "gtb_format.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace graphtransliterator {

// Forward declarations
class EngineState;
class Matcher;
class Tokenizer;

// Internal engine class (implementation detail)
class Engine {
public:
    Engine();
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Construction
    Result load(const Settings& settings, const BuildOptions& options);
    Result load(std::unique_ptr<TransliteratorFile> file);
    Result loadFromPath(const std::string& path);
    Result loadFromMemory(const uint8_t* data, size_t dataLen);
    bool isLoaded() const;

    // Serialization
    std::unique_ptr<TransliteratorFile> toFile() const;

    // Processing
    Result tokenize(const std::string& input, std::vector<std::string>& tokens) const;
    Result transliterate(const std::string& input, std::string& output);
    Result transliterate(const std::string& input, TransliterationResult& result) const;
    std::optional<size_t> matchAt(size_t tokenIndex, const std::vector<std::string>& tokens) const;
    std::vector<size_t> matchAllAt(size_t tokenIndex, const std::vector<std::string>& tokens) const;

    // Copy of the settings without rules producing one of `productions`
    Settings settingsPrunedOf(const std::vector<std::string>& productions) const;
    BuildOptions buildOptions() const;

    // Ambiguity check against the loaded rules
    bool checkForAmbiguity() const;

    // Accessors
    const std::vector<TransliterationRule>& getRules() const { return rules_; }
    const std::vector<TokenDefinition>& getTokens() const { return tokens_; }
    const TokenClassMap& getTokenClasses() const { return tokenClasses_; }
    const TokensByClass& getTokensByClass() const { return tokensByClass_; }
    const WhitespaceSettings& getWhitespace() const { return whitespace_; }
    const std::vector<OnMatchRule>& getOnMatchRules() const { return onmatchRules_; }
    const OnMatchIndex& getOnMatchLookup() const { return onmatchLookup_; }
    const std::map<std::string, std::string>& getMetadata() const { return metadata_; }
    const MatchingGraph& getGraph() const { return graph_; }
    const std::string& getTokenizerPattern() const { return tokenizerPattern_; }
    const std::string& getVersion() const { return version_; }

    bool ignoresErrors() const { return ignoreErrors_; }
    void setIgnoreErrors(bool ignore) { ignoreErrors_ = ignore; }

    // Last transliteration
    const EngineState& getState() const { return *state_; }

private:
    Result finishLoading();
    void deriveTokenTables();
    bool onMatchApplies(const OnMatchRule& rule, size_t tokenIndex,
                        const std::vector<std::string>& tokens) const;

    // Settings
    std::vector<TokenDefinition> tokens_;
    std::vector<TransliterationRule> rules_;
    WhitespaceSettings whitespace_;
    std::vector<OnMatchRule> onmatchRules_;
    std::map<std::string, std::string> metadata_;

    // Derived tables
    TokenClassMap tokenClasses_;
    TokensByClass tokensByClass_;
    MatchingGraph graph_;
    OnMatchIndex onmatchLookup_;
    std::string tokenizerPattern_;
    std::string version_;

    std::unique_ptr<Tokenizer> tokenizer_;
    std::unique_ptr<Matcher> matcher_;
    std::unique_ptr<EngineState> state_;

    // Configuration
    bool ignoreErrors_;
    bool checkAmbiguity_;
    bool loaded_;
};

// Record of the most recent transliterate() call
class EngineState {
public:
    EngineState();
    ~EngineState();

    const std::vector<std::string>& getInputTokens() const;
    void setInputTokens(const std::vector<std::string>& tokens);

    const std::vector<size_t>& getRuleKeys() const;
    void setRuleKeys(const std::vector<size_t>& ruleKeys);

    void reset();

private:
    std::vector<std::string> inputTokens_;
    std::vector<size_t> ruleKeys_;
};

} // namespace graphtransliterator

#endif // GRAPHTRANSLITERATOR_ENGINE_H
