#include <graphtransliterator/engine.h>
#include <graphtransliterator/graphtransliterator.h>
#include "../ambiguity/ambiguity_checker.h"
#include "../graph/graph_builder.h"
#include "../graph/onmatch_index.h"
#include "../gtb/validator.h"
#include "../matching/matcher.h"
#include "../settings/validator.h"
#include "../tokenizer/tokenizer.h"
#include "../utils/debug.h"
#include "../utils/version.h"
#include <algorithm>
#include <set>

namespace graphtransliterator {

namespace {

std::string joinForLog(const std::vector<std::string>& tokens) {
    std::string out = "[";
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) out += ", ";
        out += "'" + tokens[i] + "'";
    }
    return out + "]";
}

} // namespace

// Engine implementation
Engine::Engine()
    : state_(std::make_unique<EngineState>())
    , ignoreErrors_(false)
    , checkAmbiguity_(true)
    , loaded_(false) {
}

Engine::~Engine() = default;

Result Engine::load(const Settings& settings, const BuildOptions& options) {
    loaded_ = false;

    if (options.checkSettings) {
        std::vector<SettingsError> errors;
        if (!SettingsValidator::validate(settings, errors)) {
            for (const auto& error : errors) {
                utils::warningLog("Invalid settings (" + error.section + "): " + error.message);
            }
            return Result::ErrorInvalidSettings;
        }
    }

    // A rule that consumes nothing would never advance the scan
    for (const auto& rule : settings.rules) {
        if (rule.tokens.empty()) {
            utils::warningLog("Invalid settings (rules): rule without tokens");
            return Result::ErrorInvalidSettings;
        }
    }

    tokens_ = settings.tokens;
    whitespace_ = settings.whitespace;
    onmatchRules_ = settings.onmatchRules;
    metadata_ = settings.metadata;

    rules_ = settings.rules;
    for (auto& rule : rules_) {
        rule.updateCost();
    }
    std::stable_sort(rules_.begin(), rules_.end(),
                     [](const TransliterationRule& a, const TransliterationRule& b) {
                         return a.cost < b.cost;
                     });

    ignoreErrors_ = options.ignoreErrors;
    checkAmbiguity_ = options.checkAmbiguity;
    version_ = options.version.empty() ? std::string(GRAPHTRANSLITERATOR_VERSION) : options.version;

    deriveTokenTables();

    if (checkAmbiguity_ && !checkForAmbiguity()) {
        return Result::ErrorAmbiguousRules;
    }

    graph_ = GraphBuilder::build(rules_);
    onmatchLookup_ = OnMatchIndexBuilder::build(onmatchRules_, tokensByClass_);
    tokenizerPattern_ = Tokenizer::buildPattern(tokens_);

    return finishLoading();
}

Result Engine::load(std::unique_ptr<TransliteratorFile> file) {
    loaded_ = false;

    if (!file || !GtbValidator::validate(*file)) {
        return Result::ErrorInvalidFormat;
    }

    tokens_ = std::move(file->settings.tokens);
    rules_ = std::move(file->settings.rules);
    whitespace_ = file->settings.whitespace;
    onmatchRules_ = std::move(file->settings.onmatchRules);
    metadata_ = std::move(file->settings.metadata);
    graph_ = std::move(file->graph);
    onmatchLookup_ = std::move(file->onmatchLookup);
    tokenizerPattern_ = file->tokenizerPattern;
    version_ = file->version;
    ignoreErrors_ = file->ignoresErrors();

    // Loaded rules were checked when first built
    checkAmbiguity_ = false;

    deriveTokenTables();
    return finishLoading();
}

Result Engine::loadFromPath(const std::string& path) {
    auto gtb = GtbLoader::loadFromFile(path);
    if (!gtb) {
        return Result::ErrorFileNotFound;
    }

    return load(std::move(gtb));
}

Result Engine::loadFromMemory(const uint8_t* data, size_t dataLen) {
    auto gtb = GtbLoader::loadFromMemory(data, dataLen);
    if (!gtb) {
        return Result::ErrorInvalidFormat;
    }

    return load(std::move(gtb));
}

bool Engine::isLoaded() const {
    return loaded_;
}

Result Engine::finishLoading() {
    tokenizer_ = std::make_unique<Tokenizer>(tokenClasses_, whitespace_);
    Result result = tokenizer_->compile(tokenizerPattern_);
    if (result != Result::Success) {
        return result;
    }

    matcher_ = std::make_unique<Matcher>(graph_, tokenClasses_);
    state_->reset();
    loaded_ = true;

    utils::debugLog("Loaded " + std::to_string(rules_.size()) + " rules, " +
                    std::to_string(tokens_.size()) + " tokens, " +
                    std::to_string(graph_.size()) + " graph nodes");
    return Result::Success;
}

void Engine::deriveTokenTables() {
    tokenClasses_.clear();
    tokensByClass_.clear();

    for (const auto& def : tokens_) {
        auto& classes = tokenClasses_[def.token];
        for (const auto& tokenClass : def.classes) {
            classes.insert(tokenClass);
            tokensByClass_[tokenClass].insert(def.token);
        }
    }
}

std::unique_ptr<TransliteratorFile> Engine::toFile() const {
    if (!loaded_) {
        return nullptr;
    }

    auto file = std::make_unique<TransliteratorFile>();
    file->header.flags = 0;
    if (whitespace_.consolidate) file->header.flags |= GTB_FLAG_CONSOLIDATE;
    if (ignoreErrors_) file->header.flags |= GTB_FLAG_IGNORE_ERRORS;

    file->version = version_;
    file->tokenizerPattern = tokenizerPattern_;
    file->settings.tokens = tokens_;
    file->settings.rules = rules_;
    file->settings.whitespace = whitespace_;
    file->settings.onmatchRules = onmatchRules_;
    file->settings.metadata = metadata_;
    file->graph = graph_;
    file->onmatchLookup = onmatchLookup_;
    return file;
}

Result Engine::tokenize(const std::string& input, std::vector<std::string>& tokens) const {
    if (!loaded_) {
        return Result::ErrorInvalidHandle;
    }
    return tokenizer_->tokenize(input, ignoreErrors_, tokens);
}

Result Engine::transliterate(const std::string& input, std::string& output) {
    TransliterationResult result;
    Result status = static_cast<const Engine&>(*this).transliterate(input, result);

    state_->setInputTokens(result.inputTokens);
    state_->setRuleKeys(result.ruleKeys);

    if (status == Result::Success) {
        output = std::move(result.output);
    }
    return status;
}

Result Engine::transliterate(const std::string& input, TransliterationResult& result) const {
    result.clear();
    if (!loaded_) {
        return Result::ErrorInvalidHandle;
    }

    Result status = tokenizer_->tokenize(input, ignoreErrors_, result.inputTokens);
    if (status != Result::Success) {
        return status;
    }

    const auto& tokens = result.inputTokens;

    // Skip the leading and trailing whitespace tokens
    size_t pos = 1;
    while (pos + 1 < tokens.size()) {
        std::optional<size_t> ruleKey = matcher_->matchAt(pos, tokens);
        if (!ruleKey) {
            utils::warningLog("No matching transliteration rule at token pos " +
                              std::to_string(pos) + " of " + joinForLog(tokens));
            if (ignoreErrors_) {
                ++pos;
                continue;
            }
            return Result::ErrorNoMatchingRule;
        }

        result.ruleKeys.push_back(*ruleKey);
        const TransliterationRule& rule = rules_[*ruleKey];

        if (!onmatchRules_.empty()) {
            const std::vector<size_t>* candidates =
                OnMatchIndexBuilder::lookup(onmatchLookup_, tokens[pos], tokens[pos - 1]);
            if (candidates) {
                for (size_t index : *candidates) {
                    const OnMatchRule& onmatch = onmatchRules_[index];
                    if (onMatchApplies(onmatch, pos, tokens)) {
                        result.output += onmatch.production;
                        break;
                    }
                }
            }
        }

        result.output += rule.production;
        pos += rule.tokens.size();
    }

    return Result::Success;
}

bool Engine::onMatchApplies(const OnMatchRule& rule, size_t tokenIndex,
                            const std::vector<std::string>& tokens) const {
    const auto pos = static_cast<std::ptrdiff_t>(tokenIndex);
    const auto prevCount = static_cast<std::ptrdiff_t>(rule.prevClasses.size());

    // <class_a> <class_a> + <class_b>
    //  a         a           b
    //                        ^ tokenIndex
    return matcher_->matchTokens(pos - prevCount, rule.prevClasses, tokens, true, false, true) &&
           matcher_->matchTokens(pos, rule.nextClasses, tokens, false, true, true);
}

std::optional<size_t> Engine::matchAt(size_t tokenIndex, const std::vector<std::string>& tokens) const {
    if (!loaded_ || tokenIndex >= tokens.size()) {
        return std::nullopt;
    }
    return matcher_->matchAt(tokenIndex, tokens);
}

std::vector<size_t> Engine::matchAllAt(size_t tokenIndex, const std::vector<std::string>& tokens) const {
    if (!loaded_ || tokenIndex >= tokens.size()) {
        return {};
    }
    return matcher_->matchAllAt(tokenIndex, tokens);
}

Settings Engine::settingsPrunedOf(const std::vector<std::string>& productions) const {
    std::set<std::string> removed(productions.begin(), productions.end());

    Settings settings;
    settings.tokens = tokens_;
    settings.whitespace = whitespace_;
    settings.onmatchRules = onmatchRules_;
    settings.metadata = metadata_;
    for (const auto& rule : rules_) {
        if (!removed.count(rule.production)) {
            settings.rules.push_back(rule);
        }
    }
    return settings;
}

BuildOptions Engine::buildOptions() const {
    BuildOptions options(ignoreErrors_, checkAmbiguity_);
    options.version = version_;
    return options;
}

bool Engine::checkForAmbiguity() const {
    AmbiguityChecker checker(tokens_, tokensByClass_);
    return checker.check(rules_);
}

} // namespace graphtransliterator
