#include <graphtransliterator/graphtransliterator.h>
#include <graphtransliterator/engine.h>
#include "../utils/debug.h"
#include "../utils/version.h"
#include <set>

namespace graphtransliterator {

GraphTransliterator::GraphTransliterator(ConstructionKey, std::unique_ptr<Engine> engine)
    : engine_(std::move(engine)) {
}

GraphTransliterator::~GraphTransliterator() = default;

GraphTransliterator::GraphTransliterator(GraphTransliterator&&) noexcept = default;
GraphTransliterator& GraphTransliterator::operator=(GraphTransliterator&&) noexcept = default;

Result GraphTransliterator::build(const Settings& settings, const BuildOptions& options,
                                  std::unique_ptr<GraphTransliterator>& out) {
    auto engine = std::make_unique<Engine>();
    Result result = engine->load(settings, options);
    if (result != Result::Success) {
        utils::debugLog("Build failed: " + resultToString(result));
        return result;
    }
    out = std::make_unique<GraphTransliterator>(ConstructionKey(), std::move(engine));
    return Result::Success;
}

Result GraphTransliterator::build(const Settings& settings, std::unique_ptr<GraphTransliterator>& out) {
    return build(settings, BuildOptions(), out);
}

Result GraphTransliterator::loadFromFile(const std::string& path,
                                         std::unique_ptr<GraphTransliterator>& out) {
    auto engine = std::make_unique<Engine>();
    Result result = engine->loadFromPath(path);
    if (result != Result::Success) {
        return result;
    }
    out = std::make_unique<GraphTransliterator>(ConstructionKey(), std::move(engine));
    return Result::Success;
}

Result GraphTransliterator::loadFromMemory(const uint8_t* data, size_t dataLen,
                                           std::unique_ptr<GraphTransliterator>& out) {
    if (!data || dataLen == 0) {
        return Result::ErrorInvalidParameter;
    }
    auto engine = std::make_unique<Engine>();
    Result result = engine->loadFromMemory(data, dataLen);
    if (result != Result::Success) {
        return result;
    }
    out = std::make_unique<GraphTransliterator>(ConstructionKey(), std::move(engine));
    return Result::Success;
}

Result GraphTransliterator::load(std::unique_ptr<TransliteratorFile> file,
                                 std::unique_ptr<GraphTransliterator>& out) {
    auto engine = std::make_unique<Engine>();
    Result result = engine->load(std::move(file));
    if (result != Result::Success) {
        return result;
    }
    out = std::make_unique<GraphTransliterator>(ConstructionKey(), std::move(engine));
    return Result::Success;
}

std::unique_ptr<TransliteratorFile> GraphTransliterator::dump() const {
    return engine_->toFile();
}

std::vector<uint8_t> GraphTransliterator::dumpBytes() const {
    auto file = dump();
    if (!file) {
        return {};
    }
    return GtbWriter::write(*file);
}

Result GraphTransliterator::saveToFile(const std::string& path) const {
    auto file = dump();
    if (!file) {
        return Result::ErrorInvalidHandle;
    }
    return GtbWriter::writeToFile(*file, path) ? Result::Success : Result::ErrorFileNotFound;
}

Result GraphTransliterator::tokenize(const std::string& input, std::vector<std::string>& tokens) const {
    return engine_->tokenize(input, tokens);
}

Result GraphTransliterator::transliterate(const std::string& input, std::string& output) {
    return engine_->transliterate(input, output);
}

Result GraphTransliterator::transliterate(const std::string& input, TransliterationResult& result) const {
    return engine_->transliterate(input, result);
}

std::optional<size_t> GraphTransliterator::matchAt(size_t tokenIndex,
                                                   const std::vector<std::string>& tokens) const {
    return engine_->matchAt(tokenIndex, tokens);
}

std::vector<size_t> GraphTransliterator::matchAllAt(size_t tokenIndex,
                                                    const std::vector<std::string>& tokens) const {
    return engine_->matchAllAt(tokenIndex, tokens);
}

Result GraphTransliterator::prunedOf(const std::vector<std::string>& productions,
                                     std::unique_ptr<GraphTransliterator>& out) const {
    return build(engine_->settingsPrunedOf(productions), engine_->buildOptions(), out);
}

Result GraphTransliterator::prunedOf(const std::string& production,
                                     std::unique_ptr<GraphTransliterator>& out) const {
    return prunedOf(std::vector<std::string>{production}, out);
}

bool GraphTransliterator::ignoreErrors() const {
    return engine_->ignoresErrors();
}

void GraphTransliterator::setIgnoreErrors(bool ignore) {
    engine_->setIgnoreErrors(ignore);
}

const std::vector<TransliterationRule>& GraphTransliterator::rules() const {
    return engine_->getRules();
}

std::vector<std::string> GraphTransliterator::tokens() const {
    std::vector<std::string> out;
    out.reserve(engine_->getTokens().size());
    for (const auto& def : engine_->getTokens()) {
        out.push_back(def.token);
    }
    return out;
}

const std::set<std::string>* GraphTransliterator::tokenClasses(const std::string& token) const {
    const auto& classes = engine_->getTokenClasses();
    auto it = classes.find(token);
    return it != classes.end() ? &it->second : nullptr;
}

const TokensByClass& GraphTransliterator::tokensByClass() const {
    return engine_->getTokensByClass();
}

std::vector<std::string> GraphTransliterator::productions() const {
    std::vector<std::string> out;
    out.reserve(engine_->getRules().size());
    for (const auto& rule : engine_->getRules()) {
        out.push_back(rule.production);
    }
    return out;
}

const WhitespaceSettings& GraphTransliterator::whitespace() const {
    return engine_->getWhitespace();
}

const std::vector<OnMatchRule>& GraphTransliterator::onmatchRules() const {
    return engine_->getOnMatchRules();
}

const OnMatchIndex& GraphTransliterator::onmatchLookup() const {
    return engine_->getOnMatchLookup();
}

const std::map<std::string, std::string>& GraphTransliterator::metadata() const {
    return engine_->getMetadata();
}

const MatchingGraph& GraphTransliterator::graph() const {
    return engine_->getGraph();
}

const std::string& GraphTransliterator::tokenizerPattern() const {
    return engine_->getTokenizerPattern();
}

const std::string& GraphTransliterator::version() const {
    return engine_->getVersion();
}

const std::vector<size_t>& GraphTransliterator::lastMatchedRuleKeys() const {
    return engine_->getState().getRuleKeys();
}

std::vector<TransliterationRule> GraphTransliterator::lastMatchedRules() const {
    std::vector<TransliterationRule> out;
    for (size_t key : lastMatchedRuleKeys()) {
        out.push_back(engine_->getRules()[key]);
    }
    return out;
}

std::vector<std::vector<std::string>> GraphTransliterator::lastMatchedRuleTokens() const {
    std::vector<std::vector<std::string>> out;
    for (size_t key : lastMatchedRuleKeys()) {
        out.push_back(engine_->getRules()[key].tokens);
    }
    return out;
}

const std::vector<std::string>& GraphTransliterator::lastInputTokens() const {
    return engine_->getState().getInputTokens();
}

std::string GraphTransliterator::getVersion() {
    return GRAPHTRANSLITERATOR_VERSION;
}

} // namespace graphtransliterator
