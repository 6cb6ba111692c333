#include "validator.h"
#include "../utils/utf8.h"
#include <set>

namespace graphtransliterator {

namespace {

std::set<std::string> declaredTokens(const Settings& settings) {
    std::set<std::string> tokens;
    for (const auto& def : settings.tokens) {
        tokens.insert(def.token);
    }
    return tokens;
}

std::set<std::string> declaredClasses(const Settings& settings) {
    std::set<std::string> classes;
    for (const auto& def : settings.tokens) {
        classes.insert(def.classes.begin(), def.classes.end());
    }
    return classes;
}

void checkTokens(const std::vector<std::string>& values, const std::set<std::string>& known,
                 const std::string& where, std::vector<SettingsError>& errors) {
    for (const auto& value : values) {
        if (!known.count(value)) {
            errors.emplace_back("rules", "Unknown token \"" + value + "\" in " + where);
        }
    }
}

void checkClasses(const std::vector<std::string>& values, const std::set<std::string>& known,
                  const std::string& section, const std::string& where,
                  std::vector<SettingsError>& errors) {
    for (const auto& value : values) {
        if (!known.count(value)) {
            errors.emplace_back(section, "Unknown class \"" + value + "\" in " + where);
        }
    }
}

} // namespace

bool SettingsValidator::validate(const Settings& settings, std::vector<SettingsError>& errors) {
    errors.clear();

    validateTokens(settings, errors);
    validateRules(settings, errors);
    validateOnMatchRules(settings, errors);
    validateWhitespace(settings, errors);

    return errors.empty();
}

void SettingsValidator::validateTokens(const Settings& settings, std::vector<SettingsError>& errors) {
    if (settings.tokens.empty()) {
        errors.emplace_back("tokens", "No tokens declared");
        return;
    }

    std::set<std::string> seen;
    for (const auto& def : settings.tokens) {
        if (def.token.empty()) {
            errors.emplace_back("tokens", "Empty token");
            continue;
        }
        if (!utils::isValidUtf8(def.token)) {
            errors.emplace_back("tokens", "Token is not valid UTF-8");
        }
        if (!seen.insert(def.token).second) {
            errors.emplace_back("tokens", "Token \"" + def.token + "\" declared twice");
        }
    }
}

void SettingsValidator::validateRules(const Settings& settings, std::vector<SettingsError>& errors) {
    const auto tokens = declaredTokens(settings);
    const auto classes = declaredClasses(settings);

    for (size_t i = 0; i < settings.rules.size(); ++i) {
        const auto& rule = settings.rules[i];
        const std::string where = "rule " + std::to_string(i);

        if (rule.tokens.empty()) {
            errors.emplace_back("rules", "No tokens to match in " + where);
        }
        checkTokens(rule.tokens, tokens, where, errors);
        checkTokens(rule.prevTokens, tokens, where, errors);
        checkTokens(rule.nextTokens, tokens, where, errors);
        checkClasses(rule.prevClasses, classes, "rules", where, errors);
        checkClasses(rule.nextClasses, classes, "rules", where, errors);
    }
}

void SettingsValidator::validateOnMatchRules(const Settings& settings,
                                             std::vector<SettingsError>& errors) {
    const auto classes = declaredClasses(settings);

    for (size_t i = 0; i < settings.onmatchRules.size(); ++i) {
        const auto& rule = settings.onmatchRules[i];
        const std::string where = "on-match rule " + std::to_string(i);

        if (rule.prevClasses.empty()) {
            errors.emplace_back("onmatch_rules", "No preceding classes in " + where);
        }
        if (rule.nextClasses.empty()) {
            errors.emplace_back("onmatch_rules", "No following classes in " + where);
        }
        checkClasses(rule.prevClasses, classes, "onmatch_rules", where, errors);
        checkClasses(rule.nextClasses, classes, "onmatch_rules", where, errors);
    }
}

void SettingsValidator::validateWhitespace(const Settings& settings,
                                           std::vector<SettingsError>& errors) {
    const auto& whitespace = settings.whitespace;

    if (!declaredTokens(settings).count(whitespace.defaultToken)) {
        errors.emplace_back("whitespace",
                            "Default whitespace token \"" + whitespace.defaultToken + "\" not declared");
    }
    if (!declaredClasses(settings).count(whitespace.tokenClass)) {
        errors.emplace_back("whitespace",
                            "Whitespace class \"" + whitespace.tokenClass + "\" not attached to any token");
    }
}

} // namespace graphtransliterator
