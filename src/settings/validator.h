#ifndef GRAPHTRANSLITERATOR_SETTINGS_VALIDATOR_H
#define GRAPHTRANSLITERATOR_SETTINGS_VALIDATOR_H

#include <graphtransliterator/types.h>
#include <string>
#include <vector>

namespace graphtransliterator {

struct SettingsError {
    std::string section;    // "tokens", "rules", "onmatch_rules" or "whitespace"
    std::string message;

    SettingsError(const std::string& s, const std::string& m) : section(s), message(m) {}
};

class SettingsValidator {
public:
    // Returns false and fills `errors` when the settings cannot be built
    static bool validate(const Settings& settings, std::vector<SettingsError>& errors);

private:
    static void validateTokens(const Settings& settings, std::vector<SettingsError>& errors);
    static void validateRules(const Settings& settings, std::vector<SettingsError>& errors);
    static void validateOnMatchRules(const Settings& settings, std::vector<SettingsError>& errors);
    static void validateWhitespace(const Settings& settings, std::vector<SettingsError>& errors);
};

} // namespace graphtransliterator

#endif // GRAPHTRANSLITERATOR_SETTINGS_VALIDATOR_H
