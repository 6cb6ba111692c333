#include "tokenizer.h"
#include "../utils/debug.h"
#include "../utils/utf8.h"
#include <algorithm>

namespace graphtransliterator {

Tokenizer::Tokenizer(const TokenClassMap& tokenClasses, const WhitespaceSettings& whitespace)
    : tokenClasses_(tokenClasses)
    , whitespace_(whitespace)
    , compiled_(false) {
}

Tokenizer::~Tokenizer() = default;

std::string Tokenizer::escape(const std::string& token) {
    static const std::string special = "\\^$.|?*+()[]{}";
    std::string escaped;
    escaped.reserve(token.size() * 2);
    for (char ch : token) {
        if (special.find(ch) != std::string::npos) {
            escaped.push_back('\\');
        }
        escaped.push_back(ch);
    }
    return escaped;
}

std::string Tokenizer::buildPattern(const std::vector<TokenDefinition>& tokens) {
    std::vector<std::string> sorted;
    sorted.reserve(tokens.size());
    for (const auto& def : tokens) {
        sorted.push_back(def.token);
    }

    // Longer tokens first so no token is shadowed by one of its prefixes
    std::stable_sort(sorted.begin(), sorted.end(), [](const std::string& a, const std::string& b) {
        return a.size() > b.size();
    });

    std::string pattern = "(";
    for (size_t i = 0; i < sorted.size(); ++i) {
        if (i > 0) {
            pattern += "|";
        }
        pattern += escape(sorted[i]);
    }
    pattern += ")";
    return pattern;
}

Result Tokenizer::compile(const std::string& pattern) {
    try {
        pattern_ = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        utils::warningLog("Invalid tokenizer pattern: " + std::string(e.what()));
        compiled_ = false;
        return Result::ErrorInvalidFormat;
    }
    compiled_ = true;
    return Result::Success;
}

bool Tokenizer::isWhitespace(const std::string& token) const {
    auto it = tokenClasses_.find(token);
    return it != tokenClasses_.end() && it->second.count(whitespace_.tokenClass) > 0;
}

Result Tokenizer::tokenize(const std::string& input, bool ignoreErrors,
                           std::vector<std::string>& tokens) const {
    tokens.clear();
    if (!compiled_) {
        return Result::ErrorInvalidHandle;
    }

    tokens.push_back(whitespace_.defaultToken);
    bool prevWhitespace = true;

    size_t pos = 0;
    while (pos < input.size()) {
        std::smatch match;
        auto flags = std::regex_constants::match_continuous;
        if (pos > 0) {
            flags |= std::regex_constants::match_prev_avail;
        }

        bool found = std::regex_search(input.begin() + static_cast<std::ptrdiff_t>(pos),
                                       input.end(), match, pattern_, flags) &&
                     match.length(0) > 0;
        if (found) {
            std::string token = match.str(0);
            pos += token.size();

            if (isWhitespace(token)) {
                if (prevWhitespace && whitespace_.consolidate) {
                    continue;
                }
                prevWhitespace = true;
            } else {
                prevWhitespace = false;
            }
            tokens.push_back(token);
            continue;
        }

        size_t consumed = 0;
        char32_t codepoint = utils::utf8ToChar32(input, pos, consumed);
        utils::warningLog("Unrecognizable token " + utils::codepointName(codepoint) +
                          " at pos " + std::to_string(pos) + " of \"" + input + "\"");
        if (!ignoreErrors) {
            tokens.clear();
            return Result::ErrorUnrecognizableInputToken;
        }
        pos += consumed;
    }

    if (whitespace_.consolidate) {
        while (tokens.size() > 1 && isWhitespace(tokens.back())) {
            tokens.pop_back();
        }
    }
    tokens.push_back(whitespace_.defaultToken);

    return Result::Success;
}

} // namespace graphtransliterator
