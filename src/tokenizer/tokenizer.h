#ifndef GRAPHTRANSLITERATOR_TOKENIZER_H
#define GRAPHTRANSLITERATOR_TOKENIZER_H

#include <graphtransliterator/types.h>
#include <regex>
#include <string>
#include <vector>

namespace graphtransliterator {

// Splits input into declared tokens with a precompiled alternation pattern.
// Holds references only; the class map and whitespace settings must outlive it.
class Tokenizer {
public:
    Tokenizer(const TokenClassMap& tokenClasses, const WhitespaceSettings& whitespace);
    ~Tokenizer();

    // "(tok1|tok2|...)", longest token first, ties in declaration order
    static std::string buildPattern(const std::vector<TokenDefinition>& tokens);

    // Escapes regular expression metacharacters
    static std::string escape(const std::string& token);

    Result compile(const std::string& pattern);
    bool isCompiled() const { return compiled_; }

    // Tokens of `input` between two default whitespace tokens
    Result tokenize(const std::string& input, bool ignoreErrors,
                    std::vector<std::string>& tokens) const;

    bool isWhitespace(const std::string& token) const;

private:
    const TokenClassMap& tokenClasses_;
    const WhitespaceSettings& whitespace_;
    std::regex pattern_;
    bool compiled_;
};

} // namespace graphtransliterator

#endif // GRAPHTRANSLITERATOR_TOKENIZER_H
