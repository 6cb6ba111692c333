#ifndef GRAPHTRANSLITERATOR_UTF8_H
#define GRAPHTRANSLITERATOR_UTF8_H

#include <string>
#include <cstdint>

namespace graphtransliterator {
namespace utils {

// Decodes the code point at `offset`; invalid bytes give U+FFFD and consume 1
char32_t utf8ToChar32(const std::string& utf8, size_t offset, size_t& bytesConsumed);

bool isValidUtf8(const std::string& utf8);

// "U+0061" style name of a code point
std::string codepointName(char32_t codepoint);

// Helper to check for the whitespace characters recognized in rule notation
inline bool isAsciiWhitespace(char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

} // namespace utils
} // namespace graphtransliterator

#endif // GRAPHTRANSLITERATOR_UTF8_H
