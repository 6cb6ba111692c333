#ifndef GRAPHTRANSLITERATOR_DEBUG_H
#define GRAPHTRANSLITERATOR_DEBUG_H

#include <string>
#include <cstdint>

namespace graphtransliterator {
namespace utils {

// Debug logging (only active in debug builds)
void debugLog(const std::string& message);

// Warnings go to stderr unless disabled
void warningLog(const std::string& message);
void setWarningsEnabled(bool enabled);
bool warningsEnabled();

// Hex dump for binary data debugging
std::string hexDump(const uint8_t* data, size_t length);

} // namespace utils
} // namespace graphtransliterator

#endif // GRAPHTRANSLITERATOR_DEBUG_H
