#include "utf8.h"
#include <cstdio>

namespace graphtransliterator {
namespace utils {

namespace {

size_t leadByteLength(uint8_t byte) {
    if (byte <= 0x7F) return 1;
    if ((byte & 0xE0) == 0xC0) return 2;
    if ((byte & 0xF0) == 0xE0) return 3;
    if ((byte & 0xF8) == 0xF0) return 4;
    return 0;
}

} // namespace

char32_t utf8ToChar32(const std::string& utf8, size_t offset, size_t& bytesConsumed) {
    bytesConsumed = 0;
    
    if (offset >= utf8.size()) {
        return 0;
    }
    
    uint8_t byte1 = static_cast<uint8_t>(utf8[offset]);
    size_t length = leadByteLength(byte1);
    
    if (length == 1) {
        bytesConsumed = 1;
        return byte1;
    }
    
    if (length > 1 && offset + length <= utf8.size()) {
        char32_t codepoint = byte1 & (0xFF >> (length + 1));
        bool valid = true;
        for (size_t i = 1; i < length; ++i) {
            uint8_t cont = static_cast<uint8_t>(utf8[offset + i]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            codepoint = (codepoint << 6) | (cont & 0x3F);
        }
        if (valid) {
            bytesConsumed = length;
            return codepoint;
        }
    }
    
    // Invalid UTF-8 sequence
    bytesConsumed = 1;  // Skip the invalid byte
    return 0xFFFD;  // Replacement character
}

bool isValidUtf8(const std::string& utf8) {
    size_t i = 0;
    
    while (i < utf8.size()) {
        size_t sequenceLength = leadByteLength(static_cast<uint8_t>(utf8[i]));
        if (sequenceLength == 0) {
            return false;  // Invalid first byte
        }
        
        if (i + sequenceLength > utf8.size()) {
            return false;
        }
        
        for (size_t j = 1; j < sequenceLength; j++) {
            uint8_t contByte = static_cast<uint8_t>(utf8[i + j]);
            if ((contByte & 0xC0) != 0x80) {
                return false;  // Invalid continuation byte
            }
        }
        
        i += sequenceLength;
    }
    
    return true;
}

std::string codepointName(char32_t codepoint) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "U+%04X", static_cast<unsigned int>(codepoint));
    return buffer;
}

} // namespace utils
} // namespace graphtransliterator
