#include "debug.h"
#include <atomic>
#include <iostream>
#include <sstream>
#include <iomanip>

namespace graphtransliterator {
namespace utils {

namespace {
std::atomic<bool> g_warningsEnabled{true};
}

void debugLog(const std::string& message) {
#ifdef GRAPHTRANSLITERATOR_DEBUG
    std::cerr << "[GraphTransliterator] " << message << std::endl;
#else
    (void)message;
#endif
}

void warningLog(const std::string& message) {
    if (g_warningsEnabled.load()) {
        std::cerr << "[GraphTransliterator] WARNING: " << message << std::endl;
    }
}

void setWarningsEnabled(bool enabled) {
    g_warningsEnabled.store(enabled);
}

bool warningsEnabled() {
    return g_warningsEnabled.load();
}

std::string hexDump(const uint8_t* data, size_t length) {
    std::stringstream ss;
    
    for (size_t i = 0; i < length; i += 16) {
        // Offset
        ss << std::setfill('0') << std::setw(8) << std::hex << i << "  ";
        
        for (size_t j = 0; j < 16; ++j) {
            if (i + j < length) {
                ss << std::setfill('0') << std::setw(2) << std::hex 
                   << static_cast<int>(data[i + j]) << " ";
            } else {
                ss << "   ";
            }
            if (j == 7) ss << " ";
        }
        
        ss << " |";
        
        for (size_t j = 0; j < 16 && i + j < length; ++j) {
            uint8_t byte = data[i + j];
            ss << ((byte >= 32 && byte <= 126) ? static_cast<char>(byte) : '.');
        }
        
        ss << "|" << std::endl;
    }
    
    return ss.str();
}

} // namespace utils
} // namespace graphtransliterator
