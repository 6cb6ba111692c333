#ifndef GRAPHTRANSLITERATOR_GTB_FORMAT_H
#define GRAPHTRANSLITERATOR_GTB_FORMAT_H

#include "types.h"
#include "graph.h"
#include <cstdint>
#include <string>
#include <vector>

namespace graphtransliterator {

// GTB (graph transliterator binary) magic code
constexpr char GTB_MAGIC_CODE[4] = {'G', 'T', 'R', 'L'};

constexpr uint8_t GTB_MAJOR_VERSION = 1;
constexpr uint8_t GTB_MINOR_VERSION = 0;

// Header flags
constexpr uint8_t GTB_FLAG_CONSOLIDATE = 0x01;
constexpr uint8_t GTB_FLAG_IGNORE_ERRORS = 0x02;

// Child-list key used for rule children in the node section
constexpr uint32_t GTB_RULES_KEY = 0xFFFFFFFF;

// Pack structures to match binary format exactly
#pragma pack(push, 1)

struct GtbFileHeader {
    uint8_t magicCode[4];     // "GTRL"
    uint8_t majorVersion;     // 1
    uint8_t minorVersion;     // 0
    uint8_t flags;            // GTB_FLAG_*
    uint8_t reserved;
    uint32_t stringCount;     // Little-endian
    uint32_t tokenCount;
    uint32_t ruleCount;
    uint32_t onmatchCount;
    uint32_t lookupCount;     // (boundary token, preceding token) entries
    uint32_t nodeCount;
    uint32_t metadataCount;

    GtbFileHeader()
        : majorVersion(GTB_MAJOR_VERSION)
        , minorVersion(GTB_MINOR_VERSION)
        , flags(0)
        , reserved(0)
        , stringCount(0)
        , tokenCount(0)
        , ruleCount(0)
        , onmatchCount(0)
        , lookupCount(0)
        , nodeCount(0)
        , metadataCount(0) {
        for (int i = 0; i < 4; ++i) {
            magicCode[i] = static_cast<uint8_t>(GTB_MAGIC_CODE[i]);
        }
    }

    bool isValid() const {
        return magicCode[0] == 'G' &&
               magicCode[1] == 'T' &&
               magicCode[2] == 'R' &&
               magicCode[3] == 'L';
    }

    bool isCompatibleVersion() const {
        return majorVersion == GTB_MAJOR_VERSION && minorVersion <= GTB_MINOR_VERSION;
    }
};

#pragma pack(pop)

// Complete serialized state of a transliterator
class TransliteratorFile {
public:
    TransliteratorFile() = default;

    GtbFileHeader header;

    std::string version;            // Library version that built the rules
    std::string tokenizerPattern;

    // Tokens, rules (sorted, with costs), whitespace, on-match rules, metadata
    Settings settings;

    MatchingGraph graph;
    OnMatchIndex onmatchLookup;

    bool isValid() const {
        return header.isValid() && header.isCompatibleVersion();
    }

    bool consolidatesWhitespace() const { return (header.flags & GTB_FLAG_CONSOLIDATE) != 0; }
    bool ignoresErrors() const { return (header.flags & GTB_FLAG_IGNORE_ERRORS) != 0; }
};

} // namespace graphtransliterator

#endif // GRAPHTRANSLITERATOR_GTB_FORMAT_H
