#ifndef GRAPHTRANSLITERATOR_H
#define GRAPHTRANSLITERATOR_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
#include "types.h"
#include "graph.h"
#include "gtb_format.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#endif

// Export/import macros for shared library
#ifdef _WIN32
    #ifdef GRAPHTRANSLITERATOR_EXPORTS
        #define GRAPHTRANSLITERATOR_API __declspec(dllexport)
    #elif defined(GRAPHTRANSLITERATOR_IMPORTS)
        #define GRAPHTRANSLITERATOR_API __declspec(dllimport)
    #else
        #define GRAPHTRANSLITERATOR_API
    #endif
#else
    #define GRAPHTRANSLITERATOR_API __attribute__((visibility("default")))
#endif

// C API compatibility - wrap in extern "C" when included from C++
#ifdef __cplusplus
extern "C" {
#endif

// Opaque handle to a transliterator (for C API)
typedef struct GraphTransliteratorHandle GraphTransliteratorHandle;

// Result codes (C-compatible)
typedef enum {
    GraphTransliteratorResult_Success = 0,
    GraphTransliteratorResult_ErrorInvalidHandle = -1,
    GraphTransliteratorResult_ErrorInvalidParameter = -2,
    GraphTransliteratorResult_ErrorInvalidSettings = -3,
    GraphTransliteratorResult_ErrorAmbiguousRules = -4,
    GraphTransliteratorResult_ErrorUnrecognizableInputToken = -5,
    GraphTransliteratorResult_ErrorNoMatchingRule = -6,
    GraphTransliteratorResult_ErrorFileNotFound = -7,
    GraphTransliteratorResult_ErrorInvalidFormat = -8
} GraphTransliteratorResult;

// ============================================================================
// C API Functions
// ============================================================================

// Loading (from GTB files written by GraphTransliterator::saveToFile)
GRAPHTRANSLITERATOR_API GraphTransliteratorHandle* graphtransliterator_load(const char* gtb_path);
GRAPHTRANSLITERATOR_API GraphTransliteratorHandle* graphtransliterator_load_from_memory(
    const uint8_t* gtb_data,
    size_t data_len
);
GRAPHTRANSLITERATOR_API void graphtransliterator_free(GraphTransliteratorHandle* handle);

// Transliteration. On success *output receives a string to release with
// graphtransliterator_free_string.
GRAPHTRANSLITERATOR_API GraphTransliteratorResult graphtransliterator_transliterate(
    GraphTransliteratorHandle* handle,
    const char* input,
    char** output
);

// Settings
GRAPHTRANSLITERATOR_API GraphTransliteratorResult graphtransliterator_set_ignore_errors(
    GraphTransliteratorHandle* handle,
    int ignore_errors
);

// Introspection
GRAPHTRANSLITERATOR_API size_t graphtransliterator_rule_count(GraphTransliteratorHandle* handle);
GRAPHTRANSLITERATOR_API char* graphtransliterator_get_metadata(
    GraphTransliteratorHandle* handle,
    const char* key
);

// Memory management
GRAPHTRANSLITERATOR_API void graphtransliterator_free_string(char* s);

// Version info
GRAPHTRANSLITERATOR_API const char* graphtransliterator_get_version(void);

#ifdef __cplusplus
}
#endif

// ============================================================================
// C++ API
// ============================================================================

#ifdef __cplusplus

namespace graphtransliterator {

class Engine;

// Transliterates token sequences with context-sensitive rules.
//
// Rules are ordered by cost; the cheapest rule matching at a position wins.
// An instance is immutable after building apart from the ignore-errors flag
// and the record of the last transliterate() call. Share one instance across
// threads only through the const transliterate() overload.
class GRAPHTRANSLITERATOR_API GraphTransliterator {
    // Only the factories below can name this
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    GraphTransliterator(ConstructionKey, std::unique_ptr<Engine> engine);
    ~GraphTransliterator();

    // Disable copy, enable move
    GraphTransliterator(const GraphTransliterator&) = delete;
    GraphTransliterator& operator=(const GraphTransliterator&) = delete;
    GraphTransliterator(GraphTransliterator&&) noexcept;
    GraphTransliterator& operator=(GraphTransliterator&&) noexcept;

    // Construction
    static Result build(const Settings& settings, const BuildOptions& options,
                        std::unique_ptr<GraphTransliterator>& out);
    static Result build(const Settings& settings, std::unique_ptr<GraphTransliterator>& out);
    static Result loadFromFile(const std::string& path, std::unique_ptr<GraphTransliterator>& out);
    static Result loadFromMemory(const uint8_t* data, size_t dataLen,
                                 std::unique_ptr<GraphTransliterator>& out);
    static Result load(std::unique_ptr<TransliteratorFile> file,
                       std::unique_ptr<GraphTransliterator>& out);

    // Serialization
    std::unique_ptr<TransliteratorFile> dump() const;
    std::vector<uint8_t> dumpBytes() const;
    Result saveToFile(const std::string& path) const;

    // Processing
    Result tokenize(const std::string& input, std::vector<std::string>& tokens) const;
    Result transliterate(const std::string& input, std::string& output);
    Result transliterate(const std::string& input, TransliterationResult& result) const;

    // Best rule key at `tokenIndex` of sentinel-bounded `tokens`
    std::optional<size_t> matchAt(size_t tokenIndex, const std::vector<std::string>& tokens) const;

    // All matching rule keys, cheapest first
    std::vector<size_t> matchAllAt(size_t tokenIndex, const std::vector<std::string>& tokens) const;

    // New transliterator without rules producing any of `productions`
    Result prunedOf(const std::vector<std::string>& productions,
                    std::unique_ptr<GraphTransliterator>& out) const;
    Result prunedOf(const std::string& production, std::unique_ptr<GraphTransliterator>& out) const;

    // Settings
    bool ignoreErrors() const;
    void setIgnoreErrors(bool ignore);

    // Accessors
    const std::vector<TransliterationRule>& rules() const;
    std::vector<std::string> tokens() const;
    const std::set<std::string>* tokenClasses(const std::string& token) const;
    const TokensByClass& tokensByClass() const;
    std::vector<std::string> productions() const;   // One per rule, in rule order
    const WhitespaceSettings& whitespace() const;
    const std::vector<OnMatchRule>& onmatchRules() const;
    const OnMatchIndex& onmatchLookup() const;
    const std::map<std::string, std::string>& metadata() const;
    const MatchingGraph& graph() const;
    const std::string& tokenizerPattern() const;
    const std::string& version() const;

    // Last transliterate() call on this instance
    const std::vector<size_t>& lastMatchedRuleKeys() const;
    std::vector<TransliterationRule> lastMatchedRules() const;
    std::vector<std::vector<std::string>> lastMatchedRuleTokens() const;
    const std::vector<std::string>& lastInputTokens() const;

    // Version
    static std::string getVersion();

private:
    std::unique_ptr<Engine> engine_;
};

// GTB file loader class
class GRAPHTRANSLITERATOR_API GtbLoader {
public:
    // Load from file
    static std::unique_ptr<TransliteratorFile> loadFromFile(const std::string& path);

    // Load from memory
    static std::unique_ptr<TransliteratorFile> loadFromMemory(const uint8_t* data, size_t dataLen);

    // Validate file without keeping it
    static bool validateFile(const std::string& path);
    static bool validateMemory(const uint8_t* data, size_t dataLen);
};

// GTB file writer class
class GRAPHTRANSLITERATOR_API GtbWriter {
public:
    static std::vector<uint8_t> write(const TransliteratorFile& file);
    static bool writeToFile(const TransliteratorFile& file, const std::string& path);
};

} // namespace graphtransliterator

#endif // __cplusplus

#endif // GRAPHTRANSLITERATOR_H
