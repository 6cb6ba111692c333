#include <graphtransliterator/graphtransliterator.h>
#include <graphtransliterator/engine.h>
#include "../utils/version.h"
#include <cstring>
#include <mutex>
#include <unordered_map>

namespace {
std::mutex g_handleMutex;
std::unordered_map<GraphTransliteratorHandle*, std::unique_ptr<graphtransliterator::Engine>> g_engines;

char* allocateAndCopyString(const std::string& str) {
    char* result = new char[str.length() + 1];
    std::memcpy(result, str.c_str(), str.length() + 1);
    return result;
}

GraphTransliteratorResult toCResult(graphtransliterator::Result result) {
    using graphtransliterator::Result;
    switch (result) {
        case Result::Success:
            return GraphTransliteratorResult_Success;
        case Result::ErrorInvalidHandle:
            return GraphTransliteratorResult_ErrorInvalidHandle;
        case Result::ErrorInvalidParameter:
            return GraphTransliteratorResult_ErrorInvalidParameter;
        case Result::ErrorInvalidSettings:
            return GraphTransliteratorResult_ErrorInvalidSettings;
        case Result::ErrorAmbiguousRules:
            return GraphTransliteratorResult_ErrorAmbiguousRules;
        case Result::ErrorUnrecognizableInputToken:
            return GraphTransliteratorResult_ErrorUnrecognizableInputToken;
        case Result::ErrorNoMatchingRule:
            return GraphTransliteratorResult_ErrorNoMatchingRule;
        case Result::ErrorFileNotFound:
            return GraphTransliteratorResult_ErrorFileNotFound;
        case Result::ErrorInvalidFormat:
        default:
            return GraphTransliteratorResult_ErrorInvalidFormat;
    }
}

GraphTransliteratorHandle* registerEngine(std::unique_ptr<graphtransliterator::Engine> engine) {
    auto handle = reinterpret_cast<GraphTransliteratorHandle*>(engine.get());
    
    std::lock_guard<std::mutex> lock(g_handleMutex);
    g_engines[handle] = std::move(engine);
    
    return handle;
}

} // anonymous namespace

extern "C" {

// Loading
GRAPHTRANSLITERATOR_API GraphTransliteratorHandle* graphtransliterator_load(const char* gtb_path) {
    if (!gtb_path) {
        return nullptr;
    }
    
    auto engine = std::make_unique<graphtransliterator::Engine>();
    if (engine->loadFromPath(gtb_path) != graphtransliterator::Result::Success) {
        return nullptr;
    }
    
    return registerEngine(std::move(engine));
}

GRAPHTRANSLITERATOR_API GraphTransliteratorHandle* graphtransliterator_load_from_memory(
    const uint8_t* gtb_data,
    size_t data_len
) {
    if (!gtb_data || data_len == 0) {
        return nullptr;
    }
    
    auto engine = std::make_unique<graphtransliterator::Engine>();
    if (engine->loadFromMemory(gtb_data, data_len) != graphtransliterator::Result::Success) {
        return nullptr;
    }
    
    return registerEngine(std::move(engine));
}

GRAPHTRANSLITERATOR_API void graphtransliterator_free(GraphTransliteratorHandle* handle) {
    if (!handle) return;
    
    std::lock_guard<std::mutex> lock(g_handleMutex);
    g_engines.erase(handle);
}

// Transliteration
GRAPHTRANSLITERATOR_API GraphTransliteratorResult graphtransliterator_transliterate(
    GraphTransliteratorHandle* handle,
    const char* input,
    char** output
) {
    if (!handle || !input || !output) {
        return GraphTransliteratorResult_ErrorInvalidParameter;
    }
    *output = nullptr;
    
    std::lock_guard<std::mutex> lock(g_handleMutex);
    auto it = g_engines.find(handle);
    if (it == g_engines.end()) {
        return GraphTransliteratorResult_ErrorInvalidHandle;
    }
    
    std::string result;
    auto status = it->second->transliterate(input, result);
    if (status != graphtransliterator::Result::Success) {
        return toCResult(status);
    }
    
    *output = allocateAndCopyString(result);
    return GraphTransliteratorResult_Success;
}

// Settings
GRAPHTRANSLITERATOR_API GraphTransliteratorResult graphtransliterator_set_ignore_errors(
    GraphTransliteratorHandle* handle,
    int ignore_errors
) {
    if (!handle) {
        return GraphTransliteratorResult_ErrorInvalidParameter;
    }
    
    std::lock_guard<std::mutex> lock(g_handleMutex);
    auto it = g_engines.find(handle);
    if (it == g_engines.end()) {
        return GraphTransliteratorResult_ErrorInvalidHandle;
    }
    
    it->second->setIgnoreErrors(ignore_errors != 0);
    return GraphTransliteratorResult_Success;
}

// Introspection
GRAPHTRANSLITERATOR_API size_t graphtransliterator_rule_count(GraphTransliteratorHandle* handle) {
    if (!handle) return 0;
    
    std::lock_guard<std::mutex> lock(g_handleMutex);
    auto it = g_engines.find(handle);
    if (it == g_engines.end()) {
        return 0;
    }
    
    return it->second->getRules().size();
}

GRAPHTRANSLITERATOR_API char* graphtransliterator_get_metadata(
    GraphTransliteratorHandle* handle,
    const char* key
) {
    if (!handle || !key) return nullptr;
    
    std::lock_guard<std::mutex> lock(g_handleMutex);
    auto it = g_engines.find(handle);
    if (it == g_engines.end()) {
        return nullptr;
    }
    
    const auto& metadata = it->second->getMetadata();
    auto entry = metadata.find(key);
    if (entry == metadata.end()) {
        return nullptr;
    }
    
    return allocateAndCopyString(entry->second);
}

// Memory management
GRAPHTRANSLITERATOR_API void graphtransliterator_free_string(char* s) {
    delete[] s;
}

// Version info
GRAPHTRANSLITERATOR_API const char* graphtransliterator_get_version(void) {
    return GRAPHTRANSLITERATOR_VERSION;
}

} // extern "C"
