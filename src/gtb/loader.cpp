#include <graphtransliterator/graphtransliterator.h>
#include "binary_io.h"
#include "validator.h"
#include "../utils/debug.h"
#include <algorithm>
#include <fstream>

namespace graphtransliterator {

class GtbLoaderImpl {
public:
    static std::unique_ptr<TransliteratorFile> loadFromFile(const std::string& path) {
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file) {
            return nullptr;
        }
        
        std::streamoff fileSize = file.tellg();
        if (fileSize < 0) {
            return nullptr;
        }
        file.seekg(0, std::ios::beg);
        
        std::vector<uint8_t> buffer(static_cast<size_t>(fileSize));
        if (!file.read(reinterpret_cast<char*>(buffer.data()), fileSize)) {
            return nullptr;
        }
        
        return loadFromMemory(buffer.data(), buffer.size());
    }
    
    static std::unique_ptr<TransliteratorFile> loadFromMemory(const uint8_t* data, size_t dataLen) {
        if (!data || dataLen < sizeof(GtbFileHeader)) {
            return nullptr;
        }
        
        GtbLoaderImpl impl(data, dataLen);
        auto gtb = std::make_unique<TransliteratorFile>();
        
        if (!impl.readHeader(gtb->header) ||
            !impl.readStrings(gtb->header.stringCount) ||
            !impl.readInfo(*gtb) ||
            !impl.readTokens(gtb->header.tokenCount, gtb->settings.tokens) ||
            !impl.readRules(gtb->header.ruleCount, gtb->settings.rules) ||
            !impl.readOnMatchRules(gtb->header.onmatchCount, gtb->settings.onmatchRules) ||
            !impl.readLookup(gtb->header.lookupCount, gtb->onmatchLookup) ||
            !impl.readNodes(gtb->header.nodeCount, gtb->graph) ||
            !impl.readMetadata(gtb->header.metadataCount, gtb->settings.metadata)) {
            utils::debugLog("Malformed GTB data near offset " + std::to_string(impl.reader_.offset()) +
                            "\n" + utils::hexDump(data, std::min<size_t>(dataLen, 64)));
            return nullptr;
        }
        
        if (!impl.reader_.atEnd()) {
            utils::debugLog("Trailing bytes after GTB data");
            return nullptr;
        }
        
        gtb->settings.whitespace.consolidate = gtb->consolidatesWhitespace();
        
        if (!GtbValidator::validate(*gtb)) {
            return nullptr;
        }
        
        return gtb;
    }
    
private:
    GtbLoaderImpl(const uint8_t* data, size_t dataLen) : reader_(data, dataLen) {}
    
    bool readHeader(GtbFileHeader& header) {
        if (!reader_.readBytes(header.magicCode, 4) ||
            !reader_.readU8(header.majorVersion) ||
            !reader_.readU8(header.minorVersion) ||
            !reader_.readU8(header.flags) ||
            !reader_.readU8(header.reserved)) {
            return false;
        }
        if (!header.isValid() || !header.isCompatibleVersion()) {
            utils::debugLog("Not a GTB file or unsupported version " +
                            std::to_string(header.majorVersion) + "." +
                            std::to_string(header.minorVersion));
            return false;
        }
        return reader_.readU32(header.stringCount) &&
               reader_.readU32(header.tokenCount) &&
               reader_.readU32(header.ruleCount) &&
               reader_.readU32(header.onmatchCount) &&
               reader_.readU32(header.lookupCount) &&
               reader_.readU32(header.nodeCount) &&
               reader_.readU32(header.metadataCount);
    }
    
    bool readStrings(uint32_t count) {
        // Each string takes at least its 4-byte length
        if (reader_.remaining() / 4 < count) {
            return false;
        }
        strings_.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            std::string s;
            if (!reader_.readString(s)) {
                return false;
            }
            strings_.push_back(std::move(s));
        }
        return true;
    }
    
    bool readStringRef(std::string& value) {
        uint32_t index;
        if (!reader_.readU32(index) || index >= strings_.size()) {
            return false;
        }
        value = strings_[index];
        return true;
    }
    
    bool readStringList(std::vector<std::string>& values) {
        std::vector<uint32_t> indices;
        if (!reader_.readU32List(indices)) {
            return false;
        }
        values.clear();
        values.reserve(indices.size());
        for (uint32_t index : indices) {
            if (index >= strings_.size()) {
                return false;
            }
            values.push_back(strings_[index]);
        }
        return true;
    }
    
    bool readIndexList(std::vector<size_t>& values) {
        std::vector<uint32_t> raw;
        if (!reader_.readU32List(raw)) {
            return false;
        }
        values.assign(raw.begin(), raw.end());
        return true;
    }
    
    bool readInfo(TransliteratorFile& gtb) {
        return readStringRef(gtb.version) &&
               readStringRef(gtb.tokenizerPattern) &&
               readStringRef(gtb.settings.whitespace.defaultToken) &&
               readStringRef(gtb.settings.whitespace.tokenClass);
    }
    
    bool readTokens(uint32_t count, std::vector<TokenDefinition>& tokens) {
        for (uint32_t i = 0; i < count; ++i) {
            TokenDefinition def;
            if (!readStringRef(def.token) || !readStringList(def.classes)) {
                return false;
            }
            tokens.push_back(std::move(def));
        }
        return true;
    }
    
    bool readRules(uint32_t count, std::vector<TransliterationRule>& rules) {
        for (uint32_t i = 0; i < count; ++i) {
            TransliterationRule rule;
            if (!readStringRef(rule.production) ||
                !readStringList(rule.prevClasses) ||
                !readStringList(rule.prevTokens) ||
                !readStringList(rule.tokens) ||
                !readStringList(rule.nextTokens) ||
                !readStringList(rule.nextClasses) ||
                !reader_.readF64(rule.cost)) {
                return false;
            }
            rules.push_back(std::move(rule));
        }
        return true;
    }
    
    bool readOnMatchRules(uint32_t count, std::vector<OnMatchRule>& rules) {
        for (uint32_t i = 0; i < count; ++i) {
            OnMatchRule rule;
            if (!readStringList(rule.prevClasses) ||
                !readStringList(rule.nextClasses) ||
                !readStringRef(rule.production)) {
                return false;
            }
            rules.push_back(std::move(rule));
        }
        return true;
    }
    
    bool readLookup(uint32_t count, OnMatchIndex& lookup) {
        for (uint32_t i = 0; i < count; ++i) {
            std::string curr;
            std::string prev;
            std::vector<size_t> indices;
            if (!readStringRef(curr) || !readStringRef(prev) || !readIndexList(indices)) {
                return false;
            }
            lookup[curr][prev] = std::move(indices);
        }
        return true;
    }
    
    bool readNodes(uint32_t count, MatchingGraph& graph) {
        for (uint32_t i = 0; i < count; ++i) {
            uint8_t type;
            if (!reader_.readU8(type)) {
                return false;
            }
            
            GraphNode node;
            switch (static_cast<NodeType>(type)) {
                case NodeType::Start:
                    node.data = StartNode{};
                    break;
                    
                case NodeType::Token: {
                    TokenNode token;
                    if (!readStringRef(token.token)) return false;
                    node.data = token;
                    break;
                }
                    
                case NodeType::Rule: {
                    RuleNode rule;
                    uint32_t ruleKey;
                    if (!reader_.readU32(ruleKey) ||
                        !readStringList(rule.constraints.prevTokens) ||
                        !readStringList(rule.constraints.prevClasses) ||
                        !readStringList(rule.constraints.nextTokens) ||
                        !readStringList(rule.constraints.nextClasses)) {
                        return false;
                    }
                    rule.ruleKey = ruleKey;
                    node.data = rule;
                    break;
                }
                    
                default:
                    utils::debugLog("Unknown GTB node type " + std::to_string(type));
                    return false;
            }
            
            uint32_t minRuleKey;
            uint32_t entries;
            if (!reader_.readU32(minRuleKey) || !reader_.readU32(entries)) {
                return false;
            }
            node.minRuleKey = minRuleKey;
            
            for (uint32_t e = 0; e < entries; ++e) {
                uint32_t key;
                std::vector<size_t> children;
                if (!reader_.readU32(key) || !readIndexList(children)) {
                    return false;
                }
                if (key == GTB_RULES_KEY) {
                    node.ruleChildren = std::move(children);
                } else if (key < strings_.size()) {
                    node.orderedChildren[strings_[key]] = std::move(children);
                } else {
                    return false;
                }
            }
            
            graph.addNode(node);
        }
        return true;
    }
    
    bool readMetadata(uint32_t count, std::map<std::string, std::string>& metadata) {
        for (uint32_t i = 0; i < count; ++i) {
            std::string key;
            std::string value;
            if (!readStringRef(key) || !readStringRef(value)) {
                return false;
            }
            metadata[key] = value;
        }
        return true;
    }
    
    gtb::ByteReader reader_;
    std::vector<std::string> strings_;
};

// GtbLoader public interface
std::unique_ptr<TransliteratorFile> GtbLoader::loadFromFile(const std::string& path) {
    return GtbLoaderImpl::loadFromFile(path);
}

std::unique_ptr<TransliteratorFile> GtbLoader::loadFromMemory(const uint8_t* data, size_t dataLen) {
    return GtbLoaderImpl::loadFromMemory(data, dataLen);
}

bool GtbLoader::validateFile(const std::string& path) {
    auto gtb = loadFromFile(path);
    return gtb && gtb->isValid();
}

bool GtbLoader::validateMemory(const uint8_t* data, size_t dataLen) {
    auto gtb = loadFromMemory(data, dataLen);
    return gtb && gtb->isValid();
}

} // namespace graphtransliterator
