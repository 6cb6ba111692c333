#include <graphtransliterator/graphtransliterator.h>
#include "binary_io.h"
#include "../utils/debug.h"
#include <fstream>
#include <unordered_map>

namespace graphtransliterator {

class GtbWriterImpl {
public:
    static std::vector<uint8_t> write(const TransliteratorFile& file) {
        GtbWriterImpl impl;
        impl.collectStrings(file);

        gtb::ByteWriter out;
        impl.writeHeader(out, file);
        impl.writeStrings(out);
        impl.writeInfo(out, file);
        impl.writeTokens(out, file.settings.tokens);
        impl.writeRules(out, file.settings.rules);
        impl.writeOnMatchRules(out, file.settings.onmatchRules);
        impl.writeLookup(out, file.onmatchLookup);
        impl.writeNodes(out, file.graph);
        impl.writeMetadata(out, file.settings.metadata);

        utils::debugLog("Wrote GTB data: " + std::to_string(out.bytes().size()) + " bytes");
        return out.release();
    }

private:
    uint32_t intern(const std::string& s) {
        auto it = index_.find(s);
        if (it != index_.end()) {
            return it->second;
        }
        uint32_t id = static_cast<uint32_t>(strings_.size());
        strings_.push_back(s);
        index_.emplace(s, id);
        return id;
    }

    uint32_t id(const std::string& s) const {
        return index_.at(s);
    }

    std::vector<uint32_t> ids(const std::vector<std::string>& values) const {
        std::vector<uint32_t> out;
        out.reserve(values.size());
        for (const auto& v : values) {
            out.push_back(id(v));
        }
        return out;
    }

    static std::vector<uint32_t> narrow(const std::vector<size_t>& values) {
        return std::vector<uint32_t>(values.begin(), values.end());
    }

    void internAll(const std::vector<std::string>& values) {
        for (const auto& v : values) {
            intern(v);
        }
    }

    void collectStrings(const TransliteratorFile& file) {
        const auto& settings = file.settings;

        intern(file.version);
        intern(file.tokenizerPattern);
        intern(settings.whitespace.defaultToken);
        intern(settings.whitespace.tokenClass);

        for (const auto& def : settings.tokens) {
            intern(def.token);
            internAll(def.classes);
        }
        for (const auto& rule : settings.rules) {
            intern(rule.production);
            internAll(rule.prevClasses);
            internAll(rule.prevTokens);
            internAll(rule.tokens);
            internAll(rule.nextTokens);
            internAll(rule.nextClasses);
        }
        for (const auto& rule : settings.onmatchRules) {
            internAll(rule.prevClasses);
            internAll(rule.nextClasses);
            intern(rule.production);
        }
        for (const auto& curr : file.onmatchLookup) {
            intern(curr.first);
            for (const auto& prev : curr.second) {
                intern(prev.first);
            }
        }
        for (const auto& node : file.graph.nodes()) {
            if (const TokenNode* token = node.asToken()) {
                intern(token->token);
            } else if (const RuleNode* rule = node.asRule()) {
                internAll(rule->constraints.prevTokens);
                internAll(rule->constraints.prevClasses);
                internAll(rule->constraints.nextTokens);
                internAll(rule->constraints.nextClasses);
            }
            for (const auto& entry : node.orderedChildren) {
                intern(entry.first);
            }
        }
        for (const auto& entry : settings.metadata) {
            intern(entry.first);
            intern(entry.second);
        }
    }

    void writeHeader(gtb::ByteWriter& out, const TransliteratorFile& file) const {
        size_t lookupCount = 0;
        for (const auto& curr : file.onmatchLookup) {
            lookupCount += curr.second.size();
        }

        uint8_t flags = 0;
        if (file.settings.whitespace.consolidate) flags |= GTB_FLAG_CONSOLIDATE;
        if (file.ignoresErrors()) flags |= GTB_FLAG_IGNORE_ERRORS;

        out.writeBytes(GTB_MAGIC_CODE, 4);
        out.writeU8(GTB_MAJOR_VERSION);
        out.writeU8(GTB_MINOR_VERSION);
        out.writeU8(flags);
        out.writeU8(0);
        out.writeU32(static_cast<uint32_t>(strings_.size()));
        out.writeU32(static_cast<uint32_t>(file.settings.tokens.size()));
        out.writeU32(static_cast<uint32_t>(file.settings.rules.size()));
        out.writeU32(static_cast<uint32_t>(file.settings.onmatchRules.size()));
        out.writeU32(static_cast<uint32_t>(lookupCount));
        out.writeU32(static_cast<uint32_t>(file.graph.size()));
        out.writeU32(static_cast<uint32_t>(file.settings.metadata.size()));
    }

    void writeStrings(gtb::ByteWriter& out) const {
        for (const auto& s : strings_) {
            out.writeU32(static_cast<uint32_t>(s.size()));
            out.writeBytes(s.data(), s.size());
        }
    }

    void writeInfo(gtb::ByteWriter& out, const TransliteratorFile& file) const {
        out.writeU32(id(file.version));
        out.writeU32(id(file.tokenizerPattern));
        out.writeU32(id(file.settings.whitespace.defaultToken));
        out.writeU32(id(file.settings.whitespace.tokenClass));
    }

    void writeTokens(gtb::ByteWriter& out, const std::vector<TokenDefinition>& tokens) const {
        for (const auto& def : tokens) {
            out.writeU32(id(def.token));
            out.writeU32List(ids(def.classes));
        }
    }

    void writeRules(gtb::ByteWriter& out, const std::vector<TransliterationRule>& rules) const {
        for (const auto& rule : rules) {
            out.writeU32(id(rule.production));
            out.writeU32List(ids(rule.prevClasses));
            out.writeU32List(ids(rule.prevTokens));
            out.writeU32List(ids(rule.tokens));
            out.writeU32List(ids(rule.nextTokens));
            out.writeU32List(ids(rule.nextClasses));
            out.writeF64(rule.cost);
        }
    }

    void writeOnMatchRules(gtb::ByteWriter& out, const std::vector<OnMatchRule>& rules) const {
        for (const auto& rule : rules) {
            out.writeU32List(ids(rule.prevClasses));
            out.writeU32List(ids(rule.nextClasses));
            out.writeU32(id(rule.production));
        }
    }

    void writeLookup(gtb::ByteWriter& out, const OnMatchIndex& lookup) const {
        for (const auto& curr : lookup) {
            for (const auto& prev : curr.second) {
                out.writeU32(id(curr.first));
                out.writeU32(id(prev.first));
                out.writeU32List(narrow(prev.second));
            }
        }
    }

    void writeNodes(gtb::ByteWriter& out, const MatchingGraph& graph) const {
        for (const auto& node : graph.nodes()) {
            out.writeU8(static_cast<uint8_t>(node.type()));
            if (const TokenNode* token = node.asToken()) {
                out.writeU32(id(token->token));
            } else if (const RuleNode* rule = node.asRule()) {
                out.writeU32(static_cast<uint32_t>(rule->ruleKey));
                out.writeU32List(ids(rule->constraints.prevTokens));
                out.writeU32List(ids(rule->constraints.prevClasses));
                out.writeU32List(ids(rule->constraints.nextTokens));
                out.writeU32List(ids(rule->constraints.nextClasses));
            }
            out.writeU32(static_cast<uint32_t>(node.minRuleKey));

            // Token children, then rule children under the reserved key
            uint32_t entries = static_cast<uint32_t>(node.orderedChildren.size());
            if (!node.ruleChildren.empty()) ++entries;
            out.writeU32(entries);
            for (const auto& entry : node.orderedChildren) {
                out.writeU32(id(entry.first));
                out.writeU32List(narrow(entry.second));
            }
            if (!node.ruleChildren.empty()) {
                out.writeU32(GTB_RULES_KEY);
                out.writeU32List(narrow(node.ruleChildren));
            }
        }
    }

    void writeMetadata(gtb::ByteWriter& out, const std::map<std::string, std::string>& metadata) const {
        for (const auto& entry : metadata) {
            out.writeU32(id(entry.first));
            out.writeU32(id(entry.second));
        }
    }

    std::vector<std::string> strings_;
    std::unordered_map<std::string, uint32_t> index_;
};

// GtbWriter public interface
std::vector<uint8_t> GtbWriter::write(const TransliteratorFile& file) {
    return GtbWriterImpl::write(file);
}

bool GtbWriter::writeToFile(const TransliteratorFile& file, const std::string& path) {
    std::vector<uint8_t> bytes = write(file);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        utils::warningLog("Cannot open " + path + " for writing");
        return false;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(out);
}

} // namespace graphtransliterator
