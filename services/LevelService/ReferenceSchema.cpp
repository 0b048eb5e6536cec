#include "ReferenceSchema.h"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "core/Hashing.h"
#include "core/Logging/Logging.h"

namespace fs = std::filesystem;

namespace FCBForge {

const char* referenceScopeName(ReferenceScope scope) {
    return scope == ReferenceScope::File ? "file" : "level";
}

ReferenceSchema::ReferenceSchema() {
    identity_ = {hashName("disEntityId")};
    rules_ = {
        {std::nullopt, hashName("disLinkedEntityId"), ReferenceScope::Level},
        {std::nullopt, hashName("disParentId"), ReferenceScope::File},
        {std::nullopt, hashName("disTargetId"), ReferenceScope::Level},
        {std::nullopt, hashName("disLibraryId"), ReferenceScope::Level},
    };
    position_ = {hashName("hidPos"), hashName("hidPos_precise")};
    name_ = hashName("hidName");
}

std::optional<uint32_t> ReferenceSchema::resolveName(const std::string& nameOrHash) {
    if (nameOrHash.empty()) {
        return std::nullopt;
    }
    if (nameOrHash.size() > 2 && nameOrHash[0] == '0' && (nameOrHash[1] == 'x' || nameOrHash[1] == 'X')) {
        return parseHash(std::string_view(nameOrHash).substr(2));
    }
    return hashName(nameOrHash);
}

bool ReferenceSchema::loadFromFile(const fs::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        Log(ERROR, "ReferenceSchema", "Cannot open reference schema: {}", path.string());
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return loadFromString(buffer.str(), path.string());
}

bool ReferenceSchema::loadFromString(const std::string& json, const std::string& source) {
    try {
        nlohmann::json j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            Log(ERROR, "ReferenceSchema", "{}: top level must be an object", source);
            return false;
        }

        auto resolveAll = [&](const nlohmann::json& list, const char* key) {
            std::vector<uint32_t> hashes;
            for (const auto& entry : list) {
                auto hash = resolveName(entry.get<std::string>());
                if (!hash) {
                    throw std::runtime_error(std::string("invalid name in '") + key + "'");
                }
                hashes.push_back(*hash);
            }
            return hashes;
        };

        // Parse everything first so a bad file leaves the schema unchanged
        std::vector<uint32_t> identity = identity_;
        std::vector<ReferenceRule> rules = rules_;
        std::vector<uint32_t> position = position_;
        uint32_t name = name_;

        if (j.contains("identity")) {
            identity = resolveAll(j["identity"], "identity");
        }
        if (j.contains("references")) {
            rules.clear();
            for (const auto& jr : j["references"]) {
                ReferenceRule rule;
                std::string tag = jr.value("tag", std::string("*"));
                if (tag != "*") {
                    auto tagHash = resolveName(tag);
                    if (!tagHash) {
                        throw std::runtime_error("invalid tag '" + tag + "'");
                    }
                    rule.typeTag = *tagHash;
                }
                auto attribute = resolveName(jr.at("attribute").get<std::string>());
                if (!attribute) {
                    throw std::runtime_error("invalid reference attribute");
                }
                rule.attribute = *attribute;
                std::string scope = jr.value("scope", std::string("level"));
                if (scope == "file") {
                    rule.scope = ReferenceScope::File;
                } else if (scope == "level") {
                    rule.scope = ReferenceScope::Level;
                } else {
                    throw std::runtime_error("unknown scope '" + scope + "'");
                }
                rules.push_back(rule);
            }
        }
        if (j.contains("position")) {
            position = resolveAll(j["position"], "position");
        }
        if (j.contains("name")) {
            auto hash = resolveName(j["name"].get<std::string>());
            if (!hash) {
                throw std::runtime_error("invalid name attribute");
            }
            name = *hash;
        }

        identity_ = std::move(identity);
        rules_ = std::move(rules);
        position_ = std::move(position);
        name_ = name;
        Log(DEBUG, "ReferenceSchema", "Loaded {} reference rules from {}", rules_.size(), source);
        return true;
    } catch (const std::exception& e) {
        Log(ERROR, "ReferenceSchema", "Failed to load reference schema from {}: {}", source, e.what());
        return false;
    }
}

bool ReferenceSchema::isIdentity(uint32_t attribute) const {
    for (uint32_t hash : identity_) {
        if (hash == attribute) {
            return true;
        }
    }
    return false;
}

std::optional<ReferenceScope> ReferenceSchema::referenceScope(uint32_t typeTag, uint32_t attribute,
                                                              const Value& value) const {
    if (isIdentity(attribute)) {
        return std::nullopt;
    }
    // Tag-specific rules take precedence over "*" rules
    std::optional<ReferenceScope> wildcard;
    for (const auto& rule : rules_) {
        if (rule.attribute != attribute) {
            continue;
        }
        if (rule.typeTag && *rule.typeTag == typeTag) {
            return rule.scope;
        }
        if (!rule.typeTag && !wildcard) {
            wildcard = rule.scope;
        }
    }
    if (wildcard) {
        return wildcard;
    }
    if (value.kind() == ValueKind::Reference) {
        return ReferenceScope::Level;
    }
    return std::nullopt;
}

} // namespace FCBForge
