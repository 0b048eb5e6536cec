#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/Resource/Value.h"

namespace FCBForge {

enum class ReferenceScope {
    File,  // target must live in the same file
    Level  // target may live anywhere in the level
};

const char* referenceScopeName(ReferenceScope scope);

struct ReferenceRule {
    std::optional<uint32_t> typeTag; // nullopt matches every tag ("*")
    uint32_t attribute = 0;
    ReferenceScope scope = ReferenceScope::Level;
};

/**
 * @brief Which attributes carry node identities, references, positions and names
 *
 * JSON form, every key optional:
 *   {
 *     "identity":   ["disEntityId"],
 *     "references": [{"tag": "*", "attribute": "disParentId", "scope": "file"}],
 *     "position":   ["hidPos", "hidPos_precise"],
 *     "name":       "hidName"
 *   }
 * Names are hashed with hashName(); "0x1234ABCD" gives a hash directly.
 * A value of kind Reference is a level-scoped reference without any rule.
 */
class ReferenceSchema {
public:
    ReferenceSchema();

    bool loadFromFile(const std::filesystem::path& path);
    bool loadFromString(const std::string& json, const std::string& source = "<string>");

    bool isIdentity(uint32_t attribute) const;
    const std::vector<uint32_t>& identityAttributes() const { return identity_; }

    // Scope of a reference held by `attribute` on a node of `typeTag`, or nullopt for plain data
    std::optional<ReferenceScope> referenceScope(uint32_t typeTag, uint32_t attribute, const Value& value) const;

    const std::vector<ReferenceRule>& rules() const { return rules_; }
    const std::vector<uint32_t>& positionAttributes() const { return position_; }
    uint32_t nameAttribute() const { return name_; }

    void addRule(ReferenceRule rule) { rules_.push_back(rule); }

    static std::optional<uint32_t> resolveName(const std::string& nameOrHash);

private:
    std::vector<uint32_t> identity_;
    std::vector<ReferenceRule> rules_;
    std::vector<uint32_t> position_;
    uint32_t name_ = 0;
};

} // namespace FCBForge
