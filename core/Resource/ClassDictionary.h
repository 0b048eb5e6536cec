#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace pugi {
class xml_document;
}

namespace FCBForge {

/**
 * @brief Maps class and member name hashes back to readable names
 *
 * The engine stores only CRC-32 hashes of class (type tag) and member
 * (attribute) names. A tag is part of the known vocabulary when it has a
 * name here; the reader keeps nodes with other tags opaque. Definitions
 * come from a built-in table and from binary_classes.xml files:
 *
 *   <classes>
 *     <class hash="2C5A7E21" name="Entity">
 *       <member hash="..." name="hidPos"/>
 *     </class>
 *   </classes>
 *
 * A missing hash attribute is computed from the name.
 */
class ClassDictionary {
public:
    explicit ClassDictionary(bool withBuiltins = true);

    bool loadFromFile(const std::filesystem::path& path);
    bool loadFromString(const std::string& xml);

    void addClass(std::string_view name);
    void addClass(uint32_t hash, std::string_view name);
    void addMember(std::string_view name);
    void addMember(uint32_t hash, std::string_view name);

    bool isKnownClass(uint32_t hash) const { return classNames_.count(hash) != 0; }

    const std::string* className(uint32_t hash) const;
    const std::string* memberName(uint32_t hash) const;
    std::optional<uint32_t> classHash(std::string_view name) const;
    std::optional<uint32_t> memberHash(std::string_view name) const;

    size_t classCount() const { return classNames_.size(); }
    size_t memberCount() const { return memberNames_.size(); }

private:
    void addBuiltins();
    bool loadDocument(const pugi::xml_document& doc, const std::string& source);

    std::unordered_map<uint32_t, std::string> classNames_;
    std::unordered_map<uint32_t, std::string> memberNames_;
    std::unordered_map<std::string, uint32_t> classHashes_;
    std::unordered_map<std::string, uint32_t> memberHashes_;
};

} // namespace FCBForge
