#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <pugixml.hpp>

#include "core/Resource/ClassDictionary.h"
#include "core/Resource/ResourceFile.h"

namespace FCBForge {

/**
 * @brief Converts resource trees to and from the editable XML form
 *
 *   <FCBFile version="3" flags="0">
 *     <Entity disEntityId.UInt64="42" hidPos.Vector3="1.5,2,0">
 *       <_1A2B3C4D raw="BinHex">0001A2FF</_1A2B3C4D>
 *     </Entity>
 *   </FCBFile>
 *
 * Element names are dictionary class names, or `_` followed by the 8 hex
 * digits of the tag when the class has no usable name. Value attributes
 * are named `<member>.<Kind>`; dot-free attributes are reserved (`raw`,
 * `trailing` on nodes, `version`, `flags`, `trailer` on the root).
 *
 * fromMarkup() throws FCBError(MarkupError) for anything it cannot map back.
 */
class MarkupBridge {
public:
    static constexpr const char* kRootElement = "FCBFile";
    static constexpr const char* kRawEncoding = "BinHex";

    explicit MarkupBridge(const ClassDictionary& dictionary);

    std::unique_ptr<pugi::xml_document> toMarkup(const ResourceFile& file) const;
    ResourceFile fromMarkup(const pugi::xml_document& doc, const std::string& name = "") const;

    // Appends the element for `node` under `parent`
    pugi::xml_node nodeToMarkup(const Node& node, pugi::xml_node parent) const;
    Node nodeFromMarkup(const pugi::xml_node& element) const;

    std::string toMarkupString(const ResourceFile& file) const;
    ResourceFile fromMarkupString(const std::string& xml, const std::string& name = "") const;

    std::string elementName(uint32_t typeTag) const;
    uint32_t typeTagFromElementName(std::string_view name) const;
    std::string attributeName(uint32_t nameHash, ValueKind kind) const;
    uint32_t memberHashFromName(std::string_view name) const;

    // Parses markup text, MarkupError with the byte offset on failure
    static std::unique_ptr<pugi::xml_document> parseDocument(const std::string& xml);

private:
    Node nodeFromMarkup(const pugi::xml_node& element, size_t depth) const;

    const ClassDictionary& dictionary_;
};

} // namespace FCBForge
