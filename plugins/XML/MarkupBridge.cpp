#include "MarkupBridge.h"

#include <cctype>
#include <cstddef>
#include <format>
#include <optional>
#include <sstream>
#include <unordered_set>

#include "ValueFormat.h"
#include "core/FCBError.h"
#include "core/Hashing.h"
#include "plugins/FCB/FCBV3.hpp"

namespace FCBForge {

namespace {

bool isNameStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

bool isXmlName(std::string_view name) {
    if (name.empty() || !isNameStart(name.front())) {
        return false;
    }
    for (char c : name) {
        if (!isNameChar(c)) {
            return false;
        }
    }
    // "xml..." names are reserved by the XML spec
    return !(name.size() >= 3 && std::tolower(static_cast<unsigned char>(name[0])) == 'x' &&
             std::tolower(static_cast<unsigned char>(name[1])) == 'm' &&
             std::tolower(static_cast<unsigned char>(name[2])) == 'l');
}

// "_XXXXXXXX" fallback names
std::optional<uint32_t> parseHashName(std::string_view name) {
    if (name.size() != 9 || name.front() != '_') {
        return std::nullopt;
    }
    return parseHash(name.substr(1));
}

std::string hashFallbackName(uint32_t hash) {
    return "_" + formatHash(hash);
}

size_t elementOffset(const pugi::xml_node& element) {
    ptrdiff_t offset = element.offset_debug();
    return offset < 0 ? FCBError::kNoOffset : static_cast<size_t>(offset);
}

[[noreturn]] void markupFail(const pugi::xml_node& element, const std::string& message) {
    throw FCBError(ErrorKind::MarkupError, std::format("<{}>: {}", element.name(), message), elementOffset(element));
}

bool isBlank(const char* text) {
    for (; *text; ++text) {
        if (!std::isspace(static_cast<unsigned char>(*text))) {
            return false;
        }
    }
    return true;
}

uint16_t parseHeaderField(const pugi::xml_node& root, const char* name, uint16_t fallback) {
    pugi::xml_attribute attribute = root.attribute(name);
    if (!attribute) {
        return fallback;
    }
    return *ValueFormat::parseValue(ValueKind::UInt16, attribute.value()).get<uint16_t>();
}

} // namespace

MarkupBridge::MarkupBridge(const ClassDictionary& dictionary) : dictionary_(dictionary) {}

std::string MarkupBridge::elementName(uint32_t typeTag) const {
    const std::string* name = dictionary_.className(typeTag);
    if (name && isXmlName(*name) && !parseHashName(*name) && *name != kRootElement &&
        dictionary_.classHash(*name) == typeTag) {
        return *name;
    }
    return hashFallbackName(typeTag);
}

uint32_t MarkupBridge::typeTagFromElementName(std::string_view name) const {
    if (auto hash = parseHashName(name)) {
        return *hash;
    }
    if (auto hash = dictionary_.classHash(name)) {
        return *hash;
    }
    return hashName(name);
}

std::string MarkupBridge::attributeName(uint32_t nameHash, ValueKind kind) const {
    const std::string* name = dictionary_.memberName(nameHash);
    std::string member;
    if (name && isXmlName(*name) && !parseHashName(*name) && dictionary_.memberHash(*name) == nameHash) {
        member = *name;
    } else {
        member = hashFallbackName(nameHash);
    }
    return member + "." + Value::kindName(kind);
}

uint32_t MarkupBridge::memberHashFromName(std::string_view name) const {
    if (auto hash = parseHashName(name)) {
        return *hash;
    }
    if (auto hash = dictionary_.memberHash(name)) {
        return *hash;
    }
    return hashName(name);
}

std::unique_ptr<pugi::xml_document> MarkupBridge::toMarkup(const ResourceFile& file) const {
    auto doc = std::make_unique<pugi::xml_document>();
    pugi::xml_node root = doc->append_child(kRootElement);
    root.append_attribute("version").set_value(static_cast<unsigned int>(file.version));
    root.append_attribute("flags").set_value(static_cast<unsigned int>(file.flags));
    if (!file.trailer.empty()) {
        root.append_attribute("trailer").set_value(ValueFormat::toHex(file.trailer).c_str());
    }
    for (const Node& node : file.roots) {
        nodeToMarkup(node, root);
    }
    return doc;
}

pugi::xml_node MarkupBridge::nodeToMarkup(const Node& node, pugi::xml_node parent) const {
    pugi::xml_node element = parent.append_child(elementName(node.typeTag()).c_str());

    if (node.isOpaque()) {
        element.append_attribute("raw").set_value(kRawEncoding);
        if (!node.trailing().empty()) {
            element.append_attribute("trailing").set_value(ValueFormat::toHex(node.trailing()).c_str());
        }
        element.append_child(pugi::node_pcdata).set_value(ValueFormat::toHex(node.rawPayload()).c_str());
        return element;
    }

    for (const Attribute& attribute : node.attributes()) {
        std::string name = attributeName(attribute.nameHash, attribute.value.kind());
        element.append_attribute(name.c_str()).set_value(ValueFormat::formatValue(attribute.value).c_str());
    }
    if (!node.trailing().empty()) {
        element.append_attribute("trailing").set_value(ValueFormat::toHex(node.trailing()).c_str());
    }
    for (const Node& child : node.children()) {
        nodeToMarkup(child, element);
    }
    return element;
}

ResourceFile MarkupBridge::fromMarkup(const pugi::xml_document& doc, const std::string& name) const {
    pugi::xml_node root = doc.document_element();
    if (!root) {
        throw FCBError(ErrorKind::MarkupError, "document has no root element");
    }
    if (std::string_view(root.name()) != kRootElement) {
        markupFail(root, std::format("expected root element <{}>", kRootElement));
    }

    ResourceFile file;
    file.name = name;
    try {
        file.version = parseHeaderField(root, "version", kDefaultFCBVersion);
        file.flags = parseHeaderField(root, "flags", 0);
        if (pugi::xml_attribute trailer = root.attribute("trailer")) {
            file.trailer = ValueFormat::fromHex(trailer.value());
        }
    } catch (const FCBError& e) {
        markupFail(root, e.detail());
    }

    for (pugi::xml_attribute attribute : root.attributes()) {
        std::string_view attributeName = attribute.name();
        if (attributeName != "version" && attributeName != "flags" && attributeName != "trailer") {
            markupFail(root, std::format("unexpected attribute '{}'", attributeName));
        }
    }

    for (pugi::xml_node child : root.children()) {
        switch (child.type()) {
            case pugi::node_element:
                file.roots.push_back(nodeFromMarkup(child, 0));
                break;
            case pugi::node_pcdata:
            case pugi::node_cdata:
                if (!isBlank(child.value())) {
                    markupFail(root, "unexpected text content");
                }
                break;
            default:
                break;
        }
    }
    return file;
}

Node MarkupBridge::nodeFromMarkup(const pugi::xml_node& element) const {
    return nodeFromMarkup(element, 0);
}

Node MarkupBridge::nodeFromMarkup(const pugi::xml_node& element, size_t depth) const {
    if (depth >= kMaxNodeDepth) {
        markupFail(element, std::format("elements nested deeper than {} levels", kMaxNodeDepth));
    }

    uint32_t typeTag = typeTagFromElementName(element.name());

    pugi::xml_attribute raw = element.attribute("raw");
    pugi::xml_attribute trailing = element.attribute("trailing");
    std::vector<uint8_t> trailingBytes;
    if (trailing) {
        try {
            trailingBytes = ValueFormat::fromHex(trailing.value());
        } catch (const FCBError& e) {
            markupFail(element, std::format("trailing: {}", e.detail()));
        }
    }

    if (raw) {
        if (std::string_view(raw.value()) != kRawEncoding) {
            markupFail(element, std::format("unsupported raw encoding '{}'", raw.value()));
        }
        std::string hex;
        for (pugi::xml_node child : element.children()) {
            if (child.type() == pugi::node_element) {
                markupFail(element, "opaque node cannot have child elements");
            }
            if (child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata) {
                hex += child.value();
            }
        }
        for (pugi::xml_attribute attribute : element.attributes()) {
            std::string_view attributeName = attribute.name();
            if (attributeName != "raw" && attributeName != "trailing") {
                markupFail(element, std::format("opaque node cannot carry attribute '{}'", attributeName));
            }
        }
        Node node;
        try {
            node = Node::opaque(typeTag, ValueFormat::fromHex(hex));
        } catch (const FCBError& e) {
            markupFail(element, e.detail());
        }
        node.setTrailing(std::move(trailingBytes));
        return node;
    }

    Node node(typeTag);
    std::unordered_set<uint32_t> seen;
    for (pugi::xml_attribute attribute : element.attributes()) {
        std::string_view attributeName = attribute.name();
        size_t dot = attributeName.rfind('.');
        if (dot == std::string_view::npos) {
            if (attributeName == "trailing") {
                continue;
            }
            markupFail(element, std::format("unexpected attribute '{}'", attributeName));
        }

        std::string_view member = attributeName.substr(0, dot);
        std::string_view kindName = attributeName.substr(dot + 1);
        auto kind = Value::kindFromName(kindName);
        if (!kind) {
            markupFail(element, std::format("attribute '{}' has unknown kind '{}'", attributeName, kindName));
        }
        if (member.empty()) {
            markupFail(element, std::format("attribute '{}' has no member name", attributeName));
        }

        uint32_t nameHash = memberHashFromName(member);
        if (!seen.insert(nameHash).second) {
            markupFail(element, std::format("attribute '{}' duplicates member hash {}", attributeName, formatHash(nameHash)));
        }

        try {
            node.setAttribute(nameHash, ValueFormat::parseValue(*kind, attribute.value()));
        } catch (const FCBError& e) {
            markupFail(element, std::format("{}: {}", attributeName, e.detail()));
        }
    }

    for (pugi::xml_node child : element.children()) {
        switch (child.type()) {
            case pugi::node_element:
                node.addChild(nodeFromMarkup(child, depth + 1));
                break;
            case pugi::node_pcdata:
            case pugi::node_cdata:
                if (!isBlank(child.value())) {
                    markupFail(element, "structured node cannot contain text");
                }
                break;
            default:
                // comments, processing instructions
                break;
        }
    }

    node.setTrailing(std::move(trailingBytes));
    return node;
}

std::string MarkupBridge::toMarkupString(const ResourceFile& file) const {
    std::ostringstream stream;
    toMarkup(file)->save(stream, "  ", pugi::format_default, pugi::encoding_utf8);
    return stream.str();
}

ResourceFile MarkupBridge::fromMarkupString(const std::string& xml, const std::string& name) const {
    auto doc = parseDocument(xml);
    return fromMarkup(*doc, name);
}

std::unique_ptr<pugi::xml_document> MarkupBridge::parseDocument(const std::string& xml) {
    auto doc = std::make_unique<pugi::xml_document>();
    pugi::xml_parse_result result = doc->load_buffer(xml.data(), xml.size(), pugi::parse_default, pugi::encoding_utf8);
    if (!result) {
        throw FCBError(ErrorKind::MarkupError, std::format("XML parse error: {}", result.description()),
                       static_cast<size_t>(result.offset));
    }
    return doc;
}

} // namespace FCBForge
