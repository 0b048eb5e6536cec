#include "Value.h"

#include <bit>
#include <limits>

namespace FCBForge {

namespace {

struct KindName {
    ValueKind kind;
    const char* name;
};

const KindName kKindNames[] = {
    {ValueKind::Bool, "Bool"},
    {ValueKind::Int8, "Int8"},
    {ValueKind::UInt8, "UInt8"},
    {ValueKind::Int16, "Int16"},
    {ValueKind::UInt16, "UInt16"},
    {ValueKind::Int32, "Int32"},
    {ValueKind::UInt32, "UInt32"},
    {ValueKind::Int64, "Int64"},
    {ValueKind::UInt64, "UInt64"},
    {ValueKind::Float32, "Float32"},
    {ValueKind::Float64, "Float64"},
    {ValueKind::String, "String"},
    {ValueKind::Blob, "Blob"},
    {ValueKind::Reference, "Ref"},
    {ValueKind::Vector3, "Vector3"},
    {ValueKind::Hash32, "Hash32"},
};

template<typename T>
bool storeIfFits(Value::Storage& data, uint64_t id) {
    if (id > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        return false;
    }
    data = static_cast<T>(id);
    return true;
}

} // namespace

std::optional<uint64_t> Value::asId() const {
    switch (kind()) {
        case ValueKind::UInt8: return *get<uint8_t>();
        case ValueKind::UInt16: return *get<uint16_t>();
        case ValueKind::UInt32: return *get<uint32_t>();
        case ValueKind::UInt64: return *get<uint64_t>();
        case ValueKind::Reference: return get<NodeRef>()->id;
        case ValueKind::Int32: {
            int32_t v = *get<int32_t>();
            if (v < 0) return std::nullopt;
            return static_cast<uint64_t>(v);
        }
        case ValueKind::Int64: {
            int64_t v = *get<int64_t>();
            if (v < 0) return std::nullopt;
            return static_cast<uint64_t>(v);
        }
        default:
            return std::nullopt;
    }
}

bool Value::replaceId(uint64_t id) {
    switch (kind()) {
        case ValueKind::UInt8: return storeIfFits<uint8_t>(data_, id);
        case ValueKind::UInt16: return storeIfFits<uint16_t>(data_, id);
        case ValueKind::UInt32: return storeIfFits<uint32_t>(data_, id);
        case ValueKind::UInt64: data_ = id; return true;
        case ValueKind::Int32: return storeIfFits<int32_t>(data_, id);
        case ValueKind::Int64: return storeIfFits<int64_t>(data_, id);
        case ValueKind::Reference: data_ = NodeRef{id}; return true;
        default:
            return false;
    }
}

bool Value::operator==(const Value& other) const {
    if (data_.index() != other.data_.index()) {
        return false;
    }
    switch (kind()) {
        case ValueKind::Float32:
            return std::bit_cast<uint32_t>(*get<float>()) == std::bit_cast<uint32_t>(*other.get<float>());
        case ValueKind::Float64:
            return std::bit_cast<uint64_t>(*get<double>()) == std::bit_cast<uint64_t>(*other.get<double>());
        case ValueKind::Vector3: {
            const Vector3& a = *get<Vector3>();
            const Vector3& b = *other.get<Vector3>();
            return std::bit_cast<uint32_t>(a.x) == std::bit_cast<uint32_t>(b.x) &&
                   std::bit_cast<uint32_t>(a.y) == std::bit_cast<uint32_t>(b.y) &&
                   std::bit_cast<uint32_t>(a.z) == std::bit_cast<uint32_t>(b.z);
        }
        case ValueKind::Reference:
            return get<NodeRef>()->id == other.get<NodeRef>()->id;
        case ValueKind::Hash32:
            return get<Hash32>()->value == other.get<Hash32>()->value;
        default:
            // remaining alternatives all have a meaningful operator==
            return std::visit(
                [&other](const auto& lhs) -> bool {
                    using T = std::decay_t<decltype(lhs)>;
                    if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double> ||
                                  std::is_same_v<T, Vector3> || std::is_same_v<T, NodeRef> ||
                                  std::is_same_v<T, Hash32>) {
                        return false;
                    } else {
                        return lhs == *other.get<T>();
                    }
                },
                data_);
    }
}

const char* Value::kindName(ValueKind kind) {
    for (const auto& entry : kKindNames) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "Unknown";
}

std::optional<ValueKind> Value::kindFromName(std::string_view name) {
    for (const auto& entry : kKindNames) {
        if (name == entry.name) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

} // namespace FCBForge
