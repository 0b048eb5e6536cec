#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace FCBForge {

/**
 * @brief Wire codes of the attribute value kinds
 *
 * The numeric value is written as the attribute's kind byte and equals the
 * variant index in Value::Storage plus one.
 */
enum class ValueKind : uint8_t {
    Bool = 0x01,
    Int8 = 0x02,
    UInt8 = 0x03,
    Int16 = 0x04,
    UInt16 = 0x05,
    Int32 = 0x06,
    UInt32 = 0x07,
    Int64 = 0x08,
    UInt64 = 0x09,
    Float32 = 0x0A,
    Float64 = 0x0B,
    String = 0x0C,
    Blob = 0x0D,
    Reference = 0x0E,
    Vector3 = 0x0F,
    Hash32 = 0x10
};

constexpr uint8_t kFirstValueKind = 0x01;
constexpr uint8_t kLastValueKind = 0x10;

struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

// ID of another node, as opposed to a plain integer
struct NodeRef {
    uint64_t id = 0;
};

// 32-bit name hash stored as data
struct Hash32 {
    uint32_t value = 0;
};

using Blob = std::vector<uint8_t>;

class Value {
public:
    using Storage = std::variant<bool, int8_t, uint8_t, int16_t, uint16_t, int32_t, uint32_t,
                                 int64_t, uint64_t, float, double, std::string, Blob,
                                 NodeRef, Vector3, Hash32>;

    template<typename T>
    static constexpr bool isAlternative = std::is_constructible_v<Storage, std::in_place_type_t<T>, T>;

    Value() : data_(false) {}

    template<typename T, typename = std::enable_if_t<isAlternative<std::decay_t<T>>>>
    Value(T&& value) : data_(std::in_place_type<std::decay_t<T>>, std::forward<T>(value)) {}

    Value(const char* text) : data_(std::in_place_type<std::string>, text) {}

    ValueKind kind() const { return static_cast<ValueKind>(data_.index() + 1); }
    const Storage& storage() const { return data_; }

    template<typename T>
    bool is() const { return std::holds_alternative<T>(data_); }

    template<typename T>
    const T* get() const { return std::get_if<T>(&data_); }

    template<typename T>
    T* get() { return std::get_if<T>(&data_); }

    /**
     * @brief Integer view used for node IDs
     * @return the value of an unsigned or non-negative integer kind, or of a NodeRef
     */
    std::optional<uint64_t> asId() const;

    /**
     * @brief Replaces an ID while keeping the stored kind
     * @return false if the kind cannot hold IDs or the ID does not fit
     */
    bool replaceId(uint64_t id);

    // Kind and exact bit pattern must match, so -0.0 != 0.0 and NaN payloads count
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    static const char* kindName(ValueKind kind);
    static std::optional<ValueKind> kindFromName(std::string_view name);
    static bool isValidKindCode(uint8_t code) { return code >= kFirstValueKind && code <= kLastValueKind; }

private:
    Storage data_;
};

} // namespace FCBForge
