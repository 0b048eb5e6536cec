#include "ValueFormat.h"

#include <bit>
#include <charconv>
#include <cmath>
#include <format>
#include <limits>
#include <optional>
#include <type_traits>

#include "core/FCBError.h"
#include "core/Hashing.h"

namespace FCBForge {
namespace ValueFormat {

namespace {

constexpr std::string_view kBitsPrefix = "bits:0x";

std::string_view trim(std::string_view text) {
    const char* whitespace = " \t\r\n";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

[[noreturn]] void fail(ValueKind kind, std::string_view text, std::string_view reason) {
    throw FCBError(ErrorKind::MarkupError,
                   std::format("'{}' is not a valid {} value: {}", text, Value::kindName(kind), reason));
}

template<typename T>
T parseInteger(ValueKind kind, std::string_view raw) {
    std::string_view text = trim(raw);
    if (text.empty()) {
        fail(kind, raw, "empty");
    }
    T result{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), result, 10);
    if (ec == std::errc::result_out_of_range) {
        fail(kind, raw, "out of range");
    }
    if (ec != std::errc() || end != text.data() + text.size()) {
        fail(kind, raw, "not a decimal integer");
    }
    return result;
}

template<typename Bits>
std::optional<Bits> parseBits(std::string_view text) {
    if (text.substr(0, kBitsPrefix.size()) != kBitsPrefix) {
        return std::nullopt;
    }
    std::string_view digits = text.substr(kBitsPrefix.size());
    Bits bits{};
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), bits, 16);
    if (digits.empty() || ec != std::errc() || end != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return bits;
}

template<typename F, typename Bits>
std::string formatFloating(F value) {
    if (!std::isfinite(value)) {
        constexpr int width = sizeof(Bits) * 2;
        return std::format("bits:0x{:0{}X}", std::bit_cast<Bits>(value), width);
    }
    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc()) {
        return std::format("bits:0x{:0{}X}", std::bit_cast<Bits>(value), static_cast<int>(sizeof(Bits) * 2));
    }
    return std::string(buffer, end);
}

template<typename F, typename Bits>
F parseFloating(ValueKind kind, std::string_view raw) {
    std::string_view text = trim(raw);
    if (text.empty()) {
        fail(kind, raw, "empty");
    }
    if (text.substr(0, 5) == "bits:") {
        auto bits = parseBits<Bits>(text);
        if (!bits) {
            fail(kind, raw, std::format("expected bits:0x followed by up to {} hex digits", sizeof(Bits) * 2));
        }
        return std::bit_cast<F>(*bits);
    }
    F result{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (ec == std::errc::result_out_of_range) {
        fail(kind, raw, "out of range");
    }
    if (ec != std::errc() || end != text.data() + text.size()) {
        fail(kind, raw, "not a number");
    }
    return result;
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string formatFloat(float value) {
    return formatFloating<float, uint32_t>(value);
}

std::string formatDouble(double value) {
    return formatFloating<double, uint64_t>(value);
}

float parseFloat(std::string_view text) {
    return parseFloating<float, uint32_t>(ValueKind::Float32, text);
}

double parseDouble(std::string_view text) {
    return parseFloating<double, uint64_t>(ValueKind::Float64, text);
}

std::string toHex(const uint8_t* data, size_t size) {
    static const char digits[] = "0123456789ABCDEF";
    std::string text;
    text.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        text.push_back(digits[data[i] >> 4]);
        text.push_back(digits[data[i] & 0x0F]);
    }
    return text;
}

std::string toHex(const std::vector<uint8_t>& data) {
    return toHex(data.data(), data.size());
}

std::vector<uint8_t> fromHex(std::string_view text) {
    std::vector<uint8_t> bytes;
    bytes.reserve(text.size() / 2);
    int high = -1;
    for (char c : text) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            continue;
        }
        int digit = hexDigit(c);
        if (digit < 0) {
            throw FCBError(ErrorKind::MarkupError, std::format("invalid hex digit '{}'", c));
        }
        if (high < 0) {
            high = digit;
        } else {
            bytes.push_back(static_cast<uint8_t>((high << 4) | digit));
            high = -1;
        }
    }
    if (high >= 0) {
        throw FCBError(ErrorKind::MarkupError, "hex data has an odd number of digits");
    }
    return bytes;
}

std::string formatValue(const Value& value) {
    switch (value.kind()) {
        case ValueKind::Bool: return *value.get<bool>() ? "true" : "false";
        case ValueKind::Int8: return std::to_string(*value.get<int8_t>());
        case ValueKind::UInt8: return std::to_string(*value.get<uint8_t>());
        case ValueKind::Int16: return std::to_string(*value.get<int16_t>());
        case ValueKind::UInt16: return std::to_string(*value.get<uint16_t>());
        case ValueKind::Int32: return std::to_string(*value.get<int32_t>());
        case ValueKind::UInt32: return std::to_string(*value.get<uint32_t>());
        case ValueKind::Int64: return std::to_string(*value.get<int64_t>());
        case ValueKind::UInt64: return std::to_string(*value.get<uint64_t>());
        case ValueKind::Float32: return formatFloat(*value.get<float>());
        case ValueKind::Float64: return formatDouble(*value.get<double>());
        case ValueKind::String: return *value.get<std::string>();
        case ValueKind::Blob: return toHex(*value.get<Blob>());
        case ValueKind::Reference: return std::to_string(value.get<NodeRef>()->id);
        case ValueKind::Vector3: {
            const Vector3& v = *value.get<Vector3>();
            return formatFloat(v.x) + "," + formatFloat(v.y) + "," + formatFloat(v.z);
        }
        case ValueKind::Hash32: return formatHash(value.get<Hash32>()->value);
    }
    return {};
}

Value parseValue(ValueKind kind, std::string_view text) {
    switch (kind) {
        case ValueKind::Bool: {
            std::string_view t = trim(text);
            if (t == "true" || t == "1") return Value(true);
            if (t == "false" || t == "0") return Value(false);
            fail(kind, text, "expected true or false");
        }
        case ValueKind::Int8: return Value(parseInteger<int8_t>(kind, text));
        case ValueKind::UInt8: return Value(parseInteger<uint8_t>(kind, text));
        case ValueKind::Int16: return Value(parseInteger<int16_t>(kind, text));
        case ValueKind::UInt16: return Value(parseInteger<uint16_t>(kind, text));
        case ValueKind::Int32: return Value(parseInteger<int32_t>(kind, text));
        case ValueKind::UInt32: return Value(parseInteger<uint32_t>(kind, text));
        case ValueKind::Int64: return Value(parseInteger<int64_t>(kind, text));
        case ValueKind::UInt64: return Value(parseInteger<uint64_t>(kind, text));
        case ValueKind::Float32: return Value(parseFloat(text));
        case ValueKind::Float64: return Value(parseDouble(text));
        case ValueKind::String: return Value(std::string(text));
        case ValueKind::Blob: return Value(fromHex(text));
        case ValueKind::Reference: return Value(NodeRef{parseInteger<uint64_t>(kind, text)});
        case ValueKind::Vector3: {
            size_t first = text.find(',');
            size_t second = first == std::string_view::npos ? first : text.find(',', first + 1);
            if (second == std::string_view::npos || text.find(',', second + 1) != std::string_view::npos) {
                fail(kind, text, "expected three comma separated components");
            }
            Vector3 v;
            v.x = parseFloat(text.substr(0, first));
            v.y = parseFloat(text.substr(first + 1, second - first - 1));
            v.z = parseFloat(text.substr(second + 1));
            return Value(v);
        }
        case ValueKind::Hash32: {
            auto hash = parseHash(trim(text));
            if (!hash) {
                fail(kind, text, "expected 8 hex digits");
            }
            return Value(Hash32{*hash});
        }
    }
    fail(kind, text, "unknown kind");
}

} // namespace ValueFormat
} // namespace FCBForge
