#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/Resource/Value.h"

namespace FCBForge {

/**
 * @brief Canonical text forms of attribute values in markup
 *
 * Formatting is canonical so that format(parse(format(v))) == format(v):
 *  - integers in decimal, '-' only when negative
 *  - floats as the shortest decimal that parses back to the same bits;
 *    NaN and infinities as bits:0xXXXXXXXX (16 digits for Float64)
 *  - Vector3 as "x,y,z", Bool as true/false, Hash32 as 8 hex digits
 *  - Blob as upper-case hex, Ref as a decimal ID, strings verbatim
 *
 * Parsing throws FCBError(MarkupError) on text the kind cannot hold.
 */
namespace ValueFormat {

std::string formatValue(const Value& value);
Value parseValue(ValueKind kind, std::string_view text);

std::string formatFloat(float value);
std::string formatDouble(double value);
float parseFloat(std::string_view text);
double parseDouble(std::string_view text);

std::string toHex(const uint8_t* data, size_t size);
std::string toHex(const std::vector<uint8_t>& data);
// Whitespace between digits is ignored
std::vector<uint8_t> fromHex(std::string_view text);

} // namespace ValueFormat

} // namespace FCBForge
