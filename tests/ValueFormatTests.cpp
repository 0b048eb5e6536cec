#include <gtest/gtest.h>

#include <bit>
#include <cmath>
#include <limits>

#include "core/FCBError.h"
#include "plugins/XML/ValueFormat.h"

using namespace FCBForge;

namespace {

bool failsWithMarkupError(ValueKind kind, const std::string& text) {
    try {
        ValueFormat::parseValue(kind, text);
    } catch (const FCBError& e) {
        return e.kind() == ErrorKind::MarkupError;
    }
    return false;
}

} // namespace

TEST(ValueFormat, FloatsUseShortestRoundTripForm) {
    EXPECT_EQ(ValueFormat::formatFloat(0.1f), "0.1");
    EXPECT_EQ(ValueFormat::formatFloat(20.0f), "20");
    EXPECT_EQ(ValueFormat::formatDouble(0.1), "0.1");

    for (float value : {0.1f, 1.0f / 3.0f, 123456.78f, 1e-30f, -7.5e12f, std::numeric_limits<float>::max()}) {
        float parsed = ValueFormat::parseFloat(ValueFormat::formatFloat(value));
        EXPECT_EQ(std::bit_cast<uint32_t>(parsed), std::bit_cast<uint32_t>(value)) << value;
    }
}

TEST(ValueFormat, NegativeZeroKeepsItsSign) {
    std::string text = ValueFormat::formatFloat(-0.0f);
    EXPECT_EQ(text, "-0");
    EXPECT_EQ(std::bit_cast<uint32_t>(ValueFormat::parseFloat(text)), 0x80000000u);
}

TEST(ValueFormat, NonFiniteValuesUseRawBits) {
    float nan = std::bit_cast<float>(0x7FC00123u);
    EXPECT_EQ(ValueFormat::formatFloat(nan), "bits:0x7FC00123");
    EXPECT_EQ(std::bit_cast<uint32_t>(ValueFormat::parseFloat("bits:0x7FC00123")), 0x7FC00123u);

    EXPECT_EQ(ValueFormat::formatFloat(std::numeric_limits<float>::infinity()), "bits:0x7F800000");
    EXPECT_EQ(ValueFormat::formatDouble(-std::numeric_limits<double>::infinity()), "bits:0xFFF0000000000000");

    // raw bits are accepted for finite values too
    EXPECT_EQ(ValueFormat::parseFloat("bits:0x3F800000"), 1.0f);
    EXPECT_TRUE(failsWithMarkupError(ValueKind::Float32, "bits:0xZZ"));
}

TEST(ValueFormat, UserTypedDecimalsRoundToNearest) {
    EXPECT_EQ(ValueFormat::parseFloat("1.00000001"), 1.0f);
    EXPECT_EQ(ValueFormat::parseFloat(" 2.5 "), 2.5f);
    EXPECT_TRUE(failsWithMarkupError(ValueKind::Float32, "2.5m"));
    EXPECT_TRUE(failsWithMarkupError(ValueKind::Float64, ""));
}

TEST(ValueFormat, IntegersAreRangeChecked) {
    EXPECT_EQ(*ValueFormat::parseValue(ValueKind::Int8, "-128").get<int8_t>(), -128);
    EXPECT_TRUE(failsWithMarkupError(ValueKind::Int8, "200"));
    EXPECT_TRUE(failsWithMarkupError(ValueKind::UInt32, "-1"));
    EXPECT_TRUE(failsWithMarkupError(ValueKind::UInt16, "12abc"));
    EXPECT_EQ(*ValueFormat::parseValue(ValueKind::UInt64, "18446744073709551615").get<uint64_t>(),
              std::numeric_limits<uint64_t>::max());
}

TEST(ValueFormat, BooleansAndReferences) {
    EXPECT_EQ(ValueFormat::formatValue(Value(true)), "true");
    EXPECT_EQ(*ValueFormat::parseValue(ValueKind::Bool, "0").get<bool>(), false);
    EXPECT_TRUE(failsWithMarkupError(ValueKind::Bool, "yes"));

    Value reference = ValueFormat::parseValue(ValueKind::Reference, "4096");
    EXPECT_EQ(reference.kind(), ValueKind::Reference);
    EXPECT_EQ(reference.get<NodeRef>()->id, 4096u);
}

TEST(ValueFormat, Vector3NeedsThreeComponents) {
    Value v = ValueFormat::parseValue(ValueKind::Vector3, "1, 2.5, -3");
    EXPECT_EQ(v.get<Vector3>()->x, 1.0f);
    EXPECT_EQ(v.get<Vector3>()->y, 2.5f);
    EXPECT_EQ(v.get<Vector3>()->z, -3.0f);
    EXPECT_EQ(ValueFormat::formatValue(v), "1,2.5,-3");

    EXPECT_TRUE(failsWithMarkupError(ValueKind::Vector3, "1,2"));
    EXPECT_TRUE(failsWithMarkupError(ValueKind::Vector3, "1,2,3,4"));
}

TEST(ValueFormat, HashesAndBlobsUseUpperCaseHex) {
    EXPECT_EQ(ValueFormat::formatValue(Value(Hash32{0x00AB12CD})), "00AB12CD");
    EXPECT_EQ(ValueFormat::parseValue(ValueKind::Hash32, "00ab12cd").get<Hash32>()->value, 0x00AB12CDu);
    EXPECT_TRUE(failsWithMarkupError(ValueKind::Hash32, "AB12"));

    EXPECT_EQ(ValueFormat::toHex(std::vector<uint8_t>{0x0A, 0xFF, 0x00}), "0AFF00");
    EXPECT_EQ(ValueFormat::fromHex(" 0a ff\n00 "), (std::vector<uint8_t>{0x0A, 0xFF, 0x00}));
    EXPECT_TRUE(failsWithMarkupError(ValueKind::Blob, "ABC"));
    EXPECT_TRUE(failsWithMarkupError(ValueKind::Blob, "0G"));
}

TEST(ValueFormat, StringsAreVerbatim) {
    EXPECT_EQ(*ValueFormat::parseValue(ValueKind::String, "  padded <&> ").get<std::string>(), "  padded <&> ");
}
