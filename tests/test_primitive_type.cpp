#include <gtest/gtest.h>
#include "sbeir/primitive_type.hpp"
#include "sbeir/primitive_value.hpp"

#include <cmath>
#include <limits>

using namespace sbeir;

namespace {

constexpr PrimitiveType ALL_TYPES[] = {
    PrimitiveType::Char,   PrimitiveType::Int8,   PrimitiveType::Int16,  PrimitiveType::Int32,
    PrimitiveType::Int64,  PrimitiveType::UInt8,  PrimitiveType::UInt16, PrimitiveType::UInt32,
    PrimitiveType::UInt64, PrimitiveType::Float,  PrimitiveType::Double,
};

}  // namespace

// ============================================================================
// Names and sizes
// ============================================================================

TEST(PrimitiveTypeTest, NamesRoundTrip) {
    for (auto type : ALL_TYPES) {
        auto name = primitiveTypeName(type);
        auto parsed = primitiveTypeFromName(name);
        ASSERT_TRUE(parsed.has_value()) << name;
        EXPECT_EQ(*parsed, type);
    }
    EXPECT_EQ(primitiveTypeName(PrimitiveType::UInt16), "uint16");
    EXPECT_EQ(primitiveTypeName(PrimitiveType::Double), "double");
}

TEST(PrimitiveTypeTest, UnknownNameRejected) {
    EXPECT_FALSE(primitiveTypeFromName("int128").has_value());
    EXPECT_FALSE(primitiveTypeFromName("UINT8").has_value());
    EXPECT_FALSE(primitiveTypeFromName("").has_value());
}

TEST(PrimitiveTypeTest, Sizes) {
    EXPECT_EQ(primitiveTypeSize(PrimitiveType::Char), 1u);
    EXPECT_EQ(primitiveTypeSize(PrimitiveType::Int8), 1u);
    EXPECT_EQ(primitiveTypeSize(PrimitiveType::UInt8), 1u);
    EXPECT_EQ(primitiveTypeSize(PrimitiveType::Int16), 2u);
    EXPECT_EQ(primitiveTypeSize(PrimitiveType::UInt16), 2u);
    EXPECT_EQ(primitiveTypeSize(PrimitiveType::Int32), 4u);
    EXPECT_EQ(primitiveTypeSize(PrimitiveType::UInt32), 4u);
    EXPECT_EQ(primitiveTypeSize(PrimitiveType::Float), 4u);
    EXPECT_EQ(primitiveTypeSize(PrimitiveType::Int64), 8u);
    EXPECT_EQ(primitiveTypeSize(PrimitiveType::UInt64), 8u);
    EXPECT_EQ(primitiveTypeSize(PrimitiveType::Double), 8u);
}

TEST(PrimitiveTypeTest, Classification) {
    EXPECT_TRUE(isFloatingPoint(PrimitiveType::Float));
    EXPECT_TRUE(isFloatingPoint(PrimitiveType::Double));
    EXPECT_FALSE(isFloatingPoint(PrimitiveType::Int64));

    EXPECT_TRUE(isUnsigned(PrimitiveType::UInt8));
    EXPECT_TRUE(isUnsigned(PrimitiveType::UInt64));
    EXPECT_FALSE(isUnsigned(PrimitiveType::Char));
    EXPECT_FALSE(isUnsigned(PrimitiveType::Int32));

    EXPECT_TRUE(isIntegral(PrimitiveType::Char));
    EXPECT_FALSE(isIntegral(PrimitiveType::Float));
}

// ============================================================================
// Sentinels
// ============================================================================

TEST(PrimitiveTypeTest, SentinelSizesMatchType) {
    for (auto type : ALL_TYPES) {
        EXPECT_EQ(primitiveNullValue(type).size(), primitiveTypeSize(type)) << primitiveTypeName(type);
        EXPECT_EQ(primitiveMinValue(type).size(), primitiveTypeSize(type)) << primitiveTypeName(type);
        EXPECT_EQ(primitiveMaxValue(type).size(), primitiveTypeSize(type)) << primitiveTypeName(type);
    }
}

TEST(PrimitiveTypeTest, IntegerNullOutsideRange) {
    for (auto type : ALL_TYPES) {
        if (isFloatingPoint(type) || type == PrimitiveType::UInt64) continue;

        auto null = primitiveNullValue(type).asIntegral();
        auto min = primitiveMinValue(type).asIntegral();
        auto max = primitiveMaxValue(type).asIntegral();
        EXPECT_TRUE(null < min || null > max) << primitiveTypeName(type);
    }
}

TEST(PrimitiveTypeTest, UInt64SentinelsAreBitPatterns) {
    auto null = static_cast<uint64_t>(primitiveNullValue(PrimitiveType::UInt64).asIntegral());
    auto max = static_cast<uint64_t>(primitiveMaxValue(PrimitiveType::UInt64).asIntegral());
    EXPECT_EQ(null, std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(max, std::numeric_limits<uint64_t>::max() - 1);
    EXPECT_EQ(primitiveMinValue(PrimitiveType::UInt64).asIntegral(), 0);
}

TEST(PrimitiveTypeTest, CatalogValues) {
    EXPECT_EQ(primitiveNullValue(PrimitiveType::Char).asIntegral(), 0);
    EXPECT_EQ(primitiveMinValue(PrimitiveType::Char).asIntegral(), 0x20);
    EXPECT_EQ(primitiveMaxValue(PrimitiveType::Char).asIntegral(), 0x7E);

    EXPECT_EQ(primitiveNullValue(PrimitiveType::Int8).asIntegral(), -128);
    EXPECT_EQ(primitiveMinValue(PrimitiveType::Int8).asIntegral(), -127);
    EXPECT_EQ(primitiveMaxValue(PrimitiveType::Int8).asIntegral(), 127);

    EXPECT_EQ(primitiveNullValue(PrimitiveType::UInt32).asIntegral(), 4294967295LL);
    EXPECT_EQ(primitiveMaxValue(PrimitiveType::UInt32).asIntegral(), 4294967294LL);

    EXPECT_EQ(primitiveNullValue(PrimitiveType::Int64).asIntegral(), std::numeric_limits<int64_t>::min());
    EXPECT_EQ(primitiveMinValue(PrimitiveType::Int64).asIntegral(), std::numeric_limits<int64_t>::min() + 1);
}

TEST(PrimitiveTypeTest, FloatingSentinels) {
    EXPECT_TRUE(std::isnan(primitiveNullValue(PrimitiveType::Float).asFloating()));
    EXPECT_TRUE(std::isnan(primitiveNullValue(PrimitiveType::Double).asFloating()));

    EXPECT_DOUBLE_EQ(primitiveMinValue(PrimitiveType::Float).asFloating(),
                     static_cast<double>(std::numeric_limits<float>::denorm_min()));
    EXPECT_DOUBLE_EQ(primitiveMaxValue(PrimitiveType::Float).asFloating(),
                     static_cast<double>(std::numeric_limits<float>::max()));
    EXPECT_DOUBLE_EQ(primitiveMinValue(PrimitiveType::Double).asFloating(),
                     std::numeric_limits<double>::denorm_min());
    EXPECT_DOUBLE_EQ(primitiveMaxValue(PrimitiveType::Double).asFloating(),
                     std::numeric_limits<double>::max());
}

TEST(PrimitiveTypeTest, SentinelsAreStable) {
    // Catalog entries are process-wide; repeated lookups return the same object
    EXPECT_EQ(&primitiveNullValue(PrimitiveType::UInt16), &primitiveNullValue(PrimitiveType::UInt16));
}
