#pragma once

/**
 * @file primitive_type.hpp
 * @brief Catalog of primitive wire types and their sentinel values
 *
 * Every primitive has a fixed byte width and three reserved values:
 * null (absent), min and max. For integer types the null sentinel lies
 * outside [min, max] so presence needs no extra flag bit. For float and
 * double the null sentinel is NaN.
 *
 * The catalog is the only place sentinels are defined. It is built once on
 * first use and never mutated, so it is safe to read from any thread.
 */

#include <cstdint>
#include <optional>
#include <string_view>

namespace sbeir {

class PrimitiveValue;

enum class PrimitiveType : uint8_t {
    Char,
    Int8,
    Int16,
    Int32,
    Int64,
    UInt8,
    UInt16,
    UInt32,
    UInt64,
    Float,
    Double,
};

constexpr size_t PRIMITIVE_TYPE_COUNT = 11;

// ============================================================================
// Integer sentinels
// ============================================================================
//
// uint64 values are held in signed 64-bit storage as the two's-complement
// bit pattern of the unsigned value (NULL_VALUE_UINT64 is stored as -1).

constexpr int64_t NULL_VALUE_CHAR = 0;
constexpr int64_t MIN_VALUE_CHAR = 0x20;
constexpr int64_t MAX_VALUE_CHAR = 0x7E;

constexpr int64_t NULL_VALUE_INT8 = -128;
constexpr int64_t MIN_VALUE_INT8 = -127;
constexpr int64_t MAX_VALUE_INT8 = 127;

constexpr int64_t NULL_VALUE_UINT8 = 255;
constexpr int64_t MIN_VALUE_UINT8 = 0;
constexpr int64_t MAX_VALUE_UINT8 = 254;

constexpr int64_t NULL_VALUE_INT16 = -32768;
constexpr int64_t MIN_VALUE_INT16 = -32767;
constexpr int64_t MAX_VALUE_INT16 = 32767;

constexpr int64_t NULL_VALUE_UINT16 = 65535;
constexpr int64_t MIN_VALUE_UINT16 = 0;
constexpr int64_t MAX_VALUE_UINT16 = 65534;

constexpr int64_t NULL_VALUE_INT32 = -2147483647LL - 1;
constexpr int64_t MIN_VALUE_INT32 = -2147483647LL;
constexpr int64_t MAX_VALUE_INT32 = 2147483647LL;

constexpr int64_t NULL_VALUE_UINT32 = 4294967295LL;
constexpr int64_t MIN_VALUE_UINT32 = 0;
constexpr int64_t MAX_VALUE_UINT32 = 4294967294LL;

constexpr int64_t NULL_VALUE_INT64 = -9223372036854775807LL - 1;
constexpr int64_t MIN_VALUE_INT64 = -9223372036854775807LL;
constexpr int64_t MAX_VALUE_INT64 = 9223372036854775807LL;

constexpr int64_t NULL_VALUE_UINT64 = static_cast<int64_t>(0xFFFFFFFFFFFFFFFFULL);
constexpr int64_t MIN_VALUE_UINT64 = 0;
constexpr int64_t MAX_VALUE_UINT64 = static_cast<int64_t>(0xFFFFFFFFFFFFFFFEULL);

// ============================================================================
// Catalog lookups
// ============================================================================

/// Schema name of a type ("char", "int8", ..., "double")
[[nodiscard]] std::string_view primitiveTypeName(PrimitiveType type);

/// Reverse of primitiveTypeName. Returns nullopt for unknown names.
[[nodiscard]] std::optional<PrimitiveType> primitiveTypeFromName(std::string_view name);

/// Encoded width in bytes
[[nodiscard]] uint32_t primitiveTypeSize(PrimitiveType type);

[[nodiscard]] const PrimitiveValue& primitiveNullValue(PrimitiveType type);
[[nodiscard]] const PrimitiveValue& primitiveMinValue(PrimitiveType type);
[[nodiscard]] const PrimitiveValue& primitiveMaxValue(PrimitiveType type);

[[nodiscard]] constexpr bool isFloatingPoint(PrimitiveType type) {
    return type == PrimitiveType::Float || type == PrimitiveType::Double;
}

[[nodiscard]] constexpr bool isUnsigned(PrimitiveType type) {
    return type == PrimitiveType::UInt8 || type == PrimitiveType::UInt16 ||
           type == PrimitiveType::UInt32 || type == PrimitiveType::UInt64;
}

/// True for char and all integer types (everything stored as Integral)
[[nodiscard]] constexpr bool isIntegral(PrimitiveType type) {
    return !isFloatingPoint(type);
}

}  // namespace sbeir
