#include "sbeir/primitive_type.hpp"
#include "sbeir/primitive_value.hpp"

#include <array>
#include <limits>
#include <string>

namespace sbeir {

namespace {

struct CatalogEntry {
    std::string_view name;
    uint32_t size;
    PrimitiveValue nullValue;
    PrimitiveValue minValue;
    PrimitiveValue maxValue;
};

CatalogEntry integralEntry(std::string_view name, uint32_t size,
                           int64_t nullValue, int64_t minValue, int64_t maxValue) {
    return CatalogEntry{
        name,
        size,
        PrimitiveValue::fromIntegral(nullValue, size),
        PrimitiveValue::fromIntegral(minValue, size),
        PrimitiveValue::fromIntegral(maxValue, size),
    };
}

CatalogEntry floatingEntry(std::string_view name, uint32_t size,
                           double minValue, double maxValue) {
    return CatalogEntry{
        name,
        size,
        PrimitiveValue::fromFloating(std::numeric_limits<double>::quiet_NaN(), size),
        PrimitiveValue::fromFloating(minValue, size),
        PrimitiveValue::fromFloating(maxValue, size),
    };
}

// Indexed by PrimitiveType. Order must match the enum.
const std::array<CatalogEntry, PRIMITIVE_TYPE_COUNT>& catalog() {
    static const std::array<CatalogEntry, PRIMITIVE_TYPE_COUNT> entries = {
        integralEntry("char", 1, NULL_VALUE_CHAR, MIN_VALUE_CHAR, MAX_VALUE_CHAR),
        integralEntry("int8", 1, NULL_VALUE_INT8, MIN_VALUE_INT8, MAX_VALUE_INT8),
        integralEntry("int16", 2, NULL_VALUE_INT16, MIN_VALUE_INT16, MAX_VALUE_INT16),
        integralEntry("int32", 4, NULL_VALUE_INT32, MIN_VALUE_INT32, MAX_VALUE_INT32),
        integralEntry("int64", 8, NULL_VALUE_INT64, MIN_VALUE_INT64, MAX_VALUE_INT64),
        integralEntry("uint8", 1, NULL_VALUE_UINT8, MIN_VALUE_UINT8, MAX_VALUE_UINT8),
        integralEntry("uint16", 2, NULL_VALUE_UINT16, MIN_VALUE_UINT16, MAX_VALUE_UINT16),
        integralEntry("uint32", 4, NULL_VALUE_UINT32, MIN_VALUE_UINT32, MAX_VALUE_UINT32),
        integralEntry("uint64", 8, NULL_VALUE_UINT64, MIN_VALUE_UINT64, MAX_VALUE_UINT64),
        floatingEntry("float", 4,
                      std::numeric_limits<float>::denorm_min(),
                      std::numeric_limits<float>::max()),
        floatingEntry("double", 8,
                      std::numeric_limits<double>::denorm_min(),
                      std::numeric_limits<double>::max()),
    };
    return entries;
}

const CatalogEntry& lookup(PrimitiveType type) {
    return catalog()[static_cast<size_t>(type)];
}

}  // namespace

std::string_view primitiveTypeName(PrimitiveType type) {
    return lookup(type).name;
}

std::optional<PrimitiveType> primitiveTypeFromName(std::string_view name) {
    const auto& entries = catalog();
    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].name == name) {
            return static_cast<PrimitiveType>(i);
        }
    }
    return std::nullopt;
}

uint32_t primitiveTypeSize(PrimitiveType type) {
    return lookup(type).size;
}

const PrimitiveValue& primitiveNullValue(PrimitiveType type) {
    return lookup(type).nullValue;
}

const PrimitiveValue& primitiveMinValue(PrimitiveType type) {
    return lookup(type).minValue;
}

const PrimitiveValue& primitiveMaxValue(PrimitiveType type) {
    return lookup(type).maxValue;
}

}  // namespace sbeir
