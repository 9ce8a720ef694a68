#include "sbeir/primitive_value.hpp"
#include "sbeir/character_encoding.hpp"
#include "sbeir/errors.hpp"

#include <charconv>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <ostream>

namespace sbeir {

namespace {

size_t combineHash(size_t seed, size_t value) {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

// Every NaN compares and hashes as the canonical quiet NaN; signed zeros stay distinct
uint64_t doubleBits(double value) {
    if (std::isnan(value)) {
        return 0x7ff8000000000000ULL;
    }
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return bits;
}

std::string describe(std::string_view text, PrimitiveType type) {
    return "'" + std::string(text) + "' for type " + std::string(primitiveTypeName(type));
}

int64_t parseInteger(std::string_view text, PrimitiveType type) {
    std::string_view digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
        // "+-5" is not a number
        if (!digits.empty() && digits.front() == '-') {
            throw FormatError("Malformed integer literal " + describe(text, type));
        }
    }
    if (digits.empty()) {
        throw FormatError("Empty integer literal for type " + std::string(primitiveTypeName(type)));
    }

    const char* first = digits.data();
    const char* last = digits.data() + digits.size();

    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec == std::errc() && ptr == last) {
        return value;
    }

    // uint64 literals above INT64_MAX keep their unsigned bit pattern
    if (ec == std::errc::result_out_of_range && type == PrimitiveType::UInt64 && digits.front() != '-') {
        uint64_t unsignedValue = 0;
        auto [uptr, uec] = std::from_chars(first, last, unsignedValue);
        if (uec == std::errc() && uptr == last) {
            return static_cast<int64_t>(unsignedValue);
        }
    }

    if (ec == std::errc::result_out_of_range) {
        throw FormatError("Integer literal out of 64-bit range " + describe(text, type));
    }
    throw FormatError("Malformed integer literal " + describe(text, type));
}

double parseReal(std::string_view text, PrimitiveType type) {
    if (text.empty() || std::isspace(static_cast<unsigned char>(text.front()))) {
        throw FormatError("Malformed real literal " + describe(text, type));
    }

    std::string owned(text);
    char* end = nullptr;
    double value = std::strtod(owned.c_str(), &end);
    if (end != owned.c_str() + owned.size()) {
        throw FormatError("Malformed real literal " + describe(text, type));
    }
    return value;
}

std::string formatReal(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value < 0 ? "-Infinity" : "Infinity";

    char buffer[32];
    auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    std::string text(buffer, ptr);
    if (text.find_first_of(".e") == std::string::npos) {
        text += ".0";
    }
    return text;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

PrimitiveValue PrimitiveValue::fromIntegral(int64_t value, uint32_t size) {
    return PrimitiveValue(Storage(std::in_place_index<0>, value), size);
}

PrimitiveValue PrimitiveValue::fromFloating(double value, uint32_t size) {
    return PrimitiveValue(Storage(std::in_place_index<1>, value), size);
}

PrimitiveValue PrimitiveValue::fromRawBytes(std::vector<uint8_t> bytes,
                                            std::optional<std::string> characterEncoding,
                                            uint32_t size) {
    return PrimitiveValue(Storage(std::in_place_index<2>,
                                  RawBytes{std::move(bytes), std::move(characterEncoding)}),
                          size);
}

PrimitiveValue PrimitiveValue::parse(std::string_view text, PrimitiveType type) {
    switch (type) {
        case PrimitiveType::Char:
            if (text.size() != 1) {
                throw FormatError("Constant char value malformed: '" + std::string(text) + "'");
            }
            return fromIntegral(static_cast<unsigned char>(text.front()), 1);

        case PrimitiveType::Int8:
        case PrimitiveType::Int16:
        case PrimitiveType::Int32:
        case PrimitiveType::Int64:
        case PrimitiveType::UInt8:
        case PrimitiveType::UInt16:
        case PrimitiveType::UInt32:
        case PrimitiveType::UInt64:
            return fromIntegral(parseInteger(text, type), primitiveTypeSize(type));

        case PrimitiveType::Float:
        case PrimitiveType::Double:
            return fromFloating(parseReal(text, type), primitiveTypeSize(type));
    }

    throw FormatError("Unknown primitive type tag " + std::to_string(static_cast<int>(type)));
}

PrimitiveValue PrimitiveValue::parse(std::string_view text, PrimitiveType type,
                                     uint32_t length, std::string_view characterEncoding) {
    auto bytes = encodeText(text, characterEncoding);
    if (bytes.size() > length) {
        throw FormatError("Value '" + std::string(text) + "' needs " + std::to_string(bytes.size()) +
                          " bytes in " + std::string(characterEncoding) +
                          " but " + std::string(primitiveTypeName(type)) +
                          " array length is " + std::to_string(length));
    }
    return fromRawBytes(std::move(bytes), std::string(characterEncoding), length);
}

// ============================================================================
// Accessors
// ============================================================================

PrimitiveValue::Representation PrimitiveValue::representation() const {
    return static_cast<Representation>(storage_.index());
}

int64_t PrimitiveValue::asIntegral() const {
    if (const auto* value = std::get_if<int64_t>(&storage_)) {
        return *value;
    }
    throw RepresentationMismatch("PrimitiveValue is not an Integral representation (holds " +
                                 std::string(representationName(representation())) + ")");
}

double PrimitiveValue::asFloating() const {
    if (const auto* value = std::get_if<double>(&storage_)) {
        return *value;
    }
    throw RepresentationMismatch("PrimitiveValue is not a Floating representation (holds " +
                                 std::string(representationName(representation())) + ")");
}

const std::vector<uint8_t>& PrimitiveValue::asRawBytes() const {
    if (const auto* value = std::get_if<RawBytes>(&storage_)) {
        return value->bytes;
    }
    throw RepresentationMismatch("PrimitiveValue is not a RawBytes representation (holds " +
                                 std::string(representationName(representation())) + ")");
}

std::vector<uint8_t> PrimitiveValue::asRawBytes(PrimitiveType type) const {
    if (const auto* value = std::get_if<RawBytes>(&storage_)) {
        return value->bytes;
    }
    if (const auto* value = std::get_if<int64_t>(&storage_)) {
        if (size_ == 1 && type == PrimitiveType::Char) {
            return {static_cast<uint8_t>(*value)};
        }
    }
    throw RepresentationMismatch("PrimitiveValue (" + std::string(representationName(representation())) +
                                 ", size " + std::to_string(size_) +
                                 ") cannot be read as bytes of " + std::string(primitiveTypeName(type)));
}

const std::optional<std::string>& PrimitiveValue::characterEncoding() const {
    static const std::optional<std::string> none;
    if (const auto* value = std::get_if<RawBytes>(&storage_)) {
        return value->characterEncoding;
    }
    return none;
}

std::string PrimitiveValue::toString() const {
    switch (representation()) {
        case Representation::Integral:
            return std::to_string(std::get<int64_t>(storage_));

        case Representation::Floating:
            return formatReal(std::get<double>(storage_));

        case Representation::RawBytes: {
            const auto& raw = std::get<RawBytes>(storage_);
            return decodeText(raw.bytes, raw.characterEncoding.value_or(std::string(DEFAULT_CHARACTER_ENCODING)));
        }
    }
    return {};
}

// ============================================================================
// Equality and hashing
// ============================================================================

bool PrimitiveValue::operator==(const PrimitiveValue& other) const {
    if (storage_.index() != other.storage_.index()) {
        return false;
    }

    switch (representation()) {
        case Representation::Integral:
            return std::get<int64_t>(storage_) == std::get<int64_t>(other.storage_);

        case Representation::Floating:
            return doubleBits(std::get<double>(storage_)) == doubleBits(std::get<double>(other.storage_));

        case Representation::RawBytes:
            return std::get<RawBytes>(storage_).bytes == std::get<RawBytes>(other.storage_).bytes;
    }
    return false;
}

size_t PrimitiveValue::hash() const {
    size_t seed = std::hash<size_t>{}(storage_.index());

    switch (representation()) {
        case Representation::Integral:
            return combineHash(seed, std::hash<int64_t>{}(std::get<int64_t>(storage_)));

        case Representation::Floating:
            return combineHash(seed, std::hash<uint64_t>{}(doubleBits(std::get<double>(storage_))));

        case Representation::RawBytes:
            for (uint8_t byte : std::get<RawBytes>(storage_).bytes) {
                seed = combineHash(seed, byte);
            }
            return seed;
    }
    return seed;
}

std::string_view representationName(PrimitiveValue::Representation representation) {
    switch (representation) {
        case PrimitiveValue::Representation::Integral: return "Integral";
        case PrimitiveValue::Representation::Floating: return "Floating";
        case PrimitiveValue::Representation::RawBytes: return "RawBytes";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, const PrimitiveValue& value) {
    return os << value.toString();
}

}  // namespace sbeir
