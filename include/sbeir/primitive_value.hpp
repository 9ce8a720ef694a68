#pragma once

/**
 * @file primitive_value.hpp
 * @brief Literal, constant and sentinel values of primitive wire types
 *
 * A PrimitiveValue holds exactly one representation:
 * - Integral: all char and integer types (int64_t storage)
 * - Floating: float and double (double storage)
 * - RawBytes: fixed-length character arrays, with an optional encoding name
 *
 * Every value also records its serialization width, independent of the
 * representation (a char constant is Integral with size 1).
 *
 * Values are immutable once built. Equality compares floating values by bit
 * pattern, so the NaN null sentinel equals itself and values can be used as
 * hash keys.
 */

#include "sbeir/primitive_type.hpp"

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sbeir {

class PrimitiveValue {
public:
    enum class Representation : uint8_t {
        Integral,
        Floating,
        RawBytes,
    };

    // ========================================================================
    // Construction
    // ========================================================================

    [[nodiscard]] static PrimitiveValue fromIntegral(int64_t value, uint32_t size);
    [[nodiscard]] static PrimitiveValue fromFloating(double value, uint32_t size);
    [[nodiscard]] static PrimitiveValue fromRawBytes(std::vector<uint8_t> bytes,
                                                     std::optional<std::string> characterEncoding,
                                                     uint32_t size);

    /**
     * @brief Parse a scalar literal for the given type
     *
     * char takes exactly one character. Integer types take a decimal integer
     * and get the type's width; the type's [min, max] range is not checked.
     * uint64 also accepts values above INT64_MAX, stored as their bit pattern.
     * float and double take a decimal real number.
     *
     * @throws FormatError on malformed text
     */
    [[nodiscard]] static PrimitiveValue parse(std::string_view text, PrimitiveType type);

    /**
     * @brief Parse a fixed-length character array literal
     *
     * Encodes @p text (UTF-8) into @p characterEncoding. The result is
     * RawBytes of the given length; the encoded bytes are not padded.
     *
     * @throws FormatError if the encoding is unknown, the text is not
     *         representable, or the encoded text is longer than @p length
     */
    [[nodiscard]] static PrimitiveValue parse(std::string_view text, PrimitiveType type,
                                              uint32_t length, std::string_view characterEncoding);

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] Representation representation() const;

    /// @throws RepresentationMismatch unless Integral
    [[nodiscard]] int64_t asIntegral() const;

    /// @throws RepresentationMismatch unless Floating
    [[nodiscard]] double asFloating() const;

    /// @throws RepresentationMismatch unless RawBytes
    [[nodiscard]] const std::vector<uint8_t>& asRawBytes() const;

    /// Like asRawBytes(), but an Integral of size 1 read as char becomes a
    /// one-byte sequence.
    /// @throws RepresentationMismatch for any other mismatch
    [[nodiscard]] std::vector<uint8_t> asRawBytes(PrimitiveType type) const;

    /// Serialization width in bytes
    [[nodiscard]] uint32_t size() const { return size_; }

    /// Encoding recorded for a RawBytes value, if any
    [[nodiscard]] const std::optional<std::string>& characterEncoding() const;

    [[nodiscard]] bool isIntegral() const { return representation() == Representation::Integral; }
    [[nodiscard]] bool isFloating() const { return representation() == Representation::Floating; }
    [[nodiscard]] bool isRawBytes() const { return representation() == Representation::RawBytes; }

    /// Decimal for Integral, shortest round-trip form for Floating ("5.0",
    /// "NaN", "Infinity"), decoded text for RawBytes.
    /// Integral values print as signed 64-bit: a uint64 above INT64_MAX shows
    /// its bit pattern, so 2^64-2 prints as "-2".
    [[nodiscard]] std::string toString() const;

    /// Floating values compare by bit pattern with every NaN treated as one
    /// value, so 0.0 != -0.0 but any NaN equals the float/double null.
    bool operator==(const PrimitiveValue& other) const;
    bool operator!=(const PrimitiveValue& other) const { return !(*this == other); }

    [[nodiscard]] size_t hash() const;

private:
    struct RawBytes {
        std::vector<uint8_t> bytes;
        std::optional<std::string> characterEncoding;
    };

    // Variant index matches Representation
    using Storage = std::variant<int64_t, double, RawBytes>;

    PrimitiveValue(Storage storage, uint32_t size) : storage_(std::move(storage)), size_(size) {}

    Storage storage_;
    uint32_t size_ = 0;
};

[[nodiscard]] std::string_view representationName(PrimitiveValue::Representation representation);

std::ostream& operator<<(std::ostream& os, const PrimitiveValue& value);

}  // namespace sbeir

template<>
struct std::hash<sbeir::PrimitiveValue> {
    size_t operator()(const sbeir::PrimitiveValue& value) const noexcept {
        return value.hash();
    }
};
