#pragma once

/**
 * @file cbor.hpp
 * @brief Minimal CBOR (RFC 8949) encoding and bounds-checked decoding
 *
 * Only definite-length items are produced or accepted. The decoder throws
 * IrFormatError on truncated or unexpected input instead of reading past
 * the end of its buffer.
 */

#include "sbeir/errors.hpp"

#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sbeir {
namespace cbor {

// CBOR major types
constexpr uint8_t UNSIGNED_INT = 0;
constexpr uint8_t NEGATIVE_INT = 1;
constexpr uint8_t BYTE_STRING = 2;
constexpr uint8_t TEXT_STRING = 3;
constexpr uint8_t ARRAY = 4;
constexpr uint8_t MAP = 5;
constexpr uint8_t SIMPLE = 7;

// Simple values
constexpr uint8_t FALSE_VALUE = 20;
constexpr uint8_t TRUE_VALUE = 21;
constexpr uint8_t NULL_VALUE = 22;
constexpr uint8_t FLOAT64 = 27;

constexpr size_t MAX_NESTING = 64;

// ============================================================================
// Encoding
// ============================================================================

// Encode a CBOR header (major type + argument), big-endian argument bytes
inline void encodeHeader(std::vector<uint8_t>& out, uint8_t majorType, uint64_t value) {
    uint8_t mt = static_cast<uint8_t>(majorType << 5);

    int width;
    if (value < 24) {
        out.push_back(mt | static_cast<uint8_t>(value));
        return;
    } else if (value <= 0xFF) {
        out.push_back(mt | 24);
        width = 1;
    } else if (value <= 0xFFFF) {
        out.push_back(mt | 25);
        width = 2;
    } else if (value <= 0xFFFFFFFF) {
        out.push_back(mt | 26);
        width = 4;
    } else {
        out.push_back(mt | 27);
        width = 8;
    }
    for (int i = width - 1; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

inline void encodeUInt(std::vector<uint8_t>& out, uint64_t value) {
    encodeHeader(out, UNSIGNED_INT, value);
}

inline void encodeInt(std::vector<uint8_t>& out, int64_t value) {
    if (value >= 0) {
        encodeHeader(out, UNSIGNED_INT, static_cast<uint64_t>(value));
    } else {
        encodeHeader(out, NEGATIVE_INT, static_cast<uint64_t>(-1 - value));
    }
}

inline void encodeDouble(std::vector<uint8_t>& out, double value) {
    out.push_back((SIMPLE << 5) | FLOAT64);
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    for (int i = 7; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>(bits >> (i * 8)));
    }
}

inline void encodeString(std::vector<uint8_t>& out, std::string_view str) {
    encodeHeader(out, TEXT_STRING, str.size());
    out.insert(out.end(), str.begin(), str.end());
}

inline void encodeBytes(std::vector<uint8_t>& out, std::span<const uint8_t> bytes) {
    encodeHeader(out, BYTE_STRING, bytes.size());
    out.insert(out.end(), bytes.begin(), bytes.end());
}

inline void encodeNull(std::vector<uint8_t>& out) {
    out.push_back((SIMPLE << 5) | NULL_VALUE);
}

inline void encodeBool(std::vector<uint8_t>& out, bool value) {
    out.push_back((SIMPLE << 5) | (value ? TRUE_VALUE : FALSE_VALUE));
}

inline void encodeMapHeader(std::vector<uint8_t>& out, size_t count) {
    encodeHeader(out, MAP, count);
}

inline void encodeArrayHeader(std::vector<uint8_t>& out, size_t count) {
    encodeHeader(out, ARRAY, count);
}

/**
 * @brief Map whose entry count is only known once it is complete
 *
 * Entries are written to a side buffer; finish() emits the header followed
 * by the buffered entries.
 */
class MapWriter {
public:
    /// Write the key and return the buffer the value goes into
    std::vector<uint8_t>& key(std::string_view name) {
        ++count_;
        encodeString(body_, name);
        return body_;
    }

    void finish(std::vector<uint8_t>& out) const {
        encodeMapHeader(out, count_);
        out.insert(out.end(), body_.begin(), body_.end());
    }

private:
    std::vector<uint8_t> body_;
    size_t count_ = 0;
};

// ============================================================================
// Decoding
// ============================================================================

class Decoder {
public:
    explicit Decoder(std::span<const uint8_t> span) : data_(span.data()), size_(span.size()), pos_(0) {}

    [[nodiscard]] bool hasMore() const { return pos_ < size_; }
    [[nodiscard]] size_t position() const { return pos_; }
    [[nodiscard]] size_t remaining() const { return size_ - pos_; }

    /// @throws IrFormatError at end of input
    [[nodiscard]] uint8_t peek() const {
        require(1);
        return data_[pos_];
    }

    [[nodiscard]] bool peekNull() const {
        return pos_ < size_ && data_[pos_] == ((SIMPLE << 5) | NULL_VALUE);
    }

    uint8_t read() {
        require(1);
        return data_[pos_++];
    }

    // Read CBOR header, returns (major type, argument value)
    std::pair<uint8_t, uint64_t> readHeader() {
        uint8_t initial = read();
        uint8_t majorType = initial >> 5;
        uint8_t additional = initial & 0x1F;

        if (additional < 24) {
            return {majorType, additional};
        }

        int width;
        switch (additional) {
            case 24: width = 1; break;
            case 25: width = 2; break;
            case 26: width = 4; break;
            case 27: width = 8; break;
            default:
                throw IrFormatError("CBOR: indefinite or reserved length at offset " + std::to_string(pos_ - 1));
        }

        require(static_cast<size_t>(width));
        uint64_t value = 0;
        for (int i = 0; i < width; ++i) {
            value = (value << 8) | data_[pos_++];
        }
        return {majorType, value};
    }

    /// Read a header of the given major type and return its argument
    uint64_t expect(uint8_t majorType, std::string_view what) {
        auto [type, value] = readHeader();
        if (type != majorType) {
            throw IrFormatError("CBOR: expected " + std::string(what) + " at offset " + std::to_string(pos_));
        }
        return value;
    }

    uint64_t readArrayHeader() { return checkedCount(expect(ARRAY, "array")); }
    uint64_t readMapHeader() { return checkedCount(expect(MAP, "map")); }

    std::string readText() {
        auto length = expect(TEXT_STRING, "text string");
        require(length);
        std::string result(reinterpret_cast<const char*>(data_ + pos_), static_cast<size_t>(length));
        pos_ += static_cast<size_t>(length);
        return result;
    }

    std::vector<uint8_t> readBytes() {
        auto length = expect(BYTE_STRING, "byte string");
        require(length);
        std::vector<uint8_t> result(data_ + pos_, data_ + pos_ + length);
        pos_ += static_cast<size_t>(length);
        return result;
    }

    /// Text string, or nullopt for CBOR null
    std::optional<std::string> readOptionalText() {
        if (peekNull()) {
            ++pos_;
            return std::nullopt;
        }
        return readText();
    }

    bool readBool() {
        auto [type, value] = readHeader();
        if (type != SIMPLE || (value != TRUE_VALUE && value != FALSE_VALUE)) {
            throw IrFormatError("CBOR: expected boolean at offset " + std::to_string(pos_));
        }
        return value == TRUE_VALUE;
    }

    double readFloat64() {
        uint8_t initial = read();
        if (initial != ((SIMPLE << 5) | FLOAT64)) {
            throw IrFormatError("CBOR: expected float64 at offset " + std::to_string(pos_ - 1));
        }
        require(8);
        uint64_t bits = 0;
        for (int i = 0; i < 8; ++i) {
            bits = (bits << 8) | data_[pos_++];
        }
        double result;
        std::memcpy(&result, &bits, sizeof(result));
        return result;
    }

    // Read an integer (handles both unsigned and negative)
    int64_t readInt() {
        auto [majorType, value] = readHeader();
        if (value > static_cast<uint64_t>(INT64_MAX)) {
            throw IrFormatError("CBOR: integer out of range at offset " + std::to_string(pos_));
        }
        if (majorType == UNSIGNED_INT) {
            return static_cast<int64_t>(value);
        } else if (majorType == NEGATIVE_INT) {
            return -1 - static_cast<int64_t>(value);
        }
        throw IrFormatError("CBOR: expected integer at offset " + std::to_string(pos_));
    }

    uint32_t readUInt32() {
        auto value = expect(UNSIGNED_INT, "unsigned integer");
        if (value > UINT32_MAX) {
            throw IrFormatError("CBOR: value " + std::to_string(value) + " exceeds 32 bits");
        }
        return static_cast<uint32_t>(value);
    }

    // Skip a CBOR value (useful for unknown fields)
    void skipValue(size_t depth = 0) {
        if (depth > MAX_NESTING) {
            throw IrFormatError("CBOR: nesting too deep");
        }
        auto [majorType, value] = readHeader();
        switch (majorType) {
            case UNSIGNED_INT:
            case NEGATIVE_INT:
                break;
            case BYTE_STRING:
            case TEXT_STRING:
                require(value);
                pos_ += static_cast<size_t>(value);
                break;
            case ARRAY:
                for (uint64_t i = 0; i < value; ++i) {
                    skipValue(depth + 1);
                }
                break;
            case MAP:
                for (uint64_t i = 0; i < value; ++i) {
                    skipValue(depth + 1);  // key
                    skipValue(depth + 1);  // value
                }
                break;
            case SIMPLE:
                // readHeader already consumed any float argument bytes
                break;
            default:
                throw IrFormatError("CBOR: unsupported major type " + std::to_string(majorType));
        }
    }

private:
    void require(uint64_t count) const {
        if (count > size_ - pos_) {
            throw IrFormatError("CBOR: truncated input at offset " + std::to_string(pos_));
        }
    }

    // Every element takes at least one byte, so a count beyond the
    // remaining input cannot be genuine
    uint64_t checkedCount(uint64_t count) const {
        require(count);
        return count;
    }

    const uint8_t* data_;
    size_t size_;
    size_t pos_;
};

}  // namespace cbor
}  // namespace sbeir
