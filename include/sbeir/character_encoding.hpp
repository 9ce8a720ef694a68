#pragma once

/**
 * @file character_encoding.hpp
 * @brief Conversion between UTF-8 text and named character encodings
 *
 * Used for fixed-length character array constants and for rendering raw byte
 * values back to text. Encoding names are the ones iconv understands
 * ("US-ASCII", "UTF-8", "ISO-8859-1", "UTF-16LE", ...).
 */

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sbeir {

/// Encoding assumed for text when none is given
inline constexpr std::string_view DEFAULT_CHARACTER_ENCODING = "UTF-8";

/// Check whether the named encoding is usable on this platform
[[nodiscard]] bool isSupportedEncoding(std::string_view encoding);

/// Encode UTF-8 text into the named encoding.
/// Throws FormatError if the encoding is unknown or the text cannot be represented.
[[nodiscard]] std::vector<uint8_t> encodeText(std::string_view utf8, std::string_view encoding);

/// Decode bytes in the named encoding into UTF-8 text.
/// Throws FormatError if the encoding is unknown or the bytes are invalid.
[[nodiscard]] std::string decodeText(std::span<const uint8_t> bytes, std::string_view encoding);

}  // namespace sbeir
