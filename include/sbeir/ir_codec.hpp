#pragma once

/**
 * @file ir_codec.hpp
 * @brief Persisted form of a sealed Schema
 *
 * encodeIr() writes the whole graph (attributes, type arena, entry arena,
 * messages) as CBOR. decodeIr() rebuilds the graph and runs SchemaValidator
 * over it, so a consumer that never sees the XML gets the same guarantees.
 *
 * File format: magic "SBIR" (4 bytes) + uncompressed size (4 bytes LE)
 * + compressed size (4 bytes LE) + LZ4-compressed CBOR payload.
 */

#include "sbeir/parser_options.hpp"
#include "sbeir/schema.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace sbeir {

/// CBOR document version written by encodeIr()
constexpr int64_t IR_FORMAT_VERSION = 1;

[[nodiscard]] std::vector<uint8_t> encodeIr(const Schema& schema);

/// @throws IrFormatError for malformed or unsupported input
/// @throws SchemaValidationError if the decoded graph is invalid
[[nodiscard]] Schema decodeIr(std::span<const uint8_t> data, const ParserOptions& options = {});

/// @throws std::runtime_error if the file cannot be written
void saveIr(const Schema& schema, const std::filesystem::path& path);

/// @throws IrFormatError for a missing, truncated or corrupt file
[[nodiscard]] Schema loadIr(const std::filesystem::path& path, const ParserOptions& options = {});

}  // namespace sbeir
