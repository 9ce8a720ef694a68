#pragma once

/**
 * @file parser_options.hpp
 * @brief Options controlling schema loading and validation
 *
 * Options can be read from a configuration file (see ConfigParser):
 *
 *   validation.enabled: true
 *   validation.warnings_fatal: false
 *   output.suppress: false
 *   xml.xinclude: false
 *   encoding.default: US-ASCII
 *   schema.header_type: messageHeader
 */

#include "sbeir/config_parser.hpp"

#include <optional>
#include <string>

namespace sbeir {

struct ParserOptions {
    /// Run SchemaValidator when a schema is built
    bool validate = true;

    /// Raise the first validation warning as a SchemaValidationError
    bool warningsFatal = false;

    /// Do not write diagnostics to std::cerr
    bool suppressOutput = false;

    /// Process XInclude directives in schema documents
    bool xincludeAware = false;

    /// Encoding for character array literals that do not name one
    std::string defaultCharacterEncoding = "US-ASCII";

    /// Overrides the schema's headerType attribute when set
    std::optional<std::string> headerType;

    /// Build options from a parsed configuration. Unknown keys are reported
    /// on std::cerr (unless output.suppress is set) and otherwise ignored.
    [[nodiscard]] static ParserOptions fromConfig(const ConfigDocument& doc);

    /// Read options from a configuration file. nullopt if it cannot be read.
    [[nodiscard]] static std::optional<ParserOptions> loadFile(const std::string& path);
};

}  // namespace sbeir
