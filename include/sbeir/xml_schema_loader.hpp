#pragma once

/**
 * @file xml_schema_loader.hpp
 * @brief Reads SBE-style XML schema documents into a sealed Schema
 *
 * Supported elements: messageSchema, types (type, composite with inline
 * type and ref members), message, field, group, data. Elements are matched
 * by local name, so any namespace prefix is accepted. enum and set are
 * rejected.
 *
 * Network access is disabled. XInclude is processed only when
 * ParserOptions::xincludeAware is set.
 */

#include "sbeir/parser_options.hpp"
#include "sbeir/schema.hpp"

#include <string>
#include <string_view>

namespace sbeir {

class XmlSchemaLoader {
public:
    explicit XmlSchemaLoader(ParserOptions options = {});

    /// @throws SchemaLoadError for unreadable or malformed documents
    /// @throws SchemaValidationError for structurally invalid schemas
    [[nodiscard]] Schema loadFile(const std::string& path) const;

    /// @copydoc loadFile
    [[nodiscard]] Schema loadString(std::string_view xml) const;

    [[nodiscard]] const ParserOptions& options() const { return options_; }

private:
    ParserOptions options_;
};

}  // namespace sbeir
