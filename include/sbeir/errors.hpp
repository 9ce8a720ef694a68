#pragma once

/**
 * @file errors.hpp
 * @brief Exception types raised by the schema IR
 *
 * FormatError and RepresentationMismatch come from PrimitiveValue.
 * SchemaValidationError comes from SchemaBuilder and SchemaValidator.
 * SchemaLoadError and IrFormatError come from the front end and IR codec.
 */

#include <stdexcept>
#include <string>

namespace sbeir {

/// Literal text does not match the lexical grammar of its primitive type
class FormatError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Accessor requested a representation the value does not hold
class RepresentationMismatch : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/// Structural violation in a schema graph
class SchemaValidationError : public std::runtime_error {
public:
    SchemaValidationError(const std::string& entity, const std::string& reason)
        : std::runtime_error(reason + ": " + entity)
        , entity_(entity)
        , reason_(reason) {}

    /// Name of the offending entity (type, message, member, or scope path)
    [[nodiscard]] const std::string& entity() const { return entity_; }

    /// Short reason, e.g. "duplicate template id"
    [[nodiscard]] const std::string& reason() const { return reason_; }

private:
    std::string entity_;
    std::string reason_;
};

/// XML schema document could not be turned into declarations
class SchemaLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Persisted IR is truncated, corrupt, or of an unknown version
class IrFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace sbeir
