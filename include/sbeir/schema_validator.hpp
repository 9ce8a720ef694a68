#pragma once

/**
 * @file schema_validator.hpp
 * @brief Structural checks over a built schema graph
 *
 * Errors abort on the first violation with a SchemaValidationError naming
 * the offending entity. Warnings (literals outside their type's range) are
 * written to std::cerr and counted; with ParserOptions::warningsFatal the
 * first warning is raised as an error instead.
 */

#include "sbeir/parser_options.hpp"
#include "sbeir/schema.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sbeir {

/// Recognize a composite's role from the names and types of its members
[[nodiscard]] CompositeRole classifyComposite(const Schema& schema, const CompositeType& composite);

/// Whether a constant's representation suits a primitive of the given array length
[[nodiscard]] bool isRepresentationCompatible(const PrimitiveValue& value, PrimitiveType type, uint32_t length);

class SchemaValidator {
public:
    explicit SchemaValidator(ParserOptions options = {});

    /// @throws SchemaValidationError on the first violation
    void validate(const Schema& schema);

    [[nodiscard]] size_t warningCount() const { return warnings_.size(); }
    [[nodiscard]] const std::vector<std::string>& warnings() const { return warnings_; }

private:
    void validateTypes(const Schema& schema);
    void validateEncodedType(const Schema& schema, const EncodedType& type, const std::string& path);
    void validateComposite(const Schema& schema, const CompositeType& composite);
    void checkTypeCycles(const Schema& schema);
    void validateHeader(const Schema& schema);
    void validateMessages(const Schema& schema);
    void validateScope(const Schema& schema, const std::string& path,
                       std::span<const EntryId> ids, uint32_t blockLength);
    void validateField(const Schema& schema, const Entry& field, const std::string& path);
    void validateGroup(const Schema& schema, const Entry& group, const std::string& path);
    void validateData(const Schema& schema, const Entry& data, const std::string& path);
    void checkSinceVersion(const Schema& schema, uint32_t sinceVersion, const std::string& path);
    void checkRange(const EncodedType& type, const PrimitiveValue& value,
                    std::string_view what, const std::string& path);

    [[noreturn]] void fail(const std::string& entity, const std::string& reason) const;
    void warn(const std::string& entity, const std::string& message);

    ParserOptions options_;
    std::vector<std::string> warnings_;
};

}  // namespace sbeir
