#pragma once

/**
 * @file schema_builder.hpp
 * @brief Incremental construction of a sealed Schema
 *
 * Front ends declare types and messages in any order and refer to types by
 * name. build() resolves names, computes offsets and block lengths,
 * recognizes composite roles, and (unless disabled) runs SchemaValidator.
 *
 * Messages and groups are declared through scope handles, so nesting depth
 * is not limited by the declaration structures:
 *
 * @code
 *   SchemaBuilder builder(attributes);
 *   builder.addType(priceType);
 *   builder.addComposite(headerDecl);
 *   auto order = builder.addMessage({.name = "Order", .templateId = 1});
 *   builder.addField(order, {.name = "price", .id = 1, .typeName = "price"});
 *   auto fills = builder.addGroup(order, {.name = "fills", .id = 2});
 *   builder.addField(fills, {.name = "qty", .id = 3, .typeName = "uint32"});
 *   Schema schema = builder.build();
 * @endcode
 */

#include "sbeir/parser_options.hpp"
#include "sbeir/schema.hpp"

#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sbeir {

/// Composite member that refers to another named type
struct TypeRefDecl {
    std::string name;
    std::string typeName;
    std::optional<uint32_t> offset;
};

/// Inline simple type or reference to a named type
using CompositeMemberDecl = std::variant<EncodedType, TypeRefDecl>;

struct CompositeDecl {
    std::string name;
    std::vector<CompositeMemberDecl> members;
    std::optional<std::string> semanticType;
    std::optional<std::string> description;
    uint32_t sinceVersion = 0;
};

struct MessageDecl {
    std::string name;
    uint32_t templateId = 0;
    std::optional<uint32_t> blockLength;  ///< Computed from the fields when unset
    uint32_t sinceVersion = 0;
    std::optional<std::string> semanticType;
    std::optional<std::string> description;
};

struct FieldDecl {
    std::string name;
    uint32_t id = 0;
    std::string typeName;
    std::optional<uint32_t> offset;  ///< Packed after the previous field when unset
    Presence presence = Presence::Required;
    std::optional<PrimitiveValue> constValue;
    uint32_t sinceVersion = 0;
    std::optional<std::string> semanticType;
    std::optional<std::string> description;
};

struct GroupDecl {
    std::string name;
    uint32_t id = 0;
    std::string dimensionType = "groupSizeEncoding";
    std::optional<uint32_t> blockLength;
    uint32_t sinceVersion = 0;
    std::optional<std::string> semanticType;
    std::optional<std::string> description;
};

struct DataDecl {
    std::string name;
    uint32_t id = 0;
    std::string typeName = "varDataEncoding";
    uint32_t sinceVersion = 0;
    std::optional<std::string> semanticType;
    std::optional<std::string> description;
};

/// Handle to a message or group that members are added to
struct BuilderScope {
    bool isGroup = false;
    uint32_t index = 0;  ///< Message index, or EntryId of the group
};

class SchemaBuilder {
public:
    explicit SchemaBuilder(SchemaAttributes attributes, ParserOptions options = {});

    /// @throws SchemaValidationError if the name is already declared
    TypeId addType(EncodedType type);

    /// @throws SchemaValidationError if the name is already declared
    TypeId addComposite(CompositeDecl composite);

    BuilderScope addMessage(MessageDecl message);

    /// @throws std::invalid_argument for an unknown scope
    EntryId addField(BuilderScope scope, FieldDecl field);
    BuilderScope addGroup(BuilderScope scope, GroupDecl group);
    EntryId addData(BuilderScope scope, DataDecl data);

    /**
     * @brief Resolve, lay out and seal the schema
     * @throws SchemaValidationError on unresolved names, cycles, or any
     *         validator violation
     * @throws std::logic_error if called twice
     */
    [[nodiscard]] Schema build();

    /// Warnings reported by the validator during build()
    [[nodiscard]] size_t warningCount() const { return warningCount_; }

private:
    struct PendingMember {
        TypeId composite;
        size_t member;
        std::string typeName;
    };

    // Per-entry data that only matters until build()
    struct PendingEntry {
        std::string typeName;
        std::optional<uint32_t> offset;
        std::optional<uint32_t> blockLength;
        std::string path;
    };

    EntryId addEntry(BuilderScope scope, Entry entry, PendingEntry pending);
    std::vector<EntryId>& scopeEntries(BuilderScope scope);
    std::string scopePath(BuilderScope scope) const;
    TypeId declareNamed(Type type, const std::string& name);

    // Named type, or an anonymous type for a bare primitive name
    std::optional<TypeId> resolveTypeName(const std::string& name);

    void resolveCompositeMembers();
    void layoutComposites();
    void layoutComposite(TypeId id);
    void resolveHeader();
    void resolveEntries();
    void resolveGroup(Entry& group, const PendingEntry& pending);
    void resolveData(Entry& data, const PendingEntry& pending);
    uint32_t layoutScope(const std::vector<EntryId>& ids, std::optional<uint32_t> blockLength);

    Schema schema_;
    ParserOptions options_;
    std::vector<PendingMember> pendingMembers_;
    std::vector<std::vector<std::optional<uint32_t>>> memberOffsets_;  // indexed by TypeId
    std::vector<PendingEntry> pendingEntries_;                         // indexed by EntryId
    std::vector<std::optional<uint32_t>> messageBlockLengths_;
    std::array<TypeId, PRIMITIVE_TYPE_COUNT> builtinTypes_;
    size_t warningCount_ = 0;
    bool built_ = false;
};

}  // namespace sbeir
