#pragma once

/**
 * @file schema.hpp
 * @brief Sealed schema graph (the IR)
 *
 * Types, entries and messages live in flat arenas addressed by stable
 * indices (TypeId, EntryId). Groups hold ordered lists of child indices
 * rather than owning their children, so nesting depth is unbounded and
 * traversal is a walk over index lists.
 *
 * A Schema is produced by SchemaBuilder::build() or decodeIr() and is
 * immutable afterwards. All accessors are const and the object may be
 * shared between threads without locking.
 *
 * Traversal order is always declaration order. Consumers compute byte
 * offsets by walking entries in this order.
 */

#include "sbeir/primitive_type.hpp"
#include "sbeir/primitive_value.hpp"

#include <cstdint>
#include <functional>
#include <iterator>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace sbeir {

using TypeId = uint32_t;
using EntryId = uint32_t;

constexpr TypeId INVALID_TYPE_ID = std::numeric_limits<TypeId>::max();
constexpr EntryId INVALID_ENTRY_ID = std::numeric_limits<EntryId>::max();

enum class ByteOrder : uint8_t {
    LittleEndian,
    BigEndian,
};

enum class Presence : uint8_t {
    Required,
    Optional,
    Constant,
};

[[nodiscard]] std::string_view byteOrderName(ByteOrder order);
[[nodiscard]] std::optional<ByteOrder> byteOrderFromName(std::string_view name);
[[nodiscard]] std::string_view presenceName(Presence presence);
[[nodiscard]] std::optional<Presence> presenceFromName(std::string_view name);

// ============================================================================
// Types
// ============================================================================

/**
 * @brief Simple type: a primitive, optionally a fixed-length array
 *
 * Also used for the inline members of a composite. Length 0 marks the open
 * payload of a variable-data composite.
 */
struct EncodedType {
    std::string name;
    PrimitiveType primitiveType = PrimitiveType::UInt8;
    uint32_t length = 1;
    Presence presence = Presence::Required;

    std::optional<PrimitiveValue> constValue;
    std::optional<PrimitiveValue> minValue;   ///< Overrides the catalog min
    std::optional<PrimitiveValue> maxValue;   ///< Overrides the catalog max
    std::optional<PrimitiveValue> nullValue;  ///< Overrides the catalog null

    std::optional<std::string> characterEncoding;
    std::optional<std::string> semanticType;
    std::optional<std::string> description;
    std::optional<uint32_t> offset;  ///< Explicit offset inside an enclosing composite
    uint32_t sinceVersion = 0;

    /// Bytes on the wire. Constants occupy none. Throws SchemaValidationError
    /// ("layout overflow") when the array does not fit in 32 bits.
    [[nodiscard]] uint32_t encodedLength() const;

    [[nodiscard]] bool isConstant() const { return presence == Presence::Constant; }
    [[nodiscard]] bool isArray() const { return length != 1; }

    [[nodiscard]] const PrimitiveValue& effectiveMinValue() const;
    [[nodiscard]] const PrimitiveValue& effectiveMaxValue() const;
    [[nodiscard]] const PrimitiveValue& effectiveNullValue() const;
};

/// Shape of a composite, recognized from its members
enum class CompositeRole : uint8_t {
    Plain,
    MessageHeader,    ///< blockLength, templateId, schemaId, version
    GroupDimension,   ///< blockLength, numInGroup
    VarDataEncoding,  ///< unsigned length, then char or uint8 varData payload
};

[[nodiscard]] std::string_view compositeRoleName(CompositeRole role);

struct CompositeMember {
    std::string name;
    TypeId type = INVALID_TYPE_ID;
    uint32_t offset = 0;
};

struct CompositeType {
    std::string name;
    std::vector<CompositeMember> members;
    std::optional<std::string> semanticType;
    std::optional<std::string> description;
    uint32_t sinceVersion = 0;

    uint32_t encodedLength = 0;
    CompositeRole role = CompositeRole::Plain;

    /// Index of the named member, or nullopt
    [[nodiscard]] std::optional<size_t> findMember(std::string_view memberName) const;
};

using Type = std::variant<EncodedType, CompositeType>;

// ============================================================================
// Entries
// ============================================================================

enum class EntryKind : uint8_t {
    Field,
    Group,
    Data,
};

[[nodiscard]] std::string_view entryKindName(EntryKind kind);

/// What a variable-data payload carries
enum class PayloadRole : uint8_t {
    Text,    ///< char payload, or any payload with a character encoding
    Opaque,  ///< raw bytes
};

/**
 * @brief Repeating-group layout
 *
 * The repeat count lives in the dimension composite. The group entry is the
 * single entity carrying the count's numeric id; the count member itself is
 * addressed through numInGroupMember.
 */
struct GroupLayout {
    uint32_t blockLength = 0;
    std::vector<EntryId> children;
    uint32_t blockLengthMember = 0;  ///< Index into the dimension composite's members
    uint32_t numInGroupMember = 0;   ///< Index into the dimension composite's members
};

/// Variable-data layout: length prefix followed by payload
struct VarDataLayout {
    uint32_t lengthMember = 0;   ///< Index into the var-data composite's members
    uint32_t payloadMember = 1;  ///< Index into the var-data composite's members
    PrimitiveType lengthType = PrimitiveType::UInt8;
    PrimitiveType payloadType = PrimitiveType::UInt8;
    PayloadRole payloadRole = PayloadRole::Opaque;
    std::optional<std::string> characterEncoding;

    /// Largest payload the length prefix can describe
    [[nodiscard]] uint64_t maxPayloadLength() const;
};

/**
 * @brief A Field, Group or Data member of a message or group
 *
 * type is the field's value type for Fields, the dimension composite for
 * Groups and the var-data composite for Data. Exactly one of group/varData
 * is set for Groups and Data; neither for Fields.
 */
struct Entry {
    EntryKind kind = EntryKind::Field;
    std::string name;
    uint32_t id = 0;
    TypeId type = INVALID_TYPE_ID;
    uint32_t offset = 0;  ///< Offset within the enclosing block (Fields only)
    uint32_t sinceVersion = 0;
    Presence presence = Presence::Required;
    std::optional<PrimitiveValue> constValue;
    std::optional<std::string> semanticType;
    std::optional<std::string> description;

    std::optional<GroupLayout> group;
    std::optional<VarDataLayout> varData;

    [[nodiscard]] bool isField() const { return kind == EntryKind::Field; }
    [[nodiscard]] bool isGroup() const { return kind == EntryKind::Group; }
    [[nodiscard]] bool isData() const { return kind == EntryKind::Data; }
};

struct Message {
    std::string name;
    uint32_t templateId = 0;
    uint32_t blockLength = 0;
    uint32_t sinceVersion = 0;
    std::optional<std::string> semanticType;
    std::optional<std::string> description;
    std::vector<EntryId> entries;
};

/// Attributes of the schema root
struct SchemaAttributes {
    std::string package;
    uint32_t id = 0;
    uint32_t version = 0;
    std::string semanticVersion;
    std::string description;
    ByteOrder byteOrder = ByteOrder::LittleEndian;
    std::string headerType = "messageHeader";
};

class Schema;

// ============================================================================
// EntryRange - lazy, restartable view over an ordered list of entries
// ============================================================================

class EntryRange {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Entry;
        using difference_type = std::ptrdiff_t;
        using pointer = const Entry*;
        using reference = const Entry&;

        iterator() = default;
        iterator(const Schema* schema, const EntryId* position) : schema_(schema), position_(position) {}

        reference operator*() const;
        pointer operator->() const { return &**this; }

        iterator& operator++() {
            ++position_;
            return *this;
        }
        iterator operator++(int) {
            iterator copy = *this;
            ++position_;
            return copy;
        }

        bool operator==(const iterator& other) const { return position_ == other.position_; }
        bool operator!=(const iterator& other) const { return position_ != other.position_; }

    private:
        const Schema* schema_ = nullptr;
        const EntryId* position_ = nullptr;
    };

    EntryRange() = default;
    EntryRange(const Schema& schema, std::span<const EntryId> ids) : schema_(&schema), ids_(ids) {}

    [[nodiscard]] iterator begin() const { return iterator(schema_, ids_.data()); }
    [[nodiscard]] iterator end() const { return iterator(schema_, ids_.data() + ids_.size()); }
    [[nodiscard]] size_t size() const { return ids_.size(); }
    [[nodiscard]] bool empty() const { return ids_.empty(); }
    [[nodiscard]] const Entry& operator[](size_t index) const;

    /// Underlying entry indices
    [[nodiscard]] std::span<const EntryId> ids() const { return ids_; }

private:
    const Schema* schema_ = nullptr;
    std::span<const EntryId> ids_;
};

/// Group dimension resolved against its composite
struct DimensionView {
    const CompositeType* composite = nullptr;
    const CompositeMember* blockLength = nullptr;
    const CompositeMember* numInGroup = nullptr;
    PrimitiveType numInGroupType = PrimitiveType::UInt16;
};

// ============================================================================
// Schema
// ============================================================================

class Schema {
public:
    // ========================================================================
    // Schema attributes
    // ========================================================================

    [[nodiscard]] const SchemaAttributes& attributes() const { return attributes_; }
    [[nodiscard]] const std::string& package() const { return attributes_.package; }
    [[nodiscard]] uint32_t id() const { return attributes_.id; }
    [[nodiscard]] uint32_t version() const { return attributes_.version; }
    [[nodiscard]] const std::string& semanticVersion() const { return attributes_.semanticVersion; }
    [[nodiscard]] const std::string& description() const { return attributes_.description; }
    [[nodiscard]] ByteOrder byteOrder() const { return attributes_.byteOrder; }

    // ========================================================================
    // Types
    // ========================================================================

    [[nodiscard]] size_t typeCount() const { return types_.size(); }

    /// @throws std::out_of_range for an unknown id
    [[nodiscard]] const Type& type(TypeId id) const;

    /// Top-level type by name. Inline composite members are not named here.
    [[nodiscard]] std::optional<TypeId> findType(std::string_view name) const;

    /// nullptr unless id is an EncodedType
    [[nodiscard]] const EncodedType* encodedType(TypeId id) const;

    /// nullptr unless id is a CompositeType
    [[nodiscard]] const CompositeType* compositeType(TypeId id) const;

    [[nodiscard]] std::string_view typeName(TypeId id) const;

    /// Bytes a value of this type occupies on the wire
    [[nodiscard]] uint32_t encodedLength(TypeId id) const;

    /// Top-level type ids in declaration order
    [[nodiscard]] const std::vector<TypeId>& namedTypes() const { return namedTypes_; }

    [[nodiscard]] TypeId messageHeaderType() const { return headerType_; }
    [[nodiscard]] const CompositeType& messageHeader() const;

    // ========================================================================
    // Messages and entries
    // ========================================================================

    [[nodiscard]] const std::vector<Message>& messages() const { return messages_; }
    [[nodiscard]] const Message* findMessage(uint32_t templateId) const;
    [[nodiscard]] const Message* findMessage(std::string_view name) const;

    [[nodiscard]] size_t entryCount() const { return entries_.size(); }

    /// @throws std::out_of_range for an unknown id
    [[nodiscard]] const Entry& entry(EntryId id) const;

    /// Members of a message, in declaration order
    [[nodiscard]] EntryRange entries(const Message& message) const;

    /// Members of one group instance, in declaration order. Empty for non-groups.
    [[nodiscard]] EntryRange entries(const Entry& group) const;

    /// Direct member with the given numeric id, or nullptr
    [[nodiscard]] const Entry* findMember(const Message& message, uint32_t id) const;
    [[nodiscard]] const Entry* findMember(const Entry& group, uint32_t id) const;

    /// Dimension of a group entry. nullopt for non-groups.
    [[nodiscard]] std::optional<DimensionView> dimension(const Entry& group) const;

    /// Depth-first walk of a message's entries, groups before their children.
    /// depth is 0 for direct members of the message.
    void walk(const Message& message,
              const std::function<void(const Entry& entry, size_t depth)>& visitor) const;

private:
    friend class SchemaBuilder;
    friend class IrDecoder;

    Schema() = default;

    // Rebuild name and template-id lookups from the arenas
    void reindex();

    SchemaAttributes attributes_;
    std::vector<Type> types_;
    std::vector<TypeId> namedTypes_;
    std::vector<Entry> entries_;
    std::vector<Message> messages_;
    TypeId headerType_ = INVALID_TYPE_ID;

    std::unordered_map<std::string, TypeId> typeIndex_;
    std::unordered_map<uint32_t, size_t> messageIndex_;
};

}  // namespace sbeir
