#include "sbeir/schema_validator.hpp"
#include "sbeir/character_encoding.hpp"
#include "sbeir/errors.hpp"

#include <iostream>
#include <limits>
#include <unordered_set>

namespace sbeir {

namespace {

bool isScalarUnsigned(const EncodedType* type) {
    return type && type->length == 1 && !type->isConstant() && isUnsigned(type->primitiveType);
}

bool hasUnsignedMember(const Schema& schema, const CompositeType& composite, std::string_view name) {
    auto index = composite.findMember(name);
    if (!index) return false;
    return isScalarUnsigned(schema.encodedType(composite.members[*index].type));
}

// Integral comparison in the value space of the given type
bool integralLess(int64_t a, int64_t b, PrimitiveType type) {
    if (type == PrimitiveType::UInt64) {
        return static_cast<uint64_t>(a) < static_cast<uint64_t>(b);
    }
    return a < b;
}

// Entries are ordered fields, then groups, then data
int orderingPhase(EntryKind kind) {
    switch (kind) {
        case EntryKind::Field: return 0;
        case EntryKind::Group: return 1;
        case EntryKind::Data: return 2;
    }
    return 0;
}

constexpr uint64_t MAX_LAYOUT_END = std::numeric_limits<uint32_t>::max();

// Per-scope state while walking a message and its nested groups
struct ScopeFrame {
    std::string path;
    std::span<const EntryId> ids;
    uint32_t blockLength = 0;
    size_t next = 0;
    std::unordered_set<uint32_t> memberIds;
    std::unordered_set<std::string> memberNames;
    int phase = 0;
    uint64_t running = 0;
};

}  // namespace

CompositeRole classifyComposite(const Schema& schema, const CompositeType& composite) {
    if (hasUnsignedMember(schema, composite, "blockLength") &&
        hasUnsignedMember(schema, composite, "templateId") &&
        hasUnsignedMember(schema, composite, "schemaId") &&
        hasUnsignedMember(schema, composite, "version")) {
        return CompositeRole::MessageHeader;
    }

    if (hasUnsignedMember(schema, composite, "blockLength") &&
        hasUnsignedMember(schema, composite, "numInGroup")) {
        return CompositeRole::GroupDimension;
    }

    if (composite.members.size() == 2 && composite.members[0].name == "length" &&
        composite.members[1].name == "varData") {
        const auto* length = schema.encodedType(composite.members[0].type);
        const auto* payload = schema.encodedType(composite.members[1].type);
        if (isScalarUnsigned(length) && payload &&
            (payload->primitiveType == PrimitiveType::Char || payload->primitiveType == PrimitiveType::UInt8)) {
            return CompositeRole::VarDataEncoding;
        }
    }

    return CompositeRole::Plain;
}

bool isRepresentationCompatible(const PrimitiveValue& value, PrimitiveType type, uint32_t length) {
    if (isFloatingPoint(type)) {
        return value.isFloating();
    }
    if (type == PrimitiveType::Char) {
        if (length == 1) {
            return (value.isIntegral() && value.size() == 1) || value.isRawBytes();
        }
        return value.isRawBytes();
    }
    return value.isIntegral();
}

SchemaValidator::SchemaValidator(ParserOptions options)
    : options_(std::move(options)) {}

void SchemaValidator::validate(const Schema& schema) {
    warnings_.clear();
    validateTypes(schema);
    checkTypeCycles(schema);
    validateHeader(schema);
    validateMessages(schema);
}

// ============================================================================
// Types
// ============================================================================

void SchemaValidator::validateTypes(const Schema& schema) {
    for (TypeId id = 0; id < schema.typeCount(); ++id) {
        const auto& type = schema.type(id);
        if (const auto* encoded = std::get_if<EncodedType>(&type)) {
            validateEncodedType(schema, *encoded, encoded->name);
        } else {
            validateComposite(schema, std::get<CompositeType>(type));
        }
    }
}

void SchemaValidator::validateEncodedType(const Schema& schema, const EncodedType& type,
                                          const std::string& path) {
    checkSinceVersion(schema, type.sinceVersion, path);

    if (type.isConstant() && !type.constValue) {
        fail(path, "missing constant value");
    }
    if (type.constValue) {
        if (!isRepresentationCompatible(*type.constValue, type.primitiveType, type.length)) {
            fail(path, "constant/type mismatch");
        }
        checkRange(type, *type.constValue, "constant value", path);
    }

    const std::pair<const std::optional<PrimitiveValue>*, std::string_view> overrides[] = {
        {&type.minValue, "min value"},
        {&type.maxValue, "max value"},
        {&type.nullValue, "null value"},
    };
    for (const auto& [value, what] : overrides) {
        if (*value && !isRepresentationCompatible(**value, type.primitiveType, 1)) {
            fail(path + " (" + std::string(what) + ")", "constant/type mismatch");
        }
    }

    if (type.minValue && type.maxValue && type.minValue->isIntegral() && type.maxValue->isIntegral() &&
        integralLess(type.maxValue->asIntegral(), type.minValue->asIntegral(), type.primitiveType)) {
        warn(path, "max value " + type.maxValue->toString() + " is below min value " + type.minValue->toString());
    }

    if (type.nullValue && type.nullValue->isIntegral() && type.presence == Presence::Optional) {
        auto null = type.nullValue->asIntegral();
        const auto& min = type.effectiveMinValue();
        const auto& max = type.effectiveMaxValue();
        if (min.isIntegral() && max.isIntegral() &&
            !integralLess(null, min.asIntegral(), type.primitiveType) &&
            !integralLess(max.asIntegral(), null, type.primitiveType)) {
            warn(path, "null value " + type.nullValue->toString() + " lies inside [" +
                       min.toString() + ", " + max.toString() + "]");
        }
    }

    if (type.characterEncoding && !isSupportedEncoding(*type.characterEncoding)) {
        fail(path + " (" + *type.characterEncoding + ")", "unsupported character encoding");
    }
}

void SchemaValidator::validateComposite(const Schema& schema, const CompositeType& composite) {
    checkSinceVersion(schema, composite.sinceVersion, composite.name);

    std::unordered_set<std::string> names;
    uint64_t running = 0;

    for (const auto& member : composite.members) {
        std::string path = composite.name + "." + member.name;

        if (member.type >= schema.typeCount()) {
            fail(path, "unresolved type");
        }
        if (!names.insert(member.name).second) {
            fail(path, "duplicate member name");
        }
        if (member.offset < running) {
            fail(path + " (offset " + std::to_string(member.offset) +
                     ", previous member ends at " + std::to_string(running) + ")",
                 "overlapping offset");
        }
        running = static_cast<uint64_t>(member.offset) + schema.encodedLength(member.type);
        if (running > MAX_LAYOUT_END) {
            fail(path + " (member ends at " + std::to_string(running) + ")", "layout overflow");
        }
    }

    if (composite.encodedLength < running) {
        fail(composite.name + " (encoded length " + std::to_string(composite.encodedLength) +
                 ", members end at " + std::to_string(running) + ")",
             "composite length too small");
    }

    if (composite.role != classifyComposite(schema, composite)) {
        fail(composite.name, "composite role mismatch");
    }
}

void SchemaValidator::checkTypeCycles(const Schema& schema) {
    enum class Mark : uint8_t { Unvisited, Visiting, Done };
    std::vector<Mark> marks(schema.typeCount(), Mark::Unvisited);

    // Iterative DFS so deeply nested composites do not exhaust the stack
    for (TypeId root = 0; root < schema.typeCount(); ++root) {
        if (marks[root] != Mark::Unvisited) continue;

        std::vector<std::pair<TypeId, size_t>> stack;
        stack.emplace_back(root, 0);
        marks[root] = Mark::Visiting;

        while (!stack.empty()) {
            auto& [id, next] = stack.back();
            const auto* composite = schema.compositeType(id);
            if (!composite || next >= composite->members.size()) {
                marks[id] = Mark::Done;
                stack.pop_back();
                continue;
            }

            TypeId child = composite->members[next++].type;
            if (marks[child] == Mark::Visiting) {
                fail(std::string(schema.typeName(child)), "type cycle");
            }
            if (marks[child] == Mark::Unvisited) {
                marks[child] = Mark::Visiting;
                stack.emplace_back(child, 0);
            }
        }
    }
}

void SchemaValidator::validateHeader(const Schema& schema) {
    const auto* header = schema.compositeType(schema.messageHeaderType());
    if (!header) {
        fail(schema.attributes().headerType, "unresolved type");
    }
    if (header->role != CompositeRole::MessageHeader) {
        fail(header->name, "invalid message header");
    }
}

// ============================================================================
// Messages
// ============================================================================

void SchemaValidator::validateMessages(const Schema& schema) {
    std::unordered_set<uint32_t> templateIds;
    std::unordered_set<std::string> names;

    for (const auto& message : schema.messages()) {
        if (!templateIds.insert(message.templateId).second) {
            fail(message.name + " (id " + std::to_string(message.templateId) + ")", "duplicate template id");
        }
        if (!names.insert(message.name).second) {
            fail(message.name, "duplicate message name");
        }
        checkSinceVersion(schema, message.sinceVersion, message.name);
        validateScope(schema, message.name, message.entries, message.blockLength);
    }
}

void SchemaValidator::validateScope(const Schema& schema, const std::string& path,
                                    std::span<const EntryId> ids, uint32_t blockLength) {
    // Explicit stack; a decoded IR may nest groups arbitrarily deep
    std::vector<ScopeFrame> stack;
    stack.push_back({path, ids, blockLength});

    while (!stack.empty()) {
        auto& frame = stack.back();
        if (frame.next == frame.ids.size()) {
            stack.pop_back();
            continue;
        }

        EntryId id = frame.ids[frame.next++];
        if (id >= schema.entryCount()) {
            fail(frame.path + " (entry " + std::to_string(id) + ")", "unresolved entry");
        }
        const auto& member = schema.entry(id);
        std::string memberPath = frame.path + "." + member.name;

        if (!frame.memberIds.insert(member.id).second) {
            fail(memberPath + " (id " + std::to_string(member.id) + ")", "duplicate member id");
        }
        if (!frame.memberNames.insert(member.name).second) {
            fail(memberPath, "duplicate member name");
        }

        int memberPhase = orderingPhase(member.kind);
        if (memberPhase < frame.phase) {
            fail(memberPath + " (" + std::string(entryKindName(member.kind)) + " after a later member kind)",
                 "member ordering");
        }
        frame.phase = memberPhase;

        if (member.type >= schema.typeCount()) {
            fail(memberPath, "unresolved type");
        }
        checkSinceVersion(schema, member.sinceVersion, memberPath);

        switch (member.kind) {
            case EntryKind::Field: {
                validateField(schema, member, memberPath);
                uint32_t length = member.presence == Presence::Constant ? 0 : schema.encodedLength(member.type);
                if (member.offset < frame.running) {
                    fail(memberPath + " (offset " + std::to_string(member.offset) +
                             ", previous field ends at " + std::to_string(frame.running) + ")",
                         "overlapping offset");
                }
                frame.running = static_cast<uint64_t>(member.offset) + length;
                if (frame.running > MAX_LAYOUT_END) {
                    fail(memberPath + " (field ends at " + std::to_string(frame.running) + ")", "layout overflow");
                }
                if (frame.running > frame.blockLength) {
                    fail(memberPath + " (block length " + std::to_string(frame.blockLength) +
                             ", field ends at " + std::to_string(frame.running) + ")",
                         "block length too small");
                }
                break;
            }
            case EntryKind::Group:
                validateGroup(schema, member, memberPath);
                stack.push_back({memberPath, member.group->children, member.group->blockLength});
                break;
            case EntryKind::Data:
                validateData(schema, member, memberPath);
                break;
        }
    }
}

void SchemaValidator::validateField(const Schema& schema, const Entry& field, const std::string& path) {
    const auto* encoded = schema.encodedType(field.type);

    if (field.presence == Presence::Constant && !field.constValue && !(encoded && encoded->isConstant())) {
        fail(path, "missing constant value");
    }
    if (!field.constValue) {
        return;
    }
    if (!encoded) {
        fail(path + " (type " + std::string(schema.typeName(field.type)) + " is composite)",
             "constant/type mismatch");
    }
    if (!isRepresentationCompatible(*field.constValue, encoded->primitiveType, encoded->length)) {
        fail(path + " (" + std::string(representationName(field.constValue->representation())) +
                 " for " + std::string(primitiveTypeName(encoded->primitiveType)) + ")",
             "constant/type mismatch");
    }
    checkRange(*encoded, *field.constValue, "constant value", path);
}

void SchemaValidator::validateGroup(const Schema& schema, const Entry& group, const std::string& path) {
    if (!group.group) {
        fail(path, "group without layout");
    }
    const auto* dimension = schema.compositeType(group.type);
    if (!dimension || dimension->role != CompositeRole::GroupDimension) {
        fail(path + " (dimension " + std::string(schema.typeName(group.type)) + ")", "invalid group dimension");
    }
    if (group.group->blockLengthMember >= dimension->members.size() ||
        dimension->members[group.group->blockLengthMember].name != "blockLength" ||
        group.group->numInGroupMember >= dimension->members.size() ||
        dimension->members[group.group->numInGroupMember].name != "numInGroup") {
        fail(path, "invalid group dimension");
    }
}

void SchemaValidator::validateData(const Schema& schema, const Entry& data, const std::string& path) {
    if (!data.varData) {
        fail(path, "data without layout");
    }
    const auto* composite = schema.compositeType(data.type);
    if (!composite || composite->role != CompositeRole::VarDataEncoding) {
        fail(path + " (type " + std::string(schema.typeName(data.type)) + ")", "invalid var data encoding");
    }

    const auto& layout = *data.varData;
    const auto* length = layout.lengthMember < composite->members.size()
        ? schema.encodedType(composite->members[layout.lengthMember].type) : nullptr;
    const auto* payload = layout.payloadMember < composite->members.size()
        ? schema.encodedType(composite->members[layout.payloadMember].type) : nullptr;
    if (!length || !payload || layout.lengthMember == layout.payloadMember ||
        length->primitiveType != layout.lengthType || payload->primitiveType != layout.payloadType) {
        fail(path, "invalid var data encoding");
    }
}

// ============================================================================
// Shared checks
// ============================================================================

void SchemaValidator::checkSinceVersion(const Schema& schema, uint32_t sinceVersion, const std::string& path) {
    if (sinceVersion > schema.version()) {
        fail(path + " (sinceVersion " + std::to_string(sinceVersion) +
                 ", schema version " + std::to_string(schema.version()) + ")",
             "sinceVersion exceeds schema version");
    }
}

void SchemaValidator::checkRange(const EncodedType& type, const PrimitiveValue& value,
                                 std::string_view what, const std::string& path) {
    if (!value.isIntegral() || type.primitiveType == PrimitiveType::Char) {
        return;
    }
    const auto& min = type.effectiveMinValue();
    const auto& max = type.effectiveMaxValue();
    if (!min.isIntegral() || !max.isIntegral()) {
        return;
    }

    int64_t v = value.asIntegral();
    if (integralLess(v, min.asIntegral(), type.primitiveType) ||
        integralLess(max.asIntegral(), v, type.primitiveType)) {
        warn(path, std::string(what) + " " + value.toString() + " outside [" +
                   min.toString() + ", " + max.toString() + "] of " +
                   std::string(primitiveTypeName(type.primitiveType)));
    }
}

void SchemaValidator::fail(const std::string& entity, const std::string& reason) const {
    throw SchemaValidationError(entity, reason);
}

void SchemaValidator::warn(const std::string& entity, const std::string& message) {
    if (options_.warningsFatal) {
        fail(entity, message);
    }
    warnings_.push_back(message + " (" + entity + ")");
    if (!options_.suppressOutput) {
        std::cerr << "[SchemaValidator] Warning: " << warnings_.back() << "\n";
    }
}

}  // namespace sbeir
