#include "sbeir/schema_builder.hpp"
#include "sbeir/errors.hpp"
#include "sbeir/schema_validator.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace sbeir {

namespace {

constexpr uint8_t UNVISITED = 0;
constexpr uint8_t VISITING = 1;
constexpr uint8_t DONE = 2;

// End of a member that starts at offset, checked against the 32-bit layout space
uint32_t layoutEnd(uint32_t offset, uint32_t length, const std::string& path) {
    uint64_t end = static_cast<uint64_t>(offset) + length;
    if (end > std::numeric_limits<uint32_t>::max()) {
        throw SchemaValidationError(path + " (offset " + std::to_string(offset) +
                                        ", length " + std::to_string(length) + ")",
                                    "layout overflow");
    }
    return static_cast<uint32_t>(end);
}

}  // namespace

SchemaBuilder::SchemaBuilder(SchemaAttributes attributes, ParserOptions options)
    : options_(std::move(options)) {
    schema_.attributes_ = std::move(attributes);
    if (options_.headerType) {
        schema_.attributes_.headerType = *options_.headerType;
    }
    builtinTypes_.fill(INVALID_TYPE_ID);
}

// ============================================================================
// Declarations
// ============================================================================

TypeId SchemaBuilder::declareNamed(Type type, const std::string& name) {
    if (schema_.typeIndex_.contains(name)) {
        throw SchemaValidationError(name, "duplicate type name");
    }
    auto id = static_cast<TypeId>(schema_.types_.size());
    schema_.types_.push_back(std::move(type));
    schema_.namedTypes_.push_back(id);
    schema_.typeIndex_.emplace(name, id);
    return id;
}

TypeId SchemaBuilder::addType(EncodedType type) {
    std::string name = type.name;
    type.offset.reset();
    return declareNamed(std::move(type), name);
}

TypeId SchemaBuilder::addComposite(CompositeDecl decl) {
    CompositeType composite;
    composite.name = decl.name;
    composite.semanticType = std::move(decl.semanticType);
    composite.description = std::move(decl.description);
    composite.sinceVersion = decl.sinceVersion;

    TypeId id = declareNamed(std::move(composite), decl.name);

    // Inline members become anonymous arena types following the composite
    std::vector<CompositeMember> members;
    std::vector<std::optional<uint32_t>> offsets;
    for (auto& memberDecl : decl.members) {
        CompositeMember member;
        if (auto* inlineType = std::get_if<EncodedType>(&memberDecl)) {
            member.name = inlineType->name;
            offsets.push_back(inlineType->offset);
            member.type = static_cast<TypeId>(schema_.types_.size());
            schema_.types_.push_back(std::move(*inlineType));
        } else {
            auto& ref = std::get<TypeRefDecl>(memberDecl);
            member.name = ref.name;
            offsets.push_back(ref.offset);
            pendingMembers_.push_back({id, members.size(), ref.typeName});
        }
        members.push_back(std::move(member));
    }

    std::get<CompositeType>(schema_.types_[id]).members = std::move(members);
    if (memberOffsets_.size() <= id) {
        memberOffsets_.resize(id + 1);
    }
    memberOffsets_[id] = std::move(offsets);
    return id;
}

BuilderScope SchemaBuilder::addMessage(MessageDecl decl) {
    Message message;
    message.name = std::move(decl.name);
    message.templateId = decl.templateId;
    message.sinceVersion = decl.sinceVersion;
    message.semanticType = std::move(decl.semanticType);
    message.description = std::move(decl.description);

    auto index = static_cast<uint32_t>(schema_.messages_.size());
    schema_.messages_.push_back(std::move(message));
    messageBlockLengths_.push_back(decl.blockLength);
    return BuilderScope{false, index};
}

EntryId SchemaBuilder::addField(BuilderScope scope, FieldDecl decl) {
    Entry entry;
    entry.kind = EntryKind::Field;
    entry.name = decl.name;
    entry.id = decl.id;
    entry.presence = decl.presence;
    entry.constValue = std::move(decl.constValue);
    entry.sinceVersion = decl.sinceVersion;
    entry.semanticType = std::move(decl.semanticType);
    entry.description = std::move(decl.description);

    PendingEntry pending;
    pending.typeName = std::move(decl.typeName);
    pending.offset = decl.offset;
    return addEntry(scope, std::move(entry), std::move(pending));
}

BuilderScope SchemaBuilder::addGroup(BuilderScope scope, GroupDecl decl) {
    Entry entry;
    entry.kind = EntryKind::Group;
    entry.name = decl.name;
    entry.id = decl.id;
    entry.sinceVersion = decl.sinceVersion;
    entry.semanticType = std::move(decl.semanticType);
    entry.description = std::move(decl.description);
    entry.group = GroupLayout{};

    PendingEntry pending;
    pending.typeName = std::move(decl.dimensionType);
    pending.blockLength = decl.blockLength;
    return BuilderScope{true, addEntry(scope, std::move(entry), std::move(pending))};
}

EntryId SchemaBuilder::addData(BuilderScope scope, DataDecl decl) {
    Entry entry;
    entry.kind = EntryKind::Data;
    entry.name = decl.name;
    entry.id = decl.id;
    entry.sinceVersion = decl.sinceVersion;
    entry.semanticType = std::move(decl.semanticType);
    entry.description = std::move(decl.description);
    entry.varData = VarDataLayout{};

    PendingEntry pending;
    pending.typeName = std::move(decl.typeName);
    return addEntry(scope, std::move(entry), std::move(pending));
}

EntryId SchemaBuilder::addEntry(BuilderScope scope, Entry entry, PendingEntry pending) {
    pending.path = scopePath(scope) + "." + entry.name;

    auto id = static_cast<EntryId>(schema_.entries_.size());
    schema_.entries_.push_back(std::move(entry));
    pendingEntries_.push_back(std::move(pending));

    // Fetch the list after the push; the arena may have moved
    scopeEntries(scope).push_back(id);
    return id;
}

std::vector<EntryId>& SchemaBuilder::scopeEntries(BuilderScope scope) {
    if (scope.isGroup) {
        if (scope.index < schema_.entries_.size() && schema_.entries_[scope.index].group) {
            return schema_.entries_[scope.index].group->children;
        }
    } else if (scope.index < schema_.messages_.size()) {
        return schema_.messages_[scope.index].entries;
    }
    throw std::invalid_argument("SchemaBuilder: unknown scope " + std::to_string(scope.index));
}

std::string SchemaBuilder::scopePath(BuilderScope scope) const {
    if (scope.isGroup) {
        if (scope.index < pendingEntries_.size() && schema_.entries_[scope.index].group) {
            return pendingEntries_[scope.index].path;
        }
    } else if (scope.index < schema_.messages_.size()) {
        return schema_.messages_[scope.index].name;
    }
    throw std::invalid_argument("SchemaBuilder: unknown scope " + std::to_string(scope.index));
}

// ============================================================================
// Build
// ============================================================================

Schema SchemaBuilder::build() {
    if (built_) {
        throw std::logic_error("SchemaBuilder::build called twice");
    }
    built_ = true;

    resolveCompositeMembers();
    layoutComposites();
    resolveHeader();
    resolveEntries();

    for (size_t i = 0; i < schema_.messages_.size(); ++i) {
        auto& message = schema_.messages_[i];
        message.blockLength = layoutScope(message.entries, messageBlockLengths_[i]);
    }

    schema_.reindex();

    if (options_.validate) {
        SchemaValidator validator(options_);
        validator.validate(schema_);
        warningCount_ = validator.warningCount();
    }

    return std::move(schema_);
}

std::optional<TypeId> SchemaBuilder::resolveTypeName(const std::string& name) {
    if (auto id = schema_.findType(name)) {
        return id;
    }

    auto primitive = primitiveTypeFromName(name);
    if (!primitive) {
        return std::nullopt;
    }

    auto& cached = builtinTypes_[static_cast<size_t>(*primitive)];
    if (cached == INVALID_TYPE_ID) {
        EncodedType builtin;
        builtin.name = name;
        builtin.primitiveType = *primitive;
        cached = static_cast<TypeId>(schema_.types_.size());
        schema_.types_.push_back(std::move(builtin));
    }
    return cached;
}

void SchemaBuilder::resolveCompositeMembers() {
    for (const auto& pending : pendingMembers_) {
        auto resolved = resolveTypeName(pending.typeName);
        auto& composite = std::get<CompositeType>(schema_.types_[pending.composite]);
        auto& member = composite.members[pending.member];
        if (!resolved) {
            throw SchemaValidationError(composite.name + "." + member.name + " (type '" + pending.typeName + "')",
                                        "unresolved type");
        }
        member.type = *resolved;
    }
}

void SchemaBuilder::layoutComposites() {
    std::vector<uint8_t> marks(schema_.types_.size(), UNVISITED);

    // Post-order over composite references; members are laid out before
    // the composites that embed them
    for (TypeId root = 0; root < schema_.types_.size(); ++root) {
        if (!std::holds_alternative<CompositeType>(schema_.types_[root]) || marks[root] == DONE) {
            continue;
        }

        std::vector<std::pair<TypeId, size_t>> stack;
        stack.emplace_back(root, 0);
        marks[root] = VISITING;

        while (!stack.empty()) {
            auto& [id, next] = stack.back();
            const auto& composite = std::get<CompositeType>(schema_.types_[id]);
            if (next == composite.members.size()) {
                layoutComposite(id);
                marks[id] = DONE;
                stack.pop_back();
                continue;
            }

            TypeId child = composite.members[next++].type;
            if (!std::holds_alternative<CompositeType>(schema_.types_[child])) {
                continue;
            }
            if (marks[child] == VISITING) {
                throw SchemaValidationError(std::string(schema_.typeName(child)), "type cycle");
            }
            if (marks[child] == UNVISITED) {
                marks[child] = VISITING;
                stack.emplace_back(child, 0);
            }
        }
    }
}

void SchemaBuilder::layoutComposite(TypeId id) {
    auto& composite = std::get<CompositeType>(schema_.types_[id]);
    const auto& offsets = memberOffsets_[id];
    uint32_t running = 0;
    for (size_t i = 0; i < composite.members.size(); ++i) {
        auto& member = composite.members[i];
        member.offset = offsets[i].value_or(running);
        uint32_t end = layoutEnd(member.offset, schema_.encodedLength(member.type),
                                 composite.name + "." + member.name);
        running = std::max(running, end);
    }
    composite.encodedLength = running;
    composite.role = classifyComposite(schema_, composite);
}

void SchemaBuilder::resolveHeader() {
    const auto& name = schema_.attributes_.headerType;
    auto id = schema_.findType(name);
    if (!id || !schema_.compositeType(*id)) {
        throw SchemaValidationError(name, "unresolved type");
    }
    schema_.headerType_ = *id;
}

void SchemaBuilder::resolveEntries() {
    for (EntryId id = 0; id < schema_.entries_.size(); ++id) {
        const auto& pending = pendingEntries_[id];

        auto resolved = resolveTypeName(pending.typeName);
        if (!resolved) {
            throw SchemaValidationError(pending.path + " (type '" + pending.typeName + "')", "unresolved type");
        }

        auto& entry = schema_.entries_[id];
        entry.type = *resolved;

        switch (entry.kind) {
            case EntryKind::Field:
                break;
            case EntryKind::Group:
                resolveGroup(entry, pending);
                break;
            case EntryKind::Data:
                resolveData(entry, pending);
                break;
        }
    }
}

void SchemaBuilder::resolveGroup(Entry& group, const PendingEntry& pending) {
    const auto* dimension = schema_.compositeType(group.type);
    if (!dimension || dimension->role != CompositeRole::GroupDimension) {
        throw SchemaValidationError(pending.path + " (dimension '" + pending.typeName + "')",
                                    "invalid group dimension");
    }
    group.group->blockLengthMember = static_cast<uint32_t>(*dimension->findMember("blockLength"));
    group.group->numInGroupMember = static_cast<uint32_t>(*dimension->findMember("numInGroup"));
}

void SchemaBuilder::resolveData(Entry& data, const PendingEntry& pending) {
    const auto* composite = schema_.compositeType(data.type);
    if (!composite || composite->role != CompositeRole::VarDataEncoding) {
        throw SchemaValidationError(pending.path + " (type '" + pending.typeName + "')",
                                    "invalid var data encoding");
    }

    const auto* length = schema_.encodedType(composite->members[0].type);
    const auto* payload = schema_.encodedType(composite->members[1].type);

    auto& layout = *data.varData;
    layout.lengthMember = 0;
    layout.payloadMember = 1;
    layout.lengthType = length->primitiveType;
    layout.payloadType = payload->primitiveType;
    layout.characterEncoding = payload->characterEncoding;
    layout.payloadRole = (payload->primitiveType == PrimitiveType::Char || payload->characterEncoding)
        ? PayloadRole::Text
        : PayloadRole::Opaque;
}

uint32_t SchemaBuilder::layoutScope(const std::vector<EntryId>& ids, std::optional<uint32_t> blockLength) {
    struct Frame {
        const std::vector<EntryId>* ids;
        std::optional<uint32_t> blockLength;
        EntryId group;
        size_t next = 0;
        uint32_t running = 0;
    };

    std::vector<Frame> stack;
    stack.push_back({&ids, blockLength, INVALID_ENTRY_ID});
    uint32_t result = 0;

    while (!stack.empty()) {
        auto& frame = stack.back();
        if (frame.next == frame.ids->size()) {
            // An explicit block length may add padding; one that is too small
            // is left in place for the validator to report
            uint32_t length = frame.blockLength.value_or(frame.running);
            EntryId group = frame.group;
            stack.pop_back();
            if (stack.empty()) {
                result = length;
            } else {
                schema_.entries_[group].group->blockLength = length;
            }
            continue;
        }

        EntryId id = (*frame.ids)[frame.next++];
        auto& entry = schema_.entries_[id];
        const auto& pending = pendingEntries_[id];

        if (entry.isField()) {
            uint32_t length = entry.presence == Presence::Constant ? 0 : schema_.encodedLength(entry.type);
            entry.offset = pending.offset.value_or(frame.running);
            frame.running = std::max(frame.running, layoutEnd(entry.offset, length, pending.path));
        } else if (entry.isGroup()) {
            stack.push_back({&entry.group->children, pending.blockLength, id});
        }
    }
    return result;
}

}  // namespace sbeir
