#include "sbeir/schema.hpp"
#include "sbeir/errors.hpp"

#include <stdexcept>

namespace sbeir {

// ============================================================================
// Enum names
// ============================================================================

std::string_view byteOrderName(ByteOrder order) {
    switch (order) {
        case ByteOrder::LittleEndian: return "littleEndian";
        case ByteOrder::BigEndian: return "bigEndian";
    }
    return "unknown";
}

std::optional<ByteOrder> byteOrderFromName(std::string_view name) {
    if (name == "littleEndian") return ByteOrder::LittleEndian;
    if (name == "bigEndian") return ByteOrder::BigEndian;
    return std::nullopt;
}

std::string_view presenceName(Presence presence) {
    switch (presence) {
        case Presence::Required: return "required";
        case Presence::Optional: return "optional";
        case Presence::Constant: return "constant";
    }
    return "unknown";
}

std::optional<Presence> presenceFromName(std::string_view name) {
    if (name == "required") return Presence::Required;
    if (name == "optional") return Presence::Optional;
    if (name == "constant") return Presence::Constant;
    return std::nullopt;
}

std::string_view compositeRoleName(CompositeRole role) {
    switch (role) {
        case CompositeRole::Plain: return "plain";
        case CompositeRole::MessageHeader: return "messageHeader";
        case CompositeRole::GroupDimension: return "groupDimension";
        case CompositeRole::VarDataEncoding: return "varDataEncoding";
    }
    return "unknown";
}

std::string_view entryKindName(EntryKind kind) {
    switch (kind) {
        case EntryKind::Field: return "field";
        case EntryKind::Group: return "group";
        case EntryKind::Data: return "data";
    }
    return "unknown";
}

// ============================================================================
// EncodedType / CompositeType / VarDataLayout
// ============================================================================

uint32_t EncodedType::encodedLength() const {
    if (presence == Presence::Constant) {
        return 0;
    }
    uint64_t bytes = static_cast<uint64_t>(primitiveTypeSize(primitiveType)) * length;
    if (bytes > std::numeric_limits<uint32_t>::max()) {
        throw SchemaValidationError(name + " (" + std::to_string(bytes) + " bytes)", "layout overflow");
    }
    return static_cast<uint32_t>(bytes);
}

const PrimitiveValue& EncodedType::effectiveMinValue() const {
    return minValue ? *minValue : primitiveMinValue(primitiveType);
}

const PrimitiveValue& EncodedType::effectiveMaxValue() const {
    return maxValue ? *maxValue : primitiveMaxValue(primitiveType);
}

const PrimitiveValue& EncodedType::effectiveNullValue() const {
    return nullValue ? *nullValue : primitiveNullValue(primitiveType);
}

std::optional<size_t> CompositeType::findMember(std::string_view memberName) const {
    for (size_t i = 0; i < members.size(); ++i) {
        if (members[i].name == memberName) {
            return i;
        }
    }
    return std::nullopt;
}

uint64_t VarDataLayout::maxPayloadLength() const {
    // Unsigned max values are stored as bit patterns; reinterpret before widening
    auto max = primitiveMaxValue(lengthType).asIntegral();
    if (lengthType == PrimitiveType::UInt64) {
        return static_cast<uint64_t>(max);
    }
    return max < 0 ? 0 : static_cast<uint64_t>(max);
}

// ============================================================================
// EntryRange
// ============================================================================

EntryRange::iterator::reference EntryRange::iterator::operator*() const {
    return schema_->entry(*position_);
}

const Entry& EntryRange::operator[](size_t index) const {
    return schema_->entry(ids_[index]);
}

// ============================================================================
// Schema - types
// ============================================================================

const Type& Schema::type(TypeId id) const {
    if (id >= types_.size()) {
        throw std::out_of_range("Schema::type unknown type id " + std::to_string(id));
    }
    return types_[id];
}

std::optional<TypeId> Schema::findType(std::string_view name) const {
    auto it = typeIndex_.find(std::string(name));
    if (it == typeIndex_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const EncodedType* Schema::encodedType(TypeId id) const {
    if (id >= types_.size()) return nullptr;
    return std::get_if<EncodedType>(&types_[id]);
}

const CompositeType* Schema::compositeType(TypeId id) const {
    if (id >= types_.size()) return nullptr;
    return std::get_if<CompositeType>(&types_[id]);
}

std::string_view Schema::typeName(TypeId id) const {
    if (id >= types_.size()) return {};
    return std::visit([](const auto& t) -> std::string_view { return t.name; }, types_[id]);
}

uint32_t Schema::encodedLength(TypeId id) const {
    if (const auto* encoded = encodedType(id)) {
        return encoded->encodedLength();
    }
    if (const auto* composite = compositeType(id)) {
        return composite->encodedLength;
    }
    return 0;
}

const CompositeType& Schema::messageHeader() const {
    const auto* header = compositeType(headerType_);
    if (!header) {
        throw std::out_of_range("Schema has no message header composite");
    }
    return *header;
}

// ============================================================================
// Schema - messages and entries
// ============================================================================

const Message* Schema::findMessage(uint32_t templateId) const {
    auto it = messageIndex_.find(templateId);
    if (it == messageIndex_.end()) {
        return nullptr;
    }
    return &messages_[it->second];
}

const Message* Schema::findMessage(std::string_view name) const {
    for (const auto& message : messages_) {
        if (message.name == name) {
            return &message;
        }
    }
    return nullptr;
}

const Entry& Schema::entry(EntryId id) const {
    if (id >= entries_.size()) {
        throw std::out_of_range("Schema::entry unknown entry id " + std::to_string(id));
    }
    return entries_[id];
}

EntryRange Schema::entries(const Message& message) const {
    return EntryRange(*this, message.entries);
}

EntryRange Schema::entries(const Entry& group) const {
    if (!group.group) {
        return EntryRange(*this, {});
    }
    return EntryRange(*this, group.group->children);
}

const Entry* Schema::findMember(const Message& message, uint32_t id) const {
    for (const auto& member : entries(message)) {
        if (member.id == id) {
            return &member;
        }
    }
    return nullptr;
}

const Entry* Schema::findMember(const Entry& group, uint32_t id) const {
    for (const auto& member : entries(group)) {
        if (member.id == id) {
            return &member;
        }
    }
    return nullptr;
}

std::optional<DimensionView> Schema::dimension(const Entry& group) const {
    if (!group.group) {
        return std::nullopt;
    }
    const auto* composite = compositeType(group.type);
    if (!composite ||
        group.group->blockLengthMember >= composite->members.size() ||
        group.group->numInGroupMember >= composite->members.size()) {
        return std::nullopt;
    }

    DimensionView view;
    view.composite = composite;
    view.blockLength = &composite->members[group.group->blockLengthMember];
    view.numInGroup = &composite->members[group.group->numInGroupMember];
    if (const auto* count = encodedType(view.numInGroup->type)) {
        view.numInGroupType = count->primitiveType;
    }
    return view;
}

void Schema::walk(const Message& message,
                  const std::function<void(const Entry& entry, size_t depth)>& visitor) const {
    struct Frame {
        std::span<const EntryId> ids;
        size_t next = 0;
    };

    // Explicit stack; a decoded IR may nest groups arbitrarily deep
    std::vector<Frame> stack;
    stack.push_back({message.entries});
    while (!stack.empty()) {
        auto& frame = stack.back();
        if (frame.next == frame.ids.size()) {
            stack.pop_back();
            continue;
        }

        const auto& member = entry(frame.ids[frame.next++]);
        visitor(member, stack.size() - 1);
        if (member.isGroup() && member.group) {
            stack.push_back({member.group->children});
        }
    }
}

void Schema::reindex() {
    typeIndex_.clear();
    for (TypeId id : namedTypes_) {
        if (id < types_.size()) {
            typeIndex_.emplace(std::string(typeName(id)), id);
        }
    }

    messageIndex_.clear();
    for (size_t i = 0; i < messages_.size(); ++i) {
        messageIndex_.emplace(messages_[i].templateId, i);
    }
}

}  // namespace sbeir
