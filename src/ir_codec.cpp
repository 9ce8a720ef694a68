/**
 * @file ir_codec.cpp
 * @brief Schema CBOR serialization and LZ4-compressed file I/O
 *
 * Document layout (CBOR map):
 *   format      int, IR_FORMAT_VERSION
 *   attributes  map of schema attributes
 *   types       array of [kind, map], in arena order
 *   namedTypes  array of type ids
 *   headerType  type id
 *   entries     array of maps, in arena order
 *   messages    array of maps
 *
 * Enumerations are written as their ordinal. PrimitiveValues are arrays:
 *   [0, size, int] | [1, size, float64] | [2, size, bytes, encoding|null]
 */

#include "sbeir/ir_codec.hpp"
#include "sbeir/cbor.hpp"
#include "sbeir/errors.hpp"
#include "sbeir/schema_validator.hpp"

#include <lz4.h>

#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <unordered_set>

namespace sbeir {

namespace {

constexpr uint32_t IR_MAGIC = 0x52494253;  // "SBIR" as little-endian bytes
constexpr size_t HEADER_SIZE = 12;

constexpr uint32_t TYPE_KIND_ENCODED = 0;
constexpr uint32_t TYPE_KIND_COMPOSITE = 1;

constexpr size_t PRESENCE_COUNT = 3;
constexpr size_t BYTE_ORDER_COUNT = 2;
constexpr size_t COMPOSITE_ROLE_COUNT = 4;
constexpr size_t ENTRY_KIND_COUNT = 3;
constexpr size_t PAYLOAD_ROLE_COUNT = 2;

template <typename Enum>
uint64_t ordinal(Enum value) {
    return static_cast<uint64_t>(value);
}

// ============================================================================
// Encoding
// ============================================================================

void encodeValue(std::vector<uint8_t>& out, const PrimitiveValue& value) {
    switch (value.representation()) {
        case PrimitiveValue::Representation::Integral:
            cbor::encodeArrayHeader(out, 3);
            cbor::encodeUInt(out, ordinal(value.representation()));
            cbor::encodeUInt(out, value.size());
            cbor::encodeInt(out, value.asIntegral());
            break;
        case PrimitiveValue::Representation::Floating:
            cbor::encodeArrayHeader(out, 3);
            cbor::encodeUInt(out, ordinal(value.representation()));
            cbor::encodeUInt(out, value.size());
            cbor::encodeDouble(out, value.asFloating());
            break;
        case PrimitiveValue::Representation::RawBytes:
            cbor::encodeArrayHeader(out, 4);
            cbor::encodeUInt(out, ordinal(value.representation()));
            cbor::encodeUInt(out, value.size());
            cbor::encodeBytes(out, value.asRawBytes());
            if (value.characterEncoding()) {
                cbor::encodeString(out, *value.characterEncoding());
            } else {
                cbor::encodeNull(out);
            }
            break;
    }
}

void encodeOptional(cbor::MapWriter& map, std::string_view key, const std::optional<PrimitiveValue>& value) {
    if (value) {
        encodeValue(map.key(key), *value);
    }
}

void encodeOptional(cbor::MapWriter& map, std::string_view key, const std::optional<std::string>& text) {
    if (text) {
        cbor::encodeString(map.key(key), *text);
    }
}

void encodeIdList(std::vector<uint8_t>& out, std::span<const uint32_t> ids) {
    cbor::encodeArrayHeader(out, ids.size());
    for (auto id : ids) {
        cbor::encodeUInt(out, id);
    }
}

void encodeAttributes(std::vector<uint8_t>& out, const SchemaAttributes& attributes) {
    cbor::MapWriter map;
    cbor::encodeString(map.key("package"), attributes.package);
    cbor::encodeUInt(map.key("id"), attributes.id);
    cbor::encodeUInt(map.key("version"), attributes.version);
    cbor::encodeString(map.key("semanticVersion"), attributes.semanticVersion);
    cbor::encodeString(map.key("description"), attributes.description);
    cbor::encodeUInt(map.key("byteOrder"), ordinal(attributes.byteOrder));
    cbor::encodeString(map.key("headerType"), attributes.headerType);
    map.finish(out);
}

void encodeEncodedType(std::vector<uint8_t>& out, const EncodedType& type) {
    cbor::MapWriter map;
    cbor::encodeString(map.key("name"), type.name);
    cbor::encodeUInt(map.key("primitiveType"), ordinal(type.primitiveType));
    cbor::encodeUInt(map.key("length"), type.length);
    cbor::encodeUInt(map.key("presence"), ordinal(type.presence));
    encodeOptional(map, "constValue", type.constValue);
    encodeOptional(map, "minValue", type.minValue);
    encodeOptional(map, "maxValue", type.maxValue);
    encodeOptional(map, "nullValue", type.nullValue);
    encodeOptional(map, "characterEncoding", type.characterEncoding);
    encodeOptional(map, "semanticType", type.semanticType);
    encodeOptional(map, "description", type.description);
    if (type.offset) {
        cbor::encodeUInt(map.key("offset"), *type.offset);
    }
    cbor::encodeUInt(map.key("sinceVersion"), type.sinceVersion);
    map.finish(out);
}

void encodeCompositeType(std::vector<uint8_t>& out, const CompositeType& composite) {
    cbor::MapWriter map;
    cbor::encodeString(map.key("name"), composite.name);

    auto& members = map.key("members");
    cbor::encodeArrayHeader(members, composite.members.size());
    for (const auto& member : composite.members) {
        cbor::encodeArrayHeader(members, 3);
        cbor::encodeString(members, member.name);
        cbor::encodeUInt(members, member.type);
        cbor::encodeUInt(members, member.offset);
    }

    encodeOptional(map, "semanticType", composite.semanticType);
    encodeOptional(map, "description", composite.description);
    cbor::encodeUInt(map.key("sinceVersion"), composite.sinceVersion);
    cbor::encodeUInt(map.key("encodedLength"), composite.encodedLength);
    cbor::encodeUInt(map.key("role"), ordinal(composite.role));
    map.finish(out);
}

void encodeType(std::vector<uint8_t>& out, const Type& type) {
    cbor::encodeArrayHeader(out, 2);
    if (const auto* encoded = std::get_if<EncodedType>(&type)) {
        cbor::encodeUInt(out, TYPE_KIND_ENCODED);
        encodeEncodedType(out, *encoded);
    } else {
        cbor::encodeUInt(out, TYPE_KIND_COMPOSITE);
        encodeCompositeType(out, std::get<CompositeType>(type));
    }
}

void encodeEntry(std::vector<uint8_t>& out, const Entry& entry) {
    cbor::MapWriter map;
    cbor::encodeUInt(map.key("kind"), ordinal(entry.kind));
    cbor::encodeString(map.key("name"), entry.name);
    cbor::encodeUInt(map.key("id"), entry.id);
    cbor::encodeUInt(map.key("type"), entry.type);
    cbor::encodeUInt(map.key("offset"), entry.offset);
    cbor::encodeUInt(map.key("sinceVersion"), entry.sinceVersion);
    cbor::encodeUInt(map.key("presence"), ordinal(entry.presence));
    encodeOptional(map, "constValue", entry.constValue);
    encodeOptional(map, "semanticType", entry.semanticType);
    encodeOptional(map, "description", entry.description);

    if (entry.group) {
        cbor::MapWriter group;
        cbor::encodeUInt(group.key("blockLength"), entry.group->blockLength);
        encodeIdList(group.key("children"), entry.group->children);
        cbor::encodeUInt(group.key("blockLengthMember"), entry.group->blockLengthMember);
        cbor::encodeUInt(group.key("numInGroupMember"), entry.group->numInGroupMember);
        group.finish(map.key("group"));
    }

    if (entry.varData) {
        cbor::MapWriter varData;
        cbor::encodeUInt(varData.key("lengthMember"), entry.varData->lengthMember);
        cbor::encodeUInt(varData.key("payloadMember"), entry.varData->payloadMember);
        cbor::encodeUInt(varData.key("lengthType"), ordinal(entry.varData->lengthType));
        cbor::encodeUInt(varData.key("payloadType"), ordinal(entry.varData->payloadType));
        cbor::encodeUInt(varData.key("payloadRole"), ordinal(entry.varData->payloadRole));
        encodeOptional(varData, "characterEncoding", entry.varData->characterEncoding);
        varData.finish(map.key("varData"));
    }

    map.finish(out);
}

void encodeMessage(std::vector<uint8_t>& out, const Message& message) {
    cbor::MapWriter map;
    cbor::encodeString(map.key("name"), message.name);
    cbor::encodeUInt(map.key("templateId"), message.templateId);
    cbor::encodeUInt(map.key("blockLength"), message.blockLength);
    cbor::encodeUInt(map.key("sinceVersion"), message.sinceVersion);
    encodeOptional(map, "semanticType", message.semanticType);
    encodeOptional(map, "description", message.description);
    encodeIdList(map.key("entries"), message.entries);
    map.finish(out);
}

}  // namespace

std::vector<uint8_t> encodeIr(const Schema& schema) {
    cbor::MapWriter map;
    cbor::encodeInt(map.key("format"), IR_FORMAT_VERSION);
    encodeAttributes(map.key("attributes"), schema.attributes());

    auto& types = map.key("types");
    cbor::encodeArrayHeader(types, schema.typeCount());
    for (TypeId id = 0; id < schema.typeCount(); ++id) {
        encodeType(types, schema.type(id));
    }

    encodeIdList(map.key("namedTypes"), schema.namedTypes());
    cbor::encodeUInt(map.key("headerType"), schema.messageHeaderType());

    auto& entries = map.key("entries");
    cbor::encodeArrayHeader(entries, schema.entryCount());
    for (EntryId id = 0; id < schema.entryCount(); ++id) {
        encodeEntry(entries, schema.entry(id));
    }

    auto& messages = map.key("messages");
    cbor::encodeArrayHeader(messages, schema.messages().size());
    for (const auto& message : schema.messages()) {
        encodeMessage(messages, message);
    }

    std::vector<uint8_t> out;
    out.reserve(1024);
    map.finish(out);
    return out;
}

// ============================================================================
// Decoding
// ============================================================================

class IrDecoder {
public:
    explicit IrDecoder(std::span<const uint8_t> data) : decoder_(data) {}

    Schema decode();

private:
    SchemaAttributes readAttributes();
    Type readType();
    EncodedType readEncodedType();
    CompositeType readCompositeType();
    Entry readEntry();
    GroupLayout readGroupLayout();
    VarDataLayout readVarDataLayout();
    Message readMessage();
    PrimitiveValue readValue();
    std::vector<uint32_t> readIdList();

    template <typename Enum>
    Enum readEnum(size_t count, std::string_view what) {
        auto value = decoder_.readUInt32();
        if (value >= count) {
            throw IrFormatError("Invalid " + std::string(what) + " ordinal " + std::to_string(value));
        }
        return static_cast<Enum>(value);
    }

    // Arena references must be in range; each entry may belong to one scope
    static void checkReferences(const Schema& schema);

    cbor::Decoder decoder_;
};

Schema IrDecoder::decode() {
    Schema schema;
    bool sawFormat = false;

    auto fields = decoder_.readMapHeader();
    for (uint64_t i = 0; i < fields; ++i) {
        auto key = decoder_.readText();

        if (key == "format") {
            auto version = decoder_.readInt();
            if (version != IR_FORMAT_VERSION) {
                throw IrFormatError("Unsupported IR format version " + std::to_string(version));
            }
            sawFormat = true;
        } else if (key == "attributes") {
            schema.attributes_ = readAttributes();
        } else if (key == "types") {
            auto count = decoder_.readArrayHeader();
            for (uint64_t j = 0; j < count; ++j) {
                schema.types_.push_back(readType());
            }
        } else if (key == "namedTypes") {
            schema.namedTypes_ = readIdList();
        } else if (key == "headerType") {
            schema.headerType_ = decoder_.readUInt32();
        } else if (key == "entries") {
            auto count = decoder_.readArrayHeader();
            for (uint64_t j = 0; j < count; ++j) {
                schema.entries_.push_back(readEntry());
            }
        } else if (key == "messages") {
            auto count = decoder_.readArrayHeader();
            for (uint64_t j = 0; j < count; ++j) {
                schema.messages_.push_back(readMessage());
            }
        } else {
            decoder_.skipValue();
        }
    }

    if (!sawFormat) {
        throw IrFormatError("IR document has no format version");
    }
    if (decoder_.hasMore()) {
        throw IrFormatError("Trailing bytes after IR document at offset " + std::to_string(decoder_.position()));
    }

    checkReferences(schema);
    schema.reindex();
    return schema;
}

SchemaAttributes IrDecoder::readAttributes() {
    SchemaAttributes attributes;
    auto fields = decoder_.readMapHeader();
    for (uint64_t i = 0; i < fields; ++i) {
        auto key = decoder_.readText();
        if (key == "package") {
            attributes.package = decoder_.readText();
        } else if (key == "id") {
            attributes.id = decoder_.readUInt32();
        } else if (key == "version") {
            attributes.version = decoder_.readUInt32();
        } else if (key == "semanticVersion") {
            attributes.semanticVersion = decoder_.readText();
        } else if (key == "description") {
            attributes.description = decoder_.readText();
        } else if (key == "byteOrder") {
            attributes.byteOrder = readEnum<ByteOrder>(BYTE_ORDER_COUNT, "byte order");
        } else if (key == "headerType") {
            attributes.headerType = decoder_.readText();
        } else {
            decoder_.skipValue();
        }
    }
    return attributes;
}

Type IrDecoder::readType() {
    if (decoder_.readArrayHeader() != 2) {
        throw IrFormatError("Type record must be [kind, map]");
    }
    auto kind = decoder_.readUInt32();
    switch (kind) {
        case TYPE_KIND_ENCODED: return readEncodedType();
        case TYPE_KIND_COMPOSITE: return readCompositeType();
        default:
            throw IrFormatError("Unknown type kind " + std::to_string(kind));
    }
}

EncodedType IrDecoder::readEncodedType() {
    EncodedType type;
    auto fields = decoder_.readMapHeader();
    for (uint64_t i = 0; i < fields; ++i) {
        auto key = decoder_.readText();
        if (key == "name") {
            type.name = decoder_.readText();
        } else if (key == "primitiveType") {
            type.primitiveType = readEnum<PrimitiveType>(PRIMITIVE_TYPE_COUNT, "primitive type");
        } else if (key == "length") {
            type.length = decoder_.readUInt32();
        } else if (key == "presence") {
            type.presence = readEnum<Presence>(PRESENCE_COUNT, "presence");
        } else if (key == "constValue") {
            type.constValue = readValue();
        } else if (key == "minValue") {
            type.minValue = readValue();
        } else if (key == "maxValue") {
            type.maxValue = readValue();
        } else if (key == "nullValue") {
            type.nullValue = readValue();
        } else if (key == "characterEncoding") {
            type.characterEncoding = decoder_.readText();
        } else if (key == "semanticType") {
            type.semanticType = decoder_.readText();
        } else if (key == "description") {
            type.description = decoder_.readText();
        } else if (key == "offset") {
            type.offset = decoder_.readUInt32();
        } else if (key == "sinceVersion") {
            type.sinceVersion = decoder_.readUInt32();
        } else {
            decoder_.skipValue();
        }
    }
    return type;
}

CompositeType IrDecoder::readCompositeType() {
    CompositeType composite;
    auto fields = decoder_.readMapHeader();
    for (uint64_t i = 0; i < fields; ++i) {
        auto key = decoder_.readText();
        if (key == "name") {
            composite.name = decoder_.readText();
        } else if (key == "members") {
            auto count = decoder_.readArrayHeader();
            for (uint64_t j = 0; j < count; ++j) {
                if (decoder_.readArrayHeader() != 3) {
                    throw IrFormatError("Composite member must be [name, type, offset]");
                }
                CompositeMember member;
                member.name = decoder_.readText();
                member.type = decoder_.readUInt32();
                member.offset = decoder_.readUInt32();
                composite.members.push_back(std::move(member));
            }
        } else if (key == "semanticType") {
            composite.semanticType = decoder_.readText();
        } else if (key == "description") {
            composite.description = decoder_.readText();
        } else if (key == "sinceVersion") {
            composite.sinceVersion = decoder_.readUInt32();
        } else if (key == "encodedLength") {
            composite.encodedLength = decoder_.readUInt32();
        } else if (key == "role") {
            composite.role = readEnum<CompositeRole>(COMPOSITE_ROLE_COUNT, "composite role");
        } else {
            decoder_.skipValue();
        }
    }
    return composite;
}

Entry IrDecoder::readEntry() {
    Entry entry;
    auto fields = decoder_.readMapHeader();
    for (uint64_t i = 0; i < fields; ++i) {
        auto key = decoder_.readText();
        if (key == "kind") {
            entry.kind = readEnum<EntryKind>(ENTRY_KIND_COUNT, "entry kind");
        } else if (key == "name") {
            entry.name = decoder_.readText();
        } else if (key == "id") {
            entry.id = decoder_.readUInt32();
        } else if (key == "type") {
            entry.type = decoder_.readUInt32();
        } else if (key == "offset") {
            entry.offset = decoder_.readUInt32();
        } else if (key == "sinceVersion") {
            entry.sinceVersion = decoder_.readUInt32();
        } else if (key == "presence") {
            entry.presence = readEnum<Presence>(PRESENCE_COUNT, "presence");
        } else if (key == "constValue") {
            entry.constValue = readValue();
        } else if (key == "semanticType") {
            entry.semanticType = decoder_.readText();
        } else if (key == "description") {
            entry.description = decoder_.readText();
        } else if (key == "group") {
            entry.group = readGroupLayout();
        } else if (key == "varData") {
            entry.varData = readVarDataLayout();
        } else {
            decoder_.skipValue();
        }
    }

    if (entry.isGroup() != entry.group.has_value() || entry.isData() != entry.varData.has_value()) {
        throw IrFormatError("Entry '" + entry.name + "' layout does not match its kind");
    }
    return entry;
}

GroupLayout IrDecoder::readGroupLayout() {
    GroupLayout layout;
    auto fields = decoder_.readMapHeader();
    for (uint64_t i = 0; i < fields; ++i) {
        auto key = decoder_.readText();
        if (key == "blockLength") {
            layout.blockLength = decoder_.readUInt32();
        } else if (key == "children") {
            layout.children = readIdList();
        } else if (key == "blockLengthMember") {
            layout.blockLengthMember = decoder_.readUInt32();
        } else if (key == "numInGroupMember") {
            layout.numInGroupMember = decoder_.readUInt32();
        } else {
            decoder_.skipValue();
        }
    }
    return layout;
}

VarDataLayout IrDecoder::readVarDataLayout() {
    VarDataLayout layout;
    auto fields = decoder_.readMapHeader();
    for (uint64_t i = 0; i < fields; ++i) {
        auto key = decoder_.readText();
        if (key == "lengthMember") {
            layout.lengthMember = decoder_.readUInt32();
        } else if (key == "payloadMember") {
            layout.payloadMember = decoder_.readUInt32();
        } else if (key == "lengthType") {
            layout.lengthType = readEnum<PrimitiveType>(PRIMITIVE_TYPE_COUNT, "primitive type");
        } else if (key == "payloadType") {
            layout.payloadType = readEnum<PrimitiveType>(PRIMITIVE_TYPE_COUNT, "primitive type");
        } else if (key == "payloadRole") {
            layout.payloadRole = readEnum<PayloadRole>(PAYLOAD_ROLE_COUNT, "payload role");
        } else if (key == "characterEncoding") {
            layout.characterEncoding = decoder_.readText();
        } else {
            decoder_.skipValue();
        }
    }
    return layout;
}

Message IrDecoder::readMessage() {
    Message message;
    auto fields = decoder_.readMapHeader();
    for (uint64_t i = 0; i < fields; ++i) {
        auto key = decoder_.readText();
        if (key == "name") {
            message.name = decoder_.readText();
        } else if (key == "templateId") {
            message.templateId = decoder_.readUInt32();
        } else if (key == "blockLength") {
            message.blockLength = decoder_.readUInt32();
        } else if (key == "sinceVersion") {
            message.sinceVersion = decoder_.readUInt32();
        } else if (key == "semanticType") {
            message.semanticType = decoder_.readText();
        } else if (key == "description") {
            message.description = decoder_.readText();
        } else if (key == "entries") {
            message.entries = readIdList();
        } else {
            decoder_.skipValue();
        }
    }
    return message;
}

PrimitiveValue IrDecoder::readValue() {
    auto count = decoder_.readArrayHeader();
    auto representation = decoder_.readUInt32();
    auto size = decoder_.readUInt32();

    switch (static_cast<PrimitiveValue::Representation>(representation)) {
        case PrimitiveValue::Representation::Integral:
            if (count == 3) return PrimitiveValue::fromIntegral(decoder_.readInt(), size);
            break;
        case PrimitiveValue::Representation::Floating:
            if (count == 3) return PrimitiveValue::fromFloating(decoder_.readFloat64(), size);
            break;
        case PrimitiveValue::Representation::RawBytes:
            if (count == 4) {
                auto bytes = decoder_.readBytes();
                auto encoding = decoder_.readOptionalText();
                return PrimitiveValue::fromRawBytes(std::move(bytes), std::move(encoding), size);
            }
            break;
    }
    throw IrFormatError("Malformed primitive value (representation " + std::to_string(representation) +
                        ", " + std::to_string(count) + " elements)");
}

std::vector<uint32_t> IrDecoder::readIdList() {
    std::vector<uint32_t> ids;
    auto count = decoder_.readArrayHeader();
    ids.reserve(count);
    for (uint64_t i = 0; i < count; ++i) {
        ids.push_back(decoder_.readUInt32());
    }
    return ids;
}

void IrDecoder::checkReferences(const Schema& schema) {
    std::unordered_set<std::string> names;
    for (TypeId id : schema.namedTypes_) {
        if (id >= schema.types_.size()) {
            throw IrFormatError("Named type id " + std::to_string(id) + " out of range");
        }
        if (!names.insert(std::string(schema.typeName(id))).second) {
            throw IrFormatError("Duplicate type name '" + std::string(schema.typeName(id)) + "'");
        }
    }

    std::vector<bool> claimed(schema.entries_.size(), false);
    auto claim = [&](const std::vector<EntryId>& ids) {
        for (EntryId id : ids) {
            if (id >= claimed.size()) {
                throw IrFormatError("Entry id " + std::to_string(id) + " out of range");
            }
            if (claimed[id]) {
                throw IrFormatError("Entry " + std::to_string(id) + " belongs to more than one scope");
            }
            claimed[id] = true;
        }
    };

    for (const auto& message : schema.messages_) {
        claim(message.entries);
    }
    for (const auto& entry : schema.entries_) {
        if (entry.group) {
            claim(entry.group->children);
        }
    }
}

Schema decodeIr(std::span<const uint8_t> data, const ParserOptions& options) {
    IrDecoder decoder(data);
    Schema schema = decoder.decode();

    SchemaValidator validator(options);
    validator.validate(schema);
    return schema;
}

// ============================================================================
// File I/O
// ============================================================================

namespace {

void writeUInt32(std::ofstream& file, uint32_t value) {
    const char bytes[4] = {
        static_cast<char>(value & 0xFF),
        static_cast<char>((value >> 8) & 0xFF),
        static_cast<char>((value >> 16) & 0xFF),
        static_cast<char>((value >> 24) & 0xFF),
    };
    file.write(bytes, 4);
}

uint32_t readUInt32(const std::vector<uint8_t>& data, size_t offset) {
    return static_cast<uint32_t>(data[offset]) |
           (static_cast<uint32_t>(data[offset + 1]) << 8) |
           (static_cast<uint32_t>(data[offset + 2]) << 16) |
           (static_cast<uint32_t>(data[offset + 3]) << 24);
}

}  // namespace

void saveIr(const Schema& schema, const std::filesystem::path& path) {
    auto cborData = encodeIr(schema);
    if (cborData.size() > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) {
        throw std::runtime_error("IR document too large to compress");
    }

    int maxCompressed = LZ4_compressBound(static_cast<int>(cborData.size()));
    std::vector<uint8_t> compressed(static_cast<size_t>(maxCompressed));

    int compressedSize = LZ4_compress_default(
        reinterpret_cast<const char*>(cborData.data()),
        reinterpret_cast<char*>(compressed.data()),
        static_cast<int>(cborData.size()),
        maxCompressed);

    if (compressedSize <= 0) {
        throw std::runtime_error("LZ4 compression failed");
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }

    writeUInt32(file, IR_MAGIC);
    writeUInt32(file, static_cast<uint32_t>(cborData.size()));
    writeUInt32(file, static_cast<uint32_t>(compressedSize));
    file.write(reinterpret_cast<const char*>(compressed.data()), compressedSize);

    if (!file) {
        throw std::runtime_error("Failed to write IR file: " + path.string());
    }
}

Schema loadIr(const std::filesystem::path& path, const ParserOptions& options) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IrFormatError("Failed to open IR file: " + path.string());
    }

    std::vector<uint8_t> contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (contents.size() < HEADER_SIZE) {
        throw IrFormatError("IR file too small: " + path.string());
    }
    if (readUInt32(contents, 0) != IR_MAGIC) {
        throw IrFormatError("Invalid IR file magic: " + path.string());
    }

    uint32_t uncompressedSize = readUInt32(contents, 4);
    uint32_t compressedSize = readUInt32(contents, 8);
    if (compressedSize != contents.size() - HEADER_SIZE ||
        compressedSize > static_cast<uint32_t>(std::numeric_limits<int>::max()) ||
        uncompressedSize > static_cast<uint32_t>(LZ4_MAX_INPUT_SIZE)) {
        throw IrFormatError("IR file sizes do not match its contents: " + path.string());
    }

    std::vector<uint8_t> cborData(uncompressedSize);
    int result = LZ4_decompress_safe(
        reinterpret_cast<const char*>(contents.data() + HEADER_SIZE),
        reinterpret_cast<char*>(cborData.data()),
        static_cast<int>(compressedSize),
        static_cast<int>(uncompressedSize));

    if (result < 0 || static_cast<uint32_t>(result) != uncompressedSize) {
        throw IrFormatError("LZ4 decompression failed: " + path.string());
    }

    return decodeIr(cborData, options);
}

}  // namespace sbeir
