#include "sbeir/xml_schema_loader.hpp"
#include "sbeir/errors.hpp"
#include "sbeir/schema_builder.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xinclude.h>

#include <cctype>
#include <charconv>
#include <iostream>
#include <limits>
#include <memory>
#include <unordered_map>

namespace sbeir {

namespace {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

struct XmlCharDeleter {
    void operator()(xmlChar* text) const { xmlFree(text); }
};

using XmlCharPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

int parseFlags(const ParserOptions& options) {
    int flags = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;
    if (options.xincludeAware) {
        flags |= XML_PARSE_XINCLUDE;
    }
    return flags;
}

std::string lastXmlError() {
    auto* error = xmlGetLastError();
    if (!error || !error->message) {
        return "malformed XML";
    }
    std::string message = error->message;
    while (!message.empty() && std::isspace(static_cast<unsigned char>(message.back()))) {
        message.pop_back();
    }
    if (error->line > 0) {
        message += " at line " + std::to_string(error->line);
    }
    return message;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::string_view localName(const xmlNode* node) {
    return reinterpret_cast<const char*>(node->name);
}

bool isElement(const xmlNode* node) {
    return node->type == XML_ELEMENT_NODE;
}

/// Primitive shape of a declared simple type, kept for parsing field constants
struct SimpleShape {
    PrimitiveType primitiveType;
    uint32_t length;
    std::optional<std::string> characterEncoding;
};

// ============================================================================
// DocumentReader - walks one parsed document into a SchemaBuilder
// ============================================================================

class DocumentReader {
public:
    DocumentReader(const ParserOptions& options, std::string source)
        : options_(options), source_(std::move(source)) {}

    Schema read(const xmlNode* root);

private:
    void readTypes(const xmlNode* types, SchemaBuilder& builder);
    EncodedType readEncodedType(const xmlNode* node);
    CompositeDecl readComposite(const xmlNode* node);
    void readMessage(const xmlNode* node, SchemaBuilder& builder);
    void readMembers(const xmlNode* parent, BuilderScope scope, SchemaBuilder& builder);
    FieldDecl readField(const xmlNode* node);

    std::optional<PrimitiveValue> readConstant(const xmlNode* node, PrimitiveType type, uint32_t length,
                                               const std::optional<std::string>& encoding);
    PrimitiveValue parseLiteral(const xmlNode* node, std::string_view text, PrimitiveType type,
                                uint32_t length, const std::optional<std::string>& encoding);

    std::optional<std::string> attribute(const xmlNode* node, const char* name) const;
    std::string requiredAttribute(const xmlNode* node, const char* name) const;
    std::optional<uint32_t> uintAttribute(const xmlNode* node, const char* name) const;
    uint32_t requiredUintAttribute(const xmlNode* node, const char* name) const;
    Presence presenceAttribute(const xmlNode* node) const;
    std::string text(const xmlNode* node) const;

    [[noreturn]] void fail(const xmlNode* node, const std::string& message) const;

    const ParserOptions& options_;
    std::string source_;
    std::unordered_map<std::string, SimpleShape> simpleTypes_;
};

Schema DocumentReader::read(const xmlNode* root) {
    if (!root || !isElement(root) || localName(root) != "messageSchema") {
        fail(root, "expected <messageSchema> root element");
    }

    SchemaAttributes attributes;
    attributes.package = attribute(root, "package").value_or("");
    attributes.id = uintAttribute(root, "id").value_or(0);
    attributes.version = uintAttribute(root, "version").value_or(0);
    attributes.semanticVersion = attribute(root, "semanticVersion").value_or("");
    attributes.description = attribute(root, "description").value_or("");
    if (auto order = attribute(root, "byteOrder")) {
        auto parsed = byteOrderFromName(*order);
        if (!parsed) {
            fail(root, "unknown byteOrder '" + *order + "'");
        }
        attributes.byteOrder = *parsed;
    }
    if (auto header = attribute(root, "headerType")) {
        attributes.headerType = *header;
    }

    SchemaBuilder builder(std::move(attributes), options_);

    for (const xmlNode* child = root->children; child; child = child->next) {
        if (!isElement(child)) continue;

        auto name = localName(child);
        if (name == "types") {
            readTypes(child, builder);
        } else if (name == "message") {
            readMessage(child, builder);
        } else if (!options_.suppressOutput) {
            std::cerr << "[XmlSchemaLoader] Ignoring element <" << name << "> at "
                      << source_ << ":" << xmlGetLineNo(child) << "\n";
        }
    }

    return builder.build();
}

// ============================================================================
// Types
// ============================================================================

void DocumentReader::readTypes(const xmlNode* types, SchemaBuilder& builder) {
    for (const xmlNode* child = types->children; child; child = child->next) {
        if (!isElement(child)) continue;

        auto name = localName(child);
        if (name == "type") {
            auto type = readEncodedType(child);
            simpleTypes_[type.name] = SimpleShape{type.primitiveType, type.length, type.characterEncoding};
            builder.addType(std::move(type));
        } else if (name == "composite") {
            builder.addComposite(readComposite(child));
        } else if (name == "enum" || name == "set") {
            fail(child, "unsupported element <" + std::string(name) + ">");
        } else {
            fail(child, "unexpected element <" + std::string(name) + "> in <types>");
        }
    }
}

EncodedType DocumentReader::readEncodedType(const xmlNode* node) {
    EncodedType type;
    type.name = requiredAttribute(node, "name");

    auto primitiveName = requiredAttribute(node, "primitiveType");
    auto primitive = primitiveTypeFromName(primitiveName);
    if (!primitive) {
        fail(node, "unknown primitiveType '" + primitiveName + "'");
    }
    type.primitiveType = *primitive;
    type.presence = presenceAttribute(node);
    type.characterEncoding = attribute(node, "characterEncoding");
    type.semanticType = attribute(node, "semanticType");
    type.description = attribute(node, "description");
    type.offset = uintAttribute(node, "offset");
    type.sinceVersion = uintAttribute(node, "sinceVersion").value_or(0);

    auto length = uintAttribute(node, "length");
    type.length = length.value_or(1);

    if (auto min = attribute(node, "minValue")) {
        type.minValue = parseLiteral(node, *min, type.primitiveType, 1, std::nullopt);
    }
    if (auto max = attribute(node, "maxValue")) {
        type.maxValue = parseLiteral(node, *max, type.primitiveType, 1, std::nullopt);
    }
    if (auto null = attribute(node, "nullValue")) {
        type.nullValue = parseLiteral(node, *null, type.primitiveType, 1, std::nullopt);
    }

    if (type.isConstant()) {
        auto value = text(node);
        // A constant char string without a length takes the length of its text
        if (!length && type.primitiveType == PrimitiveType::Char && value.size() > 1) {
            type.length = static_cast<uint32_t>(value.size());
        }
        type.constValue = readConstant(node, type.primitiveType, type.length, type.characterEncoding);
    }

    return type;
}

CompositeDecl DocumentReader::readComposite(const xmlNode* node) {
    CompositeDecl composite;
    composite.name = requiredAttribute(node, "name");
    composite.semanticType = attribute(node, "semanticType");
    composite.description = attribute(node, "description");
    composite.sinceVersion = uintAttribute(node, "sinceVersion").value_or(0);

    for (const xmlNode* child = node->children; child; child = child->next) {
        if (!isElement(child)) continue;

        auto name = localName(child);
        if (name == "type") {
            composite.members.emplace_back(readEncodedType(child));
        } else if (name == "ref") {
            TypeRefDecl ref;
            ref.name = requiredAttribute(child, "name");
            ref.typeName = requiredAttribute(child, "type");
            ref.offset = uintAttribute(child, "offset");
            composite.members.emplace_back(std::move(ref));
        } else if (name == "enum" || name == "set") {
            fail(child, "unsupported element <" + std::string(name) + ">");
        } else {
            fail(child, "unexpected element <" + std::string(name) + "> in <composite>");
        }
    }

    return composite;
}

// ============================================================================
// Messages
// ============================================================================

void DocumentReader::readMessage(const xmlNode* node, SchemaBuilder& builder) {
    MessageDecl message;
    message.name = requiredAttribute(node, "name");
    message.templateId = requiredUintAttribute(node, "id");
    message.blockLength = uintAttribute(node, "blockLength");
    message.sinceVersion = uintAttribute(node, "sinceVersion").value_or(0);
    message.semanticType = attribute(node, "semanticType");
    message.description = attribute(node, "description");

    auto scope = builder.addMessage(std::move(message));
    readMembers(node, scope, builder);
}

void DocumentReader::readMembers(const xmlNode* parent, BuilderScope scope, SchemaBuilder& builder) {
    for (const xmlNode* child = parent->children; child; child = child->next) {
        if (!isElement(child)) continue;

        auto name = localName(child);
        if (name == "field") {
            builder.addField(scope, readField(child));
        } else if (name == "group") {
            GroupDecl group;
            group.name = requiredAttribute(child, "name");
            group.id = requiredUintAttribute(child, "id");
            if (auto dimension = attribute(child, "dimensionType")) {
                group.dimensionType = *dimension;
            }
            group.blockLength = uintAttribute(child, "blockLength");
            group.sinceVersion = uintAttribute(child, "sinceVersion").value_or(0);
            group.semanticType = attribute(child, "semanticType");
            group.description = attribute(child, "description");

            auto groupScope = builder.addGroup(scope, std::move(group));
            readMembers(child, groupScope, builder);
        } else if (name == "data") {
            DataDecl data;
            data.name = requiredAttribute(child, "name");
            data.id = requiredUintAttribute(child, "id");
            if (auto type = attribute(child, "type")) {
                data.typeName = *type;
            }
            data.sinceVersion = uintAttribute(child, "sinceVersion").value_or(0);
            data.semanticType = attribute(child, "semanticType");
            data.description = attribute(child, "description");
            builder.addData(scope, std::move(data));
        } else {
            fail(child, "unexpected element <" + std::string(name) + ">");
        }
    }
}

FieldDecl DocumentReader::readField(const xmlNode* node) {
    FieldDecl field;
    field.name = requiredAttribute(node, "name");
    field.id = requiredUintAttribute(node, "id");
    field.typeName = requiredAttribute(node, "type");
    field.offset = uintAttribute(node, "offset");
    field.presence = presenceAttribute(node);
    field.sinceVersion = uintAttribute(node, "sinceVersion").value_or(0);
    field.semanticType = attribute(node, "semanticType");
    field.description = attribute(node, "description");

    if (field.presence == Presence::Constant && !text(node).empty()) {
        auto shape = simpleTypes_.find(field.typeName);
        if (shape != simpleTypes_.end()) {
            field.constValue = readConstant(node, shape->second.primitiveType, shape->second.length,
                                            shape->second.characterEncoding);
        } else if (auto primitive = primitiveTypeFromName(field.typeName)) {
            field.constValue = readConstant(node, *primitive, 1, std::nullopt);
        } else {
            fail(node, "constant value for non-simple type '" + field.typeName + "'");
        }
    }

    return field;
}

// ============================================================================
// Literals
// ============================================================================

std::optional<PrimitiveValue> DocumentReader::readConstant(const xmlNode* node, PrimitiveType type,
                                                           uint32_t length,
                                                           const std::optional<std::string>& encoding) {
    auto value = text(node);
    if (value.empty()) {
        return std::nullopt;
    }
    return parseLiteral(node, value, type, length, encoding);
}

PrimitiveValue DocumentReader::parseLiteral(const xmlNode* node, std::string_view text, PrimitiveType type,
                                            uint32_t length, const std::optional<std::string>& encoding) {
    try {
        if (type == PrimitiveType::Char && length != 1) {
            return PrimitiveValue::parse(text, type, length, encoding.value_or(options_.defaultCharacterEncoding));
        }
        return PrimitiveValue::parse(text, type);
    } catch (const FormatError& e) {
        fail(node, e.what());
    }
}

// ============================================================================
// Attribute helpers
// ============================================================================

std::optional<std::string> DocumentReader::attribute(const xmlNode* node, const char* name) const {
    XmlCharPtr value(xmlGetProp(node, reinterpret_cast<const xmlChar*>(name)));
    if (!value) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char*>(value.get()));
}

std::string DocumentReader::requiredAttribute(const xmlNode* node, const char* name) const {
    auto value = attribute(node, name);
    if (!value) {
        fail(node, "missing required attribute '" + std::string(name) + "'");
    }
    return *value;
}

std::optional<uint32_t> DocumentReader::uintAttribute(const xmlNode* node, const char* name) const {
    auto value = attribute(node, name);
    if (!value) {
        return std::nullopt;
    }

    auto digits = trim(*value);
    uint32_t result = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), result);
    if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size()) {
        fail(node, "malformed number '" + *value + "' in attribute '" + name + "'");
    }
    return result;
}

uint32_t DocumentReader::requiredUintAttribute(const xmlNode* node, const char* name) const {
    auto value = uintAttribute(node, name);
    if (!value) {
        fail(node, "missing required attribute '" + std::string(name) + "'");
    }
    return *value;
}

Presence DocumentReader::presenceAttribute(const xmlNode* node) const {
    auto value = attribute(node, "presence");
    if (!value) {
        return Presence::Required;
    }
    auto presence = presenceFromName(*value);
    if (!presence) {
        fail(node, "unknown presence '" + *value + "'");
    }
    return *presence;
}

std::string DocumentReader::text(const xmlNode* node) const {
    XmlCharPtr content(xmlNodeGetContent(node));
    if (!content) {
        return {};
    }
    return std::string(trim(reinterpret_cast<const char*>(content.get())));
}

void DocumentReader::fail(const xmlNode* node, const std::string& message) const {
    std::string where = source_;
    if (node) {
        where += ":" + std::to_string(xmlGetLineNo(node));
        if (isElement(node)) {
            where += " <" + std::string(localName(node)) + ">";
        }
    }
    throw SchemaLoadError(where + ": " + message);
}

Schema readDocument(xmlDoc* doc, const ParserOptions& options, const std::string& source) {
    if (options.xincludeAware && xmlXIncludeProcessFlags(doc, parseFlags(options)) < 0) {
        throw SchemaLoadError(source + ": XInclude processing failed: " + lastXmlError());
    }

    DocumentReader reader(options, source);
    return reader.read(xmlDocGetRootElement(doc));
}

}  // namespace

// ============================================================================
// XmlSchemaLoader
// ============================================================================

XmlSchemaLoader::XmlSchemaLoader(ParserOptions options)
    : options_(std::move(options)) {}

Schema XmlSchemaLoader::loadFile(const std::string& path) const {
    xmlResetLastError();
    XmlDocPtr doc(xmlReadFile(path.c_str(), nullptr, parseFlags(options_)));
    if (!doc) {
        throw SchemaLoadError("Cannot parse schema file " + path + ": " + lastXmlError());
    }
    return readDocument(doc.get(), options_, path);
}

Schema XmlSchemaLoader::loadString(std::string_view xml) const {
    if (xml.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw SchemaLoadError("Schema document too large");
    }

    xmlResetLastError();
    XmlDocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), nullptr, nullptr,
                                parseFlags(options_)));
    if (!doc) {
        throw SchemaLoadError("Cannot parse schema document: " + lastXmlError());
    }
    return readDocument(doc.get(), options_, "<string>");
}

}  // namespace sbeir
