/**
 * @file test_schema_builder.cpp
 * @brief Unit tests for SchemaBuilder and the sealed Schema graph
 *
 * Tests: type resolution, composite layout and roles, message and group
 * layout, var-data layouts, traversal, and construction errors.
 */

#include "sbeir/errors.hpp"
#include "sbeir/schema_builder.hpp"
#include "schema_fixtures.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <vector>

using namespace sbeir;
using namespace sbeir::test;

class SchemaBuilderTest : public ::testing::Test {
protected:
    SchemaBuilderTest() : builder(attributes(2), quietOptions()) {
        addStandardComposites(builder);
    }

    SchemaBuilder builder;
};

// ============================================================================
// Types
// ============================================================================

TEST_F(SchemaBuilderTest, HeaderCompositeLayout) {
    builder.addMessage(message("Empty", 1));
    auto schema = builder.build();

    const auto& header = schema.messageHeader();
    EXPECT_EQ(header.name, "messageHeader");
    EXPECT_EQ(header.role, CompositeRole::MessageHeader);
    EXPECT_EQ(header.encodedLength, 8u);
    ASSERT_EQ(header.members.size(), 4u);
    EXPECT_EQ(header.members[0].offset, 0u);
    EXPECT_EQ(header.members[1].offset, 2u);
    EXPECT_EQ(header.members[2].offset, 4u);
    EXPECT_EQ(header.members[3].offset, 6u);
    EXPECT_EQ(schema.messageHeaderType(), *schema.findType("messageHeader"));
}

TEST_F(SchemaBuilderTest, CompositeRolesRecognized) {
    builder.addMessage(message("Empty", 1));
    auto schema = builder.build();

    EXPECT_EQ(schema.compositeType(*schema.findType("groupSizeEncoding"))->role, CompositeRole::GroupDimension);
    EXPECT_EQ(schema.compositeType(*schema.findType("varStringEncoding"))->role, CompositeRole::VarDataEncoding);
    EXPECT_EQ(schema.compositeType(*schema.findType("varDataEncoding"))->role, CompositeRole::VarDataEncoding);
}

TEST_F(SchemaBuilderTest, PlainCompositeWithRefs) {
    builder.addType(scalar("Price", PrimitiveType::Int64));

    CompositeDecl decimal;
    decimal.name = "Decimal";
    decimal.members = {
        TypeRefDecl{"mantissa", "Price", std::nullopt},
        scalar("exponent", PrimitiveType::Int8),
    };
    builder.addComposite(std::move(decimal));

    CompositeDecl quote;
    quote.name = "Quote";
    quote.members = {
        TypeRefDecl{"bid", "Decimal", std::nullopt},
        TypeRefDecl{"ask", "Decimal", std::nullopt},
        TypeRefDecl{"size", "uint32", std::nullopt},
    };
    builder.addComposite(std::move(quote));

    builder.addMessage(message("Empty", 1));
    auto schema = builder.build();

    const auto* decimalType = schema.compositeType(*schema.findType("Decimal"));
    ASSERT_NE(decimalType, nullptr);
    EXPECT_EQ(decimalType->role, CompositeRole::Plain);
    EXPECT_EQ(decimalType->encodedLength, 9u);
    EXPECT_EQ(schema.typeName(decimalType->members[0].type), "Price");

    const auto* quoteType = schema.compositeType(*schema.findType("Quote"));
    ASSERT_NE(quoteType, nullptr);
    EXPECT_EQ(quoteType->members[1].offset, 9u);
    EXPECT_EQ(quoteType->members[2].offset, 18u);
    EXPECT_EQ(quoteType->encodedLength, 22u);

    // Bare primitive names resolve to anonymous types, not named ones
    const auto* sizeType = schema.encodedType(quoteType->members[2].type);
    ASSERT_NE(sizeType, nullptr);
    EXPECT_EQ(sizeType->primitiveType, PrimitiveType::UInt32);
    EXPECT_FALSE(schema.findType("uint32").has_value());
}

TEST_F(SchemaBuilderTest, ExplicitCompositeOffsets) {
    auto padded = scalar("second", PrimitiveType::UInt32);
    padded.offset = 4;

    CompositeDecl composite;
    composite.name = "Padded";
    composite.members = {scalar("first", PrimitiveType::UInt8), padded};
    builder.addComposite(std::move(composite));

    builder.addMessage(message("Empty", 1));
    auto schema = builder.build();

    const auto* type = schema.compositeType(*schema.findType("Padded"));
    EXPECT_EQ(type->members[1].offset, 4u);
    EXPECT_EQ(type->encodedLength, 8u);
}

TEST_F(SchemaBuilderTest, InlineMembersAreNotNamedTypes) {
    builder.addMessage(message("Empty", 1));
    auto schema = builder.build();

    EXPECT_FALSE(schema.findType("templateId").has_value());
    EXPECT_FALSE(schema.findType("numInGroup").has_value());
    EXPECT_EQ(schema.namedTypes().size(), 4u);
}

TEST_F(SchemaBuilderTest, DuplicateTypeNameRejected) {
    builder.addType(scalar("Qty", PrimitiveType::UInt32));
    try {
        builder.addType(scalar("Qty", PrimitiveType::UInt64));
        FAIL() << "expected SchemaValidationError";
    } catch (const SchemaValidationError& e) {
        EXPECT_EQ(e.reason(), "duplicate type name");
        EXPECT_EQ(e.entity(), "Qty");
    }
}

TEST_F(SchemaBuilderTest, UnresolvedCompositeRef) {
    CompositeDecl composite;
    composite.name = "Broken";
    composite.members = {TypeRefDecl{"inner", "NoSuchType", std::nullopt}};
    builder.addComposite(std::move(composite));

    try {
        (void)builder.build();
        FAIL() << "expected SchemaValidationError";
    } catch (const SchemaValidationError& e) {
        EXPECT_EQ(e.reason(), "unresolved type");
        EXPECT_NE(e.entity().find("Broken.inner"), std::string::npos);
    }
}

TEST_F(SchemaBuilderTest, TypeCycleRejected) {
    CompositeDecl a;
    a.name = "A";
    a.members = {TypeRefDecl{"b", "B", std::nullopt}};
    builder.addComposite(std::move(a));

    CompositeDecl b;
    b.name = "B";
    b.members = {TypeRefDecl{"a", "A", std::nullopt}};
    builder.addComposite(std::move(b));

    try {
        (void)builder.build();
        FAIL() << "expected SchemaValidationError";
    } catch (const SchemaValidationError& e) {
        EXPECT_EQ(e.reason(), "type cycle");
    }
}

TEST_F(SchemaBuilderTest, SelfReferenceRejected) {
    CompositeDecl self;
    self.name = "Self";
    self.members = {scalar("x", PrimitiveType::UInt8), TypeRefDecl{"next", "Self", std::nullopt}};
    builder.addComposite(std::move(self));

    try {
        (void)builder.build();
        FAIL() << "expected SchemaValidationError";
    } catch (const SchemaValidationError& e) {
        EXPECT_EQ(e.reason(), "type cycle");
        EXPECT_EQ(e.entity(), "Self");
    }
}

// ============================================================================
// Messages
// ============================================================================

TEST_F(SchemaBuilderTest, FieldOffsetsAndBlockLength) {
    builder.addType(scalar("Price", PrimitiveType::Int64));

    auto order = builder.addMessage(message("Order", 1));
    builder.addField(order, field("qty", 1, "uint32"));
    builder.addField(order, field("price", 2, "Price"));
    builder.addField(order, field("side", 3, "char"));
    auto schema = builder.build();

    const auto* msg = schema.findMessage(1);
    ASSERT_NE(msg, nullptr);
    EXPECT_EQ(msg->name, "Order");
    EXPECT_EQ(msg->blockLength, 13u);

    auto entries = schema.entries(*msg);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].offset, 0u);
    EXPECT_EQ(entries[1].offset, 4u);
    EXPECT_EQ(entries[2].offset, 12u);
    EXPECT_EQ(schema.typeName(entries[1].type), "Price");
}

TEST_F(SchemaBuilderTest, ExplicitOffsetAndBlockLength) {
    auto decl = message("Padded", 1);
    decl.blockLength = 32;
    auto padded = builder.addMessage(decl);

    builder.addField(padded, field("a", 1, "uint8"));
    auto b = field("b", 2, "uint64");
    b.offset = 8;
    builder.addField(padded, b);
    auto schema = builder.build();

    const auto* msg = schema.findMessage("Padded");
    ASSERT_NE(msg, nullptr);
    EXPECT_EQ(msg->blockLength, 32u);
    EXPECT_EQ(schema.entries(*msg)[1].offset, 8u);
}

TEST_F(SchemaBuilderTest, ConstantFieldOccupiesNoBytes) {
    auto venue = scalar("Venue", PrimitiveType::Char, 4);
    venue.presence = Presence::Constant;
    venue.constValue = PrimitiveValue::parse("XLON", PrimitiveType::Char, 4, "US-ASCII");
    builder.addType(venue);

    auto msg = builder.addMessage(message("Trade", 1));
    builder.addField(msg, field("venue", 1, "Venue"));

    auto kind = field("kind", 2, "uint8");
    kind.presence = Presence::Constant;
    kind.constValue = PrimitiveValue::parse("3", PrimitiveType::UInt8);
    builder.addField(msg, kind);

    builder.addField(msg, field("qty", 3, "uint32"));
    auto schema = builder.build();

    const auto* trade = schema.findMessage(1);
    auto entries = schema.entries(*trade);
    EXPECT_EQ(entries[0].offset, 0u);
    EXPECT_EQ(entries[1].offset, 0u);
    EXPECT_EQ(entries[2].offset, 0u);
    EXPECT_EQ(trade->blockLength, 4u);
    ASSERT_TRUE(entries[1].constValue.has_value());
    EXPECT_EQ(entries[1].constValue->asIntegral(), 3);
}

TEST_F(SchemaBuilderTest, GroupLayoutAndEmbeddedId) {
    auto order = builder.addMessage(message("Order", 5));
    builder.addField(order, field("account", 1, "uint32"));
    auto fills = builder.addGroup(order, group("fills", 10));
    builder.addField(fills, field("price", 11, "int64"));
    builder.addField(fills, field("qty", 12, "uint32"));
    auto schema = builder.build();

    const auto* msg = schema.findMessage(5);
    ASSERT_NE(msg, nullptr);
    EXPECT_EQ(msg->blockLength, 4u);

    const auto* fillsEntry = schema.findMember(*msg, 10);
    ASSERT_NE(fillsEntry, nullptr);
    EXPECT_TRUE(fillsEntry->isGroup());
    EXPECT_EQ(fillsEntry->name, "fills");
    ASSERT_TRUE(fillsEntry->group.has_value());
    EXPECT_EQ(fillsEntry->group->blockLength, 12u);

    // The repeat count belongs to the dimension; only the group carries id 10
    auto dimension = schema.dimension(*fillsEntry);
    ASSERT_TRUE(dimension.has_value());
    EXPECT_EQ(dimension->composite->name, "groupSizeEncoding");
    EXPECT_EQ(dimension->numInGroup->name, "numInGroup");
    EXPECT_EQ(dimension->blockLength->name, "blockLength");
    EXPECT_EQ(dimension->numInGroupType, PrimitiveType::UInt16);

    auto children = schema.entries(*fillsEntry);
    ASSERT_EQ(children.size(), 2u);
    EXPECT_EQ(children[0].name, "price");
    EXPECT_EQ(children[1].offset, 8u);
    EXPECT_NE(schema.findMember(*fillsEntry, 12), nullptr);
    EXPECT_EQ(schema.findMember(*msg, 12), nullptr);
}

TEST_F(SchemaBuilderTest, VarDataLayouts) {
    auto msg = builder.addMessage(message("Note", 1));
    builder.addData(msg, data("text", 1, "varStringEncoding"));
    builder.addData(msg, data("blob", 2, "varDataEncoding"));
    auto schema = builder.build();

    auto entries = schema.entries(*schema.findMessage(1));
    ASSERT_EQ(entries.size(), 2u);

    const auto& text = entries[0];
    ASSERT_TRUE(text.varData.has_value());
    EXPECT_EQ(text.varData->lengthType, PrimitiveType::UInt8);
    EXPECT_EQ(text.varData->payloadType, PrimitiveType::Char);
    EXPECT_EQ(text.varData->payloadRole, PayloadRole::Text);
    EXPECT_EQ(text.varData->maxPayloadLength(), 254u);

    const auto& blob = entries[1];
    ASSERT_TRUE(blob.varData.has_value());
    EXPECT_EQ(blob.varData->lengthType, PrimitiveType::UInt32);
    EXPECT_EQ(blob.varData->payloadType, PrimitiveType::UInt8);
    EXPECT_EQ(blob.varData->payloadRole, PayloadRole::Opaque);
    EXPECT_EQ(blob.varData->maxPayloadLength(), 4294967294u);
}

TEST_F(SchemaBuilderTest, EncodedPayloadIsText) {
    auto payload = scalar("varData", PrimitiveType::UInt8, 0);
    payload.characterEncoding = "UTF-8";

    CompositeDecl utf8;
    utf8.name = "utf8Encoding";
    utf8.members = {scalar("length", PrimitiveType::UInt16), payload};
    builder.addComposite(std::move(utf8));

    auto msg = builder.addMessage(message("Note", 1));
    builder.addData(msg, data("body", 1, "utf8Encoding"));
    auto schema = builder.build();

    const auto& body = schema.entries(*schema.findMessage(1))[0];
    EXPECT_EQ(body.varData->payloadRole, PayloadRole::Text);
    ASSERT_TRUE(body.varData->characterEncoding.has_value());
    EXPECT_EQ(*body.varData->characterEncoding, "UTF-8");
}

TEST_F(SchemaBuilderTest, WalkVisitsDepthFirst) {
    auto msg = builder.addMessage(message("Book", 1));
    builder.addField(msg, field("id", 1, "uint32"));
    auto levels = builder.addGroup(msg, group("levels", 2));
    builder.addField(levels, field("price", 3, "int64"));
    auto orders = builder.addGroup(levels, group("orders", 4));
    builder.addField(orders, field("qty", 5, "uint32"));
    builder.addData(msg, data("note", 6, "varStringEncoding"));
    auto schema = builder.build();

    std::vector<std::pair<std::string, size_t>> visited;
    schema.walk(*schema.findMessage(1), [&](const Entry& entry, size_t depth) {
        visited.emplace_back(entry.name, depth);
    });

    std::vector<std::pair<std::string, size_t>> expected = {
        {"id", 0}, {"levels", 0}, {"price", 1}, {"orders", 1}, {"qty", 2}, {"note", 0},
    };
    EXPECT_EQ(visited, expected);
}

TEST_F(SchemaBuilderTest, ArrayWidthOverflowRejected) {
    // 4 * 2^30 bytes does not fit in a 32-bit length
    builder.addType(scalar("Huge", PrimitiveType::UInt32, 1073741824));
    auto msg = builder.addMessage(message("Bulk", 1));
    builder.addField(msg, field("big", 1, "Huge"));
    builder.addField(msg, field("tail", 2, "uint8"));

    try {
        (void)builder.build();
        FAIL() << "expected SchemaValidationError";
    } catch (const SchemaValidationError& e) {
        EXPECT_EQ(e.reason(), "layout overflow");
        EXPECT_NE(e.entity().find("Huge"), std::string::npos);
    }
}

TEST_F(SchemaBuilderTest, FieldEndOverflowRejected) {
    auto msg = builder.addMessage(message("Far", 1));
    auto big = field("big", 1, "uint32");
    big.offset = 4294967295u;
    builder.addField(msg, big);

    try {
        (void)builder.build();
        FAIL() << "expected SchemaValidationError";
    } catch (const SchemaValidationError& e) {
        EXPECT_EQ(e.reason(), "layout overflow");
        EXPECT_NE(e.entity().find("Far.big"), std::string::npos);
    }
}

TEST_F(SchemaBuilderTest, CompositeMemberEndOverflowRejected) {
    auto far = scalar("far", PrimitiveType::UInt16);
    far.offset = 4294967294u;

    CompositeDecl composite;
    composite.name = "Stretched";
    composite.members = {scalar("near", PrimitiveType::UInt8), far};
    builder.addComposite(std::move(composite));
    builder.addMessage(message("Empty", 1));

    try {
        (void)builder.build();
        FAIL() << "expected SchemaValidationError";
    } catch (const SchemaValidationError& e) {
        EXPECT_EQ(e.reason(), "layout overflow");
        EXPECT_NE(e.entity().find("Stretched.far"), std::string::npos);
    }
}

TEST_F(SchemaBuilderTest, LayoutUpToTheLastByte) {
    auto msg = builder.addMessage(message("Edge", 1));
    auto last = field("last", 1, "uint8");
    last.offset = 4294967294u;
    builder.addField(msg, last);
    auto schema = builder.build();

    EXPECT_EQ(schema.findMessage(1)->blockLength, 4294967295u);
}

TEST_F(SchemaBuilderTest, DeepNesting) {
    constexpr uint32_t DEPTH = 2000;

    auto msg = builder.addMessage(message("Deep", 1));
    auto scope = builder.addGroup(msg, group("g0", 1));
    for (uint32_t i = 1; i < DEPTH; ++i) {
        builder.addField(scope, field("f" + std::to_string(i), 1000 + i, "uint8"));
        scope = builder.addGroup(scope, group("g" + std::to_string(i), i + 1));
    }
    auto schema = builder.build();

    size_t maxDepth = 0;
    size_t groups = 0;
    schema.walk(*schema.findMessage(1), [&](const Entry& entry, size_t depth) {
        maxDepth = std::max(maxDepth, depth);
        if (entry.isGroup()) ++groups;
    });
    EXPECT_EQ(groups, DEPTH);
    EXPECT_EQ(maxDepth, DEPTH - 1);
}

TEST_F(SchemaBuilderTest, EntryRangeIsRestartable) {
    auto msg = builder.addMessage(message("Pair", 1));
    builder.addField(msg, field("a", 1, "uint8"));
    builder.addField(msg, field("b", 2, "uint8"));
    auto schema = builder.build();

    auto range = schema.entries(*schema.findMessage(1));
    size_t first = 0;
    for (const auto& entry : range) {
        (void)entry;
        ++first;
    }
    size_t second = std::distance(range.begin(), range.end());
    EXPECT_EQ(first, 2u);
    EXPECT_EQ(second, 2u);

    // Fields have no children
    EXPECT_TRUE(schema.entries(range[0]).empty());
    EXPECT_FALSE(schema.dimension(range[0]).has_value());
}

TEST_F(SchemaBuilderTest, SchemaAttributes) {
    builder.addMessage(message("A", 1));
    builder.addMessage(message("B", 2));
    auto schema = builder.build();

    EXPECT_EQ(schema.package(), "sbeir.test");
    EXPECT_EQ(schema.id(), 7u);
    EXPECT_EQ(schema.version(), 2u);
    EXPECT_EQ(schema.semanticVersion(), "1.0");
    EXPECT_EQ(schema.byteOrder(), ByteOrder::LittleEndian);
    EXPECT_EQ(schema.messages().size(), 2u);
    EXPECT_EQ(schema.findMessage(2)->name, "B");
    EXPECT_EQ(schema.findMessage(3), nullptr);
    EXPECT_EQ(schema.findMessage("C"), nullptr);
}

TEST_F(SchemaBuilderTest, UnknownTypeAndEntryIdsThrow) {
    builder.addMessage(message("A", 1));
    auto schema = builder.build();

    EXPECT_THROW((void)schema.type(static_cast<TypeId>(schema.typeCount())), std::out_of_range);
    EXPECT_THROW((void)schema.entry(static_cast<EntryId>(schema.entryCount())), std::out_of_range);
    EXPECT_EQ(schema.encodedType(INVALID_TYPE_ID), nullptr);
}

// ============================================================================
// Construction errors
// ============================================================================

TEST_F(SchemaBuilderTest, UnresolvedFieldType) {
    auto msg = builder.addMessage(message("Order", 1));
    builder.addField(msg, field("price", 1, "Money"));

    try {
        (void)builder.build();
        FAIL() << "expected SchemaValidationError";
    } catch (const SchemaValidationError& e) {
        EXPECT_EQ(e.reason(), "unresolved type");
        EXPECT_NE(e.entity().find("Order.price"), std::string::npos);
    }
}

TEST_F(SchemaBuilderTest, GroupNeedsDimensionComposite) {
    auto msg = builder.addMessage(message("Order", 1));
    auto decl = group("fills", 1);
    decl.dimensionType = "messageHeader";
    builder.addGroup(msg, decl);

    try {
        (void)builder.build();
        FAIL() << "expected SchemaValidationError";
    } catch (const SchemaValidationError& e) {
        EXPECT_EQ(e.reason(), "invalid group dimension");
    }
}

TEST_F(SchemaBuilderTest, DataNeedsVarDataComposite) {
    auto msg = builder.addMessage(message("Order", 1));
    builder.addData(msg, data("blob", 1, "uint32"));

    try {
        (void)builder.build();
        FAIL() << "expected SchemaValidationError";
    } catch (const SchemaValidationError& e) {
        EXPECT_EQ(e.reason(), "invalid var data encoding");
    }
}

TEST(SchemaBuilderHeaderTest, MissingHeader) {
    SchemaBuilder builder(attributes(), quietOptions());
    builder.addMessage(message("A", 1));

    try {
        (void)builder.build();
        FAIL() << "expected SchemaValidationError";
    } catch (const SchemaValidationError& e) {
        EXPECT_EQ(e.reason(), "unresolved type");
        EXPECT_EQ(e.entity(), "messageHeader");
    }
}

TEST(SchemaBuilderHeaderTest, HeaderTypeOverride) {
    auto options = quietOptions();
    options.headerType = "frameHeader";

    SchemaBuilder builder(attributes(), options);
    CompositeDecl header;
    header.name = "frameHeader";
    header.members = {
        scalar("blockLength", PrimitiveType::UInt16),
        scalar("templateId", PrimitiveType::UInt16),
        scalar("schemaId", PrimitiveType::UInt16),
        scalar("version", PrimitiveType::UInt16),
        scalar("frameLength", PrimitiveType::UInt32),
    };
    builder.addComposite(std::move(header));
    builder.addMessage(message("A", 1));
    auto schema = builder.build();

    EXPECT_EQ(schema.attributes().headerType, "frameHeader");
    EXPECT_EQ(schema.messageHeader().encodedLength, 12u);
}

TEST_F(SchemaBuilderTest, BuildTwiceRejected) {
    builder.addMessage(message("A", 1));
    (void)builder.build();
    EXPECT_THROW((void)builder.build(), std::logic_error);
}

TEST_F(SchemaBuilderTest, UnknownScopeRejected) {
    EXPECT_THROW(builder.addField(BuilderScope{false, 3}, field("a", 1, "uint8")), std::invalid_argument);

    auto msg = builder.addMessage(message("A", 1));
    auto a = builder.addField(msg, field("a", 1, "uint8"));
    // A field is not a group scope
    EXPECT_THROW(builder.addField(BuilderScope{true, a}, field("b", 2, "uint8")), std::invalid_argument);
}

TEST(SchemaBuilderValidationTest, ValidationCanBeDisabled) {
    auto options = quietOptions();
    options.validate = false;

    SchemaBuilder builder(attributes(), options);
    addStandardComposites(builder);
    builder.addMessage(message("A", 1));
    builder.addMessage(message("B", 1));

    auto schema = builder.build();
    EXPECT_EQ(schema.messages().size(), 2u);
}
