// tests/test_layout.cpp
#include "schema/Layout.hpp"
#include "schema/Schema.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace stridedb::schema;

namespace {
    Schema all_types_schema() {
        Schema schema{"AllTypes", 3, 9};
        schema.add("id", FieldType::Int32, {.key = true})
              .add("big", FieldType::Int64)
              .add("small", FieldType::Int16)
              .add("flag", FieldType::Bool)
              .add("letter", FieldType::Char16)
              .add_fixed_string("name", 10, {.indexed = true});
        schema.set_repository_keyed(true);
        return schema;
    }
} // anonymous namespace

TEST(LayoutBuilder, PacksFieldsAfterHeader) {
    const auto layout = LayoutBuilder::build(all_types_schema());

    ASSERT_EQ(layout->field_count(), 6u);
    EXPECT_EQ(layout->field(0).offset, 8u);
    EXPECT_EQ(layout->field(1).offset, 12u);
    EXPECT_EQ(layout->field(2).offset, 20u);
    EXPECT_EQ(layout->field(3).offset, 22u);
    EXPECT_EQ(layout->field(4).offset, 23u);
    EXPECT_EQ(layout->field(5).offset, 25u);
    EXPECT_EQ(layout->field(5).length, 10u);
    EXPECT_EQ(layout->stride(), 35u);
}

TEST(LayoutBuilder, StrideIsHeaderPlusFieldLengths) {
    const auto layout = LayoutBuilder::build(all_types_schema());

    size_t sum = Layout::HEADER_SIZE;
    for (const auto& field : layout->fields()) { sum += field.length; }
    EXPECT_EQ(layout->stride(), sum);
}

TEST(LayoutBuilder, IsDeterministic) {
    const auto a = LayoutBuilder::build(all_types_schema());
    const auto b = LayoutBuilder::build(all_types_schema());

    ASSERT_EQ(a->field_count(), b->field_count());
    EXPECT_EQ(a->stride(), b->stride());
    for (size_t i = 0; i < a->field_count(); ++i) {
        EXPECT_EQ(a->field(i).offset, b->field(i).offset);
        EXPECT_EQ(a->field(i).length, b->field(i).length);
    }
}

TEST(LayoutBuilder, ExposesBrandAndLookups) {
    const auto layout = LayoutBuilder::build(all_types_schema());

    EXPECT_EQ(layout->type_id(), 3);
    EXPECT_EQ(layout->group_id(), 9);
    EXPECT_EQ(layout->header().body_length, 35);
    EXPECT_EQ(layout->key_field(), 0u);
    EXPECT_EQ(layout->field_id("letter"), 4u);
    EXPECT_FALSE(layout->field_id("missing").has_value());
    EXPECT_THROW((void)layout->require_field("missing"), std::invalid_argument);
    ASSERT_EQ(layout->indexed_fields().size(), 1u);
    EXPECT_EQ(layout->indexed_fields()[0], 5u);
    EXPECT_TRUE(Layout::fixed_length());
}

TEST(LayoutBuilder, RejectsTwoKeys) {
    Schema schema{"TwoKeys"};
    schema.add("a", FieldType::Int32, {.key = true}).add("b", FieldType::Int32, {.key = true});
    EXPECT_THROW((void)LayoutBuilder::build(schema), std::invalid_argument);
}

TEST(LayoutBuilder, RejectsMissingKeyOnlyWhenRepositoryKeyed) {
    Schema schema{"NoKey"};
    schema.add("a", FieldType::Int32);
    EXPECT_NO_THROW((void)LayoutBuilder::build(schema));

    schema.set_repository_keyed(true);
    EXPECT_THROW((void)LayoutBuilder::build(schema), std::invalid_argument);
}

TEST(LayoutBuilder, RejectsVarString) {
    Schema schema{"Var"};
    schema.add("id", FieldType::Int32, {.key = true}).add("text", FieldType::VarString);
    EXPECT_THROW((void)LayoutBuilder::build(schema), std::invalid_argument);
}

TEST(LayoutBuilder, RejectsFixedStringWithoutLength) {
    Schema missing{"Missing"};
    missing.add("name", FieldType::FixedString);
    EXPECT_THROW((void)LayoutBuilder::build(missing), std::invalid_argument);

    Schema zero{"Zero"};
    zero.add_fixed_string("name", 0);
    EXPECT_THROW((void)LayoutBuilder::build(zero), std::invalid_argument);
}

TEST(LayoutBuilder, RejectsInvalidAttributes) {
    Schema dup{"Dup"};
    dup.add("a", FieldType::Int32).add("a", FieldType::Int64);
    EXPECT_THROW((void)LayoutBuilder::build(dup), std::invalid_argument);

    Schema unique_only{"UniqueOnly"};
    unique_only.add("a", FieldType::Int32, {.unique = true});
    EXPECT_THROW((void)LayoutBuilder::build(unique_only), std::invalid_argument);

    Schema bool_seq{"BoolSeq"};
    bool_seq.add("a", FieldType::Bool, {.sequence = true});
    EXPECT_THROW((void)LayoutBuilder::build(bool_seq), std::invalid_argument);

    Schema indexed_seq{"IndexedSeq"};
    indexed_seq.add("a", FieldType::Int64, {.indexed = true, .sequence = true});
    EXPECT_THROW((void)LayoutBuilder::build(indexed_seq), std::invalid_argument);

    Schema string_key{"StringKey"};
    string_key.add_fixed_string("code", 4, {.key = true}).set_repository_keyed(true);
    EXPECT_THROW((void)LayoutBuilder::build(string_key), std::invalid_argument);
}

TEST(LayoutBuilder, ByteLengths) {
    EXPECT_EQ(LayoutBuilder::byte_length(FieldType::Int32, std::nullopt), 4u);
    EXPECT_EQ(LayoutBuilder::byte_length(FieldType::Int64, std::nullopt), 8u);
    EXPECT_EQ(LayoutBuilder::byte_length(FieldType::Int16, std::nullopt), 2u);
    EXPECT_EQ(LayoutBuilder::byte_length(FieldType::Bool, std::nullopt), 1u);
    EXPECT_EQ(LayoutBuilder::byte_length(FieldType::Char16, std::nullopt), 2u);
    EXPECT_EQ(LayoutBuilder::byte_length(FieldType::FixedString, 12u), 12u);
    EXPECT_THROW((void)LayoutBuilder::byte_length(FieldType::VarString, 12u), std::invalid_argument);
}
