// tests/test_schema_json.cpp
#include "schema/Layout.hpp"
#include "schema/SchemaJson.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace stridedb::schema;
using json = nlohmann::json;

namespace {
    constexpr const char* ORDER_JSON = R"({
        "name": "Order", "type_id": 7, "group_id": 1,
        "transactional": true, "repository_keyed": true,
        "fields": [
            {"name": "id",   "type": "int32", "key": true},
            {"name": "code", "type": "fixed_string", "max_length": 8, "indexed": true, "unique": true},
            {"name": "rev",  "type": "int64", "sequence": true}
        ]
    })";
} // anonymous namespace

TEST(SchemaJson, ParsesDocument) {
    const auto schema = parse_schema(ORDER_JSON);

    EXPECT_EQ(schema.name(), "Order");
    EXPECT_EQ(schema.type_id(), 7);
    EXPECT_EQ(schema.group_id(), 1);
    EXPECT_TRUE(schema.transactional());
    EXPECT_TRUE(schema.repository_keyed());

    ASSERT_EQ(schema.fields().size(), 3u);
    EXPECT_EQ(schema.fields()[0].type, FieldType::Int32);
    EXPECT_TRUE(schema.fields()[0].attrs.key);
    EXPECT_EQ(schema.fields()[1].max_length, 8u);
    EXPECT_TRUE(schema.fields()[1].attrs.unique);
    EXPECT_TRUE(schema.fields()[2].attrs.sequence);
    EXPECT_FALSE(schema.fields()[2].attrs.indexed);

    const auto layout = LayoutBuilder::build(schema);
    EXPECT_EQ(layout->stride(), 8u + 4u + 8u + 8u);
}

TEST(SchemaJson, RoundTripsThroughJson) {
    const auto original = parse_schema(ORDER_JSON);
    const auto restored = schema_from_json(schema_to_json(original));

    EXPECT_EQ(schema_to_json(restored), schema_to_json(original));
    EXPECT_EQ(LayoutBuilder::build(restored)->stride(), LayoutBuilder::build(original)->stride());
}

TEST(SchemaJson, DefaultsMissingFlagsAndIds) {
    const auto schema = parse_schema(R"({"name": "Bare", "fields": [{"name": "x", "type": "int16"}]})");

    EXPECT_EQ(schema.type_id(), 0);
    EXPECT_FALSE(schema.transactional());
    EXPECT_FALSE(schema.fields()[0].attrs.key);
}

TEST(SchemaJson, RejectsMalformedDocuments) {
    EXPECT_THROW((void)parse_schema("{not json"), std::invalid_argument);
    EXPECT_THROW((void)parse_schema(R"([1, 2])"), std::invalid_argument);
    EXPECT_THROW((void)parse_schema(R"({"name": "X"})"), std::invalid_argument);
    EXPECT_THROW((void)parse_schema(R"({"name": 5, "fields": []})"), std::invalid_argument);
    EXPECT_THROW((void)parse_schema(R"({"fields": [{"type": "int32"}]})"), std::invalid_argument);
    EXPECT_THROW((void)parse_schema(R"({"fields": [{"name": "a", "type": "float"}]})"), std::invalid_argument);
    EXPECT_THROW((void)parse_schema(R"({"type_id": 70000, "fields": []})"), std::invalid_argument);
    EXPECT_THROW((void)parse_schema(R"({"fields": [{"name": "a", "type": "int32", "key": "yes"}]})"), std::invalid_argument);
}

TEST(SchemaJson, ErrorNamesOffendingField) {
    try {
        (void)parse_schema(R"({"fields": [{"name": "price", "type": "decimal"}]})");
        FAIL() << "expected std::invalid_argument";
    }
    catch (const std::invalid_argument& e) { EXPECT_NE(std::string{e.what()}.find("price"), std::string::npos); }
}

TEST(SchemaJson, LoadsSchemaFile) {
    const auto path = std::filesystem::temp_directory_path() / "stridedb_test_order_schema.json";
    {
        std::ofstream out{path};
        out << ORDER_JSON;
    }

    const auto schema = load_schema_file(path);
    EXPECT_EQ(schema.name(), "Order");
    std::filesystem::remove(path);

    EXPECT_THROW((void)load_schema_file(path), std::runtime_error);
}
