#include "schema/hash_serializer.hpp"

#include <cmath>
#include <limits>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "support/test_jobs.hpp"

using json = nlohmann::json;
using ::testing::HasSubstr;
using argwire::schema::construct;
using argwire::schema::deserialize;
using argwire::schema::SchemaPtr;
using argwire::schema::serialize;
using argwire::schema::TypedArguments;
namespace fixtures = argwire::test_jobs;
namespace types = argwire::schema::types;

TEST(SerializeTest, ProducesPlainStringKeyedObject) {
    SchemaPtr schema = std::make_shared<const fixtures::WorkerWithNestedStruct::Args>();
    auto built = construct(schema, {{"name", "Alice"}, {"address", {{"street", "Main St"}, {"city", "Portland"}}}});
    ASSERT_TRUE(built.success) << built.error;

    auto result = serialize(*built.args);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.payload, json({{"name", "Alice"}, {"address", {{"street", "Main St"}, {"city", "Portland"}}}}));
    EXPECT_EQ(json::parse(result.payload.dump()), result.payload);
}

TEST(SerializeTest, RoundTripsThroughJsonText) {
    SchemaPtr schema = std::make_shared<const fixtures::WorkerWithComplexTypes::Args>();
    auto built = construct(schema, {{"user_id", 123},
                                    {"tags", json::array({"urgent", "important"})},
                                    {"metadata", {{"source", "api"}, {"version", 2}, {"ratio", 0.5}}},
                                    {"priority", 5}});
    ASSERT_TRUE(built.success) << built.error;

    auto wire = serialize(*built.args);
    ASSERT_TRUE(wire.success) << wire.error;
    auto back = deserialize(schema, json::parse(wire.payload.dump()));
    ASSERT_TRUE(back.success) << back.error;
    EXPECT_EQ(*back.args, *built.args);
}

TEST(SerializeTest, IsIdempotentAcrossRoundTrips) {
    SchemaPtr schema = std::make_shared<const fixtures::WorkerWithCoercibleTypes::Args>();
    auto built = construct(schema, {{"bool_field", false},
                                    {"int_field", -3},
                                    {"float_field", 2.0},
                                    {"string_field", "x"},
                                    {"symbol_field", "sym"}});
    ASSERT_TRUE(built.success) << built.error;

    auto once = serialize(*built.args);
    auto twice = serialize(*deserialize(schema, json::parse(once.payload.dump())).args);
    ASSERT_TRUE(once.success && twice.success);
    EXPECT_EQ(once.payload.dump(), twice.payload.dump());
}

TEST(SerializeTest, RejectsNonFiniteFloats) {
    SchemaPtr schema = std::make_shared<const fixtures::WorkerWithSerializationError::Args>();
    for (double bad : {std::nan(""), std::numeric_limits<double>::infinity()}) {
        TypedArguments args(schema, {{"value", bad}});
        auto result = serialize(args);
        EXPECT_FALSE(result.success);
        EXPECT_THAT(result.error, HasSubstr("value: non-finite float"));
    }
}

TEST(SerializeTest, RejectsNonFiniteFloatsInsideUntypedValues) {
    SchemaPtr schema = std::make_shared<const fixtures::WorkerWithComplexTypes::Args>();
    TypedArguments args(schema, {{"user_id", 1},
                                 {"tags", json::array()},
                                 {"metadata", {{"scores", json::array({1.0, std::nan("")})}}},
                                 {"priority", nullptr}});
    auto result = serialize(args);
    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.error, HasSubstr("metadata.scores[1]"));
}

TEST(SerializeTest, RejectsBinaryValues) {
    SchemaPtr schema = std::make_shared<const fixtures::WorkerWithComplexTypes::Args>();
    TypedArguments args(schema, {{"user_id", 1},
                                 {"tags", json::array()},
                                 {"metadata", {{"blob", json::binary({0x01, 0x02})}}},
                                 {"priority", nullptr}});
    auto result = serialize(args);
    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.error, HasSubstr("metadata.blob: cannot serialize binary value"));
}

TEST(SerializeTest, NeverCoerces) {
    SchemaPtr schema = std::make_shared<const fixtures::SimpleWorker::Args>();
    TypedArguments args(schema, {{"value", "5"}});
    auto result = serialize(args);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "value: cannot serialize String \"5\" as Integer");
}

TEST(SerializeTest, FailsOnUndefinedNestedSchema) {
    struct BrokenArgs : argwire::schema::ArgumentSchema {
        BrokenArgs() { field("inner", types::structure(nullptr)); }
    };
    SchemaPtr schema = std::make_shared<const BrokenArgs>();
    TypedArguments args(schema, {{"inner", json::object()}});
    auto result = serialize(args);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "inner: nested schema is not defined");
}

TEST(SerializeTest, FailsWithoutSchema) {
    TypedArguments args(nullptr, json::object());
    auto result = serialize(args);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "arguments carry no schema");
}
