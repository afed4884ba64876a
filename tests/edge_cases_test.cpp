#include "jobs/pipeline.hpp"

#include <limits>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "support/error_capture.hpp"
#include "support/test_jobs.hpp"

using json = nlohmann::json;
using ::testing::HasSubstr;
namespace core = argwire::core;
namespace fixtures = argwire::test_jobs;

namespace types = argwire::schema::types;

namespace {

class WorkerWithMistypedDefault : public argwire::jobs::Job {
public:
    struct Args : argwire::schema::ArgumentSchema {
        Args() { field("count", types::integer(), "zero"); }
    };

    json run() override { return arg("count"); }
};

struct Dimensions : argwire::schema::ArgumentSchema {
    Dimensions() : ArgumentSchema("Dimensions") {
        field("width", types::integer(), 800);
        field("unit", types::enumeration({"px", "pt"}), "em");
    }
};

class WorkerWithMistypedNestedDefault : public argwire::jobs::Job {
public:
    struct Args : argwire::schema::ArgumentSchema {
        Args() { field("size", types::nilable(types::structure<Dimensions>()), nullptr); }
    };

    json run() override { return arg("size"); }
};

class WorkerWithMistypedProducer : public argwire::jobs::Job {
public:
    struct Args : argwire::schema::ArgumentSchema {
        Args() {
            field("label", types::string());
            field_with_producer("count", types::integer(), [] { return json("zero"); });
        }
    };

    json run() override { return arg("count"); }
};

// Reads a field its schema never declared
class WorkerReadingUndeclaredField : public argwire::jobs::Job {
public:
    struct Args : argwire::schema::ArgumentSchema {
        Args() { field("value", types::integer()); }
    };

    json run() override { return arg("other"); }
};

} // namespace

class EdgeCasesTest : public fixtures::JobsTest {};

TEST_F(EdgeCasesTest, EmptyCollectionsSurviveTheWire) {
    json kwargs = {{"user_id", 1}, {"tags", json::array()}, {"metadata", json::object()}, {"priority", nullptr}};
    job("WorkerWithComplexTypes").submit(kwargs);
    EXPECT_EQ(broker.jobs().front().args(), kwargs);
    EXPECT_EQ(broker.drain(), 1u);
}

TEST_F(EdgeCasesTest, UnicodeStringsSurviveTheWire) {
    job("WorkerWithDefaults").submit({{"required_field", "h\xC3\xA9llo \xE2\x9C\x93"}});
    EXPECT_EQ(job("WorkerWithDefaults").dispatch(broker.jobs().front().args()),
              "h\xC3\xA9llo \xE2\x9C\x93: false");
}

TEST_F(EdgeCasesTest, LargeIntegersKeepTheirValue) {
    const int64_t big = std::numeric_limits<int64_t>::max() / 2;
    job("WorkerWithCountingArgs").submit({{"value", big}});
    EXPECT_EQ(job("WorkerWithCountingArgs").dispatch(broker.jobs().front().args()), big);

    const int64_t small = std::numeric_limits<int64_t>::min();
    EXPECT_EQ(job("WorkerWithCountingArgs").dispatch({{"value", std::to_string(small)}}), small);
}

TEST_F(EdgeCasesTest, NullForNonNilableFieldIsRejected) {
    EXPECT_THROW(job("SimpleWorker").submit({{"value", nullptr}}), core::InvalidArgsError);
    EXPECT_THROW(job("SimpleWorker").dispatch({{"value", nullptr}}), core::SerializationError);
}

TEST_F(EdgeCasesTest, NonObjectKwargsAreRejected) {
    auto message = fixtures::capture_error<core::InvalidArgsError>(
        [&] { job("SimpleWorker").submit(json::array({1, 2})); });
    EXPECT_THAT(message, HasSubstr("arguments must be keyword pairs"));
}

TEST_F(EdgeCasesTest, NonObjectPayloadFailsToDeserialize) {
    EXPECT_THROW(job("SimpleWorker").dispatch("not a hash"), core::SerializationError);
}

TEST_F(EdgeCasesTest, DefaultsAreNotSharedBetweenInvocations) {
    auto first = job("WorkerWithComplexTypes").build_arguments({{"user_id", 1}});
    auto second = job("WorkerWithComplexTypes").build_arguments({{"user_id", 2}});
    ASSERT_TRUE(first && second);
    EXPECT_NE(&first->get("tags"), &second->get("tags"));
    EXPECT_EQ(first->get("tags"), json::array());
}

TEST_F(EdgeCasesTest, SchemaIsResolvedOnce) {
    int before = fixtures::counting_args_constructions;
    job("WorkerWithCountingArgs").submit();
    job("WorkerWithCountingArgs").run_synchronously();
    job("WorkerWithCountingArgs").dispatch(json::object());
    EXPECT_EQ(fixtures::counting_args_constructions - before, 1);
    EXPECT_TRUE(router.schemas().is_cached("WorkerWithCountingArgs"));
}

TEST_F(EdgeCasesTest, FailedResolutionIsRetried) {
    EXPECT_THROW(job("WorkerWithDuplicateFields").schema(), core::SchemaNotDefinedError);
    EXPECT_THROW(job("WorkerWithDuplicateFields").schema(), core::SchemaNotDefinedError);
    EXPECT_FALSE(router.schemas().is_cached("WorkerWithDuplicateFields"));
}

TEST_F(EdgeCasesTest, FloatFieldAcceptsIntegerOnlyOnTheWire) {
    EXPECT_THROW(job("WorkerWithSerializationError").submit({{"value", 3}}), core::InvalidArgsError);
    EXPECT_EQ(job("WorkerWithSerializationError").dispatch({{"value", 3}}), "never called");
}

TEST_F(EdgeCasesTest, MistypedLiteralDefaultFailsSchemaResolution) {
    auto& bad = router.define<WorkerWithMistypedDefault>("WorkerWithMistypedDefault");

    auto message = fixtures::capture_error<core::SchemaNotDefinedError>([&] { bad.schema(); });
    EXPECT_THAT(message, HasSubstr("WorkerWithMistypedDefault::Args has an invalid default"));
    EXPECT_THAT(message, HasSubstr("count: expected Integer"));

    EXPECT_THROW(bad.run_synchronously(), core::SchemaNotDefinedError);
    EXPECT_THROW(bad.submit(), core::SchemaNotDefinedError);
    EXPECT_FALSE(router.schemas().is_cached("WorkerWithMistypedDefault"));
    EXPECT_EQ(broker.size(), 0u);
}

TEST_F(EdgeCasesTest, MistypedNestedDefaultFailsSchemaResolution) {
    auto& bad = router.define<WorkerWithMistypedNestedDefault>("WorkerWithMistypedNestedDefault");

    auto message = fixtures::capture_error<core::SchemaNotDefinedError>([&] { bad.schema(); });
    EXPECT_THAT(message, HasSubstr("size.unit"));
}

TEST_F(EdgeCasesTest, MistypedProducedDefaultIsInvalid) {
    auto& bad = router.define<WorkerWithMistypedProducer>("WorkerWithMistypedProducer");
    ASSERT_NE(bad.schema(), nullptr);

    auto message = fixtures::capture_error<core::InvalidArgsError>([&] { bad.submit({{"label", "x"}}); });
    EXPECT_THAT(message, HasSubstr("count: expected Integer"));
    EXPECT_THROW(bad.run_synchronously({{"label", "x"}}), core::InvalidArgsError);
    EXPECT_EQ(broker.size(), 0u);

    EXPECT_EQ(bad.run_synchronously({{"label", "x"}, {"count", 3}}), 3);
    EXPECT_THROW(bad.dispatch({{"label", "x"}}), core::SerializationError);
}

TEST_F(EdgeCasesTest, UndeclaredFieldReadIsABodyFailure) {
    auto& reader = router.define<WorkerReadingUndeclaredField>("WorkerReadingUndeclaredField");

    auto message = fixtures::capture_error<core::Error>([&] { reader.run_synchronously({{"value", 1}}); });
    EXPECT_EQ(message, "Error in WorkerReadingUndeclaredField#run: WorkerReadingUndeclaredField has no argument 'other'");

    message = fixtures::capture_error<core::Error>([&] { reader.dispatch({{"value", 1}}); });
    EXPECT_THAT(message, HasSubstr("#run"));
}
