#include "jobs/args_codec.hpp"
#include "core/errors.hpp"
#include "schema/hash_serializer.hpp"

namespace argwire::jobs {

broker::WirePayload ArgsCodec::serialize(const std::optional<schema::TypedArguments>& args) const {
    if (!args) {
        return nlohmann::json::object();
    }

    auto result = schema::serialize(*args);
    if (!result.success) {
        throw core::SerializationError("Failed to serialize args for " + job_name_ + ": " + result.error);
    }
    return std::move(result.payload);
}

std::optional<schema::TypedArguments> ArgsCodec::deserialize(const schema::SchemaPtr& schema,
                                                             const broker::WirePayload& payload) const {
    if (!schema) {
        return std::nullopt;
    }

    auto result = schema::deserialize(schema, payload);
    if (!result.success) {
        throw core::SerializationError("Failed to deserialize args for " + job_name_ + ": " + result.error);
    }
    return std::move(result.args);
}

} // namespace argwire::jobs
