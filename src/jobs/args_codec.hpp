#pragma once
#include <optional>
#include <string>
#include "broker/broker.hpp"
#include "schema/typed_arguments.hpp"

namespace argwire::jobs {

// Turns schema-layer results into job-named errors.
// Outbound never coerces; inbound always does.
class ArgsCodec {
public:
    explicit ArgsCodec(std::string job_name) : job_name_(std::move(job_name)) {}

    // Empty object for a job without arguments.
    // Throws core::SerializationError("Failed to serialize args for <job>: ...").
    broker::WirePayload serialize(const std::optional<schema::TypedArguments>& args) const;

    // nullopt when schema is null.
    // Throws core::SerializationError("Failed to deserialize args for <job>: ...").
    std::optional<schema::TypedArguments> deserialize(const schema::SchemaPtr& schema,
                                                      const broker::WirePayload& payload) const;

private:
    std::string job_name_;
};

} // namespace argwire::jobs
