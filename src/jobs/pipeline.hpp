#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "broker/broker.hpp"
#include "jobs/args_codec.hpp"
#include "jobs/definition.hpp"
#include "jobs/schema_registry.hpp"

namespace argwire::jobs {

/**
 * Public operations of one job.
 *
 * Submission: strict build -> serialize -> forward to the broker.
 * Dispatch:   coercive deserialize -> bind context -> run.
 *
 * Errors from the argwire taxonomy propagate untouched. Anything else thrown
 * by the job body is rethrown as core::Error("Error in <job>#run: ...") with
 * the original exception nested inside it.
 */
class JobPipeline {
public:
    JobPipeline(JobDefinition definition, SchemaRegistry& schemas, broker::Broker& broker);

    JobPipeline(const JobPipeline&) = delete;
    JobPipeline& operator=(const JobPipeline&) = delete;

    const std::string& name() const { return definition_.name; }
    const JobDefinition& definition() const { return definition_; }

    // Resolved argument schema, nullptr when the job takes none
    schema::SchemaPtr schema() const;

    // Strict validation. Without a schema the kwargs are ignored and nullopt is returned.
    std::optional<schema::TypedArguments> build_arguments(const nlohmann::json& kwargs = nlohmann::json::object()) const;

    std::string submit(const nlohmann::json& kwargs = nlohmann::json::object());
    std::string schedule_at(broker::Timestamp at, const nlohmann::json& kwargs = nlohmann::json::object());
    std::string schedule_in(broker::Seconds delay, const nlohmann::json& kwargs = nlohmann::json::object());

    // Runs on the calling thread without touching the wire format
    nlohmann::json run_synchronously(const nlohmann::json& kwargs = nlohmann::json::object());

    // Called by the broker with the payload it was given at submission
    nlohmann::json dispatch(const broker::WirePayload& payload);

    void set_log_payloads(bool enabled) { log_payloads_ = enabled; }

private:
    broker::WirePayload prepare(const nlohmann::json& kwargs);
    nlohmann::json execute(std::optional<schema::TypedArguments> args);

    JobDefinition definition_;
    SchemaRegistry& schemas_;
    broker::Broker& broker_;
    ArgsCodec codec_;
    bool log_payloads_ = false;
};

} // namespace argwire::jobs
