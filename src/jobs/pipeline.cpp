#include "jobs/pipeline.hpp"
#include "core/errors.hpp"
#include "schema/hash_serializer.hpp"
#include <exception>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace argwire::jobs {

JobPipeline::JobPipeline(JobDefinition definition, SchemaRegistry& schemas, broker::Broker& broker)
    : definition_(std::move(definition)), schemas_(schemas), broker_(broker), codec_(definition_.name) {
    if (!definition_.make_job) {
        throw core::Error("Job " + definition_.name + " has no body factory");
    }
}

schema::SchemaPtr JobPipeline::schema() const {
    return schemas_.resolve(definition_);
}

std::optional<schema::TypedArguments> JobPipeline::build_arguments(const json& kwargs) const {
    auto args_schema = schema();
    if (!args_schema) {
        if (!kwargs.empty()) {
            spdlog::debug("{} takes no arguments; ignoring {} supplied", name(), kwargs.size());
        }
        return std::nullopt;
    }

    auto result = schema::construct(args_schema, kwargs);
    if (!result.success) {
        throw core::InvalidArgsError("Invalid arguments for " + name() + ": " + result.error);
    }
    return std::move(result.args);
}

broker::WirePayload JobPipeline::prepare(const json& kwargs) {
    auto args = build_arguments(kwargs);
    auto payload = codec_.serialize(args);
    if (log_payloads_) {
        spdlog::debug("{} payload: {}", name(), payload.dump());
    }
    return payload;
}

std::string JobPipeline::submit(const json& kwargs) {
    auto payload = prepare(kwargs);
    auto jid = broker_.submit(name(), payload);
    spdlog::debug("Enqueued {} as {}", name(), jid);
    return jid;
}

std::string JobPipeline::schedule_at(broker::Timestamp at, const json& kwargs) {
    auto payload = prepare(kwargs);
    auto jid = broker_.schedule_at(name(), at, payload);
    spdlog::debug("Scheduled {} as {}", name(), jid);
    return jid;
}

std::string JobPipeline::schedule_in(broker::Seconds delay, const json& kwargs) {
    auto payload = prepare(kwargs);
    auto jid = broker_.schedule_in(name(), delay, payload);
    spdlog::debug("Scheduled {} in {}s as {}", name(), delay.count(), jid);
    return jid;
}

json JobPipeline::run_synchronously(const json& kwargs) {
    return execute(build_arguments(kwargs));
}

json JobPipeline::dispatch(const broker::WirePayload& payload) {
    if (log_payloads_) {
        spdlog::debug("Dispatching {} with payload {}", name(), payload.dump());
    } else {
        spdlog::debug("Dispatching {}", name());
    }
    auto args = codec_.deserialize(schema(), payload);
    return execute(std::move(args));
}

json JobPipeline::execute(std::optional<schema::TypedArguments> args) {
    try {
        auto job = definition_.make_job();
        job->bind(ExecutionContext(name(), std::move(args)));
        json result = job->run();
        spdlog::debug("{}#run finished", name());
        return result;
    } catch (const core::NotImplementedError&) {
        throw;
    } catch (const core::SchemaNotDefinedError&) {
        throw;
    } catch (const core::InvalidArgsError&) {
        throw;
    } catch (const core::SerializationError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::warn("{}#run failed: {}", name(), e.what());
        std::throw_with_nested(core::Error("Error in " + name() + "#run: " + e.what()));
    } catch (...) {
        spdlog::warn("{}#run failed with a non-standard exception", name());
        std::throw_with_nested(core::Error("Error in " + name() + "#run: unknown exception"));
    }
}

} // namespace argwire::jobs
