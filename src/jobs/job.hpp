#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "jobs/execution_context.hpp"

namespace argwire::jobs {

class JobPipeline;

/**
 * Base class for job bodies.
 *
 * Override run(). Arguments are read through arg<T>("name") or the bundled
 * args() instance; both are bound by the pipeline before run() is called.
 * Field access never goes through methods, so a job is free to define
 * members whose names match its fields.
 */
class Job {
public:
    virtual ~Job() = default;

    // Throws core::NotImplementedError unless overridden
    virtual nlohmann::json run();

    const std::string& job_name() const { return context_.job_name(); }
    const ExecutionContext& context() const { return context_; }

    // nullptr when the job declares no schema or nothing is bound yet
    const schema::TypedArguments* args() const { return context_.arguments(); }

    const nlohmann::json& arg(const std::string& field) const { return context_.get(field); }

    template <typename T>
    T arg(const std::string& field) const {
        return context_.get<T>(field);
    }

private:
    friend class JobPipeline;

    void bind(ExecutionContext context) { context_ = std::move(context); }

    ExecutionContext context_;
};

} // namespace argwire::jobs
