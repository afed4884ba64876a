#include "jobs/execution_context.hpp"
#include "core/errors.hpp"

namespace argwire::jobs {

ExecutionContext::ExecutionContext(std::string job_name, std::optional<schema::TypedArguments> args)
    : job_name_(std::move(job_name)), args_(std::move(args)) {}

bool ExecutionContext::has(const std::string& field) const {
    return args_ && args_->has(field);
}

const nlohmann::json& ExecutionContext::get(const std::string& field) const {
    if (!has(field)) {
        throw core::Error(job_name_ + " has no argument '" + field + "'");
    }
    return args_->get(field);
}

} // namespace argwire::jobs
