#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "schema/typed_arguments.hpp"

namespace argwire::jobs {

// Runtime state of one job invocation: zero or one set of typed arguments.
class ExecutionContext {
public:
    ExecutionContext() = default;
    ExecutionContext(std::string job_name, std::optional<schema::TypedArguments> args);

    const std::string& job_name() const { return job_name_; }

    bool has_arguments() const { return args_.has_value(); }

    // Bundled access; nullptr for jobs without a schema
    const schema::TypedArguments* arguments() const { return args_ ? &*args_ : nullptr; }

    bool has(const std::string& field) const;

    // Throws core::Error when the job has no such argument
    const nlohmann::json& get(const std::string& field) const;

    template <typename T>
    T get(const std::string& field) const {
        return get(field).template get<T>();
    }

private:
    std::string job_name_;
    std::optional<schema::TypedArguments> args_;
};

} // namespace argwire::jobs
