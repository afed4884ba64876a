#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include "jobs/job.hpp"
#include "schema/argument_schema.hpp"

namespace argwire::jobs {

// What a job declared under the conventional name `Args`
struct ArgsDeclaration {
    std::string type_name;
    // Empty when the declared type is not an ArgumentSchema
    std::function<schema::SchemaPtr()> make;
};

struct JobDefinition {
    std::string name;
    std::optional<ArgsDeclaration> args;   // nullopt: job takes no arguments
    std::function<std::unique_ptr<Job>()> make_job;
};

// Readable C++ type name; falls back to the mangled form
std::string demangle(const char* mangled);

template <typename T, typename = void>
struct has_args_type : std::false_type {};

template <typename T>
struct has_args_type<T, std::void_t<typename T::Args>> : std::true_type {};

template <typename JobT>
JobDefinition define_job(std::string name) {
    static_assert(std::is_base_of_v<Job, JobT>, "jobs must derive from argwire::jobs::Job");
    static_assert(std::is_default_constructible_v<JobT>, "jobs must be default constructible");

    JobDefinition def;
    def.name = std::move(name);
    def.make_job = [] { return std::make_unique<JobT>(); };

    if constexpr (has_args_type<JobT>::value) {
        using ArgsT = typename JobT::Args;
        ArgsDeclaration decl;
        decl.type_name = demangle(typeid(ArgsT).name());
        if constexpr (std::is_base_of_v<schema::ArgumentSchema, ArgsT> &&
                      std::is_default_constructible_v<ArgsT>) {
            decl.make = [] { return schema::SchemaPtr(std::make_shared<const ArgsT>()); };
        }
        def.args = std::move(decl);
    }
    return def;
}

} // namespace argwire::jobs
