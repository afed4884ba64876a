#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "schema/typed_arguments.hpp"

namespace argwire::schema {

struct BuildResult {
    bool success = false;
    std::optional<TypedArguments> args;
    std::string error;
};

struct SerializeResult {
    bool success = false;
    nlohmann::json payload;   // string-keyed object on success
    std::string error;
};

struct CheckResult {
    bool success = false;
    std::string error;
};

// Strict check of every literal default, nested struct schemas included.
// Producer defaults are checked each time they are evaluated.
CheckResult check_defaults(const ArgumentSchema& schema);

// Strict: unknown keys, missing required fields and any type mismatch fail.
// No conversions between JSON types; integers are not accepted as floats.
BuildResult construct(const SchemaPtr& schema, const nlohmann::json& kwargs);

// Structural, fully recursive. Never coerces; fails on values JSON cannot carry.
SerializeResult serialize(const TypedArguments& args);

// Coercive: rebuilds typed values from a payload that went through JSON.
// Undeclared keys are ignored, missing optional fields take their defaults.
BuildResult deserialize(const SchemaPtr& schema, const nlohmann::json& payload);

} // namespace argwire::schema
