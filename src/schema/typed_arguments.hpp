#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "schema/argument_schema.hpp"

namespace argwire::schema {

// Values for every field of a schema, already checked against it.
// Build these with construct() or deserialize(); the constructor trusts its input.
class TypedArguments {
public:
    TypedArguments(SchemaPtr schema, nlohmann::json values);

    const SchemaPtr& schema() const { return schema_; }
    const nlohmann::json& values() const { return values_; }

    bool has(const std::string& field) const;

    // Throws std::out_of_range for a field the schema does not declare
    const nlohmann::json& get(const std::string& field) const;

    template <typename T>
    T get(const std::string& field) const {
        return get(field).template get<T>();
    }

    // Value of a nested-schema field, wrapped with that schema
    TypedArguments nested(const std::string& field) const;

    bool operator==(const TypedArguments& other) const;
    bool operator!=(const TypedArguments& other) const { return !(*this == other); }

private:
    SchemaPtr schema_;
    nlohmann::json values_;
};

// Lets a TypedArguments instance be passed where a nested-schema value is expected
void to_json(nlohmann::json& j, const TypedArguments& args);

} // namespace argwire::schema
