#include "schema/typed_arguments.hpp"
#include <stdexcept>

namespace argwire::schema {

TypedArguments::TypedArguments(SchemaPtr schema, nlohmann::json values)
    : schema_(std::move(schema)), values_(std::move(values)) {
    if (values_.is_null()) {
        values_ = nlohmann::json::object();
    }
}

bool TypedArguments::has(const std::string& field) const {
    return schema_ && schema_->has_field(field);
}

const nlohmann::json& TypedArguments::get(const std::string& field) const {
    if (!has(field)) {
        std::string owner = schema_ ? schema_->name() : "arguments";
        throw std::out_of_range("no field named '" + field + "' in " + owner);
    }
    auto it = values_.find(field);
    if (it == values_.end()) {
        static const nlohmann::json null_value;
        return null_value;
    }
    return *it;
}

TypedArguments TypedArguments::nested(const std::string& field) const {
    const auto* spec = schema_ ? schema_->find(field) : nullptr;
    if (!spec) {
        throw std::out_of_range("no field named '" + field + "'");
    }
    TypePtr type = spec->type;
    if (type->is_nilable()) {
        type = type->element();
    }
    if (type->kind() != TypeKind::STRUCT || !type->schema()) {
        throw std::invalid_argument("field '" + field + "' is " + spec->type->to_string() +
                                    ", not a nested schema");
    }
    return TypedArguments(type->schema(), get(field));
}

bool TypedArguments::operator==(const TypedArguments& other) const {
    if (schema_ != other.schema_) {
        bool same_shape = schema_ && other.schema_ && schema_->name() == other.schema_->name() &&
                          schema_->field_names() == other.schema_->field_names();
        if (!same_shape) return false;
    }
    return values_ == other.values_;
}

void to_json(nlohmann::json& j, const TypedArguments& args) {
    j = args.values();
}

} // namespace argwire::schema
