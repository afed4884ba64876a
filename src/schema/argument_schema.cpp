#include "schema/argument_schema.hpp"
#include <stdexcept>

namespace argwire::schema {

FieldDefault FieldDefault::literal(nlohmann::json value) {
    FieldDefault def;
    def.value_ = std::move(value);
    return def;
}

FieldDefault FieldDefault::produced_by(DefaultProducer producer) {
    if (!producer) {
        throw std::invalid_argument("default producer must be callable");
    }
    FieldDefault def;
    def.producer_ = std::move(producer);
    return def;
}

nlohmann::json FieldDefault::resolve() const {
    return producer_ ? producer_() : value_;
}

nlohmann::json FieldSpec::fallback() const {
    return default_value ? default_value->resolve() : nlohmann::json(nullptr);
}

const FieldSpec* ArgumentSchema::find(const std::string& field_name) const {
    for (const auto& spec : fields_) {
        if (spec.name == field_name) {
            return &spec;
        }
    }
    return nullptr;
}

std::vector<std::string> ArgumentSchema::field_names() const {
    std::vector<std::string> names;
    names.reserve(fields_.size());
    for (const auto& spec : fields_) {
        names.push_back(spec.name);
    }
    return names;
}

void ArgumentSchema::field(std::string field_name, TypePtr type) {
    add(FieldSpec{std::move(field_name), std::move(type), std::nullopt});
}

void ArgumentSchema::field(std::string field_name, TypePtr type, nlohmann::json default_value) {
    add(FieldSpec{std::move(field_name), std::move(type), FieldDefault::literal(std::move(default_value))});
}

void ArgumentSchema::field_with_producer(std::string field_name, TypePtr type, DefaultProducer producer) {
    add(FieldSpec{std::move(field_name), std::move(type), FieldDefault::produced_by(std::move(producer))});
}

void ArgumentSchema::add(FieldSpec spec) {
    if (spec.name.empty()) {
        throw std::invalid_argument("field name must not be empty in " + name_);
    }
    if (!spec.type) {
        throw std::invalid_argument("field '" + spec.name + "' in " + name_ + " has no type");
    }
    if (has_field(spec.name)) {
        throw std::invalid_argument("duplicate field '" + spec.name + "' in " + name_);
    }
    fields_.push_back(std::move(spec));
}

} // namespace argwire::schema
