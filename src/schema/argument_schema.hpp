#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "schema/type.hpp"

namespace argwire::schema {

using DefaultProducer = std::function<nlohmann::json()>;

// Default for an optional field: a literal, or a producer evaluated per build
class FieldDefault {
public:
    static FieldDefault literal(nlohmann::json value);
    static FieldDefault produced_by(DefaultProducer producer);

    nlohmann::json resolve() const;
    bool is_producer() const { return static_cast<bool>(producer_); }

private:
    nlohmann::json value_;
    DefaultProducer producer_;
};

struct FieldSpec {
    std::string name;
    TypePtr type;
    std::optional<FieldDefault> default_value;

    bool has_default() const { return default_value.has_value(); }

    // Required fields must be supplied; nilable fields default to null
    bool is_required() const { return !default_value && !type->is_nilable(); }

    // Value used when the field is absent; null when there is none
    nlohmann::json fallback() const;
};

/**
 * Declared argument shape of a job.
 *
 * Jobs declare their arguments by deriving a nested `Args` type from this
 * class and listing fields in its constructor:
 *
 *   struct Args : argwire::schema::ArgumentSchema {
 *       Args() {
 *           field("user_id", types::integer());
 *           field("notify", types::boolean(), false);
 *       }
 *   };
 *
 * Field names are unique; field() throws std::invalid_argument otherwise.
 */
class ArgumentSchema {
public:
    ArgumentSchema() : ArgumentSchema("Args") {}
    explicit ArgumentSchema(std::string name) : name_(std::move(name)) {}
    virtual ~ArgumentSchema() = default;

    const std::string& name() const { return name_; }
    const std::vector<FieldSpec>& fields() const { return fields_; }
    const FieldSpec* find(const std::string& field_name) const;
    bool has_field(const std::string& field_name) const { return find(field_name) != nullptr; }
    std::vector<std::string> field_names() const;

protected:
    void field(std::string field_name, TypePtr type);
    void field(std::string field_name, TypePtr type, nlohmann::json default_value);
    void field_with_producer(std::string field_name, TypePtr type, DefaultProducer producer);

private:
    void add(FieldSpec spec);

    std::string name_;
    std::vector<FieldSpec> fields_;
};

} // namespace argwire::schema
