#pragma once
#include <memory>
#include <string>
#include <vector>

namespace argwire::schema {

class ArgumentSchema;
class TypeDescriptor;

using TypePtr = std::shared_ptr<const TypeDescriptor>;
using SchemaPtr = std::shared_ptr<const ArgumentSchema>;

enum class TypeKind {
    BOOLEAN,
    INTEGER,
    FLOAT,
    STRING,
    SYMBOL,     // string atom, optionally restricted to an enumerated set
    ARRAY,
    MAP,        // string keys
    STRUCT,     // nested schema
    NILABLE,
    UNTYPED     // any JSON value
};

const char* type_kind_to_string(TypeKind kind);

// Describes the shape of one schema field. Immutable once built.
class TypeDescriptor {
public:
    TypeDescriptor(TypeKind kind, TypePtr element = nullptr, SchemaPtr schema = nullptr,
                   std::vector<std::string> symbols = {});

    TypeKind kind() const { return kind_; }

    // Element type for ARRAY, value type for MAP, wrapped type for NILABLE
    const TypePtr& element() const { return element_; }

    // Nested schema for STRUCT; may be null if the declaration was broken
    const SchemaPtr& schema() const { return schema_; }

    // Allowed atoms for SYMBOL; empty means any non-empty atom
    const std::vector<std::string>& symbols() const { return symbols_; }

    bool is_nilable() const { return kind_ == TypeKind::NILABLE; }
    bool allows_symbol(const std::string& atom) const;

    // Sorbet-style rendering, e.g. "T.nilable(Integer)" or "T::Array[String]"
    std::string to_string() const;

    bool operator==(const TypeDescriptor& other) const;
    bool operator!=(const TypeDescriptor& other) const { return !(*this == other); }

private:
    TypeKind kind_;
    TypePtr element_;
    SchemaPtr schema_;
    std::vector<std::string> symbols_;
};

namespace types {

TypePtr boolean();
TypePtr integer();
TypePtr floating();
TypePtr string();
TypePtr symbol();
TypePtr enumeration(std::vector<std::string> atoms);
TypePtr array_of(TypePtr element);
TypePtr map_of(TypePtr value);
TypePtr nilable(TypePtr inner);
TypePtr untyped();
TypePtr structure(SchemaPtr schema);

template <typename SchemaT>
TypePtr structure() {
    return structure(std::make_shared<const SchemaT>());
}

} // namespace types

} // namespace argwire::schema
