#include "schema/type.hpp"
#include "schema/argument_schema.hpp"
#include <algorithm>
#include <stdexcept>

namespace argwire::schema {

const char* type_kind_to_string(TypeKind kind) {
    switch (kind) {
        case TypeKind::BOOLEAN: return "BOOLEAN";
        case TypeKind::INTEGER: return "INTEGER";
        case TypeKind::FLOAT:   return "FLOAT";
        case TypeKind::STRING:  return "STRING";
        case TypeKind::SYMBOL:  return "SYMBOL";
        case TypeKind::ARRAY:   return "ARRAY";
        case TypeKind::MAP:     return "MAP";
        case TypeKind::STRUCT:  return "STRUCT";
        case TypeKind::NILABLE: return "NILABLE";
        case TypeKind::UNTYPED: return "UNTYPED";
        default: return "UNKNOWN";
    }
}

TypeDescriptor::TypeDescriptor(TypeKind kind, TypePtr element, SchemaPtr schema,
                               std::vector<std::string> symbols)
    : kind_(kind), element_(std::move(element)), schema_(std::move(schema)), symbols_(std::move(symbols)) {
    bool needs_element = kind_ == TypeKind::ARRAY || kind_ == TypeKind::MAP || kind_ == TypeKind::NILABLE;
    if (needs_element && !element_) {
        throw std::invalid_argument(std::string(type_kind_to_string(kind_)) + " type requires an element type");
    }
}

bool TypeDescriptor::allows_symbol(const std::string& atom) const {
    if (atom.empty()) return false;
    if (symbols_.empty()) return true;
    return std::find(symbols_.begin(), symbols_.end(), atom) != symbols_.end();
}

std::string TypeDescriptor::to_string() const {
    switch (kind_) {
        case TypeKind::BOOLEAN: return "T::Boolean";
        case TypeKind::INTEGER: return "Integer";
        case TypeKind::FLOAT:   return "Float";
        case TypeKind::STRING:  return "String";
        case TypeKind::SYMBOL: {
            if (symbols_.empty()) return "Symbol";
            std::string out = "T.enum([";
            for (size_t i = 0; i < symbols_.size(); ++i) {
                if (i > 0) out += ", ";
                out += ":" + symbols_[i];
            }
            return out + "])";
        }
        case TypeKind::ARRAY:   return "T::Array[" + element_->to_string() + "]";
        case TypeKind::MAP:     return "T::Hash[String, " + element_->to_string() + "]";
        case TypeKind::STRUCT:  return schema_ ? schema_->name() : "<undefined schema>";
        case TypeKind::NILABLE: return "T.nilable(" + element_->to_string() + ")";
        case TypeKind::UNTYPED: return "T.untyped";
        default: return "UNKNOWN";
    }
}

bool TypeDescriptor::operator==(const TypeDescriptor& other) const {
    if (kind_ != other.kind_ || symbols_ != other.symbols_) {
        return false;
    }
    if (static_cast<bool>(element_) != static_cast<bool>(other.element_)) {
        return false;
    }
    if (element_ && *element_ != *other.element_) {
        return false;
    }
    if (kind_ == TypeKind::STRUCT) {
        if (schema_ == other.schema_) return true;
        if (!schema_ || !other.schema_) return false;
        return schema_->name() == other.schema_->name();
    }
    return true;
}

namespace types {

TypePtr boolean() {
    static const TypePtr type = std::make_shared<const TypeDescriptor>(TypeKind::BOOLEAN);
    return type;
}

TypePtr integer() {
    static const TypePtr type = std::make_shared<const TypeDescriptor>(TypeKind::INTEGER);
    return type;
}

TypePtr floating() {
    static const TypePtr type = std::make_shared<const TypeDescriptor>(TypeKind::FLOAT);
    return type;
}

TypePtr string() {
    static const TypePtr type = std::make_shared<const TypeDescriptor>(TypeKind::STRING);
    return type;
}

TypePtr symbol() {
    static const TypePtr type = std::make_shared<const TypeDescriptor>(TypeKind::SYMBOL);
    return type;
}

TypePtr enumeration(std::vector<std::string> atoms) {
    if (atoms.empty()) {
        throw std::invalid_argument("enumeration requires at least one atom");
    }
    return std::make_shared<const TypeDescriptor>(TypeKind::SYMBOL, nullptr, nullptr, std::move(atoms));
}

TypePtr array_of(TypePtr element) {
    return std::make_shared<const TypeDescriptor>(TypeKind::ARRAY, std::move(element));
}

TypePtr map_of(TypePtr value) {
    return std::make_shared<const TypeDescriptor>(TypeKind::MAP, std::move(value));
}

TypePtr nilable(TypePtr inner) {
    // T.nilable(T.nilable(X)) is just T.nilable(X)
    if (inner && inner->is_nilable()) {
        return inner;
    }
    return std::make_shared<const TypeDescriptor>(TypeKind::NILABLE, std::move(inner));
}

TypePtr untyped() {
    static const TypePtr type = std::make_shared<const TypeDescriptor>(TypeKind::UNTYPED);
    return type;
}

TypePtr structure(SchemaPtr schema) {
    return std::make_shared<const TypeDescriptor>(TypeKind::STRUCT, nullptr, std::move(schema));
}

} // namespace types

} // namespace argwire::schema
