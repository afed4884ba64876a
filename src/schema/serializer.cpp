#include "schema/hash_serializer.hpp"
#include "schema/detail.hpp"
#include <cmath>

using json = nlohmann::json;

namespace argwire::schema {

namespace {

using detail::child_path;
using detail::describe;
using detail::fail;

[[noreturn]] void unserializable(const TypeDescriptor& type, const json& value, const std::string& path) {
    fail(path, "cannot serialize " + describe(value) + " as " + type.to_string());
}

void require_finite(const json& value, const std::string& path) {
    if (!value.is_number_float()) return;
    double d = value.get<double>();
    if (std::isnan(d)) {
        fail(path, "non-finite float NaN has no JSON representation");
    }
    if (std::isinf(d)) {
        fail(path, std::string("non-finite float ") + (d > 0 ? "Infinity" : "-Infinity") +
                       " has no JSON representation");
    }
}

json emit_value(const TypeDescriptor& type, const json& value, const std::string& path);

json emit_struct(const SchemaPtr& schema, const json& values, const std::string& path) {
    if (!schema) {
        fail(path, "nested schema is not defined");
    }
    if (!values.is_object()) {
        fail(path, "expected " + schema->name() + ", got " + describe(values));
    }

    json out = json::object();
    for (const auto& spec : schema->fields()) {
        auto it = values.find(spec.name);
        if (it == values.end()) {
            if (spec.is_required()) {
                fail(child_path(path, spec.name), "no value for required field");
            }
            out[spec.name] = emit_value(*spec.type, spec.fallback(), child_path(path, spec.name));
            continue;
        }
        out[spec.name] = emit_value(*spec.type, *it, child_path(path, spec.name));
    }
    return out;
}

json emit_untyped(const json& value, const std::string& path) {
    if (value.is_array()) {
        json out = json::array();
        for (size_t i = 0; i < value.size(); ++i) {
            out.push_back(emit_untyped(value[i], child_path(path, i)));
        }
        return out;
    }
    if (value.is_object()) {
        json out = json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = emit_untyped(it.value(), child_path(path, it.key()));
        }
        return out;
    }
    if (value.is_binary() || value.is_discarded()) {
        fail(path, std::string("cannot serialize ") + value.type_name() + " value");
    }
    require_finite(value, path);
    return value;
}

json emit_value(const TypeDescriptor& type, const json& value, const std::string& path) {
    switch (type.kind()) {
        case TypeKind::BOOLEAN:
            if (!value.is_boolean()) unserializable(type, value, path);
            return value;

        case TypeKind::INTEGER:
            if (!value.is_number_integer()) unserializable(type, value, path);
            return value;

        case TypeKind::FLOAT:
            if (!value.is_number_float()) unserializable(type, value, path);
            require_finite(value, path);
            return value;

        case TypeKind::STRING:
        case TypeKind::SYMBOL:
            if (!value.is_string()) unserializable(type, value, path);
            return value;

        case TypeKind::ARRAY: {
            if (!value.is_array()) unserializable(type, value, path);
            json out = json::array();
            for (size_t i = 0; i < value.size(); ++i) {
                out.push_back(emit_value(*type.element(), value[i], child_path(path, i)));
            }
            return out;
        }

        case TypeKind::MAP: {
            if (!value.is_object()) unserializable(type, value, path);
            json out = json::object();
            for (auto it = value.begin(); it != value.end(); ++it) {
                out[it.key()] = emit_value(*type.element(), it.value(), child_path(path, it.key()));
            }
            return out;
        }

        case TypeKind::STRUCT:
            return emit_struct(type.schema(), value, path);

        case TypeKind::NILABLE:
            if (value.is_null()) return value;
            return emit_value(*type.element(), value, path);

        case TypeKind::UNTYPED:
            return emit_untyped(value, path);
    }
    fail(path, "unsupported type descriptor");
}

} // namespace

SerializeResult serialize(const TypedArguments& args) {
    SerializeResult result;
    if (!args.schema()) {
        result.error = "arguments carry no schema";
        return result;
    }

    try {
        result.payload = emit_struct(args.schema(), args.values(), "");
        result.success = true;
    } catch (const std::exception& e) {
        result.error = e.what();
    }
    return result;
}

} // namespace argwire::schema
