#include "schema/hash_serializer.hpp"
#include "schema/detail.hpp"
#include <limits>

using json = nlohmann::json;

namespace argwire::schema {

namespace {

using detail::child_path;
using detail::describe;
using detail::fail;

json check_value(const TypeDescriptor& type, const json& value, const std::string& path);
void check_literal_defaults(const ArgumentSchema& schema, const std::string& path);

[[noreturn]] void mismatch(const TypeDescriptor& type, const json& value, const std::string& path) {
    fail(path, "expected " + type.to_string() + ", got " + describe(value));
}

json check_struct(const SchemaPtr& schema, const json& kwargs, const std::string& path) {
    if (!schema) {
        fail(path, "nested schema is not defined");
    }
    if (!kwargs.is_object()) {
        fail(path, "expected " + schema->name() + ", got " + describe(kwargs));
    }

    std::vector<std::string> unknown;
    for (auto it = kwargs.begin(); it != kwargs.end(); ++it) {
        if (!schema->has_field(it.key())) {
            unknown.push_back(it.key());
        }
    }
    if (!unknown.empty()) {
        fail(path, std::string(unknown.size() == 1 ? "unknown keyword: " : "unknown keywords: ") +
                       detail::join(unknown, ", "));
    }

    std::vector<std::string> missing;
    for (const auto& spec : schema->fields()) {
        if (spec.is_required() && !kwargs.contains(spec.name)) {
            missing.push_back(spec.name);
        }
    }
    if (!missing.empty()) {
        fail(path, std::string(missing.size() == 1 ? "missing keyword: " : "missing keywords: ") +
                       detail::join(missing, ", "));
    }

    json out = json::object();
    for (const auto& spec : schema->fields()) {
        auto it = kwargs.find(spec.name);
        if (it == kwargs.end()) {
            out[spec.name] = check_value(*spec.type, spec.fallback(), child_path(path, spec.name));
        } else {
            out[spec.name] = check_value(*spec.type, *it, child_path(path, spec.name));
        }
    }
    return out;
}

json check_value(const TypeDescriptor& type, const json& value, const std::string& path) {
    switch (type.kind()) {
        case TypeKind::BOOLEAN:
            if (!value.is_boolean()) mismatch(type, value, path);
            return value;

        case TypeKind::INTEGER:
            if (!value.is_number_integer()) mismatch(type, value, path);
            if (value.is_number_unsigned() &&
                value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                fail(path, "Integer " + value.dump() + " is out of range");
            }
            return value.get<int64_t>();

        case TypeKind::FLOAT:
            if (!value.is_number_float()) mismatch(type, value, path);
            return value;

        case TypeKind::STRING:
            if (!value.is_string()) mismatch(type, value, path);
            return value;

        case TypeKind::SYMBOL:
            if (!value.is_string() || !type.allows_symbol(value.get<std::string>())) {
                mismatch(type, value, path);
            }
            return value;

        case TypeKind::ARRAY: {
            if (!value.is_array()) mismatch(type, value, path);
            json out = json::array();
            for (size_t i = 0; i < value.size(); ++i) {
                out.push_back(check_value(*type.element(), value[i], child_path(path, i)));
            }
            return out;
        }

        case TypeKind::MAP: {
            if (!value.is_object()) mismatch(type, value, path);
            json out = json::object();
            for (auto it = value.begin(); it != value.end(); ++it) {
                out[it.key()] = check_value(*type.element(), it.value(), child_path(path, it.key()));
            }
            return out;
        }

        case TypeKind::STRUCT:
            return check_struct(type.schema(), value, path);

        case TypeKind::NILABLE:
            if (value.is_null()) return value;
            return check_value(*type.element(), value, path);

        case TypeKind::UNTYPED:
            return value;
    }
    fail(path, "unsupported type descriptor");
}

void check_literal_types(const TypeDescriptor& type, const std::string& path) {
    switch (type.kind()) {
        case TypeKind::ARRAY:
        case TypeKind::MAP:
        case TypeKind::NILABLE:
            check_literal_types(*type.element(), path);
            break;
        case TypeKind::STRUCT:
            if (type.schema()) check_literal_defaults(*type.schema(), path);
            break;
        default:
            break;
    }
}

void check_literal_defaults(const ArgumentSchema& schema, const std::string& path) {
    for (const auto& spec : schema.fields()) {
        auto field_path = child_path(path, spec.name);
        if (spec.default_value && !spec.default_value->is_producer()) {
            check_value(*spec.type, spec.default_value->resolve(), field_path);
        }
        check_literal_types(*spec.type, field_path);
    }
}

} // namespace

json detail::check_strict(const TypeDescriptor& type, const json& value, const std::string& path) {
    return check_value(type, value, path);
}

CheckResult check_defaults(const ArgumentSchema& schema) {
    CheckResult result;
    try {
        check_literal_defaults(schema, "");
        result.success = true;
    } catch (const std::exception& e) {
        result.error = e.what();
    }
    return result;
}

BuildResult construct(const SchemaPtr& schema, const json& kwargs) {
    BuildResult result;
    if (!schema) {
        result.error = "no schema to build arguments for";
        return result;
    }

    try {
        const json& input = kwargs.is_null() ? json::object() : kwargs;
        if (!input.is_object()) {
            result.error = "arguments must be keyword pairs, got " + describe(input);
            return result;
        }
        result.args.emplace(schema, check_struct(schema, input, ""));
        result.success = true;
    } catch (const std::exception& e) {
        result.error = e.what();
    }
    return result;
}

} // namespace argwire::schema
