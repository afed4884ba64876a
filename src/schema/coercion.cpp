#include "schema/hash_serializer.hpp"
#include "schema/detail.hpp"
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace argwire::schema {

namespace {

using detail::child_path;
using detail::describe;
using detail::fail;

[[noreturn]] void cannot_coerce(const TypeDescriptor& type, const json& value, const std::string& path) {
    fail(path, "cannot coerce " + describe(value) + " to " + type.to_string());
}

// Optional sign followed by decimal digits only
bool parse_integer(const std::string& text, int64_t& out) {
    if (text.empty()) return false;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    if (*begin == '+') {
        ++begin;
        if (begin == end || *begin == '-') return false;
    }
    auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc() && ptr == end;
}

// Decimal or exponent notation; no whitespace, hex, inf or nan
bool parse_float(const std::string& text, double& out) {
    if (text.empty()) return false;
    bool has_digit = false;
    for (char c : text) {
        if (c >= '0' && c <= '9') {
            has_digit = true;
        } else if (c != '+' && c != '-' && c != '.' && c != 'e' && c != 'E') {
            return false;
        }
    }
    if (!has_digit) return false;

    errno = 0;
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return errno == 0 && end == text.c_str() + text.size() && std::isfinite(out);
}

json coerce_value(const TypeDescriptor& type, const json& value, const std::string& path);

json coerce_struct(const SchemaPtr& schema, const json& payload, const std::string& path) {
    if (!schema) {
        fail(path, "nested schema is not defined");
    }
    if (!payload.is_object()) {
        fail(path, "expected " + schema->name() + ", got " + describe(payload));
    }

    json out = json::object();
    for (const auto& spec : schema->fields()) {
        auto it = payload.find(spec.name);
        if (it == payload.end()) {
            if (spec.is_required()) {
                fail(child_path(path, spec.name), "missing required field");
            }
            out[spec.name] = detail::check_strict(*spec.type, spec.fallback(), child_path(path, spec.name));
            continue;
        }
        out[spec.name] = coerce_value(*spec.type, *it, child_path(path, spec.name));
    }

    for (auto it = payload.begin(); it != payload.end(); ++it) {
        if (!schema->has_field(it.key())) {
            spdlog::debug("Ignoring undeclared key '{}' while deserializing {}",
                          child_path(path, it.key()), schema->name());
        }
    }
    return out;
}

json coerce_value(const TypeDescriptor& type, const json& value, const std::string& path) {
    switch (type.kind()) {
        case TypeKind::BOOLEAN:
            if (value.is_boolean()) return value;
            if (value.is_string()) {
                const auto& text = value.get_ref<const std::string&>();
                if (text == "true") return true;
                if (text == "false") return false;
            }
            cannot_coerce(type, value, path);

        case TypeKind::INTEGER: {
            if (value.is_number_integer()) {
                if (value.is_number_unsigned() &&
                    value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                    cannot_coerce(type, value, path);
                }
                return value.get<int64_t>();
            }
            if (value.is_number_float()) {
                double d = value.get<double>();
                // 2^63 is exactly representable; anything at or above it overflows int64
                if (std::isfinite(d) && std::trunc(d) == d && d >= -9223372036854775808.0 &&
                    d < 9223372036854775808.0) {
                    return static_cast<int64_t>(d);
                }
                cannot_coerce(type, value, path);
            }
            int64_t parsed = 0;
            if (value.is_string() && parse_integer(value.get_ref<const std::string&>(), parsed)) {
                return parsed;
            }
            cannot_coerce(type, value, path);
        }

        case TypeKind::FLOAT: {
            if (value.is_number_float()) return value;
            if (value.is_number_integer()) return value.get<double>();
            double parsed = 0.0;
            if (value.is_string() && parse_float(value.get_ref<const std::string&>(), parsed)) {
                return parsed;
            }
            cannot_coerce(type, value, path);
        }

        case TypeKind::STRING:
            if (value.is_string()) return value;
            // Numbers keep their exact decimal text
            if (value.is_number() || value.is_boolean()) return value.dump();
            cannot_coerce(type, value, path);

        case TypeKind::SYMBOL:
            if (value.is_string() && type.allows_symbol(value.get_ref<const std::string&>())) {
                return value;
            }
            cannot_coerce(type, value, path);

        case TypeKind::ARRAY: {
            if (!value.is_array()) cannot_coerce(type, value, path);
            json out = json::array();
            for (size_t i = 0; i < value.size(); ++i) {
                out.push_back(coerce_value(*type.element(), value[i], child_path(path, i)));
            }
            return out;
        }

        case TypeKind::MAP: {
            if (!value.is_object()) cannot_coerce(type, value, path);
            json out = json::object();
            for (auto it = value.begin(); it != value.end(); ++it) {
                out[it.key()] = coerce_value(*type.element(), it.value(), child_path(path, it.key()));
            }
            return out;
        }

        case TypeKind::STRUCT:
            return coerce_struct(type.schema(), value, path);

        case TypeKind::NILABLE:
            if (value.is_null()) return value;
            return coerce_value(*type.element(), value, path);

        case TypeKind::UNTYPED:
            return value;
    }
    fail(path, "unsupported type descriptor");
}

} // namespace

BuildResult deserialize(const SchemaPtr& schema, const json& payload) {
    BuildResult result;
    if (!schema) {
        result.error = "no schema to deserialize into";
        return result;
    }

    try {
        result.args.emplace(schema, coerce_struct(schema, payload, ""));
        result.success = true;
    } catch (const std::exception& e) {
        result.error = e.what();
    }
    return result;
}

} // namespace argwire::schema
