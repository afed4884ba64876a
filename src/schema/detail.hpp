#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "schema/type.hpp"

// Helpers shared by the strict, coercive and serializing passes. Not installed.
namespace argwire::schema::detail {

// Raised inside a pass and turned into a failed result at its entry point
class ValueError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

[[noreturn]] void fail(const std::string& path, const std::string& message);

std::string child_path(const std::string& path, const std::string& key);
std::string child_path(const std::string& path, size_t index);

// Ruby-flavored description of a JSON value, e.g. `String "abc"` or `Integer 5`
std::string describe(const nlohmann::json& value);

// Strict check of one value against its descriptor; throws ValueError
nlohmann::json check_strict(const TypeDescriptor& type, const nlohmann::json& value, const std::string& path);

std::string join(const std::vector<std::string>& items, const std::string& separator);

} // namespace argwire::schema::detail
