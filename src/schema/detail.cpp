#include "schema/detail.hpp"

namespace argwire::schema::detail {

void fail(const std::string& path, const std::string& message) {
    if (path.empty()) {
        throw ValueError(message);
    }
    throw ValueError(path + ": " + message);
}

std::string child_path(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

std::string child_path(const std::string& path, size_t index) {
    return path + "[" + std::to_string(index) + "]";
}

std::string describe(const nlohmann::json& value) {
    constexpr size_t kMaxShown = 40;
    std::string shown = value.dump();
    if (shown.size() > kMaxShown) {
        shown = shown.substr(0, kMaxShown) + "...";
    }

    switch (value.type()) {
        case nlohmann::json::value_t::null:            return "nil";
        case nlohmann::json::value_t::boolean:         return "T::Boolean " + shown;
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned: return "Integer " + shown;
        case nlohmann::json::value_t::number_float:    return "Float " + shown;
        case nlohmann::json::value_t::string:          return "String " + shown;
        case nlohmann::json::value_t::array:           return "Array " + shown;
        case nlohmann::json::value_t::object:          return "Hash " + shown;
        default: return value.type_name();
    }
}

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += separator;
        out += items[i];
    }
    return out;
}

} // namespace argwire::schema::detail
