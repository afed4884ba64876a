#include "core/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace argwire::core::config {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths) {
    static bool loaded = false;
    if (loaded) return;
    loaded = true;

    std::vector<std::filesystem::path> search_paths;
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        search_paths.push_back(cwd);
    }
    for (const auto& p : extra_search_paths) {
        search_paths.push_back(p);
    }

    for (const auto& base : search_paths) {
        auto env_path = base / ".env";
        if (!std::filesystem::exists(env_path)) {
            continue;
        }

        std::ifstream file(env_path);
        std::string line;
        while (std::getline(file, line)) {
            line = trim(line);

            // Skip blanks and comments
            if (line.empty() || line[0] == '#') continue;

            size_t eq_pos = line.find('=');
            if (eq_pos == std::string::npos) continue;

            std::string key = trim(line.substr(0, eq_pos));
            std::string value = trim(line.substr(eq_pos + 1));

            if (value.size() >= 2) {
                if ((value.front() == '"' && value.back() == '"') ||
                    (value.front() == '\'' && value.back() == '\'')) {
                    value = value.substr(1, value.size() - 2);
                }
            }

            if (!key.empty() && std::getenv(key.c_str()) == nullptr) {
                setenv(key.c_str(), value.c_str(), 0);
            }
        }
        spdlog::debug("Loaded environment from {}", env_path.string());
        break;
    }
}

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    return value.empty() ? fallback : value;
}

bool get_env_bool(const std::string& key, bool fallback) {
    auto value = to_lower(trim(get_env(key)));
    if (value.empty()) return fallback;
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

RuntimeConfig load_runtime_config() {
    RuntimeConfig config;
    config.log_level = to_lower(get_env_or("ARGWIRE_LOG_LEVEL", config.log_level));
    config.broker_mode = to_lower(get_env_or("ARGWIRE_BROKER_MODE", config.broker_mode));
    config.log_payloads = get_env_bool("ARGWIRE_LOG_PAYLOADS", config.log_payloads);
    return config;
}

} // namespace argwire::core::config
