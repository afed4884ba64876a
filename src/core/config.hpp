#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace argwire::core::config {

// Process-wide settings read from the environment
struct RuntimeConfig {
    std::string log_level = "info";     // ARGWIRE_LOG_LEVEL
    std::string broker_mode = "fake";   // ARGWIRE_BROKER_MODE: "fake" | "inline"
    bool log_payloads = false;          // ARGWIRE_LOG_PAYLOADS: include payloads in debug logs
};

// Load environment variables from the first .env found (idempotent).
// Searches the working directory first, then extra_search_paths in order.
void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths = {});

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// "1", "true", "yes", "on" (any case) are true; missing uses fallback.
bool get_env_bool(const std::string& key, bool fallback);

RuntimeConfig load_runtime_config();

} // namespace argwire::core::config
