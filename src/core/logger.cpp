#include "core/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace argwire::core {

void init_logger() {
    auto logger = spdlog::get("argwire");
    if (!logger) {
        logger = spdlog::stdout_color_mt("argwire");
    }
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum log_level_from_string(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str returns off for anything it does not recognize
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace argwire::core
