#include "core/config.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include "core/logger.hpp"

namespace config = argwire::core::config;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        unsetenv("ARGWIRE_LOG_LEVEL");
        unsetenv("ARGWIRE_BROKER_MODE");
        unsetenv("ARGWIRE_LOG_PAYLOADS");
        unsetenv("ARGWIRE_TEST_VALUE");
    }
};

TEST_F(ConfigTest, DefaultsWithoutEnvironment) {
    auto runtime = config::load_runtime_config();
    EXPECT_EQ(runtime.log_level, "info");
    EXPECT_EQ(runtime.broker_mode, "fake");
    EXPECT_FALSE(runtime.log_payloads);
}

TEST_F(ConfigTest, ReadsEnvironment) {
    setenv("ARGWIRE_LOG_LEVEL", "DEBUG", 1);
    setenv("ARGWIRE_BROKER_MODE", "Inline", 1);
    setenv("ARGWIRE_LOG_PAYLOADS", "yes", 1);

    auto runtime = config::load_runtime_config();
    EXPECT_EQ(runtime.log_level, "debug");
    EXPECT_EQ(runtime.broker_mode, "inline");
    EXPECT_TRUE(runtime.log_payloads);
}

TEST_F(ConfigTest, EnvHelpers) {
    EXPECT_EQ(config::get_env("ARGWIRE_TEST_VALUE"), "");
    EXPECT_EQ(config::get_env_or("ARGWIRE_TEST_VALUE", "fallback"), "fallback");
    EXPECT_TRUE(config::get_env_bool("ARGWIRE_TEST_VALUE", true));

    setenv("ARGWIRE_TEST_VALUE", "off", 1);
    EXPECT_EQ(config::get_env_or("ARGWIRE_TEST_VALUE", "fallback"), "off");
    EXPECT_FALSE(config::get_env_bool("ARGWIRE_TEST_VALUE", true));

    for (const char* truthy : {"1", "true", "TRUE", "on", " yes "}) {
        setenv("ARGWIRE_TEST_VALUE", truthy, 1);
        EXPECT_TRUE(config::get_env_bool("ARGWIRE_TEST_VALUE", false)) << truthy;
    }
}

TEST(LoggerTest, LevelNames) {
    using argwire::core::log_level_from_string;
    EXPECT_EQ(log_level_from_string("debug"), spdlog::level::debug);
    EXPECT_EQ(log_level_from_string("warn"), spdlog::level::warn);
    EXPECT_EQ(log_level_from_string("off"), spdlog::level::off);
    EXPECT_EQ(log_level_from_string("chatty"), spdlog::level::info);
}

TEST(LoggerTest, InitIsRepeatable) {
    argwire::core::init_logger();
    argwire::core::init_logger();
    EXPECT_NE(spdlog::get("argwire"), nullptr);
    EXPECT_EQ(spdlog::default_logger()->name(), "argwire");
}
