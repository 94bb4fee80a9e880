#include <cstdlib>
#include <string>
#include <gtest/gtest.h>
#include "core/config/server_config.hpp"
#include "core/errors/knife_errors.hpp"

namespace {

using knife::core::config::load_bridge_config_from_env;
using knife::core::config::load_server_config_from_env;
using knife::core::config::validate_base_url;
using knife::core::errors::get_error;
using knife::core::errors::get_value;
using knife::core::errors::is_error;
using knife::core::logging::LogLevel;

// Sets an environment variable for the scope of one test.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~ScopedEnv() { unsetenv(name_); }

private:
    const char* name_;
};

TEST(ServerConfigTest, AcceptsHttpAndHttpsUrls) {
    auto plain = validate_base_url("http://127.0.0.1:8000");
    ASSERT_FALSE(is_error(plain));
    EXPECT_EQ(get_value(plain), "http://127.0.0.1:8000");

    auto secure = validate_base_url("  https://tools.example.com/base/  ");
    ASSERT_FALSE(is_error(secure));
    EXPECT_EQ(get_value(secure), "https://tools.example.com/base");
}

TEST(ServerConfigTest, DropsQueryAndFragment) {
    auto result = validate_base_url("http://host:1/prefix/?debug=1#top");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "http://host:1/prefix");
}

TEST(ServerConfigTest, RejectsUnsupportedScheme) {
    auto result = validate_base_url("ws://host:1");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_base_url");
    EXPECT_EQ(get_error(result).message, "Base URL must start with http:// or https://");
}

TEST(ServerConfigTest, RejectsMissingHost) {
    auto result = validate_base_url("http:///only/path");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).message, "Base URL must include a host (and optional port)");
}

TEST(ServerConfigTest, ReadsServerSettingsFromEnvironment) {
    ScopedEnv host("KNIFE_HOST", "0.0.0.0");
    ScopedEnv port("KNIFE_PORT", "8123");
    ScopedEnv timeout("KNIFE_POLICY_MAX_TIMEOUT_S", "42");
    ScopedEnv level("KNIFE_LOG_LEVEL", "warn");

    auto result = load_server_config_from_env();
    ASSERT_FALSE(is_error(result));

    const auto config = get_value(result);
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 8123);
    EXPECT_EQ(config.max_timeout_s, 42);
    EXPECT_EQ(config.log_level, LogLevel::WARN);
}

TEST(ServerConfigTest, RejectsMalformedEnvironmentInteger) {
    ScopedEnv port("KNIFE_PORT", "eighty");

    auto result = load_server_config_from_env();
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_config");
}

TEST(ServerConfigTest, ReadsBridgeSettingsFromEnvironment) {
    ScopedEnv url("KNIFE_BASE_URL", "http://10.0.0.5:9000");
    ScopedEnv ttl("KNIFE_TOOLS_CACHE_TTL_S", "2.5");
    ScopedEnv timeout("KNIFE_BACKEND_TIMEOUT_S", "7");

    auto result = load_bridge_config_from_env();
    ASSERT_FALSE(is_error(result));

    const auto config = get_value(result);
    EXPECT_EQ(config.base_url, "http://10.0.0.5:9000");
    EXPECT_DOUBLE_EQ(config.tools_cache_ttl_s, 2.5);
    EXPECT_EQ(config.backend_timeout_s, 7);
}

TEST(ServerConfigTest, EmptyEnvironmentValueKeepsDefault) {
    ScopedEnv ttl("KNIFE_TOOLS_CACHE_TTL_S", "");

    auto result = load_bridge_config_from_env();
    ASSERT_FALSE(is_error(result));
    EXPECT_DOUBLE_EQ(get_value(result).tools_cache_ttl_s, 5.0);
}

}  // namespace
