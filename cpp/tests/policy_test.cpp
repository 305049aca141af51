#include <cstdlib>

#include <gtest/gtest.h>

#include "tagcache/core/log.hpp"
#include "tagcache/core/policy.hpp"

using namespace tagcache::core;

TEST(CachePolicy, Defaults) {
    const CachePolicy p{};
    EXPECT_TRUE(p.explicit_dependencies.empty());
    EXPECT_EQ(p.expiration, ExpirationMode::Absolute);
    EXPECT_EQ(p.timeout_ms, 0u);
    EXPECT_TRUE(p.log_resolution);
}

TEST(CachePolicy, WithDependenciesSkipsEmpty) {
    const CachePolicy p = policy_with_dependencies({"Orders", "", "Items", "Orders"});
    EXPECT_EQ(p.explicit_dependencies, (TagSet{"Items", "Orders"}));
}

TEST(CacheSettings, ParseLogLevel) {
    LogLevel l{};
    EXPECT_TRUE(parse_log_level("DEBUG", &l));
    EXPECT_EQ(l, LogLevel::Debug);
    EXPECT_TRUE(parse_log_level("warn", &l));
    EXPECT_EQ(l, LogLevel::Warning);
    EXPECT_FALSE(parse_log_level("loud", &l));
    EXPECT_FALSE(parse_log_level("info", nullptr));
}

TEST(CacheSettings, FromEnvironment) {
    ::setenv("TAGCACHE_DISABLE_LOGGING", "true", 1);
    ::setenv("TAGCACHE_LOG_LEVEL", "error", 1);
    CacheSettings s = settings_from_env();
    EXPECT_TRUE(s.disable_logging);
    EXPECT_EQ(s.log_level, LogLevel::Error);

    ::setenv("TAGCACHE_DISABLE_LOGGING", "0", 1);
    ::setenv("TAGCACHE_LOG_LEVEL", "bogus", 1);
    s = settings_from_env();
    EXPECT_FALSE(s.disable_logging);
    EXPECT_EQ(s.log_level, LogLevel::Info);

    ::unsetenv("TAGCACHE_DISABLE_LOGGING");
    ::unsetenv("TAGCACHE_LOG_LEVEL");
}

TEST(Logging, DefaultLoggerIsShared) {
    const auto a = default_logger();
    const auto b = default_logger();
    ASSERT_TRUE(a);
    EXPECT_EQ(a.get(), b.get());
    EXPECT_EQ(a->name(), kLoggerName);

    init_logging(LogLevel::Warning);
    EXPECT_EQ(a->level(), spdlog::level::warn);
    init_logging(LogLevel::Info);
}
