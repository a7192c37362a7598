// test/test_cache_config.cpp
#include <chrono>
#include <stdexcept>

#include "gtest/gtest.h"

#include "../src/config/CacheConfig.hpp"

TEST(CacheConfigTest, Defaults) {
    CacheConfig config;
    EXPECT_EQ(config.max_size, 1000u);
    EXPECT_EQ(config.default_ttl, std::chrono::milliseconds(60000));
    EXPECT_FALSE(config.stale_while_revalidate_ttl.has_value());
    EXPECT_EQ(config.staleWhileRevalidateTtl(), std::chrono::milliseconds(120000));
    EXPECT_DOUBLE_EQ(config.min_jitter, 0.9);
    EXPECT_DOUBLE_EQ(config.max_jitter, 1.1);
    EXPECT_TRUE(config.enable_background_refresh);
    EXPECT_EQ(config.background_refresh_threads, 2u);
}

TEST(CacheConfigTest, ResolvedFillsGraceWindowFromTtl) {
    CacheConfig config;
    config.default_ttl = std::chrono::milliseconds(500);
    CacheConfig resolved = config.resolved();
    ASSERT_TRUE(resolved.stale_while_revalidate_ttl.has_value());
    EXPECT_EQ(*resolved.stale_while_revalidate_ttl, std::chrono::milliseconds(1000));
}

TEST(CacheConfigTest, ResolvedKeepsExplicitGraceWindow) {
    CacheConfig config;
    config.stale_while_revalidate_ttl = std::chrono::milliseconds(0);
    EXPECT_EQ(*config.resolved().stale_while_revalidate_ttl, std::chrono::milliseconds(0));
}

TEST(CacheConfigTest, ProductionDefaults) {
    CacheConfig config = CacheConfig::defaults();
    EXPECT_EQ(config.default_ttl, std::chrono::milliseconds(60000));
    EXPECT_EQ(config.staleWhileRevalidateTtl(), std::chrono::milliseconds(120000));
    EXPECT_NO_THROW(config.resolved());
}

TEST(CacheConfigTest, RejectsInvalidOptions) {
    CacheConfig zero_size;
    zero_size.max_size = 0;
    EXPECT_THROW(zero_size.resolved(), ConfigurationError);

    CacheConfig zero_ttl;
    zero_ttl.default_ttl = std::chrono::milliseconds(0);
    EXPECT_THROW(zero_ttl.resolved(), ConfigurationError);

    CacheConfig negative_window;
    negative_window.stale_while_revalidate_ttl = std::chrono::milliseconds(-1);
    EXPECT_THROW(negative_window.resolved(), ConfigurationError);

    CacheConfig inverted_jitter;
    inverted_jitter.min_jitter = 1.2;
    inverted_jitter.max_jitter = 0.8;
    EXPECT_THROW(inverted_jitter.resolved(), ConfigurationError);

    CacheConfig zero_jitter;
    zero_jitter.min_jitter = 0.0;
    EXPECT_THROW(zero_jitter.resolved(), ConfigurationError);

    CacheConfig no_threads;
    no_threads.background_refresh_threads = 0;
    EXPECT_THROW(no_threads.resolved(), ConfigurationError);
}

TEST(CacheConfigTest, ConfigurationErrorIsInvalidArgument) {
    CacheConfig config;
    config.max_size = 0;
    EXPECT_THROW(config.resolved(), std::invalid_argument);
}
