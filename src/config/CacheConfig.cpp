#include "CacheConfig.hpp"

#include <sstream>

CacheConfig CacheConfig::defaults() {
    CacheConfig config;
    config.stale_while_revalidate_ttl = std::chrono::milliseconds(120000); // 2 minutes
    return config;
}

CacheConfig CacheConfig::resolved() const {
    if (max_size == 0) {
        throw ConfigurationError("max_size must be greater than zero");
    }
    if (default_ttl.count() <= 0) {
        throw ConfigurationError("default_ttl must be positive, got " + std::to_string(default_ttl.count()) + "ms");
    }
    if (stale_while_revalidate_ttl && stale_while_revalidate_ttl->count() < 0) {
        throw ConfigurationError("stale_while_revalidate_ttl must not be negative");
    }
    if (!(min_jitter > 0.0)) {
        throw ConfigurationError("min_jitter must be positive");
    }
    if (min_jitter > max_jitter) {
        std::stringstream ss;
        ss << "min_jitter (" << min_jitter << ") must not exceed max_jitter (" << max_jitter << ")";
        throw ConfigurationError(ss.str());
    }
    if (background_refresh_threads == 0) {
        throw ConfigurationError("background_refresh_threads must be greater than zero");
    }

    CacheConfig config = *this;
    config.stale_while_revalidate_ttl = staleWhileRevalidateTtl();
    return config;
}

std::string CacheConfig::to_string() const {
    std::stringstream ss;
    ss << "max_size: " << max_size << std::endl
        << "default_ttl_in_millis: " << default_ttl.count() << std::endl
        << "stale_while_revalidate_ttl_in_millis: " << staleWhileRevalidateTtl().count() << std::endl
        << "jitter_range: [" << min_jitter << ", " << max_jitter << "]" << std::endl
        << "enable_background_refresh: " << std::boolalpha << enable_background_refresh << std::noboolalpha << std::endl
        << "background_refresh_threads: " << background_refresh_threads << std::endl;
    return ss.str();
}
