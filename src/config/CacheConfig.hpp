#ifndef CACHECONFIG_HPP
#define CACHECONFIG_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

// Thrown at construction time for options that can never work.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message) : std::invalid_argument(message) {}
};

// --- Cache Options ---
class CacheConfig {
public:
    std::size_t max_size;
    std::chrono::milliseconds default_ttl;
    // Grace window measured from createdAt. Unset means 2 * default_ttl.
    std::optional<std::chrono::milliseconds> stale_while_revalidate_ttl;
    double min_jitter;
    double max_jitter;
    bool enable_background_refresh;
    std::size_t background_refresh_threads;

    CacheConfig() {
        max_size = 1000;
        default_ttl = std::chrono::milliseconds(60000); // 1 minute
        min_jitter = 0.9;
        max_jitter = 1.1;
        enable_background_refresh = true;
        background_refresh_threads = 2;
    }

    // Production defaults for position / market data caches.
    static CacheConfig defaults();

    // Copy with every optional filled in. Throws ConfigurationError.
    CacheConfig resolved() const;

    std::chrono::milliseconds staleWhileRevalidateTtl() const {
        return stale_while_revalidate_ttl.value_or(default_ttl * 2);
    }

    std::string to_string() const;
};

#endif // CACHECONFIG_HPP
