#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "CacheConfig.hpp"

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace MetricsDefinitions {
    static std::string CACHE_HIT = "cache.hit";

    static std::string CACHE_STALE_HIT = "cache.stale_hit";

    static std::string CACHE_MISS = "cache.miss";

    static std::string REQUEST_COALESCED = "cache.coalesced";

    static std::string BACKGROUND_REFRESH = "cache.background_refresh";

    static std::string REFRESH_ERROR = "cache.refresh_error";

    static std::string LOAD_TIME = "cache.load_time";

    static std::string CACHE_SIZE = "cache.size";
}

// --- Host Configuration ---
// Everything the demo host reads from stampede.config / the command line.
class AppConfig {
public:
    CacheConfig cache;

    // Logging Level
    LogUtils::LogLevel log_level;

    // Metrics
    int metrics_batch_size;
    int metrics_send_interval_in_millis;

    // --- Simulated quote consumers ---
    int consumer_threads;
    int requests_per_consumer;
    int request_interval_in_millis;
    std::vector<std::string> symbols;

    // --- Simulated market data backend ---
    int loader_latency_in_millis;
    double loader_failure_rate;

    AppConfig() {
        // --- Set Defaults ---
        cache.max_size = 1000;
        cache.default_ttl = std::chrono::milliseconds(200);
        cache.stale_while_revalidate_ttl = std::chrono::milliseconds(600);

        log_level = LogUtils::LogLevel::INFO;
        metrics_batch_size = 100;
        metrics_send_interval_in_millis = 1000;

        consumer_threads = 8;
        requests_per_consumer = 200;
        request_interval_in_millis = 5;
        symbols = {"AAPL", "MSFT", "GOOGL", "AMZN", "NVDA", "TSLA", "META", "SPY"};

        loader_latency_in_millis = 25;
        loader_failure_rate = 0.0;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "// --- Cache Configuration --- //" << std::endl
            << cache.to_string()
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_in_millis: " << metrics_send_interval_in_millis << std::endl
            << "// --- Quote Consumers --- //" << std::endl
            << "consumer_threads: " << consumer_threads << std::endl
            << "requests_per_consumer: " << requests_per_consumer << std::endl
            << "request_interval_in_millis: " << request_interval_in_millis << std::endl
            << "loader_latency_in_millis: " << loader_latency_in_millis << std::endl
            << "loader_failure_rate: " << loader_failure_rate << std::endl
            << "symbols:";
        for (const auto& symbol : symbols) {
            ss << " " << symbol;
        }
        ss << std::endl << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
