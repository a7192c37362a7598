#include <atomic>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <nlohmann/json.hpp>

#include "config/AppConfig.hpp"
#include "core/SimulatedQuoteFeed.hpp"
#include "core/StampedeProtectedCache.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "models/Quote.hpp"
#include "utils/Utils.hpp"

using json = nlohmann::json;
using namespace std;

// --- Helper Function to Initialize StatsD Client ---
std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger_) {
    string statsd_server_endpoint;
    const char* statsd_server_value = std::getenv("STATSD_SERVER");
    if (statsd_server_value != nullptr) {
        statsd_server_endpoint = std::string(statsd_server_value);
    }
    logger_->setup("STATSD_SERVER endpoint : " + statsd_server_endpoint);

    try {
        if (!statsd_server_endpoint.empty()) {
            logger_->debug("STATSD_SERVER endpoint found. Creating real StatsDClient instance.");
            return std::make_shared<StatsDClient>(config, logger_, statsd_server_endpoint);
        }
    } catch (const std::exception& e) {
        logger_->error("StatsDClient creation failed: " + std::string(e.what()));
    }

    logger_->setup("Using DummyStatsDClient instance.");
    return std::make_shared<DummyStatsDClient>();
}

// One simulated strategy thread: polls quotes for the configured symbols
// through the shared cache.
void runQuoteConsumer(int consumer_id,
                      const AppConfig& config,
                      StampedeProtectedCache<Quote>& quote_cache,
                      SimulatedQuoteFeed& feed,
                      std::shared_ptr<ILogger> logger_,
                      std::atomic<std::uint64_t>& failed_requests) {
    const auto loader = [&feed](const std::string& symbol) { return feed.fetch(symbol); };
    for (int i = 0; i < config.requests_per_consumer; ++i) {
        const std::string& symbol = config.symbols[(consumer_id + i) % config.symbols.size()];
        try {
            Quote quote = quote_cache.get(symbol, loader);
            if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
                logger_->debug("Consumer " + std::to_string(consumer_id) + " got " + quote.to_string());
            }
        } catch (const QuoteFeedError& e) {
            failed_requests.fetch_add(1);
            logger_->warn("Consumer " + std::to_string(consumer_id) + " could not get " + symbol + ": " + e.what());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(config.request_interval_in_millis));
    }
}

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        // Process command-line arguments.
        vector<string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        optional<map<string, string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            ConsoleLogger(LogUtils::LogLevel::CERROR).error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }

        // Load Configuration
        AppConfig config_ = Utils::loadConfiguration(parsedArgsOpt.value());
        if (config_.symbols.empty() || config_.consumer_threads <= 0) {
            ConsoleLogger(LogUtils::LogLevel::CERROR).error("At least one symbol and one consumer thread are required. Exiting.");
            return 1;
        }

        // Initialize the main logger *after* loading the config
        std::shared_ptr<ILogger> logger_ = std::make_shared<ConsoleLogger>(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config_, logger_);

        // Declared before the cache: background refreshes still call into it
        // until the cache is destroyed.
        SimulatedQuoteFeed feed(std::chrono::milliseconds(config_.loader_latency_in_millis),
                                config_.loader_failure_rate,
                                logger_);
        // One cache for the whole process, handed to every consumer
        StampedeProtectedCache<Quote> quote_cache(config_.cache, logger_, statsd_client);

        logger_->setup("Starting " + std::to_string(config_.consumer_threads) + " quote consumers.");
        std::atomic<std::uint64_t> failed_requests{0};
        const auto start_time = std::chrono::steady_clock::now();
        {
            boost::asio::thread_pool consumers(static_cast<std::size_t>(config_.consumer_threads));
            for (int i = 0; i < config_.consumer_threads; ++i) {
                boost::asio::post(consumers, [i, &config_, &quote_cache, &feed, logger_, &failed_requests]() {
                    runQuoteConsumer(i, config_, quote_cache, feed, logger_, failed_requests);
                });
            }
            consumers.join();
        }
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time);

        CacheStats stats = quote_cache.getStats();
        statsd_client->gauge(MetricsDefinitions::CACHE_SIZE, static_cast<double>(stats.size));

        json report;
        report["elapsedMillis"] = elapsed.count();
        report["upstreamRequests"] = feed.requestCount();
        report["upstreamFailures"] = feed.failureCount();
        report["failedCallerRequests"] = failed_requests.load();
        report["cache"] = stats;
        std::cout << report.dump(4) << std::endl;

        logger_->setup("Quote consumers finished. " + stats.to_string());
        return 0;
    } catch (const ConfigurationError& e) {
        ConsoleLogger(LogUtils::LogLevel::CERROR).error("Invalid cache configuration: " + std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        std::stringstream ss;
        ss << "Unhandled exception: " << e.what();
        ConsoleLogger(LogUtils::LogLevel::CERROR).error(ss.str());
        return 1;
    }
}
