#ifndef SIMULATEDQUOTEFEED_HPP
#define SIMULATEDQUOTEFEED_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>

#include "../interfaces/ILogger.hpp"
#include "../models/Quote.hpp"

// Thrown when the simulated upstream rejects a request.
class QuoteFeedError : public std::runtime_error {
public:
    explicit QuoteFeedError(const std::string& message) : std::runtime_error(message) {}
};

// Stand-in for a rate-limited market data API. Every fetch costs latency,
// may fail at failure_rate, and is counted so callers can see how many
// upstream requests the cache let through.
class SimulatedQuoteFeed {
public:
    SimulatedQuoteFeed(std::chrono::milliseconds latency, double failure_rate, std::shared_ptr<ILogger> logger);

    // Loader entry point: (symbol) -> Quote. Blocks for the configured latency.
    Quote fetch(const std::string& symbol);

    std::uint64_t requestCount() const { return requests_.load(); }
    std::uint64_t failureCount() const { return failures_.load(); }

private:
    double nextPrice(const std::string& symbol);

    const std::chrono::milliseconds latency_;
    const double failure_rate_;
    std::shared_ptr<ILogger> logger_;

    std::mutex mutex_; // rng_, last_prices_
    std::mt19937_64 rng_;
    std::map<std::string, double> last_prices_;

    std::atomic<std::uint64_t> requests_{0};
    std::atomic<std::uint64_t> failures_{0};
};

#endif // SIMULATEDQUOTEFEED_HPP
