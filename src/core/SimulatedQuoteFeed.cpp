#include "SimulatedQuoteFeed.hpp"

#include <algorithm>
#include <thread>

SimulatedQuoteFeed::SimulatedQuoteFeed(std::chrono::milliseconds latency, double failure_rate, std::shared_ptr<ILogger> logger)
    : latency_(latency),
    failure_rate_(failure_rate),
    logger_(logger),
    rng_(std::random_device{}()) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for SimulatedQuoteFeed");
    }
    if (failure_rate_ < 0.0 || failure_rate_ > 1.0) {
        throw std::invalid_argument("failure_rate must be within [0, 1]");
    }
}

Quote SimulatedQuoteFeed::fetch(const std::string& symbol) {
    const std::uint64_t sequence = requests_.fetch_add(1) + 1;
    std::this_thread::sleep_for(latency_);

    bool fail = false;
    double price = 0.0;
    std::uint64_t volume = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_real_distribution<double> coin(0.0, 1.0);
        fail = failure_rate_ > 0.0 && coin(rng_) < failure_rate_;
        if (!fail) {
            price = nextPrice(symbol);
            std::uniform_int_distribution<std::uint64_t> volume_dist(100, 100000);
            volume = volume_dist(rng_);
        }
    }

    if (fail) {
        failures_.fetch_add(1);
        logger_->debug("Quote feed rejected request for " + symbol);
        throw QuoteFeedError("429 Too Many Requests for " + symbol);
    }

    Quote quote;
    quote.symbol = symbol;
    quote.price = price;
    quote.volume = volume;
    quote.sequence = sequence;
    return quote;
}

// Caller holds mutex_. Random walk around a per-symbol starting price.
double SimulatedQuoteFeed::nextPrice(const std::string& symbol) {
    auto it = last_prices_.find(symbol);
    if (it == last_prices_.end()) {
        std::uniform_real_distribution<double> start(20.0, 500.0);
        it = last_prices_.emplace(symbol, start(rng_)).first;
    }
    std::normal_distribution<double> step(0.0, 0.002);
    it->second = std::max(0.01, it->second * (1.0 + step(rng_)));
    return it->second;
}
