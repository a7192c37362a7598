#include "JitterPolicy.hpp"

#include <random>
#include <sstream>

#include "../config/CacheConfig.hpp"

namespace {
    // One generator per thread; readers never contend on it.
    std::mt19937_64& thread_rng() {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        return rng;
    }
}

JitterPolicy::JitterPolicy(double min_jitter, double max_jitter)
    : min_jitter_(min_jitter), max_jitter_(max_jitter) {
    if (!(min_jitter_ > 0.0) || min_jitter_ > max_jitter_) {
        std::stringstream ss;
        ss << "Invalid jitter range [" << min_jitter_ << ", " << max_jitter_ << "]";
        throw ConfigurationError(ss.str());
    }
}

double JitterPolicy::sampleFactor() const {
    if (min_jitter_ == max_jitter_) {
        return min_jitter_;
    }
    std::uniform_real_distribution<double> dist(min_jitter_, max_jitter_);
    return dist(thread_rng());
}

std::chrono::steady_clock::time_point JitterPolicy::jitteredExpiry(
    std::chrono::steady_clock::time_point created_at,
    std::chrono::milliseconds ttl) const {
    const std::chrono::duration<double, std::milli> jittered_ttl(ttl.count() * sampleFactor());
    return created_at + std::chrono::duration_cast<std::chrono::steady_clock::duration>(jittered_ttl);
}
