#ifndef JITTERPOLICY_HPP
#define JITTERPOLICY_HPP

#include <chrono>

// Probabilistic early expiration. Every call draws a fresh multiplier in
// [min_jitter, max_jitter] so readers of entries written at the same instant
// do not all see them expire at the same instant.
class JitterPolicy {
public:
    // Throws ConfigurationError unless 0 < min_jitter <= max_jitter.
    JitterPolicy(double min_jitter, double max_jitter);

    double minJitter() const { return min_jitter_; }
    double maxJitter() const { return max_jitter_; }

    double sampleFactor() const;

    std::chrono::steady_clock::time_point jitteredExpiry(
        std::chrono::steady_clock::time_point created_at,
        std::chrono::milliseconds ttl) const;

private:
    double min_jitter_;
    double max_jitter_;
};

#endif // JITTERPOLICY_HPP
