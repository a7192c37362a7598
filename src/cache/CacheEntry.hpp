#ifndef CACHEENTRY_HPP
#define CACHEENTRY_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <mutex>
#include <utility>

// A cached value plus the bookkeeping the stampede protection needs.
// value, createdAt, ttl and expiresAt never change after construction.
template <typename T>
class CacheEntry {
public:
    using Clock = std::chrono::steady_clock;

    CacheEntry(T value, std::chrono::milliseconds ttl, Clock::time_point created_at = Clock::now())
        : value_(std::move(value)),
          created_at_(created_at),
          ttl_(ttl),
          expires_at_(created_at + ttl),
          access_count_(0),
          last_accessed_at_(created_at),
          is_refreshing_(false) {}

    CacheEntry(const CacheEntry&) = delete;
    CacheEntry& operator=(const CacheEntry&) = delete;

    const T& value() const { return value_; }
    Clock::time_point createdAt() const { return created_at_; }
    std::chrono::milliseconds ttl() const { return ttl_; }
    // Nominal deadline. Freshness checks apply jitter on top of ttl instead.
    Clock::time_point expiresAt() const { return expires_at_; }

    std::uint64_t accessCount() const { return access_count_.load(); }

    Clock::time_point lastAccessedAt() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_accessed_at_;
    }

    void recordAccess(Clock::time_point now) {
        access_count_.fetch_add(1);
        std::lock_guard<std::mutex> lock(mutex_);
        last_accessed_at_ = now;
    }

    bool isRefreshing() const { return is_refreshing_.load(); }

    // Returns false if a refresh was already marked.
    bool markRefreshing() {
        bool expected = false;
        return is_refreshing_.compare_exchange_strong(expected, true);
    }

    void clearRefreshing() { is_refreshing_.store(false); }

    std::exception_ptr lastError() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_error_;
    }

    void recordError(std::exception_ptr error) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = std::move(error);
    }

private:
    const T value_;
    const Clock::time_point created_at_;
    const std::chrono::milliseconds ttl_;
    const Clock::time_point expires_at_;

    std::atomic<std::uint64_t> access_count_;
    mutable std::mutex mutex_; // last_accessed_at_, last_error_
    Clock::time_point last_accessed_at_;
    std::exception_ptr last_error_;
    std::atomic<bool> is_refreshing_;
};

#endif // CACHEENTRY_HPP
