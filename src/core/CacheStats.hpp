#ifndef CACHESTATS_HPP
#define CACHESTATS_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Point-in-time view returned by getStats().
struct CacheStats {
    std::uint64_t total_gets = 0;
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t stale_hits = 0;
    std::uint64_t coalesced_requests = 0;
    std::uint64_t background_refreshes = 0;
    std::uint64_t refresh_errors = 0;

    // hits / total_gets, 0 when nothing was read yet
    double hit_ratio = 0.0;

    // Live values, not affected by resetStats()
    std::size_t size = 0;
    std::size_t max_size = 0;
    std::size_t active_refreshes = 0;

    std::string to_string() const;
};

void to_json(json& j, const CacheStats& stats);

// Counters behind CacheStats. Each counter is independent; a snapshot taken
// while gets are running may be mid-update across counters.
class CacheStatsCollector {
public:
    void recordGet() { total_gets_.fetch_add(1, std::memory_order_relaxed); }
    void recordHit() { hits_.fetch_add(1, std::memory_order_relaxed); }
    void recordMiss() { misses_.fetch_add(1, std::memory_order_relaxed); }
    void recordStaleHit() { stale_hits_.fetch_add(1, std::memory_order_relaxed); }
    void recordCoalesced() { coalesced_requests_.fetch_add(1, std::memory_order_relaxed); }
    void recordBackgroundRefresh() { background_refreshes_.fetch_add(1, std::memory_order_relaxed); }
    void recordRefreshError() { refresh_errors_.fetch_add(1, std::memory_order_relaxed); }

    // Fills the counter fields and hit_ratio; the live fields are left to the caller.
    CacheStats snapshot() const;
    void reset();

private:
    std::atomic<std::uint64_t> total_gets_{0};
    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> stale_hits_{0};
    std::atomic<std::uint64_t> coalesced_requests_{0};
    std::atomic<std::uint64_t> background_refreshes_{0};
    std::atomic<std::uint64_t> refresh_errors_{0};
};

#endif // CACHESTATS_HPP
