#include "CacheStats.hpp"

#include <sstream>

CacheStats CacheStatsCollector::snapshot() const {
    CacheStats stats;
    stats.total_gets = total_gets_.load(std::memory_order_relaxed);
    stats.hits = hits_.load(std::memory_order_relaxed);
    stats.misses = misses_.load(std::memory_order_relaxed);
    stats.stale_hits = stale_hits_.load(std::memory_order_relaxed);
    stats.coalesced_requests = coalesced_requests_.load(std::memory_order_relaxed);
    stats.background_refreshes = background_refreshes_.load(std::memory_order_relaxed);
    stats.refresh_errors = refresh_errors_.load(std::memory_order_relaxed);
    stats.hit_ratio = stats.total_gets > 0
        ? static_cast<double>(stats.hits) / static_cast<double>(stats.total_gets)
        : 0.0;
    return stats;
}

void CacheStatsCollector::reset() {
    total_gets_.store(0);
    hits_.store(0);
    misses_.store(0);
    stale_hits_.store(0);
    coalesced_requests_.store(0);
    background_refreshes_.store(0);
    refresh_errors_.store(0);
}

std::string CacheStats::to_string() const {
    std::stringstream ss;
    ss << "total_gets=" << total_gets
        << " hits=" << hits
        << " misses=" << misses
        << " stale_hits=" << stale_hits
        << " hit_ratio=" << hit_ratio
        << " coalesced_requests=" << coalesced_requests
        << " background_refreshes=" << background_refreshes
        << " refresh_errors=" << refresh_errors
        << " size=" << size << "/" << max_size
        << " active_refreshes=" << active_refreshes;
    return ss.str();
}

void to_json(json& j, const CacheStats& stats) {
    j = json{
        {"totalGets", stats.total_gets},
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"staleHits", stats.stale_hits},
        {"hitRatio", stats.hit_ratio},
        {"size", stats.size},
        {"maxSize", stats.max_size},
        {"activeRefreshes", stats.active_refreshes},
        {"coalescedRequests", stats.coalesced_requests},
        {"backgroundRefreshes", stats.background_refreshes},
        {"refreshErrors", stats.refresh_errors}
    };
}
