#ifndef STAMPEDEPROTECTEDCACHE_HPP
#define STAMPEDEPROTECTEDCACHE_HPP

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "CacheStats.hpp"
#include "JitterPolicy.hpp"
#include "RefreshScheduler.hpp"
#include "RequestCoalescer.hpp"
#include "../cache/CacheEntry.hpp"
#include "../cache/LruStore.hpp"
#include "../config/AppConfig.hpp" // For LogUtils, MetricsDefinitions
#include "../config/CacheConfig.hpp"
#include "../interfaces/BoundedStore.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../logging/NullLogger.hpp"
#include "../metrics/DummyStatsDClient.hpp"

/**
 * Cache that protects a rate-limited data source from request bursts.
 *
 * Three mechanisms work together on every get():
 *  - request coalescing: concurrent loads of one key share a single loader call,
 *  - stale-while-revalidate: an expired value is still served during a grace
 *    window while a background task reloads it,
 *  - probabilistic early expiration: freshness is checked against a TTL
 *    scaled by a random factor drawn anew on each read.
 *
 * One instance per logical cache, constructed by the host and passed to the
 * code that needs it. Safe to call from any number of threads.
 */
template <typename T>
class StampedeProtectedCache {
public:
    using Clock = std::chrono::steady_clock;
    using Entry = CacheEntry<T>;
    using EntryPtr = std::shared_ptr<Entry>;
    // Fetches the value for a key. May block and may throw.
    using Loader = std::function<T(const std::string&)>;

    explicit StampedeProtectedCache(const CacheConfig& config)
        : StampedeProtectedCache(config, std::make_shared<NullLogger>()) {}

    // Throws ConfigurationError for invalid options or a null logger/metrics sink.
    StampedeProtectedCache(
        const CacheConfig& config,
        std::shared_ptr<ILogger> logger,
        std::shared_ptr<IStatsDClient> statsd_client = std::make_shared<DummyStatsDClient>(),
        std::unique_ptr<BoundedStore<T>> store = nullptr)
        : config_(config.resolved()),
        logger_(requireNonNull(std::move(logger), "Logger")),
        statsd_client_(requireNonNull(std::move(statsd_client), "StatsDClient")),
        store_(store ? std::move(store) : std::make_unique<LruStore<T>>(config_.max_size)),
        jitter_(config_.min_jitter, config_.max_jitter) {
        if (config_.enable_background_refresh) {
            scheduler_ = std::make_unique<RefreshScheduler>(config_.background_refresh_threads, logger_);
        }

        std::stringstream ss;
        ss << "StampedeProtectedCache initialized: max_size=" << store_->maxSize()
            << ", default_ttl=" << config_.default_ttl.count() << "ms"
            << ", stale_while_revalidate_ttl=" << config_.staleWhileRevalidateTtl().count() << "ms"
            << ", jitter_range=[" << config_.min_jitter << ", " << config_.max_jitter << "]"
            << ", background_refresh=" << std::boolalpha << config_.enable_background_refresh;
        logger_->info(ss.str());
    }

    // Waits for in-flight background refreshes; they reference this instance.
    ~StampedeProtectedCache() {
        if (scheduler_) {
            scheduler_->shutdown();
        }
    }

    StampedeProtectedCache(const StampedeProtectedCache&) = delete;
    StampedeProtectedCache& operator=(const StampedeProtectedCache&) = delete;
    StampedeProtectedCache(StampedeProtectedCache&&) = delete;
    StampedeProtectedCache& operator=(StampedeProtectedCache&&) = delete;

    /**
     * Returns the value for key, loading it if necessary.
     *
     * Fresh hit: cached value, loader not called. Stale hit (expired but inside
     * the grace window and not already refreshing): cached value returned
     * immediately, reload scheduled in the background when enabled. Miss:
     * blocks on a coalesced load; the loader's exception propagates unchanged.
     *
     * ttl applies to the value stored by this call's load, default_ttl if unset.
     */
    T get(const std::string& key, const Loader& loader, std::optional<std::chrono::milliseconds> ttl = std::nullopt) {
        stats_.recordGet();
        const auto effective_ttl = ttl.value_or(config_.default_ttl);
        const auto now = Clock::now();

        EntryPtr cached = store_->get(key);
        if (cached) {
            cached->recordAccess(now);

            if (now < jitter_.jitteredExpiry(cached->createdAt(), cached->ttl())) {
                stats_.recordHit();
                statsd_client_->increment(MetricsDefinitions::CACHE_HIT);
                if (isDebugEnabled()) {
                    logger_->debug("Cache hit (fresh) for key: " + key + ", age: " + millisBetween(cached->createdAt(), now) + "ms");
                }
                return cached->value();
            }

            const auto stale_deadline = cached->createdAt() + config_.staleWhileRevalidateTtl();
            if (now < stale_deadline && claimStaleHit(*cached)) {
                stats_.recordStaleHit();
                statsd_client_->increment(MetricsDefinitions::CACHE_STALE_HIT);
                if (isDebugEnabled()) {
                    logger_->debug("Cache hit (stale-while-revalidate) for key: " + key
                        + ", age: " + millisBetween(cached->createdAt(), now)
                        + "ms, stale for: " + millisBetween(cached->expiresAt(), now) + "ms");
                }
                if (config_.enable_background_refresh) {
                    refreshInBackground(key, cached, loader, effective_ttl);
                }
                return cached->value();
            }
        }

        stats_.recordMiss();
        statsd_client_->increment(MetricsDefinitions::CACHE_MISS);
        if (isDebugEnabled()) {
            logger_->debug("Cache miss for key: " + key + (cached ? " (expired entry present)" : ""));
        }
        return loadWithCoalescing(key, loader, effective_ttl);
    }

    // Stores value as a fresh entry. Bypasses coalescing; a load already in
    // flight for key will overwrite it when it completes.
    void set(const std::string& key, T value, std::optional<std::chrono::milliseconds> ttl = std::nullopt) {
        const auto effective_ttl = ttl.value_or(config_.default_ttl);
        store_->set(key, std::make_shared<Entry>(std::move(value), effective_ttl));
        if (isDebugEnabled()) {
            logger_->debug("Cache set for key: " + key + ", ttl: " + std::to_string(effective_ttl.count()) + "ms");
        }
    }

    // True if an entry exists, fresh or stale. Touches no statistics.
    bool has(const std::string& key) const {
        return store_->has(key);
    }

    // Removes the entry and detaches any load in flight for key, so its
    // result is not written back.
    // Detaches before deleting: a load finishing in between must not write
    // its value back after the delete.
    bool remove(const std::string& key) {
        if (coalescer_.forget(key)) {
            logger_->debug("Detached in-flight load for key: " + key);
        }
        const bool removed = store_->remove(key);
        if (removed) {
            logger_->debug("Cache entry deleted for key: " + key);
        }
        return removed;
    }

    bool invalidate(const std::string& key) {
        return remove(key);
    }

    void clear() {
        coalescer_.forgetAll();
        const std::size_t size_before = store_->size();
        store_->clear();
        logger_->info("Cache cleared, entries removed: " + std::to_string(size_before));
    }

    // Most recently used first, fresh and stale alike.
    std::vector<std::string> keys() const {
        return store_->keys();
    }

    std::size_t size() const {
        return store_->size();
    }

    CacheStats getStats() const {
        CacheStats stats = stats_.snapshot();
        stats.size = store_->size();
        stats.max_size = store_->maxSize();
        stats.active_refreshes = coalescer_.inFlight();
        return stats;
    }

    void resetStats() {
        stats_.reset();
    }

    // Entry bookkeeping for diagnostics; nullptr when absent.
    // Leaves statistics, access counts and eviction order alone.
    EntryPtr inspect(const std::string& key) const {
        return store_->peek(key);
    }

    const CacheConfig& config() const { return config_; }

private:
    template <typename P>
    static P requireNonNull(P ptr, const std::string& what) {
        if (!ptr) {
            throw ConfigurationError(what + " cannot be null for StampedeProtectedCache");
        }
        return ptr;
    }

    // Clears the refresh mark however the refresh task ends.
    class RefreshMarkGuard {
    public:
        explicit RefreshMarkGuard(EntryPtr entry) : entry_(std::move(entry)) {}
        ~RefreshMarkGuard() { entry_->clearRefreshing(); }

        RefreshMarkGuard(const RefreshMarkGuard&) = delete;
        RefreshMarkGuard& operator=(const RefreshMarkGuard&) = delete;

    private:
        EntryPtr entry_;
    };

    bool isDebugEnabled() const {
        return logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG;
    }

    static std::string millisBetween(Clock::time_point from, Clock::time_point to) {
        return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count());
    }

    // With background refresh on, claiming the stale hit also marks the entry
    // refreshing, atomically, so only one caller schedules the reload.
    bool claimStaleHit(Entry& entry) {
        if (config_.enable_background_refresh) {
            return entry.markRefreshing();
        }
        return !entry.isRefreshing();
    }

    T loadWithCoalescing(const std::string& key, const Loader& loader, std::chrono::milliseconds ttl) {
        auto ticket = coalescer_.acquire(key);
        if (!ticket.isLeader()) {
            recordCoalesced(key);
            return coalescer_.await(ticket);
        }
        return runLoad(key, ticket, loader, ttl);
    }

    T runLoad(const std::string& key,
              const typename RequestCoalescer<T>::Ticket& ticket,
              const Loader& loader,
              std::chrono::milliseconds ttl) {
        return coalescer_.execute(
            key,
            ticket,
            [this, &loader](const std::string& k) { return loadAndRecord(k, loader); },
            [this, &key, ttl](const T& value) {
                store_->set(key, std::make_shared<Entry>(value, ttl));
            });
    }

    // Calls the loader with timing and failure bookkeeping. Rethrows unchanged.
    T loadAndRecord(const std::string& key, const Loader& loader) {
        const auto start_time = Clock::now();
        logger_->debug("Loading data for key: " + key);
        try {
            T value = loader(key);
            const auto load_time = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_time);
            statsd_client_->timing(MetricsDefinitions::LOAD_TIME, load_time);
            if (isDebugEnabled()) {
                logger_->debug("Data loaded for key: " + key + ", load time: " + std::to_string(load_time.count()) + "ms");
            }
            return value;
        } catch (const std::exception& e) {
            recordLoadFailure(key, start_time, e.what());
            throw;
        } catch (...) {
            recordLoadFailure(key, start_time, "non-standard exception");
            throw;
        }
    }

    // Caller is inside a catch block; std::current_exception() is the failure.
    void recordLoadFailure(const std::string& key, Clock::time_point start_time, const std::string& reason) {
        stats_.recordRefreshError();
        statsd_client_->increment(MetricsDefinitions::REFRESH_ERROR);
        logger_->error("Failed to load data for key: " + key + ": " + reason
            + " (load time: " + millisBetween(start_time, Clock::now()) + "ms)");
        if (EntryPtr existing = inspect(key)) {
            existing->recordError(std::current_exception());
        }
    }

    void recordCoalesced(const std::string& key) {
        stats_.recordCoalesced();
        statsd_client_->increment(MetricsDefinitions::REQUEST_COALESCED);
        logger_->debug("Request coalesced for key: " + key);
    }

    // entry is already marked refreshing. The flight is registered here, on
    // the caller's thread, so the mark never exists without a pending load.
    // A load already in flight for key is reused instead of queueing a task
    // that would only block a pool thread waiting for it.
    void refreshInBackground(const std::string& key, EntryPtr entry, const Loader& loader, std::chrono::milliseconds ttl) {
        auto ticket = coalescer_.acquire(key);
        if (!ticket.isLeader()) {
            recordCoalesced(key);
            entry->clearRefreshing();
            return;
        }

        const bool scheduled = scheduler_->schedule([this, key, entry, loader, ttl, ticket]() {
            RefreshMarkGuard guard(entry);
            try {
                runLoad(key, ticket, loader, ttl);
                stats_.recordBackgroundRefresh();
                statsd_client_->increment(MetricsDefinitions::BACKGROUND_REFRESH);
                logger_->debug("Background refresh completed for key: " + key);
            } catch (const std::exception& e) {
                logger_->warn("Background refresh failed for key: " + key + ": " + e.what());
            } catch (...) {
                logger_->warn("Background refresh failed for key: " + key + ": non-standard exception");
            }
        });

        if (!scheduled) {
            entry->clearRefreshing();
            coalescer_.abandon(key, ticket,
                std::make_exception_ptr(std::runtime_error("Background refresh scheduler is shut down")));
            logger_->warn("Background refresh not scheduled for key: " + key);
        }
    }

    const CacheConfig config_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::unique_ptr<BoundedStore<T>> store_;
    JitterPolicy jitter_;
    CacheStatsCollector stats_;
    RequestCoalescer<T> coalescer_;
    std::unique_ptr<RefreshScheduler> scheduler_;
};

template <typename T>
std::unique_ptr<StampedeProtectedCache<T>> makeStampedeProtectedCache(
    const CacheConfig& config,
    std::shared_ptr<ILogger> logger = std::make_shared<NullLogger>(),
    std::shared_ptr<IStatsDClient> statsd_client = std::make_shared<DummyStatsDClient>()) {
    return std::make_unique<StampedeProtectedCache<T>>(config, std::move(logger), std::move(statsd_client));
}

#endif // STAMPEDEPROTECTEDCACHE_HPP
