#ifndef LRUSTORE_HPP
#define LRUSTORE_HPP

#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "CacheEntry.hpp"
#include "../interfaces/BoundedStore.hpp"

// Default in-process store. Keeps entries regardless of age and evicts the
// least recently used key once max_size is reached.
template <typename T>
class LruStore : public BoundedStore<T> {
public:
    using EntryPtr = typename BoundedStore<T>::EntryPtr;

    explicit LruStore(std::size_t max_size) : max_size_(max_size) {
        if (max_size_ == 0) {
            throw std::invalid_argument("LruStore max_size must be greater than zero");
        }
    }

    ~LruStore() override = default;

    EntryPtr get(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto lru_it = lru_map_.find(key);
        if (lru_it == lru_map_.end()) {
            return nullptr;
        }
        // Move accessed key to the front (most recent)
        lru_list_.splice(lru_list_.begin(), lru_list_, lru_it->second);
        return cache_[key];
    }

    EntryPtr peek(const std::string& key) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        return it == cache_.end() ? nullptr : it->second;
    }

    void set(const std::string& key, EntryPtr entry) override {
        std::lock_guard<std::mutex> lock(mutex_);

        // --- LRU Logic ---
        auto lru_it = lru_map_.find(key);
        if (lru_it != lru_map_.end()) {
            // Overwrite keeps the slot, only its position changes
            lru_list_.erase(lru_it->second);
        } else {
            evictIfNeeded();
        }

        cache_[key] = std::move(entry);
        lru_list_.push_front(key);
        lru_map_[key] = lru_list_.begin();
        // --- End LRU Logic ---
    }

    bool has(const std::string& key) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.find(key) != cache_.end();
    }

    bool remove(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto lru_it = lru_map_.find(key);
        if (lru_it == lru_map_.end()) {
            return false;
        }
        lru_list_.erase(lru_it->second);
        lru_map_.erase(lru_it);
        cache_.erase(key);
        return true;
    }

    void clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_.clear();
        lru_list_.clear();
        lru_map_.clear();
    }

    std::size_t size() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.size();
    }

    std::size_t maxSize() const override { return max_size_; }

    // Most recently used first.
    std::vector<std::string> keys() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<std::string>(lru_list_.begin(), lru_list_.end());
    }

private:
    // Caller holds mutex_
    void evictIfNeeded() {
        while (lru_map_.size() >= max_size_ && !lru_list_.empty()) {
            std::string oldest_key = lru_list_.back();
            lru_list_.pop_back();
            lru_map_.erase(oldest_key);
            cache_.erase(oldest_key);
        }
    }

    std::unordered_map<std::string, EntryPtr> cache_;
    std::list<std::string> lru_list_; // front = most recent, back = least recent
    std::unordered_map<std::string, std::list<std::string>::iterator> lru_map_;

    mutable std::mutex mutex_;
    const std::size_t max_size_;
};

#endif // LRUSTORE_HPP
