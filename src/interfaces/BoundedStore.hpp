#ifndef BOUNDEDSTORE_HPP
#define BOUNDEDSTORE_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "../cache/CacheEntry.hpp"

// Capacity-limited key/value container underneath the cache.
// The store never decides staleness: entries stay readable past their
// nominal expiry until they are removed or evicted.
template <typename T>
class BoundedStore {
public:
    using EntryPtr = std::shared_ptr<CacheEntry<T>>;

    virtual ~BoundedStore() = default;

    // Returns nullptr when the key is absent. Counts as a use for eviction.
    virtual EntryPtr get(const std::string& key) = 0;
    // Like get(), but leaves the eviction order untouched.
    virtual EntryPtr peek(const std::string& key) const = 0;
    // Inserts or overwrites. May evict another entry to stay within maxSize().
    virtual void set(const std::string& key, EntryPtr entry) = 0;
    // Existence check only, does not count as a use.
    virtual bool has(const std::string& key) const = 0;
    virtual bool remove(const std::string& key) = 0;
    virtual void clear() = 0;
    virtual std::size_t size() const = 0;
    virtual std::size_t maxSize() const = 0;
    virtual std::vector<std::string> keys() const = 0;
};

#endif // BOUNDEDSTORE_HPP
