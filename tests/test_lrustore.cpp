// test/test_lrustore.cpp
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

#include "../src/cache/LruStore.hpp"

namespace {
    std::shared_ptr<CacheEntry<std::string>> makeEntry(const std::string& value,
                                                       std::chrono::milliseconds ttl = std::chrono::milliseconds(60000)) {
        return std::make_shared<CacheEntry<std::string>>(value, ttl);
    }
}

TEST(LruStoreTest, SetAndGet) {
    LruStore<std::string> store(10);
    std::string key = "AAPL";
    std::string value = R"({"price":189.5})";

    store.set(key, makeEntry(value));
    auto retrieved = store.get(key);
    ASSERT_NE(retrieved, nullptr);
    EXPECT_EQ(retrieved->value(), value);
}

TEST(LruStoreTest, GetNonExistent) {
    LruStore<std::string> store(10);
    EXPECT_EQ(store.get("MSFT"), nullptr);
}

TEST(LruStoreTest, KeepsEntriesPastExpiry) {
    LruStore<std::string> store(10);
    store.set("TSLA", makeEntry("stale", std::chrono::milliseconds(1)));

    // Wait for longer than the TTL
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    auto retrieved = store.get("TSLA");
    ASSERT_NE(retrieved, nullptr);
    EXPECT_EQ(retrieved->value(), "stale");
}

TEST(LruStoreTest, OverwriteEntry) {
    LruStore<std::string> store(10);
    std::string key = "NVDA";

    store.set(key, makeEntry("old"));
    ASSERT_NE(store.get(key), nullptr);
    EXPECT_EQ(store.get(key)->value(), "old");

    store.set(key, makeEntry("new")); // Overwrite
    EXPECT_EQ(store.get(key)->value(), "new");
    EXPECT_EQ(store.size(), 1u);
}

TEST(LruStoreTest, RemoveEntry) {
    LruStore<std::string> store(10);
    std::string key = "META";

    store.set(key, makeEntry("to be removed"));
    EXPECT_TRUE(store.has(key));
    EXPECT_TRUE(store.remove(key));
    EXPECT_FALSE(store.has(key));
    EXPECT_FALSE(store.remove(key)); // Second remove is a no-op
}

TEST(LruStoreTest, ClearStore) {
    LruStore<std::string> store(10);
    store.set("AMZN", makeEntry("a"));
    store.set("GOOGL", makeEntry("b"));
    EXPECT_TRUE(store.has("AMZN"));
    EXPECT_TRUE(store.has("GOOGL"));

    store.clear();
    EXPECT_FALSE(store.has("AMZN"));
    EXPECT_FALSE(store.has("GOOGL"));
    EXPECT_EQ(store.size(), 0u);
    EXPECT_TRUE(store.keys().empty());
}

TEST(LruStoreTest, EvictsLeastRecentlyUsed) {
    LruStore<std::string> store(2);
    store.set("a", makeEntry("1"));
    store.set("b", makeEntry("2"));

    // "a" becomes the most recently used, so "b" is the one to go
    ASSERT_NE(store.get("a"), nullptr);
    store.set("c", makeEntry("3"));

    EXPECT_EQ(store.size(), 2u);
    EXPECT_TRUE(store.has("a"));
    EXPECT_FALSE(store.has("b"));
    EXPECT_TRUE(store.has("c"));
}

TEST(LruStoreTest, OverwriteAtCapacityDoesNotEvict) {
    LruStore<std::string> store(2);
    store.set("a", makeEntry("1"));
    store.set("b", makeEntry("2"));
    store.set("a", makeEntry("1b"));

    EXPECT_EQ(store.size(), 2u);
    EXPECT_TRUE(store.has("a"));
    EXPECT_TRUE(store.has("b"));
}

TEST(LruStoreTest, HasDoesNotChangeRecency) {
    LruStore<std::string> store(2);
    store.set("a", makeEntry("1"));
    store.set("b", makeEntry("2"));

    EXPECT_TRUE(store.has("a"));
    store.set("c", makeEntry("3"));

    EXPECT_FALSE(store.has("a"));
    EXPECT_TRUE(store.has("b"));
}

TEST(LruStoreTest, PeekDoesNotChangeRecency) {
    LruStore<std::string> store(2);
    store.set("a", makeEntry("1"));
    store.set("b", makeEntry("2"));

    auto peeked = store.peek("a");
    ASSERT_NE(peeked, nullptr);
    EXPECT_EQ(peeked->value(), "1");
    EXPECT_EQ(store.peek("missing"), nullptr);

    // "a" is still the least recently used
    store.set("c", makeEntry("3"));
    EXPECT_FALSE(store.has("a"));
    EXPECT_TRUE(store.has("b"));
}

TEST(LruStoreTest, KeysMostRecentFirst) {
    LruStore<std::string> store(5);
    store.set("a", makeEntry("1"));
    store.set("b", makeEntry("2"));
    store.set("c", makeEntry("3"));
    store.get("a");

    std::vector<std::string> expected = {"a", "c", "b"};
    EXPECT_EQ(store.keys(), expected);
}

TEST(LruStoreTest, RejectsZeroCapacity) {
    EXPECT_THROW(LruStore<std::string> store(0), std::invalid_argument);
}

TEST(LruStoreTest, ConcurrentWritersStayWithinCapacity) {
    LruStore<int> store(50);
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&store, t]() {
            for (int i = 0; i < 200; ++i) {
                std::string key = std::to_string(t) + ":" + std::to_string(i);
                store.set(key, std::make_shared<CacheEntry<int>>(i, std::chrono::milliseconds(1000)));
                store.get(key);
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    EXPECT_EQ(store.size(), 50u);
    EXPECT_EQ(store.keys().size(), 50u);
}
