// test/test_request_coalescer.cpp
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

#include "../src/core/RequestCoalescer.hpp"

namespace {
    void noCommit(const int&) {}
}

TEST(RequestCoalescerTest, FirstCallerLeadsSecondFollows) {
    RequestCoalescer<int> coalescer;
    auto leader = coalescer.acquire("AAPL");
    auto follower = coalescer.acquire("AAPL");
    EXPECT_TRUE(leader.isLeader());
    EXPECT_FALSE(follower.isLeader());
    EXPECT_TRUE(coalescer.isInFlight("AAPL"));
    EXPECT_EQ(coalescer.inFlight(), 1u);

    int result = coalescer.execute("AAPL", leader, [](const std::string&) { return 42; }, noCommit);
    EXPECT_EQ(result, 42);
    EXPECT_EQ(coalescer.await(follower), 42);
    EXPECT_FALSE(coalescer.isInFlight("AAPL"));
}

TEST(RequestCoalescerTest, DifferentKeysDoNotShareFlights) {
    RequestCoalescer<int> coalescer;
    auto a = coalescer.acquire("AAPL");
    auto b = coalescer.acquire("MSFT");
    EXPECT_TRUE(a.isLeader());
    EXPECT_TRUE(b.isLeader());
    EXPECT_EQ(coalescer.inFlight(), 2u);
}

TEST(RequestCoalescerTest, ConcurrentCallersShareOneLoad) {
    RequestCoalescer<std::string> coalescer;
    std::atomic<int> loads{0};
    std::atomic<int> joined{0};
    // Holds the load open until every caller has a ticket
    const auto loader = [&loads, &joined](const std::string& key) {
        loads.fetch_add(1);
        while (joined.load() < 10) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return "value:" + key;
    };

    std::vector<std::future<std::string>> results;
    for (int i = 0; i < 10; ++i) {
        results.push_back(std::async(std::launch::async, [&coalescer, &loader, &joined]() {
            auto ticket = coalescer.acquire("SPY");
            joined.fetch_add(1);
            if (!ticket.isLeader()) {
                return coalescer.await(ticket);
            }
            return coalescer.execute("SPY", ticket, loader, [](const std::string&) {});
        }));
    }
    for (auto& result : results) {
        EXPECT_EQ(result.get(), "value:SPY");
    }
    EXPECT_EQ(loads.load(), 1);
    EXPECT_EQ(coalescer.inFlight(), 0u);
}

TEST(RequestCoalescerTest, FailureReachesLeaderAndFollowers) {
    RequestCoalescer<int> coalescer;
    auto leader = coalescer.acquire("TSLA");
    auto follower = coalescer.acquire("TSLA");
    bool committed = false;

    EXPECT_THROW(coalescer.execute("TSLA", leader,
                                   [](const std::string&) -> int { throw std::runtime_error("429"); },
                                   [&committed](const int&) { committed = true; }),
                 std::runtime_error);
    EXPECT_THROW(coalescer.await(follower), std::runtime_error);
    EXPECT_FALSE(committed);
    EXPECT_FALSE(coalescer.isInFlight("TSLA"));
}

TEST(RequestCoalescerTest, CommitHappensBeforeFollowersSeeTheValue) {
    RequestCoalescer<int> coalescer;
    auto leader = coalescer.acquire("NVDA");
    auto follower = coalescer.acquire("NVDA");
    std::atomic<bool> committed{false};

    auto waiter = std::async(std::launch::async, [&coalescer, &follower, &committed]() {
        int value = coalescer.await(follower);
        return committed.load() ? value : -1;
    });
    coalescer.execute("NVDA", leader, [](const std::string&) { return 1; },
                      [&committed](const int&) { committed.store(true); });

    EXPECT_EQ(waiter.get(), 1);
    EXPECT_FALSE(coalescer.isInFlight("NVDA"));
}

TEST(RequestCoalescerTest, ForgottenFlightIsNotCommitted) {
    RequestCoalescer<int> coalescer;
    auto leader = coalescer.acquire("META");
    auto follower = coalescer.acquire("META");
    EXPECT_TRUE(coalescer.forget("META"));
    EXPECT_FALSE(coalescer.forget("META"));

    // A new caller starts a fresh flight
    auto fresh = coalescer.acquire("META");
    EXPECT_TRUE(fresh.isLeader());

    bool committed = false;
    int result = coalescer.execute("META", leader, [](const std::string&) { return 7; },
                                   [&committed](const int&) { committed = true; });
    EXPECT_EQ(result, 7);
    EXPECT_EQ(coalescer.await(follower), 7);
    EXPECT_FALSE(committed);
    // The old leader must not release the fresh flight
    EXPECT_TRUE(coalescer.isInFlight("META"));
}

TEST(RequestCoalescerTest, ForgetAllDetachesEveryFlight) {
    RequestCoalescer<int> coalescer;
    coalescer.acquire("a");
    coalescer.acquire("b");
    coalescer.forgetAll();
    EXPECT_EQ(coalescer.inFlight(), 0u);
}

TEST(RequestCoalescerTest, AbandonFailsWaiters) {
    RequestCoalescer<int> coalescer;
    auto leader = coalescer.acquire("AMZN");
    auto follower = coalescer.acquire("AMZN");
    coalescer.abandon("AMZN", leader, std::make_exception_ptr(std::runtime_error("shut down")));
    EXPECT_THROW(coalescer.await(follower), std::runtime_error);
    EXPECT_FALSE(coalescer.isInFlight("AMZN"));
}
