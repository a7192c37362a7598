// test/test_refresh_scheduler.cpp
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "../src/core/RefreshScheduler.hpp"
#include "../src/interfaces/ILogger.hpp"

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;

namespace {
    class MockLogger : public ILogger {
    public:
        MOCK_METHOD(void, info, (const std::string& message), (override));
        MOCK_METHOD(void, debug, (const std::string& message), (override));
        MOCK_METHOD(void, warn, (const std::string& message), (override));
        MOCK_METHOD(void, error, (const std::string& message), (override));
        MOCK_METHOD(void, setup, (const std::string& message), (override));
        MOCK_METHOD(int, getLogLevel, (), (override));
    };
}

TEST(RefreshSchedulerTest, RunsScheduledTasks) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    std::atomic<int> runs{0};
    {
        RefreshScheduler scheduler(2, logger);
        EXPECT_EQ(scheduler.threadCount(), 2u);
        for (int i = 0; i < 10; ++i) {
            EXPECT_TRUE(scheduler.schedule([&runs]() { runs.fetch_add(1); }));
        }
        scheduler.shutdown();
        EXPECT_EQ(scheduler.pending(), 0u);
    }
    EXPECT_EQ(runs.load(), 10);
}

TEST(RefreshSchedulerTest, ShutdownWaitsForRunningTasks) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    std::atomic<bool> finished{false};
    RefreshScheduler scheduler(1, logger);
    scheduler.schedule([&finished]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        finished.store(true);
    });
    scheduler.shutdown();
    EXPECT_TRUE(finished.load());
}

TEST(RefreshSchedulerTest, RejectsTasksAfterShutdown) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    RefreshScheduler scheduler(1, logger);
    scheduler.shutdown();

    bool ran = false;
    EXPECT_FALSE(scheduler.schedule([&ran]() { ran = true; }));
    EXPECT_FALSE(ran);
    scheduler.shutdown(); // Second call is a no-op
}

TEST(RefreshSchedulerTest, ThrowingTaskIsLoggedAndPoolSurvives) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    EXPECT_CALL(*logger, error(HasSubstr("upstream down"))).Times(1);

    std::atomic<bool> later_ran{false};
    RefreshScheduler scheduler(1, logger);
    scheduler.schedule([]() { throw std::runtime_error("upstream down"); });
    scheduler.schedule([&later_ran]() { later_ran.store(true); });
    scheduler.shutdown();

    EXPECT_TRUE(later_ran.load());
    EXPECT_EQ(scheduler.failedTasks(), 1u);
}

TEST(RefreshSchedulerTest, CountsOnlyFailedTasks) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    RefreshScheduler scheduler(2, logger);
    scheduler.schedule([]() {});
    scheduler.schedule([]() { throw std::runtime_error("first"); });
    scheduler.schedule([]() { throw 42; });
    scheduler.schedule([]() {});
    scheduler.shutdown();

    EXPECT_EQ(scheduler.failedTasks(), 2u);
}

TEST(RefreshSchedulerTest, RejectsNullLogger) {
    EXPECT_THROW(RefreshScheduler(1, nullptr), std::invalid_argument);
}
