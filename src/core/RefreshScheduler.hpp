#ifndef REFRESHSCHEDULER_HPP
#define REFRESHSCHEDULER_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>

#include <boost/asio/thread_pool.hpp>

#include "../interfaces/ILogger.hpp"

// Fire-and-forget executor for background refreshes.
// Task bodies are supervised: an escaping exception is logged, never
// allowed to take a pool thread down.
class RefreshScheduler {
public:
    RefreshScheduler(std::size_t thread_count, std::shared_ptr<ILogger> logger);
    ~RefreshScheduler();

    RefreshScheduler(const RefreshScheduler&) = delete;
    RefreshScheduler& operator=(const RefreshScheduler&) = delete;

    // Returns false once shutdown() has started; the task is not run.
    bool schedule(std::function<void()> task);

    // Stops accepting tasks and waits for the queued ones to finish.
    void shutdown();

    std::size_t pending() const { return pending_.load(); }
    // Tasks that ended with an exception escaping the task body.
    std::size_t failedTasks() const { return failed_.load(); }
    std::size_t threadCount() const { return thread_count_; }

private:
    void runSupervised(const std::function<void()>& task);

    std::shared_ptr<ILogger> logger_;
    const std::size_t thread_count_;
    boost::asio::thread_pool pool_;
    std::mutex shutdown_mutex_; // orders post() against join()
    std::atomic<bool> shutdown_;
    std::atomic<std::size_t> pending_;
    std::atomic<std::size_t> failed_;
};

#endif // REFRESHSCHEDULER_HPP
