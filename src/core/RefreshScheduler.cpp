#include "RefreshScheduler.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/post.hpp>

RefreshScheduler::RefreshScheduler(std::size_t thread_count, std::shared_ptr<ILogger> logger)
    : logger_(logger),
    thread_count_(thread_count),
    pool_(thread_count),
    shutdown_(false),
    pending_(0),
    failed_(0) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RefreshScheduler");
    }
    logger_->debug("RefreshScheduler initialized with " + std::to_string(thread_count) + " threads");
}

RefreshScheduler::~RefreshScheduler() {
    shutdown();
}

bool RefreshScheduler::schedule(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    if (shutdown_) {
        logger_->error("Attempted to schedule a refresh on a shut down scheduler.");
        return false;
    }
    pending_.fetch_add(1);
    boost::asio::post(pool_, [this, task = std::move(task)]() {
        runSupervised(task);
        pending_.fetch_sub(1);
    });
    return true;
}

void RefreshScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(shutdown_mutex_);
        if (shutdown_.exchange(true)) {
            return; // Already shutting down
        }
    }
    logger_->debug("Shutting down RefreshScheduler, pending tasks: " + std::to_string(pending_.load()));
    pool_.join();
    logger_->debug("RefreshScheduler shut down complete.");
}

void RefreshScheduler::runSupervised(const std::function<void()>& task) {
    try {
        task();
    } catch (const std::exception& e) {
        failed_.fetch_add(1);
        logger_->error("Exception caught in refresh task: " + std::string(e.what()));
    } catch (...) {
        failed_.fetch_add(1);
        logger_->error("Unknown exception caught in refresh task.");
    }
}
