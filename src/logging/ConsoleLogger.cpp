#include <iostream>
#include <mutex>
#include <string>

#include "ConsoleLogger.hpp"

void ConsoleLogger::info(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::INFO) {
        std::lock_guard<std::mutex> lock(cout_mutex_);
        std::cout << LogUtils::INFO_LOG_PREFIX << message << std::endl;
    }
}

void ConsoleLogger::debug(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::DEBUG) {
        std::lock_guard<std::mutex> lock(cout_mutex_);
        std::cout << LogUtils::DEBUG_LOG_PREFIX << message << std::endl;
    }
}

void ConsoleLogger::warn(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::WARN) {
        std::lock_guard<std::mutex> lock(cout_mutex_);
        std::cout << LogUtils::WARN_LOG_PREFIX << message << std::endl;
    }
}

void ConsoleLogger::error(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::CERROR) {
        // Errors go to std::cerr
        std::lock_guard<std::mutex> lock(cout_mutex_);
        std::cerr << LogUtils::CERROR_LOG_PREFIX << message << std::endl;
    }
}

void ConsoleLogger::setup(const std::string& message) {
    std::lock_guard<std::mutex> lock(cout_mutex_);
    std::cout << LogUtils::SETUP_LOG_PREFIX << message << std::endl;
}
