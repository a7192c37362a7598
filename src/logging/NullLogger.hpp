#pragma once

#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

// Default sink when the host injects no logger.
class NullLogger : public ILogger {
public:
    void info(const std::string& /* message */) override {}
    void debug(const std::string& /* message */) override {}
    void warn(const std::string& /* message */) override {}
    void error(const std::string& /* message */) override {}
    void setup(const std::string& /* message */) override {}
    // Above every real level, so callers never format debug output for it.
    int getLogLevel() override { return LogUtils::LogLevel::SETUP + 1; }
};
