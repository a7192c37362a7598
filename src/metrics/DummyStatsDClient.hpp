#pragma once

#include "../interfaces/IStatsDClient.hpp"

// Used when no STATSD_SERVER is configured.
class DummyStatsDClient : public IStatsDClient {
public:
    DummyStatsDClient() = default;
    ~DummyStatsDClient() override = default;

    void increment(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;

private:
    DummyStatsDClient(const DummyStatsDClient&) = delete;
    DummyStatsDClient& operator=(const DummyStatsDClient&) = delete;
    DummyStatsDClient(DummyStatsDClient&&) = delete;
    DummyStatsDClient& operator=(DummyStatsDClient&&) = delete;
};
