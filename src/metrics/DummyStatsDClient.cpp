#include "DummyStatsDClient.hpp"

void DummyStatsDClient::increment(const std::string& /* key */, int /* value */) {
    // No-op implementation
}

void DummyStatsDClient::gauge(const std::string& /* key */, double /* value */) {
    // No-op implementation
}

void DummyStatsDClient::timing(const std::string& /* key */, std::chrono::milliseconds /* value */) {
    // No-op implementation
}
