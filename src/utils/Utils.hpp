#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../config/AppConfig.hpp"

using namespace std;

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            // Check if the entire string was consumed
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    static optional<double> stringToDouble(const std::string& str) {
        try {
            size_t pos;
            double val = std::stod(str, &pos);
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not a number
        } catch (const std::out_of_range&) {
            // Number out of range
        }
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // "AAPL, msft ,SPY" -> {"AAPL", "MSFT", "SPY"}; empty items are dropped
    static vector<string> splitSymbols(const std::string& list) {
        vector<string> symbols;
        std::stringstream ss(list);
        string item;
        while (getline(ss, item, ',')) {
            item = trim(item);
            if (item.empty()) {
                continue;
            }
            transform(item.begin(), item.end(), item.begin(), [](unsigned char c) { return std::toupper(c); });
            symbols.push_back(item);
        }
        return symbols;
    }

    // Function to parse key-value pairs from a string (using optional version)
    static optional<map<string, string>> parseArguments(const vector<string>& args) {
        map<string, string> argMap;
        for (const string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != string::npos && delimiterPos > 0) { // Ensure key is not empty
                string key = arg.substr(0, delimiterPos);
                string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else {
                cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << endl;
                return nullopt; // Signal failure
            }
        }
        return argMap; // Signal success
    }

    static vector<string> defaultConfigPaths() {
        return {
            "stampede.config",              // Current directory
            "../stampede.config",           // Parent directory
            "/app/stampede.config",         // Docker container path
            "../../stampede.config"         // Development path
        };
    }

    // Applies one key=value setting. Unknown keys are ignored, invalid values
    // keep the current setting and warn on std::cerr. Returns true if applied.
    static bool applyConfigValue(AppConfig& config, const string& key, const string& value) {
        if (key == "log_level") {
            try {
                config.log_level = stringToLogLevel(value);
                return true;
            } catch (const std::invalid_argument& e) {
                cerr << "Warning: " << e.what() << endl;
                return false;
            }
        }
        if (key == "cache_background_refresh") {
            if (auto val = stringToInt(value)) {
                config.cache.enable_background_refresh = (*val == 1);
                return true;
            }
            return warnInvalid("integer", key, value);
        }
        if (key == "cache_min_jitter" || key == "cache_max_jitter" || key == "loader_failure_rate") {
            auto val = stringToDouble(value);
            if (!val) {
                return warnInvalid("number", key, value);
            }
            if (key == "cache_min_jitter") {
                config.cache.min_jitter = *val;
            } else if (key == "cache_max_jitter") {
                config.cache.max_jitter = *val;
            } else {
                if (*val < 0.0 || *val > 1.0) {
                    return warnInvalid("probability", key, value);
                }
                config.loader_failure_rate = *val;
            }
            return true;
        }
        if (key == "symbols") {
            auto symbols = splitSymbols(value);
            if (symbols.empty()) {
                return warnInvalid("symbol list", key, value);
            }
            config.symbols = symbols;
            return true;
        }

        // Remaining settings are all integers
        static const vector<string> integer_keys = {
            "cache_max_size", "cache_default_ttl", "cache_stale_while_revalidate_ttl",
            "cache_background_refresh_threads", "consumer_threads", "requests_per_consumer",
            "request_interval", "loader_latency", "metrics_batch_size", "metrics_send_interval"
        };
        if (find(integer_keys.begin(), integer_keys.end(), key) == integer_keys.end()) {
            return false;
        }
        auto val = stringToInt(value);
        if (!val || *val < 0) {
            return warnInvalid("non-negative integer", key, value);
        }
        if (key == "cache_max_size") {
            config.cache.max_size = static_cast<size_t>(*val);
        } else if (key == "cache_default_ttl") {
            // value provided in millis
            config.cache.default_ttl = std::chrono::milliseconds(*val);
        } else if (key == "cache_stale_while_revalidate_ttl") {
            config.cache.stale_while_revalidate_ttl = std::chrono::milliseconds(*val);
        } else if (key == "cache_background_refresh_threads") {
            config.cache.background_refresh_threads = static_cast<size_t>(*val);
        } else if (key == "consumer_threads") {
            config.consumer_threads = *val;
        } else if (key == "requests_per_consumer") {
            config.requests_per_consumer = *val;
        } else if (key == "request_interval") {
            config.request_interval_in_millis = *val;
        } else if (key == "loader_latency") {
            config.loader_latency_in_millis = *val;
        } else if (key == "metrics_batch_size") {
            config.metrics_batch_size = *val;
        } else if (key == "metrics_send_interval") {
            config.metrics_send_interval_in_millis = *val;
        }
        return true;
    }

    // Config file first (the first one found in config_paths), then
    // command-line arguments on top.
    static AppConfig loadConfiguration(const map<string, string>& startupArguments,
                                       const vector<string>& config_paths = defaultConfigPaths()) {
        AppConfig config;

        // --- Load from Config File ---
        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (!configFile.is_open()) {
                continue;
            }
            cout << "Reading configuration from " << config_path << "..." << endl;
            config_found = true;
            std::string line;
            while (getline(configFile, line)) {
                line = trim(line);
                if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                    continue;
                }
                size_t delimiterPos = line.find('=');
                if (delimiterPos != string::npos && delimiterPos > 0) {
                    string key = trim(line.substr(0, delimiterPos));
                    string value = trim(line.substr(delimiterPos + 1));
                    applyConfigValue(config, key, value);
                }
            }
            break;
        }

        if (!config_found && !config_paths.empty()) {
            cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << endl;
        }

        // --- Command-line overrides ---
        for (const auto& pair : startupArguments) {
            if (!applyConfigValue(config, pair.first, pair.second)) {
                cerr << "Warning: Ignoring startup argument '" << pair.first << "'" << endl;
            }
        }

        return config;
    }

private:
    static bool warnInvalid(const string& expected, const string& key, const string& value) {
        cerr << "Warning: Invalid " << expected << " for " << key << ": " << value << endl;
        return false;
    }
};

#endif // UTILS_HPP
